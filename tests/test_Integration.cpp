/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors

    End-to-end tests against the mock-acp-agent executable.
*/

#include "TestHelpers.h"
#include "../src/acp/ACPClient.h"
#include "../src/acp/ACPHost.h"
#include "../src/acp/PermissionPolicy.h"
#include "../src/acp/SessionUpdateTracker.h"
#include "../src/acp/TerminalManager.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <functional>
#include <optional>

#ifndef MOCK_AGENT_PATH
#error "MOCK_AGENT_PATH must point at the mock-acp-agent executable"
#endif

namespace {

constexpr int CallTimeoutMs = 10000;

class IntegrationTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(workspace.isValid());

        client = std::make_unique<ACPClient>();
        host = std::make_unique<ACPHost>(client.get(), workspace.path());
        ASSERT_TRUE(host->install());
        QObject::connect(client.get(), &ACPClient::sessionUpdate, &tracker, &SessionUpdateTracker::update);

        AgentLaunchConfig config;
        config.executable = QStringLiteral(MOCK_AGENT_PATH);
        config.workingDirectory = workspace.path();
        ASSERT_TRUE(client->start(config));
    }

    void TearDown() override
    {
        host.reset();
        if (client) {
            client->dispose();
        }
        client.reset();
    }

    // Run one client call and spin until its callback fires
    RpcResult await(const std::function<void(ResponseCallback)> &call)
    {
        std::optional<RpcResult> result;
        call([&result](const RpcResult &r) { result = r; });
        if (!waitUntil([&result] { return result.has_value(); }, CallTimeoutMs)) {
            return RpcResult::failure(ErrorKind::Timeout, RpcErrorCode::InternalError, QStringLiteral("test wait expired"));
        }
        return *result;
    }

    void initialize()
    {
        const RpcResult result = await([this](ResponseCallback cb) { client->initialize(InitializeParams(), cb); });
        ASSERT_TRUE(result.ok()) << result.error->message.toStdString();
    }

    QString newSession(const QString &cwd = QStringLiteral("/workspace"))
    {
        const RpcResult result = await([this, cwd](ResponseCallback cb) { client->newSession(cwd, {}, cb); });
        EXPECT_TRUE(result.ok());
        return result.result[QStringLiteral("sessionId")].toString();
    }

    RpcResult prompt(const QString &sessionId, const QString &text)
    {
        tracker.resetTurn(sessionId);
        return await([this, sessionId, text](ResponseCallback cb) { client->prompt(sessionId, text, cb); });
    }

    static QString stopReason(const RpcResult &result)
    {
        return result.result[QStringLiteral("stopReason")].toString();
    }

    QString messageText(const QString &sessionId) const { return tracker.session(sessionId).messageText; }

    QTemporaryDir workspace;
    SessionUpdateTracker tracker;
    std::unique_ptr<ACPClient> client;
    std::unique_ptr<ACPHost> host;
};

TEST_F(IntegrationTest, InitializeThenLoadSession)
{
    initialize();
    EXPECT_TRUE(client->agentCapabilities().loadSession);
    EXPECT_EQ(client->agentInfo().name, QStringLiteral("Mock ACP Agent"));

    const QString sessionId = newSession();
    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("first message"))), QStringLiteral("end_turn"));

    tracker.resetTurn(sessionId);
    const RpcResult loaded = await([this, sessionId](ResponseCallback cb) {
        client->loadSession(sessionId, QStringLiteral("/workspace"), {}, cb);
    });
    ASSERT_TRUE(loaded.ok());
    // History was replayed before the response
    EXPECT_EQ(messageText(sessionId), QStringLiteral("first message"));
}

TEST_F(IntegrationTest, PromptStreamsChunksBeforeStopReason)
{
    initialize();
    const QString sessionId = newSession();
    ASSERT_FALSE(sessionId.isEmpty());

    const RpcResult result = prompt(sessionId, QStringLiteral("Hello, agent!"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(stopReason(result), QStringLiteral("end_turn"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("Hello, human!"));
}

TEST_F(IntegrationTest, UnknownSessionIsRejectedAndConnectionSurvives)
{
    initialize();

    const RpcResult failed = prompt(QStringLiteral("nonexistent-session"), QStringLiteral("Hello, agent!"));
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error->kind, ErrorKind::Protocol);
    EXPECT_TRUE(failed.error->message.contains(QStringLiteral("Session not found")));

    const QString sessionId = newSession();
    EXPECT_EQ(stopReason(prompt(sessionId, QStringLiteral("Hello, agent!"))), QStringLiteral("end_turn"));
}

TEST_F(IntegrationTest, UnsupportedProtocolVersion)
{
    InitializeParams params;
    params.protocolVersion = 1;

    const RpcResult result = await([this, params](ResponseCallback cb) { client->initialize(params, cb); });
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, RpcErrorCode::UnsupportedProtocolVersion);
    EXPECT_EQ(client->state(), ConnectionState::Created);
}

TEST_F(IntegrationTest, ConcurrentSessionsStayApart)
{
    initialize();
    const QString first = newSession();
    const QString second = newSession();
    ASSERT_NE(first, second);

    std::optional<RpcResult> a;
    std::optional<RpcResult> b;
    client->prompt(first, QStringLiteral("Hello, agent!"), [&a](const RpcResult &r) { a = r; });
    client->prompt(second, QStringLiteral("other"), [&b](const RpcResult &r) { b = r; });
    ASSERT_TRUE(waitUntil([&] { return a && b; }, CallTimeoutMs));

    EXPECT_EQ(messageText(first), QStringLiteral("Hello, human!"));
    EXPECT_EQ(messageText(second), QStringLiteral("Mock response to: other "));
}

TEST_F(IntegrationTest, SetModeNotifiesCurrentMode)
{
    initialize();
    const QString sessionId = newSession();
    ASSERT_EQ(client->sessionInfo(sessionId)->currentModeId, QStringLiteral("default"));

    const RpcResult result = await([this, sessionId](ResponseCallback cb) { client->setMode(sessionId, QStringLiteral("plan"), cb); });
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(waitUntil([&] { return tracker.session(sessionId).currentModeId == QLatin1String("plan"); }));
    EXPECT_EQ(client->sessionInfo(sessionId)->currentModeId, QStringLiteral("plan"));
}

TEST_F(IntegrationTest, AgentReadsAndWritesWorkspaceFiles)
{
    initialize();
    const QString sessionId = newSession();
    const QString path = workspace.filePath(QStringLiteral("notes.txt"));

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("write %1 remember this").arg(path))), QStringLiteral("end_turn"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("written"));

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("read %1").arg(path))), QStringLiteral("end_turn"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("remember this"));
}

TEST_F(IntegrationTest, AgentCannotEscapeWorkspace)
{
    initialize();
    const QString sessionId = newSession();

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("read /etc/passwd"))), QStringLiteral("end_turn"));
    EXPECT_TRUE(messageText(sessionId).startsWith(QStringLiteral("error: Path is outside the allowed workspace")));
}

TEST_F(IntegrationTest, PermissionGoesThroughPolicy)
{
    initialize();
    const QString sessionId = newSession();

    // No prompt installed and "edit" is not auto-approved
    prompt(sessionId, QStringLiteral("permission"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("selected:reject"));

    QString askedTitle;
    host->permissions()->setPrompt([&askedTitle](const PermissionRequest &request, const PermissionPolicy::DecisionCallback &answer) {
        askedTitle = request.toolCall.title;
        answer(PermissionDecision::AllowOnce);
    });
    prompt(sessionId, QStringLiteral("permission"));
    EXPECT_EQ(askedTitle, QStringLiteral("Edit file"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("selected:allow"));
}

TEST_F(IntegrationTest, CancelAnswersPendingPermissionAndEndsTurn)
{
    initialize();
    const QString sessionId = newSession();

    bool asked = false;
    host->permissions()->setPrompt([&asked](const PermissionRequest &, const PermissionPolicy::DecisionCallback &) {
        asked = true;  // never answered
    });

    std::optional<RpcResult> result;
    client->prompt(sessionId, QStringLiteral("permission"), [&result](const RpcResult &r) { result = r; });
    ASSERT_TRUE(waitUntil([&asked] { return asked; }));

    EXPECT_TRUE(client->cancelSession(sessionId).ok());
    ASSERT_TRUE(waitUntil([&result] { return result.has_value(); }, CallTimeoutMs));
    EXPECT_EQ(stopReason(*result), QStringLiteral("cancelled"));
}

TEST_F(IntegrationTest, CancelEndsRunningPrompt)
{
    initialize();
    const QString sessionId = newSession();

    std::optional<RpcResult> result;
    client->prompt(sessionId, QStringLiteral("wait"), [&result](const RpcResult &r) { result = r; });
    spinFor(100);
    EXPECT_FALSE(result.has_value());

    EXPECT_TRUE(client->cancelSession(sessionId).ok());
    ASSERT_TRUE(waitUntil([&result] { return result.has_value(); }, CallTimeoutMs));
    EXPECT_EQ(stopReason(*result), QStringLiteral("cancelled"));
}

TEST_F(IntegrationTest, AgentRunsCommandInTerminal)
{
    initialize();
    const QString sessionId = newSession();

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("run echo from terminal"))), QStringLiteral("end_turn"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("exit 0: from terminal"));
    // The agent released it
    EXPECT_TRUE(host->terminals()->terminalIds().isEmpty());
}

TEST_F(IntegrationTest, ToolCallStatusIsTracked)
{
    initialize();
    const QString sessionId = newSession();

    QList<ToolCallStatus> seen;
    QObject::connect(&tracker, &SessionUpdateTracker::toolCallUpdated, [&seen](const QString &, const ToolCall &call) {
        seen.append(call.status);
    });

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("tool"))), QStringLiteral("end_turn"));

    const ToolCall call = tracker.toolCall(sessionId, QStringLiteral("tool-1"));
    EXPECT_EQ(call.title, QStringLiteral("Reading file"));
    EXPECT_EQ(call.status, ToolCallStatus::Completed);
    EXPECT_EQ(seen, (QList<ToolCallStatus>{ToolCallStatus::InProgress, ToolCallStatus::Completed}));
}

TEST_F(IntegrationTest, NonJsonLineIsTolerated)
{
    initialize();
    const QString sessionId = newSession();

    ASSERT_EQ(stopReason(prompt(sessionId, QStringLiteral("noise"))), QStringLiteral("end_turn"));
    EXPECT_EQ(messageText(sessionId), QStringLiteral("still here"));
}

TEST_F(IntegrationTest, AgentExitFailsPendingRequests)
{
    initialize();
    const QString sessionId = newSession();

    int exitCode = 0;
    QObject::connect(client.get(), &ACPClient::processExited, [&exitCode](int code) { exitCode = code; });

    std::optional<RpcResult> result;
    client->prompt(sessionId, QStringLiteral("wait"), [&result](const RpcResult &r) { result = r; });
    spinFor(50);
    client->process()->forceKill();

    ASSERT_TRUE(waitUntil([&result] { return result.has_value(); }, CallTimeoutMs));
    ASSERT_FALSE(result->ok());
    EXPECT_EQ(result->error->kind, ErrorKind::Subprocess);
    EXPECT_NE(exitCode, 0);

    // Later calls fail locally
    const RpcResult after = await([this](ResponseCallback cb) { client->newSession(QStringLiteral("/workspace"), {}, cb); });
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error->kind, ErrorKind::Subprocess);
}

TEST_F(IntegrationTest, DisposeRejectsPendingAndIsIdempotent)
{
    initialize();
    const QString sessionId = newSession();

    std::optional<RpcResult> result;
    client->prompt(sessionId, QStringLiteral("wait"), [&result](const RpcResult &r) { result = r; });

    client->dispose();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->error->kind, ErrorKind::Disposed);
    EXPECT_EQ(client->state(), ConnectionState::Disposed);

    client->dispose();
    const RpcResult after = await([this](ResponseCallback cb) { client->newSession(QStringLiteral("/workspace"), {}, cb); });
    EXPECT_EQ(after.error->kind, ErrorKind::Disposed);
}

}
