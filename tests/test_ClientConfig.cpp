/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "../src/config/ClientConfig.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

class ClientConfigTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    QString iniPath() const { return dir.filePath(QStringLiteral("acpbridge.ini")); }

    void writeIni(const QByteArray &text)
    {
        QFile file(iniPath());
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(text);
    }

    QTemporaryDir dir;
};

TEST_F(ClientConfigTest, DefaultsWithoutFile)
{
    ClientConfig config(iniPath());

    EXPECT_EQ(config.protocolVersion(), QStringLiteral("2025-01-13"));
    EXPECT_EQ(config.requestTimeoutMs(), 0);
    EXPECT_EQ(config.initializeTimeoutMs(), 30000);
    EXPECT_EQ(config.malformedLinePolicy(), JsonRpcTransport::MalformedLinePolicy::Lenient);
    EXPECT_EQ(config.terminalOutputByteLimit(), 0);
    EXPECT_EQ(config.terminalColumns(), 120);
    EXPECT_EQ(config.terminalRows(), 40);
    EXPECT_EQ(config.killGracePeriodMs(), 100);
    EXPECT_EQ(config.autoApproveKinds(), (QStringList{QStringLiteral("read"), QStringLiteral("think")}));
    EXPECT_TRUE(config.mcpServers().isEmpty());
    EXPECT_FALSE(config.debugLogging());

    ASSERT_EQ(config.providers().size(), 1);
    EXPECT_EQ(config.activeProvider().id, QStringLiteral("claude-code"));
    EXPECT_EQ(config.activeProvider().executable, QStringLiteral("claude-code-acp"));
    EXPECT_TRUE(config.activeProvider().builtin);
}

TEST_F(ClientConfigTest, ReadsHandWrittenIni)
{
    writeIni("[ACP]\n"
             "protocolVersion=2025-06-01\n"
             "requestTimeoutMs=1500\n"
             "malformedLines=strict\n"
             "[Terminal]\n"
             "outputByteLimit=4096\n"
             "columns=80\n"
             "[Process]\n"
             "killGracePeriodMs=250\n"
             "[Debug]\n"
             "logging=true\n");

    ClientConfig config(iniPath());
    EXPECT_EQ(config.status(), QSettings::NoError);
    EXPECT_EQ(config.protocolVersion(), QStringLiteral("2025-06-01"));
    EXPECT_EQ(config.requestTimeoutMs(), 1500);
    EXPECT_EQ(config.malformedLinePolicy(), JsonRpcTransport::MalformedLinePolicy::Strict);
    EXPECT_EQ(config.terminalOutputByteLimit(), 4096);
    EXPECT_EQ(config.terminalColumns(), 80);
    EXPECT_EQ(config.terminalRows(), 40);
    EXPECT_EQ(config.killGracePeriodMs(), 250);
    EXPECT_TRUE(config.debugLogging());
}

TEST_F(ClientConfigTest, UnknownLinePolicyFallsBackToLenient)
{
    writeIni("[ACP]\nmalformedLines=pedantic\n");

    ClientConfig config(iniPath());
    EXPECT_EQ(config.malformedLinePolicy(), JsonRpcTransport::MalformedLinePolicy::Lenient);
}

TEST_F(ClientConfigTest, SettersPersistAndNotify)
{
    int changes = 0;
    {
        ClientConfig config(iniPath());
        QObject::connect(&config, &ClientConfig::settingsChanged, [&changes] { ++changes; });
        config.setRequestTimeoutMs(900);
        config.setMalformedLinePolicy(JsonRpcTransport::MalformedLinePolicy::Strict);
        config.setAutoApproveKinds({QStringLiteral("read")});
        config.setDebugLogging(true);
    }
    EXPECT_EQ(changes, 4);

    ClientConfig reopened(iniPath());
    EXPECT_EQ(reopened.requestTimeoutMs(), 900);
    EXPECT_EQ(reopened.malformedLinePolicy(), JsonRpcTransport::MalformedLinePolicy::Strict);
    EXPECT_EQ(reopened.autoApproveKinds(), QStringList{QStringLiteral("read")});
    EXPECT_TRUE(reopened.debugLogging());
}

TEST_F(ClientConfigTest, CustomProviders)
{
    ClientConfig config(iniPath());

    AgentProvider gemini;
    gemini.id = QStringLiteral("gemini");
    gemini.description = QStringLiteral("Gemini CLI");
    gemini.executable = QStringLiteral("gemini");
    gemini.args = {QStringLiteral("--experimental-acp")};
    gemini.env.insert(QStringLiteral("GEMINI_MODEL"), QStringLiteral("pro=latest"));
    config.addProvider(gemini);
    config.setActiveProviderId(QStringLiteral("gemini"));

    const AgentProvider active = config.activeProvider();
    EXPECT_EQ(active.id, QStringLiteral("gemini"));
    EXPECT_FALSE(active.builtin);
    EXPECT_EQ(active.args, gemini.args);
    // Only the first '=' separates name and value
    EXPECT_EQ(active.env.value(QStringLiteral("GEMINI_MODEL")), QStringLiteral("pro=latest"));

    gemini.args.append(QStringLiteral("--debug"));
    EXPECT_TRUE(config.updateProvider(QStringLiteral("gemini"), gemini));
    EXPECT_EQ(config.activeProvider().args.size(), 2);
    EXPECT_FALSE(config.updateProvider(QStringLiteral("missing"), gemini));

    EXPECT_FALSE(config.removeProvider(QStringLiteral("claude-code")));
    EXPECT_TRUE(config.removeProvider(QStringLiteral("gemini")));
    EXPECT_EQ(config.providers().size(), 1);
    // A stale active id falls back to the first provider
    EXPECT_EQ(config.activeProvider().id, QStringLiteral("claude-code"));
}

TEST_F(ClientConfigTest, LaunchConfigCarriesProviderAndGracePeriod)
{
    writeIni("[Process]\nkillGracePeriodMs=300\n");
    ClientConfig config(iniPath());

    AgentProvider provider;
    provider.id = QStringLiteral("local");
    provider.executable = QStringLiteral("/opt/agent/bin/agent");
    provider.args = {QStringLiteral("--acp")};
    provider.env.insert(QStringLiteral("AGENT_LOG"), QStringLiteral("debug"));

    const AgentLaunchConfig launch = config.launchConfig(provider, QStringLiteral("/work"));
    EXPECT_EQ(launch.executable, provider.executable);
    EXPECT_EQ(launch.args, provider.args);
    EXPECT_EQ(launch.workingDirectory, QStringLiteral("/work"));
    EXPECT_EQ(launch.environment.value(QStringLiteral("AGENT_LOG")), QStringLiteral("debug"));
    EXPECT_EQ(launch.killGracePeriodMs, 300);
}

TEST_F(ClientConfigTest, McpServersRoundTripThroughFile)
{
    MCPServerConfig files;
    files.name = QStringLiteral("files");
    files.command = QStringLiteral("mcp-files");
    files.args = {QStringLiteral("--root"), QStringLiteral("/work")};
    files.env.insert(QStringLiteral("TOKEN"), QStringLiteral("a,b"));

    {
        ClientConfig config(iniPath());
        config.setMcpServers({files});
    }

    ClientConfig reopened(iniPath());
    const QList<MCPServerConfig> servers = reopened.mcpServers();
    ASSERT_EQ(servers.size(), 1);
    EXPECT_EQ(servers.first().name, QStringLiteral("files"));
    EXPECT_EQ(servers.first().args, files.args);
    EXPECT_EQ(servers.first().env.value(QStringLiteral("TOKEN")), QStringLiteral("a,b"));
}

TEST_F(ClientConfigTest, MalformedMcpServersAreIgnored)
{
    writeIni("[MCP]\nservers=not json\n");

    ClientConfig config(iniPath());
    EXPECT_TRUE(config.mcpServers().isEmpty());
}

}
