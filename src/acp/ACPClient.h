/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "ACPModels.h"
#include "ACPProtocol.h"
#include "../rpc/JsonRpcEndpoint.h"
#include "../rpc/JsonRpcTransport.h"

#include <QHash>
#include <QJsonArray>
#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <array>
#include <optional>

class ManagedProcess;

struct AgentLaunchConfig {
    QString executable;
    QStringList args;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    QString workingDirectory;
    int killGracePeriodMs = 100;
};

/**
 * ACPClient - the host's single entry point to one agent subprocess.
 *
 * Connection states: Created -> Initializing -> Ready -> Disposed.
 * All operations report through a ResponseCallback. Local precondition
 * failures (not initialized, capability not granted, disposed) invoke the
 * callback before the call returns and put nothing on the wire.
 *
 * Session ids are always passed explicitly; any number of sessions may be
 * used concurrently. Ids the client has not seen are still forwarded so the
 * agent's own error reaches the caller.
 */
class ACPClient : public QObject
{
    Q_OBJECT

public:
    // Spawn the agent later through start()
    explicit ACPClient(QObject *parent = nullptr);
    // Speak over an existing transport (embedding, tests). Not owned.
    explicit ACPClient(JsonRpcTransport *transport, QObject *parent = nullptr);
    ~ACPClient() override;

    bool start(const AgentLaunchConfig &config);

    void initialize(const InitializeParams &params, ResponseCallback callback, int timeoutMs = 0);
    void newSession(const QString &cwd, const QList<McpServerSpec> &mcpServers, ResponseCallback callback);
    void loadSession(const QString &sessionId, const QString &cwd, const QList<McpServerSpec> &mcpServers,
                     ResponseCallback callback);
    void setMode(const QString &sessionId, const QString &modeId, ResponseCallback callback);
    void prompt(const QString &sessionId, const QJsonArray &content, ResponseCallback callback);
    void prompt(const QString &sessionId, const QString &text, ResponseCallback callback);

    // Advisory; the running prompt is expected to finish with stopReason "cancelled"
    RpcResult cancelSession(const QString &sessionId);

    // Kill the agent, reject everything pending, drop all handlers. Idempotent.
    void dispose();

    bool setClientMethodHandler(ClientMethod method, RequestHandler handler);
    void clearClientMethodHandler(ClientMethod method);
    bool hasClientMethodHandler(ClientMethod method) const;

    // Applies to session/* requests; initialize takes its own timeout
    void setRequestTimeout(int timeoutMs) { m_requestTimeoutMs = timeoutMs; }
    void setMalformedLinePolicy(JsonRpcTransport::MalformedLinePolicy policy);

    ConnectionState state() const { return m_state; }
    bool isReady() const { return m_state == ConnectionState::Ready; }
    AgentCapabilities agentCapabilities() const { return m_agentCapabilities; }
    AgentInfo agentInfo() const { return m_agentInfo; }
    QJsonValue protocolVersion() const { return m_protocolVersion; }

    QList<SessionInfo> sessions() const { return m_sessions.values(); }
    std::optional<SessionInfo> sessionInfo(const QString &sessionId) const;

    JsonRpcEndpoint *endpoint() const { return m_endpoint; }
    JsonRpcTransport *transport() const { return m_transport; }
    ManagedProcess *process() const { return m_process; }

Q_SIGNALS:
    void stateChanged(ConnectionState state);
    void sessionUpdate(const QString &sessionId, const QJsonObject &update);
    void sessionCancelled(const QString &sessionId);
    void processExited(int exitCode);
    void stderrReceived(const QString &text);

private Q_SLOTS:
    void onProcessExited(int exitCode, bool crashed);
    void onProcessFailedToStart(const QString &message);
    void onProcessStderr(const QByteArray &chunk);

private:
    void attachTransport(JsonRpcTransport *transport);
    void installClientMethods();
    void handleSessionUpdate(const QJsonValue &params);
    void setState(ConnectionState state);

    // Invokes callback with the reason and returns false unless Ready
    bool checkReady(const ResponseCallback &callback) const;
    QJsonArray mcpServersToJson(const QList<McpServerSpec> &mcpServers) const;
    void registerSession(const QString &sessionId, const QString &cwd, const QList<McpServerSpec> &mcpServers,
                         const QJsonObject &result);

    JsonRpcTransport *m_transport = nullptr;
    JsonRpcEndpoint *m_endpoint = nullptr;
    ManagedProcess *m_process = nullptr;

    std::array<RequestHandler, kClientMethods.size()> m_clientHandlers;
    QHash<QString, SessionInfo> m_sessions;

    ConnectionState m_state = ConnectionState::Created;
    AgentCapabilities m_agentCapabilities;
    AgentInfo m_agentInfo;
    QJsonValue m_protocolVersion;

    JsonRpcTransport::MalformedLinePolicy m_linePolicy = JsonRpcTransport::MalformedLinePolicy::Lenient;
    int m_requestTimeoutMs = 0;
    int m_killGracePeriodMs = 100;
    bool m_processExited = false;
    QString m_processError;
};
