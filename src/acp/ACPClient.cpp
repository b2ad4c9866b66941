/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ACPClient.h"
#include "../process/ManagedProcess.h"

#include <QDebug>
#include <QJsonObject>

namespace {

void fail(const ResponseCallback &callback, ErrorKind kind, int code, const QString &message)
{
    if (callback) {
        callback(RpcResult::failure(kind, code, message));
    }
}

}

ACPClient::ACPClient(QObject *parent)
    : QObject(parent)
{
}

ACPClient::ACPClient(JsonRpcTransport *transport, QObject *parent)
    : QObject(parent)
{
    attachTransport(transport);
}

ACPClient::~ACPClient()
{
    dispose();
}

bool ACPClient::start(const AgentLaunchConfig &config)
{
    if (m_state == ConnectionState::Disposed) {
        qWarning() << "[ACPClient] start() called on a disposed client";
        return false;
    }
    if (m_endpoint) {
        qWarning() << "[ACPClient] start() called but the client is already connected";
        return false;
    }

    m_killGracePeriodMs = config.killGracePeriodMs;

    m_process = new ManagedProcess(this);
    connect(m_process, &ManagedProcess::failedToStart, this, &ACPClient::onProcessFailedToStart);
    connect(m_process, &ManagedProcess::exited, this, &ACPClient::onProcessExited);
    connect(m_process, &ManagedProcess::stderrReceived, this, &ACPClient::onProcessStderr);

    ManagedProcess::Spec spec;
    spec.program = config.executable;
    spec.arguments = config.args;
    spec.environment = config.environment;
    spec.workingDirectory = config.workingDirectory;
    spec.channelMode = ManagedProcess::ChannelMode::SeparatePipes;

    qDebug() << "[ACPClient] Launching agent:" << config.executable << config.args;
    m_process->start(spec);

    auto *transport = new JsonRpcTransport(m_process->inputDevice(), this);
    connect(m_process, &ManagedProcess::stdoutReceived, transport, &JsonRpcTransport::feed);
    attachTransport(transport);

    // False only when the spawn failure was already reported from inside start()
    return !m_processExited;
}

void ACPClient::attachTransport(JsonRpcTransport *transport)
{
    m_transport = transport;
    m_transport->setMalformedLinePolicy(m_linePolicy);
    m_endpoint = new JsonRpcEndpoint(transport, this);

    m_endpoint->onNotification(acpMethodName(AcpMethod::SessionUpdate), [this](const QJsonValue &params) {
        handleSessionUpdate(params);
    });
    installClientMethods();
}

void ACPClient::installClientMethods()
{
    for (const auto &entry : kClientMethods) {
        const ClientMethod slot = entry.first;
        const QString method = acpMethodName(entry.second);

        m_endpoint->onRequest(method, [this, slot, method](const QJsonValue &params, const RequestResponder &responder) {
            // Copy: the handler may clear its own slot
            const RequestHandler handler = m_clientHandlers[static_cast<std::size_t>(slot)];
            if (!handler) {
                qWarning() << "[ACPClient] No handler registered for" << method;
                responder.reject(RpcErrorCode::InternalError, QStringLiteral("No handler registered for %1").arg(method));
                return;
            }
            handler(params, responder);
        });
    }
}

void ACPClient::initialize(const InitializeParams &params, ResponseCallback callback, int timeoutMs)
{
    if (m_state == ConnectionState::Disposed) {
        fail(callback, ErrorKind::Disposed, RpcErrorCode::InternalError, QStringLiteral("Client has been disposed"));
        return;
    }
    if (m_state != ConnectionState::Created) {
        fail(callback, ErrorKind::InvalidState, RpcErrorCode::InvalidRequest, QStringLiteral("Client is already initialized"));
        return;
    }
    if (!m_endpoint || m_processExited) {
        const QString message = m_processError.isEmpty() ? QStringLiteral("Agent process is not running") : m_processError;
        fail(callback, ErrorKind::Subprocess, RpcErrorCode::InternalError, message);
        return;
    }

    setState(ConnectionState::Initializing);

    const QJsonObject request = params.toJson();
    m_endpoint->sendRequest(acpMethodName(AcpMethod::Initialize), request, [this, callback](const RpcResult &result) {
        if (!result.ok()) {
            qWarning() << "[ACPClient] Initialize failed:" << result.error->message;
            if (m_state == ConnectionState::Initializing) {
                setState(ConnectionState::Created);
            }
            if (callback) {
                callback(result);
            }
            return;
        }

        const QJsonObject response = result.result.toObject();

        // Older agents answer with "capabilities"
        QJsonObject caps = response[QStringLiteral("agentCapabilities")].toObject();
        if (caps.isEmpty()) {
            caps = response[QStringLiteral("capabilities")].toObject();
        }
        m_agentCapabilities = AgentCapabilities::fromJson(caps);

        const QJsonObject info = response[QStringLiteral("agentInfo")].toObject();
        m_agentInfo.name = info[QStringLiteral("name")].toString();
        m_agentInfo.version = info[QStringLiteral("version")].toString();
        m_protocolVersion = response[QStringLiteral("protocolVersion")];

        qDebug() << "[ACPClient] Initialized - agent:" << m_agentInfo.name
                 << "loadSession:" << m_agentCapabilities.loadSession
                 << "setMode:" << m_agentCapabilities.setMode;

        setState(ConnectionState::Ready);
        if (callback) {
            callback(result);
        }
    }, timeoutMs);
}

void ACPClient::newSession(const QString &cwd, const QList<McpServerSpec> &mcpServers, ResponseCallback callback)
{
    if (!checkReady(callback)) {
        return;
    }

    QJsonObject params;
    params[QStringLiteral("cwd")] = cwd;
    params[QStringLiteral("mcpServers")] = mcpServersToJson(mcpServers);

    m_endpoint->sendRequest(acpMethodName(AcpMethod::SessionNew), params,
                            [this, cwd, mcpServers, callback](const RpcResult &result) {
        if (!result.ok()) {
            if (callback) {
                callback(result);
            }
            return;
        }

        const QJsonObject response = result.result.toObject();
        const QString sessionId = response[QStringLiteral("sessionId")].toString();
        if (sessionId.isEmpty()) {
            qWarning() << "[ACPClient] session/new returned no session id:" << response;
            fail(callback, ErrorKind::Protocol, RpcErrorCode::InternalError,
                 QStringLiteral("Agent returned an empty session id"));
            return;
        }

        registerSession(sessionId, cwd, mcpServers, response);
        qDebug() << "[ACPClient] Session created:" << sessionId;
        if (callback) {
            callback(result);
        }
    }, m_requestTimeoutMs);
}

void ACPClient::loadSession(const QString &sessionId, const QString &cwd, const QList<McpServerSpec> &mcpServers,
                            ResponseCallback callback)
{
    if (!checkReady(callback)) {
        return;
    }
    if (!m_agentCapabilities.loadSession) {
        fail(callback, ErrorKind::Capability, RpcErrorCode::MethodNotFound,
             QStringLiteral("Agent does not support loading sessions"));
        return;
    }

    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("cwd")] = cwd;
    params[QStringLiteral("mcpServers")] = mcpServersToJson(mcpServers);

    // History replays as session/update notifications before the response
    m_endpoint->sendRequest(acpMethodName(AcpMethod::SessionLoad), params,
                            [this, sessionId, cwd, mcpServers, callback](const RpcResult &result) {
        if (result.ok()) {
            registerSession(sessionId, cwd, mcpServers, result.result.toObject());
            qDebug() << "[ACPClient] Session loaded:" << sessionId;
        }
        if (callback) {
            callback(result);
        }
    }, m_requestTimeoutMs);
}

void ACPClient::setMode(const QString &sessionId, const QString &modeId, ResponseCallback callback)
{
    if (!checkReady(callback)) {
        return;
    }
    if (!m_agentCapabilities.setMode) {
        fail(callback, ErrorKind::Capability, RpcErrorCode::MethodNotFound,
             QStringLiteral("Agent does not support setting modes"));
        return;
    }

    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("modeId")] = modeId;

    m_endpoint->sendRequest(acpMethodName(AcpMethod::SessionSetMode), params,
                            [this, sessionId, modeId, callback](const RpcResult &result) {
        if (result.ok()) {
            auto it = m_sessions.find(sessionId);
            if (it != m_sessions.end()) {
                it->currentModeId = modeId;
            }
        }
        if (callback) {
            callback(result);
        }
    }, m_requestTimeoutMs);
}

void ACPClient::prompt(const QString &sessionId, const QJsonArray &content, ResponseCallback callback)
{
    if (!checkReady(callback)) {
        return;
    }

    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("prompt")] = content;

    qDebug() << "[ACPClient] Prompt for session" << sessionId << "with" << content.size() << "blocks";
    m_endpoint->sendRequest(acpMethodName(AcpMethod::SessionPrompt), params, std::move(callback), m_requestTimeoutMs);
}

void ACPClient::prompt(const QString &sessionId, const QString &text, ResponseCallback callback)
{
    prompt(sessionId, QJsonArray{ContentBlock::text(text)}, std::move(callback));
}

RpcResult ACPClient::cancelSession(const QString &sessionId)
{
    RpcResult outcome = RpcResult::success(QJsonValue());
    const bool ready = checkReady([&outcome](const RpcResult &result) {
        outcome = result;
    });
    if (!ready) {
        return outcome;
    }

    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;

    qDebug() << "[ACPClient] Cancelling session:" << sessionId;
    if (!m_endpoint->sendNotification(acpMethodName(AcpMethod::SessionCancel), params)) {
        return RpcResult::failure(ErrorKind::Transport, RpcErrorCode::InternalError,
                                  QStringLiteral("Failed to send session/cancel"));
    }

    Q_EMIT sessionCancelled(sessionId);
    return outcome;
}

void ACPClient::dispose()
{
    if (m_state == ConnectionState::Disposed) {
        return;
    }

    qDebug() << "[ACPClient] Disposing";
    setState(ConnectionState::Disposed);

    for (RequestHandler &handler : m_clientHandlers) {
        handler = nullptr;
    }

    if (m_endpoint) {
        m_endpoint->dispose();
    }

    if (m_process && m_process->isRunning()) {
        m_process->stop(m_killGracePeriodMs);
    }

    m_sessions.clear();
}

bool ACPClient::setClientMethodHandler(ClientMethod method, RequestHandler handler)
{
    if (m_state == ConnectionState::Disposed) {
        return false;
    }

    RequestHandler &slot = m_clientHandlers[static_cast<std::size_t>(method)];
    if (slot) {
        qWarning() << "[ACPClient] Handler already registered for"
                   << acpMethodName(clientMethodWireMethod(method));
        return false;
    }

    slot = std::move(handler);
    return true;
}

void ACPClient::clearClientMethodHandler(ClientMethod method)
{
    m_clientHandlers[static_cast<std::size_t>(method)] = nullptr;
}

bool ACPClient::hasClientMethodHandler(ClientMethod method) const
{
    return static_cast<bool>(m_clientHandlers[static_cast<std::size_t>(method)]);
}

void ACPClient::setMalformedLinePolicy(JsonRpcTransport::MalformedLinePolicy policy)
{
    m_linePolicy = policy;
    if (m_transport) {
        m_transport->setMalformedLinePolicy(policy);
    }
}

std::optional<SessionInfo> ACPClient::sessionInfo(const QString &sessionId) const
{
    const auto it = m_sessions.constFind(sessionId);
    if (it == m_sessions.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

void ACPClient::onProcessExited(int exitCode, bool crashed)
{
    m_processExited = true;
    if (m_processError.isEmpty()) {
        m_processError = crashed ? QStringLiteral("Agent process was terminated (exit code %1)").arg(exitCode)
                                 : QStringLiteral("Agent process exited with code %1").arg(exitCode);
    }

    qDebug() << "[ACPClient]" << m_processError;

    if (m_endpoint && !m_endpoint->isDisposed()) {
        m_endpoint->failAllPending(ErrorKind::Subprocess, m_processError);
    }

    Q_EMIT processExited(exitCode);
}

void ACPClient::onProcessFailedToStart(const QString &message)
{
    m_processError = QStringLiteral("Failed to start agent: %1").arg(message);
    qWarning() << "[ACPClient]" << m_processError;
}

void ACPClient::onProcessStderr(const QByteArray &chunk)
{
    const QString text = QString::fromUtf8(chunk);
    qDebug() << "[ACPClient] agent stderr:" << text.trimmed();
    Q_EMIT stderrReceived(text);
}

void ACPClient::handleSessionUpdate(const QJsonValue &params)
{
    const QJsonObject obj = params.toObject();
    const QString sessionId = obj[QStringLiteral("sessionId")].toString();
    const QJsonObject update = obj[QStringLiteral("update")].toObject();

    if (update[QStringLiteral("sessionUpdate")].toString() == QLatin1String("current_mode_update")) {
        auto it = m_sessions.find(sessionId);
        if (it != m_sessions.end()) {
            QString modeId = update[QStringLiteral("currentModeId")].toString();
            if (modeId.isEmpty()) {
                modeId = update[QStringLiteral("modeId")].toString();
            }
            it->currentModeId = modeId;
        }
    }

    Q_EMIT sessionUpdate(sessionId, update);
}

void ACPClient::setState(ConnectionState state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    Q_EMIT stateChanged(state);
}

bool ACPClient::checkReady(const ResponseCallback &callback) const
{
    if (m_state == ConnectionState::Disposed) {
        fail(callback, ErrorKind::Disposed, RpcErrorCode::InternalError, QStringLiteral("Client has been disposed"));
        return false;
    }
    if (m_state != ConnectionState::Ready) {
        fail(callback, ErrorKind::InvalidState, RpcErrorCode::InvalidRequest,
             QStringLiteral("Client is not initialized. Call initialize() first."));
        return false;
    }
    if (m_processExited) {
        fail(callback, ErrorKind::Subprocess, RpcErrorCode::InternalError, m_processError);
        return false;
    }
    return true;
}

QJsonArray ACPClient::mcpServersToJson(const QList<McpServerSpec> &mcpServers) const
{
    QJsonArray array;
    for (const McpServerSpec &server : mcpServers) {
        array.append(server.toJson());
    }
    return array;
}

void ACPClient::registerSession(const QString &sessionId, const QString &cwd, const QList<McpServerSpec> &mcpServers,
                                const QJsonObject &result)
{
    SessionInfo info = m_sessions.value(sessionId);
    info.sessionId = sessionId;
    info.cwd = cwd;
    info.mcpServerNames.clear();
    for (const McpServerSpec &server : mcpServers) {
        info.mcpServerNames.append(server.name);
    }
    parseSessionModes(result, info);
    m_sessions.insert(sessionId, info);
}
