/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "MCPServerManager.h"
#include "../process/ManagedProcess.h"
#include "../rpc/JsonRpcTransport.h"

#include <QDebug>
#include <QJsonArray>

#include <exception>
#include <memory>
#include <utility>

McpServerSpec MCPServerConfig::toSessionConfig() const
{
    McpServerSpec spec;
    spec.name = name;
    spec.command = command;
    spec.args = args;
    spec.env = env;
    return spec;
}

MCPServerConfig MCPServerConfig::fromJson(const QJsonObject &obj)
{
    MCPServerConfig config;
    config.name = obj[QStringLiteral("name")].toString();
    config.command = obj[QStringLiteral("command")].toString();
    for (const QJsonValue &value : obj[QStringLiteral("args")].toArray()) {
        config.args.append(value.toString());
    }

    const QJsonObject env = obj[QStringLiteral("env")].toObject();
    for (auto it = env.constBegin(); it != env.constEnd(); ++it) {
        config.env.insert(it.key(), it.value().toString());
    }

    config.transport = obj[QStringLiteral("transport")].toString(QStringLiteral("stdio"));
    config.url = obj[QStringLiteral("url")].toString();
    config.enabled = obj[QStringLiteral("enabled")].toBool(true);
    return config;
}

QJsonObject MCPServerConfig::toJson() const
{
    QJsonObject envObj;
    for (auto it = env.cbegin(); it != env.cend(); ++it) {
        envObj[it.key()] = it.value();
    }

    QJsonObject obj;
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("command")] = command;
    obj[QStringLiteral("args")] = QJsonArray::fromStringList(args);
    obj[QStringLiteral("env")] = envObj;
    obj[QStringLiteral("transport")] = transport;
    if (!url.isEmpty()) {
        obj[QStringLiteral("url")] = url;
    }
    obj[QStringLiteral("enabled")] = enabled;
    return obj;
}

MCPServerManager::MCPServerManager(QObject *parent)
    : QObject(parent)
{
}

MCPServerManager::~MCPServerManager()
{
    // ManagedProcess children kill whatever is still running
    for (const Server &server : std::as_const(m_servers)) {
        disconnect(server.process, nullptr, this, nullptr);
    }
}

bool MCPServerManager::startServer(const MCPServerConfig &config, QString *error)
{
    auto fail = [error](const QString &message) {
        qWarning() << "[MCPServerManager]" << message;
        if (error) {
            *error = message;
        }
        return false;
    };

    if (m_servers.contains(config.name)) {
        return fail(QStringLiteral("MCP server \"%1\" is already running").arg(config.name));
    }
    if (config.transport != QLatin1String("stdio")) {
        return fail(QStringLiteral("Transport \"%1\" is not yet supported").arg(config.transport));
    }
    if (!config.enabled) {
        return fail(QStringLiteral("MCP server \"%1\" is disabled").arg(config.name));
    }
    if (config.command.isEmpty()) {
        return fail(QStringLiteral("MCP server \"%1\" has no command").arg(config.name));
    }

    const QString name = config.name;
    auto *process = new ManagedProcess(this);

    Server server;
    server.config = config;
    server.process = process;
    m_servers.insert(name, server);

    auto startError = std::make_shared<QString>();

    connect(process, &ManagedProcess::stderrReceived, this, [name](const QByteArray &chunk) {
        qDebug() << "[MCPServerManager]" << name << "stderr:" << QString::fromUtf8(chunk).trimmed();
    });
    connect(process, &ManagedProcess::failedToStart, this, [this, name, startError](const QString &message) {
        *startError = message;
        Q_EMIT serverError(name, message);
    });
    connect(process, &ManagedProcess::exited, this, [this, name, process](int exitCode, bool) {
        onServerExited(name, process, exitCode);
    });

    ManagedProcess::Spec spec;
    spec.program = config.command;
    spec.arguments = config.args;
    for (auto it = config.env.cbegin(); it != config.env.cend(); ++it) {
        spec.environment.insert(it.key(), it.value());
    }
    spec.channelMode = ManagedProcess::ChannelMode::SeparatePipes;

    qDebug() << "[MCPServerManager] Starting" << name << ":" << config.command << config.args;
    process->start(spec);

    // A spawn failure reported from inside start() already removed the record
    if (!m_servers.contains(name)) {
        return fail(QStringLiteral("Failed to start MCP server \"%1\": %2").arg(name, *startError));
    }

    // Output is only delivered from the event loop, so nothing is lost here
    auto *transport = new JsonRpcTransport(process->inputDevice(), process);
    connect(process, &ManagedProcess::stdoutReceived, transport, &JsonRpcTransport::feed);
    connect(transport, &JsonRpcTransport::messageReceived, this, [this, name](const QJsonObject &message) {
        deliver(name, message);
    });
    m_servers[name].transport = transport;

    Q_EMIT serverStarted(name);
    return true;
}

void MCPServerManager::stopServer(const QString &name, DoneCallback done)
{
    auto it = m_servers.find(name);
    if (it == m_servers.end()) {
        // Already stopped or never started
        if (done) {
            done();
        }
        return;
    }

    qDebug() << "[MCPServerManager] Stopping" << name;
    if (done) {
        it->stopWaiters.append(std::move(done));
    }
    it->process->stop(m_killGracePeriodMs);
}

bool MCPServerManager::restartServer(const QString &name, std::function<void(bool ok, const QString &error)> done)
{
    const auto it = m_servers.constFind(name);
    if (it == m_servers.constEnd()) {
        const QString message = QStringLiteral("MCP server \"%1\" is not running").arg(name);
        qWarning() << "[MCPServerManager]" << message;
        if (done) {
            done(false, message);
        }
        return false;
    }

    const MCPServerConfig config = it->config;
    stopServer(name, [this, config, done]() {
        QString error;
        const bool ok = startServer(config, &error);
        if (done) {
            done(ok, error);
        }
    });
    return true;
}

bool MCPServerManager::sendMessage(const QString &name, const QJsonObject &message, QString *error)
{
    const auto it = m_servers.constFind(name);
    if (it == m_servers.constEnd()) {
        const QString text = QStringLiteral("MCP server \"%1\" is not running").arg(name);
        qWarning() << "[MCPServerManager]" << text;
        if (error) {
            *error = text;
        }
        return false;
    }

    if (!it->transport->send(message)) {
        if (error) {
            *error = QStringLiteral("Failed to write to MCP server \"%1\"").arg(name);
        }
        return false;
    }
    return true;
}

quint64 MCPServerManager::onMessage(const QString &name, MessageCallback callback)
{
    auto it = m_servers.find(name);
    if (it == m_servers.end()) {
        return 0;
    }

    Subscription subscription;
    subscription.token = m_nextToken++;
    subscription.callback = std::move(callback);
    it->subscriptions.append(subscription);
    return subscription.token;
}

void MCPServerManager::offMessage(const QString &name, quint64 token)
{
    auto it = m_servers.find(name);
    if (it == m_servers.end()) {
        return;
    }

    for (int i = 0; i < it->subscriptions.size(); ++i) {
        if (it->subscriptions[i].token == token) {
            it->subscriptions.removeAt(i);
            return;
        }
    }
}

std::optional<MCPServerConfig> MCPServerManager::getServerConfig(const QString &name) const
{
    const auto it = m_servers.constFind(name);
    if (it == m_servers.constEnd()) {
        return std::nullopt;
    }
    return it->config;
}

void MCPServerManager::dispose(DoneCallback done)
{
    const QStringList names = m_servers.keys();
    qDebug() << "[MCPServerManager] Disposing" << names.size() << "servers";

    if (names.isEmpty()) {
        if (done) {
            done();
        }
        return;
    }

    auto remaining = std::make_shared<int>(names.size());
    for (const QString &name : names) {
        stopServer(name, [remaining, done]() {
            if (--(*remaining) == 0 && done) {
                done();
            }
        });
    }
}

void MCPServerManager::onServerExited(const QString &name, ManagedProcess *process, int exitCode)
{
    auto it = m_servers.find(name);
    if (it == m_servers.end() || it->process != process) {
        return;
    }

    qDebug() << "[MCPServerManager]" << name << "exited with code" << exitCode;

    const Server server = *it;
    m_servers.erase(it);

    disconnect(process, nullptr, this, nullptr);
    process->deleteLater();

    Q_EMIT serverExited(name, exitCode);

    for (const DoneCallback &waiter : server.stopWaiters) {
        waiter();
    }
}

void MCPServerManager::deliver(const QString &name, const QJsonObject &message)
{
    const auto it = m_servers.constFind(name);
    if (it == m_servers.constEnd()) {
        return;
    }

    // Snapshot: callbacks may subscribe, unsubscribe or stop the server
    const QList<Subscription> subscriptions = it->subscriptions;
    for (const Subscription &subscription : subscriptions) {
        try {
            subscription.callback(message);
        } catch (const std::exception &e) {
            qWarning() << "[MCPServerManager] Message callback for" << name << "threw:" << e.what();
        } catch (...) {
            qWarning() << "[MCPServerManager] Message callback for" << name << "threw a non-standard exception";
        }
    }
}
