/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "../acp/ACPModels.h"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

class JsonRpcTransport;
class ManagedProcess;

struct MCPServerConfig {
    QString name;
    QString command;
    QStringList args;
    QMap<QString, QString> env;
    QString transport = QStringLiteral("stdio");  // "stdio", "http", "sse"
    QString url;                                  // http / sse only
    bool enabled = true;

    // Entry for the session/new "mcpServers" array
    McpServerSpec toSessionConfig() const;

    static MCPServerConfig fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

/**
 * MCPServerManager - supervises auxiliary MCP server processes.
 *
 * Only process lifecycle and raw newline-delimited JSON relay are handled
 * here; message contents are not interpreted. A server that exits or fails
 * is dropped from the running set on its own, so callers should check
 * getRunningServers() rather than remember earlier startServer() results.
 */
class MCPServerManager : public QObject
{
    Q_OBJECT

public:
    using MessageCallback = std::function<void(const QJsonObject &message)>;
    using DoneCallback = std::function<void()>;

    explicit MCPServerManager(QObject *parent = nullptr);
    ~MCPServerManager() override;

    bool startServer(const MCPServerConfig &config, QString *error = nullptr);

    // SIGTERM and wait for the exit; done runs immediately if not running
    void stopServer(const QString &name, DoneCallback done = DoneCallback());

    // Stop, then start again with the retained configuration
    bool restartServer(const QString &name, std::function<void(bool ok, const QString &error)> done = nullptr);

    bool sendMessage(const QString &name, const QJsonObject &message, QString *error = nullptr);

    // Returns 0 if the server is not running
    quint64 onMessage(const QString &name, MessageCallback callback);
    void offMessage(const QString &name, quint64 token);

    QStringList getRunningServers() const { return m_servers.keys(); }
    std::optional<MCPServerConfig> getServerConfig(const QString &name) const;
    bool isRunning(const QString &name) const { return m_servers.contains(name); }

    // Stop every server concurrently; done runs once all have exited
    void dispose(DoneCallback done = DoneCallback());

    void setKillGracePeriod(int ms) { m_killGracePeriodMs = ms; }

Q_SIGNALS:
    void serverStarted(const QString &name);
    void serverExited(const QString &name, int exitCode);
    void serverError(const QString &name, const QString &message);

private:
    struct Subscription {
        quint64 token = 0;
        MessageCallback callback;
    };

    struct Server {
        MCPServerConfig config;
        ManagedProcess *process = nullptr;
        JsonRpcTransport *transport = nullptr;
        QList<Subscription> subscriptions;
        QList<DoneCallback> stopWaiters;
    };

    void onServerExited(const QString &name, ManagedProcess *process, int exitCode);
    void deliver(const QString &name, const QJsonObject &message);

    QHash<QString, Server> m_servers;
    quint64 m_nextToken = 1;
    int m_killGracePeriodMs = 2000;
};
