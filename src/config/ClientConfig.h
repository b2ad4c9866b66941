/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "../acp/ACPClient.h"
#include "../mcp/MCPServerManager.h"
#include "../rpc/JsonRpcTransport.h"

#include <QList>
#include <QMap>
#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QVariant>

// Agent executable definition
struct AgentProvider {
    QString id;           // Stable identifier (e.g. "claude-code", "custom-1")
    QString description;  // Display name
    QString executable;   // Binary name or path
    QStringList args;
    QMap<QString, QString> env;
    bool builtin = false; // true for built-in providers (can't be removed)
};

class ClientConfig : public QObject
{
    Q_OBJECT

public:
    // Default scope (acpbridge/acpbridge)
    explicit ClientConfig(QObject *parent = nullptr);
    // Explicit INI file
    explicit ClientConfig(const QString &fileName, QObject *parent = nullptr);
    ~ClientConfig() override;

    QString fileName() const { return m_settings.fileName(); }
    QSettings::Status status() const { return m_settings.status(); }

    // Provider management
    QList<AgentProvider> providers() const;
    AgentProvider activeProvider() const;
    QString activeProviderId() const;
    void setActiveProviderId(const QString &id);

    void addProvider(const AgentProvider &provider);
    bool updateProvider(const QString &id, const AgentProvider &provider);
    bool removeProvider(const QString &id);

    AgentLaunchConfig launchConfig(const AgentProvider &provider, const QString &workingDirectory) const;

    // Protocol
    QString protocolVersion() const;
    void setProtocolVersion(const QString &version);

    int requestTimeoutMs() const;
    void setRequestTimeoutMs(int ms);
    int initializeTimeoutMs() const;

    JsonRpcTransport::MalformedLinePolicy malformedLinePolicy() const;
    void setMalformedLinePolicy(JsonRpcTransport::MalformedLinePolicy policy);

    // Terminals and processes
    qint64 terminalOutputByteLimit() const;
    int terminalColumns() const;
    int terminalRows() const;
    int killGracePeriodMs() const;

    // Permissions
    QStringList autoApproveKinds() const;
    void setAutoApproveKinds(const QStringList &kinds);

    // MCP servers handed to session/new
    QList<MCPServerConfig> mcpServers() const;
    void setMcpServers(const QList<MCPServerConfig> &servers);

    // Debug settings
    bool debugLogging() const;
    void setDebugLogging(bool enable);

Q_SIGNALS:
    void settingsChanged();

private:
    QList<AgentProvider> builtinProviders() const;
    QList<AgentProvider> customProviders() const;
    void writeCustomProviders(const QList<AgentProvider> &list);
    void store(const QString &key, const QVariant &value);

    mutable QSettings m_settings;
};
