/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ClientConfig.h"
#include "../acp/ACPProtocol.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

ClientConfig::ClientConfig(QObject *parent)
    : QObject(parent)
    , m_settings(QStringLiteral("acpbridge"), QStringLiteral("acpbridge"))
{
    qDebug() << "[ClientConfig] Initialized, config file:" << m_settings.fileName();
}

ClientConfig::ClientConfig(const QString &fileName, QObject *parent)
    : QObject(parent)
    , m_settings(fileName, QSettings::IniFormat)
{
    qDebug() << "[ClientConfig] Initialized, config file:" << m_settings.fileName();
}

ClientConfig::~ClientConfig() = default;

void ClientConfig::store(const QString &key, const QVariant &value)
{
    m_settings.setValue(key, value);
    m_settings.sync();
    Q_EMIT settingsChanged();
}

// --- Provider Management ---

QList<AgentProvider> ClientConfig::builtinProviders() const
{
    AgentProvider claude;
    claude.id = QStringLiteral("claude-code");
    claude.description = QStringLiteral("Claude Code");
    claude.executable = QStringLiteral("claude-code-acp");
    claude.builtin = true;
    return {claude};
}

QList<AgentProvider> ClientConfig::customProviders() const
{
    QList<AgentProvider> list;
    int size = m_settings.beginReadArray(QStringLiteral("ACP/providers"));
    for (int i = 0; i < size; ++i) {
        m_settings.setArrayIndex(i);
        AgentProvider p;
        p.id = m_settings.value(QStringLiteral("id")).toString();
        p.description = m_settings.value(QStringLiteral("description")).toString();
        p.executable = m_settings.value(QStringLiteral("executable")).toString();
        p.args = m_settings.value(QStringLiteral("args")).toStringList();

        // env is stored as a list of NAME=value strings
        const QStringList env = m_settings.value(QStringLiteral("env")).toStringList();
        for (const QString &entry : env) {
            const int eq = entry.indexOf(QLatin1Char('='));
            if (eq > 0) {
                p.env.insert(entry.left(eq), entry.mid(eq + 1));
            }
        }

        p.builtin = false;
        if (!p.id.isEmpty() && !p.executable.isEmpty()) {
            list.append(p);
        }
    }
    m_settings.endArray();
    return list;
}

void ClientConfig::writeCustomProviders(const QList<AgentProvider> &list)
{
    m_settings.beginWriteArray(QStringLiteral("ACP/providers"), list.size());
    for (int i = 0; i < list.size(); ++i) {
        m_settings.setArrayIndex(i);
        m_settings.setValue(QStringLiteral("id"), list[i].id);
        m_settings.setValue(QStringLiteral("description"), list[i].description);
        m_settings.setValue(QStringLiteral("executable"), list[i].executable);
        m_settings.setValue(QStringLiteral("args"), list[i].args);

        QStringList env;
        for (auto it = list[i].env.cbegin(); it != list[i].env.cend(); ++it) {
            env.append(it.key() + QLatin1Char('=') + it.value());
        }
        m_settings.setValue(QStringLiteral("env"), env);
    }
    m_settings.endArray();
    m_settings.sync();
    Q_EMIT settingsChanged();
}

QList<AgentProvider> ClientConfig::providers() const
{
    QList<AgentProvider> all = builtinProviders();
    all.append(customProviders());
    return all;
}

AgentProvider ClientConfig::activeProvider() const
{
    const QString id = activeProviderId();
    const auto all = providers();
    for (const auto &p : all) {
        if (p.id == id) {
            return p;
        }
    }
    // Fallback to first builtin
    return all.first();
}

QString ClientConfig::activeProviderId() const
{
    return m_settings.value(QStringLiteral("ACP/activeProvider"), QStringLiteral("claude-code")).toString();
}

void ClientConfig::setActiveProviderId(const QString &id)
{
    store(QStringLiteral("ACP/activeProvider"), id);
}

void ClientConfig::addProvider(const AgentProvider &provider)
{
    auto list = customProviders();
    list.append(provider);
    writeCustomProviders(list);
}

bool ClientConfig::updateProvider(const QString &id, const AgentProvider &provider)
{
    auto list = customProviders();
    for (int i = 0; i < list.size(); ++i) {
        if (list[i].id == id) {
            list[i] = provider;
            writeCustomProviders(list);
            return true;
        }
    }
    qWarning() << "[ClientConfig] No custom provider with id" << id;
    return false;
}

bool ClientConfig::removeProvider(const QString &id)
{
    auto list = customProviders();
    const auto removed = list.removeIf([&id](const AgentProvider &p) { return p.id == id; });
    if (removed == 0) {
        qWarning() << "[ClientConfig] Cannot remove provider" << id << "(built-in or unknown)";
        return false;
    }
    writeCustomProviders(list);
    return true;
}

AgentLaunchConfig ClientConfig::launchConfig(const AgentProvider &provider, const QString &workingDirectory) const
{
    AgentLaunchConfig config;
    config.executable = provider.executable;
    config.args = provider.args;
    for (auto it = provider.env.cbegin(); it != provider.env.cend(); ++it) {
        config.environment.insert(it.key(), it.value());
    }
    config.workingDirectory = workingDirectory;
    config.killGracePeriodMs = killGracePeriodMs();
    return config;
}

// --- Protocol ---

QString ClientConfig::protocolVersion() const
{
    return m_settings.value(QStringLiteral("ACP/protocolVersion"), QString(AcpDefaults::ProtocolVersion)).toString();
}

void ClientConfig::setProtocolVersion(const QString &version)
{
    store(QStringLiteral("ACP/protocolVersion"), version);
}

int ClientConfig::requestTimeoutMs() const
{
    return m_settings.value(QStringLiteral("ACP/requestTimeoutMs"), 0).toInt();
}

void ClientConfig::setRequestTimeoutMs(int ms)
{
    store(QStringLiteral("ACP/requestTimeoutMs"), ms);
}

int ClientConfig::initializeTimeoutMs() const
{
    return m_settings.value(QStringLiteral("ACP/initializeTimeoutMs"), 30000).toInt();
}

JsonRpcTransport::MalformedLinePolicy ClientConfig::malformedLinePolicy() const
{
    const QString value = m_settings.value(QStringLiteral("ACP/malformedLines"), QStringLiteral("lenient")).toString();
    if (value.compare(QLatin1String("strict"), Qt::CaseInsensitive) == 0) {
        return JsonRpcTransport::MalformedLinePolicy::Strict;
    }
    if (value.compare(QLatin1String("lenient"), Qt::CaseInsensitive) != 0) {
        qWarning() << "[ClientConfig] Unknown ACP/malformedLines value" << value << "- using lenient";
    }
    return JsonRpcTransport::MalformedLinePolicy::Lenient;
}

void ClientConfig::setMalformedLinePolicy(JsonRpcTransport::MalformedLinePolicy policy)
{
    store(QStringLiteral("ACP/malformedLines"),
          policy == JsonRpcTransport::MalformedLinePolicy::Strict ? QStringLiteral("strict") : QStringLiteral("lenient"));
}

// --- Terminals and processes ---

qint64 ClientConfig::terminalOutputByteLimit() const
{
    return m_settings.value(QStringLiteral("Terminal/outputByteLimit"), 0).toLongLong();
}

int ClientConfig::terminalColumns() const
{
    return m_settings.value(QStringLiteral("Terminal/columns"), 120).toInt();
}

int ClientConfig::terminalRows() const
{
    return m_settings.value(QStringLiteral("Terminal/rows"), 40).toInt();
}

int ClientConfig::killGracePeriodMs() const
{
    return m_settings.value(QStringLiteral("Process/killGracePeriodMs"), 100).toInt();
}

// --- Permissions ---

QStringList ClientConfig::autoApproveKinds() const
{
    return m_settings.value(QStringLiteral("Permissions/autoApproveKinds"),
                            QStringList{QStringLiteral("read"), QStringLiteral("think")})
        .toStringList();
}

void ClientConfig::setAutoApproveKinds(const QStringList &kinds)
{
    store(QStringLiteral("Permissions/autoApproveKinds"), kinds);
}

// --- MCP servers ---

QList<MCPServerConfig> ClientConfig::mcpServers() const
{
    // Stored as one JSON array string; nested maps do not fit QSettings arrays
    const QByteArray json = m_settings.value(QStringLiteral("MCP/servers")).toString().toUtf8();
    if (json.isEmpty()) {
        return {};
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "[ClientConfig] Ignoring malformed MCP/servers value:" << error.errorString();
        return {};
    }

    QList<MCPServerConfig> servers;
    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        MCPServerConfig server = MCPServerConfig::fromJson(value.toObject());
        if (!server.name.isEmpty()) {
            servers.append(server);
        }
    }
    return servers;
}

void ClientConfig::setMcpServers(const QList<MCPServerConfig> &servers)
{
    QJsonArray array;
    for (const MCPServerConfig &server : servers) {
        array.append(server.toJson());
    }
    store(QStringLiteral("MCP/servers"), QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact)));
}

// --- Debug ---

bool ClientConfig::debugLogging() const
{
    return m_settings.value(QStringLiteral("Debug/logging"), false).toBool();
}

void ClientConfig::setDebugLogging(bool enable)
{
    store(QStringLiteral("Debug/logging"), enable);
}
