/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

enum class ConnectionState {
    Created,
    Initializing,
    Ready,
    Disposed
};

enum class TerminalStatus {
    Running,
    Exited
};

struct PromptCapabilities {
    bool image = false;
    bool audio = false;
    bool embeddedContext = false;
};

struct McpCapabilities {
    bool http = false;
    bool sse = false;
};

struct AgentCapabilities {
    bool loadSession = false;
    bool setMode = false;
    PromptCapabilities prompt;
    McpCapabilities mcp;

    static AgentCapabilities fromJson(const QJsonObject &obj);
};

struct ClientCapabilities {
    bool readTextFile = true;
    bool writeTextFile = true;
    bool terminal = true;

    QJsonObject toJson() const;
};

struct AgentInfo {
    QString name;
    QString version;
};

struct InitializeParams {
    // Sent verbatim; the mock agent and several real agents use a date string
    QJsonValue protocolVersion;
    ClientCapabilities clientCapabilities;
    QString clientName;
    QString clientVersion;

    InitializeParams();
    QJsonObject toJson() const;
};

// Entry of the session/new "mcpServers" array
struct McpServerSpec {
    QString name;
    QString command;
    QStringList args;
    QMap<QString, QString> env;

    QJsonObject toJson() const;
};

struct SessionMode {
    QString id;
    QString name;
    QString description;
};

struct SessionInfo {
    QString sessionId;
    QString cwd;
    QStringList mcpServerNames;
    QString currentModeId;
    QList<SessionMode> availableModes;
};

// Reads both {modes: {availableModes, currentModeId}} and the flat form
void parseSessionModes(const QJsonObject &result, SessionInfo &info);

// Ordered so that a status may only move to a greater value.
// Completed and Failed are both terminal.
enum class ToolCallStatus {
    Pending = 0,
    InProgress = 1,
    AwaitingPermission = 2,
    Completed = 3,
    Failed = 4
};

ToolCallStatus toolCallStatusFromString(const QString &status, ToolCallStatus fallback = ToolCallStatus::Pending);
QString toolCallStatusName(ToolCallStatus status);
bool isTerminalStatus(ToolCallStatus status);

struct ToolCallContent {
    QString type;  // "content", "diff", "terminal"
    QString text;
    QString path;
    QString oldText;
    QString newText;
    QString terminalId;

    static ToolCallContent fromJson(const QJsonObject &obj);
};

struct ToolCallLocation {
    QString path;
    int line = -1;
};

struct ToolCall {
    QString id;
    QString title;
    QString kind;  // "read", "edit", "delete", "move", "search", "execute", "think", "fetch", "other"
    ToolCallStatus status = ToolCallStatus::Pending;
    QList<ToolCallContent> content;
    QList<ToolCallLocation> locations;
    QJsonObject rawInput;
    QJsonValue rawOutput;

    // Parses the fields present in a tool_call / tool_call_update payload
    static ToolCall fromJson(const QJsonObject &obj);
};

struct PlanEntry {
    QString content;
    QString priority;
    QString status;
};

struct SlashCommand {
    QString name;
    QString description;
    QString inputHint;
};

struct PermissionOption {
    QString optionId;
    QString name;
    QString kind;  // "allow_once", "allow_always", "reject_once", "reject_always"
};

enum class PermissionDecision {
    AllowOnce,
    AllowAlways,
    RejectOnce,
    RejectAlways,
    Cancelled
};

QString permissionDecisionName(PermissionDecision decision);

struct PermissionRequest {
    QString sessionId;
    ToolCall toolCall;
    QList<PermissionOption> options;

    static PermissionRequest fromJson(const QJsonObject &params);
};

// Prompt content blocks for session/prompt
namespace ContentBlock {
QJsonObject text(const QString &text);
QJsonObject resource(const QString &path, const QString &text, const QString &mimeType = QString());
QJsonObject resourceLink(const QString &path, const QString &name = QString());
QJsonObject image(const QString &mimeType, const QByteArray &data);
QString guessMimeType(const QString &path);
}
