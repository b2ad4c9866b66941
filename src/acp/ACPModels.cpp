/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ACPModels.h"
#include "ACPProtocol.h"

#include <QFileInfo>
#include <QJsonDocument>
#include <QUrl>

AgentCapabilities AgentCapabilities::fromJson(const QJsonObject &obj)
{
    AgentCapabilities caps;
    caps.loadSession = obj[QStringLiteral("loadSession")].toBool();
    caps.setMode = obj[QStringLiteral("setMode")].toBool();

    const QJsonObject prompt = obj[QStringLiteral("promptCapabilities")].toObject();
    caps.prompt.image = prompt[QStringLiteral("image")].toBool();
    caps.prompt.audio = prompt[QStringLiteral("audio")].toBool();
    caps.prompt.embeddedContext = prompt[QStringLiteral("embeddedContext")].toBool();

    const QJsonObject mcp = obj[QStringLiteral("mcpCapabilities")].toObject();
    caps.mcp.http = mcp[QStringLiteral("http")].toBool();
    caps.mcp.sse = mcp[QStringLiteral("sse")].toBool();
    return caps;
}

QJsonObject ClientCapabilities::toJson() const
{
    QJsonObject fs;
    fs[QStringLiteral("readTextFile")] = readTextFile;
    fs[QStringLiteral("writeTextFile")] = writeTextFile;

    QJsonObject caps;
    caps[QStringLiteral("fs")] = fs;
    caps[QStringLiteral("terminal")] = terminal;
    return caps;
}

InitializeParams::InitializeParams()
    : protocolVersion(QString(AcpDefaults::ProtocolVersion))
    , clientName(AcpDefaults::ClientName)
    , clientVersion(AcpDefaults::ClientVersion)
{
}

QJsonObject InitializeParams::toJson() const
{
    QJsonObject clientInfo;
    clientInfo[QStringLiteral("name")] = clientName;
    clientInfo[QStringLiteral("version")] = clientVersion;

    QJsonObject params;
    params[QStringLiteral("protocolVersion")] = protocolVersion;
    params[QStringLiteral("clientCapabilities")] = clientCapabilities.toJson();
    params[QStringLiteral("clientInfo")] = clientInfo;
    return params;
}

QJsonObject McpServerSpec::toJson() const
{
    QJsonArray envArray;
    for (auto it = env.cbegin(); it != env.cend(); ++it) {
        QJsonObject entry;
        entry[QStringLiteral("name")] = it.key();
        entry[QStringLiteral("value")] = it.value();
        envArray.append(entry);
    }

    QJsonObject obj;
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("command")] = command;
    obj[QStringLiteral("args")] = QJsonArray::fromStringList(args);
    obj[QStringLiteral("env")] = envArray;
    return obj;
}

void parseSessionModes(const QJsonObject &result, SessionInfo &info)
{
    QJsonObject modes = result[QStringLiteral("modes")].toObject();
    if (modes.isEmpty()) {
        modes = result;
    }

    const QJsonArray available = modes[QStringLiteral("availableModes")].toArray();
    if (!available.isEmpty()) {
        info.availableModes.clear();
        for (const QJsonValue &value : available) {
            const QJsonObject modeObj = value.toObject();
            SessionMode mode;
            mode.id = modeObj[QStringLiteral("id")].toString();
            mode.name = modeObj[QStringLiteral("name")].toString();
            mode.description = modeObj[QStringLiteral("description")].toString();
            info.availableModes.append(mode);
        }
    }

    const QString current = modes[QStringLiteral("currentModeId")].toString();
    if (!current.isEmpty()) {
        info.currentModeId = current;
    }
}

ToolCallStatus toolCallStatusFromString(const QString &status, ToolCallStatus fallback)
{
    if (status == QLatin1String("pending")) {
        return ToolCallStatus::Pending;
    }
    if (status == QLatin1String("in_progress") || status == QLatin1String("running")) {
        return ToolCallStatus::InProgress;
    }
    if (status == QLatin1String("awaiting_permission")) {
        return ToolCallStatus::AwaitingPermission;
    }
    if (status == QLatin1String("completed")) {
        return ToolCallStatus::Completed;
    }
    if (status == QLatin1String("failed") || status == QLatin1String("error")) {
        return ToolCallStatus::Failed;
    }
    return fallback;
}

QString toolCallStatusName(ToolCallStatus status)
{
    switch (status) {
    case ToolCallStatus::Pending:
        return QStringLiteral("pending");
    case ToolCallStatus::InProgress:
        return QStringLiteral("in_progress");
    case ToolCallStatus::AwaitingPermission:
        return QStringLiteral("awaiting_permission");
    case ToolCallStatus::Completed:
        return QStringLiteral("completed");
    case ToolCallStatus::Failed:
        return QStringLiteral("failed");
    }
    return QString();
}

bool isTerminalStatus(ToolCallStatus status)
{
    return status == ToolCallStatus::Completed || status == ToolCallStatus::Failed;
}

ToolCallContent ToolCallContent::fromJson(const QJsonObject &obj)
{
    ToolCallContent item;
    item.type = obj[QStringLiteral("type")].toString();

    if (item.type == QLatin1String("terminal")) {
        item.terminalId = obj[QStringLiteral("terminalId")].toString();
        if (item.terminalId.isEmpty()) {
            item.terminalId = obj[QStringLiteral("terminal_id")].toString();
        }
    } else if (item.type == QLatin1String("diff")) {
        item.path = obj[QStringLiteral("path")].toString();
        item.oldText = obj[QStringLiteral("oldText")].toString();
        item.newText = obj[QStringLiteral("newText")].toString();
    } else if (item.type == QLatin1String("content")) {
        item.text = obj[QStringLiteral("content")].toObject()[QStringLiteral("text")].toString();
    } else {
        item.text = obj[QStringLiteral("text")].toString();
    }
    return item;
}

ToolCall ToolCall::fromJson(const QJsonObject &obj)
{
    ToolCall call;
    call.id = obj[QStringLiteral("toolCallId")].toString();
    call.title = obj[QStringLiteral("title")].toString();
    if (call.title.isEmpty()) {
        const QJsonObject claudeCode = obj[QStringLiteral("_meta")].toObject()[QStringLiteral("claudeCode")].toObject();
        call.title = claudeCode[QStringLiteral("toolName")].toString();
    }
    call.kind = obj[QStringLiteral("kind")].toString();
    call.status = toolCallStatusFromString(obj[QStringLiteral("status")].toString());

    // rawInput may be an object or a JSON string that needs parsing
    const QJsonValue rawInput = obj[QStringLiteral("rawInput")];
    if (rawInput.isObject()) {
        call.rawInput = rawInput.toObject();
    } else if (rawInput.isString()) {
        const QJsonDocument doc = QJsonDocument::fromJson(rawInput.toString().toUtf8());
        if (doc.isObject()) {
            call.rawInput = doc.object();
        }
    }
    call.rawOutput = obj[QStringLiteral("rawOutput")];

    const QJsonArray content = obj[QStringLiteral("content")].toArray();
    for (const QJsonValue &value : content) {
        call.content.append(ToolCallContent::fromJson(value.toObject()));
    }

    const QJsonArray locations = obj[QStringLiteral("locations")].toArray();
    for (const QJsonValue &value : locations) {
        const QJsonObject locationObj = value.toObject();
        ToolCallLocation location;
        location.path = locationObj[QStringLiteral("path")].toString();
        location.line = locationObj[QStringLiteral("line")].toInt(-1);
        call.locations.append(location);
    }

    return call;
}

QString permissionDecisionName(PermissionDecision decision)
{
    switch (decision) {
    case PermissionDecision::AllowOnce:
        return QStringLiteral("allow_once");
    case PermissionDecision::AllowAlways:
        return QStringLiteral("allow_always");
    case PermissionDecision::RejectOnce:
        return QStringLiteral("reject_once");
    case PermissionDecision::RejectAlways:
        return QStringLiteral("reject_always");
    case PermissionDecision::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QString();
}

PermissionRequest PermissionRequest::fromJson(const QJsonObject &params)
{
    PermissionRequest request;
    request.sessionId = params[QStringLiteral("sessionId")].toString();

    QJsonObject toolCall = params[QStringLiteral("toolCall")].toObject();
    if (toolCall.isEmpty()) {
        // Older agents put the tool call fields at the top level
        toolCall = params;
    }
    request.toolCall = ToolCall::fromJson(toolCall);

    const QJsonArray options = params[QStringLiteral("options")].toArray();
    for (const QJsonValue &value : options) {
        const QJsonObject optionObj = value.toObject();
        PermissionOption option;
        option.optionId = optionObj[QStringLiteral("optionId")].toString();
        option.name = optionObj[QStringLiteral("name")].toString();
        option.kind = optionObj[QStringLiteral("kind")].toString();
        request.options.append(option);
    }

    return request;
}

namespace ContentBlock {

QJsonObject text(const QString &text)
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("text");
    block[QStringLiteral("text")] = text;
    return block;
}

QJsonObject resource(const QString &path, const QString &text, const QString &mimeType)
{
    QJsonObject resource;
    resource[QStringLiteral("uri")] = QUrl::fromLocalFile(path).toString();
    resource[QStringLiteral("text")] = text;
    resource[QStringLiteral("mimeType")] = mimeType.isEmpty() ? guessMimeType(path) : mimeType;

    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("resource");
    block[QStringLiteral("resource")] = resource;
    return block;
}

QJsonObject resourceLink(const QString &path, const QString &name)
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("resource_link");
    block[QStringLiteral("uri")] = QUrl::fromLocalFile(path).toString();
    block[QStringLiteral("name")] = name.isEmpty() ? QFileInfo(path).fileName() : name;
    block[QStringLiteral("mimeType")] = guessMimeType(path);
    return block;
}

QJsonObject image(const QString &mimeType, const QByteArray &data)
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("image");
    block[QStringLiteral("mimeType")] = mimeType;
    block[QStringLiteral("data")] = QString::fromLatin1(data.toBase64());
    return block;
}

QString guessMimeType(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();

    if (suffix == QLatin1String("cpp") || suffix == QLatin1String("h") || suffix == QLatin1String("cc")
        || suffix == QLatin1String("cxx") || suffix == QLatin1String("hpp")) {
        return QStringLiteral("text/x-c++");
    }
    if (suffix == QLatin1String("c")) {
        return QStringLiteral("text/x-c");
    }
    if (suffix == QLatin1String("py")) {
        return QStringLiteral("text/x-python");
    }
    if (suffix == QLatin1String("js")) {
        return QStringLiteral("text/javascript");
    }
    if (suffix == QLatin1String("ts")) {
        return QStringLiteral("text/x-typescript");
    }
    if (suffix == QLatin1String("rs")) {
        return QStringLiteral("text/x-rust");
    }
    if (suffix == QLatin1String("json")) {
        return QStringLiteral("application/json");
    }
    if (suffix == QLatin1String("md")) {
        return QStringLiteral("text/markdown");
    }
    return QStringLiteral("text/plain");
}

}
