/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "SessionUpdateTracker.h"

#include <QDebug>
#include <QJsonArray>

#include <utility>

SessionUpdateTracker::SessionUpdateTracker(QObject *parent)
    : QObject(parent)
{
}

ToolCall SessionUpdateTracker::toolCall(const QString &sessionId, const QString &toolCallId) const
{
    return m_sessions.value(sessionId).toolCalls.value(toolCallId);
}

QList<ToolCall> SessionUpdateTracker::toolCalls(const QString &sessionId) const
{
    const SessionState state = m_sessions.value(sessionId);
    QList<ToolCall> result;
    for (const QString &id : state.toolCallOrder) {
        result.append(state.toolCalls.value(id));
    }
    return result;
}

void SessionUpdateTracker::resetTurn(const QString &sessionId)
{
    auto it = m_sessions.find(sessionId);
    if (it != m_sessions.end()) {
        it->messageText.clear();
        it->thoughtText.clear();
    }
}

void SessionUpdateTracker::clear(const QString &sessionId)
{
    m_sessions.remove(sessionId);
}

void SessionUpdateTracker::update(const QString &sessionId, const QJsonObject &update)
{
    const QString updateType = update[QStringLiteral("sessionUpdate")].toString();
    SessionState &state = m_sessions[sessionId];

    if (updateType == QLatin1String("agent_message_chunk")) {
        const QString text = chunkText(update);
        state.messageText += text;
        Q_EMIT messageChunk(sessionId, text);
    } else if (updateType == QLatin1String("agent_thought_chunk")) {
        const QString text = chunkText(update);
        state.thoughtText += text;
        Q_EMIT thoughtChunk(sessionId, text);
    } else if (updateType == QLatin1String("tool_call")) {
        handleToolCall(sessionId, update);
    } else if (updateType == QLatin1String("tool_call_update")) {
        handleToolCallUpdate(sessionId, update);
    } else if (updateType == QLatin1String("plan")) {
        // Current agents send "entries"; older ones "plan"
        QJsonArray entries = update[QStringLiteral("entries")].toArray();
        if (entries.isEmpty()) {
            entries = update[QStringLiteral("plan")].toArray();
        }

        QList<PlanEntry> plan;
        for (const QJsonValue &value : std::as_const(entries)) {
            const QJsonObject entryObj = value.toObject();
            PlanEntry entry;
            entry.content = entryObj[QStringLiteral("content")].toString();
            entry.priority = entryObj[QStringLiteral("priority")].toString();
            entry.status = entryObj[QStringLiteral("status")].toString();
            plan.append(entry);
        }

        qDebug() << "[SessionUpdateTracker] Plan update with" << plan.size() << "entries";
        state.plan = plan;
        Q_EMIT planUpdated(sessionId, plan);
    } else if (updateType == QLatin1String("available_commands_update")) {
        QJsonArray commandsArray = update[QStringLiteral("availableCommands")].toArray();
        if (commandsArray.isEmpty()) {
            commandsArray = update[QStringLiteral("commands")].toArray();
        }

        QList<SlashCommand> commands;
        for (const QJsonValue &value : std::as_const(commandsArray)) {
            const QJsonObject cmdObj = value.toObject();
            SlashCommand cmd;
            cmd.name = cmdObj[QStringLiteral("name")].toString();
            cmd.description = cmdObj[QStringLiteral("description")].toString();
            cmd.inputHint = cmdObj[QStringLiteral("input")].toObject()[QStringLiteral("hint")].toString();
            commands.append(cmd);
        }

        state.commands = commands;
        Q_EMIT commandsUpdated(sessionId, commands);
    } else if (updateType == QLatin1String("current_mode_update")) {
        QString modeId = update[QStringLiteral("currentModeId")].toString();
        if (modeId.isEmpty()) {
            modeId = update[QStringLiteral("modeId")].toString();
        }
        qDebug() << "[SessionUpdateTracker] Mode changed to:" << modeId;
        state.currentModeId = modeId;
        Q_EMIT modeChanged(sessionId, modeId);
    } else {
        qDebug() << "[SessionUpdateTracker] Ignoring update type:" << updateType;
    }
}

void SessionUpdateTracker::handleToolCall(const QString &sessionId, const QJsonObject &update)
{
    SessionState &state = m_sessions[sessionId];
    const ToolCall incoming = ToolCall::fromJson(update);
    if (incoming.id.isEmpty()) {
        qWarning() << "[SessionUpdateTracker] tool_call without toolCallId";
        return;
    }

    auto it = state.toolCalls.find(incoming.id);
    if (it != state.toolCalls.end()) {
        // Announced twice; treat the repeat as an update
        handleToolCallUpdate(sessionId, update);
        return;
    }

    state.toolCalls.insert(incoming.id, incoming);
    state.toolCallOrder.append(incoming.id);
    Q_EMIT toolCallAdded(sessionId, incoming);
}

void SessionUpdateTracker::handleToolCallUpdate(const QString &sessionId, const QJsonObject &update)
{
    SessionState &state = m_sessions[sessionId];
    const QString toolCallId = update[QStringLiteral("toolCallId")].toString();
    if (toolCallId.isEmpty()) {
        qWarning() << "[SessionUpdateTracker] tool_call_update without toolCallId";
        return;
    }

    auto it = state.toolCalls.find(toolCallId);
    if (it == state.toolCalls.end()) {
        // Update for a call we never saw announced
        ToolCall call = ToolCall::fromJson(update);
        state.toolCalls.insert(toolCallId, call);
        state.toolCallOrder.append(toolCallId);
        Q_EMIT toolCallAdded(sessionId, call);
        return;
    }

    const ToolCall incoming = ToolCall::fromJson(update);
    ToolCall &call = *it;

    if (update.contains(QStringLiteral("status"))) {
        mergeStatus(call, incoming.status);
    }
    if (update.contains(QStringLiteral("title")) && !incoming.title.isEmpty()) {
        call.title = incoming.title;
    }
    if (update.contains(QStringLiteral("kind"))) {
        call.kind = incoming.kind;
    }
    if (update.contains(QStringLiteral("content"))) {
        call.content = incoming.content;
    }
    if (update.contains(QStringLiteral("locations"))) {
        call.locations = incoming.locations;
    }
    if (update.contains(QStringLiteral("rawInput"))) {
        call.rawInput = incoming.rawInput;
    }
    if (update.contains(QStringLiteral("rawOutput"))) {
        call.rawOutput = incoming.rawOutput;
    }

    const ToolCall snapshot = call;
    Q_EMIT toolCallUpdated(sessionId, snapshot);
}

void SessionUpdateTracker::mergeStatus(ToolCall &call, ToolCallStatus next)
{
    // A granted permission resumes the call
    const bool resumed = call.status == ToolCallStatus::AwaitingPermission && next == ToolCallStatus::InProgress;
    if (isTerminalStatus(call.status) || (!resumed && static_cast<int>(next) < static_cast<int>(call.status))) {
        if (next != call.status) {
            qDebug() << "[SessionUpdateTracker] Ignoring status change" << toolCallStatusName(call.status)
                     << "->" << toolCallStatusName(next) << "for tool call" << call.id;
        }
        return;
    }
    call.status = next;
}

QString SessionUpdateTracker::chunkText(const QJsonObject &update)
{
    const QJsonValue content = update[QStringLiteral("content")];
    if (content.isString()) {
        return content.toString();
    }
    return content.toObject()[QStringLiteral("text")].toString();
}
