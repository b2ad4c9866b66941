/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "ACPModels.h"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

/**
 * SessionUpdateTracker - rebuilds per-session state from session/update.
 *
 * Connect ACPClient::sessionUpdate to update(). Tool call status only moves
 * forward (see ToolCallStatus); an update that would revert it, or leave
 * completed/failed, keeps the old status but still merges its content.
 */
class SessionUpdateTracker : public QObject
{
    Q_OBJECT

public:
    struct SessionState {
        QString messageText;
        QString thoughtText;
        QHash<QString, ToolCall> toolCalls;
        QStringList toolCallOrder;
        QList<PlanEntry> plan;
        QList<SlashCommand> commands;
        QString currentModeId;
    };

    explicit SessionUpdateTracker(QObject *parent = nullptr);

    SessionState session(const QString &sessionId) const { return m_sessions.value(sessionId); }
    bool hasSession(const QString &sessionId) const { return m_sessions.contains(sessionId); }
    ToolCall toolCall(const QString &sessionId, const QString &toolCallId) const;
    QList<ToolCall> toolCalls(const QString &sessionId) const;

    // Start a new turn: clears accumulated message/thought text
    void resetTurn(const QString &sessionId);
    void clear(const QString &sessionId);

public Q_SLOTS:
    void update(const QString &sessionId, const QJsonObject &update);

Q_SIGNALS:
    void messageChunk(const QString &sessionId, const QString &text);
    void thoughtChunk(const QString &sessionId, const QString &text);
    void toolCallAdded(const QString &sessionId, const ToolCall &toolCall);
    void toolCallUpdated(const QString &sessionId, const ToolCall &toolCall);
    void planUpdated(const QString &sessionId, const QList<PlanEntry> &entries);
    void commandsUpdated(const QString &sessionId, const QList<SlashCommand> &commands);
    void modeChanged(const QString &sessionId, const QString &modeId);

private:
    void handleToolCall(const QString &sessionId, const QJsonObject &update);
    void handleToolCallUpdate(const QString &sessionId, const QJsonObject &update);
    static QString chunkText(const QJsonObject &update);
    static void mergeStatus(ToolCall &call, ToolCallStatus next);

    QHash<QString, SessionState> m_sessions;
};
