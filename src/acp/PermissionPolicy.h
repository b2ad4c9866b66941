/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "ACPModels.h"
#include "../rpc/JsonRpcEndpoint.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QStringList>

#include <functional>

/**
 * PermissionPolicy - answers session/request_permission.
 *
 * Decision order: auto-approved tool kinds, then stored "always" rules per
 * kind, then the host's prompt. allow_always / reject_always answers from the
 * prompt are remembered for the rest of the policy's lifetime.
 */
class PermissionPolicy : public QObject
{
    Q_OBJECT

public:
    using DecisionCallback = std::function<void(PermissionDecision decision)>;
    // Host UI hook; must eventually call answer exactly once
    using Prompt = std::function<void(const PermissionRequest &request, const DecisionCallback &answer)>;

    struct Rule {
        QString kind;
        bool allow = false;
    };

    explicit PermissionPolicy(const QStringList &autoApproveKinds = QStringList(), QObject *parent = nullptr);

    void setPrompt(Prompt prompt) { m_prompt = std::move(prompt); }
    void setAutoApproveKinds(const QStringList &kinds);
    QStringList autoApproveKinds() const { return m_autoApproveKinds.values(); }

    void decide(const PermissionRequest &request, DecisionCallback done);

    // Request handler for ClientMethod::RequestPermission
    void handleRequest(const QJsonValue &params, const RequestResponder &responder);

    // Answer every outstanding request of the session with "cancelled"
    void cancelSession(const QString &sessionId);

    // Wire result for a decision, choosing the agent option of the matching kind
    static QJsonObject outcomeFor(const PermissionRequest &request, PermissionDecision decision);

    QList<Rule> rules() const;
    void removeRule(const QString &kind);
    void clearRules();

Q_SIGNALS:
    void permissionDecided(const QString &sessionId, const QString &toolCallId, PermissionDecision decision);

private:
    struct Outstanding {
        quint64 ticket = 0;
        QString sessionId;
        RequestResponder responder;
    };

    void answer(quint64 ticket, const PermissionRequest &request, PermissionDecision decision);

    QSet<QString> m_autoApproveKinds;
    QHash<QString, bool> m_rules;
    Prompt m_prompt;
    QList<Outstanding> m_outstanding;
    quint64 m_nextTicket = 1;
};
