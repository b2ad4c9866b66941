/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "PermissionPolicy.h"

#include <QDebug>
#include <QPointer>

#include <utility>

PermissionPolicy::PermissionPolicy(const QStringList &autoApproveKinds, QObject *parent)
    : QObject(parent)
{
    setAutoApproveKinds(autoApproveKinds);
}

void PermissionPolicy::setAutoApproveKinds(const QStringList &kinds)
{
    m_autoApproveKinds = QSet<QString>(kinds.cbegin(), kinds.cend());
}

void PermissionPolicy::decide(const PermissionRequest &request, DecisionCallback done)
{
    const QString kind = request.toolCall.kind;

    if (!kind.isEmpty() && m_autoApproveKinds.contains(kind)) {
        qDebug() << "[PermissionPolicy] Auto-approving" << kind << "tool:" << request.toolCall.title;
        done(PermissionDecision::AllowOnce);
        return;
    }

    const auto rule = m_rules.constFind(kind);
    if (!kind.isEmpty() && rule != m_rules.constEnd()) {
        qDebug() << "[PermissionPolicy] Applying stored rule for" << kind << "allow:" << *rule;
        done(*rule ? PermissionDecision::AllowOnce : PermissionDecision::RejectOnce);
        return;
    }

    if (!m_prompt) {
        qWarning() << "[PermissionPolicy] No permission prompt installed, rejecting" << request.toolCall.title;
        done(PermissionDecision::RejectOnce);
        return;
    }

    QPointer<PermissionPolicy> self(this);
    m_prompt(request, [self, kind, done](PermissionDecision decision) {
        if (self && !kind.isEmpty()) {
            if (decision == PermissionDecision::AllowAlways) {
                self->m_rules.insert(kind, true);
            } else if (decision == PermissionDecision::RejectAlways) {
                self->m_rules.insert(kind, false);
            }
        }
        done(decision);
    });
}

void PermissionPolicy::handleRequest(const QJsonValue &params, const RequestResponder &responder)
{
    const PermissionRequest request = PermissionRequest::fromJson(params.toObject());

    qDebug() << "[PermissionPolicy] Permission request - session:" << request.sessionId
             << "tool:" << request.toolCall.title << "kind:" << request.toolCall.kind
             << "options count:" << request.options.size();

    Outstanding outstanding;
    outstanding.ticket = m_nextTicket++;
    outstanding.sessionId = request.sessionId;
    outstanding.responder = responder;
    m_outstanding.append(outstanding);

    const quint64 ticket = outstanding.ticket;
    QPointer<PermissionPolicy> self(this);
    decide(request, [self, ticket, request](PermissionDecision decision) {
        if (self) {
            self->answer(ticket, request, decision);
        }
    });
}

void PermissionPolicy::answer(quint64 ticket, const PermissionRequest &request, PermissionDecision decision)
{
    for (int i = 0; i < m_outstanding.size(); ++i) {
        if (m_outstanding[i].ticket != ticket) {
            continue;
        }

        const Outstanding outstanding = m_outstanding.takeAt(i);
        QJsonObject result;
        result[QStringLiteral("outcome")] = outcomeFor(request, decision);
        outstanding.responder.resolve(result);

        Q_EMIT permissionDecided(request.sessionId, request.toolCall.id, decision);
        return;
    }
    // Already answered through cancelSession()
}

void PermissionPolicy::cancelSession(const QString &sessionId)
{
    QJsonObject outcome;
    outcome[QStringLiteral("outcome")] = QStringLiteral("cancelled");
    QJsonObject result;
    result[QStringLiteral("outcome")] = outcome;

    for (int i = m_outstanding.size() - 1; i >= 0; --i) {
        if (m_outstanding[i].sessionId != sessionId) {
            continue;
        }
        const Outstanding outstanding = m_outstanding.takeAt(i);
        qDebug() << "[PermissionPolicy] Cancelling outstanding permission request for session" << sessionId;
        outstanding.responder.resolve(result);
    }
}

QJsonObject PermissionPolicy::outcomeFor(const PermissionRequest &request, PermissionDecision decision)
{
    QJsonObject outcome;

    if (decision != PermissionDecision::Cancelled) {
        QStringList preferred{permissionDecisionName(decision)};
        if (decision == PermissionDecision::AllowAlways) {
            preferred.append(QStringLiteral("allow_once"));
        } else if (decision == PermissionDecision::RejectAlways) {
            preferred.append(QStringLiteral("reject_once"));
        }

        for (const QString &kind : std::as_const(preferred)) {
            for (const PermissionOption &option : request.options) {
                if (option.kind == kind) {
                    outcome[QStringLiteral("outcome")] = QStringLiteral("selected");
                    outcome[QStringLiteral("optionId")] = option.optionId;
                    return outcome;
                }
            }
        }
        qWarning() << "[PermissionPolicy] Agent offered no option for" << permissionDecisionName(decision);
    }

    outcome[QStringLiteral("outcome")] = QStringLiteral("cancelled");
    return outcome;
}

QList<PermissionPolicy::Rule> PermissionPolicy::rules() const
{
    QList<Rule> result;
    for (auto it = m_rules.cbegin(); it != m_rules.cend(); ++it) {
        result.append(Rule{it.key(), it.value()});
    }
    return result;
}

void PermissionPolicy::removeRule(const QString &kind)
{
    m_rules.remove(kind);
}

void PermissionPolicy::clearRules()
{
    m_rules.clear();
}
