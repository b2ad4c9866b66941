/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "RpcTypes.h"

#include <QHash>
#include <QJsonValue>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include <functional>
#include <memory>

class JsonRpcEndpoint;
class JsonRpcTransport;
class QTimer;

/**
 * RequestResponder - answers exactly one inbound request.
 *
 * Copies share state, so a handler may stash the responder and answer later
 * (e.g. when a terminal exits). Only the first resolve/reject is written;
 * answering after the endpoint was disposed is a silent no-op.
 */
class RequestResponder
{
public:
    RequestResponder() = default;

    void resolve(const QJsonValue &result = QJsonValue(QJsonValue::Null)) const;
    void reject(int code, const QString &message, const QJsonValue &data = QJsonValue()) const;

    bool isAnswered() const;
    QJsonValue id() const;
    QString method() const;

private:
    friend class JsonRpcEndpoint;

    struct State {
        QPointer<JsonRpcEndpoint> endpoint;
        QJsonValue id;
        QString method;
        bool answered = false;
    };

    std::shared_ptr<State> m_state;
};

using RequestHandler = std::function<void(const QJsonValue &params, const RequestResponder &responder)>;
using NotificationHandler = std::function<void(const QJsonValue &params)>;

/**
 * JsonRpcEndpoint - request/response correlation on top of a JsonRpcTransport.
 *
 * Outbound ids are unique and increase monotonically for the lifetime of the
 * endpoint. Responses are matched purely by id, so peers may answer in any
 * order. A response whose id has no pending entry (unknown, or already timed
 * out) is ignored.
 *
 * Inbound requests are dispatched to at most one handler per method and never
 * block the read loop: a handler that answers later does not delay delivery
 * of the next message.
 */
class JsonRpcEndpoint : public QObject
{
    Q_OBJECT

public:
    explicit JsonRpcEndpoint(JsonRpcTransport *transport, QObject *parent = nullptr);
    ~JsonRpcEndpoint() override;

    // Returns the request id, or -1 if the request failed immediately
    // (callback already invoked). timeoutMs <= 0 waits indefinitely.
    int sendRequest(const QString &method, const QJsonValue &params, ResponseCallback callback, int timeoutMs = 0);

    // Fire-and-forget; no id, no pending entry
    bool sendNotification(const QString &method, const QJsonValue &params = QJsonValue());

    // Multiple subscribers per method. Returns a token for offNotification.
    quint64 onNotification(const QString &method, NotificationHandler handler);
    void offNotification(quint64 token);

    // Single handler per method; returns false if one is already registered
    bool onRequest(const QString &method, RequestHandler handler);
    void offRequest(const QString &method);
    bool hasRequestHandler(const QString &method) const;

    // Reject every pending request with the given kind, keep the endpoint usable
    void failAllPending(ErrorKind kind, const QString &message);

    // Stop reading, reject all pending requests, drop every handler. Idempotent.
    void dispose();
    bool isDisposed() const { return m_disposed; }

    int pendingRequestCount() const { return m_pending.size(); }
    JsonRpcTransport *transport() const { return m_transport; }

Q_SIGNALS:
    void disposed();

private Q_SLOTS:
    void onResponseReceived(const QJsonValue &id, const QJsonObject &message);
    void onRequestReceived(const QJsonValue &id, const QString &method, const QJsonValue &params);
    void onNotificationReceived(const QString &method, const QJsonValue &params);

private:
    friend class RequestResponder;

    struct PendingRequest {
        QString method;
        ResponseCallback callback;
        QTimer *timer = nullptr;
    };

    struct Subscription {
        quint64 token = 0;
        QString method;
        NotificationHandler handler;
    };

    void onRequestTimeout(int id);
    void writeResult(const QJsonValue &id, const QJsonValue &result);
    void writeError(const QJsonValue &id, int code, const QString &message, const QJsonValue &data = QJsonValue());

    QPointer<JsonRpcTransport> m_transport;
    QHash<int, PendingRequest> m_pending;
    QList<Subscription> m_subscriptions;
    QHash<QString, RequestHandler> m_requestHandlers;
    int m_nextId = 1;
    quint64 m_nextToken = 1;
    bool m_disposed = false;
};
