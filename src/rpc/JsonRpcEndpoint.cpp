/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "JsonRpcEndpoint.h"
#include "JsonRpcTransport.h"

#include <QDebug>
#include <QJsonObject>
#include <QTimer>

#include <exception>
#include <utility>

void RequestResponder::resolve(const QJsonValue &result) const
{
    if (!m_state || m_state->answered) {
        return;
    }
    m_state->answered = true;

    if (m_state->endpoint && !m_state->endpoint->isDisposed()) {
        m_state->endpoint->writeResult(m_state->id, result);
    }
}

void RequestResponder::reject(int code, const QString &message, const QJsonValue &data) const
{
    if (!m_state || m_state->answered) {
        return;
    }
    m_state->answered = true;

    if (m_state->endpoint && !m_state->endpoint->isDisposed()) {
        m_state->endpoint->writeError(m_state->id, code, message, data);
    }
}

bool RequestResponder::isAnswered() const
{
    return m_state && m_state->answered;
}

QJsonValue RequestResponder::id() const
{
    return m_state ? m_state->id : QJsonValue();
}

QString RequestResponder::method() const
{
    return m_state ? m_state->method : QString();
}

JsonRpcEndpoint::JsonRpcEndpoint(JsonRpcTransport *transport, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
{
    connect(m_transport, &JsonRpcTransport::responseReceived, this, &JsonRpcEndpoint::onResponseReceived);
    connect(m_transport, &JsonRpcTransport::requestReceived, this, &JsonRpcEndpoint::onRequestReceived);
    connect(m_transport, &JsonRpcTransport::notificationReceived, this, &JsonRpcEndpoint::onNotificationReceived);
}

JsonRpcEndpoint::~JsonRpcEndpoint()
{
    dispose();
}

int JsonRpcEndpoint::sendRequest(const QString &method, const QJsonValue &params, ResponseCallback callback, int timeoutMs)
{
    if (m_disposed) {
        if (callback) {
            callback(RpcResult::failure(ErrorKind::Disposed, RpcErrorCode::InternalError,
                                        QStringLiteral("Client disposed")));
        }
        return -1;
    }

    const int id = m_nextId++;

    QJsonObject request;
    request[QStringLiteral("jsonrpc")] = QStringLiteral("2.0");
    request[QStringLiteral("id")] = id;
    request[QStringLiteral("method")] = method;
    if (!params.isUndefined() && !params.isNull()) {
        request[QStringLiteral("params")] = params;
    }

    PendingRequest pending;
    pending.method = method;
    pending.callback = std::move(callback);

    if (timeoutMs > 0) {
        pending.timer = new QTimer(this);
        pending.timer->setSingleShot(true);
        connect(pending.timer, &QTimer::timeout, this, [this, id]() {
            onRequestTimeout(id);
        });
        pending.timer->start(timeoutMs);
    }

    m_pending.insert(id, pending);

    qDebug() << "[JsonRpcEndpoint] >>" << method << "id:" << id;

    if (!m_transport || !m_transport->send(request)) {
        PendingRequest failed = m_pending.take(id);
        if (failed.timer) {
            failed.timer->deleteLater();
        }
        if (failed.callback) {
            failed.callback(RpcResult::failure(ErrorKind::Transport, RpcErrorCode::InternalError,
                                               QStringLiteral("Failed to write request %1").arg(method)));
        }
        return -1;
    }

    return id;
}

bool JsonRpcEndpoint::sendNotification(const QString &method, const QJsonValue &params)
{
    if (m_disposed || !m_transport) {
        return false;
    }

    QJsonObject notification;
    notification[QStringLiteral("jsonrpc")] = QStringLiteral("2.0");
    notification[QStringLiteral("method")] = method;
    if (!params.isUndefined() && !params.isNull()) {
        notification[QStringLiteral("params")] = params;
    }

    qDebug() << "[JsonRpcEndpoint] >> notification:" << method;
    return m_transport->send(notification);
}

quint64 JsonRpcEndpoint::onNotification(const QString &method, NotificationHandler handler)
{
    Subscription subscription;
    subscription.token = m_nextToken++;
    subscription.method = method;
    subscription.handler = std::move(handler);
    m_subscriptions.append(subscription);
    return subscription.token;
}

void JsonRpcEndpoint::offNotification(quint64 token)
{
    for (int i = 0; i < m_subscriptions.size(); ++i) {
        if (m_subscriptions[i].token == token) {
            m_subscriptions.removeAt(i);
            return;
        }
    }
}

bool JsonRpcEndpoint::onRequest(const QString &method, RequestHandler handler)
{
    if (m_disposed) {
        return false;
    }

    if (m_requestHandlers.contains(method)) {
        qWarning() << "[JsonRpcEndpoint] Handler already registered for" << method;
        return false;
    }

    m_requestHandlers.insert(method, std::move(handler));
    return true;
}

void JsonRpcEndpoint::offRequest(const QString &method)
{
    m_requestHandlers.remove(method);
}

bool JsonRpcEndpoint::hasRequestHandler(const QString &method) const
{
    return m_requestHandlers.contains(method);
}

void JsonRpcEndpoint::failAllPending(ErrorKind kind, const QString &message)
{
    // Callbacks may send new requests; only fail the ones that exist now
    const QHash<int, PendingRequest> pending = std::exchange(m_pending, {});

    for (auto it = pending.cbegin(); it != pending.cend(); ++it) {
        if (it->timer) {
            it->timer->stop();
            it->timer->deleteLater();
        }
        if (it->callback) {
            it->callback(RpcResult::failure(kind, RpcErrorCode::InternalError, message));
        }
    }
}

void JsonRpcEndpoint::dispose()
{
    if (m_disposed) {
        return;
    }

    qDebug() << "[JsonRpcEndpoint] Disposing with" << m_pending.size() << "pending requests";
    m_disposed = true;

    if (m_transport) {
        disconnect(m_transport, nullptr, this, nullptr);
        m_transport->close();
    }

    failAllPending(ErrorKind::Disposed, QStringLiteral("Client disposed"));

    m_subscriptions.clear();
    m_requestHandlers.clear();

    Q_EMIT disposed();
}

void JsonRpcEndpoint::onResponseReceived(const QJsonValue &id, const QJsonObject &message)
{
    if (m_disposed) {
        return;
    }

    if (!id.isDouble()) {
        qDebug() << "[JsonRpcEndpoint] Ignoring response with non-numeric id:" << id;
        return;
    }

    const int requestId = static_cast<int>(id.toInteger());
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        // Unknown id, or the request already timed out
        qDebug() << "[JsonRpcEndpoint] Ignoring response for unknown request id:" << requestId;
        return;
    }

    PendingRequest pending = *it;
    m_pending.erase(it);

    if (pending.timer) {
        pending.timer->stop();
        pending.timer->deleteLater();
    }

    qDebug() << "[JsonRpcEndpoint] << response for" << pending.method << "id:" << requestId;

    if (!pending.callback) {
        return;
    }

    if (message.contains(QStringLiteral("error"))) {
        const QJsonObject error = message.value(QStringLiteral("error")).toObject();
        pending.callback(RpcResult::failure(ErrorKind::Protocol,
                                            error.value(QStringLiteral("code")).toInt(RpcErrorCode::InternalError),
                                            error.value(QStringLiteral("message")).toString(),
                                            error.value(QStringLiteral("data"))));
    } else {
        pending.callback(RpcResult::success(message.value(QStringLiteral("result"))));
    }
}

void JsonRpcEndpoint::onRequestReceived(const QJsonValue &id, const QString &method, const QJsonValue &params)
{
    if (m_disposed) {
        return;
    }

    qDebug() << "[JsonRpcEndpoint] << request" << method << "id:" << id;

    RequestResponder responder;
    responder.m_state = std::make_shared<RequestResponder::State>();
    responder.m_state->endpoint = this;
    responder.m_state->id = id;
    responder.m_state->method = method;

    const auto it = m_requestHandlers.constFind(method);
    if (it == m_requestHandlers.constEnd()) {
        responder.reject(RpcErrorCode::MethodNotFound, QStringLiteral("Method not found: %1").arg(method));
        return;
    }

    // Copy: the handler may unregister itself
    const RequestHandler handler = *it;

    try {
        handler(params, responder);
    } catch (const std::exception &e) {
        qWarning() << "[JsonRpcEndpoint] Handler for" << method << "threw:" << e.what();
        responder.reject(RpcErrorCode::InternalError, QString::fromUtf8(e.what()));
    } catch (...) {
        qWarning() << "[JsonRpcEndpoint] Handler for" << method << "threw a non-standard exception";
        responder.reject(RpcErrorCode::InternalError, QStringLiteral("Internal error in handler for %1").arg(method));
    }
}

void JsonRpcEndpoint::onNotificationReceived(const QString &method, const QJsonValue &params)
{
    if (m_disposed) {
        return;
    }

    // Snapshot so handlers can subscribe/unsubscribe while we iterate
    const QList<Subscription> subscriptions = m_subscriptions;

    for (const Subscription &subscription : subscriptions) {
        if (subscription.method != method || !subscription.handler) {
            continue;
        }

        try {
            subscription.handler(params);
        } catch (const std::exception &e) {
            qWarning() << "[JsonRpcEndpoint] Notification handler for" << method << "threw:" << e.what();
        } catch (...) {
            qWarning() << "[JsonRpcEndpoint] Notification handler for" << method << "threw a non-standard exception";
        }

        if (m_disposed) {
            return;
        }
    }
}

void JsonRpcEndpoint::onRequestTimeout(int id)
{
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return;
    }

    PendingRequest pending = *it;
    m_pending.erase(it);

    if (pending.timer) {
        pending.timer->deleteLater();
    }

    qWarning() << "[JsonRpcEndpoint] Request timed out:" << pending.method << "id:" << id;

    if (pending.callback) {
        pending.callback(RpcResult::failure(ErrorKind::Timeout, RpcErrorCode::InternalError,
                                            QStringLiteral("Request timeout")));
    }
}

void JsonRpcEndpoint::writeResult(const QJsonValue &id, const QJsonValue &result)
{
    if (!m_transport) {
        return;
    }

    QJsonObject response;
    response[QStringLiteral("jsonrpc")] = QStringLiteral("2.0");
    response[QStringLiteral("id")] = id;
    response[QStringLiteral("result")] = result;

    qDebug() << "[JsonRpcEndpoint] >> response for request id:" << id;
    m_transport->send(response);
}

void JsonRpcEndpoint::writeError(const QJsonValue &id, int code, const QString &message, const QJsonValue &data)
{
    if (!m_transport) {
        return;
    }

    QJsonObject error;
    error[QStringLiteral("code")] = code;
    error[QStringLiteral("message")] = message;
    if (!data.isUndefined() && !data.isNull()) {
        error[QStringLiteral("data")] = data;
    }

    QJsonObject response;
    response[QStringLiteral("jsonrpc")] = QStringLiteral("2.0");
    response[QStringLiteral("id")] = id;
    response[QStringLiteral("error")] = error;

    qDebug() << "[JsonRpcEndpoint] >> error response for request id:" << id << "code:" << code;
    m_transport->send(response);
}
