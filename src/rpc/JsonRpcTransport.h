/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QString>

class QIODevice;

/**
 * JsonRpcTransport - newline-delimited JSON-RPC 2.0 framing.
 *
 * Outbound messages are written as one compact JSON document plus '\n' to the
 * sink device. Inbound bytes arrive either from an attached source device or
 * through feed(); complete lines are parsed and classified by shape:
 *   id + method          -> requestReceived
 *   id + result|error    -> responseReceived
 *   method, no id        -> notificationReceived
 *
 * Lines that are blank, not JSON, not an object or not tagged "jsonrpc":"2.0"
 * are dropped. Under the Strict policy the drop is also reported through
 * framingError so genuine corruption does not go unnoticed.
 */
class JsonRpcTransport : public QObject
{
    Q_OBJECT

public:
    enum class MalformedLinePolicy {
        Lenient,
        Strict,
    };

    explicit JsonRpcTransport(QIODevice *sink, QObject *parent = nullptr);
    ~JsonRpcTransport() override;

    // Read inbound bytes from a device as they become available
    void attachSource(QIODevice *source);

    void setMalformedLinePolicy(MalformedLinePolicy policy) { m_policy = policy; }
    MalformedLinePolicy malformedLinePolicy() const { return m_policy; }

    // Frame and write one message. Returns false if the sink is gone,
    // not writable, or the transport was closed.
    bool send(const QJsonObject &message);

    // Append raw inbound bytes and process every complete line
    void feed(const QByteArray &chunk);

    // Stop reading and writing. Idempotent.
    void close();
    bool isClosed() const { return m_closed; }

Q_SIGNALS:
    // Every parsed object line, before classification (raw relay)
    void messageReceived(const QJsonObject &message);
    void requestReceived(const QJsonValue &id, const QString &method, const QJsonValue &params);
    void responseReceived(const QJsonValue &id, const QJsonObject &message);
    void notificationReceived(const QString &method, const QJsonValue &params);
    void framingError(const QByteArray &line, const QString &reason);
    void jsonPayload(const QString &direction, const QString &json);

private Q_SLOTS:
    void onSourceReadyRead();

private:
    void processLine(const QByteArray &line);
    void dispatch(const QJsonObject &message);
    void reportMalformed(const QByteArray &line, const QString &reason);

    QPointer<QIODevice> m_sink;
    QPointer<QIODevice> m_source;
    QByteArray m_buffer;
    MalformedLinePolicy m_policy = MalformedLinePolicy::Lenient;
    bool m_closed = false;
};
