/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "JsonRpcTransport.h"

#include <QDebug>
#include <QIODevice>
#include <QJsonDocument>

JsonRpcTransport::JsonRpcTransport(QIODevice *sink, QObject *parent)
    : QObject(parent)
    , m_sink(sink)
{
}

JsonRpcTransport::~JsonRpcTransport()
{
    if (m_source) {
        disconnect(m_source, nullptr, this, nullptr);
    }
}

void JsonRpcTransport::attachSource(QIODevice *source)
{
    if (m_source) {
        disconnect(m_source, nullptr, this, nullptr);
    }

    m_source = source;
    if (m_source) {
        connect(m_source, &QIODevice::readyRead, this, &JsonRpcTransport::onSourceReadyRead);
    }
}

bool JsonRpcTransport::send(const QJsonObject &message)
{
    if (m_closed) {
        return false;
    }

    if (!m_sink || !m_sink->isWritable()) {
        qWarning() << "[JsonRpcTransport] Cannot send: sink is not writable";
        return false;
    }

    const QByteArray json = QJsonDocument(message).toJson(QJsonDocument::Compact);
    Q_EMIT jsonPayload(QStringLiteral("send"), QString::fromUtf8(json));

    const QByteArray data = json + '\n';
    if (m_sink->write(data) != data.size()) {
        qWarning() << "[JsonRpcTransport] Short write to sink:" << m_sink->errorString();
        return false;
    }
    return true;
}

void JsonRpcTransport::feed(const QByteArray &chunk)
{
    if (m_closed) {
        return;
    }

    m_buffer.append(chunk);

    // A handler may close or delete us while we are still splitting lines
    QPointer<JsonRpcTransport> self(this);

    int pos;
    while ((pos = m_buffer.indexOf('\n')) >= 0) {
        const QByteArray line = m_buffer.left(pos);
        m_buffer.remove(0, pos + 1);
        processLine(line);

        if (!self || m_closed) {
            return;
        }
    }
}

void JsonRpcTransport::close()
{
    if (m_closed) {
        return;
    }

    m_closed = true;
    m_buffer.clear();
    if (m_source) {
        disconnect(m_source, nullptr, this, nullptr);
        m_source = nullptr;
    }
}

void JsonRpcTransport::onSourceReadyRead()
{
    if (!m_source) {
        return;
    }
    feed(m_source->readAll());
}

void JsonRpcTransport::processLine(const QByteArray &line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        reportMalformed(trimmed, parseError.errorString());
        return;
    }

    if (!doc.isObject()) {
        reportMalformed(trimmed, QStringLiteral("not a JSON object"));
        return;
    }

    QPointer<JsonRpcTransport> self(this);
    Q_EMIT jsonPayload(QStringLiteral("recv"), QString::fromUtf8(trimmed));
    Q_EMIT messageReceived(doc.object());
    if (!self || m_closed) {
        return;
    }
    dispatch(doc.object());
}

void JsonRpcTransport::dispatch(const QJsonObject &message)
{
    if (message.value(QStringLiteral("jsonrpc")).toString() != QStringLiteral("2.0")) {
        reportMalformed(QJsonDocument(message).toJson(QJsonDocument::Compact),
                        QStringLiteral("missing jsonrpc 2.0 tag"));
        return;
    }

    const QJsonValue id = message.value(QStringLiteral("id"));
    const bool hasId = !id.isUndefined() && !id.isNull();
    const bool hasMethod = message.contains(QStringLiteral("method"));

    if (hasId && (message.contains(QStringLiteral("result")) || message.contains(QStringLiteral("error")))) {
        Q_EMIT responseReceived(id, message);
    } else if (hasId && hasMethod) {
        Q_EMIT requestReceived(id, message.value(QStringLiteral("method")).toString(),
                               message.value(QStringLiteral("params")));
    } else if (hasMethod) {
        Q_EMIT notificationReceived(message.value(QStringLiteral("method")).toString(),
                                    message.value(QStringLiteral("params")));
    } else {
        reportMalformed(QJsonDocument(message).toJson(QJsonDocument::Compact),
                        QStringLiteral("unrecognized message shape"));
    }
}

void JsonRpcTransport::reportMalformed(const QByteArray &line, const QString &reason)
{
    if (m_policy == MalformedLinePolicy::Lenient) {
        qDebug() << "[JsonRpcTransport] Dropping line (" << reason << "):" << line.left(200);
        return;
    }

    qWarning() << "[JsonRpcTransport] Malformed line (" << reason << "):" << line.left(200);
    Q_EMIT framingError(line, reason);
}
