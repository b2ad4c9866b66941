/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "TestHelpers.h"
#include "../src/rpc/JsonRpcEndpoint.h"

#include <QJsonArray>

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

namespace {

class JsonRpcEndpointTest : public ::testing::Test
{
protected:
    void SetUp() override { endpoint = std::make_unique<JsonRpcEndpoint>(peer.transport.get()); }

    // Send a request and keep its result in `results`
    int request(const QString &method, int timeoutMs = 0)
    {
        return endpoint->sendRequest(method, QJsonObject(), [this](const RpcResult &result) {
            results.append(result);
        }, timeoutMs);
    }

    WirePeer peer;
    std::unique_ptr<JsonRpcEndpoint> endpoint;
    QList<RpcResult> results;
};

TEST_F(JsonRpcEndpointTest, RequestIdsAreUniqueAndIncreasing)
{
    const int first = request(QStringLiteral("initialize"));
    const int second = request(QStringLiteral("session/new"));
    const int third = request(QStringLiteral("session/prompt"));

    EXPECT_GT(first, 0);
    EXPECT_GT(second, first);
    EXPECT_GT(third, second);
    EXPECT_EQ(endpoint->pendingRequestCount(), 3);

    ASSERT_EQ(peer.sent.size(), 3);
    EXPECT_EQ(peer.sent[0][QStringLiteral("id")].toInt(), first);
    EXPECT_EQ(peer.sent[0][QStringLiteral("method")].toString(), QStringLiteral("initialize"));
    EXPECT_EQ(peer.sent[0][QStringLiteral("jsonrpc")].toString(), QStringLiteral("2.0"));
}

TEST_F(JsonRpcEndpointTest, ResponsesAreCorrelatedById)
{
    request(QStringLiteral("a"));
    request(QStringLiteral("b"));

    // Answer out of order
    peer.respond(peer.sent[1], QJsonObject{{QStringLiteral("which"), QStringLiteral("b")}});
    peer.respond(peer.sent[0], QJsonObject{{QStringLiteral("which"), QStringLiteral("a")}});

    ASSERT_EQ(results.size(), 2);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].result.toObject()[QStringLiteral("which")].toString(), QStringLiteral("b"));
    EXPECT_EQ(results[1].result.toObject()[QStringLiteral("which")].toString(), QStringLiteral("a"));
    EXPECT_EQ(endpoint->pendingRequestCount(), 0);
}

TEST_F(JsonRpcEndpointTest, ErrorResponseIsProtocolError)
{
    request(QStringLiteral("session/prompt"));
    peer.deliver({{QStringLiteral("id"), peer.sent[0][QStringLiteral("id")]},
                  {QStringLiteral("error"), QJsonObject{{QStringLiteral("code"), -32602},
                                                        {QStringLiteral("message"), QStringLiteral("Session not found: x")},
                                                        {QStringLiteral("data"), QStringLiteral("extra")}}}});

    ASSERT_EQ(results.size(), 1);
    ASSERT_FALSE(results[0].ok());
    EXPECT_EQ(results[0].error->kind, ErrorKind::Protocol);
    EXPECT_EQ(results[0].error->code, -32602);
    EXPECT_EQ(results[0].error->message, QStringLiteral("Session not found: x"));
    EXPECT_EQ(results[0].error->data.toString(), QStringLiteral("extra"));
}

TEST_F(JsonRpcEndpointTest, UnknownResponseIdIsIgnored)
{
    request(QStringLiteral("initialize"));
    peer.deliver({{QStringLiteral("id"), 999}, {QStringLiteral("result"), QJsonObject()}});

    EXPECT_TRUE(results.isEmpty());
    EXPECT_EQ(endpoint->pendingRequestCount(), 1);
}

TEST_F(JsonRpcEndpointTest, TimeoutRejectsAndLateResponseIsDropped)
{
    request(QStringLiteral("session/prompt"), 50);

    ASSERT_TRUE(waitUntil([this]() { return !results.isEmpty(); }, 2000));
    ASSERT_FALSE(results[0].ok());
    EXPECT_EQ(results[0].error->kind, ErrorKind::Timeout);
    EXPECT_EQ(endpoint->pendingRequestCount(), 0);

    peer.respond(peer.sent[0], QJsonObject());
    EXPECT_EQ(results.size(), 1);
}

TEST_F(JsonRpcEndpointTest, WriteFailureIsTransportError)
{
    peer.closeSink();

    const int id = request(QStringLiteral("initialize"));

    EXPECT_EQ(id, -1);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].error->kind, ErrorKind::Transport);
    EXPECT_EQ(endpoint->pendingRequestCount(), 0);
}

TEST_F(JsonRpcEndpointTest, NotificationHasNoId)
{
    ASSERT_TRUE(endpoint->sendNotification(QStringLiteral("session/cancel"),
                                           QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")}}));

    ASSERT_EQ(peer.sent.size(), 1);
    EXPECT_FALSE(peer.sent[0].contains(QStringLiteral("id")));
    EXPECT_EQ(peer.sent[0][QStringLiteral("method")].toString(), QStringLiteral("session/cancel"));
    EXPECT_EQ(endpoint->pendingRequestCount(), 0);
}

TEST_F(JsonRpcEndpointTest, NotificationsFanOutToEverySubscriber)
{
    int first = 0;
    int second = 0;
    endpoint->onNotification(QStringLiteral("session/update"), [&first](const QJsonValue &) { ++first; });
    const quint64 token = endpoint->onNotification(QStringLiteral("session/update"), [&second](const QJsonValue &) { ++second; });
    endpoint->onNotification(QStringLiteral("other"), [](const QJsonValue &) { FAIL() << "wrong method"; });

    peer.deliver({{QStringLiteral("method"), QStringLiteral("session/update")}});
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);

    endpoint->offNotification(token);
    peer.deliver({{QStringLiteral("method"), QStringLiteral("session/update")}});
    EXPECT_EQ(first, 2);
    EXPECT_EQ(second, 1);
}

TEST_F(JsonRpcEndpointTest, ThrowingSubscriberDoesNotStopOthers)
{
    int delivered = 0;
    endpoint->onNotification(QStringLiteral("session/update"), [](const QJsonValue &) {
        throw std::runtime_error("boom");
    });
    endpoint->onNotification(QStringLiteral("session/update"), [&delivered](const QJsonValue &) { ++delivered; });

    peer.deliver({{QStringLiteral("method"), QStringLiteral("session/update")}});
    EXPECT_EQ(delivered, 1);
}

TEST_F(JsonRpcEndpointTest, UnhandledInboundRequestGetsMethodNotFound)
{
    peer.deliver({{QStringLiteral("id"), 5}, {QStringLiteral("method"), QStringLiteral("fs/read_text_file")}});

    ASSERT_EQ(peer.sent.size(), 1);
    EXPECT_EQ(peer.last()[QStringLiteral("id")].toInt(), 5);
    EXPECT_EQ(peer.last()[QStringLiteral("error")].toObject()[QStringLiteral("code")].toInt(), RpcErrorCode::MethodNotFound);
}

TEST_F(JsonRpcEndpointTest, InboundRequestIsAnsweredWithSameId)
{
    ASSERT_TRUE(endpoint->onRequest(QStringLiteral("terminal/create"), [](const QJsonValue &params, const RequestResponder &responder) {
        EXPECT_EQ(params.toObject()[QStringLiteral("command")].toString(), QStringLiteral("ls"));
        responder.resolve(QJsonObject{{QStringLiteral("terminalId"), QStringLiteral("term_1")}});
    }));

    peer.deliver({{QStringLiteral("id"), QStringLiteral("req-9")},
                  {QStringLiteral("method"), QStringLiteral("terminal/create")},
                  {QStringLiteral("params"), QJsonObject{{QStringLiteral("command"), QStringLiteral("ls")}}}});

    ASSERT_EQ(peer.sent.size(), 1);
    EXPECT_EQ(peer.last()[QStringLiteral("id")].toString(), QStringLiteral("req-9"));
    EXPECT_EQ(peer.last()[QStringLiteral("result")].toObject()[QStringLiteral("terminalId")].toString(),
              QStringLiteral("term_1"));
}

TEST_F(JsonRpcEndpointTest, ResponderAnswersExactlyOnce)
{
    std::optional<RequestResponder> kept;
    endpoint->onRequest(QStringLiteral("fs/read_text_file"), [&kept](const QJsonValue &, const RequestResponder &responder) {
        kept = responder;
    });

    peer.deliver({{QStringLiteral("id"), 1}, {QStringLiteral("method"), QStringLiteral("fs/read_text_file")}});
    ASSERT_TRUE(kept.has_value());
    EXPECT_TRUE(peer.sent.isEmpty());

    // Answered later, from outside the handler
    kept->resolve(QJsonObject{{QStringLiteral("content"), QStringLiteral("x")}});
    kept->reject(RpcErrorCode::InternalError, QStringLiteral("too late"));
    kept->resolve(QJsonObject());

    ASSERT_EQ(peer.sent.size(), 1);
    EXPECT_TRUE(peer.last().contains(QStringLiteral("result")));
    EXPECT_TRUE(kept->isAnswered());
}

TEST_F(JsonRpcEndpointTest, ThrowingHandlerIsAnsweredWithInternalError)
{
    endpoint->onRequest(QStringLiteral("fs/write_text_file"), [](const QJsonValue &, const RequestResponder &) {
        throw std::runtime_error("disk on fire");
    });

    peer.deliver({{QStringLiteral("id"), 3}, {QStringLiteral("method"), QStringLiteral("fs/write_text_file")}});

    ASSERT_EQ(peer.sent.size(), 1);
    const QJsonObject error = peer.last()[QStringLiteral("error")].toObject();
    EXPECT_EQ(error[QStringLiteral("code")].toInt(), RpcErrorCode::InternalError);
    EXPECT_EQ(error[QStringLiteral("message")].toString(), QStringLiteral("disk on fire"));
}

TEST_F(JsonRpcEndpointTest, NonStandardThrowIsAnsweredWithInternalError)
{
    endpoint->onRequest(QStringLiteral("terminal/output"), [](const QJsonValue &, const RequestResponder &) {
        throw 42;
    });
    int delivered = 0;
    endpoint->onNotification(QStringLiteral("session/update"), [](const QJsonValue &) {
        throw QStringLiteral("not an exception type");
    });
    endpoint->onNotification(QStringLiteral("session/update"), [&delivered](const QJsonValue &) { ++delivered; });

    peer.deliver({{QStringLiteral("id"), 4}, {QStringLiteral("method"), QStringLiteral("terminal/output")}});
    ASSERT_EQ(peer.sent.size(), 1);
    EXPECT_EQ(peer.last()[QStringLiteral("id")].toInt(), 4);
    EXPECT_EQ(peer.last()[QStringLiteral("error")].toObject()[QStringLiteral("code")].toInt(), RpcErrorCode::InternalError);

    peer.deliver({{QStringLiteral("method"), QStringLiteral("session/update")}});
    EXPECT_EQ(delivered, 1);
}

TEST_F(JsonRpcEndpointTest, SecondRequestHandlerIsRejected)
{
    int firstCalls = 0;
    ASSERT_TRUE(endpoint->onRequest(QStringLiteral("x"), [&firstCalls](const QJsonValue &, const RequestResponder &r) {
        ++firstCalls;
        r.resolve();
    }));
    EXPECT_FALSE(endpoint->onRequest(QStringLiteral("x"), [](const QJsonValue &, const RequestResponder &) {
        FAIL() << "second handler must not be installed";
    }));

    peer.deliver({{QStringLiteral("id"), 1}, {QStringLiteral("method"), QStringLiteral("x")}});
    EXPECT_EQ(firstCalls, 1);

    endpoint->offRequest(QStringLiteral("x"));
    EXPECT_FALSE(endpoint->hasRequestHandler(QStringLiteral("x")));
    EXPECT_TRUE(endpoint->onRequest(QStringLiteral("x"), [](const QJsonValue &, const RequestResponder &r) { r.resolve(); }));
}

TEST_F(JsonRpcEndpointTest, FailAllPendingKeepsEndpointUsable)
{
    request(QStringLiteral("a"));
    request(QStringLiteral("b"));

    endpoint->failAllPending(ErrorKind::Subprocess, QStringLiteral("Agent process exited with code 1"));

    ASSERT_EQ(results.size(), 2);
    for (const RpcResult &result : std::as_const(results)) {
        EXPECT_EQ(result.error->kind, ErrorKind::Subprocess);
        EXPECT_EQ(result.error->message, QStringLiteral("Agent process exited with code 1"));
    }
    EXPECT_EQ(endpoint->pendingRequestCount(), 0);
    EXPECT_FALSE(endpoint->isDisposed());
    EXPECT_GT(request(QStringLiteral("c")), 0);
}

TEST_F(JsonRpcEndpointTest, DisposeRejectsPendingAndLaterCalls)
{
    request(QStringLiteral("session/prompt"));
    int disposedSignals = 0;
    QObject::connect(endpoint.get(), &JsonRpcEndpoint::disposed, [&disposedSignals]() { ++disposedSignals; });

    endpoint->dispose();
    endpoint->dispose();

    EXPECT_EQ(disposedSignals, 1);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].error->kind, ErrorKind::Disposed);

    const int sentBefore = peer.sent.size();
    EXPECT_EQ(request(QStringLiteral("session/new")), -1);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[1].error->kind, ErrorKind::Disposed);
    EXPECT_FALSE(endpoint->sendNotification(QStringLiteral("session/cancel")));
    EXPECT_FALSE(endpoint->onRequest(QStringLiteral("y"), [](const QJsonValue &, const RequestResponder &) {}));
    EXPECT_EQ(peer.sent.size(), sentBefore);
}

}
