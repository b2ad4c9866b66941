/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QJsonValue>
#include <QString>

#include <functional>
#include <optional>

// JSON-RPC 2.0 error codes plus the implementation-defined ones used by ACP Bridge
namespace RpcErrorCode {
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
constexpr int NotFound = -32001;
constexpr int UnsupportedProtocolVersion = -32002;
constexpr int OutsideWorkspace = -32003;
}

// Which layer produced an error. Hosts switch on this to render
// "agent does not support X" differently from "agent did not respond in time".
enum class ErrorKind {
    Transport,     // channel could not be written / framing failure
    Protocol,      // peer returned a JSON-RPC error object
    Capability,    // optional method not granted at initialize, no I/O happened
    Timeout,       // caller-supplied deadline elapsed
    Disposed,      // endpoint or client already disposed
    Subprocess,    // agent failed to start or exited
    InvalidState,  // call not legal in the current connection state
};

struct RpcError {
    ErrorKind kind = ErrorKind::Protocol;
    int code = RpcErrorCode::InternalError;
    QString message;
    QJsonValue data;
};

QString errorKindName(ErrorKind kind);

struct RpcResult {
    QJsonValue result;
    std::optional<RpcError> error;

    bool ok() const { return !error.has_value(); }

    static RpcResult success(const QJsonValue &value)
    {
        RpcResult r;
        r.result = value;
        return r;
    }

    static RpcResult failure(ErrorKind kind, int code, const QString &message, const QJsonValue &data = QJsonValue())
    {
        RpcResult r;
        r.error = RpcError{kind, code, message, data};
        return r;
    }
};

using ResponseCallback = std::function<void(const RpcResult &result)>;
