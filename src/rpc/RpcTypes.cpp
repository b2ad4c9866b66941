/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "RpcTypes.h"

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Transport:
        return QStringLiteral("transport");
    case ErrorKind::Protocol:
        return QStringLiteral("protocol");
    case ErrorKind::Capability:
        return QStringLiteral("capability");
    case ErrorKind::Timeout:
        return QStringLiteral("timeout");
    case ErrorKind::Disposed:
        return QStringLiteral("disposed");
    case ErrorKind::Subprocess:
        return QStringLiteral("subprocess");
    case ErrorKind::InvalidState:
        return QStringLiteral("invalid-state");
    }
    return QStringLiteral("unknown");
}
