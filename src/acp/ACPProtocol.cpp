/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ACPProtocol.h"

std::optional<AcpMethod> acpMethodFromName(const QString &name)
{
    for (const AcpMethodInfo &info : kAcpMethods) {
        if (name == QLatin1String(info.name)) {
            return info.method;
        }
    }
    return std::nullopt;
}
