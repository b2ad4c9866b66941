/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QLatin1String>
#include <QString>

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

// Every method of the Agent Client Protocol this client speaks
enum class AcpMethod {
    Initialize,
    SessionNew,
    SessionLoad,
    SessionSetMode,
    SessionPrompt,
    SessionCancel,
    SessionUpdate,
    FsReadTextFile,
    FsWriteTextFile,
    SessionRequestPermission,
    TerminalCreate,
    TerminalOutput,
    TerminalWaitForExit,
    TerminalKill,
    TerminalRelease,
};

enum class AcpDirection {
    ClientToAgent,
    AgentToClient,
};

enum class AcpMessageType {
    Request,
    Notification,
};

struct AcpMethodInfo {
    AcpMethod method;
    const char *name;
    AcpDirection direction;
    AcpMessageType type;
};

inline constexpr std::array<AcpMethodInfo, 15> kAcpMethods = {{
    {AcpMethod::Initialize, "initialize", AcpDirection::ClientToAgent, AcpMessageType::Request},
    {AcpMethod::SessionNew, "session/new", AcpDirection::ClientToAgent, AcpMessageType::Request},
    {AcpMethod::SessionLoad, "session/load", AcpDirection::ClientToAgent, AcpMessageType::Request},
    {AcpMethod::SessionSetMode, "session/set_mode", AcpDirection::ClientToAgent, AcpMessageType::Request},
    {AcpMethod::SessionPrompt, "session/prompt", AcpDirection::ClientToAgent, AcpMessageType::Request},
    {AcpMethod::SessionCancel, "session/cancel", AcpDirection::ClientToAgent, AcpMessageType::Notification},
    {AcpMethod::SessionUpdate, "session/update", AcpDirection::AgentToClient, AcpMessageType::Notification},
    {AcpMethod::FsReadTextFile, "fs/read_text_file", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::FsWriteTextFile, "fs/write_text_file", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::SessionRequestPermission, "session/request_permission", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::TerminalCreate, "terminal/create", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::TerminalOutput, "terminal/output", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::TerminalWaitForExit, "terminal/wait_for_exit", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::TerminalKill, "terminal/kill", AcpDirection::AgentToClient, AcpMessageType::Request},
    {AcpMethod::TerminalRelease, "terminal/release", AcpDirection::AgentToClient, AcpMessageType::Request},
}};

// The table is indexed by enum value; keep the two in the same order
constexpr bool acpMethodTableIsOrdered()
{
    for (std::size_t i = 0; i < kAcpMethods.size(); ++i) {
        if (static_cast<std::size_t>(kAcpMethods[i].method) != i) {
            return false;
        }
    }
    return true;
}
static_assert(acpMethodTableIsOrdered(), "kAcpMethods must follow AcpMethod declaration order");

constexpr const AcpMethodInfo &acpMethodInfo(AcpMethod method)
{
    return kAcpMethods[static_cast<std::size_t>(method)];
}

inline QString acpMethodName(AcpMethod method)
{
    return QString::fromLatin1(acpMethodInfo(method).name);
}

std::optional<AcpMethod> acpMethodFromName(const QString &name);

// Agent-to-client requests the host answers. Each slot holds exactly one handler.
enum class ClientMethod {
    ReadTextFile,
    WriteTextFile,
    RequestPermission,
    TerminalCreate,
    TerminalOutput,
    TerminalWaitForExit,
    TerminalKill,
    TerminalRelease,
};

inline constexpr std::array<std::pair<ClientMethod, AcpMethod>, 8> kClientMethods = {{
    {ClientMethod::ReadTextFile, AcpMethod::FsReadTextFile},
    {ClientMethod::WriteTextFile, AcpMethod::FsWriteTextFile},
    {ClientMethod::RequestPermission, AcpMethod::SessionRequestPermission},
    {ClientMethod::TerminalCreate, AcpMethod::TerminalCreate},
    {ClientMethod::TerminalOutput, AcpMethod::TerminalOutput},
    {ClientMethod::TerminalWaitForExit, AcpMethod::TerminalWaitForExit},
    {ClientMethod::TerminalKill, AcpMethod::TerminalKill},
    {ClientMethod::TerminalRelease, AcpMethod::TerminalRelease},
}};

constexpr AcpMethod clientMethodWireMethod(ClientMethod method)
{
    return kClientMethods[static_cast<std::size_t>(method)].second;
}

namespace AcpDefaults {
inline constexpr QLatin1String ProtocolVersion("2025-01-13");
inline constexpr QLatin1String ClientName("acpbridge");
inline constexpr QLatin1String ClientVersion("0.1.0");
}
