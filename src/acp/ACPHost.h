/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "../rpc/JsonRpcEndpoint.h"
#include "../util/WorkspaceFileSystem.h"

#include <QObject>
#include <QPointer>
#include <QProcessEnvironment>

class ACPClient;
class PermissionPolicy;
class TerminalManager;

/**
 * ACPHost - default implementation of the client-side ACP methods.
 *
 * Serves fs/* from a WorkspaceFileSystem, terminal/* from a TerminalManager
 * and session/request_permission from a PermissionPolicy. Cancelling a
 * session answers its outstanding permission requests with "cancelled".
 */
class ACPHost : public QObject
{
    Q_OBJECT

public:
    ACPHost(ACPClient *client, const QString &workspaceRoot, QObject *parent = nullptr);
    ~ACPHost() override;

    // Register every handler; false if any slot was already taken
    bool install();
    void uninstall();

    TerminalManager *terminals() const { return m_terminals; }
    PermissionPolicy *permissions() const { return m_permissions; }
    const WorkspaceFileSystem &fileSystem() const { return m_fileSystem; }

    // Used when terminal/create does not pass outputByteLimit
    void setDefaultOutputByteLimit(qint64 limit) { m_defaultOutputByteLimit = limit; }

private:
    void handleReadTextFile(const QJsonValue &params, const RequestResponder &responder);
    void handleWriteTextFile(const QJsonValue &params, const RequestResponder &responder);
    void handleTerminalCreate(const QJsonValue &params, const RequestResponder &responder);
    void handleTerminalOutput(const QJsonValue &params, const RequestResponder &responder);
    void handleTerminalWaitForExit(const QJsonValue &params, const RequestResponder &responder);
    void handleTerminalKill(const QJsonValue &params, const RequestResponder &responder);
    void handleTerminalRelease(const QJsonValue &params, const RequestResponder &responder);

    QProcessEnvironment buildEnvironment(const QJsonValue &env) const;
    bool requireTerminal(const QString &terminalId, const RequestResponder &responder) const;

    QPointer<ACPClient> m_client;
    TerminalManager *m_terminals = nullptr;
    PermissionPolicy *m_permissions = nullptr;
    WorkspaceFileSystem m_fileSystem;
    qint64 m_defaultOutputByteLimit = 0;
    bool m_installed = false;
};
