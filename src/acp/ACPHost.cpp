/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ACPHost.h"
#include "ACPClient.h"
#include "PermissionPolicy.h"
#include "TerminalManager.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QTimer>

#include <signal.h>

namespace {

QString signalName(int signalNumber)
{
    switch (signalNumber) {
    case SIGHUP:
        return QStringLiteral("SIGHUP");
    case SIGINT:
        return QStringLiteral("SIGINT");
    case SIGKILL:
        return QStringLiteral("SIGKILL");
    case SIGPIPE:
        return QStringLiteral("SIGPIPE");
    case SIGTERM:
        return QStringLiteral("SIGTERM");
    default:
        return QStringLiteral("SIG%1").arg(signalNumber);
    }
}

QJsonObject exitStatusToJson(const TerminalManager::ExitStatus &status)
{
    QJsonObject obj;
    obj[QStringLiteral("exitCode")] = status.exitCode;
    obj[QStringLiteral("signal")] = status.signal ? QJsonValue(signalName(*status.signal)) : QJsonValue(QJsonValue::Null);
    return obj;
}

}

ACPHost::ACPHost(ACPClient *client, const QString &workspaceRoot, QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_terminals(new TerminalManager(this))
    , m_permissions(new PermissionPolicy(QStringList(), this))
    , m_fileSystem(workspaceRoot)
{
}

ACPHost::~ACPHost()
{
    uninstall();
    m_terminals->releaseAll();
}

bool ACPHost::install()
{
    if (!m_client) {
        return false;
    }

    using Member = void (ACPHost::*)(const QJsonValue &, const RequestResponder &);
    const std::pair<ClientMethod, Member> table[] = {
        {ClientMethod::ReadTextFile, &ACPHost::handleReadTextFile},
        {ClientMethod::WriteTextFile, &ACPHost::handleWriteTextFile},
        {ClientMethod::TerminalCreate, &ACPHost::handleTerminalCreate},
        {ClientMethod::TerminalOutput, &ACPHost::handleTerminalOutput},
        {ClientMethod::TerminalWaitForExit, &ACPHost::handleTerminalWaitForExit},
        {ClientMethod::TerminalKill, &ACPHost::handleTerminalKill},
        {ClientMethod::TerminalRelease, &ACPHost::handleTerminalRelease},
    };

    bool ok = true;
    for (const auto &entry : table) {
        const Member member = entry.second;
        ok &= m_client->setClientMethodHandler(entry.first, [this, member](const QJsonValue &params, const RequestResponder &responder) {
            (this->*member)(params, responder);
        });
    }

    ok &= m_client->setClientMethodHandler(ClientMethod::RequestPermission,
                                           [this](const QJsonValue &params, const RequestResponder &responder) {
        m_permissions->handleRequest(params, responder);
    });

    connect(m_client, &ACPClient::sessionCancelled, m_permissions, &PermissionPolicy::cancelSession, Qt::UniqueConnection);
    connect(m_client, &ACPClient::processExited, m_terminals, &TerminalManager::releaseAll, Qt::UniqueConnection);

    m_installed = true;
    return ok;
}

void ACPHost::uninstall()
{
    if (!m_installed || !m_client) {
        return;
    }

    for (const auto &entry : kClientMethods) {
        m_client->clearClientMethodHandler(entry.first);
    }
    disconnect(m_client, nullptr, m_permissions, nullptr);
    disconnect(m_client, nullptr, m_terminals, nullptr);
    m_installed = false;
}

void ACPHost::handleReadTextFile(const QJsonValue &params, const RequestResponder &responder)
{
    const QJsonObject obj = params.toObject();
    const QString path = obj[QStringLiteral("path")].toString();
    const int line = obj[QStringLiteral("line")].toInt(1);
    const int limit = obj[QStringLiteral("limit")].toInt(-1);

    qDebug() << "[ACPHost] fs/read_text_file - path:" << path << "line:" << line << "limit:" << limit;

    QString content;
    WorkspaceFileSystem::Error error;
    if (!m_fileSystem.readTextFile(path, line, limit, &content, &error)) {
        responder.reject(error.code, error.message);
        return;
    }

    QJsonObject result;
    result[QStringLiteral("content")] = content;
    responder.resolve(result);
}

void ACPHost::handleWriteTextFile(const QJsonValue &params, const RequestResponder &responder)
{
    const QJsonObject obj = params.toObject();
    const QString path = obj[QStringLiteral("path")].toString();
    const QString content = obj[QStringLiteral("content")].toString();

    qDebug() << "[ACPHost] fs/write_text_file - path:" << path << "content length:" << content.length();

    WorkspaceFileSystem::Error error;
    if (!m_fileSystem.writeTextFile(path, content, &error)) {
        responder.reject(error.code, error.message);
        return;
    }

    responder.resolve();
}

void ACPHost::handleTerminalCreate(const QJsonValue &params, const RequestResponder &responder)
{
    const QJsonObject obj = params.toObject();
    const QString command = obj[QStringLiteral("command")].toString();
    QString cwd = obj[QStringLiteral("cwd")].toString();

    qint64 outputByteLimit = m_defaultOutputByteLimit;
    if (obj.contains(QStringLiteral("outputByteLimit"))) {
        outputByteLimit = obj[QStringLiteral("outputByteLimit")].toInteger();
    }

    QStringList args;
    const QJsonArray argsArray = obj[QStringLiteral("args")].toArray();
    for (const QJsonValue &value : argsArray) {
        args.append(value.toString());
    }

    qDebug() << "[ACPHost] terminal/create - command:" << command << "args:" << args << "cwd:" << cwd;

    if (command.isEmpty()) {
        responder.reject(RpcErrorCode::InvalidParams, QStringLiteral("Missing required parameter: command"));
        return;
    }

    // Use working dir from params, or fall back to the workspace root
    if (cwd.isEmpty()) {
        cwd = m_fileSystem.root();
    }

    // Agents often send a whole command line ("git status") without args
    QString program = command;
    if (args.isEmpty() && command.contains(QLatin1Char(' '))) {
        program = QStringLiteral("/bin/sh");
        args = QStringList{QStringLiteral("-c"), command};
    }

    const QString terminalId = m_terminals->createTerminal(program, args, buildEnvironment(obj[QStringLiteral("env")]),
                                                           cwd, outputByteLimit);
    if (terminalId.isEmpty()) {
        responder.reject(RpcErrorCode::InternalError, QStringLiteral("Failed to create terminal"));
        return;
    }

    QJsonObject result;
    result[QStringLiteral("terminalId")] = terminalId;
    responder.resolve(result);
}

void ACPHost::handleTerminalOutput(const QJsonValue &params, const RequestResponder &responder)
{
    const QString terminalId = params.toObject()[QStringLiteral("terminalId")].toString();
    qDebug() << "[ACPHost] terminal/output - terminalId:" << terminalId;

    const auto output = m_terminals->getOutput(terminalId);
    if (!output) {
        responder.reject(RpcErrorCode::NotFound, QStringLiteral("Terminal not found: %1").arg(terminalId));
        return;
    }

    QJsonObject result;
    result[QStringLiteral("output")] = output->output;
    result[QStringLiteral("truncated")] = output->truncated;
    if (output->exitStatus) {
        result[QStringLiteral("exitStatus")] = exitStatusToJson(*output->exitStatus);
    }
    responder.resolve(result);
}

void ACPHost::handleTerminalWaitForExit(const QJsonValue &params, const RequestResponder &responder)
{
    const QJsonObject obj = params.toObject();
    const QString terminalId = obj[QStringLiteral("terminalId")].toString();
    const int timeoutMs = obj[QStringLiteral("timeout")].toInt(-1);

    qDebug() << "[ACPHost] terminal/wait_for_exit - terminalId:" << terminalId << "timeout:" << timeoutMs;

    if (!requireTerminal(terminalId, responder)) {
        return;
    }

    // Answered later; the read loop keeps running meanwhile
    const quint64 waiterId = m_terminals->waitForExit(terminalId, [responder](const TerminalManager::ExitStatus &status) {
        responder.resolve(exitStatusToJson(status));
    });

    if (timeoutMs > 0 && !responder.isAnswered()) {
        QTimer::singleShot(timeoutMs, this, [this, responder, terminalId, waiterId]() {
            if (responder.isAnswered()) {
                return;
            }
            m_terminals->cancelWait(terminalId, waiterId);
            responder.reject(RpcErrorCode::InternalError,
                             QStringLiteral("Timed out waiting for terminal %1").arg(terminalId));
        });
    }
}

void ACPHost::handleTerminalKill(const QJsonValue &params, const RequestResponder &responder)
{
    const QString terminalId = params.toObject()[QStringLiteral("terminalId")].toString();
    qDebug() << "[ACPHost] terminal/kill - terminalId:" << terminalId;

    if (!requireTerminal(terminalId, responder)) {
        return;
    }

    m_terminals->killTerminal(terminalId);
    responder.resolve(QJsonObject());
}

void ACPHost::handleTerminalRelease(const QJsonValue &params, const RequestResponder &responder)
{
    const QString terminalId = params.toObject()[QStringLiteral("terminalId")].toString();
    qDebug() << "[ACPHost] terminal/release - terminalId:" << terminalId;

    if (!requireTerminal(terminalId, responder)) {
        return;
    }

    m_terminals->releaseTerminal(terminalId);
    responder.resolve(QJsonObject());
}

QProcessEnvironment ACPHost::buildEnvironment(const QJsonValue &env) const
{
    QProcessEnvironment result = QProcessEnvironment::systemEnvironment();
    result.insert(QStringLiteral("GIT_PAGER"), QStringLiteral("cat"));  // Prevent git from using pager

    if (env.isArray()) {
        const QJsonArray entries = env.toArray();
        for (const QJsonValue &value : entries) {
            const QJsonObject entry = value.toObject();
            result.insert(entry[QStringLiteral("name")].toString(), entry[QStringLiteral("value")].toString());
        }
    } else if (env.isObject()) {
        const QJsonObject entries = env.toObject();
        for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
            result.insert(it.key(), it.value().toString());
        }
    }
    return result;
}

bool ACPHost::requireTerminal(const QString &terminalId, const RequestResponder &responder) const
{
    if (m_terminals->isValid(terminalId)) {
        return true;
    }
    responder.reject(RpcErrorCode::NotFound, QStringLiteral("Terminal not found: %1").arg(terminalId));
    return false;
}
