/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "TerminalManager.h"
#include "../process/ManagedProcess.h"

#include <QDebug>

#include <signal.h>

#include <utility>

TerminalManager::TerminalManager(QObject *parent)
    : QObject(parent)
{
}

TerminalManager::~TerminalManager()
{
    releaseAll();
}

QString TerminalManager::generateTerminalId()
{
    return QStringLiteral("term_%1").arg(++m_idCounter);
}

QString TerminalManager::createTerminal(const QString &command, const QStringList &args,
                                        const QProcessEnvironment &env, const QString &cwd,
                                        qint64 outputByteLimit)
{
    if (command.isEmpty()) {
        qWarning() << "[TerminalManager] createTerminal: empty command";
        return QString();
    }

    const QString terminalId = generateTerminalId();
    qDebug() << "[TerminalManager] Creating terminal" << terminalId << "command:" << command << "args:" << args;

    auto *process = new ManagedProcess(this);

    TerminalData data;
    data.process = process;
    data.outputByteLimit = outputByteLimit;
    data.command = command;
    m_terminals.insert(terminalId, data);

    connect(process, &ManagedProcess::stdoutReceived, this, [this, terminalId](const QByteArray &chunk) {
        appendOutput(terminalId, chunk);
    });
    connect(process, &ManagedProcess::failedToStart, this, [this, terminalId](const QString &message) {
        appendOutput(terminalId, QStringLiteral("Error: %1\n").arg(message).toUtf8());
    });
    connect(process, &ManagedProcess::exited, this, [this, terminalId](int exitCode, bool crashed) {
        onProcessExited(terminalId, exitCode, crashed);
    });

    ManagedProcess::Spec spec;
    spec.program = command;
    spec.arguments = args;
    spec.environment = env;
    spec.workingDirectory = cwd;
    spec.channelMode = ManagedProcess::ChannelMode::Pty;
    spec.ptyColumns = m_defaultColumns;
    spec.ptyRows = m_defaultRows;
    process->start(spec);

    qDebug() << "[TerminalManager] Terminal" << terminalId << "started with PTY size"
             << m_defaultColumns << "x" << m_defaultRows;
    return terminalId;
}

void TerminalManager::appendOutput(const QString &terminalId, const QByteArray &data)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end() || data.isEmpty()) {
        return;
    }

    it->outputBuffer.append(data);
    truncateOutput(*it);

    Q_EMIT outputAvailable(terminalId, data);
}

void TerminalManager::onProcessExited(const QString &terminalId, int exitCode, bool crashed)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end()) {
        return;
    }

    qDebug() << "[TerminalManager] Terminal" << terminalId << "finished with exit code:" << exitCode;

    it->status = TerminalStatus::Exited;
    it->exitStatus.exitCode = exitCode;
    if (crashed && exitCode > 128) {
        it->exitStatus.signal = exitCode - 128;
    }

    const ExitStatus status = it->exitStatus;
    const auto waiters = std::exchange(it->waiters, {});

    Q_EMIT terminalExited(terminalId, exitCode);

    for (const auto &waiter : waiters) {
        waiter.second(status);
    }
}

void TerminalManager::truncateOutput(TerminalData &data)
{
    if (data.outputByteLimit <= 0 || data.outputBuffer.size() <= data.outputByteLimit) {
        return;
    }

    // Drop from the front, then skip UTF-8 continuation bytes so the
    // buffer never starts in the middle of a character
    qsizetype excess = data.outputBuffer.size() - data.outputByteLimit;
    while (excess < data.outputBuffer.size()
           && (static_cast<unsigned char>(data.outputBuffer.at(excess)) & 0xC0) == 0x80) {
        ++excess;
    }
    data.outputBuffer.remove(0, excess);
    data.truncated = true;
}

std::optional<TerminalManager::OutputResult> TerminalManager::getOutput(const QString &terminalId) const
{
    const auto it = m_terminals.constFind(terminalId);
    if (it == m_terminals.constEnd()) {
        qWarning() << "[TerminalManager] getOutput: terminal not found:" << terminalId;
        return std::nullopt;
    }

    OutputResult result;
    result.output = QString::fromUtf8(it->outputBuffer);
    result.truncated = it->truncated;
    if (it->status != TerminalStatus::Running) {
        result.exitStatus = it->exitStatus;
    }
    return result;
}

quint64 TerminalManager::waitForExit(const QString &terminalId, ExitCallback callback)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end()) {
        qWarning() << "[TerminalManager] waitForExit: terminal not found:" << terminalId;
        return 0;
    }

    const quint64 waiterId = m_nextWaiterId++;

    // If already finished, answer with the stored status
    if (it->status != TerminalStatus::Running) {
        if (callback) {
            callback(it->exitStatus);
        }
        return waiterId;
    }

    if (callback) {
        it->waiters.append(qMakePair(waiterId, std::move(callback)));
    }
    return waiterId;
}

void TerminalManager::cancelWait(const QString &terminalId, quint64 waiterId)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end()) {
        return;
    }

    for (int i = 0; i < it->waiters.size(); ++i) {
        if (it->waiters[i].first == waiterId) {
            it->waiters.removeAt(i);
            return;
        }
    }
}

int TerminalManager::pendingWaiterCount(const QString &terminalId) const
{
    const auto it = m_terminals.constFind(terminalId);
    return it == m_terminals.constEnd() ? 0 : it->waiters.size();
}

bool TerminalManager::killTerminal(const QString &terminalId)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end()) {
        qWarning() << "[TerminalManager] killTerminal: terminal not found:" << terminalId;
        return false;
    }

    if (it->status != TerminalStatus::Running) {
        return true;
    }

    qDebug() << "[TerminalManager] Killing terminal" << terminalId;
    it->process->stop(m_killGracePeriodMs);
    return true;
}

bool TerminalManager::releaseTerminal(const QString &terminalId)
{
    auto it = m_terminals.find(terminalId);
    if (it == m_terminals.end()) {
        qWarning() << "[TerminalManager] releaseTerminal: terminal not found:" << terminalId;
        return false;
    }

    qDebug() << "[TerminalManager] Releasing terminal" << terminalId;

    TerminalData data = *it;
    m_terminals.erase(it);

    ManagedProcess *process = data.process;
    const bool wasRunning = data.status == TerminalStatus::Running;
    if (process) {
        disconnect(process, nullptr, this, nullptr);
        if (wasRunning) {
            process->forceKill();
        }
        process->deleteLater();
    }

    // Nobody may be left waiting on a terminal that no longer exists
    if (wasRunning) {
        ExitStatus status;
        status.exitCode = 128 + SIGKILL;
        status.signal = SIGKILL;
        for (const auto &waiter : std::as_const(data.waiters)) {
            waiter.second(status);
        }
    }
    return true;
}

bool TerminalManager::isValid(const QString &terminalId) const
{
    return m_terminals.contains(terminalId);
}

bool TerminalManager::isRunning(const QString &terminalId) const
{
    const auto it = m_terminals.constFind(terminalId);
    return it != m_terminals.constEnd() && it->status == TerminalStatus::Running;
}

void TerminalManager::releaseAll()
{
    qDebug() << "[TerminalManager] Releasing all terminals (" << m_terminals.size() << "terminals)";

    const QStringList ids = m_terminals.keys();
    for (const QString &id : ids) {
        releaseTerminal(id);
    }
}

void TerminalManager::setDefaultTerminalSize(int columns, int rows)
{
    m_defaultColumns = qBound(40, columns, 500);  // Reasonable bounds
    m_defaultRows = qBound(10, rows, 200);
    qDebug() << "[TerminalManager] Default terminal size set to" << m_defaultColumns << "x" << m_defaultRows;
}
