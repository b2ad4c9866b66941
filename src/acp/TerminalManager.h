/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include "ACPModels.h"

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPair>
#include <QProcessEnvironment>
#include <QStringList>

#include <functional>
#include <optional>

class ManagedProcess;

/**
 * TerminalManager - backs the terminal/* client methods with real processes.
 *
 * Each terminal runs on its own pseudo terminal, so stdout and stderr land in
 * one append-only buffer in the order the program wrote them. Terminal ids
 * are generated here ("term_N") and stay valid until releaseTerminal().
 */
class TerminalManager : public QObject
{
    Q_OBJECT

public:
    struct ExitStatus {
        int exitCode = -1;
        std::optional<int> signal;
    };

    struct OutputResult {
        QString output;
        bool truncated = false;
        std::optional<ExitStatus> exitStatus;  // set once the process exited
    };

    using ExitCallback = std::function<void(const ExitStatus &status)>;

    explicit TerminalManager(QObject *parent = nullptr);
    ~TerminalManager() override;

    // Spawns asynchronously. A program that cannot be started still yields a
    // terminal: its buffer gets an "Error: ..." line and it exits with 127.
    // Returns an empty string only for an empty command.
    QString createTerminal(const QString &command, const QStringList &args,
                           const QProcessEnvironment &env, const QString &cwd,
                           qint64 outputByteLimit = 0);

    // std::nullopt if the terminal does not exist (or was released)
    std::optional<OutputResult> getOutput(const QString &terminalId) const;

    // Invokes the callback immediately if already exited, otherwise on exit.
    // Returns a waiter id for cancelWait(), or 0 (callback never invoked) if
    // the terminal does not exist.
    quint64 waitForExit(const QString &terminalId, ExitCallback callback);

    // Drops a pending waiter without invoking it
    void cancelWait(const QString &terminalId, quint64 waiterId);
    int pendingWaiterCount(const QString &terminalId) const;

    // SIGTERM, then SIGKILL after the grace period. No-op once exited.
    // Output stays queryable.
    bool killTerminal(const QString &terminalId);

    // Kill if running and forget the terminal
    bool releaseTerminal(const QString &terminalId);

    bool isValid(const QString &terminalId) const;
    bool isRunning(const QString &terminalId) const;
    QStringList terminalIds() const { return m_terminals.keys(); }

    void releaseAll();

    void setDefaultTerminalSize(int columns, int rows);
    void setKillGracePeriod(int ms) { m_killGracePeriodMs = ms; }

Q_SIGNALS:
    // Raw output as it arrives, before truncation
    void outputAvailable(const QString &terminalId, const QByteArray &chunk);

    void terminalExited(const QString &terminalId, int exitCode);

private:
    struct TerminalData {
        ManagedProcess *process = nullptr;
        QByteArray outputBuffer;
        TerminalStatus status = TerminalStatus::Running;
        ExitStatus exitStatus;
        qint64 outputByteLimit = 0;
        bool truncated = false;
        QString command;
        QList<QPair<quint64, ExitCallback>> waiters;
    };

    QString generateTerminalId();
    void appendOutput(const QString &terminalId, const QByteArray &data);
    void onProcessExited(const QString &terminalId, int exitCode, bool crashed);
    static void truncateOutput(TerminalData &data);

    QHash<QString, TerminalData> m_terminals;
    int m_idCounter = 0;
    quint64 m_nextWaiterId = 1;
    int m_defaultColumns = 120;
    int m_defaultRows = 40;
    int m_killGracePeriodMs = 100;
};
