/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <optional>

class KPtyProcess;
class QIODevice;
class QTimer;

/**
 * ManagedProcess - spawn, monitor and stop one child process.
 *
 * Shared by the agent connection, terminals and MCP servers. Guarantees:
 *  - exited() is emitted exactly once per start(), including when the
 *    program could not be started (code 127) or was killed by a signal
 *    (128 + signal), so nothing waiting on it can hang.
 *  - stop() sends SIGTERM and escalates to SIGKILL after a grace period;
 *    repeated calls and calls after exit are no-ops.
 *  - the child leads its own process group and signals go to the whole
 *    group, so wrappers such as `sh -c` or `npx` do not leave their
 *    children behind.
 *  - the destructor never leaks a running child.
 */
class ManagedProcess : public QObject
{
    Q_OBJECT

public:
    enum class ChannelMode {
        SeparatePipes,  // stdout and stderr delivered separately
        MergedPipes,    // stderr redirected into stdout
        Pty,            // both attached to a pseudo terminal
    };

    enum class State {
        NotStarted,
        Starting,
        Running,
        Exited,
    };

    struct Spec {
        QString program;
        QStringList arguments;
        QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
        QString workingDirectory;
        ChannelMode channelMode = ChannelMode::SeparatePipes;
        int ptyColumns = 120;
        int ptyRows = 40;
    };

    static constexpr int FailedToStartExitCode = 127;

    explicit ManagedProcess(QObject *parent = nullptr);
    ~ManagedProcess() override;

    // Asynchronous; failures are reported through failedToStart + exited
    bool start(const Spec &spec);

    State state() const { return m_state; }
    bool isRunning() const { return m_state == State::Starting || m_state == State::Running; }
    qint64 processId() const;
    std::optional<int> exitCode() const { return m_exitCode; }
    QString program() const { return m_spec.program; }

    bool write(const QByteArray &data);
    void closeWriteChannel();

    // Device that writes to the child's stdin (the PTY in Pty mode)
    QIODevice *inputDevice() const;

    bool sendSignal(int signalNumber);
    void stop(int gracePeriodMs);
    void forceKill();

    // Resolve a bare executable name through PATH and user-local bin directories.
    // Returns the input unchanged if nothing is found.
    static QString resolveExecutable(const QString &executable);
    static bool isExecutableAvailable(const QString &executable);

Q_SIGNALS:
    void started();
    void stdoutReceived(const QByteArray &chunk);
    void stderrReceived(const QByteArray &chunk);
    void failedToStart(const QString &message);
    void exited(int exitCode, bool crashed);

private Q_SLOTS:
    void onStarted();
    void onReadyReadStdout();
    void onReadyReadStderr();
    void onReadyReadPty();
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    void beginStop();
    bool signalGroup(int signalNumber);
    void killLeftoverGroup();
    void drainOutput();
    void finish(int exitCode, bool crashed);
    void releaseProcess();

    Spec m_spec;
    QProcess *m_process = nullptr;
    KPtyProcess *m_ptyProcess = nullptr;
    QTimer *m_killTimer = nullptr;
    State m_state = State::NotStarted;
    std::optional<int> m_exitCode;
    int m_lastSignal = 0;
    qint64 m_processGroup = 0;
    int m_gracePeriodMs = 0;
    bool m_stopRequested = false;
};
