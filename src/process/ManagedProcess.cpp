/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "ManagedProcess.h"

#include <KPtyDevice>
#include <KPtyProcess>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTimer>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

ManagedProcess::ManagedProcess(QObject *parent)
    : QObject(parent)
    , m_killTimer(new QTimer(this))
{
    m_killTimer->setSingleShot(true);
    connect(m_killTimer, &QTimer::timeout, this, &ManagedProcess::forceKill);
}

ManagedProcess::~ManagedProcess()
{
    if (m_process) {
        // Disconnect first so no signal reaches a half-destroyed owner
        disconnect(m_process, nullptr, this, nullptr);
        if (m_ptyProcess && m_ptyProcess->pty()) {
            disconnect(m_ptyProcess->pty(), nullptr, this, nullptr);
        }

        if (m_process->state() != QProcess::NotRunning) {
            qDebug() << "[ManagedProcess] Killing" << m_spec.program << "on destruction";
            signalGroup(SIGKILL);
            m_process->kill();
            m_process->waitForFinished(1000);
        }
        killLeftoverGroup();
    }
}

bool ManagedProcess::start(const Spec &spec)
{
    if (isRunning()) {
        qWarning() << "[ManagedProcess] start() called while" << m_spec.program << "is still running";
        return false;
    }

    releaseProcess();

    m_spec = spec;
    m_exitCode.reset();
    m_lastSignal = 0;
    m_processGroup = 0;
    m_stopRequested = false;

    if (spec.channelMode == ChannelMode::Pty) {
        m_ptyProcess = new KPtyProcess(this);
        m_ptyProcess->setPtyChannels(KPtyProcess::AllChannels);
        m_process = m_ptyProcess;

        KPtyDevice *pty = m_ptyProcess->pty();
        if (pty) {
            connect(pty, &KPtyDevice::readyRead, this, &ManagedProcess::onReadyReadPty);
            pty->setWinSize(spec.ptyRows, spec.ptyColumns);
        }
    } else {
        m_process = new QProcess(this);
        m_process->setProcessChannelMode(spec.channelMode == ChannelMode::MergedPipes
                                             ? QProcess::MergedChannels
                                             : QProcess::SeparateChannels);
        // KPtyProcess already makes its child a session leader
        m_process->setChildProcessModifier([] {
            ::setpgid(0, 0);
        });
        connect(m_process, &QProcess::readyReadStandardOutput, this, &ManagedProcess::onReadyReadStdout);
        connect(m_process, &QProcess::readyReadStandardError, this, &ManagedProcess::onReadyReadStderr);
    }

    connect(m_process, &QProcess::started, this, &ManagedProcess::onStarted);
    connect(m_process, &QProcess::finished, this, &ManagedProcess::onFinished);
    connect(m_process, &QProcess::errorOccurred, this, &ManagedProcess::onErrorOccurred);

    if (!spec.workingDirectory.isEmpty()) {
        m_process->setWorkingDirectory(spec.workingDirectory);
    }
    m_process->setProcessEnvironment(spec.environment);
    m_process->setProgram(resolveExecutable(spec.program));
    m_process->setArguments(spec.arguments);

    qDebug() << "[ManagedProcess] Starting" << m_process->program() << spec.arguments
             << "in:" << spec.workingDirectory;

    // errorOccurred(FailedToStart) may fire synchronously from start()
    m_state = State::Starting;
    m_process->start();
    return true;
}

qint64 ManagedProcess::processId() const
{
    return m_process ? m_process->processId() : 0;
}

bool ManagedProcess::write(const QByteArray &data)
{
    QIODevice *device = inputDevice();
    if (!device || !isRunning()) {
        return false;
    }
    return device->write(data) == data.size();
}

void ManagedProcess::closeWriteChannel()
{
    if (m_process && !m_ptyProcess) {
        m_process->closeWriteChannel();
    }
}

QIODevice *ManagedProcess::inputDevice() const
{
    if (m_ptyProcess) {
        return m_ptyProcess->pty();
    }
    return m_process;
}

bool ManagedProcess::sendSignal(int signalNumber)
{
    const qint64 pid = processId();
    if (!isRunning() || pid <= 0) {
        return false;
    }

    if (!signalGroup(signalNumber) && ::kill(static_cast<pid_t>(pid), signalNumber) != 0) {
        qWarning() << "[ManagedProcess] Failed to send signal" << signalNumber << "to" << pid;
        return false;
    }

    m_lastSignal = signalNumber;
    return true;
}

bool ManagedProcess::signalGroup(int signalNumber)
{
    if (m_processGroup <= 0) {
        return false;
    }
    return ::kill(-static_cast<pid_t>(m_processGroup), signalNumber) == 0;
}

void ManagedProcess::killLeftoverGroup()
{
    // Children that outlived the group leader of a stopped process
    if (m_processGroup > 0 && ::kill(-static_cast<pid_t>(m_processGroup), SIGKILL) == 0) {
        qDebug() << "[ManagedProcess] Killed leftover processes of group" << m_processGroup;
    }
    m_processGroup = 0;
}

void ManagedProcess::stop(int gracePeriodMs)
{
    if (!isRunning() || m_stopRequested) {
        return;
    }

    m_stopRequested = true;
    m_gracePeriodMs = gracePeriodMs;

    if (processId() > 0) {
        beginStop();
    }
    // else: onStarted() picks the request up once the pid exists
}

void ManagedProcess::forceKill()
{
    if (!isRunning() || !m_process) {
        return;
    }

    qDebug() << "[ManagedProcess] Force killing" << m_spec.program;
    m_lastSignal = SIGKILL;
    signalGroup(SIGKILL);
    m_process->kill();
}

void ManagedProcess::beginStop()
{
    qDebug() << "[ManagedProcess] Stopping" << m_spec.program << "grace:" << m_gracePeriodMs << "ms";

    if (m_gracePeriodMs <= 0 || !sendSignal(SIGTERM)) {
        forceKill();
        return;
    }

    m_killTimer->start(m_gracePeriodMs);
}

void ManagedProcess::onStarted()
{
    if (m_state != State::Starting) {
        return;
    }

    m_state = State::Running;
    // setpgid / setsid ran in the child before exec, so the pid names the group
    m_processGroup = processId();
    qDebug() << "[ManagedProcess] Started" << m_spec.program << "pid:" << processId();
    Q_EMIT started();

    if (m_stopRequested && isRunning()) {
        beginStop();
    }
}

void ManagedProcess::onReadyReadStdout()
{
    if (!m_process) {
        return;
    }

    const QByteArray data = m_process->readAllStandardOutput();
    if (!data.isEmpty()) {
        Q_EMIT stdoutReceived(data);
    }
}

void ManagedProcess::onReadyReadStderr()
{
    if (!m_process) {
        return;
    }

    const QByteArray data = m_process->readAllStandardError();
    if (!data.isEmpty()) {
        Q_EMIT stderrReceived(data);
    }
}

void ManagedProcess::onReadyReadPty()
{
    if (!m_ptyProcess || !m_ptyProcess->pty()) {
        return;
    }

    const QByteArray data = m_ptyProcess->pty()->readAll();
    if (!data.isEmpty()) {
        Q_EMIT stdoutReceived(data);
    }
}

void ManagedProcess::onFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    drainOutput();

    const bool crashed = exitStatus == QProcess::CrashExit;
    int code = exitCode;
    if (crashed) {
        // On Unix QProcess reports the terminating signal as the exit code
        const int signalNumber = exitCode > 0 ? exitCode : (m_lastSignal > 0 ? m_lastSignal : SIGKILL);
        code = 128 + signalNumber;
    }

    qDebug() << "[ManagedProcess]" << m_spec.program << "finished with exit code:" << code
             << (crashed ? "(signaled)" : "");
    finish(code, crashed);
}

void ManagedProcess::onErrorOccurred(QProcess::ProcessError error)
{
    const QString message = m_process ? m_process->errorString() : QString::number(error);

    if (error != QProcess::FailedToStart) {
        qWarning() << "[ManagedProcess]" << m_spec.program << "error:" << message;
        return;
    }

    qWarning() << "[ManagedProcess] Failed to start" << m_spec.program << ":" << message;
    if (m_state == State::Exited) {
        return;
    }

    Q_EMIT failedToStart(message);
    finish(FailedToStartExitCode, false);
}

void ManagedProcess::drainOutput()
{
    if (!m_process) {
        return;
    }

    if (m_ptyProcess) {
        // KPtyDevice only buffers on its notifier; pull what the child left in
        // the pty before reporting the exit. Bounded in case a grandchild keeps
        // writing.
        KPtyDevice *pty = m_ptyProcess->pty();
        for (int i = 0; pty && i < 64 && pty->waitForReadyRead(0); ++i) {
        }
        onReadyReadPty();
    } else {
        onReadyReadStdout();
        onReadyReadStderr();
    }
}

void ManagedProcess::finish(int exitCode, bool crashed)
{
    if (m_state == State::Exited) {
        return;
    }

    m_state = State::Exited;
    m_exitCode = exitCode;
    m_killTimer->stop();
    if (m_stopRequested) {
        killLeftoverGroup();
    } else {
        m_processGroup = 0;
    }

    Q_EMIT exited(exitCode, crashed);
}

void ManagedProcess::releaseProcess()
{
    if (!m_process) {
        return;
    }

    disconnect(m_process, nullptr, this, nullptr);
    if (m_ptyProcess && m_ptyProcess->pty()) {
        disconnect(m_ptyProcess->pty(), nullptr, this, nullptr);
    }
    m_process->deleteLater();
    m_process = nullptr;
    m_ptyProcess = nullptr;
}

QString ManagedProcess::resolveExecutable(const QString &executable)
{
    if (executable.isEmpty() || QFileInfo(executable).isAbsolute() || executable.contains(QLatin1Char('/'))) {
        return executable;
    }

    QString found = QStandardPaths::findExecutable(executable);
    if (!found.isEmpty()) {
        return found;
    }

    // When launched from desktop environments, user-local paths like
    // ~/.local/bin may not be on PATH
    const QString home = QDir::homePath();
    const QStringList fallbackDirs = {
        home + QStringLiteral("/.local/bin"),
        home + QStringLiteral("/bin"),
        home + QStringLiteral("/.cargo/bin"),
    };
    for (const QString &dir : fallbackDirs) {
        const QString candidate = dir + QLatin1Char('/') + executable;
        const QFileInfo info(candidate);
        if (info.exists() && info.isExecutable()) {
            return candidate;
        }
    }

    return executable;
}

bool ManagedProcess::isExecutableAvailable(const QString &executable)
{
    const QFileInfo info(resolveExecutable(executable));
    return info.isAbsolute() && info.exists() && info.isExecutable();
}
