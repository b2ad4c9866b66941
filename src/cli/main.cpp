/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors

    acpbridge - run one prompt turn against an ACP agent from the shell.
    Streams the agent's message text to stdout and tool call progress to
    stderr. Exit status: 0 end_turn, 1 failure, 2 usage error, 130 cancelled.
*/

#include "../acp/ACPClient.h"
#include "../acp/ACPHost.h"
#include "../acp/PermissionPolicy.h"
#include "../acp/SessionUpdateTracker.h"
#include "../acp/TerminalManager.h"
#include "../config/ClientConfig.h"
#include "../mcp/MCPServerManager.h"
#include "../process/ManagedProcess.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>

#include <cstdio>
#include <memory>

namespace {

constexpr int ExitOk = 0;
constexpr int ExitFailure = 1;
constexpr int ExitUsage = 2;
constexpr int ExitCancelled = 130;

// Time the agent gets to honor session/cancel before it is killed
constexpr int CancelGraceMs = 2000;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usageError(const QString &message)
{
    err() << "acpbridge: " << message << '\n' << "Try 'acpbridge --help' for more information.\n";
    err().flush();
    return ExitUsage;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("acpbridge"));
    QCoreApplication::setApplicationVersion(QString(AcpDefaults::ClientVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send one prompt to an Agent Client Protocol agent."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption agentOption(QStringLiteral("agent"),
                                         QStringLiteral("Agent executable (default: the configured provider)."),
                                         QStringLiteral("exe"));
    const QCommandLineOption argOption(QStringLiteral("arg"), QStringLiteral("Extra agent argument, repeatable."),
                                       QStringLiteral("a"));
    const QCommandLineOption cwdOption(QStringLiteral("cwd"),
                                       QStringLiteral("Session working directory and workspace root."),
                                       QStringLiteral("dir"));
    const QCommandLineOption modeOption(QStringLiteral("mode"), QStringLiteral("Session mode to switch to."),
                                        QStringLiteral("id"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                           QStringLiteral("Cancel the turn after this many milliseconds."),
                                           QStringLiteral("ms"));
    const QCommandLineOption yesOption(QStringLiteral("yes"), QStringLiteral("Allow every permission request."));
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Read settings from an INI file."),
                                          QStringLiteral("file"));
    const QCommandLineOption startMcpOption(QStringLiteral("start-mcp"),
                                            QStringLiteral("Also run the configured MCP servers for the duration of the turn."));
    parser.addOptions({agentOption, argOption, cwdOption, modeOption, timeoutOption, yesOption, configOption, startMcpOption});
    parser.addPositionalArgument(QStringLiteral("prompt"), QStringLiteral("Prompt text."));

    if (!parser.parse(QCoreApplication::arguments())) {
        return usageError(parser.errorText());
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(ExitOk);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    const QString promptText = parser.positionalArguments().join(QLatin1Char(' ')).trimmed();
    if (promptText.isEmpty()) {
        return usageError(QStringLiteral("missing prompt"));
    }

    int timeoutMs = 0;
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        timeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeoutMs <= 0) {
            return usageError(QStringLiteral("--timeout expects a positive number of milliseconds"));
        }
    }

    const QString cwd = QFileInfo(parser.isSet(cwdOption) ? parser.value(cwdOption) : QDir::currentPath()).absoluteFilePath();
    if (!QFileInfo(cwd).isDir()) {
        return usageError(QStringLiteral("not a directory: %1").arg(cwd));
    }

    if (parser.isSet(configOption) && !QFileInfo::exists(parser.value(configOption))) {
        return usageError(QStringLiteral("config file not found: %1").arg(parser.value(configOption)));
    }
    std::unique_ptr<ClientConfig> settings = parser.isSet(configOption)
        ? std::make_unique<ClientConfig>(parser.value(configOption))
        : std::make_unique<ClientConfig>();
    const ClientConfig &config = *settings;

    if (!config.debugLogging()) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    AgentProvider provider = config.activeProvider();
    if (parser.isSet(agentOption)) {
        provider.executable = parser.value(agentOption);
        provider.args.clear();
    }
    provider.args.append(parser.values(argOption));

    if (!ManagedProcess::isExecutableAvailable(provider.executable)) {
        err() << "acpbridge: agent executable not found: " << provider.executable << '\n';
        err().flush();
        return ExitFailure;
    }

    ACPClient client;
    client.setMalformedLinePolicy(config.malformedLinePolicy());
    client.setRequestTimeout(config.requestTimeoutMs());

    ACPHost host(&client, cwd);
    host.setDefaultOutputByteLimit(config.terminalOutputByteLimit());
    host.terminals()->setDefaultTerminalSize(config.terminalColumns(), config.terminalRows());
    host.terminals()->setKillGracePeriod(config.killGracePeriodMs());
    host.permissions()->setAutoApproveKinds(config.autoApproveKinds());
    if (parser.isSet(yesOption)) {
        host.permissions()->setPrompt([](const PermissionRequest &request, const PermissionPolicy::DecisionCallback &answer) {
            err() << "[permission] allowing " << request.toolCall.title << '\n';
            err().flush();
            answer(PermissionDecision::AllowOnce);
        });
    }
    host.install();

    SessionUpdateTracker tracker;
    QObject::connect(&client, &ACPClient::sessionUpdate, &tracker, &SessionUpdateTracker::update);

    bool printedText = false;
    QObject::connect(&tracker, &SessionUpdateTracker::messageChunk, [&printedText](const QString &, const QString &text) {
        out() << text;
        out().flush();
        printedText = true;
    });
    QObject::connect(&tracker, &SessionUpdateTracker::toolCallAdded, [](const QString &, const ToolCall &call) {
        err() << "[tool] " << call.title << " (" << toolCallStatusName(call.status) << ")\n";
        err().flush();
    });
    QObject::connect(&tracker, &SessionUpdateTracker::toolCallUpdated, [](const QString &, const ToolCall &call) {
        if (isTerminalStatus(call.status)) {
            err() << "[tool] " << call.title << " " << toolCallStatusName(call.status) << '\n';
            err().flush();
        }
    });
    QObject::connect(&client, &ACPClient::stderrReceived, [](const QString &text) {
        qDebug() << "[acpbridge] agent stderr:" << text;
    });

    MCPServerManager mcpManager;
    mcpManager.setKillGracePeriod(config.killGracePeriodMs());
    QObject::connect(&mcpManager, &MCPServerManager::serverExited, [](const QString &name, int exitCode) {
        err() << "[mcp] " << name << " exited with code " << exitCode << '\n';
        err().flush();
    });

    bool finished = false;
    auto finish = [&](int exitCode) {
        if (finished) {
            return;
        }
        finished = true;
        if (printedText) {
            out() << '\n';
            out().flush();
        }
        client.dispose();
        mcpManager.dispose([exitCode]() {
            QCoreApplication::exit(exitCode);
        });
    };
    auto fail = [&](const QString &stage, const RpcError &error) {
        err() << "acpbridge: " << stage << " failed (" << errorKindName(error.kind) << "): " << error.message << '\n';
        err().flush();
        finish(ExitFailure);
    };

    QObject::connect(&client, &ACPClient::processExited, [&](int exitCode) {
        if (!finished) {
            err() << "acpbridge: agent exited unexpectedly with code " << exitCode << '\n';
            err().flush();
            finish(ExitFailure);
        }
    });

    QString sessionId;

    auto runPrompt = [&]() {
        if (timeoutMs > 0) {
            QTimer::singleShot(timeoutMs, &client, [&]() {
                if (finished) {
                    return;
                }
                err() << "acpbridge: timed out after " << timeoutMs << " ms, cancelling\n";
                err().flush();
                client.cancelSession(sessionId);

                QTimer::singleShot(CancelGraceMs, &client, [&]() {
                    if (!finished) {
                        err() << "acpbridge: agent ignored cancellation, terminating\n";
                        err().flush();
                        finish(ExitCancelled);
                    }
                });
            });
        }

        client.prompt(sessionId, promptText, [&](const RpcResult &result) {
            if (!result.ok()) {
                fail(QStringLiteral("prompt"), *result.error);
                return;
            }

            const QString stopReason = result.result.toObject()[QStringLiteral("stopReason")].toString();
            qDebug() << "[acpbridge] Turn finished, stopReason:" << stopReason;
            if (stopReason == QLatin1String("end_turn")) {
                finish(ExitOk);
            } else if (stopReason == QLatin1String("cancelled")) {
                finish(ExitCancelled);
            } else {
                err() << "acpbridge: turn stopped: " << stopReason << '\n';
                err().flush();
                finish(ExitFailure);
            }
        });
    };

    auto onSessionReady = [&]() {
        if (!parser.isSet(modeOption)) {
            runPrompt();
            return;
        }
        client.setMode(sessionId, parser.value(modeOption), [&](const RpcResult &result) {
            if (!result.ok()) {
                fail(QStringLiteral("session/set_mode"), *result.error);
                return;
            }
            runPrompt();
        });
    };

    QList<McpServerSpec> mcpServers;
    const QList<MCPServerConfig> configuredServers = config.mcpServers();
    for (const MCPServerConfig &server : configuredServers) {
        if (!server.enabled) {
            continue;
        }
        mcpServers.append(server.toSessionConfig());

        if (parser.isSet(startMcpOption)) {
            QString error;
            if (!mcpManager.startServer(server, &error)) {
                // The turn still runs without it
                err() << "acpbridge: " << error << '\n';
                err().flush();
            }
        }
    }

    QTimer::singleShot(0, &client, [&]() {
        if (!client.start(config.launchConfig(provider, cwd))) {
            // processExited already reported it
            finish(ExitFailure);
            return;
        }

        InitializeParams params;
        params.protocolVersion = config.protocolVersion();

        client.initialize(params, [&](const RpcResult &result) {
            if (!result.ok()) {
                fail(QStringLiteral("initialize"), *result.error);
                return;
            }
            qDebug() << "[acpbridge] Connected to" << client.agentInfo().name << client.agentInfo().version;

            client.newSession(cwd, mcpServers, [&](const RpcResult &sessionResult) {
                if (!sessionResult.ok()) {
                    fail(QStringLiteral("session/new"), *sessionResult.error);
                    return;
                }
                sessionId = sessionResult.result.toObject()[QStringLiteral("sessionId")].toString();
                onSessionReady();
            });
        }, config.initializeTimeoutMs());
    });

    return app.exec();
}
