#pragma once

#include <QObject>
#include <QByteArray>
#include <QPointer>
#include <QProcess>
#include <QTimer>
#include <QUrl>
#include <optional>

#include "IControlTransport.h"
#include "PlayerLaunchConfig.h"
#include "../core/PlaybackError.h"

// Owns the lifecycle of the external player process: spawn, reuse, stop.
// The process stdin/stdout pipe doubles as the control channel transport
// (one JSON message per line in both directions).
class PlayerProcessManager : public QObject, public IControlTransport {
    Q_OBJECT

public:
    explicit PlayerProcessManager(const PlayerLaunchConfig& config = PlayerLaunchConfig(),
                                  QObject* parent = nullptr);
    ~PlayerProcessManager() override;

    PlayerLaunchConfig config() const { return m_config; }
    void setConfig(const PlayerLaunchConfig& config) { m_config = config; }

    // Starts the player unless one is already running.  Returns the error on
    // failure (also emitted through errorOccurred).
    std::optional<PlaybackError> ensureRunning(const QString& accessToken,
                                               const QUrl& backendBaseUrl = QUrl());

    // Requests termination without waiting for it.  Exit is reported through
    // processExited / runningChanged(false).
    void stop();

    bool isRunning() const { return m_isRunning; }
    qint64 processId() const;

    // IControlTransport
    bool writeMessage(const QByteArray& message) override;

signals:
    void runningChanged(bool running);
    void processLaunched(qint64 pid);
    void processExited(int exitCode);
    void errorOccurred(const PlaybackError& error);

    // One line of player stdout, without the trailing newline
    void messageReceived(const QByteArray& line);

private:
    std::optional<PlaybackError> fail(const PlaybackError& error);
    void clearTerminatingProcess();
    void onProcessFinished(QProcess* proc, int exitCode, QProcess::ExitStatus status);
    void onProcessError(QProcess* proc, QProcess::ProcessError error);
    void onReadyReadStdout(QProcess* proc);
    void onReadyReadStderr(QProcess* proc);
    void releaseProcess(QProcess* proc, int exitCode);

    PlayerLaunchConfig m_config;
    QProcess* m_process = nullptr;
    QTimer* m_killTimer = nullptr;
    QByteArray m_stdoutBuffer;
    bool m_isRunning = false;
};
