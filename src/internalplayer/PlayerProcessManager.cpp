#include "PlayerProcessManager.h"
#include "HelperLocator.h"
#include "../core/DiagnosticLog.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcessEnvironment>

namespace {
const QString kTag = QStringLiteral("PlayerProcess");
}

PlayerProcessManager::PlayerProcessManager(const PlayerLaunchConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    qRegisterMetaType<PlaybackError>("PlaybackError");

    m_killTimer = new QTimer(this);
    m_killTimer->setSingleShot(true);
    connect(m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_process && m_process->state() != QProcess::NotRunning) {
            DiagnosticLog::instance()->warn(kTag,
                QStringLiteral("Player did not exit after %1 ms, killing").arg(m_config.stopGraceMs));
            m_process->kill();
        }
    });
}

PlayerProcessManager::~PlayerProcessManager()
{
    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->terminate();
            if (!m_process->waitForFinished(m_config.stopGraceMs))
                m_process->kill();
            m_process->waitForFinished(1000);
        }
        delete m_process;
        m_process = nullptr;
    }
}

qint64 PlayerProcessManager::processId() const
{
    return m_process ? m_process->processId() : 0;
}

// ═════════════════════════════════════════════════════════════════════
//  Launch
// ═════════════════════════════════════════════════════════════════════

std::optional<PlaybackError> PlayerProcessManager::fail(const PlaybackError& error)
{
    DiagnosticLog::instance()->warn(kTag, error.description());
    emit errorOccurred(error);
    return error;
}

void PlayerProcessManager::clearTerminatingProcess()
{
    if (!m_process)
        return;

    QProcess* old = m_process;
    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Waiting for previous player (pid %1) to exit").arg(old->processId()));

    old->disconnect(this);
    if (old->state() != QProcess::NotRunning && !old->waitForFinished(m_config.stopGraceMs)) {
        old->kill();
        old->waitForFinished(1000);
    }
    m_killTimer->stop();
    m_process = nullptr;
    m_stdoutBuffer.clear();
    old->deleteLater();

    if (m_isRunning) {
        m_isRunning = false;
        emit runningChanged(false);
    }
}

std::optional<PlaybackError> PlayerProcessManager::ensureRunning(const QString& accessToken,
                                                                 const QUrl& backendBaseUrl)
{
    if (accessToken.isEmpty())
        return fail(PlaybackError::noAccessCredential());

    if (m_process && m_isRunning && !m_killTimer->isActive()
        && m_process->state() == QProcess::Running) {
        DiagnosticLog::instance()->log(kTag,
            QStringLiteral("Reusing running player (pid %1)").arg(m_process->processId()));
        return std::nullopt;
    }

    // A handle left over from stop() or a crash must be gone first
    clearTerminatingProcess();

    QString program;
    QStringList arguments;
    QString workingDir;

    if (m_config.mode == PlayerLaunchMode::Dev) {
        QFileInfo repo(m_config.devRepoPath);
        if (m_config.devRepoPath.isEmpty() || !repo.exists() || !repo.isDir())
            return fail(PlaybackError::invalidPath(m_config.devRepoPath));
        program = m_config.devProgram;
        arguments = m_config.devArguments;
        workingDir = repo.absoluteFilePath();
    } else {
        program = HelperLocator::locate(m_config.helperName, m_config.helperSearchPaths);
        if (program.isEmpty())
            return fail(PlaybackError::helperNotFound(m_config.helperName));
        workingDir = QFileInfo(program).absolutePath();
    }

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("SPOTIFY_ACCESS_TOKEN"), accessToken);
    env.insert(QStringLiteral("ELECTRIC_SLIDESHOW_MODE"), QStringLiteral("internal-player"));
    if (backendBaseUrl.isValid() && !backendBaseUrl.isEmpty())
        env.insert(QStringLiteral("ELECTRIC_BACKEND_BASE_URL"), backendBaseUrl.toString());

    auto* proc = new QProcess(this);
    proc->setProgram(program);
    proc->setArguments(arguments);
    proc->setWorkingDirectory(workingDir);
    proc->setProcessEnvironment(env);

    connect(proc, &QProcess::readyReadStandardOutput, this, [this, proc]() {
        onReadyReadStdout(proc);
    });
    connect(proc, &QProcess::readyReadStandardError, this, [this, proc]() {
        onReadyReadStderr(proc);
    });
    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [this, proc](int exitCode, QProcess::ExitStatus status) {
        onProcessFinished(proc, exitCode, status);
    });
    connect(proc, &QProcess::errorOccurred, this, [this, proc](QProcess::ProcessError error) {
        onProcessError(proc, error);
    });

    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Launching (%1): %2 %3 in %4")
            .arg(launchModeName(m_config.mode), program, arguments.join(QLatin1Char(' ')), workingDir));
    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Access token %1").arg(DiagnosticLog::redact(accessToken)));

    m_process = proc;
    proc->start();
    if (!proc->waitForStarted(m_config.startTimeoutMs)) {
        const QString reason = proc->errorString();
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
        m_process = nullptr;
        proc->deleteLater();
        return fail(PlaybackError::launchFailed(reason));
    }

    m_isRunning = true;
    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Player started (pid %1)").arg(proc->processId()));
    emit runningChanged(true);
    emit processLaunched(proc->processId());
    return std::nullopt;
}

// ═════════════════════════════════════════════════════════════════════
//  Stop
// ═════════════════════════════════════════════════════════════════════

void PlayerProcessManager::stop()
{
    if (!m_process) {
        qDebug() << "[PlayerProcess] stop(): no process";
        return;
    }

    if (m_process->state() == QProcess::NotRunning) {
        releaseProcess(m_process, m_process->exitCode());
        return;
    }

    if (m_killTimer->isActive())
        return;  // already terminating

    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Terminating player (pid %1)").arg(m_process->processId()));
    m_process->closeWriteChannel();
    m_process->terminate();
    m_killTimer->start(m_config.stopGraceMs);
}

// ═════════════════════════════════════════════════════════════════════
//  Process signals
// ═════════════════════════════════════════════════════════════════════

void PlayerProcessManager::releaseProcess(QProcess* proc, int exitCode)
{
    if (proc != m_process) {
        proc->deleteLater();
        return;
    }

    m_killTimer->stop();
    m_process = nullptr;
    m_stdoutBuffer.clear();
    proc->disconnect(this);
    proc->deleteLater();

    if (m_isRunning) {
        m_isRunning = false;
        emit runningChanged(false);
        emit processExited(exitCode);
    }
}

void PlayerProcessManager::onProcessFinished(QProcess* proc, int exitCode, QProcess::ExitStatus status)
{
    if (proc != m_process) {
        qDebug() << "[PlayerProcess] Ignoring exit of stale process";
        proc->deleteLater();
        return;
    }

    // Flush a trailing line that had no newline
    onReadyReadStdout(proc);
    if (!m_stdoutBuffer.trimmed().isEmpty()) {
        emit messageReceived(m_stdoutBuffer.trimmed());
        m_stdoutBuffer.clear();
    }

    DiagnosticLog::instance()->log(kTag,
        QStringLiteral("Player exited with code %1 (%2)")
            .arg(exitCode)
            .arg(status == QProcess::CrashExit ? QStringLiteral("crash") : QStringLiteral("normal")));
    releaseProcess(proc, exitCode);
}

void PlayerProcessManager::onProcessError(QProcess* proc, QProcess::ProcessError error)
{
    if (proc != m_process)
        return;

    // FailedToStart is reported by ensureRunning() itself; Crashed is
    // followed by finished()
    if (error == QProcess::FailedToStart || error == QProcess::Crashed)
        return;

    DiagnosticLog::instance()->warn(kTag,
        QStringLiteral("Process error %1: %2").arg(static_cast<int>(error)).arg(proc->errorString()));
}

void PlayerProcessManager::onReadyReadStdout(QProcess* proc)
{
    if (proc != m_process)
        return;

    m_stdoutBuffer.append(proc->readAllStandardOutput());
    int newline;
    while ((newline = m_stdoutBuffer.indexOf('\n')) >= 0) {
        QByteArray line = m_stdoutBuffer.left(newline).trimmed();
        m_stdoutBuffer.remove(0, newline + 1);
        if (!line.isEmpty())
            emit messageReceived(line);
    }
}

void PlayerProcessManager::onReadyReadStderr(QProcess* proc)
{
    if (proc != m_process)
        return;

    const QList<QByteArray> lines = proc->readAllStandardError().split('\n');
    for (const QByteArray& line : lines) {
        if (!line.trimmed().isEmpty())
            qDebug().noquote() << "[PlayerProcess] stderr:" << QString::fromUtf8(line.trimmed());
    }
}

// ═════════════════════════════════════════════════════════════════════
//  Transport
// ═════════════════════════════════════════════════════════════════════

bool PlayerProcessManager::writeMessage(const QByteArray& message)
{
    if (!m_process || m_process->state() != QProcess::Running || m_killTimer->isActive())
        return false;

    QByteArray framed = message;
    framed.append('\n');
    return m_process->write(framed) == framed.size();
}
