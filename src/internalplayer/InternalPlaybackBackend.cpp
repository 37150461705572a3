#include "InternalPlaybackBackend.h"
#include "../core/DiagnosticLog.h"

#include <QDebug>
#include <QPointer>
#include <utility>

namespace {
const QString kTag = QStringLiteral("InternalBackend");
}

// ═════════════════════════════════════════════════════════════════════
//  Construction
// ═════════════════════════════════════════════════════════════════════

InternalPlaybackBackend::InternalPlaybackBackend(ITokenProvider* tokenProvider,
                                                 ISpotifyWebApi* api,
                                                 const PlayerLaunchConfig& config,
                                                 const QUrl& backendBaseUrl,
                                                 QObject* parent)
    : PlaybackBackend(parent)
    , m_tokenProvider(tokenProvider)
    , m_api(api)
    , m_config(config)
    , m_backendBaseUrl(backendBaseUrl)
{
    m_process = new PlayerProcessManager(m_config, this);
    m_channel = new ControlChannel(m_process, this);
    m_readiness = new PlayerReadinessStateMachine(this);
    m_poller = new DeviceDiscoveryPoller(m_api, m_config.deviceName, this);

    connect(m_process, &PlayerProcessManager::messageReceived,
            m_channel, &ControlChannel::handleIncoming);
    connect(m_process, &PlayerProcessManager::processExited,
            this, &InternalPlaybackBackend::handleProcessExited);

    connect(m_channel, &ControlChannel::eventReceived,
            this, &InternalPlaybackBackend::handleEvent);
    connect(m_channel, &ControlChannel::credentialSent,
            m_readiness, &PlayerReadinessStateMachine::onCredentialSent);
    connect(m_channel, &ControlChannel::errorOccurred,
            this, &PlaybackBackend::errorOccurred);

    connect(m_poller, &DeviceDiscoveryPoller::deviceFound, this,
            [this](const RemoteDevice& device, int) {
        if (m_rediscovering) {
            m_rediscovering = false;
            m_readiness->onDeviceRediscovered(device.id);
            const QList<PendingDeviceCommand> pending = std::exchange(m_pendingDeviceCommands, {});
            for (const auto& command : pending) {
                DiagnosticLog::instance()->log(kTag, QStringLiteral("Retrying %1 on %2")
                    .arg(command.action, device.id));
                command.command(device.id, true);
            }
            return;
        }
        m_readiness->onDeviceDiscovered(device.id);
    });
    connect(m_poller, &DeviceDiscoveryPoller::exhausted, this, [this]() {
        if (m_rediscovering) {
            m_rediscovering = false;
            // Every command that was waiting on the device fails on its own
            const QList<PendingDeviceCommand> pending = std::exchange(m_pendingDeviceCommands, {});
            for (const auto& command : pending) {
                DiagnosticLog::instance()->warn(kTag, QStringLiteral("%1 failed: device not found")
                    .arg(command.action));
                emit errorOccurred(PlaybackError::deviceNotFound(m_config.deviceName));
            }
            return;
        }
        m_readiness->onDiscoveryExhausted();
    });

    connectStateMachine();
}

InternalPlaybackBackend::~InternalPlaybackBackend()
{
    m_poller->cancel();
}

void InternalPlaybackBackend::connectStateMachine()
{
    connect(m_readiness, &PlayerReadinessStateMachine::startProcessRequested, this, [this]() {
        const int generation = ++m_initGeneration;
        QPointer<InternalPlaybackBackend> self(this);
        m_tokenProvider->fetchAccessToken([self, generation](const QString& token,
                                                             const std::optional<PlaybackError>& error) {
            if (!self || generation != self->m_initGeneration)
                return;
            if (error) {
                self->m_readiness->onProcessFailed(*error);
                return;
            }
            self->launchWithToken(token);
        });
    });

    connect(m_readiness, &PlayerReadinessStateMachine::loadContentRequested, this, [this]() {
        // A failed write means the pipe is gone; the exit handler takes over
        m_channel->loadContent(m_config.contentUrl);
    });

    connect(m_readiness, &PlayerReadinessStateMachine::credentialRequested,
            this, &InternalPlaybackBackend::requestCredential);

    connect(m_readiness, &PlayerReadinessStateMachine::connectRequested, this, [this]() {
        m_channel->connectDevice();
    });

    connect(m_readiness, &PlayerReadinessStateMachine::discoveryRequested, this, [this]() {
        m_poller->start();
    });

    connect(m_readiness, &PlayerReadinessStateMachine::readinessChanged, this,
            [this](PlayerReadinessStateMachine::BackendReadiness readiness) {
        // First confirmation wins; a running poll is no longer needed
        if (readiness == PlayerReadinessStateMachine::BackendReadiness::Ready && !m_rediscovering)
            m_poller->cancel();
    });

    connect(m_readiness, &PlayerReadinessStateMachine::readyChanged,
            this, &PlaybackBackend::readyChanged);
    connect(m_readiness, &PlayerReadinessStateMachine::failed,
            this, &PlaybackBackend::errorOccurred);
}

// ═════════════════════════════════════════════════════════════════════
//  Startup sequence
// ═════════════════════════════════════════════════════════════════════

void InternalPlaybackBackend::initialize()
{
    if (!m_tokenProvider) {
        emit errorOccurred(PlaybackError::noAccessCredential());
        return;
    }
    DiagnosticLog::instance()->log(kTag, QStringLiteral("initialize() in %1")
        .arg(PlayerReadinessStateMachine::readinessName(m_readiness->readiness())));
    m_readiness->start();
}

void InternalPlaybackBackend::launchWithToken(const QString& token)
{
    if (auto error = m_process->ensureRunning(token, m_backendBaseUrl)) {
        m_readiness->onProcessFailed(*error);
        return;
    }

    const bool contentLoaded = m_channel->isContentLoaded();
    if (!contentLoaded)
        m_channel->sendCredential(token);   // held until ContentLoaded
    m_readiness->onProcessStarted(contentLoaded);
}

void InternalPlaybackBackend::requestCredential()
{
    // The channel flushes its buffered token right after ContentLoaded
    if (m_channel->hasPendingCredential())
        return;

    const int generation = m_initGeneration;
    QPointer<InternalPlaybackBackend> self(this);
    m_tokenProvider->fetchAccessToken([self, generation](const QString& token,
                                                         const std::optional<PlaybackError>& error) {
        if (!self || generation != self->m_initGeneration)
            return;
        if (error) {
            self->m_readiness->onProcessFailed(*error);
            return;
        }
        self->m_channel->sendCredential(token);
    });
}

void InternalPlaybackBackend::handleEvent(const ControlEvent& event)
{
    switch (event.type) {
    case ControlEvent::Type::Ready:
        m_readiness->onDeviceReady(event.deviceId);
        break;

    case ControlEvent::Type::StateChanged:
        m_state = event.state;
        emit stateChanged(m_state);
        break;

    case ControlEvent::Type::Error: {
        const PlaybackError error = PlaybackError::backend(
            event.message.isEmpty() ? QStringLiteral("Unknown internal player error") : event.message);
        m_readiness->onPlayerError(error);
        emit errorOccurred(error);
        break;
    }

    case ControlEvent::Type::ContentLoaded:
        m_readiness->onContentLoaded();
        break;

    case ControlEvent::Type::CredentialAck:
        m_readiness->onCredentialAcknowledged();
        break;

    case ControlEvent::Type::NotReady:
        m_readiness->onDeviceNotReady(event.deviceId);
        break;

    case ControlEvent::Type::ConnectResult:
        m_readiness->onConnectResult(event.ok);
        break;

    case ControlEvent::Type::Unknown:
        break;
    }
}

void InternalPlaybackBackend::handleProcessExited(int exitCode)
{
    DiagnosticLog::instance()->log(kTag, QStringLiteral("Player process exited (%1)").arg(exitCode));
    m_poller->cancel();
    m_rediscovering = false;
    m_pendingDeviceCommands.clear();
    m_channel->reset();
    m_readiness->onProcessExited();

    if (!m_state.isIdle()) {
        m_state = PlaybackState::idle();
        emit stateChanged(m_state);
    }
}

void InternalPlaybackBackend::stop()
{
    DiagnosticLog::instance()->log(kTag, QStringLiteral("stop()"));
    ++m_initGeneration;
    m_poller->cancel();
    m_rediscovering = false;
    m_pendingDeviceCommands.clear();

    if (m_process->isRunning() && m_channel->isContentLoaded())
        m_channel->pause();

    m_process->stop();
    m_channel->reset();
    m_readiness->reset();
}

QString InternalPlaybackBackend::statusDescription() const
{
    using R = PlayerReadinessStateMachine::BackendReadiness;
    switch (m_readiness->readiness()) {
    case R::Uninitialized:     return QStringLiteral("Internal player not started");
    case R::ProcessStarting:   return QStringLiteral("Player starting up… (launching process)");
    case R::ContentLoading:    return QStringLiteral("Player starting up… (loading player)");
    case R::CredentialPending: return QStringLiteral("Player starting up… (sending credentials)");
    case R::ConnectingDevice:  return QStringLiteral("Player starting up… (connecting device)");
    case R::DiscoveringDevice: return QStringLiteral("Player starting up… (looking for device)");
    case R::Ready:             return QStringLiteral("Ready");
    case R::Degraded:
        if (auto error = m_readiness->lastError())
            return error->description();
        return QStringLiteral("Internal player unavailable");
    }
    return QString();
}

// ═════════════════════════════════════════════════════════════════════
//  Commands
// ═════════════════════════════════════════════════════════════════════

bool InternalPlaybackBackend::ensureReady(const char* command)
{
    if (m_readiness->canAcceptCommands())
        return true;
    qDebug() << "[InternalBackend]" << command << "called but player not ready yet ("
             << PlayerReadinessStateMachine::readinessName(m_readiness->readiness()) << ")";
    emit errorOccurred(PlaybackError::notReady());
    return false;
}

ISpotifyWebApi::CompletionCallback InternalPlaybackBackend::reportFailure(const QString& action)
{
    QPointer<InternalPlaybackBackend> self(this);
    return [self, action](const std::optional<PlaybackError>& error) {
        if (!self || !error) return;
        qWarning() << "[InternalBackend]" << action << "failed:" << error->description();
        emit self->errorOccurred(*error);
    };
}

ISpotifyWebApi::CompletionCallback InternalPlaybackBackend::deviceCompletion(const QString& action,
                                                                            DeviceCommand retry,
                                                                            bool retried)
{
    QPointer<InternalPlaybackBackend> self(this);
    return [self, action, retry, retried](const std::optional<PlaybackError>& error) {
        if (!self || !error) return;
        if (error->kind == PlaybackError::Kind::RemoteApi && error->statusCode == 404 && !retried) {
            DiagnosticLog::instance()->warn(kTag, QStringLiteral("%1 rejected for device %2, re-discovering")
                .arg(action, self->deviceId()));
            self->rediscoverThen(action, retry);
            return;
        }
        qWarning() << "[InternalBackend]" << action << "failed:" << error->description();
        emit self->errorOccurred(*error);
    };
}

void InternalPlaybackBackend::rediscoverThen(const QString& action, DeviceCommand command)
{
    m_pendingDeviceCommands.append(PendingDeviceCommand{ action, std::move(command) });
    if (m_rediscovering)
        return;   // joins the poll already in flight

    // Fresh attempt budget for the re-discovery
    m_rediscovering = true;
    m_poller->cancel();
    m_poller->start();
}

void InternalPlaybackBackend::runDeviceCommand(const QString& action, DeviceCommand command)
{
    const QString id = m_readiness->deviceId();
    if (id.isEmpty()) {
        DiagnosticLog::instance()->warn(kTag, QStringLiteral("%1: missing device id, re-discovering").arg(action));
        rediscoverThen(action, std::move(command));
        return;
    }
    command(id, false);
}

void InternalPlaybackBackend::playTrack(const QString& trackUri, std::optional<int> startPositionMs)
{
    if (!ensureReady("playTrack"))
        return;

    QPointer<InternalPlaybackBackend> self(this);
    DeviceCommand command = [self, trackUri, startPositionMs](const QString& deviceId, bool retried) {
        if (!self) return;
        DiagnosticLog::instance()->log(kTag, QStringLiteral("startPlayback %1 on device %2")
            .arg(trackUri, deviceId));
        DeviceCommand again = [self, trackUri, startPositionMs](const QString& id, bool) {
            if (!self) return;
            self->m_api->startPlayback(trackUri, id, startPositionMs,
                                       self->reportFailure(QStringLiteral("play")));
        };
        self->m_api->startPlayback(trackUri, deviceId, startPositionMs,
                                   self->deviceCompletion(QStringLiteral("play"), again, retried));
    };
    runDeviceCommand(QStringLiteral("play"), command);
}

void InternalPlaybackBackend::resume()
{
    if (!ensureReady("resume"))
        return;

    QPointer<InternalPlaybackBackend> self(this);
    DeviceCommand command = [self](const QString& deviceId, bool retried) {
        if (!self) return;
        DeviceCommand again = [self](const QString& id, bool) {
            if (!self) return;
            self->m_api->resumePlayback(id, self->reportFailure(QStringLiteral("resume")));
        };
        self->m_api->resumePlayback(deviceId,
                                    self->deviceCompletion(QStringLiteral("resume"), again, retried));
    };
    runDeviceCommand(QStringLiteral("resume"), command);
}

void InternalPlaybackBackend::pause()
{
    if (!ensureReady("pause"))
        return;
    m_channel->pause();
}

void InternalPlaybackBackend::nextTrack()
{
    if (!ensureReady("nextTrack"))
        return;
    m_channel->next();
}

void InternalPlaybackBackend::previousTrack()
{
    if (!ensureReady("previousTrack"))
        return;
    m_channel->previous();
}

void InternalPlaybackBackend::seek(int positionMs)
{
    if (!ensureReady("seek"))
        return;
    m_channel->seek(positionMs);
}

void InternalPlaybackBackend::setVolume(double volume)
{
    if (!ensureReady("setVolume"))
        return;
    m_channel->setVolume(volume);
}

void InternalPlaybackBackend::setShuffleEnabled(bool enabled)
{
    if (!ensureReady("setShuffleEnabled"))
        return;
    m_api->setShuffle(enabled, m_readiness->deviceId(), reportFailure(QStringLiteral("shuffle")));
}

void InternalPlaybackBackend::setRepeatMode(RepeatMode mode)
{
    if (!ensureReady("setRepeatMode"))
        return;
    m_api->setRepeat(mode, m_readiness->deviceId(), reportFailure(QStringLiteral("repeat")));
}
