#pragma once

#include <QList>
#include <QUrl>
#include <functional>

#include "ControlChannel.h"
#include "DeviceDiscoveryPoller.h"
#include "PlayerLaunchConfig.h"
#include "PlayerProcessManager.h"
#include "PlayerReadinessStateMachine.h"
#include "../playback/PlaybackBackend.h"
#include "../spotify/ISpotifyWebApi.h"
#include "../spotify/ITokenProvider.h"

// Plays through the app's own Spotify Connect device: a player process we
// launch and supervise.  Track starts go through the Web API against that
// device; transport commands go straight down the control channel.
class InternalPlaybackBackend : public PlaybackBackend {
    Q_OBJECT

public:
    InternalPlaybackBackend(ITokenProvider* tokenProvider,
                            ISpotifyWebApi* api,
                            const PlayerLaunchConfig& config,
                            const QUrl& backendBaseUrl = QUrl(),
                            QObject* parent = nullptr);
    ~InternalPlaybackBackend() override;

    Kind kind() const override { return Kind::Internal; }
    bool isReady() const override { return m_readiness->isReady(); }
    bool requiresExternalApp() const override { return false; }

    void initialize() override;
    void playTrack(const QString& trackUri, std::optional<int> startPositionMs = std::nullopt) override;
    void pause() override;
    void resume() override;
    void nextTrack() override;
    void previousTrack() override;
    void seek(int positionMs) override;
    void setVolume(double volume) override;
    void setShuffleEnabled(bool enabled) override;
    void setRepeatMode(RepeatMode mode) override;

    // Cancels discovery, pauses best-effort and terminates the player
    void stop() override;

    QString deviceId() const { return m_readiness->deviceId(); }
    PlayerReadinessStateMachine::BackendReadiness readiness() const { return m_readiness->readiness(); }
    PlaybackState currentState() const { return m_state; }

    // Human-readable stage for "still starting" UI
    QString statusDescription() const;

    PlayerProcessManager* processManager() const { return m_process; }
    ControlChannel* channel() const { return m_channel; }
    PlayerReadinessStateMachine* readinessMachine() const { return m_readiness; }
    DeviceDiscoveryPoller* discoveryPoller() const { return m_poller; }

private:
    using DeviceCommand = std::function<void(const QString& deviceId, bool retried)>;

    void connectStateMachine();
    void launchWithToken(const QString& token);
    void requestCredential();
    void handleEvent(const ControlEvent& event);
    void handleProcessExited(int exitCode);

    bool ensureReady(const char* command);
    void runDeviceCommand(const QString& action, DeviceCommand command);
    void rediscoverThen(const QString& action, DeviceCommand command);
    ISpotifyWebApi::CompletionCallback deviceCompletion(const QString& action,
                                                        DeviceCommand retry,
                                                        bool retried);
    ISpotifyWebApi::CompletionCallback reportFailure(const QString& action);

    ITokenProvider* m_tokenProvider;
    ISpotifyWebApi* m_api;
    PlayerLaunchConfig m_config;
    QUrl m_backendBaseUrl;

    PlayerProcessManager* m_process = nullptr;
    ControlChannel* m_channel = nullptr;
    PlayerReadinessStateMachine* m_readiness = nullptr;
    DeviceDiscoveryPoller* m_poller = nullptr;

    PlaybackState m_state;
    int m_initGeneration = 0;   // drops token callbacks from a stopped attempt

    // Device commands waiting on a re-run of discovery, retried in order
    struct PendingDeviceCommand { QString action; DeviceCommand command; };
    QList<PendingDeviceCommand> m_pendingDeviceCommands;
    bool m_rediscovering = false;
};
