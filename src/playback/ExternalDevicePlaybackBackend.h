#pragma once

#include "PlaybackBackend.h"
#include "../spotify/ISpotifyWebApi.h"

// Drives whatever Spotify Connect device the user currently has active
// (desktop app, phone, speaker) through the Web API.
class ExternalDevicePlaybackBackend : public PlaybackBackend {
    Q_OBJECT

public:
    explicit ExternalDevicePlaybackBackend(ISpotifyWebApi* api, QObject* parent = nullptr);

    Kind kind() const override { return Kind::ExternalDevice; }
    bool isReady() const override { return m_ready; }
    bool requiresExternalApp() const override { return true; }

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

private:
    ISpotifyWebApi::CompletionCallback reportFailure(const QString& action);

    ISpotifyWebApi* m_api;
    bool m_ready = false;
};
