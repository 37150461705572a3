#pragma once

#include "PlaybackBackend.h"

// Placeholder used before a real backend is chosen.  Always ready; every
// command only re-announces the idle state.
class NoopPlaybackBackend : public PlaybackBackend {
    Q_OBJECT

public:
    explicit NoopPlaybackBackend(QObject* parent = nullptr);

    Kind kind() const override { return Kind::Noop; }
    bool isReady() const override { return true; }
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

private:
    void emitIdle();
};
