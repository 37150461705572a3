#pragma once

#include <QObject>
#include <QString>
#include <optional>

#include "../core/PlaybackError.h"
#include "../core/PlaybackState.h"

// Common surface of every music playback backend.  Commands are fire and
// forget; outcomes arrive through the signals.
class PlaybackBackend : public QObject {
    Q_OBJECT

public:
    enum class Kind { Internal, ExternalDevice, Noop };
    Q_ENUM(Kind)

    explicit PlaybackBackend(QObject* parent = nullptr) : QObject(parent)
    {
        qRegisterMetaType<PlaybackState>("PlaybackState");
        qRegisterMetaType<PlaybackError>("PlaybackError");
    }
    ~PlaybackBackend() override = default;

    virtual Kind kind() const = 0;
    virtual bool isReady() const = 0;

    // True when playback happens in another application (the Spotify app
    // or a remote Connect device) that the user must have running
    virtual bool requiresExternalApp() const = 0;

    virtual void initialize() = 0;

    virtual void playTrack(const QString& trackUri,
                           std::optional<int> startPositionMs = std::nullopt) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void nextTrack() = 0;
    virtual void previousTrack() = 0;
    virtual void seek(int positionMs) = 0;
    virtual void setVolume(double volume) = 0;    // 0.0 .. 1.0
    virtual void setShuffleEnabled(bool enabled) = 0;
    virtual void setRepeatMode(RepeatMode mode) = 0;

    // Release everything the backend started; a later initialize() starts over
    virtual void stop() {}

signals:
    void stateChanged(const PlaybackState& state);
    void errorOccurred(const PlaybackError& error);
    void readyChanged(bool ready);
};
