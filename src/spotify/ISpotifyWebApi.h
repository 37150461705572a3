#pragma once

#include <QString>
#include <QVector>
#include <functional>
#include <optional>

#include "RemoteDevice.h"
#include "../core/PlaybackError.h"
#include "../core/PlaybackState.h"

// The subset of the Spotify Web API the playback backends depend on.
// All calls are asynchronous; callbacks run on the caller's thread.
// An empty deviceId targets the user's currently active device.
class ISpotifyWebApi {
public:
    virtual ~ISpotifyWebApi() = default;

    using DevicesCallback = std::function<void(const QVector<RemoteDevice>& devices,
                                               const std::optional<PlaybackError>& error)>;
    using CompletionCallback = std::function<void(const std::optional<PlaybackError>& error)>;

    virtual void listDevices(DevicesCallback callback) = 0;

    virtual void startPlayback(const QString& trackUri, const QString& deviceId,
                               std::optional<int> startPositionMs,
                               CompletionCallback callback) = 0;
    virtual void pausePlayback(const QString& deviceId, CompletionCallback callback) = 0;
    virtual void resumePlayback(const QString& deviceId, CompletionCallback callback) = 0;
    virtual void seek(int positionMs, const QString& deviceId, CompletionCallback callback) = 0;
    virtual void setVolume(int volumePercent, const QString& deviceId, CompletionCallback callback) = 0;
    virtual void skipNext(const QString& deviceId, CompletionCallback callback) = 0;
    virtual void skipPrevious(const QString& deviceId, CompletionCallback callback) = 0;
    virtual void setShuffle(bool enabled, const QString& deviceId, CompletionCallback callback) = 0;
    virtual void setRepeat(RepeatMode mode, const QString& deviceId, CompletionCallback callback) = 0;
};
