#pragma once

#include <QString>
#include <QMetaType>
#include <optional>

// Repeat modes understood by the Spotify Web API ("off", "track", "context").
enum class RepeatMode { Off, Track, Context };

// Normalized, backend-agnostic playback snapshot.  This is the only
// playback representation the rest of the app observes.
struct PlaybackState {
    std::optional<QString> trackUri;
    std::optional<QString> trackName;
    std::optional<QString> artistName;
    int  positionMs  = 0;
    int  durationMs  = 0;
    bool isPlaying   = false;
    bool isBuffering = false;

    // No active track; the default before anything is loaded
    static PlaybackState idle() { return PlaybackState(); }

    bool isIdle() const { return !trackUri && !isPlaying && positionMs == 0; }

    bool operator==(const PlaybackState& other) const;
    bool operator!=(const PlaybackState& other) const { return !(*this == other); }
};

QString repeatModeToApiString(RepeatMode mode);
QString describePlaybackState(const PlaybackState& state);

Q_DECLARE_METATYPE(PlaybackState)
