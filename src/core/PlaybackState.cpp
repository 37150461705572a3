#include "PlaybackState.h"

bool PlaybackState::operator==(const PlaybackState& other) const
{
    return trackUri == other.trackUri
        && trackName == other.trackName
        && artistName == other.artistName
        && positionMs == other.positionMs
        && durationMs == other.durationMs
        && isPlaying == other.isPlaying
        && isBuffering == other.isBuffering;
}

QString repeatModeToApiString(RepeatMode mode)
{
    switch (mode) {
    case RepeatMode::Track:   return QStringLiteral("track");
    case RepeatMode::Context: return QStringLiteral("context");
    case RepeatMode::Off:     break;
    }
    return QStringLiteral("off");
}

// ── describePlaybackState: one-line summary for logs and the CLI ───
QString describePlaybackState(const PlaybackState& state)
{
    if (!state.trackUri)
        return QStringLiteral("idle");

    QString title = state.trackName.value_or(*state.trackUri);
    if (state.artistName)
        title += QStringLiteral(" - ") + *state.artistName;

    return QStringLiteral("%1 [%2] %3/%4 s%5")
        .arg(title,
             state.isPlaying ? QStringLiteral("playing") : QStringLiteral("paused"))
        .arg(state.positionMs / 1000)
        .arg(state.durationMs / 1000)
        .arg(state.isBuffering ? QStringLiteral(" (buffering)") : QString());
}
