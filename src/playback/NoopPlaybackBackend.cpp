#include "NoopPlaybackBackend.h"

#include <QDebug>

NoopPlaybackBackend::NoopPlaybackBackend(QObject* parent)
    : PlaybackBackend(parent)
{
}

void NoopPlaybackBackend::emitIdle()
{
    emit stateChanged(PlaybackState::idle());
}

void NoopPlaybackBackend::initialize()
{
    emit readyChanged(true);
    emitIdle();
}

void NoopPlaybackBackend::playTrack(const QString& trackUri, std::optional<int>)
{
    qDebug() << "[NoopBackend] playTrack ignored:" << trackUri;
    emitIdle();
}

void NoopPlaybackBackend::pause()                  { emitIdle(); }
void NoopPlaybackBackend::resume()                 { emitIdle(); }
void NoopPlaybackBackend::nextTrack()              { emitIdle(); }
void NoopPlaybackBackend::previousTrack()          { emitIdle(); }
void NoopPlaybackBackend::seek(int)                { emitIdle(); }
void NoopPlaybackBackend::setVolume(double)        { emitIdle(); }
void NoopPlaybackBackend::setShuffleEnabled(bool)  { emitIdle(); }
void NoopPlaybackBackend::setRepeatMode(RepeatMode) { emitIdle(); }
