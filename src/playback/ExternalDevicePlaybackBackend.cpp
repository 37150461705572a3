#include "ExternalDevicePlaybackBackend.h"

#include <QDebug>
#include <QPointer>

ExternalDevicePlaybackBackend::ExternalDevicePlaybackBackend(ISpotifyWebApi* api, QObject* parent)
    : PlaybackBackend(parent)
    , m_api(api)
{
}

void ExternalDevicePlaybackBackend::initialize()
{
    // Nothing to start; the active device is whatever the user picked
    if (m_ready) return;
    m_ready = true;
    qDebug() << "[ExternalBackend] Ready";
    emit readyChanged(true);
}

ISpotifyWebApi::CompletionCallback ExternalDevicePlaybackBackend::reportFailure(const QString& action)
{
    QPointer<ExternalDevicePlaybackBackend> self(this);
    return [self, action](const std::optional<PlaybackError>& error) {
        if (!self || !error) return;
        qWarning() << "[ExternalBackend]" << action << "failed:" << error->description();
        emit self->errorOccurred(*error);
    };
}

void ExternalDevicePlaybackBackend::playTrack(const QString& trackUri, std::optional<int> startPositionMs)
{
    qDebug() << "[ExternalBackend] playTrack" << trackUri << "at" << startPositionMs.value_or(0);
    m_api->startPlayback(trackUri, QString(), startPositionMs, reportFailure(QStringLiteral("play")));
}

void ExternalDevicePlaybackBackend::pause()
{
    m_api->pausePlayback(QString(), reportFailure(QStringLiteral("pause")));
}

void ExternalDevicePlaybackBackend::resume()
{
    m_api->resumePlayback(QString(), reportFailure(QStringLiteral("resume")));
}

void ExternalDevicePlaybackBackend::nextTrack()
{
    m_api->skipNext(QString(), reportFailure(QStringLiteral("next")));
}

void ExternalDevicePlaybackBackend::previousTrack()
{
    m_api->skipPrevious(QString(), reportFailure(QStringLiteral("previous")));
}

void ExternalDevicePlaybackBackend::seek(int positionMs)
{
    m_api->seek(qMax(0, positionMs), QString(), reportFailure(QStringLiteral("seek")));
}

void ExternalDevicePlaybackBackend::setVolume(double volume)
{
    const int percent = qRound(qBound(0.0, volume, 1.0) * 100.0);
    m_api->setVolume(percent, QString(), reportFailure(QStringLiteral("setVolume")));
}

void ExternalDevicePlaybackBackend::setShuffleEnabled(bool enabled)
{
    m_api->setShuffle(enabled, QString(), reportFailure(QStringLiteral("shuffle")));
}

void ExternalDevicePlaybackBackend::setRepeatMode(RepeatMode mode)
{
    m_api->setRepeat(mode, QString(), reportFailure(QStringLiteral("repeat")));
}
