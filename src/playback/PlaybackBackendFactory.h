#pragma once

#include <QObject>
#include <QPointer>
#include <QUrl>
#include <memory>

#include "PlaybackBackend.h"
#include "../internalplayer/PlayerLaunchConfig.h"
#include "../spotify/ISpotifyWebApi.h"
#include "../spotify/ITokenProvider.h"

class ExternalDevicePlaybackBackend;
class InternalPlaybackBackend;
class NoopPlaybackBackend;
class SpotifyWebApiClient;

enum class PlaybackBackendMode { ExternalDevice, InternalPlayer };

QString playbackBackendModeName(PlaybackBackendMode mode);
// "internal" / "external"; anything else yields std::nullopt
std::optional<PlaybackBackendMode> parsePlaybackBackendMode(const QString& name);

// Decides which playback backend the app talks to.  Constructed once at
// startup and handed to whoever needs a backend; the internal backend is
// created at most once per factory and reused.
class PlaybackBackendFactory : public QObject {
    Q_OBJECT

public:
    static constexpr PlaybackBackendMode kDefaultMode = PlaybackBackendMode::InternalPlayer;

    // api may be null; a SpotifyWebApiClient is then created on first use
    PlaybackBackendFactory(const PlayerLaunchConfig& launchConfig,
                           const QUrl& backendBaseUrl = QUrl(),
                           ISpotifyWebApi* api = nullptr,
                           QObject* parent = nullptr);
    ~PlaybackBackendFactory() override;

    void setWebApiBaseUrl(const QUrl& url) { m_webApiBaseUrl = url; }
    void setDevicesProxyUrl(const QUrl& url) { m_devicesProxyUrl = url; }

    // nullptr without a token provider.  One backend per mode is created
    // and reused; all are owned by the factory.
    PlaybackBackend* makeBackend(PlaybackBackendMode mode, ITokenProvider* tokenProvider);

    // Creates (if needed) and initializes the internal backend so the player
    // is up before playback is requested.  Calling it again while a backend
    // is cached returns that backend untouched.
    PlaybackBackend* prewarmBackend(ITokenProvider* tokenProvider);

    PlaybackBackend* noopBackend();

    InternalPlaybackBackend* cachedInternalBackend() const { return m_internalBackend; }

private:
    ISpotifyWebApi* webApiFor(ITokenProvider* tokenProvider);
    InternalPlaybackBackend* internalBackend(ITokenProvider* tokenProvider);

    PlayerLaunchConfig m_launchConfig;
    QUrl m_backendBaseUrl;
    QUrl m_webApiBaseUrl = QUrl(QStringLiteral("https://api.spotify.com/v1"));
    QUrl m_devicesProxyUrl;

    ISpotifyWebApi* m_api = nullptr;
    SpotifyWebApiClient* m_ownedApi = nullptr;
    InternalPlaybackBackend* m_internalBackend = nullptr;
    ExternalDevicePlaybackBackend* m_externalBackend = nullptr;
    NoopPlaybackBackend* m_noopBackend = nullptr;
};
