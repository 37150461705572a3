#include "PlaybackBackendFactory.h"
#include "ExternalDevicePlaybackBackend.h"
#include "NoopPlaybackBackend.h"
#include "../core/DiagnosticLog.h"
#include "../internalplayer/InternalPlaybackBackend.h"
#include "../spotify/SpotifyWebApiClient.h"

#include <QDebug>

namespace {
const QString kTag = QStringLiteral("PlaybackBackendFactory");
}

QString playbackBackendModeName(PlaybackBackendMode mode)
{
    return mode == PlaybackBackendMode::InternalPlayer ? QStringLiteral("internal")
                                                       : QStringLiteral("external");
}

std::optional<PlaybackBackendMode> parsePlaybackBackendMode(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("internal"))
        return PlaybackBackendMode::InternalPlayer;
    if (n == QLatin1String("external"))
        return PlaybackBackendMode::ExternalDevice;
    return std::nullopt;
}

PlaybackBackendFactory::PlaybackBackendFactory(const PlayerLaunchConfig& launchConfig,
                                               const QUrl& backendBaseUrl,
                                               ISpotifyWebApi* api,
                                               QObject* parent)
    : QObject(parent)
    , m_launchConfig(launchConfig)
    , m_backendBaseUrl(backendBaseUrl)
    , m_api(api)
{
}

PlaybackBackendFactory::~PlaybackBackendFactory()
{
    // Backends hold raw pointers to the Web API client; tear them down first
    delete m_internalBackend;
    m_internalBackend = nullptr;
}

ISpotifyWebApi* PlaybackBackendFactory::webApiFor(ITokenProvider* tokenProvider)
{
    if (m_api)
        return m_api;

    m_ownedApi = new SpotifyWebApiClient(tokenProvider, m_webApiBaseUrl, this);
    m_ownedApi->setDevicesProxyUrl(m_devicesProxyUrl);
    m_api = m_ownedApi;
    return m_api;
}

InternalPlaybackBackend* PlaybackBackendFactory::internalBackend(ITokenProvider* tokenProvider)
{
    if (m_internalBackend)
        return m_internalBackend;

    m_internalBackend = new InternalPlaybackBackend(tokenProvider, webApiFor(tokenProvider),
                                                    m_launchConfig, m_backendBaseUrl, this);
    return m_internalBackend;
}

PlaybackBackend* PlaybackBackendFactory::makeBackend(PlaybackBackendMode mode, ITokenProvider* tokenProvider)
{
    if (!tokenProvider) {
        qDebug() << "[PlaybackBackendFactory] No token provider, no backend";
        return nullptr;
    }

    switch (mode) {
    case PlaybackBackendMode::ExternalDevice:
        if (!m_externalBackend)
            m_externalBackend = new ExternalDevicePlaybackBackend(webApiFor(tokenProvider), this);
        return m_externalBackend;
    case PlaybackBackendMode::InternalPlayer:
        return internalBackend(tokenProvider);
    }
    return nullptr;
}

PlaybackBackend* PlaybackBackendFactory::prewarmBackend(ITokenProvider* tokenProvider)
{
    if (!tokenProvider)
        return nullptr;

    if (m_internalBackend) {
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Reusing cached internal backend instance"));
        return m_internalBackend;
    }

    DiagnosticLog::instance()->log(kTag, QStringLiteral("Creating new internal backend instance"));
    InternalPlaybackBackend* backend = internalBackend(tokenProvider);
    backend->initialize();
    return backend;
}

PlaybackBackend* PlaybackBackendFactory::noopBackend()
{
    if (!m_noopBackend)
        m_noopBackend = new NoopPlaybackBackend(this);
    return m_noopBackend;
}
