#pragma once

#include <QObject>
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QUrl>
#include <QUrlQuery>

#include "ISpotifyWebApi.h"
#include "ITokenProvider.h"

class QNetworkReply;

// QNetworkAccessManager-backed Spotify Web API client.  Only the device
// list and the player endpoints used by the playback backends are wired.
class SpotifyWebApiClient : public QObject, public ISpotifyWebApi
{
    Q_OBJECT

public:
    SpotifyWebApiClient(ITokenProvider* tokenProvider,
                        const QUrl& apiBaseUrl = QUrl(QStringLiteral("https://api.spotify.com/v1")),
                        QObject* parent = nullptr);
    ~SpotifyWebApiClient() override;

    // When set, the device list is fetched from this backend proxy instead
    // of {apiBase}/me/player/devices.
    void setDevicesProxyUrl(const QUrl& url) { m_devicesProxyUrl = url; }
    QUrl devicesProxyUrl() const { return m_devicesProxyUrl; }
    QUrl apiBaseUrl() const { return m_apiBaseUrl; }

    // ── ISpotifyWebApi ───────────────────────────────────────────────
    void listDevices(DevicesCallback callback) override;
    void startPlayback(const QString& trackUri, const QString& deviceId,
                       std::optional<int> startPositionMs,
                       CompletionCallback callback) override;
    void pausePlayback(const QString& deviceId, CompletionCallback callback) override;
    void resumePlayback(const QString& deviceId, CompletionCallback callback) override;
    void seek(int positionMs, const QString& deviceId, CompletionCallback callback) override;
    void setVolume(int volumePercent, const QString& deviceId, CompletionCallback callback) override;
    void skipNext(const QString& deviceId, CompletionCallback callback) override;
    void skipPrevious(const QString& deviceId, CompletionCallback callback) override;
    void setShuffle(bool enabled, const QString& deviceId, CompletionCallback callback) override;
    void setRepeat(RepeatMode mode, const QString& deviceId, CompletionCallback callback) override;

    // ── Parsing helpers (public for tests) ───────────────────────────
    // Accepts {"devices":[...]} and the proxy envelope {"data":{"devices":[...]}}
    static std::optional<QVector<RemoteDevice>> parseDevices(const QByteArray& json,
                                                             QString* errorMessage = nullptr);
    // {"error":{"status":404,"message":"...","reason":"NO_ACTIVE_DEVICE"}}
    static PlaybackError parseApiError(int httpStatus, const QByteArray& body);

    QUrl playerEndpoint(const QString& path, const QUrlQuery& query) const;

private:
    void sendPlayerRequest(const QByteArray& verb,
                           const QString& path,
                           const QUrlQuery& query,
                           const QByteArray& body,
                           CompletionCallback callback);
    static QUrlQuery deviceQuery(const QString& deviceId);

    ITokenProvider* m_tokenProvider;
    QNetworkAccessManager* m_networkManager = nullptr;
    QUrl m_apiBaseUrl;
    QUrl m_devicesProxyUrl;
};
