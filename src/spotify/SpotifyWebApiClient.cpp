#include "SpotifyWebApiClient.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>

// ═══════════════════════════════════════════════════════════════════
//  Constructor / Destructor
// ═══════════════════════════════════════════════════════════════════

SpotifyWebApiClient::SpotifyWebApiClient(ITokenProvider* tokenProvider,
                                         const QUrl& apiBaseUrl,
                                         QObject* parent)
    : QObject(parent)
    , m_tokenProvider(tokenProvider)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_apiBaseUrl(apiBaseUrl)
{
    qRegisterMetaType<PlaybackError>("PlaybackError");
    qDebug() << "[SpotifyAPI] Initialized, base URL:" << m_apiBaseUrl.toString();
}

SpotifyWebApiClient::~SpotifyWebApiClient() = default;

// ═══════════════════════════════════════════════════════════════════
//  URL helpers
// ═══════════════════════════════════════════════════════════════════

QUrl SpotifyWebApiClient::playerEndpoint(const QString& path, const QUrlQuery& query) const
{
    QUrl url(m_apiBaseUrl);
    QString basePath = url.path();
    if (!basePath.endsWith(QLatin1Char('/')))
        basePath += QLatin1Char('/');
    url.setPath(basePath + path);
    if (!query.isEmpty())
        url.setQuery(query);
    return url;
}

QUrlQuery SpotifyWebApiClient::deviceQuery(const QString& deviceId)
{
    QUrlQuery query;
    if (!deviceId.isEmpty())
        query.addQueryItem(QStringLiteral("device_id"), deviceId);
    return query;
}

// ═══════════════════════════════════════════════════════════════════
//  Devices
// ═══════════════════════════════════════════════════════════════════

void SpotifyWebApiClient::listDevices(DevicesCallback callback)
{
    QPointer<SpotifyWebApiClient> self(this);
    m_tokenProvider->fetchAccessToken([self, callback](const QString& token,
                                                       const std::optional<PlaybackError>& tokenError) {
        if (!self) return;
        if (tokenError) {
            callback({}, tokenError);
            return;
        }

        QUrl url = self->m_devicesProxyUrl.isEmpty()
            ? self->playerEndpoint(QStringLiteral("me/player/devices"), QUrlQuery())
            : self->m_devicesProxyUrl;

        QNetworkRequest request(url);
        request.setRawHeader("Authorization", QStringLiteral("Bearer %1").arg(token).toUtf8());

        QNetworkReply* reply = self->m_networkManager->get(request);
        connect(reply, &QNetworkReply::finished, self.data(), [self, reply, callback]() {
            reply->deleteLater();

            const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            const QByteArray body = reply->readAll();

            if (httpStatus == 0 && reply->error() != QNetworkReply::NoError) {
                auto err = PlaybackError::networkFailure(reply->errorString());
                qWarning() << "[SpotifyAPI] Devices request failed:" << reply->errorString();
                callback({}, err);
                return;
            }

            if (httpStatus < 200 || httpStatus > 299) {
                auto err = parseApiError(httpStatus, body);
                qWarning() << "[SpotifyAPI] Devices request failed with" << httpStatus << ":" << err.message;
                callback({}, err);
                return;
            }

            QString parseMessage;
            auto devices = parseDevices(body, &parseMessage);
            if (!devices) {
                auto err = PlaybackError::remoteApi(httpStatus, parseMessage);
                qWarning() << "[SpotifyAPI] Failed to decode devices response:" << parseMessage;
                callback({}, err);
                return;
            }

            qDebug() << "[SpotifyAPI] Decoded" << devices->size() << "devices";
            callback(*devices, std::nullopt);
        });
    });
}

std::optional<QVector<RemoteDevice>> SpotifyWebApiClient::parseDevices(const QByteArray& json,
                                                                      QString* errorMessage)
{
    QJsonParseError parseErr;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage)
            *errorMessage = parseErr.error != QJsonParseError::NoError
                ? parseErr.errorString()
                : QStringLiteral("device list is not a JSON object");
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    QJsonValue devicesValue = root.value(QStringLiteral("devices"));
    if (!devicesValue.isArray())
        devicesValue = root.value(QStringLiteral("data")).toObject().value(QStringLiteral("devices"));
    if (!devicesValue.isArray()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("missing 'devices' array");
        return std::nullopt;
    }

    QVector<RemoteDevice> devices;
    const QJsonArray array = devicesValue.toArray();
    devices.reserve(array.size());
    for (const QJsonValue& v : array) {
        QJsonObject d = v.toObject();
        RemoteDevice device;
        // The proxy reports the addressable id separately for some devices
        device.id = d.value(QStringLiteral("device_id")).toString(
            d.value(QStringLiteral("id")).toString());
        device.name = d.value(QStringLiteral("name")).toString();
        device.type = d.value(QStringLiteral("type")).toString();
        device.isActive = d.value(QStringLiteral("is_active")).toBool(false);
        device.isRestricted = d.value(QStringLiteral("is_restricted")).toBool(false);
        QJsonValue volume = d.value(QStringLiteral("volume_percent"));
        if (volume.isDouble())
            device.volumePercent = volume.toInt();
        if (device.id.isEmpty())
            continue;
        devices.append(device);
    }
    return devices;
}

PlaybackError SpotifyWebApiClient::parseApiError(int httpStatus, const QByteArray& body)
{
    QJsonObject error = QJsonDocument::fromJson(body).object().value(QStringLiteral("error")).toObject();
    QString message = error.value(QStringLiteral("message")).toString();
    const QString reason = error.value(QStringLiteral("reason")).toString();

    if (message.isEmpty())
        message = body.isEmpty() ? QStringLiteral("(no body)") : QString::fromUtf8(body).left(200);
    if (reason == QStringLiteral("NO_ACTIVE_DEVICE"))
        message = QStringLiteral("No active Spotify device found (%1)").arg(message);
    else if (!reason.isEmpty())
        message += QStringLiteral(" [%1]").arg(reason);

    return PlaybackError::remoteApi(httpStatus, message);
}

// ═══════════════════════════════════════════════════════════════════
//  Player commands
// ═══════════════════════════════════════════════════════════════════

void SpotifyWebApiClient::sendPlayerRequest(const QByteArray& verb,
                                            const QString& path,
                                            const QUrlQuery& query,
                                            const QByteArray& body,
                                            CompletionCallback callback)
{
    QPointer<SpotifyWebApiClient> self(this);
    m_tokenProvider->fetchAccessToken([self, verb, path, query, body, callback](
                                          const QString& token,
                                          const std::optional<PlaybackError>& tokenError) {
        if (!self) return;
        if (tokenError) {
            callback(tokenError);
            return;
        }

        QUrl url = self->playerEndpoint(path, query);
        QNetworkRequest request(url);
        request.setRawHeader("Authorization", QStringLiteral("Bearer %1").arg(token).toUtf8());
        if (!body.isEmpty())
            request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

        qDebug() << "[SpotifyAPI]" << verb << url.toString();

        QNetworkReply* reply = self->m_networkManager->sendCustomRequest(request, verb, body);
        connect(reply, &QNetworkReply::finished, self.data(), [self, reply, verb, path, callback]() {
            reply->deleteLater();

            const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            if (httpStatus >= 200 && httpStatus <= 299) {
                callback(std::nullopt);
                return;
            }

            PlaybackError err = httpStatus == 0
                ? PlaybackError::networkFailure(reply->errorString())
                : parseApiError(httpStatus, reply->readAll());
            qWarning() << "[SpotifyAPI]" << verb << path << "failed:" << err.description();
            callback(err);
        });
    });
}

void SpotifyWebApiClient::startPlayback(const QString& trackUri, const QString& deviceId,
                                        std::optional<int> startPositionMs,
                                        CompletionCallback callback)
{
    QJsonObject body;
    if (!trackUri.isEmpty())
        body[QStringLiteral("uris")] = QJsonArray{ trackUri };
    if (startPositionMs)
        body[QStringLiteral("position_ms")] = *startPositionMs;

    sendPlayerRequest("PUT", QStringLiteral("me/player/play"), deviceQuery(deviceId),
                      QJsonDocument(body).toJson(QJsonDocument::Compact), std::move(callback));
}

void SpotifyWebApiClient::pausePlayback(const QString& deviceId, CompletionCallback callback)
{
    sendPlayerRequest("PUT", QStringLiteral("me/player/pause"), deviceQuery(deviceId),
                      QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::resumePlayback(const QString& deviceId, CompletionCallback callback)
{
    // An empty body resumes the current context
    sendPlayerRequest("PUT", QStringLiteral("me/player/play"), deviceQuery(deviceId),
                      QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::seek(int positionMs, const QString& deviceId, CompletionCallback callback)
{
    QUrlQuery query = deviceQuery(deviceId);
    query.addQueryItem(QStringLiteral("position_ms"), QString::number(qMax(0, positionMs)));
    sendPlayerRequest("PUT", QStringLiteral("me/player/seek"), query, QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::setVolume(int volumePercent, const QString& deviceId, CompletionCallback callback)
{
    QUrlQuery query = deviceQuery(deviceId);
    query.addQueryItem(QStringLiteral("volume_percent"), QString::number(qBound(0, volumePercent, 100)));
    sendPlayerRequest("PUT", QStringLiteral("me/player/volume"), query, QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::skipNext(const QString& deviceId, CompletionCallback callback)
{
    sendPlayerRequest("POST", QStringLiteral("me/player/next"), deviceQuery(deviceId),
                      QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::skipPrevious(const QString& deviceId, CompletionCallback callback)
{
    sendPlayerRequest("POST", QStringLiteral("me/player/previous"), deviceQuery(deviceId),
                      QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::setShuffle(bool enabled, const QString& deviceId, CompletionCallback callback)
{
    QUrlQuery query = deviceQuery(deviceId);
    query.addQueryItem(QStringLiteral("state"), enabled ? QStringLiteral("true") : QStringLiteral("false"));
    sendPlayerRequest("PUT", QStringLiteral("me/player/shuffle"), query, QByteArray(), std::move(callback));
}

void SpotifyWebApiClient::setRepeat(RepeatMode mode, const QString& deviceId, CompletionCallback callback)
{
    QUrlQuery query = deviceQuery(deviceId);
    query.addQueryItem(QStringLiteral("state"), repeatModeToApiString(mode));
    sendPlayerRequest("PUT", QStringLiteral("me/player/repeat"), query, QByteArray(), std::move(callback));
}
