#include "ControlChannel.h"
#include "../core/DiagnosticLog.h"

#include <QDebug>
#include <QJsonDocument>

namespace {
const QString kTag = QStringLiteral("ControlChannel");
}

ControlChannel::ControlChannel(IControlTransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    qRegisterMetaType<ControlEvent>("ControlEvent");
    qRegisterMetaType<PlaybackError>("PlaybackError");
}

// ═════════════════════════════════════════════════════════════════════
//  Outbound
// ═════════════════════════════════════════════════════════════════════

bool ControlChannel::send(const QString& type, QJsonObject body)
{
    body.insert(QStringLiteral("type"), type);
    const QByteArray message = QJsonDocument(body).toJson(QJsonDocument::Compact);

    if (!m_transport || !m_transport->writeMessage(message)) {
        DiagnosticLog::instance()->warn(kTag, QStringLiteral("Failed to send '%1'").arg(type));
        emit errorOccurred(PlaybackError::sendFailed(type));
        return false;
    }

    if (type == QLatin1String("setAccessToken"))
        DiagnosticLog::instance()->log(kTag, QStringLiteral("-> setAccessToken %1")
            .arg(DiagnosticLog::redact(body.value(QStringLiteral("token")).toString())));
    else
        qDebug().noquote() << "[ControlChannel] ->" << QString::fromUtf8(message);
    return true;
}

bool ControlChannel::loadContent(const QUrl& url)
{
    DiagnosticLog::instance()->log(kTag, QStringLiteral("Loading player content %1").arg(url.toString()));
    QJsonObject body;
    body.insert(QStringLiteral("url"), url.toString());
    return send(QStringLiteral("load"), body);
}

void ControlChannel::sendCredential(const QString& accessToken)
{
    m_pendingCredential = accessToken;
    if (!m_contentLoaded) {
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Content not loaded yet, buffering token %1")
            .arg(DiagnosticLog::redact(accessToken)));
        return;
    }
    flushCredential();
}

void ControlChannel::flushCredential()
{
    if (!m_pendingCredential)
        return;

    const QString token = *m_pendingCredential;
    m_pendingCredential.reset();

    QJsonObject body;
    body.insert(QStringLiteral("token"), token);
    if (send(QStringLiteral("setAccessToken"), body))
        emit credentialSent();
}

bool ControlChannel::connectDevice()
{
    return send(QStringLiteral("connect"));
}

bool ControlChannel::play(const QString& trackUri, std::optional<int> startPositionMs)
{
    QJsonObject body;
    body.insert(QStringLiteral("trackUri"), trackUri);
    if (startPositionMs)
        body.insert(QStringLiteral("positionMs"), qMax(0, *startPositionMs));
    return send(QStringLiteral("play"), body);
}

bool ControlChannel::pause()
{
    return send(QStringLiteral("pause"));
}

bool ControlChannel::resume()
{
    return send(QStringLiteral("resume"));
}

bool ControlChannel::next()
{
    return send(QStringLiteral("next"));
}

bool ControlChannel::previous()
{
    return send(QStringLiteral("previous"));
}

bool ControlChannel::seek(int positionMs)
{
    QJsonObject body;
    body.insert(QStringLiteral("positionMs"), qMax(0, positionMs));
    return send(QStringLiteral("seek"), body);
}

bool ControlChannel::setVolume(double volume)
{
    QJsonObject body;
    body.insert(QStringLiteral("volume"), qBound(0.0, volume, 1.0));
    return send(QStringLiteral("setVolume"), body);
}

void ControlChannel::reset()
{
    m_contentLoaded = false;
    m_pendingCredential.reset();
}

// ═════════════════════════════════════════════════════════════════════
//  Inbound
// ═════════════════════════════════════════════════════════════════════

void ControlChannel::handleIncoming(const QByteArray& payload)
{
    const ControlEvent event = ControlEvent::decode(payload);

    switch (event.type) {
    case ControlEvent::Type::Unknown:
        // Non-fatal: the line is dropped and no state changes
        DiagnosticLog::instance()->warn(kTag,
            PlaybackError::decodeFailed(QString::fromUtf8(payload.left(200))).description());
        return;

    case ControlEvent::Type::StateChanged:
        qDebug().noquote() << "[ControlChannel] <- stateChanged" << describePlaybackState(event.state);
        emit eventReceived(event);
        return;

    case ControlEvent::Type::ContentLoaded: {
        const bool firstLoad = !m_contentLoaded;
        m_contentLoaded = true;
        DiagnosticLog::instance()->log(kTag, firstLoad ? QStringLiteral("Player content loaded")
                                                       : QStringLiteral("Player content reloaded"));
        emit eventReceived(event);
        if (m_pendingCredential) {
            DiagnosticLog::instance()->log(kTag, QStringLiteral("Flushing buffered token"));
            flushCredential();
        }
        return;
    }

    default:
        break;
    }

    QString detail;
    if (event.type == ControlEvent::Type::Ready || event.type == ControlEvent::Type::NotReady)
        detail = event.deviceId.isEmpty() ? QStringLiteral("(no device id)") : event.deviceId;
    else if (event.type == ControlEvent::Type::Error)
        detail = QStringLiteral("%1 - %2").arg(event.code, event.message);
    else if (event.type == ControlEvent::Type::ConnectResult)
        detail = event.ok ? QStringLiteral("connected") : QStringLiteral("failed");

    DiagnosticLog::instance()->log(kTag, QStringLiteral("<- %1 %2").arg(event.typeName(), detail).trimmed());
    emit eventReceived(event);
}
