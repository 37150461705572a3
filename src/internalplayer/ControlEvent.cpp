#include "ControlEvent.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QtGlobal>
#include <limits>

namespace {

std::optional<QString> optionalString(const QJsonObject& obj, const char* key)
{
    QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isString())
        return std::nullopt;
    return v.toString();
}

int intField(const QJsonObject& obj, const char* key)
{
    QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble())
        return 0;
    // Positions and durations are non-negative and must fit an int
    return static_cast<int>(qBound(0.0, v.toDouble(), double(std::numeric_limits<int>::max())));
}

ControlEvent unknown(const QByteArray& raw)
{
    ControlEvent ev;
    ev.type = ControlEvent::Type::Unknown;
    ev.raw = raw;
    return ev;
}

} // namespace

ControlEvent ControlEvent::decode(const QByteArray& payload)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return unknown(payload);

    ControlEvent ev = decode(doc.object());
    if (ev.type == Type::Unknown)
        ev.raw = payload;
    return ev;
}

ControlEvent ControlEvent::decode(const QJsonObject& object)
{
    const QString type = object.value(QStringLiteral("type")).toString();
    // Events either carry their fields inline or under "payload"
    QJsonObject fields = object.value(QStringLiteral("payload")).isObject()
        ? object.value(QStringLiteral("payload")).toObject()
        : object;

    ControlEvent ev;

    if (type == QLatin1String("ready")) {
        ev.type = Type::Ready;
        ev.deviceId = fields.value(QStringLiteral("deviceId")).toString();
    } else if (type == QLatin1String("stateChanged")) {
        ev.type = Type::StateChanged;
        ev.state.isPlaying = fields.value(QStringLiteral("isPlaying")).toBool(false);
        ev.state.positionMs = intField(fields, "positionMs");
        ev.state.durationMs = intField(fields, "durationMs");
        ev.state.trackUri = optionalString(fields, "trackUri");
        ev.state.trackName = optionalString(fields, "trackName");
        ev.state.artistName = optionalString(fields, "artistName");
        ev.albumName = optionalString(fields, "albumName");
    } else if (type == QLatin1String("error")) {
        ev.type = Type::Error;
        ev.code = fields.value(QStringLiteral("code")).toString();
        ev.message = fields.value(QStringLiteral("message")).toString();
    } else if (type == QLatin1String("contentLoaded") || type == QLatin1String("htmlLoaded")) {
        ev.type = Type::ContentLoaded;
    } else if (type == QLatin1String("tokenUpdated") || type == QLatin1String("credentialAck")) {
        ev.type = Type::CredentialAck;
    } else if (type == QLatin1String("notReady")) {
        ev.type = Type::NotReady;
        ev.deviceId = fields.value(QStringLiteral("deviceId")).toString();
    } else if (type == QLatin1String("connectResult")) {
        ev.type = Type::ConnectResult;
        QJsonValue ok = fields.value(QStringLiteral("ok"));
        if (ok.isBool())
            ev.ok = ok.toBool();
        else
            ev.ok = fields.value(QStringLiteral("message")).toString() == QLatin1String("connected");
    } else {
        ev.type = Type::Unknown;
        ev.raw = QJsonDocument(object).toJson(QJsonDocument::Compact);
    }
    return ev;
}

QString ControlEvent::typeName() const
{
    switch (type) {
    case Type::Ready:         return QStringLiteral("ready");
    case Type::StateChanged:  return QStringLiteral("stateChanged");
    case Type::Error:         return QStringLiteral("error");
    case Type::ContentLoaded: return QStringLiteral("contentLoaded");
    case Type::CredentialAck: return QStringLiteral("credentialAck");
    case Type::NotReady:      return QStringLiteral("notReady");
    case Type::ConnectResult: return QStringLiteral("connectResult");
    case Type::Unknown:       break;
    }
    return QStringLiteral("unknown");
}
