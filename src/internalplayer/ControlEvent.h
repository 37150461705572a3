#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <optional>

#include "../core/PlaybackState.h"

// One inbound message from the player process.
struct ControlEvent {
    enum class Type {
        Ready,          // deviceId (may be empty)
        StateChanged,   // state + albumName
        Error,          // code, message
        ContentLoaded,
        CredentialAck,
        NotReady,       // deviceId
        ConnectResult,  // ok
        Unknown         // raw
    };

    Type type = Type::Unknown;

    QString deviceId;
    PlaybackState state;
    std::optional<QString> albumName;
    QString code;
    QString message;
    bool ok = false;
    QByteArray raw;

    // Never fails: unreadable input becomes Type::Unknown carrying the raw bytes
    static ControlEvent decode(const QByteArray& payload);
    static ControlEvent decode(const QJsonObject& object);

    QString typeName() const;
};

Q_DECLARE_METATYPE(ControlEvent)
