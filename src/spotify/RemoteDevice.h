#pragma once

#include <QString>
#include <QVector>
#include <QMetaType>
#include <optional>

// A Spotify Connect device as reported by the Web API device list.
struct RemoteDevice {
    QString id;
    QString name;
    QString type;          // "Computer", "Smartphone", ...
    bool isActive = false;
    bool isRestricted = false;
    std::optional<int> volumePercent;
};

Q_DECLARE_METATYPE(RemoteDevice)
