#include "PlaybackError.h"

PlaybackError::Category PlaybackError::category() const
{
    switch (kind) {
    case Kind::InvalidPath:
    case Kind::LaunchFailed:
    case Kind::HelperNotFound:
        return Category::Process;
    case Kind::NoAccessCredential:
    case Kind::NotAuthenticated:
    case Kind::NetworkFailure:
        return Category::Credential;
    case Kind::SendFailed:
    case Kind::DecodeFailed:
        return Category::Channel;
    case Kind::NotReady:
    case Kind::DeviceNotFound:
        return Category::Readiness;
    case Kind::RemoteApi:
        return Category::RemoteApi;
    case Kind::Backend:
        break;
    }
    return Category::Backend;
}

QString PlaybackError::kindName() const
{
    switch (kind) {
    case Kind::InvalidPath:        return QStringLiteral("InvalidPath");
    case Kind::LaunchFailed:       return QStringLiteral("LaunchFailed");
    case Kind::HelperNotFound:     return QStringLiteral("HelperNotFound");
    case Kind::NoAccessCredential: return QStringLiteral("NoAccessCredential");
    case Kind::NotAuthenticated:   return QStringLiteral("NotAuthenticated");
    case Kind::NetworkFailure:     return QStringLiteral("NetworkFailure");
    case Kind::SendFailed:         return QStringLiteral("SendFailed");
    case Kind::DecodeFailed:       return QStringLiteral("DecodeFailed");
    case Kind::NotReady:           return QStringLiteral("NotReady");
    case Kind::DeviceNotFound:     return QStringLiteral("DeviceNotFound");
    case Kind::RemoteApi:          return QStringLiteral("RemoteApi");
    case Kind::Backend:            return QStringLiteral("Backend");
    }
    return QStringLiteral("Backend");
}

QString PlaybackError::description() const
{
    switch (kind) {
    case Kind::InvalidPath:
        return QStringLiteral("Invalid internal player path: %1").arg(message);
    case Kind::LaunchFailed:
        return QStringLiteral("Failed to launch internal player: %1").arg(message);
    case Kind::HelperNotFound:
        return QStringLiteral("Embedded internal player helper not found: %1").arg(message);
    case Kind::NoAccessCredential:
        return QStringLiteral("No Spotify access token available");
    case Kind::NotAuthenticated:
        return message.isEmpty() ? QStringLiteral("Spotify authorization failed")
                                 : QStringLiteral("Spotify authorization failed: %1").arg(message);
    case Kind::NetworkFailure:
        return QStringLiteral("Network error: %1").arg(message);
    case Kind::SendFailed:
        return QStringLiteral("Could not send '%1' to the internal player").arg(message);
    case Kind::DecodeFailed:
        return QStringLiteral("Unreadable message from the internal player: %1").arg(message);
    case Kind::NotReady:
        return QStringLiteral("Player starting up…");
    case Kind::DeviceNotFound:
        return QStringLiteral("Playback device '%1' not found").arg(message);
    case Kind::RemoteApi:
        return QStringLiteral("Spotify request failed (HTTP %1): %2").arg(statusCode).arg(message);
    case Kind::Backend:
        return QStringLiteral("Internal Player Error: %1").arg(message);
    }
    return message;
}

PlaybackError PlaybackError::invalidPath(const QString& path)
{
    return { Kind::InvalidPath, path, 0 };
}

PlaybackError PlaybackError::launchFailed(const QString& reason)
{
    return { Kind::LaunchFailed, reason, 0 };
}

PlaybackError PlaybackError::helperNotFound(const QString& helperName)
{
    return { Kind::HelperNotFound, helperName, 0 };
}

PlaybackError PlaybackError::noAccessCredential()
{
    return { Kind::NoAccessCredential, QString(), 0 };
}

PlaybackError PlaybackError::notAuthenticated(const QString& message)
{
    return { Kind::NotAuthenticated, message, 0 };
}

PlaybackError PlaybackError::networkFailure(const QString& message)
{
    return { Kind::NetworkFailure, message, 0 };
}

PlaybackError PlaybackError::sendFailed(const QString& command)
{
    return { Kind::SendFailed, command, 0 };
}

PlaybackError PlaybackError::decodeFailed(const QString& raw)
{
    return { Kind::DecodeFailed, raw, 0 };
}

PlaybackError PlaybackError::notReady()
{
    return { Kind::NotReady, QString(), 0 };
}

PlaybackError PlaybackError::deviceNotFound(const QString& deviceName)
{
    return { Kind::DeviceNotFound, deviceName, 0 };
}

PlaybackError PlaybackError::remoteApi(int statusCode, const QString& message)
{
    return { Kind::RemoteApi, message, statusCode };
}

PlaybackError PlaybackError::backend(const QString& message)
{
    return { Kind::Backend, message, 0 };
}
