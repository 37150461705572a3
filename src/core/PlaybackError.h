#pragma once

#include <QString>
#include <QMetaType>

// Error value shared by every playback component.  Errors travel as
// return values (std::optional<PlaybackError>) and through Qt signals;
// nothing is thrown across the event loop.
struct PlaybackError {
    enum class Kind {
        // Process supervision
        InvalidPath,
        LaunchFailed,
        HelperNotFound,
        // Credentials
        NoAccessCredential,
        NotAuthenticated,
        NetworkFailure,
        // Control channel
        SendFailed,
        DecodeFailed,
        // Readiness
        NotReady,
        DeviceNotFound,
        // Remote Web API (statusCode set)
        RemoteApi,
        // Error reported by the player process itself
        Backend
    };

    enum class Category { Process, Credential, Channel, Readiness, RemoteApi, Backend };

    Kind kind = Kind::Backend;
    QString message;
    int statusCode = 0;

    Category category() const;
    QString kindName() const;
    QString description() const;   // user-facing text

    // ── Constructors for the common cases ────────────────────────────
    static PlaybackError invalidPath(const QString& path);
    static PlaybackError launchFailed(const QString& reason);
    static PlaybackError helperNotFound(const QString& helperName);
    static PlaybackError noAccessCredential();
    static PlaybackError notAuthenticated(const QString& message = QString());
    static PlaybackError networkFailure(const QString& message);
    static PlaybackError sendFailed(const QString& command);
    static PlaybackError decodeFailed(const QString& raw);
    static PlaybackError notReady();
    static PlaybackError deviceNotFound(const QString& deviceName);
    static PlaybackError remoteApi(int statusCode, const QString& message);
    static PlaybackError backend(const QString& message);
};

Q_DECLARE_METATYPE(PlaybackError)
