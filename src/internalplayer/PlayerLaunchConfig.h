#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>

// How the external player process is started.
//   Dev      : "npm run dev" inside a local checkout of the player repo
//   Packaged : helper executable shipped inside the application bundle
enum class PlayerLaunchMode { Dev, Packaged };

struct PlayerLaunchConfig {
#ifdef ELECTRIC_SLIDESHOW_DEV_PLAYER
    PlayerLaunchMode mode = PlayerLaunchMode::Dev;
#else
    PlayerLaunchMode mode = PlayerLaunchMode::Packaged;
#endif

    // Dev mode
    QString     devRepoPath;
    QString     devProgram   = QStringLiteral("/usr/bin/env");
    QStringList devArguments = { QStringLiteral("npm"), QStringLiteral("run"), QStringLiteral("dev") };

    // Packaged mode
    QString     helperName = QStringLiteral("ElectricSlideshowInternalPlayer");
    QStringList helperSearchPaths;   // checked before the bundle locations

    // Player content + device registration
    QUrl    contentUrl = QUrl(QStringLiteral("https://electric-slideshow-server.onrender.com/internal-player"));
    QString deviceName = QStringLiteral("Electric Slideshow Internal Player");

    // Grace period between terminate() and kill() on stop
    int stopGraceMs  = 3000;
    int startTimeoutMs = 5000;
};

inline QString launchModeName(PlayerLaunchMode mode)
{
    return mode == PlayerLaunchMode::Dev ? QStringLiteral("dev") : QStringLiteral("packaged");
}
