#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QStandardPaths>
#include <QTimer>
#include <csignal>
#include <cstdio>
#include <iostream>

#include "core/DiagnosticLog.h"
#include "core/PlaybackState.h"
#include "core/Settings.h"
#include "internalplayer/InternalPlaybackBackend.h"
#include "playback/PlaybackBackendFactory.h"
#include "spotify/ITokenProvider.h"

// Set from the signal handler, polled on the event loop
static volatile std::sig_atomic_t s_quitRequested = 0;

static void requestQuit(int sig)
{
    (void)sig;
    s_quitRequested = 1;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setOrganizationName("ElectricSlideshow");
    app.setApplicationName("electric-slideshow-player");
    app.setApplicationVersion(APP_VERSION);

    // ── File logging ────────────────────────────────────────────────
    static QFile s_logFile;
    {
        QString logPath = QStandardPaths::writableLocation(QStandardPaths::TempLocation)
                          + QStringLiteral("/electric-slideshow-player.log");
        s_logFile.setFileName(logPath);
        const bool logOpen = s_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate);

        qInstallMessageHandler([](QtMsgType, const QMessageLogContext&, const QString& msg) {
            static QMutex mtx;
            QMutexLocker lock(&mtx);
            QString line = QStringLiteral("[%1] %2\n")
                .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
            QByteArray utf8 = line.toUtf8();
            if (s_logFile.isOpen()) {
                s_logFile.write(utf8);
                s_logFile.flush();
            }
            fprintf(stderr, "%s", utf8.constData());
        });

        if (!logOpen)
            qWarning() << "[STARTUP] Could not open log file" << logPath << ":" << s_logFile.errorString();
        qDebug() << "=== electric-slideshow-player launched ==="
                 << "Log:" << logPath
                 << "PID:" << QCoreApplication::applicationPid();
    }

    // ── Command line ────────────────────────────────────────────────
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Starts the Electric Slideshow playback backend and plays one track."));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption tokenOption(QStringLiteral("token"),
        QStringLiteral("Spotify access token (default: $SPOTIFY_ACCESS_TOKEN)."), QStringLiteral("token"));
    QCommandLineOption modeOption(QStringLiteral("mode"),
        QStringLiteral("Playback backend: internal or external."), QStringLiteral("mode"));
    QCommandLineOption devPathOption(QStringLiteral("dev-path"),
        QStringLiteral("Run the player from this checkout (\"npm run dev\")."), QStringLiteral("path"));
    QCommandLineOption trackOption(QStringLiteral("track"),
        QStringLiteral("Track URI to play once the backend is ready."), QStringLiteral("uri"));
    QCommandLineOption positionOption(QStringLiteral("position"),
        QStringLiteral("Start position in milliseconds."), QStringLiteral("ms"));
    parser.addOptions({ tokenOption, modeOption, devPathOption, trackOption, positionOption });
    parser.process(app);

    Settings* settings = Settings::instance();

    QString token = parser.value(tokenOption);
    if (token.isEmpty())
        token = qEnvironmentVariable("SPOTIFY_ACCESS_TOKEN");
    if (token.isEmpty()) {
        std::cerr << "No access token: pass --token or set SPOTIFY_ACCESS_TOKEN" << std::endl;
        return 2;
    }

    const QString modeName = parser.isSet(modeOption) ? parser.value(modeOption)
                                                      : settings->playbackBackendMode();
    std::optional<PlaybackBackendMode> mode = parsePlaybackBackendMode(modeName);
    if (!mode) {
        std::cerr << "Unknown --mode '" << modeName.toStdString() << "' (expected internal or external)" << std::endl;
        return 2;
    }

    PlayerLaunchConfig launchConfig = settings->playerLaunchConfig();
    if (parser.isSet(devPathOption)) {
        launchConfig.mode = PlayerLaunchMode::Dev;
        launchConfig.devRepoPath = parser.value(devPathOption);
    }

    std::optional<int> startPositionMs;
    if (parser.isSet(positionOption)) {
        bool ok = false;
        const int ms = parser.value(positionOption).toInt(&ok);
        if (!ok || ms < 0) {
            std::cerr << "--position must be a non-negative number of milliseconds" << std::endl;
            return 2;
        }
        startPositionMs = ms;
    }
    const QString trackUri = parser.value(trackOption);

    // ── Backend ─────────────────────────────────────────────────────
    StaticTokenProvider tokenProvider(token);
    PlaybackBackendFactory factory(launchConfig, settings->backendBaseUrl());
    factory.setWebApiBaseUrl(settings->webApiBaseUrl());
    factory.setDevicesProxyUrl(settings->devicesProxyUrl());

    PlaybackBackend* backend = *mode == PlaybackBackendMode::InternalPlayer
        ? factory.prewarmBackend(&tokenProvider)
        : factory.makeBackend(*mode, &tokenProvider);
    if (!backend) {
        std::cerr << "No playback backend available" << std::endl;
        return 1;
    }

    int exitCode = 0;
    bool trackStarted = false;

    QObject::connect(backend, &PlaybackBackend::stateChanged, [](const PlaybackState& state) {
        std::cout << describePlaybackState(state).toStdString() << std::endl;
    });
    QObject::connect(backend, &PlaybackBackend::errorOccurred, [&](const PlaybackError& error) {
        std::cerr << "Error: " << error.description().toStdString() << std::endl;
        if (error.category() == PlaybackError::Category::Process
            || error.category() == PlaybackError::Category::Credential) {
            std::cerr << DiagnosticLog::instance()->formattedEntries().toStdString() << std::endl;
            exitCode = 1;
            QCoreApplication::quit();
        }
    });
    QObject::connect(backend, &PlaybackBackend::readyChanged, [&](bool ready) {
        std::cout << (ready ? "Backend ready" : "Backend not ready") << std::endl;
        if (ready && !trackStarted && !trackUri.isEmpty()) {
            trackStarted = true;
            backend->playTrack(trackUri, startPositionMs);
        }
    });

    if (*mode == PlaybackBackendMode::ExternalDevice) {
        backend->initialize();
    } else if (auto* internal = qobject_cast<InternalPlaybackBackend*>(backend)) {
        // Prewarm runs the launch synchronously; a failure is already final here
        if (internal->readiness() == PlayerReadinessStateMachine::BackendReadiness::Degraded) {
            std::cerr << "Error: " << internal->statusDescription().toStdString() << std::endl;
            std::cerr << DiagnosticLog::instance()->formattedEntries().toStdString() << std::endl;
            return 1;
        }
    }

    // ── Shutdown ────────────────────────────────────────────────────
    std::signal(SIGINT, requestQuit);
    std::signal(SIGTERM, requestQuit);

    QTimer quitPoll;
    quitPoll.setInterval(200);
    QObject::connect(&quitPoll, &QTimer::timeout, [&]() {
        if (s_quitRequested)
            QCoreApplication::quit();
    });
    quitPoll.start();

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        qDebug() << "[STARTUP] Shutting down";
        if (auto* internal = qobject_cast<InternalPlaybackBackend*>(backend)) {
            if (!internal->isReady())
                qDebug().noquote() << "[STARTUP] Last status:" << internal->statusDescription();
        }
        backend->stop();
    });

    const int loopResult = app.exec();
    return exitCode != 0 ? exitCode : loopResult;
}
