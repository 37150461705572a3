#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <csignal>
#include <sys/types.h>
#include <signal.h>
#include "internalplayer/PlayerProcessManager.h"
#include "internalplayer/HelperLocator.h"

static const QString kToken = QStringLiteral("BQDtest-token-123456");

// Dev-mode config running an arbitrary shell snippet inside `dir`
static PlayerLaunchConfig shellConfig(const QString& dir, const QString& script)
{
    PlayerLaunchConfig config;
    config.mode = PlayerLaunchMode::Dev;
    config.devRepoPath = dir;
    config.devProgram = QStringLiteral("/bin/sh");
    config.devArguments = { QStringLiteral("-c"), script };
    config.stopGraceMs = 1000;
    return config;
}

class tst_PlayerProcessManager : public QObject {
    Q_OBJECT

private slots:

    // ── Launch validation ────────────────────────────────────────
    void emptyToken_isNoAccessCredential()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy errorSpy(&manager, &PlayerProcessManager::errorOccurred);

        auto err = manager.ensureRunning(QString());
        QVERIFY(err.has_value());
        QCOMPARE(err->kind, PlaybackError::Kind::NoAccessCredential);
        QCOMPARE(errorSpy.count(), 1);
        QVERIFY(!manager.isRunning());
    }

    void devMode_missingDirectory_isInvalidPath()
    {
        PlayerProcessManager manager(shellConfig(QStringLiteral("/nonexistent/electric-player"),
                                                 QStringLiteral("exec sleep 30")));
        QSignalSpy launchSpy(&manager, &PlayerProcessManager::processLaunched);

        auto err = manager.ensureRunning(kToken);
        QVERIFY(err.has_value());
        QCOMPARE(err->kind, PlaybackError::Kind::InvalidPath);
        QCOMPARE(err->message, QStringLiteral("/nonexistent/electric-player"));
        QCOMPARE(err->category(), PlaybackError::Category::Process);
        QCOMPARE(launchSpy.count(), 0);
        QVERIFY(!manager.isRunning());
    }

    void devMode_pathIsFile_isInvalidPath()
    {
        QTemporaryDir dir;
        const QString file = dir.filePath(QStringLiteral("not-a-dir"));
        QFile f(file);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.close();

        PlayerProcessManager manager(shellConfig(file, QStringLiteral("exec sleep 30")));
        auto err = manager.ensureRunning(kToken);
        QVERIFY(err.has_value());
        QCOMPARE(err->kind, PlaybackError::Kind::InvalidPath);
    }

    void badProgram_isLaunchFailed()
    {
        QTemporaryDir dir;
        PlayerLaunchConfig config = shellConfig(dir.path(), QString());
        config.devProgram = dir.filePath(QStringLiteral("does-not-exist"));
        config.devArguments.clear();
        PlayerProcessManager manager(config);

        auto err = manager.ensureRunning(kToken);
        QVERIFY(err.has_value());
        QCOMPARE(err->kind, PlaybackError::Kind::LaunchFailed);
        QVERIFY(!manager.isRunning());
    }

    void packagedMode_missingHelper_isHelperNotFound()
    {
        QTemporaryDir dir;
        PlayerLaunchConfig config;
        config.mode = PlayerLaunchMode::Packaged;
        config.helperName = QStringLiteral("NoSuchHelper-%1").arg(QCoreApplication::applicationPid());
        config.helperSearchPaths = { dir.path() };
        PlayerProcessManager manager(config);

        auto err = manager.ensureRunning(kToken);
        QVERIFY(err.has_value());
        QCOMPARE(err->kind, PlaybackError::Kind::HelperNotFound);
        QCOMPARE(err->message, config.helperName);
    }

    void packagedMode_helperFromSearchPath_starts()
    {
        QTemporaryDir dir;
        const QString helper = dir.filePath(QStringLiteral("TestPlayerHelper"));
        QFile f(helper);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("#!/bin/sh\nexec sleep 30\n");
        f.close();
        QVERIFY(f.setPermissions(f.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser));

        PlayerLaunchConfig config;
        config.mode = PlayerLaunchMode::Packaged;
        config.helperName = QStringLiteral("TestPlayerHelper");
        config.helperSearchPaths = { dir.path() };
        config.stopGraceMs = 1000;
        PlayerProcessManager manager(config);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QVERIFY(manager.isRunning());
        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    // ── Spawn / reuse ────────────────────────────────────────────
    void ensureRunning_isIdempotent()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy launchSpy(&manager, &PlayerProcessManager::processLaunched);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        const qint64 pid = manager.processId();
        QVERIFY(pid > 0);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QCOMPARE(launchSpy.count(), 1);
        QCOMPARE(manager.processId(), pid);

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    void environment_isInjected()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(),
            QStringLiteral("echo \"{\\\"mode\\\":\\\"$ELECTRIC_SLIDESHOW_MODE\\\","
                           "\\\"token\\\":\\\"$SPOTIFY_ACCESS_TOKEN\\\","
                           "\\\"backend\\\":\\\"$ELECTRIC_BACKEND_BASE_URL\\\"}\"; exec sleep 5")));
        QSignalSpy messageSpy(&manager, &PlayerProcessManager::messageReceived);

        QVERIFY(!manager.ensureRunning(kToken, QUrl(QStringLiteral("https://backend.example"))).has_value());
        QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 1, 5000);

        const QJsonObject env = QJsonDocument::fromJson(messageSpy.at(0).at(0).toByteArray()).object();
        QCOMPARE(env.value(QStringLiteral("mode")).toString(), QStringLiteral("internal-player"));
        QCOMPARE(env.value(QStringLiteral("token")).toString(), kToken);
        QCOMPARE(env.value(QStringLiteral("backend")).toString(), QStringLiteral("https://backend.example"));

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    void workingDirectory_isRepoPath()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("pwd; exec sleep 5")));
        QSignalSpy messageSpy(&manager, &PlayerProcessManager::messageReceived);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 1, 5000);
        QCOMPARE(QFileInfo(QString::fromUtf8(messageSpy.at(0).at(0).toByteArray())).canonicalFilePath(),
                 QFileInfo(dir.path()).canonicalFilePath());

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    void stdoutLines_areSplit()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(),
            QStringLiteral("printf 'one\\n\\ntwo\\nthree'; exec sleep 5")));
        QSignalSpy messageSpy(&manager, &PlayerProcessManager::messageReceived);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 2, 5000);
        QCOMPARE(messageSpy.at(0).at(0).toByteArray(), QByteArray("one"));
        QCOMPARE(messageSpy.at(1).at(0).toByteArray(), QByteArray("two"));

        // The unterminated last line is delivered on exit
        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
        QCOMPARE(messageSpy.count(), 3);
        QCOMPARE(messageSpy.at(2).at(0).toByteArray(), QByteArray("three"));
    }

    void writeMessage_reachesStdin()
    {
        QTemporaryDir dir;
        // Echo stdin lines back on stdout
        PlayerProcessManager manager(shellConfig(dir.path(),
            QStringLiteral("while read line; do echo \"$line\"; done")));
        QSignalSpy messageSpy(&manager, &PlayerProcessManager::messageReceived);

        QVERIFY(!manager.writeMessage(QByteArray("{}")));   // nothing running yet
        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QVERIFY(manager.writeMessage(QByteArray(R"({"type":"pause"})")));
        QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 1, 5000);
        QCOMPARE(messageSpy.at(0).at(0).toByteArray(), QByteArray(R"({"type":"pause"})"));

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    // ── Exit / stop ──────────────────────────────────────────────
    void externalKill_clearsHandle_thenRespawns()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy runningSpy(&manager, &PlayerProcessManager::runningChanged);
        QSignalSpy exitSpy(&manager, &PlayerProcessManager::processExited);
        QSignalSpy launchSpy(&manager, &PlayerProcessManager::processLaunched);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        const qint64 firstPid = manager.processId();
        QVERIFY(::kill(static_cast<pid_t>(firstPid), SIGKILL) == 0);

        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
        QCOMPARE(exitSpy.count(), 1);
        QCOMPARE(runningSpy.count(), 2);   // true, false
        QCOMPARE(runningSpy.at(1).at(0).toBool(), false);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QVERIFY(manager.isRunning());
        QCOMPARE(launchSpy.count(), 2);
        QVERIFY(manager.processId() != firstPid);

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    void stop_withoutProcess_isNoop()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy runningSpy(&manager, &PlayerProcessManager::runningChanged);
        manager.stop();
        manager.stop();
        QCOMPARE(runningSpy.count(), 0);
    }

    void stop_returnsImmediately_exitObservedLater()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy exitSpy(&manager, &PlayerProcessManager::processExited);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        manager.stop();
        QCOMPARE(exitSpy.count(), 0);
        QTRY_COMPARE_WITH_TIMEOUT(exitSpy.count(), 1, 5000);
        QVERIFY(!manager.isRunning());
        QCOMPARE(manager.processId(), qint64(0));
    }

    void stop_killsAfterGracePeriod()
    {
        QTemporaryDir dir;
        // Ignores SIGTERM; only the kill fallback ends it
        PlayerProcessManager manager(shellConfig(dir.path(),
            QStringLiteral("trap '' TERM; while true; do sleep 1; done")));
        QSignalSpy exitSpy(&manager, &PlayerProcessManager::processExited);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        manager.stop();
        QTRY_COMPARE_WITH_TIMEOUT(exitSpy.count(), 1, 8000);
        QVERIFY(!manager.isRunning());
    }

    void ensureRunning_whileStopping_startsFreshProcess()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exec sleep 30")));
        QSignalSpy launchSpy(&manager, &PlayerProcessManager::processLaunched);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        const qint64 firstPid = manager.processId();
        manager.stop();

        // Still terminating: the old handle is waited for, then replaced
        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QCOMPARE(launchSpy.count(), 2);
        QVERIFY(manager.isRunning());
        QVERIFY(manager.processId() != firstPid);

        // The old process exiting later must not clear the new handle
        QTest::qWait(200);
        QVERIFY(manager.isRunning());

        manager.stop();
        QTRY_VERIFY_WITH_TIMEOUT(!manager.isRunning(), 5000);
    }

    void naturalExit_isObserved()
    {
        QTemporaryDir dir;
        PlayerProcessManager manager(shellConfig(dir.path(), QStringLiteral("exit 3")));
        QSignalSpy exitSpy(&manager, &PlayerProcessManager::processExited);

        QVERIFY(!manager.ensureRunning(kToken).has_value());
        QTRY_COMPARE_WITH_TIMEOUT(exitSpy.count(), 1, 5000);
        QCOMPARE(exitSpy.at(0).at(0).toInt(), 3);
        QVERIFY(!manager.isRunning());
    }

    // ── HelperLocator ────────────────────────────────────────────
    void helperLocator_candidateOrder()
    {
        const QStringList paths = HelperLocator::candidatePaths(
            QStringLiteral("Player"), { QStringLiteral("/opt/extra") }, QStringLiteral("/app/Contents/MacOS"));
        QCOMPARE(paths, (QStringList{
            QStringLiteral("/app/Contents/MacOS/Player"),
            QStringLiteral("/app/Contents/Resources/Player.app/Contents/MacOS/Player"),
            QStringLiteral("/app/Contents/Resources/Player"),
            QStringLiteral("/app/Contents/libexec/Player"),
            QStringLiteral("/opt/extra/Player") }));
    }

    void helperLocator_skipsNonExecutable()
    {
        QTemporaryDir dir;
        QFile f(dir.filePath(QStringLiteral("Player")));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.close();
        QVERIFY(f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner));

        QVERIFY(HelperLocator::locate(QStringLiteral("Player"), {}, dir.path()).isEmpty());

        QVERIFY(f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner));
        QCOMPARE(HelperLocator::locate(QStringLiteral("Player"), {}, dir.path()),
                 QFileInfo(f.fileName()).absoluteFilePath());
    }
};

QTEST_MAIN(tst_PlayerProcessManager)
#include "tst_PlayerProcessManager.moc"
