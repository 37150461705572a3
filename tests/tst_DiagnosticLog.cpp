#include <QtTest/QtTest>
#include <QSignalSpy>
#include "core/DiagnosticLog.h"
#include "core/PlaybackError.h"

class tst_DiagnosticLog : public QObject {
    Q_OBJECT

private slots:
    void init()
    {
        DiagnosticLog::instance()->clear();
    }

    void empty_formatsPlaceholder()
    {
        QCOMPARE(DiagnosticLog::instance()->size(), 0);
        QCOMPARE(DiagnosticLog::instance()->formattedEntries(), QStringLiteral("No logs available"));
    }

    void entries_keepSourceAndOrder()
    {
        auto* log = DiagnosticLog::instance();
        QSignalSpy addedSpy(log, &DiagnosticLog::entryAdded);

        log->log(QStringLiteral("PlayerProcess"), QStringLiteral("Launching"));
        log->warn(QStringLiteral("ControlChannel"), QStringLiteral("Unhandled message"));

        QCOMPARE(addedSpy.count(), 2);
        const auto entries = log->entries();
        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries.at(0).source, QStringLiteral("PlayerProcess"));
        QCOMPARE(entries.at(1).message, QStringLiteral("Unhandled message"));
        QVERIFY(entries.at(0).timestamp <= entries.at(1).timestamp);
    }

    void formattedEntries_layout()
    {
        auto* log = DiagnosticLog::instance();
        log->log(QStringLiteral("Readiness"), QStringLiteral("Uninitialized -> ProcessStarting"));
        log->log(QStringLiteral("DevicePoll"), QStringLiteral("Found device"));

        const QStringList lines = log->formattedEntries().split(QLatin1Char('\n'));
        QCOMPARE(lines.size(), 2);
        QRegularExpression pattern(QStringLiteral(R"(^\[\d{2}:\d{2}:\d{2}\.\d{3}\] \[Readiness\] Uninitialized -> ProcessStarting$)"));
        QVERIFY2(pattern.match(lines.at(0)).hasMatch(), qPrintable(lines.at(0)));
        QVERIFY(lines.at(1).endsWith(QStringLiteral("[DevicePoll] Found device")));
    }

    void clear_empties()
    {
        auto* log = DiagnosticLog::instance();
        log->log(QStringLiteral("X"), QStringLiteral("y"));
        log->clear();
        QCOMPARE(log->size(), 0);
    }

    void redact_keepsSixCharacters()
    {
        QCOMPARE(DiagnosticLog::redact(QStringLiteral("BQDabcdefghijkl")), QStringLiteral("BQDabc…"));
        QCOMPARE(DiagnosticLog::redact(QStringLiteral("abc")), QStringLiteral("abc…"));
        QCOMPARE(DiagnosticLog::redact(QString()), QStringLiteral("(empty)"));
    }

    // ── PlaybackError texts shown next to the log ────────────────
    void errorDescriptions()
    {
        QCOMPARE(PlaybackError::notReady().description(), QStringLiteral("Player starting up…"));
        QVERIFY(PlaybackError::invalidPath(QStringLiteral("/x")).category() == PlaybackError::Category::Process);
        QVERIFY(PlaybackError::sendFailed(QStringLiteral("pause")).category() == PlaybackError::Category::Channel);
        QVERIFY(PlaybackError::deviceNotFound(QStringLiteral("P")).category() == PlaybackError::Category::Readiness);
        QCOMPARE(PlaybackError::remoteApi(429, QStringLiteral("slow down")).description(),
                 QStringLiteral("Spotify request failed (HTTP 429): slow down"));
        QCOMPARE(PlaybackError::noAccessCredential().kindName(), QStringLiteral("NoAccessCredential"));
    }
};

QTEST_MAIN(tst_DiagnosticLog)
#include "tst_DiagnosticLog.moc"
