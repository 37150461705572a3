#include <QtTest/QtTest>
#include "spotify/SpotifyWebApiClient.h"

class tst_SpotifyWebApiClient : public QObject {
    Q_OBJECT

private slots:

    // ── Device list parsing ──────────────────────────────────────
    void parseDevices_plainEnvelope()
    {
        const QByteArray json = R"({"devices":[
            {"id":"abc","name":"Electric Slideshow Internal Player","type":"Computer",
             "is_active":true,"is_restricted":false,"volume_percent":65},
            {"id":"def","name":"Kitchen","type":"Speaker","volume_percent":null}
        ]})";

        auto devices = SpotifyWebApiClient::parseDevices(json);
        QVERIFY(devices.has_value());
        QCOMPARE(devices->size(), 2);
        QCOMPARE(devices->at(0).id, QStringLiteral("abc"));
        QCOMPARE(devices->at(0).name, QStringLiteral("Electric Slideshow Internal Player"));
        QVERIFY(devices->at(0).isActive);
        QCOMPARE(devices->at(0).volumePercent.value_or(-1), 65);
        QCOMPARE(devices->at(1).type, QStringLiteral("Speaker"));
        QVERIFY(!devices->at(1).isActive);
        QVERIFY(!devices->at(1).volumePercent.has_value());
    }

    void parseDevices_proxyEnvelope_deviceIdWins()
    {
        const QByteArray json = R"({"data":{"devices":[
            {"id":"public-id","device_id":"real-id","name":"Player"}
        ]}})";

        auto devices = SpotifyWebApiClient::parseDevices(json);
        QVERIFY(devices.has_value());
        QCOMPARE(devices->size(), 1);
        QCOMPARE(devices->at(0).id, QStringLiteral("real-id"));
    }

    void parseDevices_skipsEntriesWithoutId()
    {
        auto devices = SpotifyWebApiClient::parseDevices(R"({"devices":[{"name":"ghost"},{"id":"x","name":"ok"}]})");
        QVERIFY(devices.has_value());
        QCOMPARE(devices->size(), 1);
        QCOMPARE(devices->at(0).id, QStringLiteral("x"));
    }

    void parseDevices_emptyList()
    {
        auto devices = SpotifyWebApiClient::parseDevices(R"({"devices":[]})");
        QVERIFY(devices.has_value());
        QVERIFY(devices->isEmpty());
    }

    void parseDevices_rejectsMalformed_data()
    {
        QTest::addColumn<QByteArray>("json");
        QTest::newRow("garbage")        << QByteArray("<html>");
        QTest::newRow("array")          << QByteArray("[]");
        QTest::newRow("no devices")     << QByteArray(R"({"items":[]})");
        QTest::newRow("devices object") << QByteArray(R"({"devices":{}})");
    }

    void parseDevices_rejectsMalformed()
    {
        QFETCH(QByteArray, json);
        QString message;
        QVERIFY(!SpotifyWebApiClient::parseDevices(json, &message).has_value());
        QVERIFY(!message.isEmpty());
    }

    // ── API errors ───────────────────────────────────────────────
    void parseApiError_noActiveDevice()
    {
        auto err = SpotifyWebApiClient::parseApiError(404,
            R"({"error":{"status":404,"message":"Player command failed: No active device found","reason":"NO_ACTIVE_DEVICE"}})");
        QCOMPARE(err.kind, PlaybackError::Kind::RemoteApi);
        QCOMPARE(err.statusCode, 404);
        QVERIFY(err.message.contains(QStringLiteral("No active Spotify device found")));
        QCOMPARE(err.category(), PlaybackError::Category::RemoteApi);
    }

    void parseApiError_otherReason_isAppended()
    {
        auto err = SpotifyWebApiClient::parseApiError(403,
            R"({"error":{"status":403,"message":"Player command failed","reason":"PREMIUM_REQUIRED"}})");
        QCOMPARE(err.message, QStringLiteral("Player command failed [PREMIUM_REQUIRED]"));
    }

    void parseApiError_nonJsonBody()
    {
        auto err = SpotifyWebApiClient::parseApiError(502, "Bad Gateway");
        QCOMPARE(err.statusCode, 502);
        QCOMPARE(err.message, QStringLiteral("Bad Gateway"));

        auto empty = SpotifyWebApiClient::parseApiError(500, QByteArray());
        QCOMPARE(empty.message, QStringLiteral("(no body)"));
    }

    // ── Requests ─────────────────────────────────────────────────
    void playerEndpoint_joinsBaseAndQuery()
    {
        StaticTokenProvider tokens(QStringLiteral("tok"));
        SpotifyWebApiClient client(&tokens, QUrl(QStringLiteral("https://api.example.com/v1")));

        QUrlQuery query;
        query.addQueryItem(QStringLiteral("device_id"), QStringLiteral("abc"));
        QCOMPARE(client.playerEndpoint(QStringLiteral("me/player/play"), query).toString(),
                 QStringLiteral("https://api.example.com/v1/me/player/play?device_id=abc"));
        QCOMPARE(client.playerEndpoint(QStringLiteral("me/player/devices"), QUrlQuery()).toString(),
                 QStringLiteral("https://api.example.com/v1/me/player/devices"));
    }

    void missingToken_failsWithoutNetwork()
    {
        StaticTokenProvider tokens;
        SpotifyWebApiClient client(&tokens);

        std::optional<PlaybackError> playError;
        bool called = false;
        client.startPlayback(QStringLiteral("spotify:track:1"), QStringLiteral("dev"), 0,
                             [&](const std::optional<PlaybackError>& error) {
            called = true;
            playError = error;
        });
        QVERIFY(called);
        QVERIFY(playError.has_value());
        QCOMPARE(playError->kind, PlaybackError::Kind::NotAuthenticated);

        std::optional<PlaybackError> listError;
        client.listDevices([&](const QVector<RemoteDevice>& devices, const std::optional<PlaybackError>& error) {
            QVERIFY(devices.isEmpty());
            listError = error;
        });
        QVERIFY(listError.has_value());
        QCOMPARE(listError->category(), PlaybackError::Category::Credential);
    }
};

QTEST_MAIN(tst_SpotifyWebApiClient)
#include "tst_SpotifyWebApiClient.moc"
