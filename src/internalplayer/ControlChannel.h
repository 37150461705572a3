#pragma once

#include <QObject>
#include <QByteArray>
#include <QJsonObject>
#include <QUrl>
#include <optional>

#include "ControlEvent.h"
#include "IControlTransport.h"
#include "../core/PlaybackError.h"

// Bidirectional message channel to the player process.  Outbound commands
// are JSON objects with a "type" field; inbound lines are decoded into
// ControlEvent values.  The access token is held back until the player has
// reported its content as loaded.
class ControlChannel : public QObject {
    Q_OBJECT

public:
    explicit ControlChannel(IControlTransport* transport, QObject* parent = nullptr);

    void setTransport(IControlTransport* transport) { m_transport = transport; }

    bool isContentLoaded() const { return m_contentLoaded; }
    bool hasPendingCredential() const { return m_pendingCredential.has_value(); }

    // ── Outbound ─────────────────────────────────────────────────────
    bool loadContent(const QUrl& url);
    void sendCredential(const QString& accessToken);
    bool connectDevice();
    bool play(const QString& trackUri, std::optional<int> startPositionMs = std::nullopt);
    bool pause();
    bool resume();
    bool next();
    bool previous();
    bool seek(int positionMs);
    bool setVolume(double volume);   // clamped to [0, 1]

    // Forget loaded content and any buffered credential
    void reset();

public slots:
    void handleIncoming(const QByteArray& payload);

signals:
    void eventReceived(const ControlEvent& event);
    void credentialSent();
    void errorOccurred(const PlaybackError& error);

private:
    bool send(const QString& type, QJsonObject body = QJsonObject());
    void flushCredential();

    IControlTransport* m_transport = nullptr;
    bool m_contentLoaded = false;
    std::optional<QString> m_pendingCredential;
};
