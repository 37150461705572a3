#pragma once

#include <QObject>
#include <QString>
#include <optional>

#include "../core/PlaybackError.h"

// Tracks how far the internal player has come on its way to being a
// controllable playback device.  The machine only decides; the owning
// backend performs the requested actions and feeds the results back in.
class PlayerReadinessStateMachine : public QObject {
    Q_OBJECT
public:
    enum class BackendReadiness {
        Uninitialized,
        ProcessStarting,
        ContentLoading,
        CredentialPending,
        ConnectingDevice,
        DiscoveringDevice,
        Ready,
        Degraded
    };
    Q_ENUM(BackendReadiness)

    explicit PlayerReadinessStateMachine(QObject* parent = nullptr);

    BackendReadiness readiness() const { return m_readiness; }
    QString deviceId() const { return m_deviceId; }
    bool isReady() const { return m_readiness == BackendReadiness::Ready; }
    bool canAcceptCommands() const { return isReady(); }
    std::optional<PlaybackError> lastError() const { return m_lastError; }

    static QString readinessName(BackendReadiness readiness);

    // ── Input methods (called by InternalPlaybackBackend) ────────────
    bool start();
    void onProcessStarted(bool contentAlreadyLoaded = false);
    void onProcessFailed(const PlaybackError& error);
    void onContentLoaded();
    void onCredentialSent();
    void onCredentialAcknowledged();
    void onDeviceReady(const QString& deviceId);
    void onConnectResult(bool ok);
    void onDeviceDiscovered(const QString& deviceId);
    // Explicit re-discovery after a command found the device id missing or stale
    void onDeviceRediscovered(const QString& deviceId);
    void onDiscoveryExhausted();
    void onDeviceNotReady(const QString& deviceId);
    void onPlayerError(const PlaybackError& error);
    void onProcessExited();
    void reset();

signals:
    // State notifications
    void readinessChanged(PlayerReadinessStateMachine::BackendReadiness readiness);
    void readyChanged(bool ready);
    void failed(const PlaybackError& error);

    // Action requests
    void startProcessRequested();
    void loadContentRequested();
    void credentialRequested();
    void connectRequested();
    void discoveryRequested();

private:
    void setReadiness(BackendReadiness newState);
    void adoptDevice(const QString& deviceId);

    BackendReadiness m_readiness = BackendReadiness::Uninitialized;
    QString m_deviceId;
    std::optional<PlaybackError> m_lastError;
};
