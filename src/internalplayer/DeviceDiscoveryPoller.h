#pragma once

#include <QObject>
#include <QTimer>

#include "../spotify/ISpotifyWebApi.h"

// Polls the Web API device list until a device with the expected display
// name shows up.  Fixed delay between attempts, no backoff.
class DeviceDiscoveryPoller : public QObject {
    Q_OBJECT

public:
    static constexpr int kDefaultMaxAttempts = 6;
    static constexpr int kDefaultIntervalMs = 500;

    DeviceDiscoveryPoller(ISpotifyWebApi* api,
                          const QString& deviceName,
                          QObject* parent = nullptr,
                          int maxAttempts = kDefaultMaxAttempts,
                          int intervalMs = kDefaultIntervalMs);

    QString deviceName() const { return m_deviceName; }
    void setDeviceName(const QString& name) { m_deviceName = name; }

    bool isRunning() const { return m_running; }
    int attemptsMade() const { return m_attempt; }
    int maxAttempts() const { return m_maxAttempts; }

    // Returns false when a poll is already in progress
    bool start();
    void cancel();

signals:
    void deviceFound(const RemoteDevice& device, int attempt);
    void attemptFailed(int attempt, const QString& reason);
    void exhausted();

private:
    void runAttempt();
    void scheduleNext();

    ISpotifyWebApi* m_api;
    QString m_deviceName;
    QTimer* m_timer = nullptr;
    int m_maxAttempts;
    int m_intervalMs;
    int m_attempt = 0;
    int m_generation = 0;   // bumps on start/cancel; stale replies compare against it
    bool m_running = false;
};
