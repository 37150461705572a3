#include "DeviceDiscoveryPoller.h"
#include "../core/DiagnosticLog.h"

#include <QDebug>
#include <QPointer>

namespace {
const QString kTag = QStringLiteral("DevicePoll");
}

DeviceDiscoveryPoller::DeviceDiscoveryPoller(ISpotifyWebApi* api,
                                             const QString& deviceName,
                                             QObject* parent,
                                             int maxAttempts,
                                             int intervalMs)
    : QObject(parent)
    , m_api(api)
    , m_deviceName(deviceName)
    , m_maxAttempts(qMax(1, maxAttempts))
    , m_intervalMs(qMax(0, intervalMs))
{
    qRegisterMetaType<RemoteDevice>("RemoteDevice");

    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &DeviceDiscoveryPoller::runAttempt);
}

bool DeviceDiscoveryPoller::start()
{
    if (m_running) {
        qDebug() << "[DevicePoll] Poll already running, attempt" << m_attempt;
        return false;
    }

    m_running = true;
    m_attempt = 0;
    ++m_generation;
    DiagnosticLog::instance()->log(kTag, QStringLiteral("Looking for device '%1' (%2 attempts, %3 ms apart)")
        .arg(m_deviceName).arg(m_maxAttempts).arg(m_intervalMs));
    // First attempt runs on the next event loop pass
    m_timer->start(0);
    return true;
}

void DeviceDiscoveryPoller::cancel()
{
    if (!m_running)
        return;
    m_timer->stop();
    m_running = false;
    ++m_generation;
    qDebug() << "[DevicePoll] Cancelled after" << m_attempt << "attempts";
}

void DeviceDiscoveryPoller::scheduleNext()
{
    if (m_attempt >= m_maxAttempts) {
        m_running = false;
        DiagnosticLog::instance()->warn(kTag, QStringLiteral("Device '%1' not found after %2 attempts")
            .arg(m_deviceName).arg(m_attempt));
        emit exhausted();
        return;
    }
    m_timer->start(m_intervalMs);
}

void DeviceDiscoveryPoller::runAttempt()
{
    if (!m_running)
        return;

    const int attempt = ++m_attempt;
    const int generation = m_generation;

    if (!m_api) {
        emit attemptFailed(attempt, QStringLiteral("no Web API client"));
        scheduleNext();
        return;
    }

    QPointer<DeviceDiscoveryPoller> self(this);
    m_api->listDevices([self, attempt, generation](const QVector<RemoteDevice>& devices,
                                                   const std::optional<PlaybackError>& error) {
        if (!self || generation != self->m_generation || !self->m_running)
            return;

        if (error) {
            // Network/API errors are retried within the attempt budget
            DiagnosticLog::instance()->log(kTag, QStringLiteral("Attempt %1 failed: %2")
                .arg(attempt).arg(error->description()));
            emit self->attemptFailed(attempt, error->description());
            self->scheduleNext();
            return;
        }

        for (const RemoteDevice& device : devices) {
            if (device.name == self->m_deviceName) {
                self->m_running = false;
                DiagnosticLog::instance()->log(kTag, QStringLiteral("Found device %1 on attempt %2")
                    .arg(device.id).arg(attempt));
                emit self->deviceFound(device, attempt);
                return;
            }
        }

        qDebug() << "[DevicePoll] Attempt" << attempt << "- device not listed among" << devices.size();
        emit self->attemptFailed(attempt, QStringLiteral("device not listed"));
        self->scheduleNext();
    });
}
