#include "PlayerReadinessStateMachine.h"
#include "../core/DiagnosticLog.h"

#include <QDebug>

namespace {
const QString kTag = QStringLiteral("Readiness");
}

PlayerReadinessStateMachine::PlayerReadinessStateMachine(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<PlaybackError>("PlaybackError");
}

QString PlayerReadinessStateMachine::readinessName(BackendReadiness readiness)
{
    switch (readiness) {
    case BackendReadiness::Uninitialized:     return QStringLiteral("Uninitialized");
    case BackendReadiness::ProcessStarting:   return QStringLiteral("ProcessStarting");
    case BackendReadiness::ContentLoading:    return QStringLiteral("ContentLoading");
    case BackendReadiness::CredentialPending: return QStringLiteral("CredentialPending");
    case BackendReadiness::ConnectingDevice:  return QStringLiteral("ConnectingDevice");
    case BackendReadiness::DiscoveringDevice: return QStringLiteral("DiscoveringDevice");
    case BackendReadiness::Ready:             return QStringLiteral("Ready");
    case BackendReadiness::Degraded:          return QStringLiteral("Degraded");
    }
    return QStringLiteral("?");
}

// ═════════════════════════════════════════════════════════════════════
//  Public input methods
// ═════════════════════════════════════════════════════════════════════

bool PlayerReadinessStateMachine::start()
{
    if (m_readiness != BackendReadiness::Uninitialized &&
        m_readiness != BackendReadiness::Degraded) {
        qDebug() << "[Readiness] start() ignored in" << readinessName(m_readiness);
        return false;
    }

    m_lastError.reset();
    setReadiness(BackendReadiness::ProcessStarting);
    emit startProcessRequested();
    return true;
}

void PlayerReadinessStateMachine::onProcessStarted(bool contentAlreadyLoaded)
{
    if (m_readiness != BackendReadiness::ProcessStarting)
        return;

    setReadiness(BackendReadiness::ContentLoading);
    if (contentAlreadyLoaded) {
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Reused player already has content loaded"));
        onContentLoaded();
    } else {
        emit loadContentRequested();
    }
}

void PlayerReadinessStateMachine::onProcessFailed(const PlaybackError& error)
{
    if (m_readiness == BackendReadiness::Uninitialized)
        return;

    m_lastError = error;
    DiagnosticLog::instance()->warn(kTag, QStringLiteral("Initialization failed in %1: %2")
        .arg(readinessName(m_readiness), error.description()));
    setReadiness(BackendReadiness::Degraded);
    emit failed(error);
}

void PlayerReadinessStateMachine::onContentLoaded()
{
    if (m_readiness != BackendReadiness::ContentLoading)
        return;

    setReadiness(BackendReadiness::CredentialPending);
    emit credentialRequested();
}

void PlayerReadinessStateMachine::onCredentialSent()
{
    if (m_readiness != BackendReadiness::CredentialPending)
        return;

    setReadiness(BackendReadiness::ConnectingDevice);
    emit connectRequested();
    // The device list is polled alongside the connect attempt
    emit discoveryRequested();
}

void PlayerReadinessStateMachine::onCredentialAcknowledged()
{
    switch (m_readiness) {
    case BackendReadiness::CredentialPending:
    case BackendReadiness::ConnectingDevice:
    case BackendReadiness::DiscoveringDevice:
        emit discoveryRequested();
        break;
    default:
        break;
    }
}

void PlayerReadinessStateMachine::onDeviceReady(const QString& deviceId)
{
    switch (m_readiness) {
    case BackendReadiness::Uninitialized:
    case BackendReadiness::ProcessStarting:
    case BackendReadiness::ContentLoading:
        qDebug() << "[Readiness] Ignoring ready event in" << readinessName(m_readiness);
        return;
    default:
        break;
    }

    if (deviceId.isEmpty()) {
        if (m_readiness == BackendReadiness::Ready)
            return;
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Ready event without device id, discovering"));
        setReadiness(BackendReadiness::DiscoveringDevice);
        emit discoveryRequested();
        return;
    }

    adoptDevice(deviceId);
}

void PlayerReadinessStateMachine::onConnectResult(bool ok)
{
    if (m_readiness != BackendReadiness::ConnectingDevice &&
        m_readiness != BackendReadiness::DiscoveringDevice)
        return;

    if (!ok) {
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Connect failed, relying on device poll"));
        setReadiness(BackendReadiness::DiscoveringDevice);
        emit discoveryRequested();
        return;
    }

    setReadiness(BackendReadiness::Ready);
    if (m_deviceId.isEmpty())
        emit discoveryRequested();
}

void PlayerReadinessStateMachine::onDeviceDiscovered(const QString& deviceId)
{
    if (deviceId.isEmpty())
        return;

    switch (m_readiness) {
    case BackendReadiness::CredentialPending:
    case BackendReadiness::ConnectingDevice:
    case BackendReadiness::DiscoveringDevice:
    case BackendReadiness::Degraded:
        adoptDevice(deviceId);
        break;
    case BackendReadiness::Ready:
        if (m_deviceId.isEmpty()) {
            adoptDevice(deviceId);
            break;
        }
        // Local ready event won the race
        qDebug() << "[Readiness] Already ready with" << m_deviceId << "- ignoring poll result" << deviceId;
        break;
    default:
        qDebug() << "[Readiness] Ignoring discovered device in" << readinessName(m_readiness);
        break;
    }
}

void PlayerReadinessStateMachine::onDeviceRediscovered(const QString& deviceId)
{
    if (deviceId.isEmpty() || m_readiness == BackendReadiness::Uninitialized)
        return;

    if (deviceId != m_deviceId) {
        DiagnosticLog::instance()->log(kTag, QStringLiteral("Device id replaced %1 -> %2")
            .arg(m_deviceId.isEmpty() ? QStringLiteral("(none)") : m_deviceId, deviceId));
    }
    adoptDevice(deviceId);
}

void PlayerReadinessStateMachine::onDiscoveryExhausted()
{
    if (m_readiness == BackendReadiness::Ready)
        return;
    DiagnosticLog::instance()->warn(kTag, QStringLiteral("Device not found by polling, still %1")
        .arg(readinessName(m_readiness)));
}

void PlayerReadinessStateMachine::onDeviceNotReady(const QString& deviceId)
{
    if (m_readiness != BackendReadiness::Ready || deviceId != m_deviceId)
        return;

    DiagnosticLog::instance()->warn(kTag, QStringLiteral("Device %1 went offline").arg(deviceId));
    setReadiness(BackendReadiness::Degraded);
}

void PlayerReadinessStateMachine::onPlayerError(const PlaybackError& error)
{
    m_lastError = error;
    if (m_readiness == BackendReadiness::Ready)
        setReadiness(BackendReadiness::Degraded);
}

void PlayerReadinessStateMachine::onProcessExited()
{
    if (m_readiness == BackendReadiness::Uninitialized)
        return;

    m_deviceId.clear();
    setReadiness(BackendReadiness::Degraded);
}

void PlayerReadinessStateMachine::reset()
{
    m_deviceId.clear();
    m_lastError.reset();
    setReadiness(BackendReadiness::Uninitialized);
}

// ═════════════════════════════════════════════════════════════════════
//  Internals
// ═════════════════════════════════════════════════════════════════════

void PlayerReadinessStateMachine::adoptDevice(const QString& deviceId)
{
    m_deviceId = deviceId;
    DiagnosticLog::instance()->log(kTag, QStringLiteral("Device id %1").arg(deviceId));
    setReadiness(BackendReadiness::Ready);
}

void PlayerReadinessStateMachine::setReadiness(BackendReadiness newState)
{
    if (m_readiness == newState) return;

    const bool wasReady = m_readiness == BackendReadiness::Ready;
    const BackendReadiness oldState = m_readiness;
    m_readiness = newState;

    DiagnosticLog::instance()->log(kTag, QStringLiteral("%1 -> %2")
        .arg(readinessName(oldState), readinessName(newState)));

    emit readinessChanged(newState);
    if (wasReady != (newState == BackendReadiness::Ready))
        emit readyChanged(newState == BackendReadiness::Ready);
}
