#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/ElectricSlideshow/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/ElectricSlideshow"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Internal player ─────────────────────────────────────────────────

PlayerLaunchMode Settings::playerLaunchMode() const
{
    const QString fallback = launchModeName(PlayerLaunchConfig().mode);
    const QString mode = m_settings.value(QStringLiteral("internalPlayer/launchMode"), fallback).toString();
    return mode == QStringLiteral("dev") ? PlayerLaunchMode::Dev : PlayerLaunchMode::Packaged;
}

void Settings::setPlayerLaunchMode(PlayerLaunchMode mode)
{
    m_settings.setValue(QStringLiteral("internalPlayer/launchMode"), launchModeName(mode));
    emit playerConfigurationChanged();
}

QString Settings::devRepoPath() const
{
    return m_settings.value(QStringLiteral("internalPlayer/devRepoPath"),
                            QDir::homePath() + QStringLiteral("/Projects/electric-slideshow-internal-player"))
        .toString();
}

void Settings::setDevRepoPath(const QString& path)
{
    m_settings.setValue(QStringLiteral("internalPlayer/devRepoPath"), path);
    emit playerConfigurationChanged();
}

QString Settings::devProgram() const
{
    return m_settings.value(QStringLiteral("internalPlayer/devProgram"),
                            PlayerLaunchConfig().devProgram).toString();
}

QStringList Settings::devArguments() const
{
    return m_settings.value(QStringLiteral("internalPlayer/devArguments"),
                            PlayerLaunchConfig().devArguments).toStringList();
}

void Settings::setDevCommand(const QString& program, const QStringList& arguments)
{
    m_settings.setValue(QStringLiteral("internalPlayer/devProgram"), program);
    m_settings.setValue(QStringLiteral("internalPlayer/devArguments"), arguments);
    emit playerConfigurationChanged();
}

QString Settings::helperName() const
{
    return m_settings.value(QStringLiteral("internalPlayer/helperName"),
                            PlayerLaunchConfig().helperName).toString();
}

void Settings::setHelperName(const QString& name)
{
    m_settings.setValue(QStringLiteral("internalPlayer/helperName"), name);
    emit playerConfigurationChanged();
}

QStringList Settings::helperSearchPaths() const
{
    return m_settings.value(QStringLiteral("internalPlayer/helperSearchPaths")).toStringList();
}

void Settings::setHelperSearchPaths(const QStringList& paths)
{
    m_settings.setValue(QStringLiteral("internalPlayer/helperSearchPaths"), paths);
    emit playerConfigurationChanged();
}

QUrl Settings::backendBaseUrl() const
{
    return QUrl(m_settings.value(QStringLiteral("internalPlayer/backendBaseUrl"),
                                 QStringLiteral("https://electric-slideshow-server.onrender.com"))
                    .toString());
}

void Settings::setBackendBaseUrl(const QUrl& url)
{
    m_settings.setValue(QStringLiteral("internalPlayer/backendBaseUrl"), url.toString());
    emit playerConfigurationChanged();
}

QUrl Settings::playerContentUrl() const
{
    return QUrl(m_settings.value(QStringLiteral("internalPlayer/contentUrl"),
                                 PlayerLaunchConfig().contentUrl.toString())
                    .toString());
}

void Settings::setPlayerContentUrl(const QUrl& url)
{
    m_settings.setValue(QStringLiteral("internalPlayer/contentUrl"), url.toString());
    emit playerConfigurationChanged();
}

QString Settings::playerDeviceName() const
{
    return m_settings.value(QStringLiteral("internalPlayer/deviceName"),
                            PlayerLaunchConfig().deviceName).toString();
}

void Settings::setPlayerDeviceName(const QString& name)
{
    m_settings.setValue(QStringLiteral("internalPlayer/deviceName"), name);
    emit playerConfigurationChanged();
}

PlayerLaunchConfig Settings::playerLaunchConfig() const
{
    PlayerLaunchConfig config;
    config.mode = playerLaunchMode();
    config.devRepoPath = devRepoPath();
    config.devProgram = devProgram();
    config.devArguments = devArguments();
    config.helperName = helperName();
    config.helperSearchPaths = helperSearchPaths();
    config.contentUrl = playerContentUrl();
    config.deviceName = playerDeviceName();
    return config;
}

// ── Spotify ─────────────────────────────────────────────────────────

QUrl Settings::webApiBaseUrl() const
{
    return QUrl(m_settings.value(QStringLiteral("spotify/apiBaseUrl"),
                                 QStringLiteral("https://api.spotify.com/v1")).toString());
}

void Settings::setWebApiBaseUrl(const QUrl& url)
{
    m_settings.setValue(QStringLiteral("spotify/apiBaseUrl"), url.toString());
}

QUrl Settings::devicesProxyUrl() const
{
    return QUrl(m_settings.value(QStringLiteral("spotify/devicesProxyUrl")).toString());
}

void Settings::setDevicesProxyUrl(const QUrl& url)
{
    m_settings.setValue(QStringLiteral("spotify/devicesProxyUrl"), url.toString());
}

QString Settings::playbackBackendMode() const
{
    return m_settings.value(QStringLiteral("playback/backendMode"), QStringLiteral("internal")).toString();
}

void Settings::setPlaybackBackendMode(const QString& mode)
{
    m_settings.setValue(QStringLiteral("playback/backendMode"), mode);
}

// ── Generic access ──────────────────────────────────────────────────

QVariant Settings::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings.value(key, defaultValue);
}

void Settings::setValue(const QString& key, const QVariant& value)
{
    m_settings.setValue(key, value);
}

void Settings::remove(const QString& key)
{
    m_settings.remove(key);
}
