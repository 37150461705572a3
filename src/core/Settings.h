#pragma once

#include <QObject>
#include <QSettings>
#include <QStringList>
#include <QUrl>

#include "../internalplayer/PlayerLaunchConfig.h"

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // ── Internal player ──────────────────────────────────────────────
    PlayerLaunchMode playerLaunchMode() const;
    void setPlayerLaunchMode(PlayerLaunchMode mode);

    QString devRepoPath() const;
    void setDevRepoPath(const QString& path);

    // Program + arguments run inside the dev repository
    QString devProgram() const;
    QStringList devArguments() const;
    void setDevCommand(const QString& program, const QStringList& arguments);

    QString helperName() const;
    void setHelperName(const QString& name);

    QStringList helperSearchPaths() const;
    void setHelperSearchPaths(const QStringList& paths);

    // Optional; injected into the player environment when non-empty
    QUrl backendBaseUrl() const;
    void setBackendBaseUrl(const QUrl& url);

    QUrl playerContentUrl() const;
    void setPlayerContentUrl(const QUrl& url);

    // Display name the player registers as a Spotify Connect device
    QString playerDeviceName() const;
    void setPlayerDeviceName(const QString& name);

    PlayerLaunchConfig playerLaunchConfig() const;

    // ── Spotify ──────────────────────────────────────────────────────
    QUrl webApiBaseUrl() const;
    void setWebApiBaseUrl(const QUrl& url);

    // Backend proxy for the device list; empty = query the Web API directly
    QUrl devicesProxyUrl() const;
    void setDevicesProxyUrl(const QUrl& url);

    // "internal" or "external"
    QString playbackBackendMode() const;
    void setPlaybackBackendMode(const QString& mode);

    // ── Generic access ───────────────────────────────────────────────
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);
    void sync() { m_settings.sync(); }

    static QString settingsPath();

signals:
    void playerConfigurationChanged();

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
