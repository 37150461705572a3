#include "HelperLocator.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

QStringList HelperLocator::candidatePaths(const QString& helperName,
                                          const QStringList& extraDirs,
                                          const QString& appDir)
{
    QStringList paths;
    if (helperName.isEmpty())
        return paths;

    QString baseDir = appDir;
    if (baseDir.isEmpty() && QCoreApplication::instance())
        baseDir = QCoreApplication::applicationDirPath();

    if (!baseDir.isEmpty()) {
        QDir dir(baseDir);
        paths << dir.filePath(helperName);
        paths << QDir::cleanPath(dir.filePath(
            QStringLiteral("../Resources/%1.app/Contents/MacOS/%1").arg(helperName)));
        paths << QDir::cleanPath(dir.filePath(QStringLiteral("../Resources/") + helperName));
        paths << QDir::cleanPath(dir.filePath(QStringLiteral("../libexec/") + helperName));
    }

    for (const QString& extra : extraDirs) {
        if (extra.isEmpty()) continue;
        paths << QDir(extra).filePath(helperName);
    }
    return paths;
}

QString HelperLocator::locate(const QString& helperName,
                              const QStringList& extraDirs,
                              const QString& appDir)
{
    const QStringList candidates = candidatePaths(helperName, extraDirs, appDir);
    for (const QString& path : candidates) {
        QFileInfo fi(path);
        if (fi.exists() && fi.isFile() && fi.isExecutable()) {
            qDebug() << "[HelperLocator] Found" << helperName << "at" << fi.absoluteFilePath();
            return fi.absoluteFilePath();
        }
    }
    qWarning() << "[HelperLocator] Helper" << helperName << "not found in" << candidates;
    return QString();
}
