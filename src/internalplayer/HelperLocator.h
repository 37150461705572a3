#pragma once

#include <QString>
#include <QStringList>

// Resolves the packaged player helper shipped next to (or inside the bundle
// of) the running application.
class HelperLocator {
public:
    // Search order:
    //   <appDir>/<name>
    //   <appDir>/../Resources/<name>.app/Contents/MacOS/<name>
    //   <appDir>/../Resources/<name>
    //   <appDir>/../libexec/<name>
    //   each of extraDirs/<name>
    static QStringList candidatePaths(const QString& helperName,
                                      const QStringList& extraDirs = {},
                                      const QString& appDir = QString());

    // First existing executable file, or an empty string
    static QString locate(const QString& helperName,
                          const QStringList& extraDirs = {},
                          const QString& appDir = QString());
};
