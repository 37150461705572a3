#pragma once

#include <QObject>
#include <QDateTime>
#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QVector>

struct DiagnosticEntry {
    QDateTime timestamp;
    QString   source;    // component tag, e.g. "PlayerProcess"
    QString   message;
};

Q_DECLARE_METATYPE(DiagnosticEntry)

// Collects player lifecycle and error events so they can be shown to the
// user when initialization stalls.  Every entry is also forwarded to the
// Qt message log with its component tag.
class DiagnosticLog : public QObject {
    Q_OBJECT

public:
    static DiagnosticLog* instance();

    void log(const QString& source, const QString& message);
    void warn(const QString& source, const QString& message);

    QVector<DiagnosticEntry> entries() const;
    QString formattedEntries() const;
    int size() const;
    void clear();

    // First six characters of a credential followed by an ellipsis
    static QString redact(const QString& secret);

signals:
    void entryAdded(const DiagnosticEntry& entry);

private:
    explicit DiagnosticLog(QObject* parent = nullptr);
    void append(const QString& source, const QString& message);

    mutable QMutex m_mutex;
    QVector<DiagnosticEntry> m_entries;

    static constexpr int kMaxEntries = 2000;
};
