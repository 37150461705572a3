#include "DiagnosticLog.h"

#include <QDebug>
#include <QMutexLocker>
#include <QStringList>

// ── Singleton ───────────────────────────────────────────────────────
DiagnosticLog* DiagnosticLog::instance()
{
    static DiagnosticLog s;
    return &s;
}

DiagnosticLog::DiagnosticLog(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<DiagnosticEntry>("DiagnosticEntry");
}

// ── log / warn ──────────────────────────────────────────────────────
void DiagnosticLog::log(const QString& source, const QString& message)
{
    qDebug().noquote() << QStringLiteral("[%1]").arg(source) << message;
    append(source, message);
}

void DiagnosticLog::warn(const QString& source, const QString& message)
{
    qWarning().noquote() << QStringLiteral("[%1]").arg(source) << message;
    append(source, message);
}

void DiagnosticLog::append(const QString& source, const QString& message)
{
    DiagnosticEntry entry{ QDateTime::currentDateTime(), source, message };
    {
        QMutexLocker lock(&m_mutex);
        m_entries.append(entry);
        if (m_entries.size() > kMaxEntries)
            m_entries.remove(0, m_entries.size() - kMaxEntries);
    }
    emit entryAdded(entry);
}

QVector<DiagnosticEntry> DiagnosticLog::entries() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries;
}

// ── formattedEntries: "[HH:mm:ss.zzz] [Source] message" per line ──
QString DiagnosticLog::formattedEntries() const
{
    QMutexLocker lock(&m_mutex);
    if (m_entries.isEmpty())
        return QStringLiteral("No logs available");

    QStringList lines;
    lines.reserve(m_entries.size());
    for (const auto& e : m_entries) {
        lines << QStringLiteral("[%1] [%2] %3")
                     .arg(e.timestamp.toString(QStringLiteral("HH:mm:ss.zzz")),
                          e.source, e.message);
    }
    return lines.join(QLatin1Char('\n'));
}

int DiagnosticLog::size() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.size();
}

void DiagnosticLog::clear()
{
    QMutexLocker lock(&m_mutex);
    m_entries.clear();
}

QString DiagnosticLog::redact(const QString& secret)
{
    if (secret.isEmpty())
        return QStringLiteral("(empty)");
    return secret.left(6) + QStringLiteral("…");
}
