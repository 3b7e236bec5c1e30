#ifndef CAPTUREHISTORY_H
#define CAPTUREHISTORY_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QtGlobal>

struct CaptureHistoryEntry
{
    QString filename;
    QString filepath;      // Absolute
    QString metadataPath;  // Empty when the sidecar is missing
    QDateTime modified;
    qint64 size = 0;
};

struct CaptureListing
{
    QList<CaptureHistoryEntry> entries;  // Newest first, at most the requested limit
    int total = 0;                       // All captures found, before the limit
};

/**
 * @brief Lists saved captures (capture_*.png) in an output directory
 *
 * Entries are ordered by modification time, newest first. Equal times are
 * ordered by file name, descending, which follows the timestamped names.
 * A missing directory yields an empty listing.
 */
class CaptureHistory
{
public:
    static constexpr int DEFAULT_LIMIT = 10;

    // limit <= 0 returns every capture
    static CaptureListing list(const QString& directory, int limit = DEFAULT_LIMIT);

    static QByteArray toJson(const CaptureListing& listing);
};

#endif // CAPTUREHISTORY_H
