#include "session/CaptureHistory.h"

#include "metadata/CaptureMetadata.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

CaptureListing CaptureHistory::list(const QString& directory, int limit)
{
    CaptureListing listing;

    QDir dir(directory);
    if (!dir.exists()) {
        qDebug() << "CaptureHistory: Directory does not exist" << directory;
        return listing;
    }

    const QFileInfoList files = dir.entryInfoList(
        QStringList() << "capture_*.png",
        QDir::Files | QDir::Readable,
        QDir::Name);

    QList<CaptureHistoryEntry> entries;
    entries.reserve(files.size());

    for (const QFileInfo& fileInfo : files) {
        CaptureHistoryEntry entry;
        entry.filename = fileInfo.fileName();
        entry.filepath = fileInfo.absoluteFilePath();
        entry.modified = fileInfo.lastModified();
        entry.size = fileInfo.size();

        const QString sidecar = CaptureMetadataStore::sidecarPathFor(entry.filepath);
        if (QFile::exists(sidecar)) {
            entry.metadataPath = sidecar;
        }
        entries.append(entry);
    }

    std::sort(entries.begin(), entries.end(),
              [](const CaptureHistoryEntry& lhs, const CaptureHistoryEntry& rhs) {
        if (lhs.modified != rhs.modified) {
            return lhs.modified > rhs.modified;
        }
        return lhs.filename > rhs.filename;
    });

    listing.total = static_cast<int>(entries.size());
    if (limit > 0 && entries.size() > limit) {
        entries = entries.mid(0, limit);
    }
    listing.entries = entries;
    return listing;
}

QByteArray CaptureHistory::toJson(const CaptureListing& listing)
{
    QJsonArray captures;
    for (const CaptureHistoryEntry& entry : listing.entries) {
        QJsonObject obj;
        obj["filename"] = entry.filename;
        obj["filepath"] = entry.filepath;
        obj["timestamp"] = entry.modified.toString(Qt::ISODate);
        obj["size"] = entry.size;
        if (!entry.metadataPath.isEmpty()) {
            obj["metadata_file"] = entry.metadataPath;
        }
        captures.append(obj);
    }

    QJsonObject root;
    root["captures"] = captures;
    root["total"] = listing.total;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}
