#ifndef CAPTUREMETADATA_H
#define CAPTUREMETADATA_H

#include "compose/CompositionTypes.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QRect>
#include <QString>

/**
 * @brief Record written beside every saved capture
 */
struct CaptureMetadata {
    QString description;
    QDateTime timestamp;               // Local time, seconds precision
    int captures = 0;
    bool merged = false;               // captures > 1
    QString filepath;                  // Absolute path of the image
    QList<QRect> regions;              // Capture order
    int recaptureIteration = 0;        // 0 for the first attempt
    MergeMethod mergeMethod = MergeMethod::Auto;
};

class CaptureMetadataStore
{
public:
    struct Error {
        QString message;
        QString stage; // parse / read / write
    };

    static QJsonObject toJson(const CaptureMetadata &metadata);
    static bool fromJson(const QJsonObject &json, CaptureMetadata *metadata, Error *error = nullptr);

    static bool save(const CaptureMetadata &metadata, const QString &path, Error *error = nullptr);
    static bool load(const QString &path, CaptureMetadata *metadata, Error *error = nullptr);

    // Same directory and base name as the image, ".json" suffix
    static QString sidecarPathFor(const QString &imagePath);

    static QString formatTimestamp(const QDateTime &timestamp);

    static constexpr const char* kKeyDescription = "description";
    static constexpr const char* kKeyTimestamp = "timestamp";
    static constexpr const char* kKeyCaptures = "captures";
    static constexpr const char* kKeyMerged = "merged";
    static constexpr const char* kKeyFilepath = "filepath";
    static constexpr const char* kKeyRegions = "regions";
    static constexpr const char* kKeyRecaptureIteration = "recapture_iteration";
    static constexpr const char* kKeyMergeMethod = "merge_method";

private:
    static void setError(Error *error, const QString &stage, const QString &message);
};

#endif // CAPTUREMETADATA_H
