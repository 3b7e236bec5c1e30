#include "metadata/CaptureMetadata.h"
#include "utils/ImageSaveUtils.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace
{
QJsonObject regionToJson(const QRect &region)
{
    QJsonObject json;
    json["x"] = region.x();
    json["y"] = region.y();
    json["width"] = region.width();
    json["height"] = region.height();
    return json;
}

QRect regionFromJson(const QJsonObject &json)
{
    return QRect(json.value("x").toInt(), json.value("y").toInt(),
                 json.value("width").toInt(), json.value("height").toInt());
}
} // namespace

QString CaptureMetadataStore::formatTimestamp(const QDateTime &timestamp)
{
    return timestamp.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss"));
}

QString CaptureMetadataStore::sidecarPathFor(const QString &imagePath)
{
    const QFileInfo info(imagePath);
    return QDir(info.path()).filePath(info.completeBaseName() + QStringLiteral(".json"));
}

QJsonObject CaptureMetadataStore::toJson(const CaptureMetadata &metadata)
{
    QJsonArray regions;
    for (const QRect &region : metadata.regions) {
        regions.append(regionToJson(region));
    }

    QJsonObject json;
    json[kKeyDescription] = metadata.description;
    json[kKeyTimestamp] = formatTimestamp(metadata.timestamp);
    json[kKeyCaptures] = metadata.captures;
    json[kKeyMerged] = metadata.merged;
    json[kKeyFilepath] = metadata.filepath;
    json[kKeyRegions] = regions;
    json[kKeyRecaptureIteration] = metadata.recaptureIteration;
    json[kKeyMergeMethod] = mergeMethodToString(metadata.mergeMethod);
    return json;
}

bool CaptureMetadataStore::fromJson(const QJsonObject &json, CaptureMetadata *metadata, Error *error)
{
    if (!metadata) {
        setError(error, QStringLiteral("parse"), QStringLiteral("No output record"));
        return false;
    }

    CaptureMetadata parsed;
    parsed.description = json.value(kKeyDescription).toString();

    const QString timestamp = json.value(kKeyTimestamp).toString();
    parsed.timestamp = QDateTime::fromString(timestamp, Qt::ISODate);
    if (!parsed.timestamp.isValid()) {
        setError(error, QStringLiteral("parse"),
                 QStringLiteral("Invalid timestamp '%1'").arg(timestamp));
        return false;
    }

    if (!json.value(kKeyCaptures).isDouble()) {
        setError(error, QStringLiteral("parse"), QStringLiteral("Missing capture count"));
        return false;
    }
    parsed.captures = json.value(kKeyCaptures).toInt();
    parsed.merged = json.value(kKeyMerged).toBool(parsed.captures > 1);
    parsed.filepath = json.value(kKeyFilepath).toString();
    parsed.recaptureIteration = json.value(kKeyRecaptureIteration).toInt();

    const QJsonArray regions = json.value(kKeyRegions).toArray();
    for (const QJsonValue &value : regions) {
        parsed.regions.append(regionFromJson(value.toObject()));
    }

    const QString method = json.value(kKeyMergeMethod).toString(QStringLiteral("auto"));
    if (!mergeMethodFromString(method, &parsed.mergeMethod)) {
        setError(error, QStringLiteral("parse"),
                 QStringLiteral("Unknown merge method '%1'").arg(method));
        return false;
    }

    *metadata = parsed;
    return true;
}

bool CaptureMetadataStore::save(const CaptureMetadata &metadata, const QString &path, Error *error)
{
    const QByteArray data = QJsonDocument(toJson(metadata)).toJson(QJsonDocument::Indented);

    ImageSaveUtils::Error writeError;
    if (!ImageSaveUtils::writeBytesAtomically(data, path, &writeError)) {
        qWarning() << "CaptureMetadataStore: Failed to write" << path << writeError.message;
        setError(error, QStringLiteral("write"), ImageSaveUtils::describe(writeError));
        return false;
    }
    return true;
}

bool CaptureMetadataStore::load(const QString &path, CaptureMetadata *metadata, Error *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("read"), file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(error, QStringLiteral("parse"),
                 parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                              : QStringLiteral("Not a JSON object"));
        return false;
    }

    return fromJson(doc.object(), metadata, error);
}

void CaptureMetadataStore::setError(Error *error, const QString &stage, const QString &message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}
