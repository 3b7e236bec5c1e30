#include "utils/ImageSaveUtils.h"

#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImageWriter>
#include <QSaveFile>

namespace {

QByteArray normalizeFormat(QByteArray format)
{
    format = format.trimmed().toLower();
    while (format.startsWith('.')) {
        format.remove(0, 1);
    }
    if (format == "jpg") {
        return QByteArrayLiteral("jpeg");
    }
    if (format == "tif") {
        return QByteArrayLiteral("tiff");
    }
    return format;
}

QString orFallback(const QString& message, const char* fallback)
{
    const QString trimmed = message.trimmed();
    return trimmed.isEmpty() ? QString::fromLatin1(fallback) : trimmed;
}

} // namespace

QByteArray ImageSaveUtils::formatForPath(const QString& filePath, const QByteArray& explicitFormat)
{
    QByteArray format = normalizeFormat(explicitFormat);
    if (format.isEmpty()) {
        format = normalizeFormat(QFileInfo(filePath).suffix().toLatin1());
    }
    if (format.isEmpty()) {
        format = QByteArrayLiteral("png");
    }
    return format;
}

QByteArray ImageSaveUtils::encodeImage(const QImage& image, const QByteArray& format, Error* error)
{
    if (image.isNull()) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Image is null"));
        return QByteArray();
    }

    const QByteArray normalized = normalizeFormat(format);
    if (!QImageWriter::supportedImageFormats().contains(normalized)) {
        setError(error, QStringLiteral("format"),
                 QStringLiteral("Unsupported image format '%1'").arg(QString::fromLatin1(normalized)));
        return QByteArray();
    }

    QByteArray encoded;
    QBuffer buffer(&encoded);
    buffer.open(QIODevice::WriteOnly);
    QImageWriter writer(&buffer, normalized);
    if (!writer.write(image)) {
        setError(error, QStringLiteral("encode"),
                 orFallback(writer.errorString(), "Failed to encode image"));
        return QByteArray();
    }
    return encoded;
}

bool ImageSaveUtils::writeBytesAtomically(const QByteArray& data, const QString& filePath, Error* error)
{
    const QFileInfo info(filePath);
    if (!info.absoluteDir().exists()) {
        setError(error, QStringLiteral("open"),
                 QStringLiteral("Directory does not exist: %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile saveFile(filePath);
    // Some filesystems allow writing the target but not creating a temp sibling
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("open"),
                 orFallback(saveFile.errorString(), "Failed to open output file"));
        return false;
    }

    if (saveFile.write(data) != data.size()) {
        const QString writeError = saveFile.errorString();
        saveFile.cancelWriting();
        setError(error, QStringLiteral("write"), orFallback(writeError, "Short write"));
        return false;
    }

    if (!saveFile.commit()) {
        setError(error, QStringLiteral("commit"),
                 orFallback(saveFile.errorString(), "Failed to commit output file"));
        return false;
    }

    return true;
}

bool ImageSaveUtils::saveImageAtomically(const QImage& image,
                                         const QString& filePath,
                                         const QByteArray& explicitFormat,
                                         Error* error)
{
    const QByteArray encoded = encodeImage(image, formatForPath(filePath, explicitFormat), error);
    if (encoded.isEmpty()) {
        return false;
    }

    if (!writeBytesAtomically(encoded, filePath, error)) {
        qWarning() << "ImageSaveUtils: Failed to save" << filePath;
        return false;
    }
    return true;
}

QString ImageSaveUtils::describe(const Error& error)
{
    if (error.stage.isEmpty()) {
        return error.message;
    }
    return QStringLiteral("%1 (%2)").arg(error.message, error.stage);
}

void ImageSaveUtils::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}
