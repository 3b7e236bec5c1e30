#ifndef IMAGESAVEUTILS_H
#define IMAGESAVEUTILS_H

#include <QByteArray>
#include <QImage>
#include <QString>

/**
 * @brief All-or-nothing writes for output images and sidecars
 *
 * Content is fully encoded in memory first and then committed through
 * QSaveFile, so a failed call never leaves a truncated file behind.
 */
class ImageSaveUtils
{
public:
    struct Error {
        QString message;
        QString stage; // format / encode / open / write / commit
    };

    static bool saveImageAtomically(const QImage& image,
                                    const QString& filePath,
                                    const QByteArray& explicitFormat = QByteArray(),
                                    Error* error = nullptr);

    static bool writeBytesAtomically(const QByteArray& data,
                                     const QString& filePath,
                                     Error* error = nullptr);

    // Encodes without touching the filesystem; empty on failure
    static QByteArray encodeImage(const QImage& image,
                                  const QByteArray& format,
                                  Error* error = nullptr);

    // Lower-case writer format for a path, "png" when the path has no suffix
    static QByteArray formatForPath(const QString& filePath,
                                    const QByteArray& explicitFormat = QByteArray());

    static QString describe(const Error& error);

private:
    static void setError(Error* error, const QString& stage, const QString& message);
};

#endif // IMAGESAVEUTILS_H
