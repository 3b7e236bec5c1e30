#include "capture/ImageFileSource.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageReader>

ImageFileSource::ImageFileSource(const QStringList &paths)
    : m_paths(paths)
{
}

FrameCaptureResult ImageFileSource::captureFrames()
{
    if (m_paths.isEmpty()) {
        return FrameCaptureResult::failure(CaptureError::EmptyInput, QStringLiteral("No images given"));
    }

    FrameCaptureResult result;
    result.frames.reserve(static_cast<size_t>(m_paths.size()));
    m_bounds = QRect();

    for (int i = 0; i < m_paths.size(); ++i) {
        const QString &path = m_paths.at(i);
        const QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            qWarning() << "ImageFileSource: Image not found:" << path;
            return FrameCaptureResult::failure(CaptureError::MissingFile,
                                               QStringLiteral("Image not found: %1").arg(path), path);
        }

        QImageReader reader(path);
        reader.setAutoTransform(true);
        const QImage image = reader.read();
        if (image.isNull()) {
            qWarning() << "ImageFileSource: Cannot decode" << path << "-" << reader.errorString();
            return FrameCaptureResult::failure(
                CaptureError::UnreadableFrame,
                QStringLiteral("Cannot read image %1: %2").arg(path, reader.errorString()), path);
        }

        result.frames.emplace_back(image, image.rect(), i);
        m_bounds = m_bounds.united(image.rect());
    }

    result.success = true;
    qDebug() << "ImageFileSource: Loaded" << result.frames.size() << "images";
    return result;
}

QRect ImageFileSource::queryVirtualScreenBounds() const
{
    return m_bounds;
}
