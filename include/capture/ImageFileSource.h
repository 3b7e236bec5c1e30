#ifndef IMAGEFILESOURCE_H
#define IMAGEFILESOURCE_H

#include "capture/ICaptureSource.h"

#include <QStringList>

/**
 * @brief Capture source backed by image files on disk
 *
 * Each path becomes one frame, in argument order, with region {0, 0, w, h}.
 */
class ImageFileSource : public ICaptureSource
{
public:
    explicit ImageFileSource(const QStringList &paths);

    FrameCaptureResult captureFrames() override;
    QRect queryVirtualScreenBounds() const override;
    QString sourceName() const override { return QStringLiteral("Image Files"); }

    QStringList paths() const { return m_paths; }

private:
    QStringList m_paths;
    QRect m_bounds;
};

#endif // IMAGEFILESOURCE_H
