#ifndef FRAME_H
#define FRAME_H

#include <QImage>
#include <QRect>

#include <vector>

/**
 * @brief One captured screen region
 *
 * Holds the pixel data, the region it was grabbed from (virtual-screen
 * coordinates) and its position in the capture sequence. Frames are never
 * modified after capture; the composition engine only reads them.
 */
struct Frame {
    QImage image;
    QRect region;        // Source region, kept for metadata only
    int captureIndex = 0;

    Frame() = default;
    Frame(const QImage &img, const QRect &sourceRegion, int index)
        : image(img)
        , region(sourceRegion)
        , captureIndex(index)
    {}

    bool isNull() const { return image.isNull(); }
    int width() const { return image.width(); }
    int height() const { return image.height(); }
    QSize size() const { return image.size(); }
};

using FrameSequence = std::vector<Frame>;

// Wraps plain images as frames in the given order, region = image rect.
inline FrameSequence framesFromImages(const std::vector<QImage> &images)
{
    FrameSequence frames;
    frames.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        frames.emplace_back(images[i], images[i].rect(), static_cast<int>(i));
    }
    return frames;
}

#endif // FRAME_H
