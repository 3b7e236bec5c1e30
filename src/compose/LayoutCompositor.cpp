#include "compose/LayoutCompositor.h"

#include <QDebug>
#include <QPainter>
#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
int maxFrameWidth(const FrameSequence &frames)
{
    int width = 0;
    for (const Frame &frame : frames) {
        width = std::max(width, frame.width());
    }
    return width;
}

int maxFrameHeight(const FrameSequence &frames)
{
    int height = 0;
    for (const Frame &frame : frames) {
        height = std::max(height, frame.height());
    }
    return height;
}

constexpr qint64 kMaxCanvasExtent = std::numeric_limits<int>::max();

qint64 gapTotal(int count, int spacing)
{
    return static_cast<qint64>(spacing) * std::max(0, count - 1);
}

bool fitsCanvas(qint64 width, qint64 height)
{
    return width <= kMaxCanvasExtent && height <= kMaxCanvasExtent;
}
} // namespace

int LayoutCompositor::defaultGridColumns(int frameCount)
{
    if (frameCount <= 0) {
        return 1;
    }

    // Integer ceil(sqrt(n)), avoids floating point rounding on perfect squares
    int columns = static_cast<int>(std::sqrt(static_cast<double>(frameCount)));
    while (columns * columns > frameCount) {
        --columns;
    }
    if (columns * columns < frameCount) {
        ++columns;
    }
    return std::max(1, columns);
}

LayoutCompositor::GridDimensions LayoutCompositor::gridDimensions(int frameCount, int requestedColumns)
{
    GridDimensions dims;
    dims.columns = requestedColumns > 0 ? requestedColumns : defaultGridColumns(frameCount);
    dims.rows = frameCount > 0 ? frameCount / dims.columns + (frameCount % dims.columns != 0 ? 1 : 0) : 0;
    return dims;
}

int LayoutCompositor::autoGridColumns(int frameCount)
{
    if (frameCount <= 2) {
        return 0;
    }
    if (frameCount <= AUTO_SMALL_GRID_MAX) {
        return AUTO_SMALL_GRID_COLUMNS;
    }
    return defaultGridColumns(frameCount);
}

LayoutUsed LayoutCompositor::resolveLayout(const FrameSequence &frames, MergeMethod method)
{
    if (frames.size() <= 1) {
        return LayoutUsed::Identity;
    }

    switch (method) {
    case MergeMethod::Vertical:
        return LayoutUsed::Vertical;
    case MergeMethod::Horizontal:
        return LayoutUsed::Horizontal;
    case MergeMethod::Grid:
        return LayoutUsed::Grid;
    case MergeMethod::Auto:
        break;
    }

    if (frames.size() == 2) {
        double aspectSum = 0.0;
        for (const Frame &frame : frames) {
            aspectSum += static_cast<double>(frame.width()) / std::max(1, frame.height());
        }
        const double meanAspect = aspectSum / static_cast<double>(frames.size());
        // Wide frames read better stacked top-to-bottom
        return meanAspect > AUTO_WIDE_ASPECT_RATIO ? LayoutUsed::Vertical : LayoutUsed::Horizontal;
    }

    return LayoutUsed::Grid;
}

LayoutCompositor::Placement LayoutCompositor::placeVertical(const FrameSequence &frames, int spacing)
{
    Placement placement;
    placement.layout = LayoutUsed::Vertical;

    const int canvasWidth = maxFrameWidth(frames);
    qint64 totalHeight = gapTotal(static_cast<int>(frames.size()), spacing);
    for (const Frame &frame : frames) {
        totalHeight += frame.height();
    }
    if (!fitsCanvas(canvasWidth, totalHeight)) {
        placement.oversized = true;
        return placement;
    }
    placement.canvasSize = QSize(canvasWidth, static_cast<int>(totalHeight));

    qint64 y = 0;
    for (const Frame &frame : frames) {
        placement.origins.emplace_back((canvasWidth - frame.width()) / 2, static_cast<int>(y));
        y += frame.height() + static_cast<qint64>(spacing);
    }
    return placement;
}

LayoutCompositor::Placement LayoutCompositor::placeHorizontal(const FrameSequence &frames, int spacing)
{
    Placement placement;
    placement.layout = LayoutUsed::Horizontal;

    const int canvasHeight = maxFrameHeight(frames);
    qint64 totalWidth = gapTotal(static_cast<int>(frames.size()), spacing);
    for (const Frame &frame : frames) {
        totalWidth += frame.width();
    }
    if (!fitsCanvas(totalWidth, canvasHeight)) {
        placement.oversized = true;
        return placement;
    }
    placement.canvasSize = QSize(static_cast<int>(totalWidth), canvasHeight);

    qint64 x = 0;
    for (const Frame &frame : frames) {
        placement.origins.emplace_back(static_cast<int>(x), (canvasHeight - frame.height()) / 2);
        x += frame.width() + static_cast<qint64>(spacing);
    }
    return placement;
}

LayoutCompositor::Placement LayoutCompositor::placeGrid(const FrameSequence &frames, int columns, int spacing)
{
    Placement placement;
    placement.layout = LayoutUsed::Grid;

    const GridDimensions dims = gridDimensions(static_cast<int>(frames.size()), columns);
    const int cellWidth = maxFrameWidth(frames);
    const int cellHeight = maxFrameHeight(frames);

    const qint64 canvasWidth = static_cast<qint64>(cellWidth) * dims.columns + gapTotal(dims.columns, spacing);
    const qint64 canvasHeight = static_cast<qint64>(cellHeight) * dims.rows + gapTotal(dims.rows, spacing);
    if (!fitsCanvas(canvasWidth, canvasHeight)) {
        placement.oversized = true;
        return placement;
    }
    placement.canvasSize = QSize(static_cast<int>(canvasWidth), static_cast<int>(canvasHeight));

    const qint64 strideX = static_cast<qint64>(cellWidth) + spacing;
    const qint64 strideY = static_cast<qint64>(cellHeight) + spacing;
    for (size_t i = 0; i < frames.size(); ++i) {
        const int row = static_cast<int>(i) / dims.columns;
        const int col = static_cast<int>(i) % dims.columns;
        const Frame &frame = frames[i];
        placement.origins.emplace_back(static_cast<int>(col * strideX + (cellWidth - frame.width()) / 2),
                                       static_cast<int>(row * strideY + (cellHeight - frame.height()) / 2));
    }
    return placement;
}

LayoutCompositor::Placement LayoutCompositor::computePlacement(const FrameSequence &frames,
                                                               const MergeSpec &spec)
{
    if (frames.size() <= 1) {
        Placement placement;
        placement.layout = LayoutUsed::Identity;
        if (!frames.empty()) {
            placement.canvasSize = frames.front().size();
            placement.origins.emplace_back(0, 0);
        }
        return placement;
    }

    const int spacing = std::max(0, spec.spacing);
    switch (resolveLayout(frames, spec.method)) {
    case LayoutUsed::Vertical:
        return placeVertical(frames, spacing);
    case LayoutUsed::Horizontal:
        return placeHorizontal(frames, spacing);
    case LayoutUsed::Grid: {
        const int columns = spec.method == MergeMethod::Auto
            ? autoGridColumns(static_cast<int>(frames.size()))
            : spec.gridColumns;
        return placeGrid(frames, columns, spacing);
    }
    case LayoutUsed::Identity:
        break;
    }
    return placeVertical(frames, spacing);
}

QImage LayoutCompositor::render(const FrameSequence &frames, const Placement &placement,
                                const QColor &background)
{
    QImage canvas(placement.canvasSize, QImage::Format_RGB32);
    if (canvas.isNull()) {
        qWarning() << "LayoutCompositor: Failed to allocate canvas" << placement.canvasSize;
        return QImage();
    }
    canvas.fill(background);

    QPainter painter(&canvas);
    // Paste pixels as-is, frames never blend with the background
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    for (size_t i = 0; i < frames.size(); ++i) {
        // Alpha is dropped, stored RGB is kept
        painter.drawImage(placement.origins[i], frames[i].image.convertToFormat(QImage::Format_RGB32));
    }
    painter.end();

    return canvas;
}

CompositionResult LayoutCompositor::compose(const FrameSequence &frames, const MergeSpec &spec)
{
    if (frames.empty()) {
        return CompositionResult::failure(CompositionError::EmptyInput, QStringLiteral("No frames to merge"));
    }

    for (const Frame &frame : frames) {
        if (frame.isNull()) {
            return CompositionResult::failure(
                CompositionError::InvalidFrame,
                QStringLiteral("Frame %1 has no pixel data").arg(frame.captureIndex));
        }
    }

    CompositionResult result;
    result.frameCount = static_cast<int>(frames.size());

    if (frames.size() == 1) {
        result.success = true;
        result.canvas = frames.front().image;
        result.layoutUsed = LayoutUsed::Identity;
        return result;
    }

    const Placement placement = computePlacement(frames, spec);
    if (placement.oversized) {
        qWarning() << "LayoutCompositor: Canvas extent exceeds" << kMaxCanvasExtent << "pixels";
        return CompositionResult::failure(CompositionError::InvalidFrame,
                                          QStringLiteral("Canvas too large for %1 frames with spacing %2")
                                              .arg(static_cast<int>(frames.size()))
                                              .arg(spec.spacing));
    }

    result.canvas = render(frames, placement, spec.background);
    if (result.canvas.isNull()) {
        result.error = CompositionError::InvalidFrame;
        result.failureReason = QStringLiteral("Canvas too large (%1x%2)")
            .arg(placement.canvasSize.width())
            .arg(placement.canvasSize.height());
        return result;
    }

    result.success = true;
    result.layoutUsed = placement.layout;
    qDebug() << "LayoutCompositor: Composed" << frames.size() << "frames as"
             << layoutUsedToString(placement.layout) << "canvas" << placement.canvasSize;
    return result;
}

QImage LayoutCompositor::composeVertical(const FrameSequence &frames, int spacing, const QColor &background)
{
    MergeSpec spec;
    spec.method = MergeMethod::Vertical;
    spec.spacing = spacing;
    spec.background = background;
    return compose(frames, spec).canvas;
}

QImage LayoutCompositor::composeHorizontal(const FrameSequence &frames, int spacing, const QColor &background)
{
    MergeSpec spec;
    spec.method = MergeMethod::Horizontal;
    spec.spacing = spacing;
    spec.background = background;
    return compose(frames, spec).canvas;
}

QImage LayoutCompositor::composeGrid(const FrameSequence &frames, int columns, int spacing,
                                     const QColor &background)
{
    MergeSpec spec;
    spec.method = MergeMethod::Grid;
    spec.gridColumns = columns;
    spec.spacing = spacing;
    spec.background = background;
    return compose(frames, spec).canvas;
}
