#ifndef LAYOUTCOMPOSITOR_H
#define LAYOUTCOMPOSITOR_H

#include "compose/CompositionTypes.h"
#include "compose/Frame.h"

#include <QColor>
#include <QPoint>
#include <QSize>

#include <vector>

/**
 * @brief Arranges an ordered frame sequence onto a single canvas
 *
 * Layouts:
 * - Vertical: stacked top-to-bottom, each frame horizontally centered
 * - Horizontal: left-to-right, each frame vertically centered
 * - Grid: row-major cells of the largest frame size, frames centered in cells
 * - Auto: picked from the frame count and aspect ratios
 *
 * Geometry is a pure function of the frame sizes and the MergeSpec, so the
 * same input always yields the same canvas. Frames are placed in capture
 * order and never reordered. A single frame is returned unchanged.
 */
class LayoutCompositor
{
public:
    struct GridDimensions {
        int columns = 0;
        int rows = 0;
    };

    struct Placement {
        QSize canvasSize;
        std::vector<QPoint> origins;  // Top-left of each frame, capture order
        LayoutUsed layout = LayoutUsed::Identity;
        bool oversized = false;  // Extent does not fit in int; no origins computed
    };

    static CompositionResult compose(const FrameSequence &frames, const MergeSpec &spec);

    // Convenience wrappers for the individual layouts
    static QImage composeVertical(const FrameSequence &frames, int spacing, const QColor &background);
    static QImage composeHorizontal(const FrameSequence &frames, int spacing, const QColor &background);
    static QImage composeGrid(const FrameSequence &frames, int columns, int spacing,
                              const QColor &background);

    // Concrete layout Auto resolves to for these frames (Identity for a single frame)
    static LayoutUsed resolveLayout(const FrameSequence &frames, MergeMethod method);

    // Column count Auto uses for a grid, or 0 when Auto does not pick a grid
    static int autoGridColumns(int frameCount);

    static GridDimensions gridDimensions(int frameCount, int requestedColumns = 0);
    static int defaultGridColumns(int frameCount);

    static Placement computePlacement(const FrameSequence &frames, const MergeSpec &spec);

private:
    static Placement placeVertical(const FrameSequence &frames, int spacing);
    static Placement placeHorizontal(const FrameSequence &frames, int spacing);
    static Placement placeGrid(const FrameSequence &frames, int columns, int spacing);
    static QImage render(const FrameSequence &frames, const Placement &placement,
                         const QColor &background);

    static constexpr double AUTO_WIDE_ASPECT_RATIO = 1.5;  // Above: two frames stack vertically
    static constexpr int AUTO_SMALL_GRID_MAX = 4;          // Up to this many frames: 2 columns
    static constexpr int AUTO_SMALL_GRID_COLUMNS = 2;
};

#endif // LAYOUTCOMPOSITOR_H
