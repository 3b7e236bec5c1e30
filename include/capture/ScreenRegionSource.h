#ifndef SCREENREGIONSOURCE_H
#define SCREENREGIONSOURCE_H

#include "capture/ICaptureSource.h"

#include <QList>

class QScreen;

/**
 * @brief Grabs screen regions given in virtual-desktop coordinates
 *
 * Uses QScreen::grabWindow() on every screen a region touches and assembles
 * the pieces into one frame, so regions may span monitors. Parts of a region
 * that fall between screens stay black. Needs a QGuiApplication.
 */
class ScreenRegionSource : public ICaptureSource
{
public:
    explicit ScreenRegionSource(const QList<QRect> &regions);

    FrameCaptureResult captureFrames() override;
    QRect queryVirtualScreenBounds() const override;
    QString sourceName() const override { return QStringLiteral("Screen Regions"); }

    QList<QRect> regions() const { return m_regions; }

    // Region must be larger than this on both sides
    static constexpr int MIN_REGION_SIZE = 5;
    static bool isValidRegion(const QRect &region, const QRect &virtualBounds);

    struct ScreenPiece {
        int screenIndex = -1;
        QRect area;  // Virtual-desktop coordinates, inside the region
    };

    // Splits a region into the parts covered by each screen, in screen order
    static QList<ScreenPiece> splitAcrossScreens(const QRect &region, const QList<QRect> &screenGeometries);

private:
    QImage grabRegion(const QRect &region) const;
    QImage grabFromScreen(const QRect &area, QScreen *screen) const;

    QList<QRect> m_regions;
};

#endif // SCREENREGIONSOURCE_H
