#include "capture/ScreenRegionSource.h"

#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QPainter>
#include <QPixmap>
#include <QScreen>

namespace
{
QString regionToString(const QRect &region)
{
    return QStringLiteral("%1,%2,%3,%4")
        .arg(region.x()).arg(region.y()).arg(region.width()).arg(region.height());
}
} // namespace

ScreenRegionSource::ScreenRegionSource(const QList<QRect> &regions)
    : m_regions(regions)
{
}

bool ScreenRegionSource::isValidRegion(const QRect &region, const QRect &virtualBounds)
{
    if (region.width() <= MIN_REGION_SIZE || region.height() <= MIN_REGION_SIZE) {
        return false;
    }
    return virtualBounds.contains(region);
}

QRect ScreenRegionSource::queryVirtualScreenBounds() const
{
    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        return QRect();
    }

    QRect bounds;
    for (QScreen *screen : QGuiApplication::screens()) {
        bounds = bounds.united(screen->geometry());
    }
    return bounds;
}

QList<ScreenRegionSource::ScreenPiece> ScreenRegionSource::splitAcrossScreens(
    const QRect &region, const QList<QRect> &screenGeometries)
{
    QList<ScreenPiece> pieces;
    for (int i = 0; i < screenGeometries.size(); ++i) {
        ScreenPiece piece;
        piece.screenIndex = i;
        piece.area = region.intersected(screenGeometries.at(i));
        if (!piece.area.isEmpty()) {
            pieces.append(piece);
        }
    }
    return pieces;
}

QImage ScreenRegionSource::grabFromScreen(const QRect &area, QScreen *screen) const
{
    // grabWindow(0, ...) takes coordinates relative to the screen
    const QRect screenGeom = screen->geometry();
    const QPixmap pixmap = screen->grabWindow(0,
                                              area.x() - screenGeom.x(),
                                              area.y() - screenGeom.y(),
                                              area.width(),
                                              area.height());
    if (pixmap.isNull()) {
        return QImage();
    }

    QImage image = pixmap.toImage();
    // Keep logical size so frames line up with the requested regions on HiDPI screens
    if (image.size() != area.size()) {
        image = image.scaled(area.size(), Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    }
    image.setDevicePixelRatio(1.0);
    return image;
}

QImage ScreenRegionSource::grabRegion(const QRect &region) const
{
    const QList<QScreen*> screens = QGuiApplication::screens();
    QList<QRect> geometries;
    for (QScreen *screen : screens) {
        geometries.append(screen->geometry());
    }

    const QList<ScreenPiece> pieces = splitAcrossScreens(region, geometries);
    if (pieces.isEmpty()) {
        return QImage();
    }
    if (pieces.size() == 1 && pieces.first().area == region) {
        return grabFromScreen(region, screens.at(pieces.first().screenIndex));
    }

    QImage assembled(region.size(), QImage::Format_RGB32);
    if (assembled.isNull()) {
        return QImage();
    }
    assembled.fill(Qt::black);

    QPainter painter(&assembled);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    for (const ScreenPiece &piece : pieces) {
        QScreen *screen = screens.at(piece.screenIndex);
        const QImage part = grabFromScreen(piece.area, screen);
        if (part.isNull()) {
            qWarning() << "ScreenRegionSource: Grab failed on" << screen->name() << "for" << piece.area;
            return QImage();
        }
        painter.drawImage(piece.area.topLeft() - region.topLeft(), part.convertToFormat(QImage::Format_RGB32));
    }
    painter.end();

    qDebug() << "ScreenRegionSource: Assembled region" << region << "from" << pieces.size() << "screens";
    return assembled;
}

FrameCaptureResult ScreenRegionSource::captureFrames()
{
    if (m_regions.isEmpty()) {
        return FrameCaptureResult::failure(CaptureError::EmptyInput, QStringLiteral("No regions given"));
    }

    const QRect virtualBounds = queryVirtualScreenBounds();
    if (virtualBounds.isEmpty()) {
        return FrameCaptureResult::failure(CaptureError::GrabFailed, QStringLiteral("No screen available"));
    }

    FrameCaptureResult result;
    result.frames.reserve(static_cast<size_t>(m_regions.size()));

    for (int i = 0; i < m_regions.size(); ++i) {
        const QRect &region = m_regions.at(i);
        if (!isValidRegion(region, virtualBounds)) {
            qWarning() << "ScreenRegionSource: Rejected region" << region << "bounds" << virtualBounds;
            return FrameCaptureResult::failure(
                CaptureError::InvalidRegion,
                QStringLiteral("Invalid region %1 (must be larger than %2x%2 and inside the desktop)")
                    .arg(regionToString(region)).arg(MIN_REGION_SIZE),
                regionToString(region));
        }

        const QImage image = grabRegion(region);
        if (image.isNull()) {
            return FrameCaptureResult::failure(
                CaptureError::GrabFailed,
                QStringLiteral("Failed to capture region %1").arg(regionToString(region)),
                regionToString(region));
        }

        result.frames.emplace_back(image, region, i);
        qDebug() << "ScreenRegionSource: Captured region" << region;
    }

    result.success = true;
    return result;
}
