#include "compose/HeaderAnnotator.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFontInfo>
#include <QFontMetrics>
#include <QGuiApplication>
#include <QPainter>
#include <algorithm>

namespace
{
constexpr int kTextFlags = Qt::AlignHCenter | Qt::AlignTop | Qt::TextWordWrap;
constexpr int kMaxTextHeight = 1 << 20;

bool hasFontDatabase()
{
    return qobject_cast<QGuiApplication*>(QCoreApplication::instance()) != nullptr;
}
} // namespace

HeaderAnnotator::TextLayout HeaderAnnotator::layoutText(int imageWidth, const QString &description,
                                                        const Options &options)
{
    TextLayout layout;
    layout.textHeight = FALLBACK_TEXT_HEIGHT;

    if (!hasFontDatabase()) {
        qWarning() << "HeaderAnnotator: No font database available, using default text metric";
        return layout;
    }

    QFont font(options.fontFamily);
    font.setPixelSize(options.pixelSize);
    const QFontInfo info(font);
    layout.preferredFont = info.family().compare(options.fontFamily, Qt::CaseInsensitive) == 0;
    if (!layout.preferredFont) {
        qWarning() << "HeaderAnnotator: Font" << options.fontFamily
                   << "unavailable, falling back to" << info.family();
        font = QGuiApplication::font();
        font.setPixelSize(options.pixelSize);
    }

    const QFontMetrics metrics(font);
    const QRect bounds = metrics.boundingRect(QRect(0, 0, std::max(1, imageWidth), kMaxTextHeight),
                                              kTextFlags, description);

    layout.font = font;
    layout.canDraw = true;
    layout.textWidth = bounds.width();
    layout.textHeight = bounds.height() > 0 ? bounds.height() : FALLBACK_TEXT_HEIGHT;
    return layout;
}

int HeaderAnnotator::headerHeight(int imageWidth, const QString &description, const Options &options)
{
    const int padding = std::max(0, options.padding);
    return layoutText(imageWidth, description, options).textHeight + padding * 2;
}

QImage HeaderAnnotator::annotate(const QImage &image, const QString &description, const Options &options)
{
    if (image.isNull()) {
        qWarning() << "HeaderAnnotator: Null image, nothing to annotate";
        return QImage();
    }

    const int padding = std::max(0, options.padding);
    const TextLayout layout = layoutText(image.width(), description, options);
    const int bandHeight = layout.textHeight + padding * 2;

    QImage annotated(image.width(), image.height() + bandHeight, QImage::Format_RGB32);
    if (annotated.isNull()) {
        qWarning() << "HeaderAnnotator: Failed to allocate annotated image";
        return image;
    }
    annotated.fill(options.bandColor);

    QPainter painter(&annotated);
    if (layout.canDraw && !description.isEmpty()) {
        painter.setRenderHint(QPainter::TextAntialiasing);
        painter.setFont(layout.font);
        painter.setPen(options.textColor);
        painter.drawText(QRect(0, padding, image.width(), layout.textHeight), kTextFlags, description);
    }

    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.drawImage(0, bandHeight, image.convertToFormat(QImage::Format_RGB32));
    painter.end();

    return annotated;
}
