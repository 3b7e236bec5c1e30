#ifndef HEADERANNOTATOR_H
#define HEADERANNOTATOR_H

#include <QColor>
#include <QFont>
#include <QImage>
#include <QString>

/**
 * @brief Renders a description banner above an image
 *
 * The output is taller than the input by textHeight + 2 * padding. The text
 * is centered horizontally in the band and wrapped to the image width; the
 * input image is pasted unchanged below the band.
 *
 * Missing fonts never fail the annotation: the application default font is
 * used when the preferred family is not installed, and a fixed text height
 * when no font database is available at all (no QGuiApplication).
 */
class HeaderAnnotator
{
public:
    struct Options {
        int padding = 20;
        QColor bandColor = QColor(0xf0, 0xf0, 0xf0);
        QColor textColor = QColor(0, 0, 0);
        QString fontFamily = QStringLiteral("Arial");
        int pixelSize = 16;
    };

    struct TextLayout {
        QFont font;
        int textWidth = 0;
        int textHeight = 0;
        bool preferredFont = false;  // Requested family resolved exactly
        bool canDraw = false;        // False when only the fallback metric is known
    };

    static QImage annotate(const QImage &image, const QString &description,
                           const Options &options = Options());

    // Height of the band annotate() would add above an image of this width
    static int headerHeight(int imageWidth, const QString &description,
                            const Options &options = Options());

    static TextLayout layoutText(int imageWidth, const QString &description,
                                 const Options &options = Options());

    static constexpr int FALLBACK_TEXT_HEIGHT = 16;
};

#endif // HEADERANNOTATOR_H
