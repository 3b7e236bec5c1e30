#include <QtTest/QtTest>
#include <QImage>
#include "compose/HeaderAnnotator.h"

class TestHeaderAnnotator : public QObject
{
    Q_OBJECT

private:
    QImage createCheckerImage(int width, int height)
    {
        QImage img(width, height, QImage::Format_RGB32);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.setPixel(x, y, ((x / 8 + y / 8) % 2) ? qRgb(200, 30, 30) : qRgb(20, 20, 120));
            }
        }
        return img;
    }

private slots:
    void testHeightGrowsByTextAndPadding()
    {
        const QImage image = createCheckerImage(240, 90);
        HeaderAnnotator::Options options;

        const HeaderAnnotator::TextLayout layout = HeaderAnnotator::layoutText(240, "Login page", options);
        QVERIFY(layout.textHeight > 0);

        const QImage annotated = HeaderAnnotator::annotate(image, "Login page", options);
        QCOMPARE(annotated.width(), image.width());
        QCOMPARE(annotated.height(), image.height() + layout.textHeight + 2 * options.padding);
    }

    void testOriginalIsPastedUnchangedBelowBand()
    {
        const QImage image = createCheckerImage(200, 64);
        const int band = HeaderAnnotator::headerHeight(200, "Checkout error");

        const QImage annotated = HeaderAnnotator::annotate(image, "Checkout error");
        QCOMPARE(annotated.copy(0, band, image.width(), image.height()), image);
    }

    void testTranslucentImageKeepsStoredColor()
    {
        QImage image(100, 30, QImage::Format_ARGB32);
        image.fill(QColor(10, 200, 90, 64));
        const int band = HeaderAnnotator::headerHeight(100, "Overlay");

        const QImage annotated = HeaderAnnotator::annotate(image, "Overlay");
        QCOMPARE(annotated.pixelColor(50, band + 15), QColor(10, 200, 90));
    }

    void testBandUsesBackgroundColor()
    {
        const QImage image = createCheckerImage(200, 40);
        HeaderAnnotator::Options options;
        options.bandColor = QColor(0xf0, 0xf0, 0xf0);

        const QImage annotated = HeaderAnnotator::annotate(image, "x", options);
        // Top padding rows never contain text
        QCOMPARE(annotated.pixelColor(0, 0), QColor(0xf0, 0xf0, 0xf0));
        QCOMPARE(annotated.pixelColor(199, options.padding - 1), QColor(0xf0, 0xf0, 0xf0));
    }

    void testPaddingIsConfigurable()
    {
        HeaderAnnotator::Options tight;
        tight.padding = 0;
        HeaderAnnotator::Options loose;
        loose.padding = 20;

        QCOMPARE(HeaderAnnotator::headerHeight(300, "Dashboard", loose),
                 HeaderAnnotator::headerHeight(300, "Dashboard", tight) + 40);
    }

    void testNarrowImageWrapsText()
    {
        const QString text = "A fairly long description that will not fit on one line of a narrow image";
        QVERIFY(HeaderAnnotator::headerHeight(60, text) >= HeaderAnnotator::headerHeight(2000, text));
    }

    void testMissingFontFallsBack()
    {
        HeaderAnnotator::Options options;
        options.fontFamily = "No Such Font Family 1234";

        const QImage image = createCheckerImage(120, 30);
        const QImage annotated = HeaderAnnotator::annotate(image, "Fallback", options);
        QVERIFY(!annotated.isNull());
        QVERIFY(annotated.height() > image.height() + 2 * options.padding);

        const HeaderAnnotator::TextLayout layout = HeaderAnnotator::layoutText(120, "Fallback", options);
        QVERIFY(!layout.preferredFont);
    }

    void testNullImageReturnsNull()
    {
        QVERIFY(HeaderAnnotator::annotate(QImage(), "Nothing").isNull());
    }
};

QTEST_MAIN(TestHeaderAnnotator)
#include "tst_HeaderAnnotator.moc"
