#include <QtTest/QtTest>
#include <QImage>
#include <limits>
#include "compose/LayoutCompositor.h"

class TestLayoutCompositor : public QObject
{
    Q_OBJECT

private:
    QImage createSolidImage(int width, int height, const QColor &color)
    {
        QImage img(width, height, QImage::Format_RGB32);
        img.fill(color);
        return img;
    }

    FrameSequence createSquares(int count, int size = 100)
    {
        static const QColor colors[] = {Qt::red, Qt::green, Qt::blue, Qt::yellow, Qt::cyan, Qt::magenta};
        std::vector<QImage> images;
        for (int i = 0; i < count; ++i) {
            images.push_back(createSolidImage(size, size, colors[i % 6]));
        }
        return framesFromImages(images);
    }

    MergeSpec specFor(MergeMethod method, int spacing = 10)
    {
        MergeSpec spec;
        spec.method = method;
        spec.spacing = spacing;
        return spec;
    }

private slots:
    void testSingleFrameIsReturnedUnchanged_data()
    {
        QTest::addColumn<int>("method");
        QTest::newRow("vertical") << static_cast<int>(MergeMethod::Vertical);
        QTest::newRow("horizontal") << static_cast<int>(MergeMethod::Horizontal);
        QTest::newRow("grid") << static_cast<int>(MergeMethod::Grid);
        QTest::newRow("auto") << static_cast<int>(MergeMethod::Auto);
    }

    void testSingleFrameIsReturnedUnchanged()
    {
        QFETCH(int, method);

        QImage frame(37, 21, QImage::Format_ARGB32);
        frame.fill(QColor(10, 20, 30, 128));

        const CompositionResult result = LayoutCompositor::compose(
            framesFromImages({frame}), specFor(static_cast<MergeMethod>(method), 25));

        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Identity);
        QCOMPARE(result.canvas, frame);
    }

    void testVerticalDimensions()
    {
        const CompositionResult result = LayoutCompositor::compose(createSquares(3),
                                                                   specFor(MergeMethod::Vertical));
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(100, 320));
        QCOMPARE(result.layoutUsed, LayoutUsed::Vertical);
        QCOMPARE(result.frameCount, 3);
    }

    void testHorizontalDimensions()
    {
        const CompositionResult result = LayoutCompositor::compose(createSquares(3),
                                                                   specFor(MergeMethod::Horizontal));
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(320, 100));
        QCOMPARE(result.layoutUsed, LayoutUsed::Horizontal);
    }

    void testGridDimensions()
    {
        MergeSpec spec = specFor(MergeMethod::Grid);
        spec.gridColumns = 2;

        const CompositionResult result = LayoutCompositor::compose(createSquares(4), spec);
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(210, 210));
        QCOMPARE(result.layoutUsed, LayoutUsed::Grid);
    }

    void testGridDefaultColumns()
    {
        QCOMPARE(LayoutCompositor::defaultGridColumns(1), 1);
        QCOMPARE(LayoutCompositor::defaultGridColumns(4), 2);
        QCOMPARE(LayoutCompositor::defaultGridColumns(5), 3);
        QCOMPARE(LayoutCompositor::defaultGridColumns(9), 3);
        QCOMPARE(LayoutCompositor::defaultGridColumns(10), 4);

        // 5 frames, 3 columns, 2 rows
        const CompositionResult result = LayoutCompositor::compose(createSquares(5),
                                                                   specFor(MergeMethod::Grid));
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(320, 210));
    }

    void testGridPlacesFramesRowMajor()
    {
        MergeSpec spec = specFor(MergeMethod::Grid, 10);
        spec.gridColumns = 2;
        spec.background = Qt::white;

        const CompositionResult result = LayoutCompositor::compose(createSquares(3), spec);
        QVERIFY(result.success);
        QCOMPARE(result.canvas.pixelColor(50, 50), QColor(Qt::red));
        QCOMPARE(result.canvas.pixelColor(160, 50), QColor(Qt::green));
        QCOMPARE(result.canvas.pixelColor(50, 160), QColor(Qt::blue));
        // Empty fourth cell keeps the background
        QCOMPARE(result.canvas.pixelColor(160, 160), QColor(Qt::white));
    }

    void testAutoTwoSquaresIsHorizontal()
    {
        const CompositionResult result = LayoutCompositor::compose(createSquares(2),
                                                                   specFor(MergeMethod::Auto));
        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Horizontal);
        QCOMPARE(result.canvas.size(), QSize(210, 100));
    }

    void testAutoTwoWideFramesIsVertical()
    {
        const FrameSequence frames = framesFromImages({createSolidImage(300, 100, Qt::red),
                                                       createSolidImage(300, 100, Qt::blue)});
        const CompositionResult result = LayoutCompositor::compose(frames, specFor(MergeMethod::Auto));
        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Vertical);
        QCOMPARE(result.canvas.size(), QSize(300, 210));
    }

    void testAutoSmallSetUsesTwoColumnGrid()
    {
        const CompositionResult result = LayoutCompositor::compose(createSquares(3),
                                                                   specFor(MergeMethod::Auto));
        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Grid);
        QCOMPARE(result.canvas.size(), QSize(210, 210));
    }

    void testAutoFourFramesUsesTwoColumns()
    {
        // ceil(sqrt(4)) is also 2, so check the rule directly as well
        QCOMPARE(LayoutCompositor::autoGridColumns(3), 2);
        QCOMPARE(LayoutCompositor::autoGridColumns(4), 2);
        QCOMPARE(LayoutCompositor::autoGridColumns(2), 0);

        const CompositionResult result = LayoutCompositor::compose(createSquares(4),
                                                                   specFor(MergeMethod::Auto));
        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Grid);
        QCOMPARE(result.canvas.size(), QSize(210, 210));
    }

    void testAutoLargeSetUsesSqrtColumns()
    {
        QCOMPARE(LayoutCompositor::autoGridColumns(5), 3);
        QCOMPARE(LayoutCompositor::autoGridColumns(10), 4);

        // 5 frames, 3 columns, 2 rows
        const CompositionResult result = LayoutCompositor::compose(createSquares(5),
                                                                   specFor(MergeMethod::Auto));
        QVERIFY(result.success);
        QCOMPARE(result.layoutUsed, LayoutUsed::Grid);
        QCOMPARE(result.canvas.size(), QSize(320, 210));
        QCOMPARE(result.canvas.pixelColor(270, 50), QColor(Qt::blue));
        QCOMPARE(result.canvas.pixelColor(160, 160), QColor(Qt::cyan));
    }

    void testHorizontalCentersShortFrames()
    {
        MergeSpec spec = specFor(MergeMethod::Horizontal, 0);
        spec.background = Qt::white;
        const FrameSequence frames = framesFromImages({createSolidImage(50, 100, Qt::red),
                                                       createSolidImage(50, 40, Qt::blue)});

        const CompositionResult result = LayoutCompositor::compose(frames, spec);
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(100, 100));
        // Short frame occupies rows 30..69 of its column
        QCOMPARE(result.canvas.pixelColor(75, 29), QColor(Qt::white));
        QCOMPARE(result.canvas.pixelColor(75, 30), QColor(Qt::blue));
        QCOMPARE(result.canvas.pixelColor(75, 69), QColor(Qt::blue));
        QCOMPARE(result.canvas.pixelColor(75, 70), QColor(Qt::white));
    }

    void testHugeSpacingFailsCleanly_data()
    {
        QTest::addColumn<int>("method");
        QTest::newRow("vertical") << static_cast<int>(MergeMethod::Vertical);
        QTest::newRow("horizontal") << static_cast<int>(MergeMethod::Horizontal);
        QTest::newRow("grid") << static_cast<int>(MergeMethod::Grid);
    }

    void testHugeSpacingFailsCleanly()
    {
        QFETCH(int, method);

        MergeSpec spec = specFor(static_cast<MergeMethod>(method), 1500000000);
        spec.gridColumns = 3;

        const CompositionResult result = LayoutCompositor::compose(createSquares(3, 10), spec);
        QVERIFY(!result.success);
        QCOMPARE(result.error, CompositionError::InvalidFrame);
        QVERIFY(result.failureReason.contains("Canvas too large"));
        QVERIFY(result.canvas.isNull());
    }

    void testHugeColumnCountFailsCleanly()
    {
        MergeSpec spec = specFor(MergeMethod::Grid, 0);
        spec.gridColumns = std::numeric_limits<int>::max();

        const CompositionResult result = LayoutCompositor::compose(createSquares(2, 10), spec);
        QVERIFY(!result.success);
        QVERIFY(result.failureReason.contains("Canvas too large"));
    }

    void testTranslucentFramesKeepStoredColor()
    {
        QImage translucent(40, 40, QImage::Format_ARGB32);
        translucent.fill(QColor(200, 100, 50, 128));
        const FrameSequence frames = framesFromImages({translucent, createSolidImage(40, 40, Qt::blue)});

        const CompositionResult result = LayoutCompositor::compose(frames, specFor(MergeMethod::Vertical, 0));
        QVERIFY(result.success);
        QCOMPARE(result.canvas.pixelColor(20, 20), QColor(200, 100, 50));
        QCOMPARE(result.canvas.pixelColor(20, 60), QColor(Qt::blue));
    }

    void testVerticalCentersNarrowFrames()
    {
        MergeSpec spec = specFor(MergeMethod::Vertical, 10);
        spec.background = Qt::white;
        const FrameSequence frames = framesFromImages({createSolidImage(100, 50, Qt::red),
                                                       createSolidImage(50, 50, Qt::blue)});

        const CompositionResult result = LayoutCompositor::compose(frames, spec);
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(100, 110));
        QCOMPARE(result.canvas.pixelColor(25, 60), QColor(Qt::blue));
        QCOMPARE(result.canvas.pixelColor(74, 109), QColor(Qt::blue));
        QCOMPARE(result.canvas.pixelColor(10, 80), QColor(Qt::white));
        // Spacing band
        QCOMPARE(result.canvas.pixelColor(50, 55), QColor(Qt::white));
    }

    void testBackgroundFillsGaps()
    {
        MergeSpec spec = specFor(MergeMethod::Horizontal, 20);
        spec.background = QColor(0x12, 0x34, 0x56);

        const CompositionResult result = LayoutCompositor::compose(createSquares(2), spec);
        QVERIFY(result.success);
        QCOMPARE(result.canvas.pixelColor(110, 50), QColor(0x12, 0x34, 0x56));
    }

    void testEmptyInputFails()
    {
        const CompositionResult result = LayoutCompositor::compose(FrameSequence(),
                                                                   specFor(MergeMethod::Auto));
        QVERIFY(!result.success);
        QCOMPARE(result.error, CompositionError::EmptyInput);
        QVERIFY(result.canvas.isNull());
    }

    void testNullFrameFails()
    {
        FrameSequence frames = createSquares(2);
        frames.emplace_back(QImage(), QRect(), 2);

        const CompositionResult result = LayoutCompositor::compose(frames, specFor(MergeMethod::Vertical));
        QVERIFY(!result.success);
        QCOMPARE(result.error, CompositionError::InvalidFrame);
    }

    void testCompositionIsDeterministic()
    {
        const FrameSequence frames = framesFromImages({createSolidImage(80, 60, Qt::red),
                                                       createSolidImage(40, 90, Qt::green),
                                                       createSolidImage(70, 30, Qt::blue)});
        const MergeSpec spec = specFor(MergeMethod::Grid, 7);

        const CompositionResult first = LayoutCompositor::compose(frames, spec);
        const CompositionResult second = LayoutCompositor::compose(frames, spec);
        QVERIFY(first.success);
        QCOMPARE(first.canvas, second.canvas);
    }

    void testNegativeSpacingIsClamped()
    {
        const CompositionResult result = LayoutCompositor::compose(createSquares(2),
                                                                   specFor(MergeMethod::Vertical, -5));
        QVERIFY(result.success);
        QCOMPARE(result.canvas.size(), QSize(100, 200));
    }
};

QTEST_MAIN(TestLayoutCompositor)
#include "tst_LayoutCompositor.moc"
