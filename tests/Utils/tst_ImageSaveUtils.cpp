#include <QtTest>

#include <QFile>
#include <QImageReader>
#include <QTemporaryDir>

#include "utils/ImageSaveUtils.h"

class tst_ImageSaveUtils : public QObject
{
    Q_OBJECT

private slots:
    void testSavePngSuccess();
    void testSaveWithoutExtensionDefaultsToPng();
    void testUnsupportedExtensionFails();
    void testMissingDirectoryReportsOpenStage();
    void testNullImageFails();
    void testWriteBytesReplacesExistingFile();
    void testFormatForPath();
};

void tst_ImageSaveUtils::testSavePngSuccess()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QImage image(24, 24, QImage::Format_RGB32);
    image.fill(QColor(255, 0, 0));

    const QString filePath = tempDir.filePath("merged.png");
    ImageSaveUtils::Error error;
    QVERIFY2(ImageSaveUtils::saveImageAtomically(image, filePath, QByteArrayLiteral("PNG"), &error),
             qPrintable(error.message));

    const QImage loaded(filePath);
    QVERIFY(!loaded.isNull());
    QCOMPARE(loaded.pixelColor(0, 0), QColor(255, 0, 0));
}

void tst_ImageSaveUtils::testSaveWithoutExtensionDefaultsToPng()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QImage image(16, 16, QImage::Format_RGB32);
    image.fill(Qt::green);

    const QString filePath = tempDir.filePath("merged_no_ext");
    QVERIFY(ImageSaveUtils::saveImageAtomically(image, filePath));

    QImageReader reader(filePath);
    QVERIFY(reader.canRead());
    QCOMPARE(reader.format().toLower(), QByteArrayLiteral("png"));
}

void tst_ImageSaveUtils::testUnsupportedExtensionFails()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(Qt::blue);

    const QString filePath = tempDir.filePath("merged.unsupported_ext");
    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(image, filePath, QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("format"));
    QVERIFY(error.message.contains("Unsupported image format"));
    QVERIFY(!QFile::exists(filePath));
}

void tst_ImageSaveUtils::testMissingDirectoryReportsOpenStage()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(Qt::blue);

    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(image, tempDir.filePath("missing/merged.png"),
                                                 QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("open"));
}

void tst_ImageSaveUtils::testNullImageFails()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("null.png");
    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(QImage(), filePath, QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("encode"));
    QVERIFY(!QFile::exists(filePath));
}

void tst_ImageSaveUtils::testWriteBytesReplacesExistingFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("meta.json");
    QVERIFY(ImageSaveUtils::writeBytesAtomically("{\"old\": true}", filePath));
    QVERIFY(ImageSaveUtils::writeBytesAtomically("{}", filePath));

    QFile file(filePath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{}"));
}

void tst_ImageSaveUtils::testFormatForPath()
{
    QCOMPARE(ImageSaveUtils::formatForPath("a/b/c.PNG"), QByteArrayLiteral("png"));
    QCOMPARE(ImageSaveUtils::formatForPath("shot.jpg"), QByteArrayLiteral("jpeg"));
    QCOMPARE(ImageSaveUtils::formatForPath("noext"), QByteArrayLiteral("png"));
    QCOMPARE(ImageSaveUtils::formatForPath("x.png", ".TIF"), QByteArrayLiteral("tiff"));
}

QTEST_MAIN(tst_ImageSaveUtils)
#include "tst_ImageSaveUtils.moc"
