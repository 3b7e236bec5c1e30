#include <QtTest>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "metadata/CaptureMetadata.h"
#include "session/CaptureHistory.h"

class tst_CaptureHistory : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void testMissingDirectoryIsEmpty();
    void testOnlyCaptureImagesAreListed();
    void testNewestFirst();
    void testLimitKeepsTotal();
    void testZeroLimitListsAll();
    void testSidecarIsReported();
    void testJsonShape();

private:
    QString writeCapture(const QString& name, const QDateTime& modified);

    QScopedPointer<QTemporaryDir> m_tempDir;
    QDateTime m_base;
};

void tst_CaptureHistory::init()
{
    m_tempDir.reset(new QTemporaryDir);
    QVERIFY(m_tempDir->isValid());
    m_base = QDateTime(QDate(2024, 3, 1), QTime(12, 0, 0));
}

QString tst_CaptureHistory::writeCapture(const QString& name, const QDateTime& modified)
{
    const QString path = m_tempDir->filePath(name);
    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(Qt::red);
    if (!image.save(path, "PNG")) {
        return QString();
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadWrite)) {
        return QString();
    }
    if (!file.setFileTime(modified, QFileDevice::FileModificationTime)) {
        return QString();
    }
    file.close();
    return path;
}

void tst_CaptureHistory::testMissingDirectoryIsEmpty()
{
    const CaptureListing listing = CaptureHistory::list(m_tempDir->filePath("nowhere"));
    QCOMPARE(listing.total, 0);
    QVERIFY(listing.entries.isEmpty());
    QVERIFY(!QFile::exists(m_tempDir->filePath("nowhere")));
}

void tst_CaptureHistory::testOnlyCaptureImagesAreListed()
{
    QVERIFY(!writeCapture("capture_2024-03-01_120000.png", m_base).isEmpty());
    QVERIFY(!writeCapture("screenshot.png", m_base).isEmpty());
    QVERIFY(!writeCapture("capture_2024-03-01_120001.jpg", m_base).isEmpty());

    const CaptureListing listing = CaptureHistory::list(m_tempDir->path());
    QCOMPARE(listing.total, 1);
    QCOMPARE(listing.entries.first().filename, QString("capture_2024-03-01_120000.png"));
    QVERIFY(listing.entries.first().size > 0);
}

void tst_CaptureHistory::testNewestFirst()
{
    QVERIFY(!writeCapture("capture_a.png", m_base.addSecs(10)).isEmpty());
    QVERIFY(!writeCapture("capture_b.png", m_base.addSecs(30)).isEmpty());
    QVERIFY(!writeCapture("capture_c.png", m_base.addSecs(20)).isEmpty());

    const CaptureListing listing = CaptureHistory::list(m_tempDir->path());
    QCOMPARE(listing.entries.size(), 3);
    QCOMPARE(listing.entries.at(0).filename, QString("capture_b.png"));
    QCOMPARE(listing.entries.at(1).filename, QString("capture_c.png"));
    QCOMPARE(listing.entries.at(2).filename, QString("capture_a.png"));
}

void tst_CaptureHistory::testLimitKeepsTotal()
{
    for (int i = 0; i < 5; ++i) {
        QVERIFY(!writeCapture(QString("capture_%1.png").arg(i), m_base.addSecs(i)).isEmpty());
    }

    const CaptureListing listing = CaptureHistory::list(m_tempDir->path(), 2);
    QCOMPARE(listing.total, 5);
    QCOMPARE(listing.entries.size(), 2);
    QCOMPARE(listing.entries.at(0).filename, QString("capture_4.png"));
    QCOMPARE(listing.entries.at(1).filename, QString("capture_3.png"));
}

void tst_CaptureHistory::testZeroLimitListsAll()
{
    for (int i = 0; i < 12; ++i) {
        QVERIFY(!writeCapture(QString("capture_%1.png").arg(i, 2, 10, QChar('0')), m_base.addSecs(i)).isEmpty());
    }

    QCOMPARE(CaptureHistory::list(m_tempDir->path()).entries.size(), CaptureHistory::DEFAULT_LIMIT);
    QCOMPARE(CaptureHistory::list(m_tempDir->path(), 0).entries.size(), 12);
}

void tst_CaptureHistory::testSidecarIsReported()
{
    const QString withSidecar = writeCapture("capture_meta.png", m_base);
    QVERIFY(!withSidecar.isEmpty());
    QVERIFY(!writeCapture("capture_plain.png", m_base.addSecs(-5)).isEmpty());

    QFile sidecar(CaptureMetadataStore::sidecarPathFor(withSidecar));
    QVERIFY(sidecar.open(QIODevice::WriteOnly));
    sidecar.write("{}");
    sidecar.close();

    const CaptureListing listing = CaptureHistory::list(m_tempDir->path());
    QCOMPARE(listing.entries.size(), 2);
    QCOMPARE(listing.entries.at(0).metadataPath, CaptureMetadataStore::sidecarPathFor(withSidecar));
    QVERIFY(listing.entries.at(1).metadataPath.isEmpty());
}

void tst_CaptureHistory::testJsonShape()
{
    const QString path = writeCapture("capture_json.png", m_base);
    QVERIFY(!path.isEmpty());

    const QJsonObject root = QJsonDocument::fromJson(
        CaptureHistory::toJson(CaptureHistory::list(m_tempDir->path()))).object();
    QCOMPARE(root.value("total").toInt(), 1);

    const QJsonObject entry = root.value("captures").toArray().first().toObject();
    QCOMPARE(entry.value("filename").toString(), QString("capture_json.png"));
    QCOMPARE(entry.value("filepath").toString(), QFileInfo(path).absoluteFilePath());
    QCOMPARE(QDateTime::fromString(entry.value("timestamp").toString(), Qt::ISODate), m_base);
    QVERIFY(entry.value("size").toInteger() > 0);
    QVERIFY(!entry.contains("metadata_file"));
}

QTEST_MAIN(tst_CaptureHistory)
#include "tst_CaptureHistory.moc"
