#ifndef MOCKCAPTURESOURCE_H
#define MOCKCAPTURESOURCE_H

#include "capture/ICaptureSource.h"

#include <QList>

/**
 * @brief Mock implementation of ICaptureSource for testing
 *
 * Returns a preset frame sequence, or a preset failure, without touching
 * the screen or the filesystem.
 */
class MockCaptureSource : public ICaptureSource
{
public:
    MockCaptureSource() = default;

    FrameCaptureResult captureFrames() override;
    QRect queryVirtualScreenBounds() const override { return m_virtualBounds; }
    QString sourceName() const override { return QStringLiteral("MockCaptureSource"); }

    // ========== Mock Control Methods ==========

    /**
     * @brief Frames returned by captureFrames(), region = (index * 100, 0, w, h)
     */
    void setFrameImages(const QList<QImage> &images);

    void setFailure(CaptureError error, const QString &reason);
    void setVirtualBounds(const QRect &bounds) { m_virtualBounds = bounds; }

    // ========== Spy Methods ==========

    int captureCallCount() const { return m_captureCalls; }

private:
    FrameSequence m_frames;
    CaptureError m_failure = CaptureError::None;
    QString m_failureReason;
    QRect m_virtualBounds = QRect(0, 0, 1920, 1080);
    int m_captureCalls = 0;
};

#endif // MOCKCAPTURESOURCE_H
