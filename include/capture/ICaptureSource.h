#ifndef ICAPTURESOURCE_H
#define ICAPTURESOURCE_H

#include "compose/Frame.h"

#include <QRect>
#include <QString>

enum class CaptureError {
    None,
    EmptyInput,
    MissingFile,
    UnreadableFrame,
    InvalidRegion,
    GrabFailed
};

struct FrameCaptureResult {
    bool success = false;
    FrameSequence frames;
    CaptureError error = CaptureError::None;
    QString failureReason;
    QString failedItem;     // Path or region that caused the failure

    static FrameCaptureResult failure(CaptureError error, const QString &reason,
                                      const QString &item = QString())
    {
        FrameCaptureResult result;
        result.error = error;
        result.failureReason = reason;
        result.failedItem = item;
        return result;
    }
};

/**
 * @brief Abstract provider of an ordered frame sequence
 *
 * Implementations:
 * - ImageFileSource: frames decoded from image files
 * - ScreenRegionSource: regions grabbed from the attached screens
 *
 * Sources own all OS interaction, the composition engine only ever sees
 * the returned frames.
 */
class ICaptureSource
{
public:
    virtual ~ICaptureSource() = default;

    /**
     * @brief Acquire every frame of the sequence in capture order
     * @return Frames on success, or the first failure encountered
     */
    virtual FrameCaptureResult captureFrames() = 0;

    /**
     * @brief Union of all screen geometries this source can capture from
     *
     * Sources without a screen notion return the bounding rect of their frames.
     */
    virtual QRect queryVirtualScreenBounds() const = 0;

    virtual QString sourceName() const = 0;
};

#endif // ICAPTURESOURCE_H
