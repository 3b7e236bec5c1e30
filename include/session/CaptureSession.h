#ifndef CAPTURESESSION_H
#define CAPTURESESSION_H

#include "capture/ICaptureSource.h"
#include "compose/CompositionTypes.h"
#include "compose/StitchPipeline.h"
#include "metadata/CaptureMetadata.h"

#include <QDateTime>
#include <QString>

struct SessionRequest {
    MergeSpec spec;
    StitchMode stitchMode = StitchMode::Layout;
    HeaderAnnotator::Options header;
    OverlapDetector::Config overlapConfig;
    QString outputDirectory;           // Created when missing
    int recaptureIteration = 0;
    QDateTime timestamp;               // Invalid = now
    bool annotateImage = false;        // Draw spec.description into the image
};

enum class SessionError {
    None,
    CaptureFailed,
    CompositionFailed,
    OutputFailed
};

struct SessionResult {
    bool success = false;
    QString imagePath;
    QString metadataPath;
    CaptureMetadata metadata;
    CompositionResult composition;
    SessionError error = SessionError::None;
    CaptureError captureError = CaptureError::None;
    QString failureReason;
};

/**
 * @brief One capture-merge-save round
 *
 * Acquires the frames from a source, composes them, then writes
 * capture_yyyy-MM-dd_HHmmss.png and its JSON sidecar into the output
 * directory. Either both files exist afterwards or neither does.
 */
class CaptureSession
{
public:
    static SessionResult run(ICaptureSource &source, const SessionRequest &request);

    /**
     * @brief Delete the image and sidecar of an earlier run
     *
     * Used before a recapture. Missing files are not an error.
     * @return false if a file exists but could not be removed
     */
    static bool discard(const SessionResult &result, QString *errorMessage = nullptr);

    // First free capture_<timestamp>[_N].png path in the directory
    static QString uniqueImagePath(const QString &directory, const QDateTime &timestamp);

    static CaptureMetadata buildMetadata(const FrameSequence &frames, const MergeSpec &spec,
                                         int recaptureIteration, const QDateTime &timestamp,
                                         const QString &imagePath);
};

#endif // CAPTURESESSION_H
