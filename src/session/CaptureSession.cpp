#include "session/CaptureSession.h"
#include "utils/ImageSaveUtils.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

namespace
{
constexpr int kMaxNameAttempts = 1000;

SessionResult sessionFailure(SessionError error, const QString &reason)
{
    SessionResult result;
    result.error = error;
    result.failureReason = reason;
    qWarning() << "CaptureSession:" << reason;
    return result;
}
} // namespace

QString CaptureSession::uniqueImagePath(const QString &directory, const QDateTime &timestamp)
{
    const QDir dir(directory);
    const QString stem = QStringLiteral("capture_%1").arg(timestamp.toString("yyyy-MM-dd_HHmmss"));

    QString candidate = dir.absoluteFilePath(stem + QStringLiteral(".png"));
    for (int suffix = 1; suffix < kMaxNameAttempts; ++suffix) {
        if (!QFileInfo::exists(candidate)
            && !QFileInfo::exists(CaptureMetadataStore::sidecarPathFor(candidate))) {
            return candidate;
        }
        candidate = dir.absoluteFilePath(QStringLiteral("%1_%2.png").arg(stem).arg(suffix));
    }
    return QString();
}

CaptureMetadata CaptureSession::buildMetadata(const FrameSequence &frames, const MergeSpec &spec,
                                              int recaptureIteration, const QDateTime &timestamp,
                                              const QString &imagePath)
{
    CaptureMetadata metadata;
    metadata.description = spec.description;
    metadata.timestamp = timestamp;
    metadata.captures = static_cast<int>(frames.size());
    metadata.merged = frames.size() > 1;
    metadata.filepath = imagePath;
    metadata.recaptureIteration = recaptureIteration;
    metadata.mergeMethod = spec.method;
    for (const Frame &frame : frames) {
        metadata.regions.append(frame.region);
    }
    return metadata;
}

SessionResult CaptureSession::run(ICaptureSource &source, const SessionRequest &request)
{
    FrameCaptureResult capture = source.captureFrames();
    if (!capture.success) {
        SessionResult result = sessionFailure(SessionError::CaptureFailed, capture.failureReason);
        result.captureError = capture.error;
        return result;
    }
    qDebug() << "CaptureSession: Acquired" << capture.frames.size() << "frames from" << source.sourceName();

    StitchOptions options;
    options.mode = request.stitchMode;
    options.header = request.header;
    options.overlapConfig = request.overlapConfig;
    const StitchPipeline pipeline(options);

    CompositionResult composition = request.annotateImage
        ? pipeline.stitch(capture.frames, request.spec)
        : pipeline.compose(capture.frames, request.spec);
    if (!composition.success) {
        SessionResult result = sessionFailure(SessionError::CompositionFailed, composition.failureReason);
        result.composition = composition;
        return result;
    }

    const QString directory = request.outputDirectory.isEmpty() ? QDir::currentPath()
                                                                : request.outputDirectory;
    if (!QDir().mkpath(directory)) {
        return sessionFailure(SessionError::OutputFailed,
                              QStringLiteral("Cannot create output directory: %1").arg(directory));
    }

    QDateTime timestamp = request.timestamp.isValid() ? request.timestamp : QDateTime::currentDateTime();
    timestamp = timestamp.addMSecs(-timestamp.time().msec());

    const QString imagePath = uniqueImagePath(directory, timestamp);
    if (imagePath.isEmpty()) {
        return sessionFailure(SessionError::OutputFailed,
                              QStringLiteral("No free file name in %1").arg(directory));
    }

    ImageSaveUtils::Error saveError;
    if (!ImageSaveUtils::saveImageAtomically(composition.canvas, imagePath, QByteArrayLiteral("png"),
                                             &saveError)) {
        return sessionFailure(SessionError::OutputFailed,
                              QStringLiteral("Failed to save %1: %2")
                                  .arg(imagePath, ImageSaveUtils::describe(saveError)));
    }

    SessionResult result;
    result.imagePath = imagePath;
    result.metadataPath = CaptureMetadataStore::sidecarPathFor(imagePath);
    result.metadata = buildMetadata(capture.frames, request.spec, request.recaptureIteration,
                                    timestamp, imagePath);

    CaptureMetadataStore::Error metadataError;
    if (!CaptureMetadataStore::save(result.metadata, result.metadataPath, &metadataError)) {
        if (!QFile::remove(imagePath)) {
            qWarning() << "CaptureSession: Could not remove orphaned image" << imagePath;
        }
        return sessionFailure(SessionError::OutputFailed,
                              QStringLiteral("Failed to write metadata %1: %2")
                                  .arg(result.metadataPath, metadataError.message));
    }

    result.success = true;
    result.composition = composition;
    qInfo() << "CaptureSession: Saved" << imagePath << "(" << result.metadata.captures << "captures)";
    return result;
}

bool CaptureSession::discard(const SessionResult &result, QString *errorMessage)
{
    bool ok = true;
    QStringList failed;
    for (const QString &path : {result.imagePath, result.metadataPath}) {
        if (path.isEmpty() || !QFileInfo::exists(path)) {
            continue;
        }
        if (!QFile::remove(path)) {
            ok = false;
            failed << path;
        }
    }

    if (!ok) {
        qWarning() << "CaptureSession: Failed to discard" << failed;
        if (errorMessage) {
            *errorMessage = QStringLiteral("Could not delete: %1").arg(failed.join(", "));
        }
    }
    return ok;
}
