#include "compose/StitchPipeline.h"
#include "compose/LayoutCompositor.h"

#include <QDebug>

namespace
{
MergeSpec flushSpec(const MergeSpec &spec)
{
    MergeSpec flush = spec;
    flush.method = MergeMethod::Vertical;
    flush.spacing = 0;
    return flush;
}
} // namespace

QString stitchModeToString(StitchMode mode)
{
    switch (mode) {
    case StitchMode::FlushStack:
        return QStringLiteral("flush");
    case StitchMode::OverlapAware:
        return QStringLiteral("overlap");
    case StitchMode::Layout:
        return QStringLiteral("layout");
    }
    return QStringLiteral("flush");
}

bool stitchModeFromString(const QString &text, StitchMode *mode)
{
    const QString key = text.trimmed().toLower();
    StitchMode parsed;
    if (key == QLatin1String("flush")) {
        parsed = StitchMode::FlushStack;
    } else if (key == QLatin1String("overlap")) {
        parsed = StitchMode::OverlapAware;
    } else if (key == QLatin1String("layout")) {
        parsed = StitchMode::Layout;
    } else {
        return false;
    }

    if (mode) {
        *mode = parsed;
    }
    return true;
}

StitchPipeline::StitchPipeline(const StitchOptions &options)
    : m_options(options)
{
}

CompositionResult StitchPipeline::composeFlush(const FrameSequence &frames, const MergeSpec &spec) const
{
    return LayoutCompositor::compose(frames, flushSpec(spec));
}

CompositionResult StitchPipeline::composeOverlapAware(const FrameSequence &frames,
                                                      const MergeSpec &spec) const
{
    std::vector<OverlapMeasurement> overlaps;
    overlaps.reserve(frames.size() - 1);

    FrameSequence trimmed;
    trimmed.reserve(frames.size());
    trimmed.push_back(frames.front());

    for (size_t i = 1; i < frames.size(); ++i) {
        // Detection always runs on the untrimmed pair
        const OverlapMeasurement measurement =
            OverlapDetector::measure(frames[i - 1].image, frames[i].image, -1, m_options.overlapConfig);
        overlaps.push_back(measurement);

        const Frame &frame = frames[i];
        if (measurement.accepted() && measurement.overlapPx > 0 && measurement.overlapPx < frame.height()) {
            const int k = measurement.overlapPx;
            trimmed.emplace_back(frame.image.copy(0, k, frame.width(), frame.height() - k),
                                 frame.region, frame.captureIndex);
        } else {
            trimmed.push_back(frame);
        }
    }

    CompositionResult result = LayoutCompositor::compose(trimmed, flushSpec(spec));
    result.overlaps = overlaps;
    result.frameCount = static_cast<int>(frames.size());
    return result;
}

CompositionResult StitchPipeline::compose(const FrameSequence &frames, const MergeSpec &spec) const
{
    if (frames.empty()) {
        return CompositionResult::failure(CompositionError::EmptyInput, QStringLiteral("No frames to merge"));
    }

    for (const Frame &frame : frames) {
        if (frame.isNull()) {
            return CompositionResult::failure(
                CompositionError::InvalidFrame,
                QStringLiteral("Frame %1 has no pixel data").arg(frame.captureIndex));
        }
    }

    if (frames.size() == 1) {
        return LayoutCompositor::compose(frames, spec);
    }

    qDebug() << "StitchPipeline: Composing" << frames.size() << "frames, mode"
             << stitchModeToString(m_options.mode);

    switch (m_options.mode) {
    case StitchMode::FlushStack:
        return composeFlush(frames, spec);
    case StitchMode::OverlapAware:
        return composeOverlapAware(frames, spec);
    case StitchMode::Layout:
        return LayoutCompositor::compose(frames, spec);
    }
    return composeFlush(frames, spec);
}

CompositionResult StitchPipeline::stitch(const FrameSequence &frames, const MergeSpec &spec) const
{
    CompositionResult result = compose(frames, spec);
    if (!result.success || !spec.hasDescription()) {
        return result;
    }

    const QImage annotated = HeaderAnnotator::annotate(result.canvas, spec.description, m_options.header);
    if (annotated.isNull()) {
        qWarning() << "StitchPipeline: Header annotation failed, keeping plain canvas";
        return result;
    }

    result.canvas = annotated;
    result.annotated = true;
    return result;
}
