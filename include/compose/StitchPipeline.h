#ifndef STITCHPIPELINE_H
#define STITCHPIPELINE_H

#include "compose/CompositionTypes.h"
#include "compose/Frame.h"
#include "compose/HeaderAnnotator.h"
#include "compose/OverlapDetector.h"

#include <QString>

enum class StitchMode {
    FlushStack,     // Frames stacked top-to-bottom without gaps
    OverlapAware,   // Flush stack with detected duplicate rows removed
    Layout          // LayoutCompositor with the MergeSpec as given
};

QString stitchModeToString(StitchMode mode);
bool stitchModeFromString(const QString &text, StitchMode *mode);

struct StitchOptions {
    StitchMode mode = StitchMode::FlushStack;
    OverlapDetector::Config overlapConfig;
    HeaderAnnotator::Options header;
};

/**
 * @brief Entry point of the composition engine
 *
 * compose() arranges the frames according to the configured mode.
 * stitch() does the same and then draws spec.description above the canvas
 * when one is given.
 *
 * Frames are only read, so one pipeline can be reused for any number of
 * calls.
 */
class StitchPipeline
{
public:
    StitchPipeline() = default;
    explicit StitchPipeline(const StitchOptions &options);

    const StitchOptions &options() const { return m_options; }
    void setOptions(const StitchOptions &options) { m_options = options; }

    CompositionResult compose(const FrameSequence &frames, const MergeSpec &spec) const;
    CompositionResult stitch(const FrameSequence &frames, const MergeSpec &spec) const;

private:
    CompositionResult composeFlush(const FrameSequence &frames, const MergeSpec &spec) const;
    CompositionResult composeOverlapAware(const FrameSequence &frames, const MergeSpec &spec) const;

    StitchOptions m_options;
};

#endif // STITCHPIPELINE_H
