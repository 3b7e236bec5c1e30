#ifndef COMPOSITIONTYPES_H
#define COMPOSITIONTYPES_H

#include <QColor>
#include <QImage>
#include <QString>

#include <vector>

// How the caller wants multiple frames arranged
enum class MergeMethod {
    Vertical,
    Horizontal,
    Grid,
    Auto
};

// Arrangement that was actually applied to produce a canvas
enum class LayoutUsed {
    Identity,    // Single frame returned as-is
    Vertical,
    Horizontal,
    Grid
};

enum class CompositionError {
    None,
    EmptyInput,
    InvalidFrame
};

struct MergeSpec {
    MergeMethod method = MergeMethod::Auto;
    int gridColumns = 0;                  // Grid only, <= 0 means sqrt-based default
    int spacing = 10;                     // Pixels between frames, >= 0
    QColor background = QColor(255, 255, 255);
    QString description;                  // Empty = no header

    bool hasDescription() const { return !description.isEmpty(); }
};

enum class OverlapDecision {
    Accepted,
    Rejected
};

enum class OverlapReason {
    Accepted,
    InvalidInput,
    NoCandidates,
    ScoreAboveThreshold,
    IndistinctMinimum,
    LowVariance
};

struct OverlapMeasurement {
    int overlapPx = 0;
    double score = 0.0;                   // Mean squared error at overlapPx
    OverlapDecision decision = OverlapDecision::Rejected;
    OverlapReason reason = OverlapReason::NoCandidates;
    int candidateCount = 0;

    bool accepted() const { return decision == OverlapDecision::Accepted; }
};

struct CompositionResult {
    bool success = false;
    QImage canvas;
    LayoutUsed layoutUsed = LayoutUsed::Identity;
    int frameCount = 0;
    std::vector<OverlapMeasurement> overlaps;  // One per adjacent pair in overlap-aware mode
    bool annotated = false;
    CompositionError error = CompositionError::None;
    QString failureReason;

    static CompositionResult failure(CompositionError error, const QString &reason)
    {
        CompositionResult result;
        result.error = error;
        result.failureReason = reason;
        return result;
    }
};

QString mergeMethodToString(MergeMethod method);
bool mergeMethodFromString(const QString &text, MergeMethod *method);
QString layoutUsedToString(LayoutUsed layout);
QString overlapReasonToString(OverlapReason reason);

#endif // COMPOSITIONTYPES_H
