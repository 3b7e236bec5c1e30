#include "compose/CompositionTypes.h"

QString mergeMethodToString(MergeMethod method)
{
    switch (method) {
    case MergeMethod::Vertical:
        return QStringLiteral("vertical");
    case MergeMethod::Horizontal:
        return QStringLiteral("horizontal");
    case MergeMethod::Grid:
        return QStringLiteral("grid");
    case MergeMethod::Auto:
        return QStringLiteral("auto");
    }
    return QStringLiteral("auto");
}

bool mergeMethodFromString(const QString &text, MergeMethod *method)
{
    const QString normalized = text.trimmed().toLower();
    MergeMethod parsed;
    if (normalized == QLatin1String("vertical")) {
        parsed = MergeMethod::Vertical;
    } else if (normalized == QLatin1String("horizontal")) {
        parsed = MergeMethod::Horizontal;
    } else if (normalized == QLatin1String("grid")) {
        parsed = MergeMethod::Grid;
    } else if (normalized == QLatin1String("auto")) {
        parsed = MergeMethod::Auto;
    } else {
        return false;
    }

    if (method) {
        *method = parsed;
    }
    return true;
}

QString layoutUsedToString(LayoutUsed layout)
{
    switch (layout) {
    case LayoutUsed::Identity:
        return QStringLiteral("identity");
    case LayoutUsed::Vertical:
        return QStringLiteral("vertical");
    case LayoutUsed::Horizontal:
        return QStringLiteral("horizontal");
    case LayoutUsed::Grid:
        return QStringLiteral("grid");
    }
    return QStringLiteral("identity");
}

QString overlapReasonToString(OverlapReason reason)
{
    switch (reason) {
    case OverlapReason::Accepted:
        return QStringLiteral("accepted");
    case OverlapReason::InvalidInput:
        return QStringLiteral("invalid input");
    case OverlapReason::NoCandidates:
        return QStringLiteral("no candidate overlaps");
    case OverlapReason::ScoreAboveThreshold:
        return QStringLiteral("score above threshold");
    case OverlapReason::IndistinctMinimum:
        return QStringLiteral("best score close to median");
    case OverlapReason::LowVariance:
        return QStringLiteral("blank region");
    }
    return QString();
}
