#include "cli/CommandArguments.h"

#include "settings/MergeSettingsManager.h"

#include <QCommandLineParser>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <QTextStream>

namespace ScreenCatch {
namespace CLI {

namespace {

void setError(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

bool parseRegion(const QString& text, QRect* region, QString* error)
{
    const QStringList parts = text.split(',');
    if (parts.size() != 4) {
        setError(error, QString("Invalid region format '%1'. Use: x,y,width,height").arg(text));
        return false;
    }

    int values[4] = {0, 0, 0, 0};
    static const char* const names[4] = {"x coordinate", "y coordinate", "width", "height"};
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toInt(&ok);
        if (!ok || (i >= 2 && values[i] <= 0)) {
            setError(error, QString("Invalid %1 in region '%2'").arg(QLatin1String(names[i]), text));
            return false;
        }
    }

    *region = QRect(values[0], values[1], values[2], values[3]);
    return true;
}

bool parseNonNegativeInt(const QString& text, const QString& what, int* value, QString* error)
{
    bool ok = false;
    const int parsed = text.trimmed().toInt(&ok);
    if (!ok || parsed < 0) {
        setError(error, QString("Invalid %1: %2 (must be a non-negative integer)").arg(what, text));
        return false;
    }
    *value = parsed;
    return true;
}

bool parseSpacing(const QString& text, int* spacing, QString* error)
{
    return parseNonNegativeInt(text, QStringLiteral("spacing"), spacing, error);
}

bool parseColor(const QString& text, QColor* color, QString* error)
{
    const QColor parsed(text.trimmed());
    if (!parsed.isValid()) {
        setError(error, QString("Invalid color: %1 (use #rrggbb or a color name)").arg(text));
        return false;
    }
    *color = parsed;
    return true;
}

bool parseMethod(const QString& text, MergeMethod* method, QString* error)
{
    if (!mergeMethodFromString(text, method)) {
        setError(error,
                 QString("Invalid merge method: %1 (use vertical, horizontal, grid or auto)").arg(text));
        return false;
    }
    return true;
}

bool resolveMergeSpec(const QCommandLineParser& parser, MergeSpec* spec, QString* error)
{
    MergeSpec resolved = MergeSettingsManager::instance().loadMergeSpec();

    if (parser.isSet("method") && !parseMethod(parser.value("method"), &resolved.method, error)) {
        return false;
    }
    if (parser.isSet("spacing") && !parseSpacing(parser.value("spacing"), &resolved.spacing, error)) {
        return false;
    }
    if (parser.isSet("background")
        && !parseColor(parser.value("background"), &resolved.background, error)) {
        return false;
    }
    if (parser.isSet("cols")) {
        int columns = 0;
        if (!parseNonNegativeInt(parser.value("cols"), QStringLiteral("column count"), &columns, error)) {
            return false;
        }
        resolved.gridColumns = columns;
    }
    resolved.description = parser.value("description").trimmed();

    *spec = resolved;
    return true;
}

CLIResult::Code codeForCaptureError(CaptureError error)
{
    switch (error) {
    case CaptureError::None:
        return CLIResult::Code::Success;
    case CaptureError::MissingFile:
    case CaptureError::UnreadableFrame:
        return CLIResult::Code::FileError;
    case CaptureError::EmptyInput:
    case CaptureError::InvalidRegion:
        return CLIResult::Code::InvalidArguments;
    case CaptureError::GrabFailed:
        return CLIResult::Code::GeneralError;
    }
    return CLIResult::Code::GeneralError;
}

CLIResult::Code codeForSession(const SessionResult& result)
{
    switch (result.error) {
    case SessionError::None:
        return CLIResult::Code::Success;
    case SessionError::CaptureFailed:
        return codeForCaptureError(result.captureError);
    case SessionError::CompositionFailed:
        return CLIResult::Code::GeneralError;
    case SessionError::OutputFailed:
        return CLIResult::Code::FileError;
    }
    return CLIResult::Code::GeneralError;
}

QByteArray sessionResultToJson(const SessionResult& result)
{
    QJsonObject json;
    json["success"] = result.success;
    json["filepath"] = result.imagePath;
    json["description"] = result.metadata.description;
    json["capture_count"] = result.metadata.captures;
    json["merged"] = result.metadata.merged;
    json["recapture_iterations"] = result.metadata.recaptureIteration;
    json["metadata_file"] = result.metadataPath;
    return QJsonDocument(json).toJson(QJsonDocument::Indented);
}

QString sessionSummary(const SessionResult& result)
{
    QString summary;
    QTextStream out(&summary);
    out << "Saved to: " << result.imagePath;
    if (result.metadata.merged) {
        out << "\nMerged " << result.metadata.captures << " captures";
    }
    if (!result.metadata.description.isEmpty()) {
        out << "\nDescription: " << result.metadata.description;
    }
    out << "\nMetadata: " << result.metadataPath;
    return summary;
}

} // namespace CLI
} // namespace ScreenCatch
