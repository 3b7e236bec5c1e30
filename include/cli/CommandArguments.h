#ifndef COMMAND_ARGUMENTS_H
#define COMMAND_ARGUMENTS_H

#include "cli/CLIResult.h"
#include "capture/ICaptureSource.h"
#include "compose/CompositionTypes.h"
#include "session/CaptureSession.h"

#include <QByteArray>
#include <QColor>
#include <QRect>
#include <QString>

class QCommandLineParser;

namespace ScreenCatch {
namespace CLI {

// Option parsers shared by the commands. Each returns false and fills
// error with a user-facing message when the text is invalid.
bool parseRegion(const QString& text, QRect* region, QString* error);
bool parseSpacing(const QString& text, int* spacing, QString* error);
bool parseColor(const QString& text, QColor* color, QString* error);
bool parseMethod(const QString& text, MergeMethod* method, QString* error);
bool parseNonNegativeInt(const QString& text, const QString& what, int* value, QString* error);

/**
 * @brief Build a MergeSpec from --method, --spacing, --background,
 * --cols and --description, falling back to the stored defaults
 *
 * The parser must have all five options registered.
 */
bool resolveMergeSpec(const QCommandLineParser& parser, MergeSpec* spec, QString* error);

CLIResult::Code codeForCaptureError(CaptureError error);
CLIResult::Code codeForSession(const SessionResult& result);

// Machine-readable summary of a finished session (--json)
QByteArray sessionResultToJson(const SessionResult& result);

// Human-readable summary of a finished session
QString sessionSummary(const SessionResult& result);

} // namespace CLI
} // namespace ScreenCatch

#endif // COMMAND_ARGUMENTS_H
