#include "cli/commands/CaptureCommand.h"

#include "capture/ScreenRegionSource.h"
#include "cli/CommandArguments.h"
#include "session/CaptureSession.h"
#include "settings/MergeSettingsManager.h"

#include <QCoreApplication>
#include <QGuiApplication>
#include <QList>

namespace ScreenCatch {
namespace CLI {

QString CaptureCommand::name() const { return "capture"; }

QString CaptureCommand::description() const { return "Capture screen regions and merge them"; }

void CaptureCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"r", "region"}, "Region x,y,width,height (repeat for more)", "rect"});
    parser.addOption({{"p", "output-dir"}, "Save directory", "dir"});
    parser.addOption({{"m", "method"}, "Layout: vertical, horizontal, grid, auto", "method"});
    parser.addOption({{"s", "spacing"}, "Pixels between captures", "px"});
    parser.addOption({{"b", "background"}, "Background color (#rrggbb)", "color"});
    parser.addOption({"cols", "Grid columns (default: ceil(sqrt(n)))", "n"});
    parser.addOption({{"d", "description"}, "Description stored with the capture", "text"});
    parser.addOption({"annotate", "Draw the description above the image"});
    parser.addOption({"recapture-iteration", "Recapture attempt number (0 = first)", "n", "0"});
    parser.addOption({"json", "Print the result as JSON"});
}

CLIResult CaptureCommand::execute(const QCommandLineParser& parser)
{
    const QStringList regionArgs = parser.values("region");
    if (regionArgs.isEmpty()) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            "Region required. Use --region x,y,width,height");
    }

    QList<QRect> regions;
    QString argumentError;
    for (const QString& text : regionArgs) {
        QRect region;
        if (!parseRegion(text, &region, &argumentError)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
        }
        regions.append(region);
    }

    SessionRequest request;
    if (!resolveMergeSpec(parser, &request.spec, &argumentError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
    }
    if (!parseNonNegativeInt(parser.value("recapture-iteration"), QStringLiteral("recapture iteration"),
                             &request.recaptureIteration, &argumentError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
    }

    auto& settings = MergeSettingsManager::instance();
    request.stitchMode = StitchMode::Layout;
    request.header.padding = settings.loadHeaderPadding();
    request.annotateImage = parser.isSet("annotate");
    request.outputDirectory = parser.isSet("output-dir") ? parser.value("output-dir")
                                                         : settings.loadOutputDirectory();

    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        return CLIResult::error(CLIResult::Code::GeneralError, "Screen capture needs a display");
    }

    // Let the platform plugin finish reporting screens before grabbing
    QCoreApplication::processEvents();

    ScreenRegionSource source(regions);
    const SessionResult result = CaptureSession::run(source, request);
    if (!result.success) {
        return CLIResult::error(codeForSession(result), result.failureReason);
    }

    if (parser.isSet("json")) {
        return CLIResult::withData(sessionResultToJson(result));
    }
    return CLIResult::success(sessionSummary(result));
}

} // namespace CLI
} // namespace ScreenCatch
