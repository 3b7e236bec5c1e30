#include "cli/commands/StitchCommand.h"

#include "capture/ImageFileSource.h"
#include "cli/CommandArguments.h"
#include "session/CaptureSession.h"
#include "settings/MergeSettingsManager.h"

namespace ScreenCatch {
namespace CLI {

QString StitchCommand::name() const { return "stitch"; }

QString StitchCommand::description() const { return "Stack image files into a panorama"; }

void StitchCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("images", "Images to stitch, top to bottom", "<images...>");
    parser.addOption({{"p", "output-dir"}, "Save directory", "dir"});
    parser.addOption({"overlap", "Detect and remove rows repeated between neighbours"});
    parser.addOption({{"d", "description"}, "Description stored with the capture", "text"});
    parser.addOption({"annotate", "Draw the description above the image"});
    parser.addOption({{"b", "background"}, "Background color (#rrggbb)", "color"});
    parser.addOption({"json", "Print the result as JSON"});
}

CLIResult StitchCommand::execute(const QCommandLineParser& parser)
{
    const QStringList images = parser.positionalArguments();
    if (images.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                "No images given. Usage: screencatch stitch <images...>");
    }

    auto& settings = MergeSettingsManager::instance();

    SessionRequest request;
    request.spec.method = MergeMethod::Vertical;
    request.spec.spacing = 0;
    request.spec.background = settings.loadBackground();
    request.spec.description = parser.value("description").trimmed();
    request.stitchMode = parser.isSet("overlap") ? StitchMode::OverlapAware : settings.loadStitchMode();
    if (request.stitchMode == StitchMode::Layout) {
        request.stitchMode = StitchMode::FlushStack;
    }
    request.header.padding = settings.loadHeaderPadding();
    request.annotateImage = parser.isSet("annotate");
    request.outputDirectory = parser.isSet("output-dir") ? parser.value("output-dir")
                                                         : settings.loadOutputDirectory();

    QString argumentError;
    if (parser.isSet("background")
        && !parseColor(parser.value("background"), &request.spec.background, &argumentError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
    }

    ImageFileSource source(images);
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
