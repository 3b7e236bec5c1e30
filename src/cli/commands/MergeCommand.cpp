#include "cli/commands/MergeCommand.h"

#include "capture/ImageFileSource.h"
#include "cli/CommandArguments.h"
#include "compose/StitchPipeline.h"
#include "metadata/CaptureMetadata.h"
#include "session/CaptureSession.h"
#include "settings/MergeSettingsManager.h"
#include "utils/ImageSaveUtils.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace ScreenCatch {
namespace CLI {

QString MergeCommand::name() const { return "merge"; }

QString MergeCommand::description() const { return "Merge image files into one image"; }

void MergeCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("images", "Images to merge, in order", "<images...>");
    parser.addOption({{"o", "output"}, "Output image path", "file"});
    parser.addOption({{"m", "method"}, "Layout: vertical, horizontal, grid, auto", "method"});
    parser.addOption({{"s", "spacing"}, "Pixels between images", "px"});
    parser.addOption({{"b", "background"}, "Background color (#rrggbb)", "color"});
    parser.addOption({{"d", "description"}, "Description drawn above the result", "text"});
    parser.addOption({"cols", "Grid columns (default: ceil(sqrt(n)))", "n"});
    parser.addOption({"metadata", "Also write a JSON sidecar next to the output"});
}

CLIResult MergeCommand::execute(const QCommandLineParser& parser)
{
    const QStringList images = parser.positionalArguments();
    if (images.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                "No images given. Usage: screencatch merge <images...> --output <file>");
    }

    const QString outputFile = parser.value("output");
    if (outputFile.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Output required. Use --output <file>");
    }

    MergeSpec spec;
    QString argumentError;
    if (!resolveMergeSpec(parser, &spec, &argumentError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
    }

    ImageFileSource source(images);
    const FrameCaptureResult capture = source.captureFrames();
    if (!capture.success) {
        return CLIResult::error(codeForCaptureError(capture.error), capture.failureReason);
    }

    StitchOptions options;
    options.mode = StitchMode::Layout;
    options.header.padding = MergeSettingsManager::instance().loadHeaderPadding();
    const CompositionResult composition = StitchPipeline(options).stitch(capture.frames, spec);
    if (!composition.success) {
        return CLIResult::error(CLIResult::Code::GeneralError, composition.failureReason);
    }

    const QString filePath = QFileInfo(outputFile).absoluteFilePath();
    const QString outputDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(outputDir)) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Failed to create output directory: %1").arg(outputDir));
    }

    // Always PNG, whatever the extension says
    ImageSaveUtils::Error saveError;
    if (!ImageSaveUtils::saveImageAtomically(composition.canvas, filePath, QByteArrayLiteral("png"),
                                             &saveError)) {
        return CLIResult::error(
            CLIResult::Code::FileError,
            QString("Failed to save merged image to: %1 (%2)")
                .arg(filePath, ImageSaveUtils::describe(saveError)));
    }

    QString message = QString("Merged %1 image(s) (%2) into: %3")
                          .arg(capture.frames.size())
                          .arg(layoutUsedToString(composition.layoutUsed), filePath);

    if (parser.isSet("metadata")) {
        const QString sidecar = CaptureMetadataStore::sidecarPathFor(filePath);
        const CaptureMetadata metadata = CaptureSession::buildMetadata(
            capture.frames, spec, 0, QDateTime::currentDateTime(), filePath);

        CaptureMetadataStore::Error metadataError;
        if (!CaptureMetadataStore::save(metadata, sidecar, &metadataError)) {
            if (!QFile::remove(filePath)) {
                qWarning() << "MergeCommand: Could not remove" << filePath;
            }
            return CLIResult::error(
                CLIResult::Code::FileError,
                QString("Failed to write metadata to: %1 (%2)").arg(sidecar, metadataError.message));
        }
        message += QString("\nMetadata: %1").arg(sidecar);
    }

    return CLIResult::success(message);
}

} // namespace CLI
} // namespace ScreenCatch
