#include "cli/commands/ListCommand.h"

#include "cli/CommandArguments.h"
#include "session/CaptureHistory.h"
#include "settings/MergeSettingsManager.h"

#include <QLocale>
#include <QTextStream>

namespace ScreenCatch {
namespace CLI {

QString ListCommand::name() const { return "list"; }

QString ListCommand::description() const { return "List saved captures, newest first"; }

void ListCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"p", "output-dir"}, "Directory to list (default: configured output directory)", "dir"});
    parser.addOption({{"n", "limit"}, "Maximum number of captures (default: 10, 0 for all)", "n"});
    parser.addOption({"json", "Print the listing as JSON"});
}

CLIResult ListCommand::execute(const QCommandLineParser& parser)
{
    int limit = CaptureHistory::DEFAULT_LIMIT;
    QString argumentError;
    if (parser.isSet("limit")
        && !parseNonNegativeInt(parser.value("limit"), QStringLiteral("limit"), &limit, &argumentError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, argumentError);
    }

    const QString directory = parser.isSet("output-dir")
        ? parser.value("output-dir")
        : MergeSettingsManager::instance().loadOutputDirectory();

    const CaptureListing listing = CaptureHistory::list(directory, limit);

    if (parser.isSet("json")) {
        return CLIResult::withData(CaptureHistory::toJson(listing));
    }

    if (listing.entries.isEmpty()) {
        return CLIResult::success(QString("No captures in: %1").arg(directory));
    }

    QString output;
    QTextStream out(&output);
    out << QString("Showing %1 of %2 capture(s) in: %3\n")
               .arg(listing.entries.size())
               .arg(listing.total)
               .arg(directory);
    for (const CaptureHistoryEntry& entry : listing.entries) {
        out << QString("  %1  %2  %3\n")
                   .arg(entry.modified.toString(Qt::ISODate),
                        QLocale::c().formattedDataSize(entry.size),
                        entry.filepath);
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace ScreenCatch
