#include "cli/CLIHandler.h"

#include "cli/commands/CaptureCommand.h"
#include "cli/commands/ConfigCommand.h"
#include "cli/commands/ListCommand.h"
#include "cli/commands/MergeCommand.h"
#include "cli/commands/StitchCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace ScreenCatch {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<MergeCommand>());
    addCmd(std::make_unique<StitchCommand>());
    addCmd(std::make_unique<CaptureCommand>());
    addCmd(std::make_unique<ListCommand>());
    addCmd(std::make_unique<ConfigCommand>());
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString& cmdOrOption = arguments.at(1);

    if (cmdOrOption == "--help" || cmdOrOption == "-h") {
        return CLIResult::success(getHelpText());
    }
    if (cmdOrOption == "--version" || cmdOrOption == "-v") {
        return CLIResult::success(getVersionText());
    }

    CLICommand* command = findCommand(cmdOrOption);
    if (!command) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown command: %1\n\n%2").arg(cmdOrOption, getHelpText()));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    // Parser expects the program name first, drop the command name
    QStringList cmdArgs = arguments;
    cmdArgs.removeAt(1);

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "ScreenCatch - Capture, merge and annotate screen regions\n\n";
    out << "Usage: screencatch <command> [options]\n\n";
    out << "Commands:\n";

    // std::map keeps names sorted
    for (const auto& [name, cmd] : m_commands) {
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nUse 'screencatch <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText()
{
    return QString("%1 version %2")
        .arg(QStringLiteral(SCREENCATCH_APP_NAME), QStringLiteral(SCREENCATCH_VERSION));
}

} // namespace CLI
} // namespace ScreenCatch
