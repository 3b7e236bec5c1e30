#include <QGuiApplication>
#include <QTextStream>
#include <cstdio>

#include "cli/CLIHandler.h"
#include "version.h"

int main(int argc, char *argv[])
{
    // Fonts for the description header and screens for capture both need a GUI application
    QGuiApplication app(argc, argv);
    app.setApplicationName(SCREENCATCH_APP_NAME);
    app.setOrganizationName(SCREENCATCH_ORGANIZATION);
    app.setApplicationVersion(SCREENCATCH_VERSION);

    ScreenCatch::CLI::CLIHandler handler;
    const ScreenCatch::CLI::CLIResult result = handler.process(app.arguments());

    if (!result.data.isEmpty()) {
        fwrite(result.data.constData(), 1, static_cast<size_t>(result.data.size()), stdout);
        fflush(stdout);
    }

    if (!result.message.isEmpty()) {
        // Results go to stdout only when no data was requested, errors always to stderr
        FILE *stream = (result.isSuccess() && result.data.isEmpty()) ? stdout : stderr;
        QTextStream out(stream);
        out << result.message << Qt::endl;
    }

    return result.exitCode();
}
