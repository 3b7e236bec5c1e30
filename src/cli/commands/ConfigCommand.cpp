#include "cli/commands/ConfigCommand.h"

#include "cli/CommandArguments.h"
#include "compose/StitchPipeline.h"
#include "settings/MergeSettingsManager.h"

#include <QDir>
#include <QFileInfo>
#include <QTextStream>

namespace ScreenCatch {
namespace CLI {

namespace {

QString currentValue(const QString& key)
{
    const auto& settings = MergeSettingsManager::instance();
    if (key == "method") {
        return mergeMethodToString(settings.loadMethod());
    }
    if (key == "spacing") {
        return QString::number(settings.loadSpacing());
    }
    if (key == "background") {
        return settings.loadBackground().name();
    }
    if (key == "stitch-mode") {
        return stitchModeToString(settings.loadStitchMode());
    }
    if (key == "header-padding") {
        return QString::number(settings.loadHeaderPadding());
    }
    if (key == "output-dir") {
        return settings.loadOutputDirectory();
    }
    return QString();
}

bool storeValue(const QString& key, const QString& value, QString* stored, QString* error)
{
    auto& settings = MergeSettingsManager::instance();

    if (key == "method") {
        MergeMethod method = MergeMethod::Auto;
        if (!parseMethod(value, &method, error)) {
            return false;
        }
        settings.saveMethod(method);
    }
    else if (key == "spacing") {
        int spacing = 0;
        if (!parseSpacing(value, &spacing, error)) {
            return false;
        }
        settings.saveSpacing(spacing);
    }
    else if (key == "background") {
        QColor color;
        if (!parseColor(value, &color, error)) {
            return false;
        }
        settings.saveBackground(color);
    }
    else if (key == "stitch-mode") {
        StitchMode mode = StitchMode::FlushStack;
        if (!stitchModeFromString(value.trimmed(), &mode)) {
            *error = QString("Invalid stitch mode: %1 (use flush, overlap or layout)").arg(value);
            return false;
        }
        settings.saveStitchMode(mode);
    }
    else if (key == "header-padding") {
        int padding = 0;
        if (!parseNonNegativeInt(value, QStringLiteral("header padding"), &padding, error)) {
            return false;
        }
        settings.saveHeaderPadding(padding);
    }
    else if (key == "output-dir") {
        if (value.trimmed().isEmpty()) {
            *error = QStringLiteral("Output directory must not be empty");
            return false;
        }
        const QString directory = QDir::cleanPath(QFileInfo(value.trimmed()).absoluteFilePath());
        if (QFileInfo(directory).exists() && !QFileInfo(directory).isDir()) {
            *error = QString("Not a directory: %1").arg(directory);
            return false;
        }
        settings.saveOutputDirectory(directory);
    }

    *stored = currentValue(key);
    return true;
}

} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Show or change stored defaults"; }

QStringList ConfigCommand::keys()
{
    return {"method", "spacing", "background", "stitch-mode", "header-padding", "output-dir"};
}

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        if (!keys().contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Unknown setting: %1 (keys: %2)").arg(key, keys().join(", ")));
        }
        return CLIResult::success(currentValue(key));
    }

    if (parser.isSet("set")) {
        const QString key = parser.value("set");
        if (!keys().contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Unknown setting: %1 (keys: %2)").arg(key, keys().join(", ")));
        }
        const QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }

        QString stored;
        QString error;
        if (!storeValue(key, positionalArgs.first(), &stored, &error)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, error);
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, stored));
    }

    if (parser.isSet("reset")) {
        MergeSettingsManager::instance().resetToDefaults();
        return CLIResult::success("Settings reset to defaults");
    }

    // --list and no option both print everything
    QString output;
    QTextStream out(&output);
    out << "Current settings:\n";
    for (const QString& key : keys()) {
        out << QString("  %1 = %2\n").arg(key, currentValue(key));
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace ScreenCatch
