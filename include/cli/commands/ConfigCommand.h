#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

#include <QStringList>

namespace ScreenCatch {
namespace CLI {

/**
 * @brief Show or change the stored merge defaults and output directory
 *
 * Keys: method, spacing, background, stitch-mode, header-padding, output-dir.
 * Values are validated like the matching command-line options before they
 * are stored.
 */
class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    static QStringList keys();
};

} // namespace CLI
} // namespace ScreenCatch

#endif // CONFIG_COMMAND_H
