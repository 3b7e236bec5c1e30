#ifndef LIST_COMMAND_H
#define LIST_COMMAND_H

#include "cli/CLICommand.h"

namespace ScreenCatch {
namespace CLI {

/**
 * @brief List saved captures in the output directory, newest first
 */
class ListCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace ScreenCatch

#endif // LIST_COMMAND_H
