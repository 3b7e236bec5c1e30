#ifndef MERGE_COMMAND_H
#define MERGE_COMMAND_H

#include "cli/CLICommand.h"

namespace ScreenCatch {
namespace CLI {

/**
 * @brief Merge image files into one image with an optional description header
 */
class MergeCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace ScreenCatch

#endif // MERGE_COMMAND_H
