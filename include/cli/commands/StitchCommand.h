#ifndef STITCH_COMMAND_H
#define STITCH_COMMAND_H

#include "cli/CLICommand.h"

namespace ScreenCatch {
namespace CLI {

/**
 * @brief Stack image files into a panorama and save it with a metadata sidecar
 */
class StitchCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace ScreenCatch

#endif // STITCH_COMMAND_H
