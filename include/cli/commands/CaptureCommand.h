#ifndef CAPTURE_COMMAND_H
#define CAPTURE_COMMAND_H

#include "cli/CLICommand.h"

namespace ScreenCatch {
namespace CLI {

/**
 * @brief Capture screen regions, merge them and save image plus sidecar
 */
class CaptureCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace ScreenCatch

#endif // CAPTURE_COMMAND_H
