#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QByteArray>
#include <QString>

namespace ScreenCatch {
namespace CLI {

/**
 * @brief CLI execution result
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        FileError = 3,
    };

    Code code = Code::Success;
    QString message;
    QByteArray data; // Printed verbatim on stdout (--json)

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult success(const QString& msg = QString())
    {
        return {Code::Success, msg, {}};
    }

    static CLIResult error(Code code, const QString& msg) { return {code, msg, {}}; }

    static CLIResult withData(const QByteArray& data, const QString& msg = QString())
    {
        return {Code::Success, msg, data};
    }
};

} // namespace CLI
} // namespace ScreenCatch

#endif // CLI_RESULT_H
