#include "common/process_executor.hpp"

#include <QProcess>
#include <QStandardPaths>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace hostform {

ProcessResult QProcessExecutor::run(const QString &program, const QStringList &arguments)
{
    HFLOG_DEBUG(QStringLiteral("ProcessExecutor"),
                QStringLiteral("run"),
                QStringLiteral("process_start"),
                QStringLiteral("reconcile_step"),
                QStringLiteral("qprocess"),
                hostform::logging::defaultWho(),
                QString(),
                nlohmann::json{{"command", describeCommand(program, arguments).toStdString()}});

    ProcessResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(-1)) {
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    // A hung tool hangs the run; supervising that is the caller's business.
    if (!process.waitForFinished(-1)) {
        return result;
    }

    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());
    if (process.exitStatus() == QProcess::NormalExit) {
        result.exitCode = process.exitCode();
    }

    HFLOG_DEBUG(QStringLiteral("ProcessExecutor"),
                QStringLiteral("run"),
                QStringLiteral("process_finished"),
                QStringLiteral("reconcile_step"),
                QStringLiteral("qprocess"),
                hostform::logging::defaultWho(),
                QString(),
                nlohmann::json{{"program", program.toStdString()},
                               {"exitCode", result.exitCode}});
    return result;
}

QString QProcessExecutor::findProgram(const QString &program) const
{
    return QStandardPaths::findExecutable(program);
}

void requireProgram(const ProcessExecutor &executor, const QString &program)
{
    const QString path = executor.findProgram(program);
    if (path.isEmpty()) {
        HFLOG_ERROR(QStringLiteral("ProcessExecutor"),
                    QStringLiteral("requireProgram"),
                    QStringLiteral("program_not_found"),
                    QStringLiteral("precondition_check"),
                    QStringLiteral("path_lookup"),
                    hostform::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"program", program.toStdString()}});
        throw ReconcileError(ErrorKind::PreconditionNotFound,
                             "Program not found on PATH: " + program.toStdString());
    }

    HFLOG_DEBUG(QStringLiteral("ProcessExecutor"),
                QStringLiteral("requireProgram"),
                QStringLiteral("program_found"),
                QStringLiteral("precondition_check"),
                QStringLiteral("path_lookup"),
                hostform::logging::defaultWho(),
                QString(),
                nlohmann::json{{"program", program.toStdString()},
                               {"path", path.toStdString()}});
}

ProcessResult runChecked(ProcessExecutor &executor,
                         const QString &program,
                         const QStringList &arguments,
                         ErrorKind failureKind)
{
    ProcessResult result = executor.run(program, arguments);
    if (result.succeeded()) {
        return result;
    }

    const QString command = describeCommand(program, arguments);
    HFLOG_ERROR(QStringLiteral("ProcessExecutor"),
                QStringLiteral("runChecked"),
                QStringLiteral("command_failed"),
                QString::fromStdString(toErrorKindString(failureKind)),
                QStringLiteral("exit_status"),
                hostform::logging::defaultWho(),
                QString(),
                nlohmann::json{{"command", command.toStdString()},
                               {"started", result.started},
                               {"exitCode", result.exitCode},
                               {"stderr", result.standardError.trimmed().toStdString()}});

    std::string message;
    if (!result.started) {
        message = "Failed to launch '" + command.toStdString() + "'";
    } else {
        message = "'" + command.toStdString() + "' exited with status "
            + std::to_string(result.exitCode);
        const QString stderrText = result.standardError.trimmed();
        if (!stderrText.isEmpty()) {
            message += ": " + stderrText.toStdString();
        }
    }
    throw ReconcileError(failureKind, message);
}

QStringList outputLines(const ProcessResult &result)
{
    QStringList lines;
    const QStringList raw = result.standardOutput.split(QChar('\n'));
    for (const QString &line : raw) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

QString describeCommand(const QString &program, const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return program;
    }
    return program + QChar(' ') + arguments.join(QChar(' '));
}

} // namespace hostform
