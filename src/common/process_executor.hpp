#pragma once

#include <QString>
#include <QStringList>

#include "common/errors.hpp"

namespace hostform {

struct ProcessResult {
    // False when the program could not be launched at all.
    bool started = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool succeeded() const
    {
        return started && exitCode == 0;
    }
};

// Boundary to every external tool. Reconcilers only talk to the live system
// through this interface so tests can replay scripted results.
class ProcessExecutor
{
public:
    virtual ~ProcessExecutor() = default;

    // Blocks until the program exits. There is no timeout at this layer.
    virtual ProcessResult run(const QString &program, const QStringList &arguments) = 0;

    // Absolute path of program on PATH, or an empty string.
    virtual QString findProgram(const QString &program) const = 0;
};

class QProcessExecutor : public ProcessExecutor
{
public:
    ProcessResult run(const QString &program, const QStringList &arguments) override;
    QString findProgram(const QString &program) const override;
};

// Throws PreconditionNotFound when program is not on PATH.
void requireProgram(const ProcessExecutor &executor, const QString &program);

// Runs a command whose success is required. A launch failure or non-zero
// exit throws ReconcileError(failureKind) carrying the command and stderr.
ProcessResult runChecked(ProcessExecutor &executor,
                         const QString &program,
                         const QStringList &arguments,
                         ErrorKind failureKind);

// Splits captured stdout into trimmed, non-empty lines.
QStringList outputLines(const ProcessResult &result);

QString describeCommand(const QString &program, const QStringList &arguments);

} // namespace hostform
