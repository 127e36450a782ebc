#pragma once

#include <memory>

#include <QString>
#include <QStringList>

#include "common/process_executor.hpp"

namespace hostform {

class HostformCli
{
public:
    // Uses a QProcessExecutor when executor is null.
    explicit HostformCli(ProcessExecutor *executor = nullptr);

    // CLI dispatcher. Returns the process exit code.
    int run(int argc, char *argv[]);

private:
    int runSync(const QStringList &args);

    std::unique_ptr<ProcessExecutor> m_ownedExecutor;
    ProcessExecutor *m_executor = nullptr;
};

} // namespace hostform
