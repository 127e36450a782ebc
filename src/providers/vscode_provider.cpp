#include "providers/vscode_provider.hpp"

#include <cctype>

#include "common/errors.hpp"

namespace hostform {

namespace {

const QString kCodeProgram = QStringLiteral("code");

char lowerAscii(char ch)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

std::string identityOf(const std::string &id)
{
    return id;
}

} // namespace

std::size_t ExtensionIdHash::operator()(const std::string &id) const
{
    std::string lowered;
    lowered.reserve(id.size());
    for (char ch : id) {
        lowered.push_back(lowerAscii(ch));
    }
    return std::hash<std::string>{}(lowered);
}

bool ExtensionIdEqual::operator()(const std::string &lhs, const std::string &rhs) const
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lowerAscii(lhs[i]) != lowerAscii(rhs[i])) {
            return false;
        }
    }
    return true;
}

VscodeProvider::VscodeProvider(ProcessExecutor &executor, bool dryRun)
    : m_executor(executor)
    , m_dryRun(dryRun)
{
}

void VscodeProvider::checkInstalled() const
{
    requireProgram(m_executor, kCodeProgram);
}

ExtensionSet VscodeProvider::installedExtensions() const
{
    const ProcessResult result = runChecked(m_executor, kCodeProgram,
                                            {QStringLiteral("--list-extensions")},
                                            ErrorKind::QueryFailed);

    ExtensionSet installed;
    for (const QString &line : outputLines(result)) {
        installed.insert(line.toStdString());
    }
    return installed;
}

void VscodeProvider::installExtension(const std::string &id) const
{
    runChecked(m_executor, kCodeProgram,
               {QStringLiteral("--install-extension"), QString::fromStdString(id)},
               ErrorKind::WriteFailed);
}

SetOutcome<std::string> VscodeProvider::reconcile(const std::vector<std::string> &desired) const
{
    SetReconciler<std::string, ExtensionIdHash, ExtensionIdEqual> reconciler(
        QStringLiteral("vscode_extension"),
        [this]() { return installedExtensions(); },
        [this](const std::string &id) { installExtension(id); },
        identityOf);
    if (m_dryRun) {
        return reconciler.plan(desired);
    }
    return reconciler.reconcile(desired);
}

} // namespace hostform
