#pragma once

#include <optional>
#include <string>

#include "common/errors.hpp"
#include "common/process_executor.hpp"
#include "reconcile/defaults_types.hpp"

namespace hostform {

struct PreferenceKey {
    std::string domain;
    std::string key;
};

/**
 * Idempotent read-compare-write of scalar preferences through `defaults`.
 *
 * write() returns true when a `defaults write` was issued (or, in dry-run
 * mode, would have been). A key that has never been set counts as different
 * from every desired value, so it is always written.
 */
class DefaultsWriter
{
public:
    explicit DefaultsWriter(ProcessExecutor &executor, bool dryRun = false);

    // nullopt when the key has never been set. Throws QueryFailed when
    // `defaults read` fails otherwise, ParseFailed when the stored text is
    // not a T.
    template <typename T>
    std::optional<T> read(const PreferenceKey &key) const
    {
        const std::optional<std::string> text = readRaw(key);
        if (!text.has_value()) {
            return std::nullopt;
        }
        const std::optional<T> value = DefaultsType<T>::parse(*text);
        if (!value.has_value()) {
            throw ReconcileError(ErrorKind::ParseFailed,
                                 "Unable to parse '" + *text + "' as "
                                     + DefaultsType<T>::typeFlag + " for "
                                     + key.domain + "." + key.key);
        }
        return value;
    }

    template <typename T>
    bool write(const PreferenceKey &key, const T &desired)
    {
        const std::string serialized = DefaultsType<T>::serialize(desired);
        const std::optional<T> current = read<T>(key);
        if (current.has_value() && *current == desired) {
            logUnchanged(key, serialized);
            return false;
        }

        const std::string previous = current.has_value()
            ? DefaultsType<T>::serialize(*current)
            : std::string();
        writeRaw(key, DefaultsType<T>::typeFlag, serialized, previous,
                 !current.has_value());
        return true;
    }

    int writeCount() const
    {
        return m_writeCount;
    }

private:
    std::optional<std::string> readRaw(const PreferenceKey &key) const;
    void writeRaw(const PreferenceKey &key, const char *typeFlag,
                  const std::string &value, const std::string &previous,
                  bool wasUnset);
    void logUnchanged(const PreferenceKey &key, const std::string &value) const;

    ProcessExecutor &m_executor;
    bool m_dryRun = false;
    int m_writeCount = 0;
};

} // namespace hostform
