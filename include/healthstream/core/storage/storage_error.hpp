#pragma once

#include <stdexcept>
#include <string>

namespace HealthStream {

enum class StorageErrc {
    NOT_ENABLED = 0,
    BACKEND_UNAVAILABLE,
    WRITE_FAILED,
    QUERY_FAILED,
    RAW_WRITE_REJECTED,
    CLOSED,
    BACKUP_DISABLED,
    BACKUP_FAILED,
    BACKUP_NOT_FOUND,
    RESTORE_FAILED
};

/**
 * @brief Error raised by explicitly invoked storage operations
 *
 * Background flushes never throw across threads; they log and drop.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrc code, const std::string& message)
        : std::runtime_error(std::string(codeString(code)) + ": " + message), code_(code) {}

    StorageErrc code() const { return code_; }

    static const char* codeString(StorageErrc code) {
        switch (code) {
            case StorageErrc::NOT_ENABLED:         return "persistence not enabled";
            case StorageErrc::BACKEND_UNAVAILABLE: return "backend unavailable";
            case StorageErrc::WRITE_FAILED:        return "backend write failed";
            case StorageErrc::QUERY_FAILED:        return "backend query failed";
            case StorageErrc::RAW_WRITE_REJECTED:  return "raw write rejected";
            case StorageErrc::CLOSED:              return "backend closed";
            case StorageErrc::BACKUP_DISABLED:     return "backup not enabled";
            case StorageErrc::BACKUP_FAILED:       return "backup failed";
            case StorageErrc::BACKUP_NOT_FOUND:    return "backup not found";
            case StorageErrc::RESTORE_FAILED:      return "restore failed";
        }
        return "unknown storage error";
    }

private:
    StorageErrc code_;
};

} // namespace HealthStream
