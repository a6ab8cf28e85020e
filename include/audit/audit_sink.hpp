#pragma once

#include <string>
#include <string_view>

namespace privguard {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Receives one serialized JSON record per call. Sinks are driven from a
 * single thread (the CLI's document loop), so no internal locking.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write a single JSON record (without trailing newline). Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace privguard
