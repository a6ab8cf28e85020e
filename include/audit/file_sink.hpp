#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace privguard {

/**
 * @brief JSONL audit sink with size-based rotation
 *
 * Rotated files are named with numeric suffixes: audit.jsonl.1,
 * audit.jsonl.2, ... (1 is the newest). Files beyond max_files are deleted.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "privguard_audit.jsonl";
        size_t max_file_size_bytes = 10ULL * 1024 * 1024;  // 10MB
        int max_files = 5;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace privguard
