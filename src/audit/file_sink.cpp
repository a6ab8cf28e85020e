#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace privguard {

FileSink::FileSink(const Config& config)
    : config_(config) {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_line) {
    if (!file_stream_.is_open()) {
        return false;
    }
    if (current_file_size_ > 0 &&
        current_file_size_ + json_line.size() + 1 > config_.max_file_size_bytes) {
        rotate_file();
    }
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.put('\n');
    current_file_size_ += json_line.size() + 1;
    return file_stream_.good();
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    const auto oldest = std::format("{}.{}", config_.output_file, config_.max_files);
    std::filesystem::remove(oldest, ec);

    // .N -> .N+1; missing files are expected
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }

    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);
    if (ec) {
        utils::log::warn(std::format("Audit rotation of {} failed: {}",
            config_.output_file, ec.message()));
    }

    file_stream_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace privguard
