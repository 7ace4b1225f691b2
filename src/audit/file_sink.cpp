#include "audit/file_sink.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace redactguard {

FileSink::FileSink(std::string path)
    : path_(std::move(path)) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    file_stream_.open(path_, std::ios::app | std::ios::binary);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit ledger: " + path_);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_line) {
    if (!file_stream_.is_open()) return false;
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.put('\n');
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

Result<std::vector<std::string>> FileSink::load() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return Result<std::vector<std::string>>::ok({});
        }
        return Result<std::vector<std::string>>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Cannot read audit ledger {}", path_));
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        lines.push_back(std::move(line));
    }
    if (in.bad()) {
        return Result<std::vector<std::string>>::error(ErrorCategory::STORAGE_ERROR,
            std::format("I/O error reading audit ledger {}", path_));
    }
    return Result<std::vector<std::string>>::ok(std::move(lines));
}

std::string FileSink::name() const {
    return "file:" + path_;
}

} // namespace redactguard
