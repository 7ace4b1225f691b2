#include "receipt/receipt_store.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>

namespace redactguard {

namespace {

// Create-exclusive write + fsync. EEXIST maps to CONFLICT.
Result<void> write_exclusive(const std::string& path, std::string_view data) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Result<void>::error(ErrorCategory::CONFLICT,
                std::format("{} already exists", path));
        }
        return Result<void>::error(ErrorCategory::STORAGE_ERROR,
            std::format("open {}: {}", path, std::strerror(errno)));
    }

    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string err = std::strerror(errno);
            ::close(fd);
            ::unlink(path.c_str());
            return Result<void>::error(ErrorCategory::STORAGE_ERROR,
                std::format("write {}: {}", path, err));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const std::string err = std::strerror(errno);
        ::close(fd);
        ::unlink(path.c_str());
        return Result<void>::error(ErrorCategory::STORAGE_ERROR,
            std::format("fsync {}: {}", path, err));
    }
    if (::close(fd) != 0) {
        return Result<void>::error(ErrorCategory::STORAGE_ERROR,
            std::format("close {}: {}", path, std::strerror(errno)));
    }
    return Result<void>::ok();
}

} // anonymous namespace

bool is_valid_operation_id(const std::string& operation_id) {
    if (operation_id.empty() || operation_id.size() > 64) return false;
    for (const char c : operation_id) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex && c != '-') return false;
    }
    return true;
}

FileReceiptStore::FileReceiptStore(std::string directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        utils::log::error(std::format("FileReceiptStore: cannot create '{}': {}",
            directory_, ec.message()));
    }
}

std::string FileReceiptStore::receipt_path(const std::string& operation_id) const {
    return (std::filesystem::path(directory_) / (operation_id + ".json")).string();
}

std::string FileReceiptStore::marker_path(const std::string& operation_id) const {
    return (std::filesystem::path(directory_) / (operation_id + ".invalid")).string();
}

std::vector<std::string> FileReceiptStore::operation_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json") continue;
        const std::string id = path.stem().string();
        if (is_valid_operation_id(id)) {
            ids.push_back(id);
        }
    }
    if (ec) {
        utils::log::warn(std::format("FileReceiptStore: cannot list '{}': {}", directory_, ec.message()));
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string FileReceiptStore::name() const {
    return "file:" + directory_;
}

Result<void> FileReceiptStore::put(const Receipt& receipt) {
    if (!is_valid_operation_id(receipt.operation_id)) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Invalid operation id '{}'", receipt.operation_id));
    }

    auto result = write_exclusive(receipt_path(receipt.operation_id),
                                  receipt_codec::serialize(receipt));
    if (result.is_error()) {
        utils::log::error(std::format("Receipt {} not stored: {}",
            receipt.operation_id, result.error_message()));
    }
    return result;
}

Result<Receipt> FileReceiptStore::get(const std::string& operation_id) const {
    if (!is_valid_operation_id(operation_id)) {
        return Result<Receipt>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Invalid operation id '{}'", operation_id));
    }

    std::error_code ec;
    if (std::filesystem::exists(marker_path(operation_id), ec)) {
        return Result<Receipt>::error(ErrorCategory::NOT_FOUND,
            std::format("Receipt {} was invalidated", operation_id));
    }

    std::ifstream file(receipt_path(operation_id), std::ios::binary);
    if (!file.is_open()) {
        return Result<Receipt>::error(ErrorCategory::NOT_FOUND,
            std::format("No receipt for operation {}", operation_id));
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());

    auto parsed = receipt_codec::parse(buffer);
    if (parsed.is_ok() && parsed.value().operation_id != operation_id) {
        return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Receipt file for {} names operation {}",
                operation_id, parsed.value().operation_id));
    }
    return parsed;
}

Result<void> FileReceiptStore::invalidate(const std::string& operation_id,
                                          const std::string& reason) {
    if (!is_valid_operation_id(operation_id)) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Invalid operation id '{}'", operation_id));
    }

    auto result = write_exclusive(marker_path(operation_id),
        std::format("{} {}\n", utils::format_timestamp_utc(utils::now()), reason));
    if (result.is_error() && result.error_category() == ErrorCategory::CONFLICT) {
        return Result<void>::ok();  // Already invalidated
    }
    if (result.is_ok()) {
        utils::log::warn(std::format("Receipt {} invalidated: {}", operation_id, reason));
    }
    return result;
}

} // namespace redactguard
