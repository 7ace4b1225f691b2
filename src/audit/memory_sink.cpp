#include "audit/memory_sink.hpp"

namespace redactguard {

bool MemorySink::write(std::string_view json_line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return false;
    lines_.emplace_back(json_line);
    return true;
}

Result<std::vector<std::string>> MemorySink::load() const {
    return Result<std::vector<std::string>>::ok(lines());
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

bool MemorySink::replace(size_t index, std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= lines_.size()) return false;
    lines_[index] = std::move(line);
    return true;
}

void MemorySink::set_fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

} // namespace redactguard
