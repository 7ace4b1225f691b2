#include "receipt/receipt_store.hpp"

#include <format>

namespace redactguard {

Result<void> MemoryReceiptStore::put(const Receipt& receipt) {
    if (!is_valid_operation_id(receipt.operation_id)) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Invalid operation id '{}'", receipt.operation_id));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = receipts_.try_emplace(
        receipt.operation_id, receipt_codec::serialize(receipt));
    if (!inserted) {
        return Result<void>::error(ErrorCategory::CONFLICT,
            std::format("Receipt {} already exists", receipt.operation_id));
    }
    return Result<void>::ok();
}

Result<Receipt> MemoryReceiptStore::get(const std::string& operation_id) const {
    std::string serialized;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (invalidated_.contains(operation_id)) {
            return Result<Receipt>::error(ErrorCategory::NOT_FOUND,
                std::format("Receipt {} was invalidated", operation_id));
        }
        const auto it = receipts_.find(operation_id);
        if (it == receipts_.end()) {
            return Result<Receipt>::error(ErrorCategory::NOT_FOUND,
                std::format("No receipt for operation {}", operation_id));
        }
        serialized = it->second;
    }
    return receipt_codec::parse(serialized);
}

Result<void> MemoryReceiptStore::invalidate(const std::string& operation_id,
                                            const std::string& /*reason*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    invalidated_.insert(operation_id);
    return Result<void>::ok();
}

size_t MemoryReceiptStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receipts_.size();
}

std::vector<std::string> MemoryReceiptStore::operation_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(receipts_.size());
    for (const auto& [id, serialized] : receipts_) {
        ids.push_back(id);
    }
    return ids;
}

bool MemoryReceiptStore::is_invalidated(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invalidated_.contains(operation_id);
}

} // namespace redactguard
