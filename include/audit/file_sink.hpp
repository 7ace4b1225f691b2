#pragma once

#include "audit/audit_sink.hpp"

#include <fstream>
#include <string>

namespace redactguard {

/**
 * @brief JSONL ledger file, opened in append mode
 *
 * No rotation: the chain spans a single file.
 */
class FileSink : public IAuditSink {
public:
    explicit FileSink(std::string path);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] Result<std::vector<std::string>> load() const override;
    [[nodiscard]] std::string name() const override;

private:
    std::string path_;
    std::ofstream file_stream_;
};

} // namespace redactguard
