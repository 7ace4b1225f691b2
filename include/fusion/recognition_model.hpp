#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

/// One (label, span, score) proposal from an external recognition model
struct ExternalCandidate {
    std::string label;
    Span span;
    double score = 0.0;
};

/**
 * @brief Pluggable recognition model (NER or similar)
 *
 * predict() may be slow and may throw. Callers never talk to a model
 * directly; they go through BoundedRecognitionModel.
 */
class IRecognitionModel {
public:
    virtual ~IRecognitionModel() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::vector<ExternalCandidate> predict(std::string_view content) = 0;
};

/// Used when the external model is disabled. Always returns nothing.
class NullRecognitionModel : public IRecognitionModel {
public:
    [[nodiscard]] std::string name() const override { return "none"; }
    [[nodiscard]] std::vector<ExternalCandidate> predict(std::string_view) override { return {}; }
};

struct RecognitionResult {
    std::vector<ExternalCandidate> candidates;
    bool degraded = false;          // Model timed out or failed
    std::string reason;
};

/**
 * @brief Timeout and failure boundary around an IRecognitionModel
 *
 * Each call runs the model on its own thread and waits at most `timeout`.
 * A late call is abandoned (its result discarded when it finishes); an
 * exception from the model is caught at this boundary. Both cases return
 * an empty, degraded result. Labels are normalised on the way out.
 * Constructed with a null model it behaves as NullRecognitionModel.
 *
 * At most `max_in_flight` model threads exist at once, abandoned ones
 * included. A call arriving while the cap is reached spawns nothing and
 * returns a degraded result, so a hung model cannot grow the thread count.
 */
class BoundedRecognitionModel {
public:
    static constexpr size_t kDefaultMaxInFlight = 4;

    BoundedRecognitionModel(std::shared_ptr<IRecognitionModel> model,
                            std::chrono::milliseconds timeout,
                            size_t max_in_flight = kDefaultMaxInFlight);

    [[nodiscard]] RecognitionResult recognize(std::string_view content) const;

    [[nodiscard]] std::string name() const;
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }
    [[nodiscard]] size_t max_in_flight() const { return max_in_flight_; }

    /// Model threads still running, abandoned ones included
    [[nodiscard]] size_t in_flight() const { return in_flight_->load(std::memory_order_acquire); }

    /**
     * @brief Map model vocabularies onto detector labels
     * PERSON/PER -> NAME, ORG/ORGANIZATION -> ORG_NAME,
     * LOC/LOCATION/GPE -> ADDRESS. BIO prefixes ("B-", "I-") are stripped.
     */
    [[nodiscard]] static std::string normalize_label(std::string_view raw);

private:
    std::shared_ptr<IRecognitionModel> model_;
    std::chrono::milliseconds timeout_;
    size_t max_in_flight_;
    // Shared with detached workers, which may outlive this object
    std::shared_ptr<std::atomic<size_t>> in_flight_;
    bool inline_;       // No model configured: skip the worker thread
};

} // namespace redactguard
