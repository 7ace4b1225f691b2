#include "fusion/recognition_model.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace redactguard {

BoundedRecognitionModel::BoundedRecognitionModel(
    std::shared_ptr<IRecognitionModel> model, std::chrono::milliseconds timeout,
    size_t max_in_flight)
    : model_(model ? model : std::make_shared<NullRecognitionModel>()),
      timeout_(timeout),
      max_in_flight_(max_in_flight > 0 ? max_in_flight : 1),
      in_flight_(std::make_shared<std::atomic<size_t>>(0)),
      inline_(!model) {}

std::string BoundedRecognitionModel::name() const {
    return model_->name();
}

std::string BoundedRecognitionModel::normalize_label(std::string_view raw) {
    std::string label = utils::to_upper(utils::trim(raw));
    if (label.size() > 2 && (label.starts_with("B-") || label.starts_with("I-"))) {
        label = label.substr(2);
    }

    static const std::unordered_map<std::string, std::string> kLabelMap = {
        {"PERSON",       "NAME"},
        {"PER",          "NAME"},
        {"ORG",          "ORG_NAME"},
        {"ORGANIZATION", "ORG_NAME"},
        {"LOC",          "ADDRESS"},
        {"LOCATION",     "ADDRESS"},
        {"GPE",          "ADDRESS"},
    };
    const auto it = kLabelMap.find(label);
    return it != kLabelMap.end() ? it->second : label;
}

RecognitionResult BoundedRecognitionModel::recognize(std::string_view content) const {
    RecognitionResult result;
    if (inline_) {
        return result;
    }

    if (in_flight_->fetch_add(1, std::memory_order_acq_rel) >= max_in_flight_) {
        in_flight_->fetch_sub(1, std::memory_order_acq_rel);
        result.degraded = true;
        result.reason = std::format("model '{}' has {} calls in flight", model_->name(), max_in_flight_);
        utils::log::warn(std::format("Recognition degraded: {}", result.reason));
        return result;
    }

    // The worker owns copies of everything it touches so it can outlive this call
    auto promise = std::make_shared<std::promise<std::vector<ExternalCandidate>>>();
    auto future = promise->get_future();
    auto model = model_;
    auto in_flight = in_flight_;
    std::string text(content);

    try {
        std::thread([promise, model, in_flight, text = std::move(text)]() mutable {
            try {
                promise->set_value(model->predict(text));
            } catch (const std::exception&) {
                promise->set_exception(std::current_exception());
            } catch (...) {
                promise->set_exception(std::make_exception_ptr(
                    std::runtime_error("non-standard exception")));
            }
            in_flight->fetch_sub(1, std::memory_order_acq_rel);
        }).detach();
    } catch (const std::system_error& e) {
        in_flight_->fetch_sub(1, std::memory_order_acq_rel);
        result.degraded = true;
        result.reason = std::format("model '{}' could not start: {}", model_->name(), e.what());
        utils::log::warn(std::format("Recognition degraded: {}", result.reason));
        return result;
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        result.degraded = true;
        result.reason = std::format("model '{}' exceeded {}ms", model_->name(), timeout_.count());
        utils::log::warn(std::format("Recognition degraded: {}", result.reason));
        return result;
    }

    try {
        result.candidates = future.get();
    } catch (const std::exception& e) {
        result.degraded = true;
        result.reason = std::format("model '{}' failed: {}", model_->name(), e.what());
        utils::log::warn(std::format("Recognition degraded: {}", result.reason));
        return result;
    }

    for (auto& c : result.candidates) {
        c.label = normalize_label(c.label);
    }
    return result;
}

} // namespace redactguard
