#pragma once

#include "fusion/recognition_model.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace redactguard::testing {

/// Returns a fixed candidate list for every call
class ScriptedRecognitionModel : public IRecognitionModel {
public:
    explicit ScriptedRecognitionModel(std::vector<ExternalCandidate> script)
        : script_(std::move(script)) {}

    std::string name() const override { return "scripted"; }
    std::vector<ExternalCandidate> predict(std::string_view) override {
        ++calls_;
        return script_;
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::vector<ExternalCandidate> script_;
    std::atomic<int> calls_{0};
};

class ThrowingRecognitionModel : public IRecognitionModel {
public:
    std::string name() const override { return "throwing"; }
    std::vector<ExternalCandidate> predict(std::string_view) override {
        throw std::runtime_error("model backend unreachable");
    }
};

/// Sleeps past any reasonable timeout before answering
class SlowRecognitionModel : public IRecognitionModel {
public:
    explicit SlowRecognitionModel(std::chrono::milliseconds delay) : delay_(delay) {}

    std::string name() const override { return "slow"; }
    std::vector<ExternalCandidate> predict(std::string_view) override {
        std::this_thread::sleep_for(delay_);
        return {ExternalCandidate{"PERSON", Span{0, 1}, 0.99}};
    }

private:
    std::chrono::milliseconds delay_;
};

/// Never answers until release() is called
class HangingRecognitionModel : public IRecognitionModel {
public:
    std::string name() const override { return "hanging"; }
    std::vector<ExternalCandidate> predict(std::string_view) override {
        ++calls_;
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return released_; });
        return {};
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    std::atomic<int> calls_{0};
};

} // namespace redactguard::testing
