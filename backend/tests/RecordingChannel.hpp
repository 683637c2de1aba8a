#pragma once
#include "OutboundChannel.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// In-memory OutboundChannel that records every frame.
class RecordingChannel : public tickflow::OutboundChannel {
public:
    bool deliver(const std::string& payload) override {
        std::lock_guard<std::mutex> lk(m_);
        if (!open_) return false;
        frames_.push_back(nlohmann::json::parse(payload));
        cv_.notify_all();
        return true;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lk(m_);
        return open_;
    }

    void close() override {
        std::lock_guard<std::mutex> lk(m_);
        open_ = false;
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lk(m_);
        return frames_;
    }

    std::vector<nlohmann::json> of_type(const std::string& type) const {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<nlohmann::json> out;
        for (const auto& f : frames_) {
            if (f.value("type", std::string{}) == type) out.push_back(f);
        }
        return out;
    }

    size_t count(const std::string& type) const { return of_type(type).size(); }

    size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return frames_.size();
    }

    // Blocks until at least `n` frames of `type` were recorded
    bool wait_for(const std::string& type, size_t n,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) const {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&]() {
            size_t c = 0;
            for (const auto& f : frames_) {
                if (f.value("type", std::string{}) == type) ++c;
            }
            return c >= n;
        });
    }

private:
    mutable std::mutex m_;
    mutable std::condition_variable cv_;
    std::vector<nlohmann::json> frames_;
    bool open_ = true;
};
