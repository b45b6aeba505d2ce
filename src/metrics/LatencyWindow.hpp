#ifndef LATENCYWINDOW_HPP
#define LATENCYWINDOW_HPP

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <vector>

// Fixed-size ring of the most recent operation latencies (milliseconds).
class LatencyWindow {
public:
    explicit LatencyWindow(std::size_t capacity) : samples_(std::max<std::size_t>(capacity, 1), 0.0) {}

    void record(double latency_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_[next_] = latency_ms;
        next_ = (next_ + 1) % samples_.size();
        if (count_ < samples_.size()) {
            ++count_;
        }
    }

    struct Summary {
        double avg_ms = 0.0;
        double max_ms = 0.0;
        std::size_t samples = 0;
    };

    Summary summarize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Summary summary;
        summary.samples = count_;
        if (count_ == 0) {
            return summary;
        }
        double total = 0.0;
        for (std::size_t i = 0; i < count_; ++i) {
            total += samples_[i];
            summary.max_ms = std::max(summary.max_ms, samples_[i]);
        }
        summary.avg_ms = total / static_cast<double>(count_);
        return summary;
    }

    std::size_t capacity() const { return samples_.size(); }

private:
    mutable std::mutex mutex_;
    std::vector<double> samples_;
    std::size_t next_ = 0;
    std::size_t count_ = 0;
};

#endif // LATENCYWINDOW_HPP
