#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace shipyard {

// ============================================================================
// Progress Reporting
// ============================================================================

/**
 * Receives upload progress.
 *
 * on_advance may be called from several worker threads at once. Each call
 * carries the cumulative byte count at the time its part completed, so
 * concurrent calls can arrive out of order and a later call may report
 * less than an earlier one.
 */
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void on_start(const std::string& label, uint64_t total_bytes) = 0;
    virtual void on_advance(uint64_t completed_bytes, uint64_t total_bytes) = 0;
    virtual void on_finish(bool success) = 0;
};

// Thread-safe byte counter that forwards increments to an optional observer
class ProgressCounter {
public:
    ProgressCounter(ProgressObserver* observer, uint64_t total)
        : observer_(observer), total_(total) {}

    void add(uint64_t bytes) {
        uint64_t now = completed_.fetch_add(bytes) + bytes;
        if (observer_) observer_->on_advance(now, total_);
    }

    uint64_t completed() const { return completed_.load(); }
    uint64_t total() const { return total_; }

private:
    ProgressObserver* observer_;
    uint64_t total_;
    std::atomic<uint64_t> completed_{0};
};

// Single-line progress bar on stderr
class ConsoleProgressBar : public ProgressObserver {
public:
    void on_start(const std::string& label, uint64_t total_bytes) override;
    void on_advance(uint64_t completed_bytes, uint64_t total_bytes) override;
    void on_finish(bool success) override;

private:
    std::mutex mutex_;
    std::string label_;
    int last_percent_ = -1;
};

} // namespace shipyard
