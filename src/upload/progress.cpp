#include "shipyard/progress.hpp"

#include <cstdio>

namespace shipyard {

namespace {

constexpr int kBarWidth = 40;

} // namespace

void ConsoleProgressBar::on_start(const std::string& label, uint64_t /*total_bytes*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    label_ = label;
    last_percent_ = -1;
}

void ConsoleProgressBar::on_advance(uint64_t completed_bytes, uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    int percent = total_bytes == 0
        ? 100
        : static_cast<int>((completed_bytes * 100) / total_bytes);
    if (percent > 100) percent = 100;
    // Concurrent workers can report out of order
    if (percent <= last_percent_) return;
    last_percent_ = percent;

    int filled = percent * kBarWidth / 100;
    std::string bar(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(kBarWidth - filled), '-');
    std::fprintf(stderr, "\r%s [%s] %3d%% (%llu/%llu bytes)", label_.c_str(), bar.c_str(),
                 percent, static_cast<unsigned long long>(completed_bytes),
                 static_cast<unsigned long long>(total_bytes));
    std::fflush(stderr);
}

void ConsoleProgressBar::on_finish(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_percent_ >= 0) {
        std::fprintf(stderr, success ? "\n" : " failed\n");
        std::fflush(stderr);
    }
}

} // namespace shipyard
