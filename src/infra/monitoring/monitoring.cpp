#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <algorithm>
#include <thread>

namespace cupload::infra {

auto format_rate(double bytes_per_sec) -> std::string {
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }
    return fmt::format("{:.1f} {}", speed, unit);
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
        render_thread_.reset();
    }
    if (enabled_) {
        render_();
        std::cout << "\n"; // финальный перенос
    }
}

void ProgressMonitor::set_total(std::uint64_t total_bytes, std::uint64_t base_bytes) {
    total_bytes_ = total_bytes;
    base_bytes_ = base_bytes;
}

void ProgressMonitor::update(std::uint64_t bytes_uploaded, double instant_rate, double overall_rate) {
    // Обновления приходят не по порядку: счётчик только растёт
    auto current = uploaded_bytes_.load();
    while (current < bytes_uploaded && !uploaded_bytes_.compare_exchange_weak(current, bytes_uploaded)) {}
    instant_rate_ = instant_rate;
    overall_rate_ = overall_rate;
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_bytes = total_bytes_.load(),
        .base_bytes = base_bytes_.load(),
        .uploaded_bytes = uploaded_bytes_.load(),
        .instant_rate = instant_rate_.load(),
        .overall_rate = overall_rate_.load(),
    };
}

auto ProgressMonitor::render_line(const Stats& stats) -> std::string {
    const auto done = std::min(stats.base_bytes + stats.uploaded_bytes, stats.total_bytes);
    const double progress = stats.total_bytes > 0
        ? static_cast<double>(done) / static_cast<double>(stats.total_bytes)
        : 1.0;

    const int bar_width = 20;
    const int filled = static_cast<int>(progress * bar_width);
    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    return fmt::format("[{}] {:5.1f}% | {} | avg {}",
                       bar, progress * 100.0,
                       format_rate(stats.instant_rate),
                       format_rate(stats.overall_rate));
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !shutdown_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    shutdown_.store(true);
    if (render_thread_) {
        render_thread_->request_stop();
    }
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    std::cout << "\r\033[K"; // ANSI: очистить строку
    std::cout << render_line(get_stats()) << std::flush;
}

} // namespace cupload::infra
