#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <thread>
#include "../../core/upload_session/upload_session.hpp"

namespace cupload::infra {

// "12.3 MB/s"
[[nodiscard]] auto format_rate(double bytes_per_sec) -> std::string;

class ProgressMonitor final : public core::ProgressHandler {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t base_bytes = 0;      // уже было загружено до resume
        std::uint64_t uploaded_bytes = 0;  // за этот запуск
        double instant_rate = 0.0;
        double overall_rate = 0.0;
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor() override;

    void set_total(std::uint64_t total_bytes, std::uint64_t base_bytes = 0);

    // Вызывается из рабочих потоков загрузки: только атомики
    void update(std::uint64_t bytes_uploaded, double instant_rate, double overall_rate) override;

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // Строка прогресса без управляющих символов
    [[nodiscard]] static auto render_line(const Stats& stats) -> std::string;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> uploaded_bytes_{0};
    std::atomic<double> instant_rate_{0.0};
    std::atomic<double> overall_rate_{0.0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> base_bytes_{0};

    const bool enabled_;
    const bool quiet_;
    mutable std::atomic<bool> shutdown_{false};
    mutable std::unique_ptr<std::jthread> render_thread_;
};

} // namespace cupload::infra
