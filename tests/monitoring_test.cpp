#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

using cupload::infra::ProgressMonitor;

TEST(ProgressMonitorTest, KeepsLargestByteCount)
{
    ProgressMonitor monitor(false);
    EXPECT_FALSE(monitor.is_enabled());

    monitor.set_total(100, 20);
    monitor.update(50, 10.0, 5.0);
    monitor.update(30, 11.0, 6.0); // поздний отчёт другого потока

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.total_bytes, 100u);
    EXPECT_EQ(stats.base_bytes, 20u);
    EXPECT_EQ(stats.uploaded_bytes, 50u);
    EXPECT_DOUBLE_EQ(stats.instant_rate, 11.0);
    EXPECT_DOUBLE_EQ(stats.overall_rate, 6.0);
}

TEST(ProgressMonitorTest, RenderLineShowsPercentAndRates)
{
    ProgressMonitor::Stats stats{
        .total_bytes = 1000,
        .base_bytes = 250,
        .uploaded_bytes = 250,
        .instant_rate = 3.0 * 1024 * 1024,
        .overall_rate = 512.0,
    };
    const auto line = ProgressMonitor::render_line(stats);
    EXPECT_NE(line.find(" 50.0%"), std::string::npos) << line;
    EXPECT_NE(line.find("3.0 MB/s"), std::string::npos) << line;
    EXPECT_NE(line.find("avg 512.0 B/s"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, EmptyTotalIsComplete)
{
    const auto line = ProgressMonitor::render_line(ProgressMonitor::Stats{});
    EXPECT_NE(line.find("100.0%"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, QuietDisablesRendering)
{
    ProgressMonitor monitor(true, true);
    EXPECT_FALSE(monitor.is_enabled());
}

TEST(FormatRateTest, Units)
{
    EXPECT_EQ(cupload::infra::format_rate(100), "100.0 B/s");
    EXPECT_EQ(cupload::infra::format_rate(2048), "2.0 KB/s");
    EXPECT_EQ(cupload::infra::format_rate(5.5 * 1024 * 1024 * 1024), "5.5 GB/s");
}
