#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cstdio>
#include <string>

namespace antig::infra {

namespace {

constexpr int bar_width = 60;
constexpr auto render_period = std::chrono::milliseconds(100);

auto format_elapsed(std::chrono::steady_clock::duration elapsed) -> std::string {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    const auto hours = seconds / 3600;
    const auto minutes = (seconds % 3600) / 60;
    seconds = seconds % 60;
    return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    stop_rendering_thread_();
    if (enabled_) {
        std::lock_guard lock(output_mutex_);
        if (length_.load(std::memory_order_relaxed) > 0) {
            render_locked_();
        }
        if (bar_drawn_) {
            std::fputc('\n', stdout); // финальный перенос
            std::fflush(stdout);
        }
    }
}

void ProgressMonitor::set_length(std::uint64_t length) {
    length_.store(length, std::memory_order_relaxed);
}

void ProgressMonitor::inc(std::uint64_t delta) {
    position_.fetch_add(delta, std::memory_order_relaxed);
}

void ProgressMonitor::println(std::string_view line) {
    std::lock_guard lock(output_mutex_);
    if (enabled_) {
        clear_line_locked_();
    }
    fmt::print("{}\n", line);
    if (enabled_ && bar_drawn_) {
        render_locked_();
    }
    std::fflush(stdout);
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .position = position_.load(std::memory_order_relaxed),
        .length = length_.load(std::memory_order_relaxed),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        std::unique_lock lock(output_mutex_);
        while (!st.stop_requested()) {
            if (length_.load(std::memory_order_relaxed) > 0) {
                render_locked_();
            }
            // Просыпаемся по таймеру или сразу по request_stop()
            wake_.wait_for(lock, st, render_period, [] { return false; });
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // join
    }
}

void ProgressMonitor::clear_line_locked_() const {
    if (bar_drawn_) {
        fmt::print("\r\033[K"); // ANSI: очистить строку
    }
}

void ProgressMonitor::render_locked_() const {
    auto stats = get_stats();
    // Счётчик мог отстать от копирования, позиция не должна выходить за длину
    const auto length = std::max(stats.length, stats.position);

    const double fraction = length > 0 ? static_cast<double>(stats.position) / length : 0.0;
    const int filled = static_cast<int>(fraction * bar_width);
    const int percent = static_cast<int>(fraction * 100.0);

    std::string bar = std::string(filled, '#') + std::string(bar_width - filled, '-');
    fmt::print("\r\033[K{} {:>7}/{:<7} {}% [{}]",
               bar,
               stats.position,
               length,
               percent,
               format_elapsed(std::chrono::steady_clock::now() - stats.start_time));
    std::fflush(stdout);
    bar_drawn_ = true;
}

} // namespace antig::infra
