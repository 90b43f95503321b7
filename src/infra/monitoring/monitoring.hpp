#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace antig::infra {

/// Прогресс-бар: длина (сколько файлов найдено) и позиция (сколько обработано).
/// Все методы потокобезопасны. Отрисовка идёт в отдельном потоке, только если enabled.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t position = 0;
        std::uint64_t length = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_length(std::uint64_t length);
    void inc(std::uint64_t delta = 1);

    /// Печатает строку над прогресс-баром, не разрывая его.
    void println(std::string_view line);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_locked_() const;
    void clear_line_locked_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> position_{0};
    std::atomic<std::uint64_t> length_{0};

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex output_mutex_;
    mutable bool bar_drawn_ = false;
    std::condition_variable_any wake_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace antig::infra
