#include "rawr/progress.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <utility>

#include <fmt/color.h>
#include <fmt/format.h>

namespace rawr::progress {

namespace details {
namespace {

void show_console_cursor(bool const show) {
    std::fputs(show ? "\033[?25h" : "\033[?25l", stdout);
}

void erase_line() { std::fputs("\r\033[K", stderr); }

std::string repeat_unicode(const std::string_view s, SizeType n) {
    std::string result;
    result.reserve(s.size() * n);
    for (SizeType i = 0; i < n; ++i) {
        result += s;
    }
    return result;
}

template <typename Rep, typename Period>
std::string format_duration(std::chrono::duration<Rep, Period> dur) {
    auto secs      = std::chrono::floor<std::chrono::seconds>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(dur));
    const auto hms = std::chrono::hh_mm_ss{secs};

    std::string result;
    if (hms.hours().count() > 0) {
        result += fmt::format("{:02d}:", hms.hours().count());
    }
    result += fmt::format("{:02d}:{:02d}s", hms.minutes().count(),
                          hms.seconds().count());
    return result;
}

} // namespace
} // namespace details

std::string TextColumn::render(const ProgressBar& /*bar*/) {
    return fmt::format("{}", fmt::styled(m_text, m_style.value));
}

std::string SpinnerColumn::render(const ProgressBar& bar) {
    if (bar.is_completed()) {
        return fmt::format("{}", fmt::styled("✔", fmt::fg(palette::kBrightGreen) |
                                                     fmt::emphasis::bold));
    }
    constexpr double kIntervalMs = 120.0;
    const auto frame_no =
        (static_cast<double>(bar.get_elapsed().count()) / 1e6) / kIntervalMs;
    return fmt::format(
        "{}",
        fmt::styled(kFrames[static_cast<SizeType>(frame_no) % kFrames.size()],
                    m_style.value));
}

std::string BarColumn::render(const ProgressBar& bar) {
    double fraction = 0.0;
    if (bar.get_max_progress() > 0) {
        fraction = static_cast<double>(bar.get_progress()) /
                   static_cast<double>(bar.get_max_progress());
    }
    fraction = std::clamp(fraction, 0.0, 1.0);

    const int completed_width = static_cast<int>(m_width * fraction);
    const auto part1 = details::repeat_unicode(kBarChar, completed_width);
    const auto part2 =
        details::repeat_unicode(kBarChar, m_width - completed_width);
    return fmt::format("{}{}", fmt::styled(part1, m_style.value),
                       fmt::styled(part2, m_background_style.value));
}

std::string PercentageColumn::render(const ProgressBar& bar) {
    const auto max_progress = bar.get_max_progress();
    if (max_progress == 0) {
        return "";
    }
    const auto percentage =
        static_cast<int>(static_cast<double>(bar.get_progress()) /
                         static_cast<double>(max_progress) * 100.0);
    return fmt::format(
        "{}", fmt::styled(fmt::format("{:02d}%", percentage), m_style.value));
}

std::string TimeStatsColumn::render(const ProgressBar& bar) {
    const auto elapsed      = bar.get_elapsed();
    const auto progress     = bar.get_progress();
    const auto max_progress = bar.get_max_progress();
    std::string eta         = "--:--s";
    if (progress > 0 && max_progress > 0) {
        const auto estimated_total =
            std::chrono::duration_cast<std::chrono::nanoseconds>(
                elapsed * (static_cast<double>(max_progress) /
                           static_cast<double>(progress)));
        eta = details::format_duration(
            std::max(estimated_total - elapsed, std::chrono::nanoseconds{0}));
    }
    const auto rendered =
        fmt::format("[{}<{}]", details::format_duration(elapsed), eta);
    return fmt::format("{}", fmt::styled(rendered, m_style.value));
}

std::string KeptColumn::render(const ProgressBar& bar) {
    return fmt::format(
        "{}", fmt::styled(fmt::format("Kept: {:.1f}%", bar.get_kept() * 100.0),
                          m_style.value));
}

ProgressBar::ProgressBar(std::string_view prefix,
                         SizeType max_progress,
                         int bar_width,
                         bool transient)
    : m_max_progress(max_progress),
      m_start_time(std::chrono::steady_clock::now()),
      m_transient(transient) {
    add_column(std::make_unique<TextColumn>(
        prefix,
        Style{.value = fmt::fg(palette::kOrange) | fmt::emphasis::bold}));
    add_column(std::make_unique<TextColumn>(" "));
    add_column(std::make_unique<SpinnerColumn>());
    add_column(std::make_unique<TextColumn>(" "));
    add_column(std::make_unique<BarColumn>(bar_width));
    add_column(std::make_unique<TextColumn>(" "));
    add_column(std::make_unique<PercentageColumn>());
    add_column(std::make_unique<TextColumn>(kSeparator));
    add_column(std::make_unique<TimeStatsColumn>());
}

ProgressBar::~ProgressBar() { mark_as_completed(); }

ProgressBar& ProgressBar::add_column(std::unique_ptr<Column> col) {
    m_columns.push_back(std::move(col));
    return *this;
}

ProgressBar& ProgressBar::add_kept_column() {
    add_column(std::make_unique<TextColumn>(kSeparator));
    add_column(std::make_unique<KeptColumn>());
    return *this;
}

void ProgressBar::set_progress(SizeType new_progress) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_progress = new_progress;
        if (m_progress >= m_max_progress && m_max_progress > 0) {
            m_elapsed   = std::chrono::steady_clock::now() - m_start_time;
            m_completed = true;
        }
    }
    print_progress();
}

void ProgressBar::set_kept(double k) { m_kept = k; }
void ProgressBar::tick() { set_progress(m_progress + 1); }
bool ProgressBar::is_completed() const { return m_completed.load(); }

void ProgressBar::mark_as_completed() {
    if (!is_completed()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_elapsed   = std::chrono::steady_clock::now() - m_start_time;
            m_completed = true;
        }
        print_progress();
    }
}

SizeType ProgressBar::get_progress() const { return m_progress.load(); }
SizeType ProgressBar::get_max_progress() const { return m_max_progress; }
double ProgressBar::get_kept() const { return m_kept.load(); }

std::chrono::nanoseconds ProgressBar::get_elapsed() const {
    if (is_completed()) {
        return m_elapsed;
    }
    return std::chrono::steady_clock::now() - m_start_time;
}

std::string ProgressBar::to_string() const {
    std::stringstream line_ss;
    for (const auto& column : m_columns) {
        line_ss << column->render(*this);
    }
    return line_ss.str();
}

void ProgressBar::print_progress() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostream& os = std::cerr;
    details::erase_line();
    // Transient bars disappear once completed
    if (!is_completed()) {
        os << to_string();
    } else if (!m_transient) {
        os << to_string() << '\n';
    }
    os.flush();
}

ProgressGuard::ProgressGuard(bool show) : m_show(show) {
    if (m_show) {
        details::show_console_cursor(false);
    }
}

ProgressGuard::~ProgressGuard() {
    if (m_show) {
        details::show_console_cursor(true);
    }
}

std::unique_ptr<ProgressBar> make_rawr_bar(std::string_view prefix,
                                           SizeType max_progress,
                                           bool transient) {
    auto bar = std::make_unique<ProgressBar>(prefix, max_progress,
                                             /*bar_width=*/40, transient);
    bar->add_kept_column();
    return bar;
}

} // namespace rawr::progress
