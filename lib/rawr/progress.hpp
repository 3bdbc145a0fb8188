#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/color.h>

#include "rawr/common/types.hpp"

namespace rawr::progress {

namespace palette {
constexpr auto kOrange      = fmt::color{0xFF8C42};
constexpr auto kAmber       = fmt::color{0xFFB366};
constexpr auto kDarkOrange  = fmt::color{0xE6722A};
constexpr auto kBrightGreen = fmt::color{0x66BB6A};
constexpr auto kBackground  = fmt::color{0x3A3A3A};
constexpr auto kRed         = fmt::color{0xF92672};
} // namespace palette

struct Style {
    fmt::text_style value;
};

class ProgressBar;

// Base class for all progress bar columns
class Column {
public:
    Column() = default;
    explicit Column(Style style) : m_style(style) {}
    virtual ~Column()                                  = default;
    Column(const Column&)                              = delete;
    Column& operator=(const Column&)                   = delete;
    Column(Column&&)                                   = delete;
    Column& operator=(Column&&)                        = delete;
    virtual std::string render(const ProgressBar& bar) = 0;

protected:
    Style m_style{};
};

class TextColumn : public Column {
public:
    explicit TextColumn(std::string_view text, Style style = {})
        : Column(style),
          m_text(text) {}
    std::string render(const ProgressBar& /*bar*/) override;

private:
    std::string m_text;
};

class SpinnerColumn : public Column {
public:
    explicit SpinnerColumn(Style style = {.value = fmt::fg(palette::kOrange)})
        : Column(style) {}
    std::string render(const ProgressBar& bar) override;

private:
    static constexpr std::array<std::string_view, 10> kFrames = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
};

class BarColumn : public Column {
public:
    explicit BarColumn(
        int width              = 40,
        Style style            = {.value = fmt::fg(palette::kRed)},
        Style background_style = {.value = fmt::fg(palette::kBackground)})
        : Column(style),
          m_width(width),
          m_background_style(background_style) {}

    std::string render(const ProgressBar& bar) override;

private:
    int m_width;
    Style m_background_style;
    static constexpr std::string_view kBarChar = "━";
};

class PercentageColumn : public Column {
public:
    explicit PercentageColumn(Style style = {.value = fmt::fg(palette::kAmber)})
        : Column(style) {}
    std::string render(const ProgressBar& bar) override;
};

class TimeStatsColumn : public Column {
public:
    explicit TimeStatsColumn(
        Style style = {.value = fmt::fg(palette::kDarkOrange)})
        : Column(style) {}
    std::string render(const ProgressBar& bar) override;
};

// Mean fraction of tokens kept by the reductions so far
class KeptColumn : public Column {
public:
    explicit KeptColumn(
        Style style = {.value = fmt::fg(palette::kBrightGreen)})
        : Column(style) {}
    std::string render(const ProgressBar& bar) override;
};

class ProgressBar {
public:
    explicit ProgressBar(std::string_view prefix,
                         SizeType max_progress = 100,
                         int bar_width         = 40,
                         bool transient        = true);

    ~ProgressBar();

    ProgressBar(const ProgressBar&)            = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    ProgressBar(ProgressBar&&)                 = delete;
    ProgressBar& operator=(ProgressBar&&)      = delete;

    ProgressBar& add_column(std::unique_ptr<Column> col);
    ProgressBar& add_kept_column();

    void set_progress(SizeType new_progress);
    void set_kept(double k);
    void tick();
    bool is_completed() const;
    void mark_as_completed();

    SizeType get_progress() const;
    SizeType get_max_progress() const;
    double get_kept() const;

    std::chrono::nanoseconds get_elapsed() const;
    std::string to_string() const;
    void print_progress();

private:
    std::vector<std::unique_ptr<Column>> m_columns;
    SizeType m_max_progress;
    std::atomic<SizeType> m_progress{0};
    std::atomic<bool> m_completed{false};
    std::atomic<double> m_kept{1.0};
    std::chrono::steady_clock::time_point m_start_time;
    std::chrono::nanoseconds m_elapsed{};
    bool m_transient;
    std::mutex m_mutex;

    static constexpr std::string_view kSeparator = " • ";
};

// Hides the console cursor while a bar is drawn and restores it afterwards
class ProgressGuard {
public:
    explicit ProgressGuard(bool show);
    ~ProgressGuard();
    ProgressGuard(const ProgressGuard&)            = delete;
    ProgressGuard& operator=(const ProgressGuard&) = delete;
    ProgressGuard(ProgressGuard&&)                 = delete;
    ProgressGuard& operator=(ProgressGuard&&)      = delete;

private:
    bool m_show;
};

std::unique_ptr<ProgressBar> make_rawr_bar(std::string_view prefix,
                                           SizeType max_progress,
                                           bool transient = true);

} // namespace rawr::progress
