#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <highfive/highfive.hpp>

#include "rawr/common/types.hpp"
#include "rawr/pipelines/rawr_pipeline.hpp"

namespace rawr::cands {

// Bookkeeping of one search round
struct SearchStats {
    SizeType batch{};
    SizeType round{};
    SizeType n_active     = 0;
    SizeType n_beams      = 0;
    SizeType n_candidates = 0;
    SizeType n_preserved  = 0;
    SizeType n_survivors  = 0;
    SizeType n_results    = 0;

    [[nodiscard]] double preserve_frac() const noexcept;
    [[nodiscard]] double survive_frac() const noexcept;
    [[nodiscard]] std::string get_summary() const;
};

struct TimerStatsPacked {
    float expand{};
    float predict{};
    float record{};
};

class TimerStats {
public:
    TimerStats();
    [[nodiscard]] float& operator[](const std::string& key);
    [[nodiscard]] const float& operator[](const std::string& key) const;
    [[nodiscard]] const float& at(const std::string& key) const;
    [[nodiscard]] float& at(const std::string& key);
    [[nodiscard]] std::map<std::string, float>::const_iterator begin() const;
    [[nodiscard]] std::map<std::string, float>::const_iterator end() const;
    [[nodiscard]] float total() const;
    void reset();
    TimerStats& operator+=(const TimerStats& other);

private:
    static constexpr std::array kTimerNames = {"expand", "predict", "record"};

    std::map<std::string, float> m_timers;
};

class SearchStatsCollection {
public:
    SearchStatsCollection() = default;

    void update_stats(const SearchStats& stats, const TimerStats& timers);
    // Append the rounds of another search, tagged with its batch index
    void merge(const SearchStatsCollection& other, SizeType batch);
    void reset();

    [[nodiscard]] const TimerStats& get_timers() const {
        return m_accumulated_timers;
    }
    [[nodiscard]] SizeType get_nrounds() const;
    [[nodiscard]] const std::vector<SearchStats>& get_stats_list() const {
        return m_stats_list;
    }
    [[nodiscard]] std::optional<SearchStats> get_stats(SizeType round) const;
    [[nodiscard]] std::string get_stats_summary() const;
    [[nodiscard]] std::string get_timer_summary() const;
    [[nodiscard]] std::string get_concise_timer_summary() const;
    [[nodiscard]] std::pair<std::vector<SearchStats>,
                            std::vector<TimerStatsPacked>>
    get_packed_data() const;

private:
    std::vector<SearchStats> m_stats_list;
    TimerStats m_accumulated_timers;
};

/**
 * @brief Writes reduction records to an HDF5 checkpoint.
 *
 * Layout mirrors a list (examples) of lists (tied reductions) of records:
 * `/examples/<example>/<result>/` holds the record fields as datasets and
 * scalar attributes. Examples are numbered across batches in write order.
 */
class CheckpointWriter {
public:
    enum class Mode : std::uint8_t { kWrite, kAppend };

    explicit CheckpointWriter(std::filesystem::path filename,
                              Mode mode = Mode::kWrite);
    ~CheckpointWriter()                                  = default;
    CheckpointWriter(const CheckpointWriter&)            = delete;
    CheckpointWriter& operator=(const CheckpointWriter&) = delete;
    CheckpointWriter(CheckpointWriter&&)                 = delete;
    CheckpointWriter& operator=(CheckpointWriter&&)      = delete;

    void write_metadata(SizeType max_beam_size, SizeType batch_size);

    // Append the records of one batch. Returns the number of examples stored.
    SizeType write_batch(const std::vector<pipelines::ExampleEntries>& entries);

    void write_stats(const SearchStatsCollection& stats);

private:
    std::filesystem::path m_filepath;
    Mode m_mode;

    // kWrite truncates on the first open only, later opens append
    [[nodiscard]] HighFive::File open_file();
    static HighFive::Group open_examples_group(HighFive::File& file);
};

} // namespace rawr::cands
