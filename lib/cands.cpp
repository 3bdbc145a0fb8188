#include "rawr/cands.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>

#include <highfive/highfive.hpp>

#include "rawr/common/types.hpp"

namespace rawr::cands {

namespace {

inline constexpr std::string_view kCheckpointVersion = "1.0.0-cpp";

// Round-half-to-even (bankers' rounding)
double round_dp(double x, int digits) noexcept {
    if (!std::isfinite(x)) {
        return x;
    }
    const double scale = std::pow(10.0, digits);
    return std::nearbyint(x * scale) / scale;
}

double safe_frac(SizeType num, SizeType den) noexcept {
    if (den == 0) {
        return 0.0;
    }
    return round_dp(static_cast<double>(num) / static_cast<double>(den), 2);
}

HighFive::CompoundType create_compound_search_stats() {
    return {{"batch", HighFive::create_datatype<SizeType>()},
            {"round", HighFive::create_datatype<SizeType>()},
            {"n_active", HighFive::create_datatype<SizeType>()},
            {"n_beams", HighFive::create_datatype<SizeType>()},
            {"n_candidates", HighFive::create_datatype<SizeType>()},
            {"n_preserved", HighFive::create_datatype<SizeType>()},
            {"n_survivors", HighFive::create_datatype<SizeType>()},
            {"n_results", HighFive::create_datatype<SizeType>()}};
}

HighFive::CompoundType create_compound_timer_stats() {
    return {{"expand", HighFive::create_datatype<float>()},
            {"predict", HighFive::create_datatype<float>()},
            {"record", HighFive::create_datatype<float>()}};
}

} // namespace
} // namespace rawr::cands

HIGHFIVE_REGISTER_TYPE(rawr::cands::SearchStats,
                       rawr::cands::create_compound_search_stats)
HIGHFIVE_REGISTER_TYPE(rawr::cands::TimerStatsPacked,
                       rawr::cands::create_compound_timer_stats)

namespace rawr::cands {

// --- SearchStats ---
double SearchStats::preserve_frac() const noexcept {
    return safe_frac(n_preserved, n_candidates);
}
double SearchStats::survive_frac() const noexcept {
    return safe_frac(n_survivors, n_candidates);
}
std::string SearchStats::get_summary() const {
    return std::format("Batch: {:4d}, round: {:3d}, active: {:4d}, beams: "
                       "{:5d}, candidates: {:5d}, P(keep): {:4.2f}, "
                       "P(surv): {:4.2f}, results: {:5d}\n",
                       batch, round, n_active, n_beams, n_candidates,
                       preserve_frac(), survive_frac(), n_results);
}

// --- TimerStats ---
TimerStats::TimerStats() {
    for (const auto& name : kTimerNames) {
        m_timers[name] = 0.0F;
    }
}
float& TimerStats::operator[](const std::string& key) { return m_timers[key]; }
const float& TimerStats::operator[](const std::string& key) const {
    return m_timers.at(key);
}
float& TimerStats::at(const std::string& key) { return m_timers.at(key); }
const float& TimerStats::at(const std::string& key) const {
    return m_timers.at(key);
}
std::map<std::string, float>::const_iterator TimerStats::begin() const {
    return m_timers.begin();
}
std::map<std::string, float>::const_iterator TimerStats::end() const {
    return m_timers.end();
}
float TimerStats::total() const {
    return std::accumulate(
        m_timers.begin(), m_timers.end(), 0.0F,
        [](float sum, const auto& pair) { return sum + pair.second; });
}
void TimerStats::reset() {
    for (auto& [name, time] : m_timers) {
        time = 0.0F;
    }
}
TimerStats& TimerStats::operator+=(const TimerStats& other) {
    for (const auto& [name, time] : other.m_timers) {
        m_timers[name] += time;
    }
    return *this;
}

// --- SearchStatsCollection ---
SizeType SearchStatsCollection::get_nrounds() const {
    return m_stats_list.size();
}
void SearchStatsCollection::update_stats(const SearchStats& stats,
                                         const TimerStats& timers) {
    m_stats_list.push_back(stats);
    m_accumulated_timers += timers;
}
void SearchStatsCollection::merge(const SearchStatsCollection& other,
                                  SizeType batch) {
    for (auto stats : other.m_stats_list) {
        stats.batch = batch;
        m_stats_list.push_back(stats);
    }
    m_accumulated_timers += other.m_accumulated_timers;
}
void SearchStatsCollection::reset() {
    m_stats_list.clear();
    m_accumulated_timers.reset();
}
std::optional<SearchStats>
SearchStatsCollection::get_stats(SizeType round) const {
    auto it = std::ranges::find_if(
        m_stats_list, [round](const auto& s) { return s.round == round; });
    return it != m_stats_list.end() ? std::optional{*it} : std::nullopt;
}
std::string SearchStatsCollection::get_stats_summary() const {
    if (m_stats_list.empty()) {
        return "No stats available.";
    }
    const auto max_beams = std::ranges::max(m_stats_list, {},
                                            &SearchStats::n_beams)
                               .n_beams;
    const auto& last_stats = m_stats_list.back();
    return std::format("Rounds: {}, max beams: {}, results: {}",
                       m_stats_list.size(), max_beams, last_stats.n_results);
}
std::string SearchStatsCollection::get_timer_summary() const {
    const float total_time = m_accumulated_timers.total();
    if (total_time == 0.0F) {
        return "Timing breakdown: 0.00s\n";
    }
    std::string summary =
        std::format("Timing breakdown: {:.2f}s\n", total_time);
    std::vector<std::pair<std::string, float>> sorted_timers(
        m_accumulated_timers.begin(), m_accumulated_timers.end());
    std::ranges::sort(sorted_timers, [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    for (const auto& [name, time] : sorted_timers) {
        const auto percent = (time / total_time) * 100.0F;
        summary += std::format("  {:10s}: {:6.1f}%\n", name, percent);
    }
    return summary;
}
std::string SearchStatsCollection::get_concise_timer_summary() const {
    const float total_time = m_accumulated_timers.total();
    if (total_time == 0.0F) {
        return "Total: 0.0s";
    }
    std::string breakdown;
    for (const auto& [name, time] : m_accumulated_timers) {
        if (time > 0) {
            if (!breakdown.empty()) {
                breakdown += " | ";
            }
            breakdown +=
                std::format("{}: {:.0f}%", name, (time / total_time) * 100.0F);
        }
    }
    return std::format("Total: {:.1f}s ({})", total_time, breakdown);
}
std::pair<std::vector<SearchStats>, std::vector<TimerStatsPacked>>
SearchStatsCollection::get_packed_data() const {
    std::vector<TimerStatsPacked> packed_timers;
    if (m_accumulated_timers.total() > 0.0F) {
        packed_timers.push_back({.expand  = m_accumulated_timers.at("expand"),
                                 .predict = m_accumulated_timers.at("predict"),
                                 .record  = m_accumulated_timers.at("record")});
    }
    return {m_stats_list, packed_timers};
}

// --- CheckpointWriter ---
CheckpointWriter::CheckpointWriter(std::filesystem::path filename, Mode mode)
    : m_filepath(std::move(filename)),
      m_mode(mode) {}

void CheckpointWriter::write_metadata(SizeType max_beam_size,
                                      SizeType batch_size) {
    HighFive::File file = open_file();
    if (file.hasAttribute("rawr_version")) {
        throw std::runtime_error("Metadata already exists in file. Use "
                                 "append mode or new file.");
    }
    file.createAttribute("rawr_version", std::string(kCheckpointVersion));
    file.createAttribute("max_beam_size", max_beam_size);
    file.createAttribute("batch_size", batch_size);
    file.createAttribute("n_examples", SizeType{0});
}

SizeType CheckpointWriter::write_batch(
    const std::vector<pipelines::ExampleEntries>& entries) {
    HighFive::File file            = open_file();
    HighFive::Group examples_group = open_examples_group(file);
    SizeType n_examples            = examples_group.getNumberObjects();

    for (const auto& example_entries : entries) {
        const auto example_name = std::format("{:06d}", n_examples);
        if (examples_group.exist(example_name)) {
            throw std::runtime_error(
                std::format("Example {} already exists.", example_name));
        }
        HighFive::Group example_group =
            examples_group.createGroup(example_name);
        example_group.createAttribute("n_results", example_entries.size());
        for (SizeType ir = 0; ir < example_entries.size(); ++ir) {
            const auto& entry = example_entries[ir];
            HighFive::Group entry_group =
                example_group.createGroup(std::format("{:03d}", ir));
            entry_group.createDataSet("original_input", entry.original_input);
            entry_group.createDataSet("reduced_input", entry.reduced_input);
            entry_group.createDataSet("original_scores",
                                      entry.original_scores);
            entry_group.createDataSet("reduced_scores", entry.reduced_scores);
            entry_group.createDataSet("removed_indices",
                                      entry.removed_indices);
            entry_group.createAttribute("original_prediction",
                                        entry.original_prediction);
            entry_group.createAttribute("reduced_prediction",
                                        entry.reduced_prediction);
            entry_group.createAttribute("label", entry.label);
        }
        ++n_examples;
    }
    if (file.hasAttribute("n_examples")) {
        file.getAttribute("n_examples").write(n_examples);
    } else {
        file.createAttribute("n_examples", n_examples);
    }
    return n_examples;
}

void CheckpointWriter::write_stats(const SearchStatsCollection& stats) {
    HighFive::File file = open_file();
    for (const auto* name : {"search_stats", "timer_stats"}) {
        if (file.exist(name)) {
            file.unlink(name);
        }
    }
    auto [search_stats, timer_stats] = stats.get_packed_data();
    if (!search_stats.empty()) {
        file.createDataSet("search_stats", search_stats);
    }
    if (!timer_stats.empty()) {
        file.createDataSet("timer_stats", timer_stats);
    }
}

HighFive::File CheckpointWriter::open_file() {
    HighFive::File::AccessMode open_mode;
    if (m_mode == Mode::kWrite) {
        open_mode = HighFive::File::Overwrite;
        m_mode    = Mode::kAppend;
    } else if (std::filesystem::exists(m_filepath)) {
        open_mode = HighFive::File::ReadWrite;
    } else {
        open_mode = HighFive::File::Create;
    }

    HighFive::File file(m_filepath.string(), open_mode);
    if (!file.isValid()) {
        throw std::runtime_error("Failed to create valid HDF5 file");
    }
    return file;
}

HighFive::Group CheckpointWriter::open_examples_group(HighFive::File& file) {
    return file.exist("examples") ? file.getGroup("examples")
                                  : file.createGroup("examples");
}

} // namespace rawr::cands
