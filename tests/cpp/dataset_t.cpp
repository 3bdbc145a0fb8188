#include <filesystem>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "rawr/data/dataset.hpp"
#include "rawr/exceptions.hpp"

using rawr::LabelType;
using rawr::Sequence;
using rawr::SizeType;
using rawr::TokenId;
using rawr::data::BatchIterator;
using rawr::data::SequenceDataset;

TEST_CASE("SequenceDataset layout", "[dataset]") {
    SequenceDataset dataset({5, 6, 0, 7, 0, 0}, {0, 3, 5, 6}, {1, 0, 1});
    REQUIRE(dataset.size() == 3);
    REQUIRE(dataset.get_ntokens() == 6);
    REQUIRE(dataset.get_sequence(0) == Sequence{5, 6, 0});
    REQUIRE(dataset.get_sequence(1) == Sequence{7, 0});
    REQUIRE(dataset.get_sequence(2) == Sequence{0});
    REQUIRE(dataset.get_label(1) == 0);
    REQUIRE_THROWS_AS(dataset.get_sequence(3),
                      rawr::error_check::DetailedException);

    const auto batch = dataset.get_batch(1, 5);
    REQUIRE(batch.size() == 2);
    REQUIRE(batch.ys == std::vector<LabelType>{0, 1});
}

TEST_CASE("SequenceDataset validation", "[dataset]") {
    using Tokens  = std::vector<TokenId>;
    using Offsets = std::vector<SizeType>;
    using Labels  = std::vector<LabelType>;
    SECTION("Offsets count") {
        REQUIRE_THROWS_AS(SequenceDataset(Tokens{1, 0}, Offsets{0, 2},
                                          Labels{1, 0}),
                          rawr::error_check::DetailedException);
    }
    SECTION("Offsets start") {
        REQUIRE_THROWS_AS(SequenceDataset(Tokens{1, 0}, Offsets{1, 2},
                                          Labels{1}),
                          rawr::error_check::DetailedException);
    }
    SECTION("Offsets end") {
        REQUIRE_THROWS_AS(SequenceDataset(Tokens{1, 0, 0}, Offsets{0, 2},
                                          Labels{1}),
                          rawr::error_check::DetailedException);
    }
    SECTION("Empty sequence") {
        REQUIRE_THROWS_AS(SequenceDataset(Tokens{1, 0}, Offsets{0, 2, 2},
                                          Labels{1, 0}),
                          rawr::error_check::DetailedException);
    }
    SECTION("Decreasing offsets") {
        REQUIRE_THROWS_AS(SequenceDataset(Tokens{1, 0, 2}, Offsets{0, 2, 1, 3},
                                          Labels{1, 0, 1}),
                          rawr::error_check::DetailedException);
    }
    SECTION("Mismatched labels") {
        const std::vector<Sequence> xs = {{1, 0}};
        const std::vector<LabelType> ys = {1, 0};
        REQUIRE_THROWS_AS(SequenceDataset::from_sequences(xs, ys),
                          rawr::error_check::DetailedException);
    }
}

TEST_CASE("BatchIterator", "[dataset]") {
    const std::vector<Sequence> xs = {{1, 0}, {2, 0}, {3, 0}, {4, 0}, {5, 0}};
    const std::vector<LabelType> ys = {0, 1, 0, 1, 0};
    const auto dataset = SequenceDataset::from_sequences(xs, ys);
    BatchIterator it(dataset, 2);
    REQUIRE(it.get_nbatches() == 3);

    std::vector<SizeType> sizes;
    std::vector<Sequence> seen;
    while (it.has_next()) {
        const auto batch = it.next();
        sizes.push_back(batch.size());
        seen.insert(seen.end(), batch.xs.begin(), batch.xs.end());
    }
    REQUIRE(sizes == std::vector<SizeType>{2, 2, 1});
    REQUIRE(seen == xs);
    REQUIRE_THROWS_AS(it.next(), std::out_of_range);

    it.reset();
    REQUIRE(it.get_batch_idx() == 0);
    REQUIRE(it.next().xs.front() == xs.front());
    REQUIRE_THROWS_AS(BatchIterator(dataset, 0),
                      rawr::error_check::DetailedException);
}

TEST_CASE("SequenceDataset file round trip", "[dataset]") {
    const auto path =
        std::filesystem::temp_directory_path() / "rawr_dataset_t.h5";
    const std::vector<Sequence> xs = {{9, 8, 0}, {7, 0}};
    const std::vector<LabelType> ys = {2, 1};
    SequenceDataset::from_sequences(xs, ys).save(path);

    const auto loaded = SequenceDataset::from_file(path);
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded.get_sequence(0) == xs[0]);
    REQUIRE(loaded.get_label(1) == 1);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(SequenceDataset::from_file(path), std::runtime_error);
}
