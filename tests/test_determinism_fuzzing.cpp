#include <gtest/gtest.h>
#include <ninja_split/parallel_file_processor.hpp>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "test_helpers.hpp"

using namespace ninja_split;

/**
 * Random inputs and random chunk layouts must give exactly the declarations
 * of a sequential scan over the whole buffer.
 */
class DeterminismFuzzingTest : public ::testing::Test {
protected:
    void SetUp() override {
        jobs = std::make_unique<SplitJobSystem>(4);
        jobs->start();
    }

    void TearDown() override {
        jobs.reset();
    }

    void check_layout(const std::string& text, const std::vector<ChunkRange>& chunks,
                      const SeparatorRule& separator, const std::string& context) {
        DeclarationCollector collector;
        ParallelFileProcessor processor(*jobs);
        processor.process(ByteRegion::from_string(text), chunks, separator, collector.as_sink());

        auto expected = test_utils::reference_split(text, separator);
        EXPECT_EQ(collector.size(), expected.size()) << context;
        EXPECT_EQ(collector.sorted(), expected) << context;
        EXPECT_EQ(collector.reassemble(), text) << context;
    }

    std::unique_ptr<SplitJobSystem> jobs;
};

TEST_F(DeterminismFuzzingTest, RandomNinjaTextRandomLayouts) {
    std::mt19937 gen(12345);
    for (uint32_t round = 0; round < 50; ++round) {
        std::string text = test_utils::random_ninja_text(20 + round, round);
        auto chunks = test_utils::random_chunks(text.size(), 12, gen);
        check_layout(text, chunks, ninja_separator,
                     "round " + std::to_string(round) + ", " + std::to_string(chunks.size()) + " chunks");
    }
}

TEST_F(DeterminismFuzzingTest, RandomBytesFromSmallAlphabet) {
    // Dense separators, escapes and indentation stress every seam case
    const std::string alphabet = "\n\n\n$ \tab";
    std::mt19937 gen(777);
    std::uniform_int_distribution<std::size_t> letter(0, alphabet.size() - 1);
    std::uniform_int_distribution<std::size_t> length(1, 64);

    for (int round = 0; round < 300; ++round) {
        std::string text(length(gen), ' ');
        for (char& c : text) {
            c = alphabet[letter(gen)];
        }
        auto chunks = test_utils::random_chunks(text.size(), 10, gen);
        std::string context = "round " + std::to_string(round);
        check_layout(text, chunks, ninja_separator, context + " (ninja)");
        check_layout(text, chunks, line_break_separator, context + " (line break)");
    }
}

TEST_F(DeterminismFuzzingTest, EverySingleCutOfShortInput) {
    const std::string text = "build a: cc b $\n  c\n  flags = x\n\nrule cc\n  command = cc\n";
    for (std::size_t cut = 1; cut < text.size(); ++cut) {
        check_layout(text, test_utils::chunks_at(text.size(), {cut}), ninja_separator,
                     "cut at " + std::to_string(cut));
    }
}

TEST_F(DeterminismFuzzingTest, OneByteChunks) {
    const std::string text = test_utils::random_ninja_text(15, 99);
    std::vector<std::size_t> cuts;
    for (std::size_t i = 1; i < text.size(); ++i) {
        cuts.push_back(i);
    }
    check_layout(text, test_utils::chunks_at(text.size(), cuts), ninja_separator, "one-byte chunks");
}

TEST_F(DeterminismFuzzingTest, ChunkCountDoesNotChangeResult) {
    const std::string text = test_utils::random_ninja_text(500, 2024);
    ByteRegion buffer = ByteRegion::from_string(text);

    DeclarationCollector baseline;
    SplitOptions sequential;
    sequential.parallelism = 1;
    ParallelFileProcessor(*jobs, sequential).process(buffer, ninja_separator, baseline.as_sink());
    auto expected = baseline.sorted();
    ASSERT_EQ(expected, test_utils::reference_split(text, ninja_separator));

    for (std::size_t parallelism : {2u, 3u, 7u, 32u, 100u}) {
        for (auto mode : {job_system::ScheduleMode::FIFO, job_system::ScheduleMode::LIFO}) {
            SplitOptions options;
            options.parallelism = parallelism;
            options.min_chunk_size = 16;
            options.schedule_mode = mode;

            DeclarationCollector collector;
            ParallelFileProcessor(*jobs, options).process(buffer, ninja_separator, collector.as_sink());
            EXPECT_EQ(collector.sorted(), expected) << "parallelism " << parallelism;
        }
    }
}

TEST_F(DeterminismFuzzingTest, LargeInputWithDefaultChunkSize) {
    const std::string text = test_utils::random_ninja_text(20000, 1);
    ByteRegion buffer = ByteRegion::from_string(text);
    auto expected = test_utils::reference_split(text, ninja_separator);

    for (std::size_t parallelism : {1u, 2u, 4u}) {
        SplitOptions options;
        options.parallelism = parallelism;
        DeclarationCollector collector;
        test_utils::PerfTimer timer;
        ParallelFileProcessor processor(*jobs, options);
        processor.process(buffer, ninja_separator, collector.as_sink());

        std::cout << "parallelism " << parallelism << ": " << collector.size()
                  << " declarations in " << timer.elapsed_ms() << " ms" << std::endl;

        EXPECT_EQ(processor.last_statistics().chunks, parallelism);
        EXPECT_EQ(collector.sorted(), expected) << "parallelism " << parallelism;
        EXPECT_EQ(collector.reassemble(), text) << "parallelism " << parallelism;
    }
}
