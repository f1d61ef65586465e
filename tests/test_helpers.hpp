#pragma once
#include <gtest/gtest.h>
#include <ninja_split/byte_region.hpp>
#include <ninja_split/declaration_sink.hpp>
#include <ninja_split/parallel_file_processor.hpp>
#include <ninja_split/separator_rule.hpp>
#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#include <vector>

namespace test_utils {

/**
 * Performance measurement utility
 */
class PerfTimer {
    std::chrono::high_resolution_clock::time_point start_;
public:
    PerfTimer() : start_(std::chrono::high_resolution_clock::now()) {}

    double elapsed_ms() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    void reset() {
        start_ = std::chrono::high_resolution_clock::now();
    }
};

/**
 * Sequential reference: every window of the whole text, no chunking at all.
 */
inline std::vector<ninja_split::Declaration> reference_split(
    const std::string& text, const ninja_split::SeparatorRule& separator) {
    std::vector<ninja_split::Declaration> result;
    std::size_t start = 0;
    for (std::size_t i = 0; i + 2 < text.size(); ++i) {
        if (separator(static_cast<uint8_t>(text[i]), static_cast<uint8_t>(text[i + 1]),
                      static_cast<uint8_t>(text[i + 2]))) {
            result.push_back({start, text.substr(start, i + 2 - start)});
            start = i + 2;
        }
    }
    if (start < text.size()) {
        result.push_back({start, text.substr(start)});
    }
    return result;
}

inline std::vector<std::string> texts(const std::vector<ninja_split::Declaration>& declarations) {
    std::vector<std::string> result;
    result.reserve(declarations.size());
    for (const auto& declaration : declarations) {
        result.push_back(declaration.text);
    }
    return result;
}

// Chunk layout with cuts at the given offsets
inline std::vector<ninja_split::ChunkRange> chunks_at(std::size_t length,
                                                      const std::vector<std::size_t>& cuts) {
    std::vector<ninja_split::ChunkRange> chunks;
    std::size_t offset = 0;
    for (std::size_t cut : cuts) {
        chunks.push_back({chunks.size(), offset, cut - offset});
        offset = cut;
    }
    chunks.push_back({chunks.size(), offset, length - offset});
    return chunks;
}

// Random chunk layout with up to max_chunks non-empty chunks
inline std::vector<ninja_split::ChunkRange> random_chunks(std::size_t length, std::size_t max_chunks,
                                                          std::mt19937& gen) {
    std::vector<std::size_t> cuts;
    if (length > 1) {
        std::uniform_int_distribution<std::size_t> position(1, length - 1);
        std::uniform_int_distribution<std::size_t> count(0, max_chunks - 1);
        std::size_t n = count(gen);
        for (std::size_t i = 0; i < n; ++i) {
            cuts.push_back(position(gen));
        }
        std::sort(cuts.begin(), cuts.end());
        cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());
    }
    return chunks_at(length, cuts);
}

/**
 * Ninja-like text: rules, builds with indented bindings, escaped line breaks,
 * blank lines and comments.
 */
inline std::string random_ninja_text(std::size_t statements, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> kind(0, 5);
    std::uniform_int_distribution<int> small(1, 4);

    std::string text;
    for (std::size_t i = 0; i < statements; ++i) {
        std::string id = std::to_string(i);
        switch (kind(gen)) {
            case 0:
                text += "rule cc" + id + "\n  command = gcc -c $in -o $out\n  description = CC $out\n";
                break;
            case 1:
                text += "build obj/f" + id + ".o: cc src/f" + id + ".c";
                for (int k = small(gen); k > 0; --k) {
                    text += " $\n    src/h" + std::to_string(k) + ".h";
                }
                text += "\n";
                break;
            case 2:
                text += "cflags_" + id + " = -O2 -Wall\n";
                break;
            case 3:
                text += "\n";
                break;
            case 4:
                text += "# comment " + id + "\n";
                break;
            default:
                text += "build out" + id + ": phony\n\tpool = console\n";
                break;
        }
    }
    return text;
}

} // namespace test_utils
