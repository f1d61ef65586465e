/**
 * Ninja File Splitting Example
 *
 * Splits a .ninja file into top-level declarations in parallel:
 * - Reading the whole file into a shared buffer
 * - Running the chunk tasks on a job system
 * - Collecting declarations and restoring file order
 *
 * Usage: split_ninja_file <path> [threads] [--dump]
 */

#include <ninja_split/byte_region.hpp>
#include <ninja_split/declaration_sink.hpp>
#include <ninja_split/errors.hpp>
#include <ninja_split/parallel_file_processor.hpp>
#include <ninja_split/separator_rule.hpp>
#include <chrono>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

ninja_split::SharedBuffer read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    auto buffer = std::make_shared<ninja_split::Buffer>(
        std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Failed reading " + path);
    }
    return buffer;
}

void print_cause(const std::exception& e) {
    std::cerr << "  caused by: " << e.what() << "\n";
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        print_cause(nested);
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <path> [threads] [--dump]\n";
        return 2;
    }

    std::string path = argv[1];
    std::size_t threads = 0;
    bool dump = false;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--dump") == 0) {
            dump = true;
        } else {
            try {
                threads = std::stoul(argv[i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid thread count: " << argv[i] << "\n";
                return 2;
            }
        }
    }

    try {
        ninja_split::ByteRegion buffer(read_file(path));

        ninja_split::SplitJobSystem jobs(threads);
        jobs.start();

        ninja_split::ParallelFileProcessor processor(jobs);
        ninja_split::DeclarationCollector collector;

        auto start_time = std::chrono::high_resolution_clock::now();
        processor.process(buffer, ninja_split::ninja_separator, collector.as_sink());
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

        const auto& stats = processor.last_statistics();
        std::cout << "=== " << path << " ===\n";
        std::cout << "Bytes: " << buffer.length() << "\n";
        std::cout << "Workers: " << jobs.get_num_workers() << "\n";
        std::cout << "Chunks: " << stats.chunks << "\n";
        std::cout << "Declarations: " << collector.size() << " ("
                  << stats.interior_declarations << " interior, "
                  << stats.assembled_declarations << " across seams)\n";
        std::cout << "Time: " << duration.count() / 1000.0 << " ms\n";

        if (dump) {
            for (const auto& declaration : collector.sorted()) {
                std::cout << "--- @" << declaration.offset << "\n" << declaration.text;
                if (declaration.text.empty() || declaration.text.back() != '\n') {
                    std::cout << "\n";
                }
            }
        }

        jobs.shutdown();
    } catch (const ninja_split::SplitException& e) {
        std::cerr << "Splitting failed at offset " << e.offset() << ": " << e.what() << "\n";
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& nested) {
            print_cause(nested);
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
