#include <ninja_split/parallel_file_processor.hpp>
#include <ninja_split/chunk_splitter.hpp>
#include <ninja_split/debug_log.hpp>
#include <ninja_split/edge_assembler.hpp>
#include <ninja_split/errors.hpp>
#include <algorithm>
#include <exception>
#include <string>
#include <thread>

namespace ninja_split {

std::vector<ChunkRange> partition(std::size_t length, std::size_t parallelism,
                                  std::size_t min_chunk_size) {
    if (min_chunk_size == 0) {
        throw InvalidArgumentError("minimum chunk size must be positive");
    }

    std::vector<ChunkRange> chunks;
    if (length == 0) {
        return chunks;
    }

    std::size_t count = std::max<std::size_t>(parallelism, 1);
    count = std::min(count, std::max<std::size_t>(length / min_chunk_size, 1));

    const std::size_t chunk_size = length / count;
    chunks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t offset = i * chunk_size;
        std::size_t size = (i + 1 == count) ? length - offset : chunk_size;
        chunks.push_back(ChunkRange{i, offset, size});
    }
    return chunks;
}

ParallelFileProcessor::ParallelFileProcessor(SplitJobSystem& jobs, SplitOptions options)
    : jobs_(jobs), options_(options) {
    if (options_.min_chunk_size == 0) {
        throw InvalidArgumentError("minimum chunk size must be positive");
    }
    if (options_.parallelism == 0) {
        options_.parallelism = jobs_.get_num_workers();
    }
}

void ParallelFileProcessor::process(const ByteRegion& buffer, const SeparatorRule& separator,
                                    const DeclarationSink& sink) {
    auto chunks = partition(buffer.length(), options_.parallelism, options_.min_chunk_size);
    NINJA_SPLIT_DEBUG_LOG("partitioned %zu bytes into %zu chunks (parallelism %zu, min chunk %zu)",
                          buffer.length(), chunks.size(), options_.parallelism,
                          options_.min_chunk_size);
    process(buffer, chunks, separator, sink);
}

void ParallelFileProcessor::validate_chunks(const ByteRegion& buffer,
                                            const std::vector<ChunkRange>& chunks) {
    std::size_t expected_offset = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const ChunkRange& chunk = chunks[i];
        if (chunk.index != i) {
            throw InvalidArgumentError("chunk at position " + std::to_string(i) +
                                       " has index " + std::to_string(chunk.index),
                                       buffer.offset() + chunk.offset);
        }
        if (chunk.length == 0) {
            throw InvalidArgumentError("chunk " + std::to_string(i) + " is empty",
                                       buffer.offset() + chunk.offset);
        }
        if (chunk.offset != expected_offset) {
            throw InvalidArgumentError("chunk " + std::to_string(i) + " starts at " +
                                       std::to_string(chunk.offset) + ", expected " +
                                       std::to_string(expected_offset),
                                       buffer.offset() + chunk.offset);
        }
        expected_offset += chunk.length;
    }
    if (expected_offset != buffer.length()) {
        throw InvalidArgumentError("chunks cover " + std::to_string(expected_offset) +
                                   " of " + std::to_string(buffer.length()) + " bytes",
                                   buffer.offset() + expected_offset);
    }
}

void ParallelFileProcessor::process(const ByteRegion& buffer,
                                    const std::vector<ChunkRange>& chunks,
                                    const SeparatorRule& separator,
                                    const DeclarationSink& sink) {
    statistics_ = Statistics{};
    cancel_requested_.store(false);

    validate_chunks(buffer, chunks);
    if (chunks.empty()) {
        return;
    }

    auto batch = jobs_.create_batch();
    {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        active_batch_ = batch;
    }

    // Indexed by chunk, not by completion order
    std::vector<EdgeList> results(chunks.size());
    std::atomic<std::size_t> interior{0};

    try {
        for (const auto& chunk : chunks) {
            jobs_.submit_function(batch, [&buffer, &separator, &sink, &results, &interior, &batch, chunk]() {
                ChunkSplitter splitter(buffer.sub_region(chunk.offset, chunk.offset + chunk.length),
                                       chunk.index, separator, sink);
                splitter.set_abort_flag(batch->cancellation_flag());
                results[chunk.index] = splitter.split();
                interior.fetch_add(splitter.interior_count(), std::memory_order_relaxed);
            }, SplitTaskType::SPLIT_CHUNK, 0, options_.schedule_mode);
        }
    } catch (...) {
        // Tasks already queued reference this frame
        batch->cancel();
        batch->wait();
        std::lock_guard<std::mutex> lock(batch_mutex_);
        active_batch_.reset();
        throw;
    }

    bool stopped_early = batch->wait_with_abort([this] { return cancel_requested_.load(); });
    if (stopped_early) {
        // Fail fast: skip queued chunks, let running ones reach their abort poll
        batch->cancel();
        batch->wait();
    }

    {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        active_batch_.reset();
    }

    statistics_.chunks = chunks.size();
    statistics_.interior_declarations = interior.load();

    if (cancel_requested_.load()) {
        NINJA_SPLIT_DEBUG_LOG("splitting cancelled by caller");
        throw OperationAborted(buffer.offset());
    }

    if (batch->has_error()) {
        const ChunkRange& failed = chunks[batch->failed_job_index()];
        std::size_t failed_offset = buffer.offset() + failed.offset;
        NINJA_SPLIT_DEBUG_LOG("chunk %zu at offset %zu failed: %s",
                              failed.index, failed_offset, batch->get_error_description());
        try {
            std::rethrow_exception(batch->first_error());
        } catch (const std::exception& e) {
            std::throw_with_nested(ChunkSplitError(failed.index, failed_offset, e.what()));
        } catch (...) {
            std::throw_with_nested(ChunkSplitError(failed.index, failed_offset,
                                                   batch->get_error_description()));
        }
    }

    EdgeList edges;
    edges.reserve(results.size() * 2);
    for (auto& chunk_edges : results) {
        for (auto& edge : chunk_edges) {
            edges.push_back(std::move(edge));
        }
    }

    EdgeAssembler assembler(separator, sink);
    assembler.assemble(edges);
    statistics_.assembled_declarations = assembler.declarations_assembled();

    NINJA_SPLIT_DEBUG_LOG("split %zu bytes: %zu chunks, %zu interior and %zu seam declarations",
                          buffer.length(), statistics_.chunks,
                          statistics_.interior_declarations, statistics_.assembled_declarations);
}

void ParallelFileProcessor::cancel() {
    cancel_requested_.store(true);
    std::lock_guard<std::mutex> lock(batch_mutex_);
    if (active_batch_) {
        active_batch_->cancel();
    }
}

void process(const ByteRegion& buffer, const SeparatorRule& separator,
             const DeclarationSink& sink, std::size_t parallelism) {
    if (buffer.empty()) {
        return;
    }

    const std::size_t hardware = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    SplitOptions options;
    options.parallelism = parallelism == 0 ? hardware : parallelism;

    auto chunks = partition(buffer.length(), options.parallelism, options.min_chunk_size);
    if (chunks.size() == 1) {
        // Nothing to overlap: split and assemble on the calling thread
        NINJA_SPLIT_DEBUG_LOG("splitting %zu bytes inline", buffer.length());
        ChunkSplitter splitter(buffer, 0, separator, sink);
        EdgeList edges;
        try {
            edges = splitter.split();
        } catch (const std::exception& e) {
            std::throw_with_nested(ChunkSplitError(0, buffer.offset(), e.what()));
        } catch (...) {
            std::throw_with_nested(ChunkSplitError(0, buffer.offset(), "Unhandled exception type"));
        }
        EdgeAssembler assembler(separator, sink);
        assembler.assemble(edges);
        return;
    }

    // One worker per chunk at most
    SplitJobSystem jobs(std::min(chunks.size(), hardware));
    jobs.start();

    ParallelFileProcessor processor(jobs, options);
    processor.process(buffer, chunks, separator, sink);
}

} // namespace ninja_split
