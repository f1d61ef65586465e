#ifndef NINJA_SPLIT_CHUNK_SPLITTER_HPP
#define NINJA_SPLIT_CHUNK_SPLITTER_HPP

#include <ninja_split/byte_region.hpp>
#include <ninja_split/declaration_sink.hpp>
#include <ninja_split/edge_segment.hpp>
#include <ninja_split/separator_rule.hpp>
#include <atomic>
#include <cstddef>

namespace ninja_split {

/**
 * Splits one chunk of the input into declarations.
 *
 * Every declaration that starts after the chunk's first boundary and ends at
 * a boundary inside the chunk is complete and goes straight to the sink.
 * The prefix up to the first boundary (LEADING) and the suffix after the last
 * one (TRAILING) may continue in the neighbouring chunks and are returned for
 * the EdgeAssembler instead. Runs on a pool worker; chunks never talk to each
 * other.
 */
class ChunkSplitter {
public:
    // Bytes scanned between two polls of the abort flag
    static constexpr std::size_t ABORT_POLL_STRIDE = 64 * 1024;

    ChunkSplitter(ByteRegion chunk, std::size_t chunk_index,
                  const SeparatorRule& separator, const DeclarationSink& sink)
        : chunk_(std::move(chunk)), chunk_index_(chunk_index),
          separator_(separator), sink_(sink) {}

    // Abort flag for early termination when the operation is cancelled
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }
    bool should_abort() const {
        return abort_flag_ && abort_flag_->load(std::memory_order_relaxed);
    }

    /**
     * Scan the chunk. Returns [LEADING?, TRAILING]; the TRAILING edge is
     * always present and never empty for a non-empty chunk.
     * Exceptions from the sink propagate unchanged; an observed abort
     * throws job_system::AbortedException.
     */
    EdgeList split();

    // Declarations handed to the sink by the last split()
    std::size_t interior_count() const { return interior_count_; }

    std::size_t chunk_index() const { return chunk_index_; }
    const ByteRegion& chunk() const { return chunk_; }

private:
    ByteRegion chunk_;
    std::size_t chunk_index_;
    const SeparatorRule& separator_;
    const DeclarationSink& sink_;
    const std::atomic<bool>* abort_flag_ = nullptr;
    std::size_t interior_count_ = 0;
};

} // namespace ninja_split

#endif // NINJA_SPLIT_CHUNK_SPLITTER_HPP
