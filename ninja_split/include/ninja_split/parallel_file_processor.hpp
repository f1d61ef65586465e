#ifndef NINJA_SPLIT_PARALLEL_FILE_PROCESSOR_HPP
#define NINJA_SPLIT_PARALLEL_FILE_PROCESSOR_HPP

#include <ninja_split/byte_region.hpp>
#include <ninja_split/declaration_sink.hpp>
#include <ninja_split/separator_rule.hpp>
#include <job_system/job.hpp>
#include <job_system/job_system.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

namespace ninja_split {

enum class SplitTaskType {
    SPLIT_CHUNK   // Scan one chunk, sink interior declarations, return its edges
};

using SplitJobSystem = job_system::JobSystem<SplitTaskType>;

// Contiguous slice of the input handled by one task
struct ChunkRange {
    std::size_t index;
    std::size_t offset;
    std::size_t length;
};

struct SplitOptions {
    static constexpr std::size_t DEFAULT_MIN_CHUNK_SIZE = 64 * 1024;

    std::size_t parallelism = 0;  // Number of chunks to aim for; 0 = one per pool worker
    std::size_t min_chunk_size = DEFAULT_MIN_CHUNK_SIZE;
    job_system::ScheduleMode schedule_mode = job_system::ScheduleMode::FIFO;
};

/**
 * Cut [0, length) into at most `parallelism` chunks of length / N bytes, the
 * last one taking the remainder. N shrinks until every chunk holds at least
 * min_chunk_size bytes, down to a single chunk. Empty input gives no chunks.
 */
std::vector<ChunkRange> partition(std::size_t length, std::size_t parallelism,
                                  std::size_t min_chunk_size);

/**
 * Splits a whole buffer into declarations using a shared job system.
 *
 * Chunk tasks run concurrently and sink interior declarations in no global
 * order; declarations crossing seams are sunk afterwards from the calling
 * thread, in offset order.
 *
 * Errors from process():
 *  - a chunk task that fails (including a sink failure inside the task)
 *    aborts the operation with a ChunkSplitError; the exception the task
 *    raised is nested, reach it with std::rethrow_if_nested.
 *  - a sink failure while seam declarations are assembled propagates
 *    unwrapped, exactly as the sink threw it.
 *  - cancel() makes process() throw OperationAborted.
 *  - a malformed chunk layout throws InvalidArgumentError.
 */
class ParallelFileProcessor {
public:
    struct Statistics {
        std::size_t chunks = 0;
        std::size_t interior_declarations = 0;
        std::size_t assembled_declarations = 0;
    };

    explicit ParallelFileProcessor(SplitJobSystem& jobs, SplitOptions options = {});

    ParallelFileProcessor(const ParallelFileProcessor&) = delete;
    ParallelFileProcessor& operator=(const ParallelFileProcessor&) = delete;

    void process(const ByteRegion& buffer, const SeparatorRule& separator,
                 const DeclarationSink& sink);

    // Explicit chunk layout; the chunks must tile the buffer in index order
    void process(const ByteRegion& buffer, const std::vector<ChunkRange>& chunks,
                 const SeparatorRule& separator, const DeclarationSink& sink);

    /**
     * Request cancellation of the running process() call from another thread.
     * Queued chunk tasks are skipped, running ones stop at their next poll,
     * and process() throws OperationAborted. Declarations already sunk stay.
     */
    void cancel();

    const Statistics& last_statistics() const { return statistics_; }
    const SplitOptions& options() const { return options_; }

private:
    static void validate_chunks(const ByteRegion& buffer, const std::vector<ChunkRange>& chunks);

    SplitJobSystem& jobs_;
    SplitOptions options_;
    Statistics statistics_;

    std::mutex batch_mutex_;
    job_system::BatchPtr active_batch_;
    std::atomic<bool> cancel_requested_{false};
};

/**
 * One-shot entry point. Aims for `parallelism` chunks (0 = hardware
 * concurrency) of at least the default minimum chunk size, and runs them on
 * a private job system with one worker per chunk, capped at hardware
 * concurrency. Input that fits in a single chunk is split on the calling
 * thread without a pool. Errors are reported as by ParallelFileProcessor.
 */
void process(const ByteRegion& buffer, const SeparatorRule& separator,
             const DeclarationSink& sink, std::size_t parallelism = 0);

} // namespace ninja_split

#endif // NINJA_SPLIT_PARALLEL_FILE_PROCESSOR_HPP
