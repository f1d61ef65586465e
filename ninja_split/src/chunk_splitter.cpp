#include <ninja_split/chunk_splitter.hpp>
#include <ninja_split/debug_log.hpp>
#include <job_system/job.hpp>
#include <optional>

namespace ninja_split {

EdgeList ChunkSplitter::split() {
    EdgeList edges;
    interior_count_ = 0;
    const std::size_t length = chunk_.length();
    if (length == 0) {
        return edges;
    }

    const uint8_t* bytes = chunk_.data();
    std::size_t start = 0;
    std::size_t next_poll = ABORT_POLL_STRIDE;

    for (std::size_t i = 0; i + 2 < length; ++i) {
        if (i == next_poll) {
            if (should_abort()) throw job_system::AbortedException{};
            next_poll += ABORT_POLL_STRIDE;
        }

        if (!separator_(bytes[i], bytes[i + 1], bytes[i + 2])) {
            continue;
        }

        ByteRegion declaration = chunk_.sub_region(start, i + 2);
        if (start > 0) {
            if (should_abort()) throw job_system::AbortedException{};
            sink_(declaration);
            ++interior_count_;
        } else {
            // Its beginning may live in the previous chunk
            edges.push_back(EdgeSegment{std::move(declaration), EdgeRole::LEADING, chunk_index_, std::nullopt});
        }
        start = i + 2;
    }

    // Boundaries end at most at length - 1, so the suffix holds at least one byte
    std::optional<uint8_t> preceding;
    if (start > 0) {
        preceding = bytes[start - 1];
    }
    edges.push_back(EdgeSegment{chunk_.sub_region(start, length), EdgeRole::TRAILING,
                                chunk_index_, preceding});

    NINJA_SPLIT_DEBUG_LOG("chunk %zu [%zu, %zu): %s leading edge, trailing edge of %zu bytes",
                          chunk_index_, chunk_.offset(), chunk_.end_offset(),
                          edges.size() == 2 ? "with" : "no", length - start);
    return edges;
}

} // namespace ninja_split
