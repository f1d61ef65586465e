#ifndef NINJA_SPLIT_EDGE_SEGMENT_HPP
#define NINJA_SPLIT_EDGE_SEGMENT_HPP

#include <ninja_split/byte_region.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ninja_split {

enum class EdgeRole {
    LEADING,   // Chunk prefix up to and including its first boundary
    TRAILING   // Chunk suffix after its last boundary (or the whole chunk)
};

/**
 * Declaration fragment touching a chunk seam, left for the EdgeAssembler.
 */
struct EdgeSegment {
    ByteRegion content;
    EdgeRole role;
    std::size_t chunk_index;
    // Byte right before a TRAILING edge inside its chunk; empty when the edge starts the chunk
    std::optional<uint8_t> preceding_byte;

    std::size_t offset() const { return content.offset(); }
    std::size_t end_offset() const { return content.end_offset(); }
};

using EdgeList = std::vector<EdgeSegment>;

} // namespace ninja_split

#endif // NINJA_SPLIT_EDGE_SEGMENT_HPP
