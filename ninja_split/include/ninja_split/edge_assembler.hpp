#ifndef NINJA_SPLIT_EDGE_ASSEMBLER_HPP
#define NINJA_SPLIT_EDGE_ASSEMBLER_HPP

#include <ninja_split/byte_region.hpp>
#include <ninja_split/declaration_sink.hpp>
#include <ninja_split/edge_segment.hpp>
#include <ninja_split/separator_rule.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace ninja_split {

/**
 * Rebuilds the declarations that cross chunk seams.
 *
 * Consumes the edge lists of all chunks, concatenated in chunk order, after
 * every chunk task has finished. A TRAILING edge is glued to the next chunk's
 * LEADING edge; a chunk without a LEADING edge had no boundary at all and is
 * folded into the run entirely, so a declaration may span any number of
 * chunks. The separator rule is re-applied to the windows around each seam,
 * which the chunk scans could not see. Runs on one thread and sinks in
 * increasing offset order.
 */
class EdgeAssembler {
public:
    EdgeAssembler(const SeparatorRule& separator, const DeclarationSink& sink)
        : separator_(separator), sink_(sink) {}

    // Throws InvalidArgumentError if the edges are not in chunk order or not contiguous
    void assemble(const EdgeList& edges);

    std::size_t declarations_assembled() const { return assembled_; }

private:
    static void validate(const EdgeList& edges);

    void append(const ByteRegion& part);

    // Examine every window of the run that has a known next byte
    void scan();

    // Sink run_[0, length) and carry the rest
    void finalize(std::size_t length);

    const SeparatorRule& separator_;
    const DeclarationSink& sink_;

    ByteRegion run_;
    std::optional<uint8_t> lookbehind_;  // Byte right before run_
    std::size_t scanned_ = 0;            // First run_ index whose window is unexamined
    std::size_t assembled_ = 0;
};

} // namespace ninja_split

#endif // NINJA_SPLIT_EDGE_ASSEMBLER_HPP
