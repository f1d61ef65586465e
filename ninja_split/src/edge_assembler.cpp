#include <ninja_split/edge_assembler.hpp>
#include <ninja_split/debug_log.hpp>
#include <ninja_split/errors.hpp>
#include <string>
#include <vector>

namespace ninja_split {

void EdgeAssembler::validate(const EdgeList& edges) {
    bool expect_new_chunk = true;
    std::size_t chunk = 0;

    for (std::size_t i = 0; i < edges.size(); ++i) {
        const EdgeSegment& edge = edges[i];
        if (edge.content.empty()) {
            throw InvalidArgumentError("empty edge for chunk " + std::to_string(edge.chunk_index),
                                       edge.offset());
        }

        if (expect_new_chunk) {
            if (i > 0 && edge.chunk_index <= chunk) {
                throw InvalidArgumentError("edges out of chunk order at chunk " +
                                           std::to_string(edge.chunk_index), edge.offset());
            }
            chunk = edge.chunk_index;
        } else if (edge.chunk_index != chunk || edge.role != EdgeRole::TRAILING) {
            throw InvalidArgumentError("chunk " + std::to_string(chunk) +
                                       " has a LEADING edge but no TRAILING edge", edge.offset());
        }

        if (i > 0) {
            const EdgeSegment& previous = edges[i - 1];
            if (expect_new_chunk && previous.end_offset() != edge.offset()) {
                throw InvalidArgumentError("gap or overlap between chunks at offset " +
                                           std::to_string(edge.offset()), edge.offset());
            }
            // Interior declarations were sunk between a chunk's LEADING and TRAILING edges
            if (!expect_new_chunk && previous.end_offset() > edge.offset()) {
                throw InvalidArgumentError("TRAILING edge overlaps LEADING edge in chunk " +
                                           std::to_string(chunk), edge.offset());
            }
        }

        expect_new_chunk = edge.role == EdgeRole::TRAILING;
    }

    if (!expect_new_chunk) {
        throw InvalidArgumentError("last chunk has no TRAILING edge");
    }
}

void EdgeAssembler::assemble(const EdgeList& edges) {
    validate(edges);

    run_ = ByteRegion();
    lookbehind_.reset();
    scanned_ = 0;
    assembled_ = 0;

    for (const auto& edge : edges) {
        if (edge.role == EdgeRole::LEADING) {
            append(edge.content);
            scan();
            // The leading edge ends on a boundary the chunk scan already found
            finalize(run_.length());
            continue;
        }

        if (run_.empty()) {
            run_ = edge.content;
            scanned_ = 0;
            if (edge.preceding_byte) {
                lookbehind_ = edge.preceding_byte;
            }
        } else {
            // No LEADING edge in this chunk: no boundary inside it, fold it in
            append(edge.content);
        }
        scan();
    }

    // End of input closes the last run without a separator
    if (!run_.empty()) {
        finalize(run_.length());
    }

    NINJA_SPLIT_DEBUG_LOG("assembled %zu seam declarations from %zu edges", assembled_, edges.size());
}

void EdgeAssembler::append(const ByteRegion& part) {
    if (run_.empty()) {
        run_ = part;
        scanned_ = 0;
        return;
    }
    run_ = ByteRegion::join(std::vector<ByteRegion>{run_, part});
}

void EdgeAssembler::scan() {
    while (scanned_ + 1 < run_.length()) {
        std::size_t c = scanned_;
        if (c == 0 && !lookbehind_) {
            // Start of input: no window is centred on the first byte
            scanned_ = 1;
            continue;
        }

        uint8_t previous = c == 0 ? *lookbehind_ : run_.byte_at(c - 1);
        if (separator_(previous, run_.byte_at(c), run_.byte_at(c + 1))) {
            finalize(c + 1);
        } else {
            scanned_ = c + 1;
        }
    }
}

void EdgeAssembler::finalize(std::size_t length) {
    ByteRegion declaration = run_.sub_region(0, length);
    lookbehind_ = declaration.byte_at(length - 1);
    run_ = run_.sub_region(length, run_.length());
    scanned_ = 0;

    sink_(declaration);
    ++assembled_;
}

} // namespace ninja_split
