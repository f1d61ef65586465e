#ifndef NINJA_SPLIT_BYTE_REGION_HPP
#define NINJA_SPLIT_BYTE_REGION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ninja_split {

using Buffer = std::vector<uint8_t>;
using SharedBuffer = std::shared_ptr<const Buffer>;

/**
 * Immutable view over a shared read-only buffer.
 *
 * A region knows where its bytes live in the buffer (begin/length) and where
 * they sit in the original input (offset). For views over the input buffer
 * both coincide; a region materialized by join() owns a fresh buffer whose
 * bytes still report the offset of the input they were copied from.
 */
class ByteRegion {
public:
    ByteRegion() = default;

    // Whole-buffer view at global offset 0
    explicit ByteRegion(SharedBuffer buffer);

    // View of [begin, begin + length) within buffer; throws InvalidArgumentError out of range
    ByteRegion(SharedBuffer buffer, std::size_t begin, std::size_t length);

    static ByteRegion from_string(std::string_view text);

    std::size_t offset() const { return origin_ + begin_; }
    std::size_t end_offset() const { return offset() + length_; }
    std::size_t length() const { return length_; }
    bool empty() const { return length_ == 0; }

    uint8_t byte_at(std::size_t index) const { return (*buffer_)[begin_ + index]; }
    const uint8_t* data() const { return buffer_ ? buffer_->data() + begin_ : nullptr; }

    // Relative to this region: [from, to)
    ByteRegion sub_region(std::size_t from, std::size_t to) const;

    // True if other starts exactly where this ends inside the same buffer
    bool is_followed_by(const ByteRegion& other) const;

    /**
     * Join adjacent regions (in order) into one region.
     * Adjacent views of a single buffer yield a spanning view without copying;
     * anything else is materialized into a new buffer. The parts must be
     * contiguous in global offsets.
     */
    static ByteRegion join(const std::vector<ByteRegion>& parts);

    const SharedBuffer& buffer() const { return buffer_; }

    std::string_view view() const;
    std::string to_string() const;

private:
    ByteRegion(SharedBuffer buffer, std::size_t origin, std::size_t begin, std::size_t length)
        : buffer_(std::move(buffer)), origin_(origin), begin_(begin), length_(length) {}

    SharedBuffer buffer_;
    std::size_t origin_ = 0;  // Global offset of buffer_[0]
    std::size_t begin_ = 0;
    std::size_t length_ = 0;
};

} // namespace ninja_split

#endif // NINJA_SPLIT_BYTE_REGION_HPP
