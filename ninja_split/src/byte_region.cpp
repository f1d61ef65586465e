#include <ninja_split/byte_region.hpp>
#include <ninja_split/errors.hpp>
#include <cstring>

namespace ninja_split {

ByteRegion::ByteRegion(SharedBuffer buffer)
    : buffer_(std::move(buffer)), origin_(0), begin_(0), length_(buffer_ ? buffer_->size() : 0) {}

ByteRegion::ByteRegion(SharedBuffer buffer, std::size_t begin, std::size_t length)
    : buffer_(std::move(buffer)), origin_(0), begin_(begin), length_(length) {
    std::size_t capacity = buffer_ ? buffer_->size() : 0;
    if (begin > capacity || length > capacity - begin) {
        throw InvalidArgumentError("region [" + std::to_string(begin) + ", " +
                                   std::to_string(begin + length) + ") exceeds buffer of " +
                                   std::to_string(capacity) + " bytes", begin);
    }
}

ByteRegion ByteRegion::from_string(std::string_view text) {
    auto buffer = std::make_shared<Buffer>(text.begin(), text.end());
    return ByteRegion(std::move(buffer));
}

ByteRegion ByteRegion::sub_region(std::size_t from, std::size_t to) const {
    if (from > to || to > length_) {
        throw InvalidArgumentError("sub-region [" + std::to_string(from) + ", " +
                                   std::to_string(to) + ") of a " + std::to_string(length_) +
                                   "-byte region", offset() + from);
    }
    return ByteRegion(buffer_, origin_, begin_ + from, to - from);
}

bool ByteRegion::is_followed_by(const ByteRegion& other) const {
    return buffer_ == other.buffer_ && origin_ == other.origin_ &&
           begin_ + length_ == other.begin_;
}

ByteRegion ByteRegion::join(const std::vector<ByteRegion>& parts) {
    if (parts.empty()) {
        return ByteRegion();
    }
    if (parts.size() == 1) {
        return parts.front();
    }

    bool spanning = true;
    std::size_t total = parts.front().length_;
    for (std::size_t i = 1; i < parts.size(); ++i) {
        const ByteRegion& previous = parts[i - 1];
        const ByteRegion& current = parts[i];
        if (previous.end_offset() != current.offset()) {
            throw InvalidArgumentError("regions to join are not contiguous: " +
                                       std::to_string(previous.end_offset()) + " != " +
                                       std::to_string(current.offset()), current.offset());
        }
        spanning = spanning && previous.is_followed_by(current);
        total += current.length_;
    }

    const ByteRegion& first = parts.front();
    if (spanning) {
        return ByteRegion(first.buffer_, first.origin_, first.begin_, total);
    }

    auto merged = std::make_shared<Buffer>();
    merged->reserve(total);
    for (const auto& part : parts) {
        merged->insert(merged->end(), part.data(), part.data() + part.length_);
    }
    return ByteRegion(std::move(merged), first.offset(), 0, total);
}

std::string_view ByteRegion::view() const {
    if (length_ == 0) {
        return {};
    }
    return std::string_view(reinterpret_cast<const char*>(data()), length_);
}

std::string ByteRegion::to_string() const {
    return std::string(view());
}

} // namespace ninja_split
