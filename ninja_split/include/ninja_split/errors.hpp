#ifndef NINJA_SPLIT_ERRORS_HPP
#define NINJA_SPLIT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ninja_split {

// Base of every error raised by the splitter; offset is a global byte offset
class SplitException : public std::runtime_error {
public:
    SplitException(const std::string& message, std::size_t offset = 0)
        : std::runtime_error(message), offset_(offset) {}

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class InvalidArgumentError : public SplitException {
public:
    InvalidArgumentError(const std::string& message, std::size_t offset = 0)
        : SplitException("Invalid argument: " + message, offset) {}
};

/**
 * A chunk task failed. The exception the task raised (a sink failure, an
 * allocation failure, ...) is nested: use std::rethrow_if_nested to reach it.
 */
class ChunkSplitError : public SplitException {
public:
    ChunkSplitError(std::size_t chunk_index, std::size_t chunk_offset, const std::string& cause)
        : SplitException("Chunk " + std::to_string(chunk_index) + " at offset " +
                         std::to_string(chunk_offset) + " failed: " + cause,
                         chunk_offset),
          chunk_index_(chunk_index) {}

    std::size_t chunk_index() const noexcept { return chunk_index_; }

private:
    std::size_t chunk_index_;
};

class OperationAborted : public SplitException {
public:
    explicit OperationAborted(std::size_t offset = 0)
        : SplitException("Splitting aborted by caller", offset) {}
};

} // namespace ninja_split

#endif // NINJA_SPLIT_ERRORS_HPP
