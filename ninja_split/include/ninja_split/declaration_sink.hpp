#ifndef NINJA_SPLIT_DECLARATION_SINK_HPP
#define NINJA_SPLIT_DECLARATION_SINK_HPP

#include <ninja_split/byte_region.hpp>
#include <cstddef>
#include <functional>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ninja_split {

/**
 * Receives finished declarations. Invoked concurrently from chunk tasks, so
 * the callable must be thread-safe. It reports failure by throwing; the
 * exception aborts the whole operation.
 */
using DeclarationSink = std::function<void(const ByteRegion& declaration)>;

// Thrown by DeclarationCollector once its accept limit is exceeded
class SinkRejected : public std::runtime_error {
public:
    SinkRejected(std::size_t accepted, std::size_t offset)
        : std::runtime_error("Sink rejected declaration at offset " + std::to_string(offset) +
                             " after " + std::to_string(accepted) + " accepted"),
          accepted_(accepted), offset_(offset) {}

    std::size_t accepted() const noexcept { return accepted_; }
    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t accepted_;
    std::size_t offset_;
};

struct Declaration {
    std::size_t offset;
    std::string text;

    bool operator==(const Declaration& other) const {
        return offset == other.offset && text == other.text;
    }
    bool operator<(const Declaration& other) const {
        return offset < other.offset;
    }
};

/**
 * Thread-safe sink that copies every declaration it accepts and can restore
 * global order afterwards. Optionally rejects every call after `accept_limit`
 * successful ones.
 */
class DeclarationCollector {
public:
    static constexpr std::size_t UNLIMITED = std::numeric_limits<std::size_t>::max();

    explicit DeclarationCollector(std::size_t accept_limit = UNLIMITED)
        : accept_limit_(accept_limit) {}

    void accept(const ByteRegion& declaration);

    // Callable bound to this collector; the collector must outlive it
    DeclarationSink as_sink() {
        return [this](const ByteRegion& declaration) { accept(declaration); };
    }

    // Declarations in the order the sink received them
    std::vector<Declaration> received() const;

    // Declarations ordered by offset
    std::vector<Declaration> sorted() const;

    std::size_t size() const;
    std::size_t rejected_count() const;

    // Forget everything accepted so far; the accept limit is kept
    void clear();

    // Concatenation of all declarations in offset order
    std::string reassemble() const;

private:
    mutable std::mutex mutex_;
    std::vector<Declaration> declarations_;
    std::size_t accept_limit_;
    std::size_t rejected_ = 0;
};

} // namespace ninja_split

#endif // NINJA_SPLIT_DECLARATION_SINK_HPP
