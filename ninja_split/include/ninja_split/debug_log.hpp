#ifndef NINJA_SPLIT_DEBUG_LOG_HPP
#define NINJA_SPLIT_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace ninja_split {
namespace debug {

// Where NINJA_SPLIT_DEBUG_LOG writes; null means stderr
inline std::atomic<std::FILE*> g_debug_stream{nullptr};

inline void set_debug_stream(std::FILE* stream) {
    g_debug_stream.store(stream, std::memory_order_release);
}

inline std::FILE* debug_stream() {
    std::FILE* stream = g_debug_stream.load(std::memory_order_acquire);
    return stream ? stream : stderr;
}

// Short per-thread tag; chunk tasks log from pool workers
inline unsigned thread_tag() {
    return static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000);
}

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
inline void debug_output(const char* file, int line, const char* fmt, ...) {
    char message[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    const char* name = std::strrchr(file, '/');
    name = name ? name + 1 : file;

    // One fputs per line so concurrent workers never interleave mid-line
    char full_message[1200];
    std::snprintf(full_message, sizeof(full_message), "[ninja_split %s:%d T%04u] %s\n",
                  name, line, thread_tag(), message);

    std::FILE* stream = debug_stream();
    std::fputs(full_message, stream);
    std::fflush(stream);
}

} // namespace debug
} // namespace ninja_split

#ifdef NINJA_SPLIT_ENABLE_DEBUG_OUTPUT
    #define NINJA_SPLIT_DEBUG_LOG(fmt, ...) \
        ::ninja_split::debug::debug_output(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
    #define NINJA_SPLIT_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // NINJA_SPLIT_DEBUG_LOG_HPP
