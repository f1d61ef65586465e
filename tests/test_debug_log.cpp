#include <gtest/gtest.h>
#include <ninja_split/debug_log.hpp>
#include <algorithm>
#include <cstdio>
#include <string>

using namespace ninja_split;

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        stream = std::tmpfile();
        ASSERT_NE(stream, nullptr);
        debug::set_debug_stream(stream);
    }

    void TearDown() override {
        debug::set_debug_stream(nullptr);
        if (stream) std::fclose(stream);
    }

    std::string written() {
        std::fflush(stream);
        std::rewind(stream);
        std::string text;
        char chunk[256];
        std::size_t n;
        while ((n = std::fread(chunk, 1, sizeof(chunk), stream)) > 0) {
            text.append(chunk, n);
        }
        return text;
    }

    std::FILE* stream = nullptr;
};

TEST_F(DebugLogTest, LineCarriesSourceLocationAndMessage) {
    debug::debug_output("ninja_split/src/chunk_splitter.cpp", 42, "chunk %zu has %d edges",
                        std::size_t(3), 2);

    std::string text = written();
    EXPECT_EQ(text.rfind("[ninja_split chunk_splitter.cpp:42 T", 0), 0u) << text;
    EXPECT_NE(text.find("] chunk 3 has 2 edges\n"), std::string::npos) << text;
}

TEST_F(DebugLogTest, OneLinePerMessage) {
    debug::debug_output("a.cpp", 1, "first");
    debug::debug_output("b.cpp", 2, "second");

    std::string text = written();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
    EXPECT_LT(text.find("first"), text.find("second"));
}

TEST_F(DebugLogTest, NullStreamFallsBackToStderr) {
    debug::set_debug_stream(nullptr);
    EXPECT_EQ(debug::debug_stream(), stderr);
    debug::set_debug_stream(stream);
    EXPECT_EQ(debug::debug_stream(), stream);
}
