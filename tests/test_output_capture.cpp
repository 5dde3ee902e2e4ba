#include <execgate/core/process_runner.hpp>

#include <gtest/gtest.h>
#include <cstring>

using namespace execgate;

namespace {

const size_t MARKER_LEN = strlen(OutputCapture::TRUNCATION_MARKER);

void append_out(OutputCapture& c, const std::string& s) { c.append_stdout(s.data(), s.size()); }
void append_err(OutputCapture& c, const std::string& s) { c.append_stderr(s.data(), s.size()); }

} // namespace

TEST(OutputCaptureTest, KeepsOutputUnderBudgetVerbatim) {
    OutputCapture c(1024);
    append_out(c, "hello ");
    append_out(c, "world\n");
    append_err(c, "warning\n");
    EXPECT_FALSE(c.truncated());
    EXPECT_EQ(c.stdout_data(), "hello world\n");
    EXPECT_EQ(c.stderr_data(), "warning\n");
    EXPECT_EQ(c.total_size(), 20u);
}

TEST(OutputCaptureTest, BinaryBytesPreserved) {
    OutputCapture c(1024);
    std::string bin("\x00\xff\x01\n", 4);
    append_out(c, bin);
    EXPECT_EQ(c.stdout_data(), bin);
}

TEST(OutputCaptureTest, OverflowCutsAndAppendsMarker) {
    const size_t max = 200;
    OutputCapture c(max);
    std::string data(2 * max, 'x');
    append_out(c, data);

    EXPECT_TRUE(c.truncated());
    EXPECT_LE(c.total_size(), max);
    EXPECT_EQ(c.stdout_data(), std::string(max - MARKER_LEN, 'x') + OutputCapture::TRUNCATION_MARKER);
}

TEST(OutputCaptureTest, BudgetIsSharedByBothStreams) {
    const size_t max = 150;
    OutputCapture c(max);
    append_out(c, std::string(80, 'o'));
    append_err(c, std::string(80, 'e'));

    EXPECT_TRUE(c.truncated());
    EXPECT_LE(c.total_size(), max);
    EXPECT_EQ(c.stdout_data(), std::string(80, 'o'));
    EXPECT_EQ(c.stderr_data().compare(0, max - MARKER_LEN - 80, std::string(max - MARKER_LEN - 80, 'e')), 0);
    EXPECT_NE(c.stderr_data().find(OutputCapture::TRUNCATION_MARKER), std::string::npos);
}

TEST(OutputCaptureTest, DiscardsEverythingAfterTruncation) {
    OutputCapture c(100);
    append_out(c, std::string(500, 'a'));
    std::string before_out = c.stdout_data();

    append_out(c, "more");
    append_err(c, "more");
    EXPECT_EQ(c.stdout_data(), before_out);
    EXPECT_TRUE(c.stderr_data().empty());
}

TEST(OutputCaptureTest, ExactFitIsNotTruncated) {
    const size_t max = 120;
    OutputCapture c(max);
    append_out(c, std::string(max - MARKER_LEN, 'z'));
    EXPECT_FALSE(c.truncated());
}

TEST(OutputCaptureTest, TinyBudgetKeepsDataWithoutMarker) {
    OutputCapture c(10);
    append_out(c, "0123456789abcdef");
    EXPECT_TRUE(c.truncated());
    EXPECT_EQ(c.stdout_data(), "0123456789");
}
