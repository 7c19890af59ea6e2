#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "byte_source.h"
#include "byte_writer.h"
#include "config.h"
#include "diff_writer.h"
#include "test_support.h"

namespace {

void expectRun(const DiffRun& run, uint16_t start, uint16_t end, RunKind kind, uint32_t count) {
    EXPECT_EQ(start, run.start);
    EXPECT_EQ(end, run.end);
    EXPECT_EQ(kind, run.kind);
    EXPECT_EQ(count, run.count);
}

std::string format(const DiffRun& run) {
    char buffer[64];
    return bb_formatRun(run, buffer, sizeof(buffer));
}

class DiffWriteDriverTest : public ::testing::Test {
protected:
    DiffWriteDriverTest()
        : driver(writer, reporter) {}

    bbError run(const std::vector<uint8_t>& primary) {
        BufferByteSource source(primary.data(), primary.size());
        return driver.run(source, NULL);
    }

    bbError run(const std::vector<uint8_t>& primary, const std::vector<uint8_t>& baseline) {
        BufferByteSource source(primary.data(), primary.size());
        BufferByteSource old(baseline.data(), baseline.size());
        return driver.run(source, &old);
    }

    RecordingWriter    writer;
    CollectingReporter reporter;
    DiffWriteDriver    driver;
};

}  // namespace

TEST_F(DiffWriteDriverTest, WritesOnlyChangedBytes) {
    ASSERT_EQ(bbError_OK, run({ 1, 2, 3, 4 }, { 1, 9, 3, 4 }));

    ASSERT_EQ(1u, writer.writes.size());
    EXPECT_EQ(1, writer.writes[0].first);
    EXPECT_EQ(2, writer.writes[0].second);

    ASSERT_EQ(3u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 0, Run_Skipped, 1);
    expectRun(reporter.runs[1], 1, 1, Run_Written, 1);
    expectRun(reporter.runs[2], 2, 3, Run_Skipped, 2);
    EXPECT_EQ(0, reporter.nothingToDoCalls);

    uint32_t total = 0;
    for (size_t i = 0; i < reporter.runs.size(); i++) {
        total += reporter.runs[i].count;
    }
    EXPECT_EQ(4u, total);
}

TEST_F(DiffWriteDriverTest, WithoutBaselineEverythingIsWritten) {
    ASSERT_EQ(bbError_OK, run({ 5, 6, 7, 5 }));

    ASSERT_EQ(4u, writer.writes.size());
    for (uint16_t i = 0; i < 4; i++) {
        EXPECT_EQ(i, writer.writes[i].first);
    }
    EXPECT_EQ(7, writer.writes[2].second);

    ASSERT_EQ(1u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 3, Run_Written, 4);
    EXPECT_EQ(0, reporter.nothingToDoCalls);
}

TEST_F(DiffWriteDriverTest, IdenticalInputIsNothingToDo) {
    ASSERT_EQ(bbError_OK, run({ 1, 2, 3, 4 }, { 1, 2, 3, 4 }));

    EXPECT_TRUE(writer.writes.empty());
    EXPECT_TRUE(reporter.runs.empty());
    ASSERT_EQ(1, reporter.nothingToDoCalls);
    expectRun(reporter.nothingToDoRun, 0, 3, Run_Skipped, 4);
}

TEST_F(DiffWriteDriverTest, TrailingSkippedRunIsReported) {
    ASSERT_EQ(bbError_OK, run({ 0, 2, 3 }, { 1, 2, 3 }));

    ASSERT_EQ(2u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 0, Run_Written, 1);
    expectRun(reporter.runs[1], 1, 2, Run_Skipped, 2);
    EXPECT_EQ(0, reporter.nothingToDoCalls);
}

TEST_F(DiffWriteDriverTest, EmptyInputIsNothingToDo) {
    ASSERT_EQ(bbError_OK, run({}));

    EXPECT_TRUE(writer.writes.empty());
    EXPECT_TRUE(reporter.runs.empty());
    ASSERT_EQ(1, reporter.nothingToDoCalls);
    EXPECT_EQ(0u, reporter.nothingToDoRun.count);
    EXPECT_EQ(Run_Empty, reporter.nothingToDoRun.kind);
}

// A shorter old file ends the walk. Nothing past its end is visited, even
// though those bytes of the new file were never compared.
TEST_F(DiffWriteDriverTest, ShortBaselineTruncatesPrimary) {
    ASSERT_EQ(bbError_OK, run({ 1, 2, 3, 4, 5 }, { 1, 0 }));

    ASSERT_EQ(1u, writer.writes.size());
    EXPECT_EQ(1, writer.writes[0].first);

    ASSERT_EQ(2u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 0, Run_Skipped, 1);
    expectRun(reporter.runs[1], 1, 1, Run_Written, 1);
}

TEST_F(DiffWriteDriverTest, EmptyBaselineWritesNothing) {
    ASSERT_EQ(bbError_OK, run({ 1, 2, 3 }, {}));

    EXPECT_TRUE(writer.writes.empty());
    EXPECT_TRUE(reporter.runs.empty());
    ASSERT_EQ(1, reporter.nothingToDoCalls);

    // Not empty input, the old file just ended first.
    EXPECT_EQ(0u, reporter.nothingToDoRun.count);
    EXPECT_EQ(Run_Skipped, reporter.nothingToDoRun.kind);
}

TEST_F(DiffWriteDriverTest, LongBaselineEndsWithPrimary) {
    ASSERT_EQ(bbError_OK, run({ 1, 5 }, { 1, 2, 3 }));

    ASSERT_EQ(1u, writer.writes.size());
    ASSERT_EQ(2u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 0, Run_Skipped, 1);
    expectRun(reporter.runs[1], 1, 1, Run_Written, 1);
}

TEST_F(DiffWriteDriverTest, FullAddressSpaceFits) {
    std::vector<uint8_t> image(c_addressSpaceSize, 0xea);
    ASSERT_EQ(bbError_OK, run(image));

    EXPECT_EQ(c_addressSpaceSize, writer.writes.size());
    ASSERT_EQ(1u, reporter.runs.size());
    expectRun(reporter.runs[0], 0, 0x7fff, Run_Written, c_addressSpaceSize);
}

TEST_F(DiffWriteDriverTest, AddressOverflowAborts) {
    std::vector<uint8_t> image(c_addressSpaceSize + 1, 0xea);
    EXPECT_EQ(bbError_AddressOverflow, run(image));

    // Everything up to the overflow went out, nothing after it.
    ASSERT_EQ(c_addressSpaceSize, writer.writes.size());
    EXPECT_EQ(0x7fff, writer.writes.back().first);
    EXPECT_TRUE(reporter.runs.empty());
    EXPECT_EQ(0, reporter.nothingToDoCalls);
}

TEST_F(DiffWriteDriverTest, WriterFailureAborts) {
    writer.failAt(2);
    EXPECT_EQ(bbError_DeviceWriteFailed, run({ 1, 2, 3, 4 }));

    EXPECT_EQ(2u, writer.writes.size());
    EXPECT_TRUE(reporter.runs.empty());
}

TEST_F(DiffWriteDriverTest, SourceFailureAborts) {
    FailingSource primary(3);
    EXPECT_EQ(bbError_FileReadFailed, driver.run(primary, NULL));
    EXPECT_EQ(3u, writer.writes.size());

    writer.writes.clear();
    std::vector<uint8_t> data = { 1, 2, 3 };
    BufferByteSource source(data.data(), data.size());
    FailingSource old(1);
    EXPECT_EQ(bbError_FileReadFailed, driver.run(source, &old));
    EXPECT_EQ(1u, writer.writes.size());
}

TEST_F(DiffWriteDriverTest, RunsAreReportedAsTheyComplete) {
    // Reporter sees the written run before the writer sees address 3.
    struct OrderCheck : public RunReporter {
        RecordingWriter* writer;
        size_t writesAtFirstRun;
        OrderCheck() : writer(NULL), writesAtFirstRun(0) {}
        void runCompleted(const DiffRun&) {
            if (writesAtFirstRun == 0) {
                writesAtFirstRun = writer->writes.size();
            }
        }
        void nothingToDo(const DiffRun&) {}
    } order;
    order.writer = &writer;

    DiffWriteDriver streaming(writer, order);
    std::vector<uint8_t> primary  = { 1, 2, 3, 4 };
    std::vector<uint8_t> baseline = { 0, 0, 3, 0 };
    BufferByteSource source(primary.data(), primary.size());
    BufferByteSource old(baseline.data(), baseline.size());
    ASSERT_EQ(bbError_OK, streaming.run(source, &old));

    EXPECT_EQ(2u, order.writesAtFirstRun);
    EXPECT_EQ(3u, writer.writes.size());
}

TEST(DiffWriteIntegrationTest, DrivesRealWriter) {
    FakeClock clock;
    MemorySink sink(&clock);
    TimedByteWriter writer(sink, clock, std::chrono::milliseconds(15));
    CollectingReporter reporter;
    DiffWriteDriver driver(writer, reporter);

    ASSERT_EQ(bbError_OK, writer.begin());

    std::vector<uint8_t> primary  = { 0x11, 0x22, 0x33 };
    std::vector<uint8_t> baseline = { 0x00, 0x22, 0x00 };
    BufferByteSource source(primary.data(), primary.size());
    BufferByteSource old(baseline.data(), baseline.size());
    ASSERT_EQ(bbError_OK, driver.run(source, &old));

    // One ~WE pulse per written byte.
    Telegram strobe = sn_encode(Channel_AddrHigh, 0x00);
    int pulses = 0;
    for (size_t i = 0; i < sink.chunks.size(); i++) {
        if (sink.chunks[i].bytes[0] == strobe.low && sink.chunks[i].bytes[1] == strobe.high) {
            pulses++;
        }
    }
    EXPECT_EQ(2, pulses);
    EXPECT_EQ(2, clock.sleeps());
    EXPECT_EQ(3u, reporter.runs.size());
}

TEST(FormatRunTest, Written) {
    DiffRun run = { 0x0010, 0x001f, Run_Written, 16 };
    EXPECT_EQ("0010...001f: Wrote 16 byte", format(run));
}

TEST(FormatRunTest, Skipped) {
    DiffRun run = { 0x0000, 0x7fff, Run_Skipped, 32768 };
    EXPECT_EQ("0000...7fff: Skipped 32768 byte (no change)", format(run));
}

TEST(ConsoleRunReporterTest, PrintsLines) {
    FILE* out = tmpfile();
    ASSERT_TRUE(out != NULL);

    ConsoleRunReporter console(out);
    DiffRun written = { 0x0001, 0x0002, Run_Written, 2 };
    DiffRun all     = { 0x0000, 0x0003, Run_Skipped, 4 };
    console.runCompleted(written);
    console.nothingToDo(all);

    rewind(out);
    char text[128] = { 0 };
    size_t length = fread(text, 1, sizeof(text) - 1, out);
    fclose(out);

    EXPECT_EQ("0001...0002: Wrote 2 byte\nNothing to do (no changes)\n",
              std::string(text, length));
}

TEST(ConsoleRunReporterTest, EmptyInputAndEmptyBaselineDiffer) {
    FILE* out = tmpfile();
    ASSERT_TRUE(out != NULL);

    ConsoleRunReporter console(out);
    DiffRun empty     = { 0, 0, Run_Empty,   0 };
    DiffRun truncated = { 0, 0, Run_Skipped, 0 };
    console.nothingToDo(empty);
    console.nothingToDo(truncated);

    rewind(out);
    char text[128] = { 0 };
    size_t length = fread(text, 1, sizeof(text) - 1, out);
    fclose(out);

    EXPECT_EQ("Nothing to do (empty input)\nNothing to do (no changes)\n",
              std::string(text, length));
}
