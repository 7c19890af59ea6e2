#ifndef INCLUDE_DIFF_WRITER_H
#define INCLUDE_DIFF_WRITER_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include "bb_error.h"
#include "byte_source.h"
#include "byte_writer.h"

enum RunKind {
    Run_Written,
    Run_Skipped,
    Run_Empty,      // primary had no bytes at all
};

// A contiguous range of addresses that were either all written or all
// skipped. end is inclusive.
struct DiffRun {
    uint16_t start;
    uint16_t end;
    RunKind  kind;
    uint32_t count;
};

class RunReporter {
public:
    virtual ~RunReporter() {}

    // Called as soon as each run is complete.
    virtual void runCompleted(const DiffRun& run) = 0;

    // Called instead of runCompleted when no byte had to be written at all.
    // run covers every visited address. Its kind is Run_Empty if primary
    // had no bytes, and its count is zero if nothing was visited.
    virtual void nothingToDo(const DiffRun& run) = 0;
};

// Prints runs to a stdio stream, one line each.
class ConsoleRunReporter : public RunReporter {
public:
    explicit ConsoleRunReporter(FILE* out);

    void runCompleted(const DiffRun& run);
    void nothingToDo(const DiffRun& run);

private:
    FILE* m_out;
};

// Formats a run like "0000...00ff: Wrote 256 byte". Returns buffer.
extern const char* bb_formatRun(const DiffRun& run, char* buffer, size_t size);

// Writes every byte of primary that differs from baseline, or every byte if
// there is no baseline.
class DiffWriteDriver {
public:
    DiffWriteDriver(ByteWriter& writer, RunReporter& reporter);

    // baseline may be NULL. If baseline runs out before primary does, the
    // walk stops there and the rest of primary is not written.
    bbError run(ByteSource& primary, ByteSource* baseline);

private:
    ByteWriter&  m_writer;
    RunReporter& m_reporter;
};

#endif // INCLUDE_DIFF_WRITER_H
