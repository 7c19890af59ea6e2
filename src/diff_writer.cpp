#include "diff_writer.h"
#include "config.h"

ConsoleRunReporter::ConsoleRunReporter(FILE* out)
    : m_out(out) {
}

void ConsoleRunReporter::runCompleted(const DiffRun& run) {
    char line[64];
    fprintf(m_out, "%s\n", bb_formatRun(run, line, sizeof(line)));
    fflush(m_out);
}

void ConsoleRunReporter::nothingToDo(const DiffRun& run) {
    if (run.kind == Run_Empty) {
        fprintf(m_out, "Nothing to do (empty input)\n");
    }
    else {
        fprintf(m_out, "Nothing to do (no changes)\n");
    }
    fflush(m_out);
}

const char* bb_formatRun(const DiffRun& run, char* buffer, size_t size) {
    if (run.kind == Run_Written) {
        snprintf(buffer, size, "%04x...%04x: Wrote %u byte",
                 run.start, run.end, (unsigned)run.count);
    }
    else {
        snprintf(buffer, size, "%04x...%04x: Skipped %u byte (no change)",
                 run.start, run.end, (unsigned)run.count);
    }
    return buffer;
}

static DiffRun makeRun(uint32_t start, uint32_t end, RunKind kind) {
    DiffRun run;
    run.start = (uint16_t)start;
    run.end   = (uint16_t)end;
    run.kind  = kind;
    run.count = end + 1 - start;
    return run;
}

DiffWriteDriver::DiffWriteDriver(ByteWriter& writer, RunReporter& reporter)
    : m_writer(writer)
    , m_reporter(reporter) {
}

bbError DiffWriteDriver::run(ByteSource& primary, ByteSource* baseline) {
    bool     runOpen  = false;
    RunKind  runKind  = Run_Written;
    uint32_t runStart = 0;
    uint32_t address  = 0;
    bool primaryEmpty = true;

    for (;; address++) {
        uint8_t byte = 0;
        bool eof = false;

        bbError status = primary.next(byte, eof);
        if (status != bbError_OK) {
            return status;
        }
        if (eof) {
            break;
        }
        primaryEmpty = false;

        if (address >= c_addressSpaceSize) {
            return bbError_AddressOverflow;
        }

        // Without a baseline, every byte counts as changed.
        bool unchanged = false;
        if (baseline != NULL) {
            uint8_t oldByte = 0;
            bool oldEof = false;

            status = baseline->next(oldByte, oldEof);
            if (status != bbError_OK) {
                return status;
            }

            // TODO - this drops the tail of primary when the old file is
            // shorter. Writing the tail unconditionally is probably what's
            // wanted, but that needs confirming before changing it.
            if (oldEof) {
                break;
            }

            unchanged = (byte == oldByte);
        }

        RunKind kind = unchanged ? Run_Skipped : Run_Written;

        if (!runOpen) {
            runOpen  = true;
            runKind  = kind;
            runStart = address;
        }
        else if (kind != runKind) {
            m_reporter.runCompleted(makeRun(runStart, address - 1, runKind));
            runKind  = kind;
            runStart = address;
        }

        if (kind == Run_Written) {
            status = m_writer.writeByte((uint16_t)address, byte);
            if (status != bbError_OK) {
                return status;
            }
        }
    }

    if (!runOpen) {
        // Either primary was empty, or the baseline was and cut it short.
        DiffRun none = { 0, 0, primaryEmpty ? Run_Empty : Run_Skipped, 0 };
        m_reporter.nothingToDo(none);
        return bbError_OK;
    }

    // address is one past the last visited byte.
    DiffRun last = makeRun(runStart, address - 1, runKind);
    if (last.kind == Run_Skipped && last.start == 0) {
        m_reporter.nothingToDo(last);
    }
    else {
        m_reporter.runCompleted(last);
    }

    return bbError_OK;
}
