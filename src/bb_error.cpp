#include "bb_error.h"

const char* bb_errorMessage(bbError error) {
    switch (error) {

    case bbError_OK:
        return "OK";

    case bbError_AddressOverflow:
        return "address overflow, too much data";

    case bbError_InvalidChannel:
        return "invalid channel";

    case bbError_BaudRateOutOfRange:
        return "baud rate out of range";

    case bbError_OutOfSession:
        return "out of session";

    case bbError_Usage:
        return "invalid command line";

    case bbError_DeviceOpenFailed:
        return "serial device open failed";

    case bbError_DeviceConfigFailed:
        return "serial device configuration failed";

    case bbError_DeviceWriteFailed:
        return "serial device write failed";

    case bbError_FileOpenFailed:
        return "file open failed";

    case bbError_FileReadFailed:
        return "file read failed";

    default:
        return "unknown error code";
    }
}

bool bb_isPreconditionViolation(bbError error) {
    switch (error) {
    case bbError_AddressOverflow:
    case bbError_InvalidChannel:
    case bbError_BaudRateOutOfRange:
    case bbError_OutOfSession:
    case bbError_Usage:
        return true;

    default:
        return false;
    }
}
