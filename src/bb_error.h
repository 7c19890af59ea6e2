#ifndef INCLUDE_BB_ERROR_H
#define INCLUDE_BB_ERROR_H

enum bbError {
    bbError_OK = 0,

    // Caller bugs. Never retried.
    bbError_AddressOverflow,
    bbError_InvalidChannel,
    bbError_BaudRateOutOfRange,
    bbError_OutOfSession,
    bbError_Usage,

    // Transport and file failures. Abort the session.
    bbError_DeviceOpenFailed,
    bbError_DeviceConfigFailed,
    bbError_DeviceWriteFailed,
    bbError_FileOpenFailed,
    bbError_FileReadFailed,
};

extern const char* bb_errorMessage(bbError error);
extern bool bb_isPreconditionViolation(bbError error);

#endif // INCLUDE_BB_ERROR_H
