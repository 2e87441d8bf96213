#ifndef DUOSTITCH_STITCH_ERROR_H
#define DUOSTITCH_STITCH_ERROR_H

enum class StitchError {
    None,
    InvalidIntrinsics,
    InvalidConfig,
    SeekFailed,
    DecodeError,
    CaptureTimeout,
    Cancelled,
};

const char *stitch_error_name(StitchError err);

/* CaptureTimeout is reported to callers as a decode failure. */
bool is_decode_failure(StitchError err);

#endif
