#include "stitch_error.h"

const char *stitch_error_name(StitchError err)
{
    switch (err) {
    case StitchError::None:              return "None";
    case StitchError::InvalidIntrinsics: return "InvalidIntrinsics";
    case StitchError::InvalidConfig:     return "InvalidConfig";
    case StitchError::SeekFailed:        return "SeekFailed";
    case StitchError::DecodeError:       return "DecodeError";
    case StitchError::CaptureTimeout:    return "CaptureTimeout";
    case StitchError::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

bool is_decode_failure(StitchError err)
{
    return err == StitchError::DecodeError || err == StitchError::CaptureTimeout;
}
