#include <NorFlash.hpp>

const char* flashErrorName(FlashError e) {
    switch (e) {
        case FlashError::None:         return "none";
        case FlashError::NotAligned:   return "not-aligned";
        case FlashError::OutOfBounds:  return "out-of-bounds";
        case FlashError::BadWrite:     return "bad-write";
        case FlashError::Busy:         return "busy";
        case FlashError::NotSupported: return "not-supported";
        case FlashError::ReadOnly:     return "read-only";
        case FlashError::Other:        return "device";
    }
    return "?";
}
