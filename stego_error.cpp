#include "stego_error.hpp"

namespace svgstego {

    const char* errorName(StegoError err)
    {
        switch (err) {
        case StegoError::None:             return "None";
        case StegoError::InvalidFile:      return "InvalidFile";
        case StegoError::InvalidDocument:  return "InvalidDocument";
        case StegoError::CapacityExceeded: return "CapacityExceeded";
        case StegoError::CapacityMismatch: return "CapacityMismatch";
        case StegoError::CorruptHeader:    return "CorruptHeader";
        case StegoError::UsageError:       return "UsageError";
        }
        return "Unknown";
    }

    const char* errorMessage(StegoError err)
    {
        switch (err) {
        case StegoError::None:
            return "no error";
        case StegoError::InvalidFile:
            return "not a valid file";
        case StegoError::InvalidDocument:
            return "not a valid svg image";
        case StegoError::CapacityExceeded:
            return "message size is greater than carrier capacity";
        case StegoError::CapacityMismatch:
        case StegoError::CorruptHeader:
            return "could not extract message, stego-key incorrect or carrier image damaged";
        case StegoError::UsageError:
            return "bad arguments";
        }
        return "unknown error";
    }

    int exitCodeFor(StegoError err)
    {
        switch (err) {
        case StegoError::None:
            return 0;
        case StegoError::UsageError:
            return 1;
        case StegoError::InvalidFile:
        case StegoError::InvalidDocument:
            return 2;
        case StegoError::CapacityExceeded:
        case StegoError::CapacityMismatch:
        case StegoError::CorruptHeader:
            return 3;
        }
        return 1;
    }

}
