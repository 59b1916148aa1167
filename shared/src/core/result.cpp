#include "core/result.hpp"

namespace pmx {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INSUFFICIENT_DATA: return "InsufficientData";
        case ErrorKind::INVALID_INPUT: return "InvalidInput";
        case ErrorKind::UNFILLABLE: return "Unfillable";
        case ErrorKind::UPSTREAM_DATA_GAP: return "UpstreamDataGap";
        default: return "Unknown";
    }
}

} // namespace pmx
