#include "rangeget/error.hpp"

namespace rangeget {

std::string_view toString(ChunkError error) noexcept {
    switch (error) {
    case ChunkError::TransportError:
        return "transport error";
    case ChunkError::RangeMismatch:
        return "range mismatch";
    case ChunkError::SizeMismatch:
        return "size mismatch";
    case ChunkError::IoError:
        return "I/O error";
    }
    return "unknown error";
}

} // namespace rangeget
