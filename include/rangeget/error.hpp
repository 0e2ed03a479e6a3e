#pragma once

#include <stdexcept>
#include <string_view>

namespace rangeget {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection or status failure while probing the resource; fatal for the whole download.
class ProbeError : public Error {
public:
    using Error::Error;
};

class TransportError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

class UsageError : public Error {
public:
    using Error::Error;
};

// Chunk-scoped failure kinds. None of them stops sibling chunks.
enum class ChunkError {
    TransportError,
    RangeMismatch,
    SizeMismatch,
    IoError,
};

[[nodiscard]] std::string_view toString(ChunkError error) noexcept;

} // namespace rangeget
