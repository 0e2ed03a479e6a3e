#include "rangeget/fetch_worker.hpp"
#include "rangeget/error.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

constexpr long kPartialContent = 206;

} // namespace

FetchWorker::FetchWorker(ChunkSpec chunk,
                         std::string url,
                         HttpTransport& transport,
                         OutputSink& sink,
                         ProgressCallback on_progress)
    : chunk_(std::move(chunk)),
      url_(std::move(url)),
      transport_(transport),
      sink_(sink),
      on_progress_(std::move(on_progress)) {}

ChunkResult FetchWorker::fail(ChunkError error, std::string message) const {
    spdlog::warn("Chunk {} [{}] failed: {} ({})", chunk_.index, describeRange(chunk_), message, toString(error));
    return ChunkResult::failure(chunk_.index, error, std::move(message), written_);
}

ChunkResult FetchWorker::run() {
    written_ = 0;
    if (chunk_.isEmpty()) {
        return ChunkResult::success(chunk_.index, 0);
    }

    std::optional<ByteRange> range;
    if (chunk_.ranged) {
        range = ByteRange{chunk_.start_offset, chunk_.endOffset()};
    }
    const auto expected = chunk_.length;

    spdlog::debug("Chunk {} started: {}", chunk_.index,
                  range ? formatRangeHeader(*range) : std::string("full resource"));

    std::optional<ChunkResult> failure;

    const auto on_head = [&](const ResponseHead& head) {
        if (!head.isSuccess()) {
            failure = fail(ChunkError::TransportError, fmt::format("unexpected HTTP status {}", head.status));
            return false;
        }
        if (range && head.status != kPartialContent) {
            failure = fail(ChunkError::RangeMismatch,
                           fmt::format("server ignored the range request (HTTP {})", head.status));
            return false;
        }
        if (!range && head.status == kPartialContent) {
            failure = fail(ChunkError::RangeMismatch, "server sent partial content for a full request");
            return false;
        }
        return true;
    };

    const auto on_body = [&](const char* data, std::size_t size) {
        if (expected && written_ + size > *expected) {
            failure = fail(ChunkError::SizeMismatch,
                           fmt::format("server sent more than the {} bytes expected", *expected));
            return false;
        }
        try {
            sink_.writeAt(chunk_.start_offset + written_, data, size);
        } catch (const IoError& ex) {
            failure = fail(ChunkError::IoError, ex.what());
            return false;
        }
        written_ += size;
        if (on_progress_) {
            on_progress_(ProgressEvent{chunk_.index, static_cast<std::uint64_t>(size)});
        }
        return true;
    };

    try {
        transport_.get(url_, range, on_head, on_body);
    } catch (const TransportError& ex) {
        return fail(ChunkError::TransportError, ex.what());
    } catch (const std::exception& ex) {
        return fail(ChunkError::TransportError, fmt::format("unexpected error: {}", ex.what()));
    }

    if (failure) {
        return *failure;
    }
    if (expected && written_ != *expected) {
        return fail(ChunkError::SizeMismatch, fmt::format("received {} of {} bytes", written_, *expected));
    }

    spdlog::debug("Chunk {} finished: {} bytes", chunk_.index, written_);
    return ChunkResult::success(chunk_.index, written_);
}

} // namespace rangeget
