#pragma once

#include "chunk_planner.hpp"
#include "events.hpp"
#include "http_transport.hpp"
#include "output_sink.hpp"

#include <functional>
#include <string>

namespace rangeget {

class FetchWorker {
public:
    using ProgressCallback = std::function<void(const ProgressEvent&)>;

    FetchWorker(ChunkSpec chunk,
                std::string url,
                HttpTransport& transport,
                OutputSink& sink,
                ProgressCallback on_progress = {});

    /// Downloads the chunk into the sink at its absolute offsets and reports
    /// every block through the progress callback. Never throws: all failures
    /// come back as the chunk's result.
    [[nodiscard]] ChunkResult run();

    [[nodiscard]] const ChunkSpec& chunk() const noexcept { return chunk_; }

private:
    [[nodiscard]] ChunkResult fail(ChunkError error, std::string message) const;

    ChunkSpec chunk_;
    std::string url_;
    HttpTransport& transport_;
    OutputSink& sink_;
    ProgressCallback on_progress_;
    std::uint64_t written_{0};
};

} // namespace rangeget
