#pragma once

#include "chunk_planner.hpp"
#include "download_listener.hpp"
#include "events.hpp"
#include "http_transport.hpp"
#include "resource_info.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rangeget {

struct DownloadRequest {
    std::string url;
    std::string destination;
    std::uint32_t threads{2};
};

struct DownloadOutcome {
    DownloadState state{DownloadState::PartialFailure};
    std::uint64_t total_bytes_written{0};
    std::set<std::uint32_t> failed_chunks;

    std::optional<ResourceInfo> resource;
    std::vector<ChunkSpec> chunks;
    std::vector<ChunkResult> results; // indexed by chunk index
    // Set when the download failed before or after the chunk work.
    std::string error_message;

    [[nodiscard]] bool succeeded() const noexcept { return state == DownloadState::Success; }
};

/// Drives one download: probe, plan, one worker thread per chunk, then
/// aggregation of every worker's events into a single outcome. The output
/// file is left as written on partial failure.
class Coordinator {
public:
    Coordinator(DownloadRequest request, std::shared_ptr<HttpTransport> transport);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    void subscribe(DownloadListenerPtr listener);

    // Returns after every worker has reported and been joined. Runs once per instance.
    [[nodiscard]] DownloadOutcome run();

    [[nodiscard]] DownloadState state() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangeget
