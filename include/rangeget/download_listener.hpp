#pragma once

#include "chunk_planner.hpp"
#include "events.hpp"
#include "resource_info.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace rangeget {

enum class DownloadState {
    Planning,
    Running,
    Finalizing,
    Success,
    PartialFailure,
};

[[nodiscard]] const char* toString(DownloadState state) noexcept;

// Observer of one download. All callbacks run on the coordinator's thread.
class DownloadListener {
public:
    virtual ~DownloadListener() = default;

    virtual void onStateChanged(DownloadState /*state*/) {}
    virtual void onPlanned(const ResourceInfo& /*resource*/, const std::vector<ChunkSpec>& /*chunks*/) {}
    virtual void onProgress(const ProgressEvent& /*event*/, std::uint64_t /*downloaded_total*/) {}
    virtual void onChunkFinished(const ChunkResult& /*result*/) {}
};

using DownloadListenerPtr = std::shared_ptr<DownloadListener>;

} // namespace rangeget
