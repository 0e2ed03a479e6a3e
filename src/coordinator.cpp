#include "rangeget/coordinator.hpp"
#include "rangeget/error.hpp"
#include "rangeget/event_channel.hpp"
#include "rangeget/fetch_worker.hpp"
#include "rangeget/output_sink.hpp"
#include "rangeget/range_probe.hpp"

#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

const char* toString(DownloadState state) noexcept {
    switch (state) {
    case DownloadState::Planning:
        return "planning";
    case DownloadState::Running:
        return "running";
    case DownloadState::Finalizing:
        return "finalizing";
    case DownloadState::Success:
        return "success";
    case DownloadState::PartialFailure:
        return "partial failure";
    }
    return "unknown";
}

class Coordinator::Impl {
public:
    Impl(DownloadRequest request, std::shared_ptr<HttpTransport> transport)
        : request_(std::move(request)), transport_(std::move(transport)) {
        if (!transport_) {
            throw Error("Coordinator requires a transport");
        }
    }

    void subscribe(DownloadListenerPtr listener) {
        if (listener) {
            listeners_.push_back(std::move(listener));
        }
    }

    DownloadOutcome run() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (started_) {
                throw Error("Coordinator::run may only be called once");
            }
            started_ = true;
        }

        DownloadOutcome outcome;
        setState(DownloadState::Planning);

        try {
            outcome.resource = RangeProbe{*transport_}.probe(request_.url);
        } catch (const ProbeError& ex) {
            spdlog::error("{}", ex.what());
            return finishWithoutChunks(std::move(outcome), ex.what());
        }

        outcome.chunks = planChunks(outcome.resource->total_size, request_.threads,
                                    outcome.resource->supports_ranges);
        for (const auto& chunk : outcome.chunks) {
            spdlog::debug("Planned chunk {}: {}", chunk.index, describeRange(chunk));
        }
        spdlog::info("Downloading {} to {} with {} worker(s)", request_.url, request_.destination,
                     outcome.chunks.size());
        notify([&](DownloadListener& listener) { listener.onPlanned(*outcome.resource, outcome.chunks); });

        std::unique_ptr<OutputSink> sink;
        try {
            sink = std::make_unique<OutputSink>(request_.destination, outcome.resource->total_size);
        } catch (const IoError& ex) {
            spdlog::error("{}", ex.what());
            return finishWithoutChunks(std::move(outcome), ex.what());
        }

        setState(DownloadState::Running);
        outcome.results = runWorkers(outcome.chunks, *sink, outcome.total_bytes_written);

        setState(DownloadState::Finalizing);
        for (const auto& result : outcome.results) {
            if (!result.succeeded()) {
                outcome.failed_chunks.insert(result.chunk_index);
            }
        }
        try {
            sink->sync();
        } catch (const IoError& ex) {
            spdlog::error("{}", ex.what());
            outcome.error_message = ex.what();
        }

        outcome.state = (outcome.failed_chunks.empty() && outcome.error_message.empty())
                            ? DownloadState::Success
                            : DownloadState::PartialFailure;
        setState(outcome.state);
        return outcome;
    }

    DownloadState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

private:
    DownloadOutcome finishWithoutChunks(DownloadOutcome outcome, std::string message) {
        outcome.error_message = std::move(message);
        outcome.state = DownloadState::PartialFailure;
        setState(outcome.state);
        return outcome;
    }

    // Spawns one thread per chunk and consumes their events until every chunk
    // has reported its terminal result, then joins all threads.
    std::vector<ChunkResult> runWorkers(const std::vector<ChunkSpec>& chunks,
                                        OutputSink& sink,
                                        std::uint64_t& downloaded_total) {
        EventChannel<WorkerEvent> channel;
        std::vector<std::thread> workers;
        workers.reserve(chunks.size());

        for (const auto& chunk : chunks) {
            try {
                workers.emplace_back([this, chunk, &sink, &channel]() {
                    FetchWorker worker(chunk, request_.url, *transport_, sink,
                                       [&channel](const ProgressEvent& event) { channel.push(event); });
                    channel.push(worker.run());
                });
            } catch (const std::system_error& ex) {
                channel.push(ChunkResult::failure(chunk.index, ChunkError::TransportError,
                                                  fmt::format("cannot start worker thread: {}", ex.what()), 0));
            }
        }

        std::vector<std::optional<ChunkResult>> collected(chunks.size());
        std::size_t pending = chunks.size();
        while (pending > 0) {
            WorkerEvent event = channel.pop();
            if (const auto* progress = std::get_if<ProgressEvent>(&event)) {
                downloaded_total += progress->bytes_since_last;
                notify([&](DownloadListener& listener) { listener.onProgress(*progress, downloaded_total); });
                continue;
            }

            auto& result = std::get<ChunkResult>(event);
            auto& slot = collected.at(result.chunk_index);
            if (slot) {
                spdlog::error("Chunk {} reported more than one result", result.chunk_index);
                continue;
            }
            notify([&](DownloadListener& listener) { listener.onChunkFinished(result); });
            slot = std::move(result);
            --pending;
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        std::vector<ChunkResult> results;
        results.reserve(collected.size());
        for (auto& result : collected) {
            results.push_back(std::move(*result));
        }
        return results;
    }

    void setState(DownloadState state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = state;
        }
        spdlog::debug("Download state: {}", toString(state));
        notify([state](DownloadListener& listener) { listener.onStateChanged(state); });
    }

    // A failing listener must not unwind through the consuming loop while
    // workers are still pushing into its channel.
    template <typename Callback>
    void notify(const Callback& callback) {
        for (const auto& listener : listeners_) {
            try {
                callback(*listener);
            } catch (const std::exception& ex) {
                spdlog::error("Download listener failed: {}", ex.what());
            }
        }
    }

    DownloadRequest request_;
    std::shared_ptr<HttpTransport> transport_;
    std::vector<DownloadListenerPtr> listeners_;

    mutable std::mutex state_mutex_;
    DownloadState state_{DownloadState::Planning};
    bool started_{false};
};

Coordinator::Coordinator(DownloadRequest request, std::shared_ptr<HttpTransport> transport)
    : impl_(std::make_unique<Impl>(std::move(request), std::move(transport))) {}

Coordinator::~Coordinator() = default;

void Coordinator::subscribe(DownloadListenerPtr listener) { impl_->subscribe(std::move(listener)); }

DownloadOutcome Coordinator::run() { return impl_->run(); }

DownloadState Coordinator::state() const { return impl_->state(); }

} // namespace rangeget
