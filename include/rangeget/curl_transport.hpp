#pragma once

#include "http_transport.hpp"

#include <string>

namespace rangeget {

/// HttpTransport backed by libcurl easy handles. Every call uses its own
/// handle, so one instance can serve all workers at once.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(TransportOptions options = {});

    [[nodiscard]] ResponseHead head(const std::string& url) override;
    void get(const std::string& url,
             const std::optional<ByteRange>& range,
             const HeadHandler& on_head,
             const BodyHandler& on_body) override;

    [[nodiscard]] const TransportOptions& options() const noexcept { return options_; }

private:
    void applyCommonOptions(void* handle, const std::string& url) const;

    TransportOptions options_;
};

} // namespace rangeget
