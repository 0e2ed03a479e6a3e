#pragma once

#include "http_transport.hpp"
#include "resource_info.hpp"

#include <string>

namespace rangeget {

class RangeProbe {
public:
    explicit RangeProbe(HttpTransport& transport) : transport_(transport) {}

    /// Learns the resource size and whether byte ranges are honoured.
    /// Sends a HEAD; servers rejecting HEAD with 405/501 get a GET whose body
    /// is dropped right after the headers. Throws ProbeError when the server is
    /// unreachable or answers with an error status.
    [[nodiscard]] ResourceInfo probe(const std::string& url);

    [[nodiscard]] static ResourceInfo interpret(const ResponseHead& head);

private:
    [[nodiscard]] ResponseHead headViaGet(const std::string& url);

    HttpTransport& transport_;
};

} // namespace rangeget
