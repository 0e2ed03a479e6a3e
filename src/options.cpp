#include "rangeget/options.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/error.hpp"

#include <filesystem>
#include <string>

#include <fmt/format.h>

namespace rangeget {

namespace {

constexpr const char* kDefaultFileName = "index.html";

long parseInteger(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (consumed != value.size()) {
        throw UsageError(fmt::format("Invalid value for {}: {}", option, value));
    }
    return parsed;
}

} // namespace

Options parseOptions(int argc, const char* const* argv) {
    Options options;

    const auto requireValue = [&](int& index) -> std::string {
        if (index + 1 >= argc) {
            throw UsageError(fmt::format("Missing value for {}", argv[index]));
        }
        ++index;
        return argv[index];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (arg == "-t" || arg == "--threads") {
            const long threads = parseInteger(arg, requireValue(i));
            if (threads <= 0 || threads > static_cast<long>(kMaxThreads)) {
                throw UsageError(fmt::format("Thread count must be between 1 and {}", kMaxThreads));
            }
            options.threads = static_cast<std::uint32_t>(threads);
        } else if (arg == "-o" || arg == "--output") {
            options.output = requireValue(i);
            if (options.output->empty()) {
                throw UsageError("Output path must not be empty");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-A" || arg == "--user-agent") {
            options.transport.user_agent = requireValue(i);
        } else if (arg == "--connect-timeout") {
            const long seconds = parseInteger(arg, requireValue(i));
            if (seconds <= 0) {
                throw UsageError("Connect timeout must be positive");
            }
            options.transport.connect_timeout_seconds = seconds;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError(fmt::format("Unknown option: {}", arg));
        } else if (options.url.empty()) {
            options.url = arg;
        } else {
            throw UsageError(fmt::format("Unexpected argument: {}", arg));
        }
    }

    if (options.url.empty()) {
        throw UsageError("Missing URL");
    }
    return options;
}

std::string usage(std::string_view program) {
    return fmt::format(
        "Usage: {} [options] <url>\n"
        "Options:\n"
        "  -t, --threads <N>          Number of concurrent range requests (default: 2, max: {})\n"
        "  -o, --output <path>        Destination file (default: last URL path segment)\n"
        "  -v, --verbose              Show per-chunk progress and a transfer summary\n"
        "  -A, --user-agent <ua>      User-Agent header (default: curl/7.81.0)\n"
        "      --connect-timeout <s>  Connection timeout in seconds (default: 30)\n"
        "  -h, --help                 Show this message\n",
        program, kMaxThreads);
}

std::string outputNameFromUrl(const std::string& url) {
    detail::ensureCurlInitialized();
    detail::CurlUrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw Error("Failed to allocate URL handle");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        throw UsageError(fmt::format("Invalid URL: {}", url));
    }

    char* raw_path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &raw_path, CURLU_URLDECODE) != CURLUE_OK || !raw_path) {
        return kDefaultFileName;
    }
    const std::string path{raw_path};
    curl_free(raw_path);

    const auto slash = path.find_last_of('/');
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return kDefaultFileName;
    }
    return name;
}

std::string uniqueOutputPath(const std::string& candidate) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }

    const fs::path original{candidate};
    const fs::path parent = original.parent_path();
    const std::string stem = original.stem().string();
    const std::string extension = original.extension().string();

    for (unsigned index = 1;; ++index) {
        const fs::path next = parent / fmt::format("{}.{}{}", stem, index, extension);
        if (!fs::exists(next, ec)) {
            return next.string();
        }
    }
}

std::string resolveOutputPath(const Options& options) {
    if (options.output) {
        return *options.output;
    }
    return uniqueOutputPath(outputNameFromUrl(options.url));
}

} // namespace rangeget
