#include "rangeget/coordinator.hpp"
#include "rangeget/curl_transport.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/error.hpp"
#include "rangeget/log.hpp"
#include "rangeget/options.hpp"
#include "rangeget/progress_panel.hpp"
#include "rangeget/report.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

} // namespace

int main(int argc, char** argv) {
    rangeget::Options options;
    try {
        options = rangeget::parseOptions(argc, argv);
    } catch (const rangeget::UsageError& ex) {
        std::cerr << ex.what() << '\n' << rangeget::usage(argv[0]);
        return kExitUsage;
    }
    if (options.show_help) {
        std::cout << rangeget::usage(argv[0]);
        return kExitSuccess;
    }

    try {
        rangeget::log::setup(options.verbose);
        rangeget::detail::ensureCurlInitialized();

        const std::string destination = rangeget::resolveOutputPath(options);
        auto transport = std::make_shared<rangeget::CurlTransport>(options.transport);
        rangeget::Coordinator coordinator({options.url, destination, options.threads}, transport);
        if (options.verbose) {
            coordinator.subscribe(std::make_shared<rangeget::ProgressPanel>(std::cout, destination));
        }

        const auto started = std::chrono::steady_clock::now();
        const auto outcome = coordinator.run();
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

        if (!outcome.succeeded()) {
            std::cerr << rangeget::formatFailureReport(outcome, destination);
            return kExitFailure;
        }

        if (options.verbose) {
            std::cout << rangeget::formatSummary(outcome.total_bytes_written, elapsed) << '\n';
        }
        std::cout << "Downloaded successfully: " << destination << std::endl;
        return kExitSuccess;
    } catch (const rangeget::UsageError& ex) {
        std::cerr << ex.what() << '\n' << rangeget::usage(argv[0]);
        return kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitFailure;
    }
}
