#include "BatchJson.h"
#include "ConfigManager.h"
#include "DedupeEngine.h"
#include "DedupeErrors.h"
#include "ImageDecoder.h"
#include "ResultAssembler.h"

#include <getopt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

void usage(char const* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] request.json\n"
              << "  -c <file>   engine settings (default: " << cfg::defaultConfigPath() << ")\n"
              << "  -t <0..1>   similarity threshold override\n"
              << "  -o <file>   write result JSON to <file> instead of stdout\n"
              << "  -r          log a text report for every duplicate group\n"
              << "  -v          debug logging\n"
              << "  -h          this help\n";
}

} // namespace

int main(int argc, char* argv[])
{
    // logs go to stderr, result JSON to stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("ndfdetect"));

    std::string configPath = cfg::defaultConfigPath();
    std::string outPath;
    std::optional<double> threshold;
    bool report = false;
    bool verbose = false;

    int opt;
    while ((opt = getopt(argc, argv, "c:t:o:rvh")) != -1) {
        switch (opt) {
        case 'c':
            configPath = optarg;
            break;
        case 't':
            try {
                threshold = std::stod(optarg);
            } catch (std::exception const&) {
                std::cerr << "Invalid threshold: " << optarg << '\n';
                return 1;
            }
            break;
        case 'o':
            outPath = optarg;
            break;
        case 'r':
            report = true;
            break;
        case 'v':
            verbose = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 1;
        }
    }
    if (optind != argc - 1) {
        usage(argv[0]);
        return 1;
    }
    std::string const requestPath = argv[optind];

    EngineSettings settings;
    if (auto loaded = cfg::loadSettings(configPath))
        settings = *loaded;
    else
        spdlog::debug("[cfg] no settings at {}, using defaults", configPath);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(settings.logLevel));

    try {
        auto request = loadBatchRequest(requestPath);
        if (threshold)
            request.threshold = threshold;

        FfmpegImageDecoder decoder;
        DedupeEngine engine(settings, decoder);
        auto result = engine.run(request);

        if (report) {
            for (auto const& g : result.groups)
                spdlog::info("[report] confidence {:.3f}\n{}", g.confidence, formatGroupReport(g, request.files));
        }

        auto text = toJson(result).dump(2);
        if (outPath.empty()) {
            std::cout << text << '\n';
        } else {
            std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
            if (!(out << text << '\n')) {
                spdlog::error("Cannot write {}", outPath);
                return 3;
            }
        }
    } catch (BatchTooLargeError const& e) {
        spdlog::error("Batch rejected: {}", e.what());
        return 2;
    } catch (InvalidBatchError const& e) {
        spdlog::error("Batch rejected: {}", e.what());
        return 2;
    } catch (std::exception const& e) {
        spdlog::error("Unhandled exception: {}", e.what());
        return 3;
    }
    return 0;
}
