#include "bench_options.h"
#include <iostream>
#include <stdexcept>

namespace {

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(flag);
        }
        return result;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + flag + ": " + value);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("expected an integer for " + flag + ": " + value);
    }
}

double parseDouble(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(flag);
        }
        return result;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + flag + ": " + value);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("expected a number for " + flag + ": " + value);
    }
}

}  // namespace

void printBenchUsage() {
    std::cout << "Usage: chunk_pipeline_bench [--config FILE] [--rounds N] [--requests N]\n"
              << "                            [--radius R] [--fixed-load CPU MEM] [--debug]\n";
}

BenchOptions parseBenchOptions(int argc, const char* const argv[]) {
    BenchOptions options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto needValues = [&](int count) {
            if (i + count >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
        };

        if (arg == "--config") {
            needValues(1);
            options.configPath = argv[++i];
        } else if (arg == "--rounds") {
            needValues(1);
            options.rounds = parseInt(arg, argv[++i]);
        } else if (arg == "--requests") {
            needValues(1);
            options.requestsPerRound = parseInt(arg, argv[++i]);
        } else if (arg == "--radius") {
            needValues(1);
            options.radius = parseInt(arg, argv[++i]);
        } else if (arg == "--fixed-load") {
            needValues(2);
            options.fixedLoad = true;
            options.fixedCpu = parseDouble(arg, argv[++i]);
            options.fixedMem = parseDouble(arg, argv[++i]);
        } else if (arg == "-debug" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw std::invalid_argument("unknown argument " + arg);
        }
    }
    return options;
}
