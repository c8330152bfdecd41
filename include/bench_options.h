/**
 * @file bench_options.h
 * @brief Command line options for chunk_pipeline_bench
 */

#pragma once

#include <string>

struct BenchOptions {
    std::string configPath = "config.ini";
    int rounds = 20;
    int requestsPerRound = 2000;
    int radius = 4;
    bool fixedLoad = false;
    double fixedCpu = 0.0;
    double fixedMem = 0.0;
    bool debug = false;
    bool help = false;
};

/**
 * @brief Parses the bench arguments
 *
 * @throws std::invalid_argument for unknown flags, missing values, and values
 *         that are not numbers or do not fit the option's type
 */
BenchOptions parseBenchOptions(int argc, const char* const argv[]);

void printBenchUsage();
