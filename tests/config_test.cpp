/**
 * @file config_test.cpp
 * @brief INI parsing, PipelineSettings repair and bench option tests
 */

#include "test_utils.h"
#include "bench_options.h"
#include "config.h"
#include "logger.h"
#include "pipeline_settings.h"
#include <cstdio>
#include <stdexcept>

// ============================================================
// Config Parsing
// ============================================================

TEST(ParsesSectionsCommentsAndTypes) {
    Config config;
    bool clean = config.loadFromString(
        "# leading comment\n"
        "[cache]\n"
        "capacity = 128   ; inline comment\n"
        "ttl_seconds = 2.5\n"
        "sweep_on_insert = off\n"
        "\n"
        "[logging]\n"
        "level = debug\n");

    ASSERT_TRUE(clean);
    ASSERT_EQ(config.getInt("cache", "capacity", 0), 128);
    ASSERT_NEAR(config.getDouble("cache", "ttl_seconds", 0.0), 2.5, 1e-9);
    ASSERT_FALSE(config.getBool("cache", "sweep_on_insert", true));
    ASSERT_EQ(config.getString("logging", "level"), std::string("debug"));
    ASSERT_FALSE(config.has("logging", "capacity"));
}

TEST(MalformedLinesAreReported) {
    Config config;
    bool clean = config.loadFromString(
        "orphan = 1\n"
        "[cache]\n"
        "this line has no separator\n"
        "capacity = lots\n");

    ASSERT_FALSE(clean);
    ASSERT_FALSE(config.has("", "orphan"));

    // Unparseable values fall back to the default
    ASSERT_EQ(config.getInt("cache", "capacity", 77), 77);
}

TEST(SaveAndReload) {
    const std::string path = "config_test_roundtrip.ini";

    Config original;
    original.setInt("concurrency", "max_parallelism", 12);
    original.setBool("scheduler", "neighbor_notifications", false);
    original.setString("blocks", "definitions", "assets/blocks.yaml");
    ASSERT_TRUE(original.saveToFile(path));

    Config reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    std::remove(path.c_str());

    ASSERT_EQ(reloaded.getInt("concurrency", "max_parallelism", 0), 12);
    ASSERT_FALSE(reloaded.getBool("scheduler", "neighbor_notifications", true));
    ASSERT_EQ(reloaded.getString("blocks", "definitions"), std::string("assets/blocks.yaml"));
}

TEST(MissingFileLeavesConfigEmpty) {
    Config config;
    ASSERT_FALSE(config.loadFromFile("/nonexistent/config.ini"));
    ASSERT_EQ(config.getInt("cache", "capacity", 5), 5);
}

// ============================================================
// PipelineSettings
// ============================================================

TEST(DefaultsWithoutConfig) {
    Config config;
    PipelineSettings settings = PipelineSettings::fromConfig(config);

    ASSERT_EQ(settings.cache.capacity, 512u);
    ASSERT_EQ(settings.cache.ttl.count(), 60000);
    ASSERT_EQ(settings.concurrency.minParallelism, 1u);
    ASSERT_EQ(settings.concurrency.maxParallelism, 8u);
    ASSERT_EQ(settings.concurrency.initialLimit, 4u);
    ASSERT_EQ(settings.scheduler.maxDerivedPasses, 4);
    ASSERT_TRUE(settings.scheduler.neighborNotifications);
    ASSERT_EQ(settings.logLevel, std::string("info"));
}

TEST(ValuesOverlayDefaults) {
    Config config;
    config.loadFromString(
        "[cache]\ncapacity = 2\nttl_seconds = 0.5\n"
        "[concurrency]\nmin_parallelism = 2\nmax_parallelism = 6\ninitial_limit = 3\n"
        "high_cpu = 0.9\nmax_consecutive_adjustments = 5\nsample_interval_ms = 250\n"
        "[scheduler]\nmax_derived_passes = 2\nneighbor_notifications = false\n");

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    ASSERT_EQ(settings.cache.capacity, 2u);
    ASSERT_EQ(settings.cache.ttl.count(), 500);
    ASSERT_EQ(settings.concurrency.minParallelism, 2u);
    ASSERT_EQ(settings.concurrency.maxParallelism, 6u);
    ASSERT_EQ(settings.concurrency.initialLimit, 3u);
    ASSERT_NEAR(settings.concurrency.highCpuThreshold, 0.9, 1e-9);
    ASSERT_EQ(settings.concurrency.maxConsecutiveAdjustments, 5);
    ASSERT_EQ(settings.concurrency.sampleInterval.count(), 250);
    ASSERT_EQ(settings.scheduler.maxDerivedPasses, 2);
    ASSERT_FALSE(settings.scheduler.neighborNotifications);
}

TEST(InvalidValuesAreRepaired) {
    Config config;
    config.loadFromString(
        "[cache]\ncapacity = -4\nttl_seconds = -1\n"
        "[concurrency]\nmin_parallelism = 9\nmax_parallelism = 3\ninitial_limit = 50\n"
        "high_cpu = 1.7\nlow_mem = 0.95\nhigh_mem = 0.8\nsample_interval_ms = 1\n"
        "[scheduler]\nmax_derived_passes = 0\n");

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    ASSERT_EQ(settings.cache.capacity, 0u);
    ASSERT_EQ(settings.cache.ttl.count(), 0);

    // min > max is swapped, initial clamped into the repaired range
    ASSERT_EQ(settings.concurrency.minParallelism, 3u);
    ASSERT_EQ(settings.concurrency.maxParallelism, 9u);
    ASSERT_EQ(settings.concurrency.initialLimit, 9u);

    ASSERT_NEAR(settings.concurrency.highCpuThreshold, 1.0, 1e-9);
    ASSERT_NEAR(settings.concurrency.lowMemThreshold, 0.8, 1e-9);
    ASSERT_EQ(settings.concurrency.sampleInterval.count(), 10);
    ASSERT_EQ(settings.scheduler.maxDerivedPasses, 1);
}

TEST(OversizedTtlIsCapped) {
    Config config;
    config.loadFromString("[cache]\nttl_seconds = 1e30\n");

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    ASSERT_EQ(settings.cache.ttl.count(), 30LL * 24 * 3600 * 1000);

    Config notANumber;
    notANumber.loadFromString("[cache]\nttl_seconds = nan\n");
    ASSERT_EQ(PipelineSettings::fromConfig(notANumber).cache.ttl.count(), 0);
}

// ============================================================
// Bench Options
// ============================================================

TEST(BenchOptionsParse) {
    const char* argv[] = {"bench", "--rounds", "3", "--radius", "2", "--fixed-load", "0.25", "0.5", "--debug"};
    BenchOptions options = parseBenchOptions(9, argv);

    ASSERT_EQ(options.rounds, 3);
    ASSERT_EQ(options.radius, 2);
    ASSERT_EQ(options.requestsPerRound, 2000);
    ASSERT_TRUE(options.fixedLoad);
    ASSERT_NEAR(options.fixedCpu, 0.25, 1e-9);
    ASSERT_NEAR(options.fixedMem, 0.5, 1e-9);
    ASSERT_TRUE(options.debug);
    ASSERT_FALSE(options.help);
}

TEST(BadBenchArgumentsAreInvalid) {
    // Every malformed value reports std::invalid_argument, including overflow
    const char* overflowInt[] = {"bench", "--rounds", "99999999999999999999"};
    ASSERT_THROWS(parseBenchOptions(3, overflowInt), std::invalid_argument);

    const char* overflowDouble[] = {"bench", "--fixed-load", "1e999", "0.5"};
    ASSERT_THROWS(parseBenchOptions(4, overflowDouble), std::invalid_argument);

    const char* notANumber[] = {"bench", "--requests", "many"};
    ASSERT_THROWS(parseBenchOptions(3, notANumber), std::invalid_argument);

    const char* trailing[] = {"bench", "--radius", "4x"};
    ASSERT_THROWS(parseBenchOptions(3, trailing), std::invalid_argument);

    const char* missing[] = {"bench", "--fixed-load", "0.5"};
    ASSERT_THROWS(parseBenchOptions(3, missing), std::invalid_argument);

    const char* unknown[] = {"bench", "--verbose"};
    ASSERT_THROWS(parseBenchOptions(2, unknown), std::invalid_argument);
}

// ============================================================
// Logger
// ============================================================

TEST(LogLevelNames) {
    ASSERT_TRUE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parseLevel("WARNING") == LogLevel::WARNING);
    ASSERT_TRUE(Logger::parseLevel("error") == LogLevel::ERROR);
    ASSERT_TRUE(Logger::parseLevel("chatty", LogLevel::INFO) == LogLevel::INFO);
}

int main() {
    try {
        std::cout << "========================================\n";
        std::cout << "CONFIG TESTS\n";
        std::cout << "========================================\n\n";

        Logger::setMinLevel(LogLevel::ERROR);
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
