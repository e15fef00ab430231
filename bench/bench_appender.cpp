#include <benchmark/benchmark.h>
#include <cstdio>
#include <string>
#include <vector>
#include "rollout.hpp"

#include <unistd.h>

static std::string benchDir(const std::string& suffix) {
    std::string dir = "/tmp/rollout_bench_" + std::to_string(getpid()) + "_" + suffix;
    rollout::detail::mkdirRecursive(dir);
    return dir;
}

static void removeDir(const std::string& dir) {
    std::vector<std::string> names;
    if (rollout::detail::listDirectory(dir, names)) {
        for (size_t i = 0; i < names.size(); ++i) {
            std::remove(rollout::detail::joinPath(dir, names[i]).c_str());
        }
    }
    rmdir(dir.c_str());
}

static std::string makeLines(size_t count, size_t width) {
    std::string line(width - 1, 'x');
    line += '\n';
    std::string out;
    out.reserve(count * width);
    for (size_t i = 0; i < count; ++i) out += line;
    return out;
}

// ---------------------------------------------------------------------------
// BM_Appender_NoRotation
// Threshold never reached: cost of append + flush per chunk.
// ---------------------------------------------------------------------------
static void BM_Appender_NoRotation(benchmark::State& state) {
    std::string dir = benchDir("norot");
    std::string chunk = makeLines(static_cast<size_t>(state.range(0)) / 64, 64);
    {
        rollout::Logger logger(rollout::LogLevel::FATAL, false);
        rollout::Appender appender(
            rollout::JournalConfig::in(dir).prefix("bench").maxSize(1ULL << 40), logger);
        appender.start();

        for (auto _ : state) {
            appender.feed(chunk.data(), chunk.size());
        }
        state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(chunk.size()));
    }
    removeDir(dir);
}
BENCHMARK(BM_Appender_NoRotation)->Arg(64)->Arg(4096)->Arg(65536);

// ---------------------------------------------------------------------------
// BM_Appender_Rotating
// Small threshold so most chunks trigger a rename + retention sweep.
// ---------------------------------------------------------------------------
static void BM_Appender_Rotating(benchmark::State& state) {
    std::string dir = benchDir("rot");
    std::string chunk = makeLines(16, 64);
    {
        rollout::Logger logger(rollout::LogLevel::FATAL, false);
        rollout::Appender appender(
            rollout::JournalConfig::in(dir).prefix("bench").maxSize(512)
                .keep(static_cast<unsigned int>(state.range(0))),
            logger);
        appender.start();

        for (auto _ : state) {
            appender.feed(chunk.data(), chunk.size());
        }
        state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(chunk.size()));
        state.counters["rotations"] = static_cast<double>(appender.stats().rotations);
    }
    removeDir(dir);
}
BENCHMARK(BM_Appender_Rotating)->Arg(1)->Arg(10)->Arg(100);

// ---------------------------------------------------------------------------
// BM_SequenceAllocator_NextIndex
// Directory scan with N rotated files already present.
// ---------------------------------------------------------------------------
static void BM_SequenceAllocator_NextIndex(benchmark::State& state) {
    std::string dir = benchDir("seq");
    for (unsigned int i = 1; i <= static_cast<unsigned int>(state.range(0)); ++i) {
        std::FILE* f = std::fopen(rollout::detail::joinPath(
            dir, rollout::SequenceAllocator::rotatedName("bench", i)).c_str(), "w");
        if (f) std::fclose(f);
    }
    rollout::JournalConfig config = rollout::JournalConfig::in(dir).prefix("bench");

    for (auto _ : state) {
        benchmark::DoNotOptimize(rollout::SequenceAllocator::nextIndex(config));
    }
    removeDir(dir);
}
BENCHMARK(BM_SequenceAllocator_NextIndex)->Arg(10)->Arg(100)->Arg(999);

// ---------------------------------------------------------------------------
// BM_Logger_NullSink
// Diagnostics baseline: template binding only, entry discarded.
// ---------------------------------------------------------------------------
static void BM_Logger_NullSink(benchmark::State& state) {
    rollout::Logger logger(rollout::LogLevel::TRACE, false);
    logger.addSink<rollout::NullSink>();

    for (auto _ : state) {
        logger.info("Rotated journal to {file} ({bytes} bytes)", "bench.42.log", 10485760);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Logger_NullSink);

// ---------------------------------------------------------------------------
// BM_Logger_Json
// Template binding plus JSON rendering of every entry.
// ---------------------------------------------------------------------------
static void BM_Logger_Json(benchmark::State& state) {
    rollout::Logger logger(rollout::LogLevel::TRACE, false);
    size_t bytes = 0;
    logger.addCustomSink(rollout::detail::make_unique<rollout::CallbackSink>(
        rollout::CallbackSink::StringCallback([&bytes](const std::string& s) { bytes += s.size(); }),
        rollout::detail::make_unique<rollout::JsonFormatter>()));

    for (auto _ : state) {
        logger.info("Rotated journal to {file} ({bytes} bytes)", "bench.42.log", 10485760);
        benchmark::ClobberMemory();
    }
    benchmark::DoNotOptimize(bytes);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Logger_Json);
