#include <gtest/gtest.h>
#include "codec/text_codec.hpp"
#include "concurrency/thread_pool.hpp"
#include "generator/bulk_generator.hpp"
#include "generator/generator.hpp"
#include "generator/namespaces.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef __linux__
#include <sys/utsname.h>
#endif

using namespace uuidpp;

namespace {

// Get CPU name/brand string
std::string getCpuBrandString() {
#ifdef __linux__
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.find("model name") != std::string::npos) {
            size_t colon = line.find(':');
            if (colon != std::string::npos && colon + 2 < line.size()) {
                return line.substr(colon + 2);
            }
        }
    }
#endif
    return "Unknown CPU";
}

nlohmann::json hardwareToJson() {
    nlohmann::json j;
#ifdef __linux__
    struct utsname info;
    if (uname(&info) == 0) {
        j["os"]["name"] = info.sysname;
        j["os"]["version"] = info.release;
        j["architecture"] = info.machine;
    }
#endif
    j["cpu"]["name"] = getCpuBrandString();
    j["cpu"]["cores_logical"] = std::thread::hardware_concurrency();
#ifdef NDEBUG
    j["build_type"] = "Release";
#else
    j["build_type"] = "Debug";
#endif
    return j;
}

std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

template<typename F>
int64_t timeMicros(F&& f) {
    auto start = std::chrono::high_resolution_clock::now();
    f();
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

double perSecond(size_t count, int64_t micros) {
    return micros > 0 ? (count * 1000000.0) / micros : 0.0;
}

} // namespace

// Test fixture for generation benchmarks
class GenerateBenchmarkTest : public ::testing::Test {
protected:
    static constexpr size_t NUM_UUIDS = 100000;

    Generator& generator_ = default_generator();

    void report(const std::string& label, size_t count, int64_t micros) {
        std::cout << label << ": " << micros / 1000.0 << " ms, "
                  << std::fixed << std::setprecision(0) << perSecond(count, micros)
                  << " uuids/sec" << std::endl;
    }
};

// Benchmark: Time-based generation on one thread
TEST_F(GenerateBenchmarkTest, VersionOneThroughput) {
    std::cout << "\n=== Version 1 Generation ===" << std::endl;

    Uuid last;
    int64_t micros = timeMicros([&]() {
        for (size_t i = 0; i < NUM_UUIDS; ++i) {
            last = generator_.new_v1();
        }
    });
    ASSERT_EQ(last.version(), 1u);

    report("v1", NUM_UUIDS, micros);
    RecordProperty("VersionOneUuidsPerSec", static_cast<int>(perSecond(NUM_UUIDS, micros)));
}

// Benchmark: Random generation on one thread
TEST_F(GenerateBenchmarkTest, VersionFourThroughput) {
    std::cout << "\n=== Version 4 Generation ===" << std::endl;

    Uuid last;
    int64_t micros = timeMicros([&]() {
        for (size_t i = 0; i < NUM_UUIDS; ++i) {
            last = generator_.new_v4();
        }
    });
    ASSERT_EQ(last.version(), 4u);

    report("v4", NUM_UUIDS, micros);
    RecordProperty("VersionFourUuidsPerSec", static_cast<int>(perSecond(NUM_UUIDS, micros)));
}

// Benchmark: Name-based generation
TEST_F(GenerateBenchmarkTest, NameBasedThroughput) {
    std::cout << "\n=== Version 3 / 5 Generation ===" << std::endl;
    const size_t count = NUM_UUIDS / 4;

    Uuid last;
    int64_t md5_micros = timeMicros([&]() {
        for (size_t i = 0; i < count; ++i) {
            last = generator_.new_v3(namespace_dns(), "host-" + std::to_string(i) + ".example.com");
        }
    });
    ASSERT_EQ(last.version(), 3u);

    int64_t sha1_micros = timeMicros([&]() {
        for (size_t i = 0; i < count; ++i) {
            last = generator_.new_v5(namespace_dns(), "host-" + std::to_string(i) + ".example.com");
        }
    });
    ASSERT_EQ(last.version(), 5u);

    report("v3", count, md5_micros);
    report("v5", count, sha1_micros);
}

// Benchmark: Text formatting and parsing
TEST_F(GenerateBenchmarkTest, TextCodecThroughput) {
    std::cout << "\n=== Text Codec ===" << std::endl;

    std::vector<std::string> texts;
    texts.reserve(NUM_UUIDS);
    int64_t format_micros = timeMicros([&]() {
        for (size_t i = 0; i < NUM_UUIDS; ++i) {
            texts.push_back(to_string(generator_.new_v4()));
        }
    });

    size_t parsed = 0;
    int64_t parse_micros = timeMicros([&]() {
        for (const auto& text : texts) {
            if (!from_string(text).is_nil()) {
                ++parsed;
            }
        }
    });
    ASSERT_EQ(parsed, NUM_UUIDS);

    report("generate + format", NUM_UUIDS, format_micros);
    report("parse", NUM_UUIDS, parse_micros);
}

// Benchmark: Bulk generation scaling with worker count, exported as JSON
TEST_F(GenerateBenchmarkTest, ThreadScaling) {
    std::cout << "\n=== Bulk Generation Thread Scaling ===" << std::endl;

    nlohmann::json results;
    results["metadata"]["timestamp"] = getCurrentTimestamp();
    results["metadata"]["hardware"] = hardwareToJson();
    results["metadata"]["num_uuids"] = NUM_UUIDS;

    nlohmann::json scaling = nlohmann::json::array();
    for (unsigned version : {1u, 4u}) {
        double baseline = 0.0;
        for (size_t threads : {1, 2, 4, 8}) {
            ThreadPool pool(threads);
            GenerationRequest request;
            request.version = version;
            request.count = NUM_UUIDS;

            std::vector<Uuid> uuids;
            int64_t micros = timeMicros([&]() {
                uuids = generate_bulk(generator_, request, pool);
            });
            ASSERT_EQ(uuids.size(), NUM_UUIDS);

            double throughput = perSecond(NUM_UUIDS, micros);
            if (threads == 1) {
                baseline = throughput;
            }

            nlohmann::json entry;
            entry["version"] = version;
            entry["num_threads"] = threads;
            entry["time_us"] = micros;
            entry["throughput_uuids_per_sec"] = throughput;
            entry["speedup"] = baseline > 0 ? throughput / baseline : 0.0;
            scaling.push_back(entry);

            std::cout << "  v" << version << ", " << threads << " threads: "
                      << std::fixed << std::setprecision(0) << throughput << " uuids/sec" << std::endl;
        }
    }
    results["thread_scaling"] = scaling;

    const std::string filename = "benchmark_generate_results.json";
    std::ofstream file(filename);
    if (file.is_open()) {
        file << results.dump(2) << std::endl;
        std::cout << "Results exported to: " << filename << std::endl;
    } else {
        std::cerr << "Failed to write results file: " << filename << std::endl;
    }
}
