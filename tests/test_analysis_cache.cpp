/**
 * Segue Engine - Analysis Cache Tests
 * Tests for the SQLite store, content hashing and the analysis service
 */

#include "segue/types.h"
#include "../src/core/store.h"
#include "../src/core/content_hash.h"
#include "../src/core/analysis_service.h"

#include <iostream>
#include <cassert>
#include <cmath>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace segue;
namespace fs = std::filesystem;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(float actual, float expected, float tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

// Scratch directory removed when the test ends
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
            ("segue_test_" + std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()) +
             "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.string();
    }

    std::string path(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

static AudioBuffer make_tone(float duration) {
    AudioBuffer buf;
    buf.sample_rate = 44100;
    buf.channels = 2;
    size_t frames = static_cast<size_t>(duration * buf.sample_rate);
    buf.samples.resize(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        float v = 0.3f * std::sin(2.0f * static_cast<float>(M_PI) * 440.0f * i / buf.sample_rate);
        buf.samples[i * 2] = v;
        buf.samples[i * 2 + 1] = v;
    }
    return buf;
}

static CachedAnalysis make_entry(const std::string& path, const std::string& hash,
                                 int64_t computed_at, int64_t size) {
    CachedAnalysis entry;
    entry.path = path;
    entry.file_size = size;
    entry.last_modified = 42;
    entry.result.content_hash = hash;
    entry.result.computed_at = computed_at;
    entry.result.loudness.integrated = -12.5f;
    entry.result.loudness.gain_adjustment = -5.5f;
    entry.result.silence.start_silence = 0.75f;
    entry.result.silence.has_gapless_markers = true;
    entry.result.silence.encoder_delay = 1105;
    entry.result.beats.bpm = 128.0f;
    entry.result.beats.confidence = 0.8f;
    entry.result.beats.beats = {0.1f, 0.57f, 1.04f, 1.51f, 1.98f};
    entry.result.beats.downbeats = {0.1f, 1.98f};
    entry.result.beats.time_signature = "3/4";
    return entry;
}

// Decode collaborator that counts invocations
struct CountingDecoder {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
    int delay_ms = 0;

    DecodeFunction function() const {
        auto counter = calls;
        int delay = delay_ms;
        return [counter, delay](const std::string& locator) -> Result<AudioBuffer> {
            counter->fetch_add(1);
            if (delay > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
            if (locator.find("broken") != std::string::npos) {
                return "Unsupported stream";
            }
            if (locator.find("throws") != std::string::npos) {
                throw std::runtime_error("decoder crashed");
            }
            return make_tone(3.0f);
        };
    }
};

static AnalysisServiceConfig memory_config() {
    AnalysisServiceConfig config;
    config.cache_path = ":memory:";
    config.inflight_grace_ms = 0;
    return config;
}

/* ============================================================================
 * Store
 * ============================================================================ */

TEST(store_upsert_and_lookup) {
    AnalysisStore store(":memory:");
    assert(store.is_open());

    auto written = store.upsert(make_entry("/music/a.flac", "hash-a", 1000, 10));
    assert(written.ok());

    auto by_path = store.get_by_path("/music/a.flac");
    assert(by_path.has_value());
    assert(by_path->file_size == 10);
    assert(by_path->last_modified == 42);
    assert(by_path->result.content_hash == "hash-a");
    assert(by_path->result.computed_at == 1000);
    assert_near(by_path->result.loudness.integrated, -12.5f, 1e-5f, "integrated");
    assert_near(by_path->result.silence.start_silence, 0.75f, 1e-5f, "start silence");
    assert(by_path->result.silence.has_gapless_markers);
    assert(by_path->result.silence.encoder_delay == 1105);
    assert_near(by_path->result.beats.bpm, 128.0f, 1e-5f, "bpm");
    assert(by_path->result.beats.beats.size() == 5);
    assert_near(by_path->result.beats.beats[1], 0.57f, 1e-6f, "beat position");
    assert(by_path->result.beats.downbeats.size() == 2);
    assert(by_path->result.beats.time_signature == "3/4");

    auto by_hash = store.get_by_hash("hash-a");
    assert(by_hash.has_value());
    assert(by_hash->path == "/music/a.flac");

    assert(!store.get_by_path("/music/missing.flac").has_value());
    assert(!store.get_by_hash("nope").has_value());
    assert(!store.get_by_hash("").has_value());
}

TEST(store_replaces_by_path) {
    AnalysisStore store(":memory:");
    assert(store.upsert(make_entry("/music/a.flac", "hash-a", 1000, 10)).ok());
    assert(store.upsert(make_entry("/music/a.flac", "hash-b", 2000, 30)).ok());

    assert(store.stats().entries == 1);
    auto row = store.get_by_path("/music/a.flac");
    assert(row.has_value());
    assert(row->result.content_hash == "hash-b");
    assert(!store.get_by_hash("hash-a").has_value());
}

TEST(store_hash_lookup_prefers_newest) {
    AnalysisStore store(":memory:");
    assert(store.upsert(make_entry("/old/a.flac", "same", 1000, 10)).ok());
    assert(store.upsert(make_entry("/new/a.flac", "same", 3000, 10)).ok());

    auto row = store.get_by_hash("same");
    assert(row.has_value());
    assert(row->path == "/new/a.flac");
}

TEST(store_stats_and_retention) {
    AnalysisStore store(":memory:");

    CacheStats empty = store.stats();
    assert(empty.entries == 0);
    assert(empty.total_size_bytes == 0);

    assert(store.upsert(make_entry("/a", "h1", 1000, 10)).ok());
    assert(store.upsert(make_entry("/b", "h2", 5000, 20)).ok());

    CacheStats stats = store.stats();
    assert(stats.entries == 2);
    assert(stats.total_size_bytes == 30);
    assert(stats.oldest == 1000);
    assert(stats.newest == 5000);

    assert(store.delete_older_than(2000) == 1);
    assert(!store.get_by_path("/a").has_value());
    assert(store.get_by_path("/b").has_value());

    assert(store.clear());
    assert(store.stats().entries == 0);
}

TEST(store_unopenable_path) {
    AnalysisStore store("/nonexistent-dir/segue/cache.db");
    assert(!store.is_open());
    assert(!store.error().empty());
    assert(store.upsert(make_entry("/a", "h", 1, 1)).failed());
    assert(!store.get_by_path("/a").has_value());
    assert(store.delete_older_than(0) == -1);
}

/* ============================================================================
 * Content Hash
 * ============================================================================ */

TEST(hash_identical_content) {
    TempDir dir;
    std::string a = dir.write("a.bin", "the same bytes");
    std::string b = dir.write("b.bin", "the same bytes");
    std::string c = dir.write("c.bin", "different bytes");

    auto ha = hash_file_prefix(a);
    auto hb = hash_file_prefix(b);
    auto hc = hash_file_prefix(c);
    assert(ha.ok() && hb.ok() && hc.ok());
    assert(ha.value().size() == 64);
    assert(ha.value() == hb.value());
    assert(ha.value() != hc.value());
}

TEST(hash_reads_only_prefix) {
    TempDir dir;
    std::string head(100, 'x');
    std::string a = dir.write("a.bin", head + "tail one");
    std::string b = dir.write("b.bin", head + "tail two");

    auto ha = hash_file_prefix(a, 100);
    auto hb = hash_file_prefix(b, 100);
    assert(ha.ok() && hb.ok());
    assert(ha.value() == hb.value());

    assert(hash_file_prefix(a).value() != hash_file_prefix(b).value());
}

TEST(hash_known_digest) {
    TempDir dir;
    std::string file = dir.write("abc.txt", "abc");
    auto h = hash_file_prefix(file);
    assert(h.ok());
    assert(h.value() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hash_missing_file) {
    auto h = hash_file_prefix("/nonexistent/segue/file.mp3");
    assert(h.failed());
    assert(!h.error().empty());
}

/* ============================================================================
 * Analysis Service
 * ============================================================================ */

TEST(service_analyzes_and_caches) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 1");

    CountingDecoder decoder;
    AnalysisService service(memory_config(), decoder.function());
    assert(service.has_store());

    AnalysisResult first = service.analyze(track);
    assert(!first.is_default());
    assert(first.content_hash.size() == 64);
    assert(first.computed_at > 0);
    assert(first.loudness.integrated > -70.0f);
    assert(decoder.calls->load() == 1);

    AnalysisResult second = service.analyze(track);
    assert(decoder.calls->load() == 1);
    assert(second.content_hash == first.content_hash);
    assert(second.computed_at == first.computed_at);

    CacheStats stats = service.cache_stats();
    assert(stats.entries == 1);
    assert(stats.total_size_bytes == static_cast<int64_t>(std::string("fake audio payload 1").size()));
}

TEST(service_concurrent_requests_share_work) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 2");

    CountingDecoder decoder;
    decoder.delay_ms = 300;
    AnalysisService service(memory_config(), decoder.function());

    AnalysisResult a, b;
    std::thread t1([&]() { a = service.analyze(track); });
    std::thread t2([&]() { b = service.analyze(track); });
    t1.join();
    t2.join();

    assert(decoder.calls->load() == 1);
    assert(!a.is_default());
    assert(a.content_hash == b.content_hash);
    assert(a.computed_at == b.computed_at);
}

TEST(service_moved_file_hits_by_hash) {
    TempDir dir;
    std::string original = dir.write("original.flac", "fake audio payload 3");

    CountingDecoder decoder;
    AnalysisService service(memory_config(), decoder.function());

    AnalysisResult first = service.analyze(original);
    assert(decoder.calls->load() == 1);

    std::string moved = dir.path("renamed.flac");
    fs::rename(original, moved);

    AnalysisResult second = service.analyze(moved);
    assert(decoder.calls->load() == 1);
    assert(second.content_hash == first.content_hash);
    assert_near(second.loudness.integrated, first.loudness.integrated, 1e-4f, "copied metrics");

    // The row was re-keyed under the new path
    assert(service.cache_stats().entries == 2);
    service.analyze(moved);
    assert(decoder.calls->load() == 1);
}

TEST(service_modified_file_recomputes) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 4");

    CountingDecoder decoder;
    AnalysisService service(memory_config(), decoder.function());

    AnalysisResult first = service.analyze(track);
    dir.write("track.flac", "fake audio payload 4, re-encoded with more bytes");
    AnalysisResult second = service.analyze(track);

    assert(decoder.calls->load() == 2);
    assert(second.content_hash != first.content_hash);
}

TEST(service_failures_yield_defaults) {
    TempDir dir;
    std::string broken = dir.write("broken.flac", "garbage 1");
    std::string throws = dir.write("throws.flac", "garbage 2");

    CountingDecoder decoder;
    AnalysisService service(memory_config(), decoder.function());

    AnalysisResult r1 = service.analyze(broken);
    assert(r1.is_default());
    assert_near(r1.loudness.integrated, -23.0f, 1e-5f, "default loudness");
    assert_near(r1.beats.bpm, 120.0f, 1e-5f, "default bpm");

    AnalysisResult r2 = service.analyze(throws);
    assert(r2.is_default());

    AnalysisResult r3 = service.analyze(dir.path("missing.flac"));
    assert(r3.is_default());
    assert(decoder.calls->load() == 2);

    // Failures are not cached
    assert(service.cache_stats().entries == 0);
}

TEST(service_without_decoder) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 5");

    AnalysisService service(memory_config(), DecodeFunction());
    assert(service.analyze(track).is_default());
}

TEST(service_without_store) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 6");

    AnalysisServiceConfig config = memory_config();
    config.cache_path.clear();

    CountingDecoder decoder;
    AnalysisService service(config, decoder.function());
    assert(!service.has_store());

    assert(!service.analyze(track).is_default());
    assert(!service.analyze(track).is_default());
    assert(decoder.calls->load() == 2);
    assert(service.cache_stats().entries == 0);
    assert(service.prune_expired() == 0);
}

TEST(service_clear_cache) {
    TempDir dir;
    std::string track = dir.write("track.flac", "fake audio payload 7");

    CountingDecoder decoder;
    AnalysisService service(memory_config(), decoder.function());

    service.analyze(track);
    assert(service.cache_stats().entries == 1);

    assert(service.clear_cache());
    assert(service.cache_stats().entries == 0);

    service.analyze(track);
    assert(decoder.calls->load() == 2);
}

TEST(service_async_and_batch) {
    TempDir dir;
    std::vector<std::string> tracks;
    for (int i = 0; i < 5; ++i) {
        tracks.push_back(dir.write("t" + std::to_string(i) + ".flac",
                                   "fake audio payload batch " + std::to_string(i)));
    }
    tracks.push_back(dir.path("missing.flac"));

    CountingDecoder decoder;
    auto service = std::make_shared<AnalysisService>(memory_config(), decoder.function());

    auto pending = service->analyze_async(tracks[0]);
    AnalysisResult async_result = pending.get();
    assert(!async_result.is_default());

    std::vector<AnalysisResult> results = service->analyze_batch(tracks);
    assert(results.size() == tracks.size());
    for (size_t i = 0; i < 5; ++i) {
        assert(!results[i].is_default());
        auto expected = hash_file_prefix(tracks[i]);
        assert(expected.ok());
        assert(results[i].content_hash == expected.value());
    }
    assert(results[5].is_default());
    assert(decoder.calls->load() == 5);
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "Segue Engine - Analysis Cache Tests\n";
    std::cout << "===================================\n\n";

    std::cout << "--- Store ---\n";
    RUN_TEST(store_upsert_and_lookup);
    RUN_TEST(store_replaces_by_path);
    RUN_TEST(store_hash_lookup_prefers_newest);
    RUN_TEST(store_stats_and_retention);
    RUN_TEST(store_unopenable_path);

    std::cout << "\n--- Content Hash ---\n";
    RUN_TEST(hash_identical_content);
    RUN_TEST(hash_reads_only_prefix);
    RUN_TEST(hash_known_digest);
    RUN_TEST(hash_missing_file);

    std::cout << "\n--- Analysis Service ---\n";
    RUN_TEST(service_analyzes_and_caches);
    RUN_TEST(service_concurrent_requests_share_work);
    RUN_TEST(service_moved_file_hits_by_hash);
    RUN_TEST(service_modified_file_recomputes);
    RUN_TEST(service_failures_yield_defaults);
    RUN_TEST(service_without_decoder);
    RUN_TEST(service_without_store);
    RUN_TEST(service_clear_cache);
    RUN_TEST(service_async_and_batch);

    std::cout << "\n";
    if (failed_tests > 0) {
        std::cout << failed_tests << " test(s) FAILED\n";
        return 1;
    }
    std::cout << "All analysis cache tests passed!\n";
    return 0;
}
