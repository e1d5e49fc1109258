/**
 * Segue Engine - Analysis Cache & Orchestrator Implementation
 */

#include "analysis_service.h"
#include "content_hash.h"
#include "utils.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iterator>
#include <thread>

namespace segue {

namespace {

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

} // namespace

AnalysisService::AnalysisService(AnalysisServiceConfig config, DecodeFunction decode)
    : config_(std::move(config))
    , decode_(std::move(decode)) {
    if (!config_.cache_path.empty()) {
        store_ = std::make_unique<AnalysisStore>(config_.cache_path);
        if (!store_->is_open()) {
            std::fprintf(stderr, "[AnalysisService] Cache unavailable, results will not persist: %s\n",
                         store_->error().c_str());
            store_.reset();
        }
    }

    int removed = prune_expired();
    if (removed > 0) {
        std::fprintf(stderr, "[AnalysisService] Pruned %d expired cache entries\n", removed);
    }
}

AnalysisService::~AnalysisService() = default;

/* ============================================================================
 * In-flight de-duplication
 * ============================================================================ */

void AnalysisService::prune_inflight_locked(std::chrono::steady_clock::time_point now) {
    auto grace = std::chrono::milliseconds(config_.inflight_grace_ms);
    for (auto it = inflight_.begin(); it != inflight_.end();) {
        if (it->second.resolved && now - it->second.resolved_at >= grace) {
            it = inflight_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_future<AnalysisResult> AnalysisService::claim(const std::string& locator,
                                                          std::shared_ptr<Promise>& owner) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    prune_inflight_locked(std::chrono::steady_clock::now());

    auto it = inflight_.find(locator);
    if (it != inflight_.end()) {
        return it->second.result;
    }

    owner = std::make_shared<Promise>();
    InFlight entry;
    entry.result = owner->get_future().share();
    inflight_.emplace(locator, entry);
    return entry.result;
}

void AnalysisService::fulfil(const std::string& locator, const std::shared_ptr<Promise>& owner) {
    AnalysisResult result;
    try {
        result = compute(locator);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[AnalysisService] Analysis of %s threw: %s\n", locator.c_str(), e.what());
        result = failure_result();
    }
    owner->set_value(result);

    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = inflight_.find(locator);
    if (it != inflight_.end()) {
        it->second.resolved = true;
        it->second.resolved_at = std::chrono::steady_clock::now();
    }
}

/* ============================================================================
 * Public interface
 * ============================================================================ */

AnalysisResult AnalysisService::analyze(const std::string& locator) {
    std::shared_ptr<Promise> owner;
    std::shared_future<AnalysisResult> pending = claim(locator, owner);
    if (owner) {
        fulfil(locator, owner);
    }
    return pending.get();
}

std::shared_future<AnalysisResult> AnalysisService::analyze_async(const std::string& locator) {
    std::shared_ptr<Promise> owner;
    std::shared_future<AnalysisResult> pending = claim(locator, owner);
    if (!owner) {
        return pending;
    }

    std::shared_ptr<AnalysisService> self = weak_from_this().lock();
    if (!self) {
        fulfil(locator, owner);
        return pending;
    }

    // The worker keeps the service alive until the result is delivered
    std::thread([self, locator, owner]() {
        self->fulfil(locator, owner);
    }).detach();
    return pending;
}

std::vector<AnalysisResult> AnalysisService::analyze_batch(const std::vector<std::string>& locators) {
    std::vector<AnalysisResult> results;
    results.reserve(locators.size());

    size_t workers = std::max(1u, std::thread::hardware_concurrency());
    for (size_t start = 0; start < locators.size(); start += workers) {
        size_t end = std::min(locators.size(), start + workers);

        std::vector<std::future<AnalysisResult>> batch;
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async,
                [this, &locators, i]() { return analyze(locators[i]); }));
        }
        for (auto& f : batch) {
            results.push_back(f.get());
        }
    }
    return results;
}

bool AnalysisService::clear_cache() {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        for (auto it = inflight_.begin(); it != inflight_.end();) {
            it = it->second.resolved ? inflight_.erase(it) : std::next(it);
        }
    }

    if (!store_) return true;

    std::lock_guard<std::mutex> lock(write_mutex_);
    bool ok = store_->clear();
    if (!ok) {
        std::fprintf(stderr, "[AnalysisService] Failed to clear cache: %s\n", store_->error().c_str());
    }
    return ok;
}

CacheStats AnalysisService::cache_stats() {
    return store_ ? store_->stats() : CacheStats{};
}

int AnalysisService::prune_expired() {
    if (!store_ || config_.retention_days <= 0) return 0;

    int64_t cutoff = utils::current_timestamp_ms() - config_.retention_days * kMillisPerDay;
    std::lock_guard<std::mutex> lock(write_mutex_);
    int removed = store_->delete_older_than(cutoff);
    if (removed < 0) {
        std::fprintf(stderr, "[AnalysisService] Failed to prune expired entries\n");
        return 0;
    }
    return removed;
}

/* ============================================================================
 * Computation
 * ============================================================================ */

AnalysisResult AnalysisService::failure_result() const {
    AnalysisResult result;
    result.computed_at = utils::current_timestamp_ms();
    return result;
}

void AnalysisService::persist(const CachedAnalysis& entry) {
    if (!store_) return;

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto written = store_->upsert(entry);
    if (written.failed()) {
        std::fprintf(stderr, "[AnalysisService] Cache write failed for %s: %s\n",
                     entry.path.c_str(), written.error().c_str());
    }
}

AnalysisResult AnalysisService::compute(const std::string& locator) {
    auto identity = utils::file_identity(locator);
    if (!identity) {
        std::fprintf(stderr, "[AnalysisService] Cannot stat %s\n", locator.c_str());
        return failure_result();
    }

    if (store_) {
        auto cached = store_->get_by_path(locator);
        if (cached && cached->file_size == identity->size &&
            cached->last_modified == identity->modified_ms) {
            return cached->result;
        }
    }

    auto hash = hash_file_prefix(locator, config_.hash_prefix_bytes);
    if (hash.failed()) {
        std::fprintf(stderr, "[AnalysisService] %s\n", hash.error().c_str());
        return failure_result();
    }

    CachedAnalysis entry;
    entry.path = locator;
    entry.file_size = identity->size;
    entry.last_modified = identity->modified_ms;

    if (store_) {
        auto moved = store_->get_by_hash(hash.value());
        if (moved) {
            entry.result = moved->result;
            persist(entry);
            return entry.result;
        }
    }

    if (!decode_) {
        std::fprintf(stderr, "[AnalysisService] No decoder configured\n");
        return failure_result();
    }

    Result<AudioBuffer> audio = ResultError("Decode did not run");
    try {
        audio = decode_(locator);
    } catch (const std::exception& e) {
        audio = ResultError(std::string("Decoder threw: ") + e.what());
    }
    if (audio.failed()) {
        std::fprintf(stderr, "[AnalysisService] Decode failed for %s: %s\n",
                     locator.c_str(), audio.error().c_str());
        return failure_result();
    }

    TrackMetrics metrics = analyzer_.analyze(audio.value());

    entry.result.loudness = metrics.loudness;
    entry.result.silence = metrics.silence;
    entry.result.beats = metrics.beats;
    entry.result.content_hash = hash.value();
    entry.result.computed_at = utils::current_timestamp_ms();

    persist(entry);
    return entry.result;
}

} // namespace segue
