/**
 * Segue Engine - Analysis Cache & Orchestrator
 */

#ifndef SEGUE_ANALYSIS_SERVICE_H
#define SEGUE_ANALYSIS_SERVICE_H

#include "segue/types.h"
#include "store.h"
#include "../analyzer/analyzer.h"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace segue {

/**
 * Decode collaborator: full PCM extraction for a locator.
 */
using DecodeFunction = std::function<Result<AudioBuffer>(const std::string& locator)>;

struct AnalysisServiceConfig {
    std::string cache_path = "segue_cache.db";  // Empty disables persistence
    int retention_days = 30;
    size_t hash_prefix_bytes = 65536;
    int inflight_grace_ms = 100;
};

/**
 * Produces AnalysisResults for locators, keeping the expensive decode and
 * analysis off the playback path.
 *
 * Lookup order:
 *   1. In-flight request for the same locator (shared, not recomputed)
 *   2. Cache row for the locator whose size and mtime still match the file
 *   3. Cache row with the same content hash (a moved or renamed file);
 *      the row is copied under the new locator
 *   4. Decode + analyze, then persist
 *
 * Any failure yields a result built from analyzer defaults with an empty
 * content hash. Durable writes are serialized; reads are not.
 */
class AnalysisService : public std::enable_shared_from_this<AnalysisService> {
public:
    AnalysisService(AnalysisServiceConfig config, DecodeFunction decode);
    ~AnalysisService();

    // Non-copyable
    AnalysisService(const AnalysisService&) = delete;
    AnalysisService& operator=(const AnalysisService&) = delete;

    /**
     * Whether results are persisted (the cache database opened).
     */
    bool has_store() const { return store_ != nullptr; }

    /**
     * Analyze a locator, blocking until the result is available.
     * Concurrent calls for the same locator share one computation.
     */
    AnalysisResult analyze(const std::string& locator);

    /**
     * Start (or join) analysis of a locator on a background thread.
     * Runs synchronously when the service is not owned by a shared_ptr.
     */
    std::shared_future<AnalysisResult> analyze_async(const std::string& locator);

    /**
     * Analyze several locators concurrently. Results are in input order.
     */
    std::vector<AnalysisResult> analyze_batch(const std::vector<std::string>& locators);

    /**
     * Remove every persisted entry.
     */
    bool clear_cache();

    CacheStats cache_stats();

    /**
     * Remove entries older than the retention window.
     * @return Number of removed entries (0 without a store)
     */
    int prune_expired();

private:
    using Promise = std::promise<AnalysisResult>;

    struct InFlight {
        std::shared_future<AnalysisResult> result;
        bool resolved = false;
        std::chrono::steady_clock::time_point resolved_at;
    };

    // Join an existing request or register a new one; `owner` is set when
    // the caller is responsible for computing the result
    std::shared_future<AnalysisResult> claim(const std::string& locator,
                                             std::shared_ptr<Promise>& owner);
    void fulfil(const std::string& locator, const std::shared_ptr<Promise>& owner);
    void prune_inflight_locked(std::chrono::steady_clock::time_point now);

    AnalysisResult compute(const std::string& locator);
    AnalysisResult failure_result() const;
    void persist(const CachedAnalysis& entry);

    AnalysisServiceConfig config_;
    DecodeFunction decode_;
    Analyzer analyzer_;
    std::unique_ptr<AnalysisStore> store_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, InFlight> inflight_;

    std::mutex write_mutex_;            // One durable write in flight
};

} // namespace segue

#endif // SEGUE_ANALYSIS_SERVICE_H
