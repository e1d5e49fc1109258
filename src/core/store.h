/**
 * Segue Engine - Analysis Cache Store
 */

#ifndef SEGUE_STORE_H
#define SEGUE_STORE_H

#include "segue/types.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>

namespace segue {

/**
 * One cached analysis row: the result plus the file identity it was
 * computed for.
 */
struct CachedAnalysis {
    std::string path;
    AnalysisResult result;
    int64_t file_size = 0;
    int64_t last_modified = 0;          // Milliseconds since epoch
};

/**
 * SQLite-based durable storage for analysis results.
 * Rows are keyed by file path and indexed by content hash, so an entry can
 * be found again after the file is moved.
 *
 * The connection is opened in serialized mode; callers may read from any
 * thread. Writers are expected to serialize themselves.
 */
class AnalysisStore {
public:
    explicit AnalysisStore(const std::string& db_path);
    ~AnalysisStore();

    // Non-copyable
    AnalysisStore(const AnalysisStore&) = delete;
    AnalysisStore& operator=(const AnalysisStore&) = delete;

    // Move constructible
    AnalysisStore(AnalysisStore&&) noexcept;
    AnalysisStore& operator=(AnalysisStore&&) noexcept;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /* ========================================================================
     * Lookup
     * ======================================================================== */

    /**
     * Get the entry stored under a file path.
     * The caller validates size/mtime against the file on disk.
     */
    std::optional<CachedAnalysis> get_by_path(const std::string& path);

    /**
     * Get the newest entry with the given content hash, whatever its path.
     */
    std::optional<CachedAnalysis> get_by_hash(const std::string& hash);

    /* ========================================================================
     * Mutation
     * ======================================================================== */

    /**
     * Insert or replace the entry for entry.path.
     */
    Result<bool> upsert(const CachedAnalysis& entry);

    /**
     * Remove entries computed before the cutoff (ms since epoch).
     * @return Number of removed rows, or -1 on error
     */
    int delete_older_than(int64_t cutoff_ms);

    /**
     * Remove every entry.
     */
    bool clear();

    /* ========================================================================
     * Statistics
     * ======================================================================== */

    CacheStats stats();

private:
    void init_schema();
    std::optional<CachedAnalysis> query_one(const char* sql, const std::string& key);
    static CachedAnalysis read_row(sqlite3_stmt* stmt);

    // Serialization helpers for vector fields
    static std::vector<uint8_t> serialize_floats(const std::vector<float>& data);
    static std::vector<float> deserialize_floats(const void* data, int size);

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace segue

#endif // SEGUE_STORE_H
