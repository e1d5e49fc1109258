/**
 * Segue Engine - Analysis Cache Store Implementation
 */

#include "store.h"
#include <cstring>
#include <cstdio>

namespace segue {

namespace {

// Column order shared by every SELECT and read_row()
constexpr const char* kColumns =
    "file_path, file_hash, file_size, last_modified, timestamp, "
    "integrated, short_term, momentary, loudness_range, true_peak, gain_adjustment, "
    "start_silence, end_silence, start_fade, end_fade, gapless, encoder_delay, encoder_padding, "
    "bpm, confidence, beats, downbeats, time_signature, first_downbeat, phase_shift";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // namespace

AnalysisStore::AnalysisStore(const std::string& db_path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "Failed to open database";
        sqlite3_close(db_);
        db_ = nullptr;
        std::fprintf(stderr, "[AnalysisStore] Cannot open %s: %s\n",
                     db_path.c_str(), last_error_.c_str());
        return;
    }

    // Enable WAL mode for better concurrency
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    init_schema();
}

AnalysisStore::~AnalysisStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

AnalysisStore::AnalysisStore(AnalysisStore&& other) noexcept
    : db_(other.db_), last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

AnalysisStore& AnalysisStore::operator=(AnalysisStore&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

void AnalysisStore::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS audio_analysis (
            file_path TEXT PRIMARY KEY,
            file_hash TEXT NOT NULL,
            file_size INTEGER DEFAULT 0,
            last_modified INTEGER DEFAULT 0,
            timestamp INTEGER DEFAULT 0,
            integrated REAL,
            short_term REAL,
            momentary REAL,
            loudness_range REAL,
            true_peak REAL,
            gain_adjustment REAL,
            start_silence REAL,
            end_silence REAL,
            start_fade REAL,
            end_fade REAL,
            gapless INTEGER DEFAULT 0,
            encoder_delay INTEGER DEFAULT 0,
            encoder_padding INTEGER DEFAULT 0,
            bpm REAL,
            confidence REAL,
            beats BLOB,
            downbeats BLOB,
            time_signature TEXT,
            first_downbeat REAL,
            phase_shift REAL
        );

        CREATE INDEX IF NOT EXISTS idx_audio_analysis_hash ON audio_analysis(file_hash);
        CREATE INDEX IF NOT EXISTS idx_audio_analysis_timestamp ON audio_analysis(timestamp);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
    }
}

std::vector<uint8_t> AnalysisStore::serialize_floats(const std::vector<float>& data) {
    std::vector<uint8_t> result(data.size() * sizeof(float));
    if (!result.empty()) {
        std::memcpy(result.data(), data.data(), result.size());
    }
    return result;
}

std::vector<float> AnalysisStore::deserialize_floats(const void* data, int size) {
    if (!data || size <= 0) return {};

    size_t count = size / sizeof(float);
    std::vector<float> result(count);
    std::memcpy(result.data(), data, count * sizeof(float));
    return result;
}

CachedAnalysis AnalysisStore::read_row(sqlite3_stmt* stmt) {
    CachedAnalysis entry;
    entry.path = column_text(stmt, 0);
    entry.result.content_hash = column_text(stmt, 1);
    entry.file_size = sqlite3_column_int64(stmt, 2);
    entry.last_modified = sqlite3_column_int64(stmt, 3);
    entry.result.computed_at = sqlite3_column_int64(stmt, 4);

    LoudnessMetrics& l = entry.result.loudness;
    l.integrated = static_cast<float>(sqlite3_column_double(stmt, 5));
    l.short_term = static_cast<float>(sqlite3_column_double(stmt, 6));
    l.momentary = static_cast<float>(sqlite3_column_double(stmt, 7));
    l.loudness_range = static_cast<float>(sqlite3_column_double(stmt, 8));
    l.true_peak = static_cast<float>(sqlite3_column_double(stmt, 9));
    l.gain_adjustment = static_cast<float>(sqlite3_column_double(stmt, 10));

    SilenceMetrics& s = entry.result.silence;
    s.start_silence = static_cast<float>(sqlite3_column_double(stmt, 11));
    s.end_silence = static_cast<float>(sqlite3_column_double(stmt, 12));
    s.start_fade = static_cast<float>(sqlite3_column_double(stmt, 13));
    s.end_fade = static_cast<float>(sqlite3_column_double(stmt, 14));
    s.has_gapless_markers = sqlite3_column_int(stmt, 15) != 0;
    s.encoder_delay = sqlite3_column_int(stmt, 16);
    s.encoder_padding = sqlite3_column_int(stmt, 17);

    BeatMetrics& b = entry.result.beats;
    b.bpm = static_cast<float>(sqlite3_column_double(stmt, 18));
    b.confidence = static_cast<float>(sqlite3_column_double(stmt, 19));
    b.beats = deserialize_floats(sqlite3_column_blob(stmt, 20), sqlite3_column_bytes(stmt, 20));
    b.downbeats = deserialize_floats(sqlite3_column_blob(stmt, 21), sqlite3_column_bytes(stmt, 21));
    b.time_signature = column_text(stmt, 22);
    b.first_downbeat = static_cast<float>(sqlite3_column_double(stmt, 23));
    b.phase_shift = static_cast<float>(sqlite3_column_double(stmt, 24));

    return entry;
}

std::optional<CachedAnalysis> AnalysisStore::query_one(const char* sql, const std::string& key) {
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<CachedAnalysis> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<CachedAnalysis> AnalysisStore::get_by_path(const std::string& path) {
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM audio_analysis WHERE file_path = ?";
    return query_one(sql.c_str(), path);
}

std::optional<CachedAnalysis> AnalysisStore::get_by_hash(const std::string& hash) {
    if (hash.empty()) return std::nullopt;

    std::string sql = std::string("SELECT ") + kColumns +
        " FROM audio_analysis WHERE file_hash = ? ORDER BY timestamp DESC LIMIT 1";
    return query_one(sql.c_str(), hash);
}

Result<bool> AnalysisStore::upsert(const CachedAnalysis& entry) {
    if (!db_) return "Database not open";

    const char* sql = R"(
        INSERT OR REPLACE INTO audio_analysis (
            file_path, file_hash, file_size, last_modified, timestamp,
            integrated, short_term, momentary, loudness_range, true_peak, gain_adjustment,
            start_silence, end_silence, start_fade, end_fade, gapless, encoder_delay, encoder_padding,
            bpm, confidence, beats, downbeats, time_signature, first_downbeat, phase_shift)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::string("Prepare failed: ") + sqlite3_errmsg(db_);
    }

    const AnalysisResult& r = entry.result;
    auto beats_data = serialize_floats(r.beats.beats);
    auto downbeats_data = serialize_floats(r.beats.downbeats);

    sqlite3_bind_text(stmt, 1, entry.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, r.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, entry.file_size);
    sqlite3_bind_int64(stmt, 4, entry.last_modified);
    sqlite3_bind_int64(stmt, 5, r.computed_at);

    sqlite3_bind_double(stmt, 6, r.loudness.integrated);
    sqlite3_bind_double(stmt, 7, r.loudness.short_term);
    sqlite3_bind_double(stmt, 8, r.loudness.momentary);
    sqlite3_bind_double(stmt, 9, r.loudness.loudness_range);
    sqlite3_bind_double(stmt, 10, r.loudness.true_peak);
    sqlite3_bind_double(stmt, 11, r.loudness.gain_adjustment);

    sqlite3_bind_double(stmt, 12, r.silence.start_silence);
    sqlite3_bind_double(stmt, 13, r.silence.end_silence);
    sqlite3_bind_double(stmt, 14, r.silence.start_fade);
    sqlite3_bind_double(stmt, 15, r.silence.end_fade);
    sqlite3_bind_int(stmt, 16, r.silence.has_gapless_markers ? 1 : 0);
    sqlite3_bind_int(stmt, 17, r.silence.encoder_delay);
    sqlite3_bind_int(stmt, 18, r.silence.encoder_padding);

    sqlite3_bind_double(stmt, 19, r.beats.bpm);
    sqlite3_bind_double(stmt, 20, r.beats.confidence);
    sqlite3_bind_blob(stmt, 21, beats_data.data(), static_cast<int>(beats_data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 22, downbeats_data.data(), static_cast<int>(downbeats_data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 23, r.beats.time_signature.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 24, r.beats.first_downbeat);
    sqlite3_bind_double(stmt, 25, r.beats.phase_shift);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::string("Insert failed: ") + sqlite3_errmsg(db_);
    }
    return true;
}

int AnalysisStore::delete_older_than(int64_t cutoff_ms) {
    if (!db_) return -1;

    const char* sql = "DELETE FROM audio_analysis WHERE timestamp < ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, cutoff_ms);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) return -1;
    return sqlite3_changes(db_);
}

bool AnalysisStore::clear() {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, "DELETE FROM audio_analysis", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to clear cache";
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

CacheStats AnalysisStore::stats() {
    CacheStats stats;
    if (!db_) return stats;

    const char* sql = R"(
        SELECT COUNT(*), COALESCE(SUM(file_size), 0),
               COALESCE(MIN(timestamp), 0), COALESCE(MAX(timestamp), 0)
        FROM audio_analysis
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return stats;
    }

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.entries = sqlite3_column_int(stmt, 0);
        stats.total_size_bytes = sqlite3_column_int64(stmt, 1);
        stats.oldest = sqlite3_column_int64(stmt, 2);
        stats.newest = sqlite3_column_int64(stmt, 3);
    }

    sqlite3_finalize(stmt);
    return stats;
}

} // namespace segue
