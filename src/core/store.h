/**
 * Cadence Engine - Database Store
 */

#ifndef CADENCE_STORE_H
#define CADENCE_STORE_H

#include "cadence/types.h"
#include "storage.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>

namespace cadence {

/**
 * SQLite-based storage for the track catalog and persisted engine state.
 *
 * Tracks live in their own table; everything else (embeddings, index,
 * profiles, preferences, co-occurrence) goes through the key/value
 * StorageAdapter interface into the kv_state table.
 */
class Store : public StorageAdapter {
public:
    explicit Store(const std::string& db_path);
    ~Store() override;

    // Non-copyable
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /* ========================================================================
     * Track Operations
     * ======================================================================== */

    /**
     * Insert or update a track. Returns the track id.
     */
    Result<std::string> upsert_track(const Track& track);

    /**
     * Get track by ID.
     */
    std::optional<Track> get_track(const std::string& id);

    /**
     * Get all tracks.
     */
    std::vector<Track> get_all_tracks();

    /**
     * Search tracks by title pattern (SQL LIKE).
     */
    std::vector<Track> search_tracks(const std::string& pattern, int limit = 50);

    int get_track_count();

    bool delete_track(const std::string& id);

    /* ========================================================================
     * Key/Value State (StorageAdapter)
     * ======================================================================== */

    std::optional<std::vector<uint8_t>> get(const std::string& key) override;
    bool set(const std::string& key, const std::vector<uint8_t>& value) override;
    bool remove(const std::string& key) override;
    bool clear() override;

private:
    void init_schema();
    Track read_track_row(sqlite3_stmt* stmt);
    std::vector<Track> query_tracks(const char* sql, const std::string* pattern, int limit);

    // Serialization helpers for list fields
    static std::vector<uint8_t> serialize_artists(const std::vector<Artist>& artists);
    static std::vector<Artist> deserialize_artists(const void* data, int size);
    static std::vector<uint8_t> serialize_strings(const std::vector<std::string>& values);
    static std::vector<std::string> deserialize_strings(const void* data, int size);
    static std::vector<uint8_t> serialize_features(const std::optional<AudioFeatures>& features);
    static std::optional<AudioFeatures> deserialize_features(const void* data, int size);

    sqlite3* db_ = nullptr;
    std::string last_error_;
    std::mutex mutex_;
};

} // namespace cadence

#endif // CADENCE_STORE_H
