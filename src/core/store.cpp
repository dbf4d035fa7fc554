/**
 * Cadence Engine - Database Store Implementation
 */

#include "store.h"
#include "serialize.h"
#include "utils.h"

namespace cadence {

namespace {

enum FeatureFlags : uint8_t {
    kHasEnergy = 1 << 0,
    kHasValence = 1 << 1,
    kHasDanceability = 1 << 2,
    kHasBpm = 1 << 3,
    kHasKey = 1 << 4,
};

std::vector<uint8_t> blob_to_vector(const void* data, int size) {
    if (!data || size <= 0) return {};
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // namespace

Store::Store(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        utils::log(utils::LogLevel::Error, "Store", "Failed to open %s: %s",
                   db_path.c_str(), last_error_.c_str());
        return;
    }

    // Enable WAL mode for better concurrency
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

Store::~Store() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Store::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS tracks (
            id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            artists BLOB,
            album_id TEXT,
            album_title TEXT,
            genres BLOB,
            moods BLOB,
            duration REAL DEFAULT 0,
            features BLOB,
            updated_at INTEGER DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_tracks_title ON tracks(title);

        CREATE TABLE IF NOT EXISTS kv_state (
            key TEXT PRIMARY KEY,
            value BLOB,
            updated_at INTEGER DEFAULT 0
        );
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
        utils::log(utils::LogLevel::Error, "Store", "%s", last_error_.c_str());
    }
}

/* ============================================================================
 * Field Serialization
 * ============================================================================ */

std::vector<uint8_t> Store::serialize_artists(const std::vector<Artist>& artists) {
    BinaryWriter w;
    w.put_u32(static_cast<uint32_t>(artists.size()));
    for (const auto& a : artists) {
        w.put_string(a.id);
        w.put_string(a.name);
    }
    return w.take();
}

std::vector<Artist> Store::deserialize_artists(const void* data, int size) {
    auto bytes = blob_to_vector(data, size);
    if (bytes.empty()) return {};

    BinaryReader r(bytes);
    uint32_t count = r.get_u32();
    std::vector<Artist> artists;
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        Artist a;
        a.id = r.get_string();
        a.name = r.get_string();
        if (r.ok()) artists.push_back(std::move(a));
    }
    return artists;
}

std::vector<uint8_t> Store::serialize_strings(const std::vector<std::string>& values) {
    BinaryWriter w;
    w.put_strings(values);
    return w.take();
}

std::vector<std::string> Store::deserialize_strings(const void* data, int size) {
    auto bytes = blob_to_vector(data, size);
    if (bytes.empty()) return {};

    BinaryReader r(bytes);
    auto values = r.get_strings();
    return r.ok() ? values : std::vector<std::string>{};
}

std::vector<uint8_t> Store::serialize_features(const std::optional<AudioFeatures>& features) {
    if (!features) return {};

    uint8_t flags = 0;
    if (features->energy) flags |= kHasEnergy;
    if (features->valence) flags |= kHasValence;
    if (features->danceability) flags |= kHasDanceability;
    if (features->bpm) flags |= kHasBpm;
    if (features->key) flags |= kHasKey;

    BinaryWriter w;
    w.put_u8(flags);
    w.put_f32(features->energy.value_or(0.0f));
    w.put_f32(features->valence.value_or(0.0f));
    w.put_f32(features->danceability.value_or(0.0f));
    w.put_f32(features->bpm.value_or(0.0f));
    w.put_string(features->key.value_or(""));
    return w.take();
}

std::optional<AudioFeatures> Store::deserialize_features(const void* data, int size) {
    auto bytes = blob_to_vector(data, size);
    if (bytes.empty()) return std::nullopt;

    BinaryReader r(bytes);
    uint8_t flags = r.get_u8();
    float energy = r.get_f32();
    float valence = r.get_f32();
    float danceability = r.get_f32();
    float bpm = r.get_f32();
    std::string key = r.get_string();
    if (!r.ok()) return std::nullopt;

    AudioFeatures f;
    if (flags & kHasEnergy) f.energy = energy;
    if (flags & kHasValence) f.valence = valence;
    if (flags & kHasDanceability) f.danceability = danceability;
    if (flags & kHasBpm) f.bpm = bpm;
    if (flags & kHasKey) f.key = key;
    return f;
}

/* ============================================================================
 * Tracks
 * ============================================================================ */

Result<std::string> Store::upsert_track(const Track& track) {
    if (!db_) return ResultError{"Database not open"};
    if (track.id.empty()) return ResultError{"Track id is empty"};

    const char* sql = R"(
        INSERT INTO tracks (id, title, artists, album_id, album_title, genres, moods, duration, features, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            title = excluded.title,
            artists = excluded.artists,
            album_id = excluded.album_id,
            album_title = excluded.album_title,
            genres = excluded.genres,
            moods = excluded.moods,
            duration = excluded.duration,
            features = excluded.features,
            updated_at = excluded.updated_at
    )";

    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ResultError{std::string("Prepare failed: ") + sqlite3_errmsg(db_)};
    }

    auto artists_data = serialize_artists(track.artists);
    auto genres_data = serialize_strings(track.genres);
    auto moods_data = serialize_strings(track.moods);
    auto features_data = serialize_features(track.audio_features);

    sqlite3_bind_text(stmt, 1, track.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, track.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, artists_data.data(), static_cast<int>(artists_data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, track.album_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, track.album_title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 6, genres_data.data(), static_cast<int>(genres_data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 7, moods_data.data(), static_cast<int>(moods_data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 8, track.duration);
    if (features_data.empty()) {
        sqlite3_bind_null(stmt, 9);
    } else {
        sqlite3_bind_blob(stmt, 9, features_data.data(), static_cast<int>(features_data.size()), SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, 10, utils::current_timestamp_ms());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return ResultError{std::string("Insert failed: ") + sqlite3_errmsg(db_)};
    }

    return track.id;
}

Track Store::read_track_row(sqlite3_stmt* stmt) {
    Track track;
    track.id = column_text(stmt, 0);
    track.title = column_text(stmt, 1);
    track.artists = deserialize_artists(sqlite3_column_blob(stmt, 2), sqlite3_column_bytes(stmt, 2));
    track.album_id = column_text(stmt, 3);
    track.album_title = column_text(stmt, 4);
    track.genres = deserialize_strings(sqlite3_column_blob(stmt, 5), sqlite3_column_bytes(stmt, 5));
    track.moods = deserialize_strings(sqlite3_column_blob(stmt, 6), sqlite3_column_bytes(stmt, 6));
    track.duration = static_cast<float>(sqlite3_column_double(stmt, 7));
    track.audio_features = deserialize_features(sqlite3_column_blob(stmt, 8), sqlite3_column_bytes(stmt, 8));
    return track;
}

std::optional<Track> Store::get_track(const std::string& id) {
    if (!db_) return std::nullopt;

    const char* sql = "SELECT id, title, artists, album_id, album_title, genres, moods, duration, features "
                      "FROM tracks WHERE id = ?";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Track> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_track_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<Track> Store::query_tracks(const char* sql, const std::string* pattern, int limit) {
    std::vector<Track> tracks;
    if (!db_) return tracks;

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return tracks;
    }

    if (pattern) {
        sqlite3_bind_text(stmt, 1, pattern->c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, limit);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        tracks.push_back(read_track_row(stmt));
    }

    sqlite3_finalize(stmt);
    return tracks;
}

std::vector<Track> Store::get_all_tracks() {
    return query_tracks(
        "SELECT id, title, artists, album_id, album_title, genres, moods, duration, features "
        "FROM tracks ORDER BY id", nullptr, 0);
}

std::vector<Track> Store::search_tracks(const std::string& pattern, int limit) {
    return query_tracks(
        "SELECT id, title, artists, album_id, album_title, genres, moods, duration, features "
        "FROM tracks WHERE title LIKE ? ORDER BY id LIMIT ?", &pattern, limit);
}

int Store::get_track_count() {
    if (!db_) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "SELECT COUNT(*) FROM tracks";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

bool Store::delete_track(const std::string& id) {
    if (!db_) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "DELETE FROM tracks WHERE id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

/* ============================================================================
 * Key/Value State
 * ============================================================================ */

std::optional<std::vector<uint8_t>> Store::get(const std::string& key) {
    if (!db_) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "SELECT value FROM kv_state WHERE key = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::vector<uint8_t>> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return result;
}

bool Store::set(const std::string& key, const std::vector<uint8_t>& value) {
    if (!db_) return false;

    const char* sql = R"(
        INSERT INTO kv_state (key, value, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET
            value = excluded.value,
            updated_at = excluded.updated_at
    )";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, utils::current_timestamp_ms());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        utils::log(utils::LogLevel::Error, "Store", "Failed to write %s: %s",
                   key.c_str(), last_error_.c_str());
        return false;
    }
    return true;
}

bool Store::remove(const std::string& key) {
    if (!db_) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "DELETE FROM kv_state WHERE key = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Store::clear() {
    if (!db_) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, "DELETE FROM kv_state;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to clear state";
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

} // namespace cadence
