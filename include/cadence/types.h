/**
 * Cadence Engine - Internal Types
 */

#ifndef CADENCE_TYPES_H
#define CADENCE_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <cstdint>
#include <cctype>

namespace cadence {

/* ============================================================================
 * Result Type
 * ============================================================================ */

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    std::string message;
    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const std::string& error() const { return std::get<ResultError>(data_).message; }

    T value_or(T default_value) const {
        return ok() ? value() : default_value;
    }

private:
    std::variant<T, ResultError> data_;
};

/* ============================================================================
 * Track Types
 * ============================================================================ */

constexpr int kEmbeddingDim = 128;

struct AudioFeatures {
    std::optional<float> energy;        // 0-1
    std::optional<float> valence;       // 0-1
    std::optional<float> danceability;  // 0-1
    std::optional<float> bpm;
    std::optional<std::string> key;     // Circle of Fifths name, e.g. "C", "F#m"

    bool empty() const {
        return !energy && !valence && !danceability && !bpm && !key;
    }

    bool operator==(const AudioFeatures& other) const {
        return energy == other.energy && valence == other.valence &&
               danceability == other.danceability && bpm == other.bpm &&
               key == other.key;
    }
    bool operator!=(const AudioFeatures& other) const { return !(*this == other); }
};

struct Artist {
    std::string id;
    std::string name;
};

struct Track {
    std::string id;
    std::string title;
    std::vector<Artist> artists;
    std::string album_id;
    std::string album_title;
    std::vector<std::string> genres;
    std::vector<std::string> moods;
    float duration = 0.0f;              // Seconds
    std::optional<AudioFeatures> audio_features;

    /**
     * Lower-cased name of the first artist, or "unknown".
     */
    std::string primary_artist() const {
        if (artists.empty() || artists[0].name.empty()) return "unknown";
        std::string name = artists[0].name;
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return name;
    }

    std::optional<float> energy() const {
        return audio_features ? audio_features->energy : std::nullopt;
    }
};

/* ============================================================================
 * User Events
 * ============================================================================ */

enum class EventType {
    Listen,
    Skip,
    Like,
    Dislike,
    Download,
    PlaylistAdd
};

struct UserEvent {
    EventType type = EventType::Listen;
    std::string user_id;
    Track track;
    int64_t timestamp = 0;              // Unix time, milliseconds
    float played_duration = 0.0f;       // Seconds actually listened
    bool completed = false;
    int strength = 1;                   // Likes: 1 = regular, 2 = strong
    std::string dislike_reason;         // "artist", "genre" or free text

    /**
     * Fraction of the track that was played, 0-1.
     */
    float listen_ratio() const {
        if (completed) return 1.0f;
        if (track.duration <= 0.0f || played_duration <= 0.0f) return 0.0f;
        float ratio = played_duration / track.duration;
        return ratio > 1.0f ? 1.0f : ratio;
    }
};

/* ============================================================================
 * Time Context
 * ============================================================================ */

enum class TimeSlot {
    Morning,        // 06-12
    Afternoon,      // 12-18
    Evening,        // 18-22
    Night           // 22-06
};

struct TimeContext {
    int64_t timestamp = 0;              // Unix time, milliseconds
    int hour = 12;                      // 0-23, local
    int day_of_week = 1;                // 0 = Sunday

    bool is_weekend() const { return day_of_week == 0 || day_of_week == 6; }

    TimeSlot slot() const {
        if (hour >= 6 && hour < 12) return TimeSlot::Morning;
        if (hour >= 12 && hour < 18) return TimeSlot::Afternoon;
        if (hour >= 18 && hour < 22) return TimeSlot::Evening;
        return TimeSlot::Night;
    }
};

/* ============================================================================
 * Queue Types
 * ============================================================================ */

enum class QueueMode {
    Manual,
    AutoQueue,
    Radio
};

enum class QueueSourceType {
    Manual,         // User explicitly added
    Artist,         // Same/similar artist
    Album,          // Same album
    Genre,          // Genre match
    Similar,        // Similar track (embedding/audio features)
    Radio,          // Radio station
    Mood,           // Mood/energy match
    Discovery,      // New discovery from API
    Trending,       // Trending tracks
    Search,         // From search results
    Liked,          // From user's liked tracks
    Playlist,       // From user's playlists
    ML,             // Model recommendation
    Auto            // Generic auto-queue
};

struct QueueSource {
    QueueSourceType type = QueueSourceType::Auto;
    std::string label;                  // Human-readable description
    std::string context;                // Artist name, genre, etc.
    std::optional<float> score;         // Relevance score when added
    int64_t timestamp = 0;
    std::optional<std::string> seed_track_id;
};

struct QueuedTrack {
    Track track;
    QueueSource source;
};

enum class RadioSeedType {
    Track,
    Artist,
    Genre
};

struct RadioSeed {
    RadioSeedType type = RadioSeedType::Track;
    std::string id;
    std::string name;
    std::vector<std::string> genres;
    std::vector<std::string> artist_ids;
    std::optional<AudioFeatures> audio_features;
};

enum class ExplorationMode {
    Balanced,
    Explore,
    Exploit
};

/* ============================================================================
 * Scoring Types
 * ============================================================================ */

struct ScoreComponents {
    float base = 0.0f;
    float exploration = 0.0f;
    float serendipity = 0.0f;
    float diversity = 0.0f;
    float flow = 0.0f;
    float temporal = 0.0f;
    float plugin = 0.0f;
};

struct ScoredTrack {
    Track track;
    float final_score = 0.0f;
    ScoreComponents components;
    std::vector<std::string> explanation;
};

/* ============================================================================
 * Configuration
 * ============================================================================ */

struct IndexConfig {
    int ef_construction = 200;
    int ef_search = 50;
    int m_max = 16;                     // Links per node; layer 0 keeps twice as many
    size_t capacity = 100000;
    size_t brute_force_threshold = 1000; // Exact scan below this many elements
    uint32_t level_seed = 42;
};

struct ProfileConfig {
    size_t min_interactions = 5;
    size_t max_contributions = 1000;
    float half_life_days = 30.0f;
    float main_weight = 0.5f;
    float slot_weight = 0.3f;
    float day_type_weight = 0.2f;
};

struct PreferenceConfig {
    float daily_decay = 0.98f;
    float min_score = -100.0f;
    float max_score = 100.0f;
    float early_skip_seconds = 30.0f;
};

struct CoOccurrenceConfig {
    size_t max_pairs = 50000;
    float min_count = 2.0f;
    float daily_decay = 0.98f;
    int64_t session_window_ms = 30LL * 60 * 1000;
    size_t max_session_tracks = 20;
    size_t max_list_tracks = 50;
};

struct ScoringWeights {
    float base = 0.40f;
    float exploration = 0.10f;
    float serendipity = 0.15f;
    float diversity = 0.15f;
    float flow = 0.10f;
    float temporal = 0.05f;
    float plugin = 0.05f;
    float epsilon = 0.15f;              // Epsilon-greedy exploration probability

    static ScoringWeights defaults() { return ScoringWeights{}; }

    float sum() const {
        return base + exploration + serendipity + diversity + flow + temporal + plugin;
    }
};

struct SmartQueueConfig {
    bool auto_queue_enabled = false;
    int auto_queue_threshold = 2;       // Replenish when <= this many tracks remain
    int batch_size = 10;
    bool limit_artist_repetition = true;
    int max_artist_per_batch = 2;
    int64_t min_fetch_interval_ms = 5000;
    int64_t session_timeout_ms = 4LL * 60 * 60 * 1000;
    size_t max_session_history = 200;
    int64_t request_timeout_ms = 10000;
};

struct RadioConfig {
    float seed_weight = 0.7f;           // 0-1, how much to prioritize seed relevance
    bool progressive_drift = true;      // Gradually drift from seed over time
    float drift_per_track = 0.02f;
    float min_seed_weight = 0.3f;
};

struct EngineConfig {
    IndexConfig index;
    ProfileConfig profile;
    PreferenceConfig preferences;
    CoOccurrenceConfig cooccurrence;
    ScoringWeights scoring;
    SmartQueueConfig queue;
    RadioConfig radio;
    int utc_offset_minutes = 0;         // Local time offset for time-of-day context
    uint32_t random_seed = 0x5eed;      // Seeds epsilon-greedy exploration
};

} // namespace cadence

#endif // CADENCE_TYPES_H
