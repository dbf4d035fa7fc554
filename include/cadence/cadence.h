/**
 * Cadence Engine - Public C API
 *
 * A personalized music recommendation engine: track embeddings, a vector
 * index, evolving user taste and a diversity-aware radio / auto-queue.
 */

#ifndef CADENCE_H
#define CADENCE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct CadenceEngine CadenceEngine;

typedef enum {
    CADENCE_OK = 0,
    CADENCE_ERROR_INVALID_ARGUMENT = -1,
    CADENCE_ERROR_NOT_FOUND = -2,
    CADENCE_ERROR_DATABASE_ERROR = -3,
    CADENCE_ERROR_INDEX_FULL = -4,
    CADENCE_ERROR_NO_CANDIDATES = -5,
    CADENCE_ERROR_OUT_OF_MEMORY = -6,
    CADENCE_ERROR_NOT_INITIALIZED = -7,
} CadenceError;

typedef enum {
    CADENCE_LOG_DEBUG = 0,
    CADENCE_LOG_INFO = 1,
    CADENCE_LOG_WARN = 2,
    CADENCE_LOG_ERROR = 3,
    CADENCE_LOG_OFF = 4,
} CadenceLogLevel;

typedef enum {
    CADENCE_MODE_MANUAL = 0,
    CADENCE_MODE_AUTO_QUEUE = 1,
    CADENCE_MODE_RADIO = 2,
} CadenceQueueMode;

typedef enum {
    CADENCE_EVENT_LISTEN = 0,
    CADENCE_EVENT_SKIP = 1,
    CADENCE_EVENT_LIKE = 2,
    CADENCE_EVENT_DISLIKE = 3,
    CADENCE_EVENT_DOWNLOAD = 4,
    CADENCE_EVENT_PLAYLIST_ADD = 5,
} CadenceEventType;

typedef enum {
    CADENCE_SEED_TRACK = 0,
    CADENCE_SEED_ARTIST = 1,
    CADENCE_SEED_GENRE = 2,
} CadenceSeedType;

/* Track metadata. Audio features below zero (and a NULL key) are unknown. */
typedef struct {
    const char* id;
    const char* title;
    const char* artist_id;
    const char* artist_name;
    const char* album_id;
    const char* album_title;
    const char** genres;        /* NULL-terminated array, or NULL */
    const char** moods;         /* NULL-terminated array, or NULL */
    float duration;             /* seconds */
    float energy;               /* 0-1 */
    float valence;              /* 0-1 */
    float danceability;         /* 0-1 */
    float bpm;
    const char* key;            /* e.g. "C", "F#m" */
} CadenceTrack;

/* User event on a track already added to the library */
typedef struct {
    CadenceEventType type;
    const char* user_id;
    const char* track_id;
    int64_t timestamp;          /* Unix time, milliseconds */
    float played_duration;      /* seconds */
    int completed;
    int strength;               /* likes: 1 = regular, 2 = strong */
    const char* dislike_reason; /* "artist", "genre" or NULL */
} CadenceEvent;

/* Recommended track (strings owned by the array, see cadence_free_queued_tracks) */
typedef struct {
    char* track_id;
    char* title;
    char* artist;
    float score;
    char* explanation;          /* "; "-separated reasons */
} CadenceQueuedTrack;

typedef struct {
    int auto_queue_enabled;
    int auto_queue_threshold;   /* replenish when <= this many tracks remain */
    int batch_size;
    int limit_artist_repetition;
    int max_artist_per_batch;
} CadenceQueueConfig;

typedef struct {
    float seed_weight;          /* 0-1 */
    int progressive_drift;
    float drift_per_track;
    float min_seed_weight;
} CadenceRadioConfig;

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new Cadence engine instance.
 *
 * @param db_path Path to SQLite database file (created if missing), or NULL
 *                for an in-memory engine
 * @return Engine instance, or NULL on failure
 */
CadenceEngine* cadence_create(const char* db_path);

/**
 * Destroy an engine instance and free all resources.
 */
void cadence_destroy(CadenceEngine* engine);

/**
 * Get the last error message.
 */
const char* cadence_get_error(CadenceEngine* engine);

/**
 * Set the minimum level of diagnostics written to stderr.
 */
void cadence_set_log_level(CadenceLogLevel level);

/* ============================================================================
 * Library
 * ============================================================================ */

/**
 * Add or update a track in the library and the similarity index.
 */
CadenceError cadence_add_track(CadenceEngine* engine, const CadenceTrack* track);

int cadence_get_track_count(CadenceEngine* engine);

/* ============================================================================
 * Events
 * ============================================================================ */

CadenceError cadence_record_event(CadenceEngine* engine, const CadenceEvent* event);

/* ============================================================================
 * Queue
 * ============================================================================ */

CadenceError cadence_start_radio(
    CadenceEngine* engine,
    const char* user_id,
    CadenceSeedType seed_type,
    const char* seed_id,
    const char* seed_name
);

CadenceError cadence_stop_radio(CadenceEngine* engine, const char* user_id);

/**
 * Enable auto-queue. Fails while radio is active.
 */
CadenceError cadence_enable_auto_queue(CadenceEngine* engine, const char* user_id);
CadenceError cadence_disable_auto_queue(CadenceEngine* engine, const char* user_id);

CadenceQueueMode cadence_get_queue_mode(CadenceEngine* engine, const char* user_id);

/**
 * Recommend the next tracks for a user.
 *
 * @param current_track_id Track playing now, or NULL
 * @param count Number of tracks wanted
 * @param out_tracks Output array (free with cadence_free_queued_tracks)
 * @param out_count Output number of tracks
 */
CadenceError cadence_get_next_tracks(
    CadenceEngine* engine,
    const char* user_id,
    const char* current_track_id,
    int count,
    CadenceQueuedTrack** out_tracks,
    int* out_count
);

void cadence_free_queued_tracks(CadenceQueuedTrack* tracks, int count);

/**
 * Configure queue and radio behaviour (NULL restores defaults).
 */
void cadence_set_queue_config(CadenceEngine* engine, const CadenceQueueConfig* config);
void cadence_set_radio_config(CadenceEngine* engine, const CadenceRadioConfig* config);

/* ============================================================================
 * Maintenance and Persistence
 * ============================================================================ */

/**
 * Apply time decay to every loaded user's affinities and co-occurrence.
 */
void cadence_run_maintenance(CadenceEngine* engine, int64_t now);

/**
 * Persist the index and all loaded users.
 */
CadenceError cadence_save(CadenceEngine* engine);

CadenceError cadence_load_user(CadenceEngine* engine, const char* user_id);
CadenceError cadence_load_index(CadenceEngine* engine);

#ifdef __cplusplus
}
#endif

#endif /* CADENCE_H */
