/**
 * Cadence Engine - C API Implementation
 */

#include "cadence/cadence.h"
#include "../engine/engine.h"
#include "../core/utils.h"
#include <cstdlib>
#include <cstring>
#include <new>

using namespace cadence;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct CadenceEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
};

namespace {

std::string to_string(const char* s) {
    return s ? std::string(s) : std::string();
}

std::vector<std::string> to_strings(const char** values) {
    std::vector<std::string> out;
    if (!values) return out;
    for (const char** p = values; *p; ++p) out.emplace_back(*p);
    return out;
}

std::optional<float> known(float value) {
    return value < 0.0f ? std::nullopt : std::optional<float>(value);
}

Track to_track(const CadenceTrack& in) {
    Track track;
    track.id = to_string(in.id);
    track.title = to_string(in.title);
    if (in.artist_id || in.artist_name) {
        track.artists.push_back({to_string(in.artist_id), to_string(in.artist_name)});
    }
    track.album_id = to_string(in.album_id);
    track.album_title = to_string(in.album_title);
    track.genres = to_strings(in.genres);
    track.moods = to_strings(in.moods);
    track.duration = in.duration;

    AudioFeatures features;
    features.energy = known(in.energy);
    features.valence = known(in.valence);
    features.danceability = known(in.danceability);
    features.bpm = in.bpm > 0.0f ? std::optional<float>(in.bpm) : std::nullopt;
    if (in.key && *in.key) features.key = std::string(in.key);
    if (!features.empty()) track.audio_features = features;
    return track;
}

char* copy_string(const std::string& s) {
    return strdup(s.c_str());
}

}

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

CadenceEngine* cadence_create(const char* db_path) {
    auto handle = new CadenceEngine();
    if (db_path) {
        handle->engine = std::make_unique<Engine>(std::string(db_path));
    } else {
        handle->engine = std::make_unique<Engine>(EngineConfig{});
    }

    if (!handle->engine->is_valid()) {
        delete handle;
        return nullptr;
    }
    return handle;
}

void cadence_destroy(CadenceEngine* engine) {
    delete engine;
}

const char* cadence_get_error(CadenceEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

void cadence_set_log_level(CadenceLogLevel level) {
    int value = static_cast<int>(level);
    if (value < 0) value = 0;
    if (value > static_cast<int>(utils::LogLevel::Off)) value = static_cast<int>(utils::LogLevel::Off);
    utils::set_log_level(static_cast<utils::LogLevel>(value));
}

/* ============================================================================
 * Library
 * ============================================================================ */

CadenceError cadence_add_track(CadenceEngine* engine, const CadenceTrack* track) {
    if (!engine || !engine->engine || !track || !track->id) return CADENCE_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->add_track(to_track(*track));
    if (result.failed()) {
        engine->last_error = result.error();
        if (result.error().find("capacity exceeded") != std::string::npos) return CADENCE_ERROR_INDEX_FULL;
        if (result.error().find("not indexed") != std::string::npos) return CADENCE_ERROR_INVALID_ARGUMENT;
        return CADENCE_ERROR_DATABASE_ERROR;
    }
    return CADENCE_OK;
}

int cadence_get_track_count(CadenceEngine* engine) {
    if (!engine || !engine->engine) return 0;
    return static_cast<int>(engine->engine->track_count());
}

/* ============================================================================
 * Events
 * ============================================================================ */

CadenceError cadence_record_event(CadenceEngine* engine, const CadenceEvent* event) {
    if (!engine || !engine->engine || !event || !event->user_id || !event->track_id) {
        return CADENCE_ERROR_INVALID_ARGUMENT;
    }
    if (event->type < CADENCE_EVENT_LISTEN || event->type > CADENCE_EVENT_PLAYLIST_ADD) {
        return CADENCE_ERROR_INVALID_ARGUMENT;
    }

    auto track = engine->engine->get_track(event->track_id);
    if (!track) {
        engine->last_error = std::string("Unknown track: ") + event->track_id;
        return CADENCE_ERROR_NOT_FOUND;
    }

    UserEvent e;
    e.type = static_cast<EventType>(event->type);
    e.user_id = event->user_id;
    e.track = std::move(*track);
    e.timestamp = event->timestamp > 0 ? event->timestamp : utils::current_timestamp_ms();
    e.played_duration = event->played_duration;
    e.completed = event->completed != 0;
    e.strength = event->strength > 0 ? event->strength : 1;
    e.dislike_reason = to_string(event->dislike_reason);

    engine->engine->record_event(e);
    if (e.type == EventType::Listen) {
        engine->engine->record_track_played(e.user_id, e.track, e.timestamp);
    }
    return CADENCE_OK;
}

/* ============================================================================
 * Queue
 * ============================================================================ */

CadenceError cadence_start_radio(
    CadenceEngine* engine,
    const char* user_id,
    CadenceSeedType seed_type,
    const char* seed_id,
    const char* seed_name
) {
    if (!engine || !engine->engine || !user_id || (!seed_id && !seed_name)) {
        return CADENCE_ERROR_INVALID_ARGUMENT;
    }
    if (seed_type < CADENCE_SEED_TRACK || seed_type > CADENCE_SEED_GENRE) return CADENCE_ERROR_INVALID_ARGUMENT;

    RadioSeed seed;
    seed.type = static_cast<RadioSeedType>(seed_type);
    seed.id = seed_id ? seed_id : seed_name;
    seed.name = to_string(seed_name);

    if (seed.type == RadioSeedType::Track && !engine->engine->get_track(seed.id)) {
        engine->last_error = "Unknown seed track: " + seed.id;
        return CADENCE_ERROR_NOT_FOUND;
    }

    engine->engine->start_radio(user_id, seed, utils::current_timestamp_ms());
    return CADENCE_OK;
}

CadenceError cadence_stop_radio(CadenceEngine* engine, const char* user_id) {
    if (!engine || !engine->engine || !user_id) return CADENCE_ERROR_INVALID_ARGUMENT;
    engine->engine->stop_radio(user_id);
    return CADENCE_OK;
}

CadenceError cadence_enable_auto_queue(CadenceEngine* engine, const char* user_id) {
    if (!engine || !engine->engine || !user_id) return CADENCE_ERROR_INVALID_ARGUMENT;
    if (!engine->engine->enable_auto_queue(user_id)) {
        engine->last_error = "Auto-queue is unavailable while radio is active";
        return CADENCE_ERROR_INVALID_ARGUMENT;
    }
    return CADENCE_OK;
}

CadenceError cadence_disable_auto_queue(CadenceEngine* engine, const char* user_id) {
    if (!engine || !engine->engine || !user_id) return CADENCE_ERROR_INVALID_ARGUMENT;
    engine->engine->disable_auto_queue(user_id);
    return CADENCE_OK;
}

CadenceQueueMode cadence_get_queue_mode(CadenceEngine* engine, const char* user_id) {
    if (!engine || !engine->engine || !user_id) return CADENCE_MODE_MANUAL;
    return static_cast<CadenceQueueMode>(engine->engine->queue_mode(user_id));
}

CadenceError cadence_get_next_tracks(
    CadenceEngine* engine,
    const char* user_id,
    const char* current_track_id,
    int count,
    CadenceQueuedTrack** out_tracks,
    int* out_count
) {
    if (!engine || !engine->engine || !user_id || count <= 0 || !out_tracks || !out_count) {
        return CADENCE_ERROR_INVALID_ARGUMENT;
    }
    *out_tracks = nullptr;
    *out_count = 0;

    FetchRequest request;
    request.time = engine->engine->time_context(utils::current_timestamp_ms());
    if (current_track_id) {
        auto current = engine->engine->get_track(current_track_id);
        if (!current) {
            engine->last_error = std::string("Unknown track: ") + current_track_id;
            return CADENCE_ERROR_NOT_FOUND;
        }
        request.queue.tracks.push_back(std::move(*current));
        request.queue.index = 0;
    }

    std::vector<ScoredTrack> scored;
    try {
        scored = engine->engine->get_next_tracks(user_id, count, request);
    } catch (const std::bad_alloc&) {
        engine->last_error = "Out of memory";
        return CADENCE_ERROR_OUT_OF_MEMORY;
    }

    if (scored.empty()) {
        engine->last_error = "No matching tracks found";
        return CADENCE_ERROR_NO_CANDIDATES;
    }

    auto tracks = static_cast<CadenceQueuedTrack*>(std::calloc(scored.size(), sizeof(CadenceQueuedTrack)));
    if (!tracks) return CADENCE_ERROR_OUT_OF_MEMORY;

    for (size_t i = 0; i < scored.size(); ++i) {
        const auto& s = scored[i];
        std::string explanation;
        for (const auto& reason : s.explanation) {
            if (!explanation.empty()) explanation += "; ";
            explanation += reason;
        }
        tracks[i].track_id = copy_string(s.track.id);
        tracks[i].title = copy_string(s.track.title);
        tracks[i].artist = copy_string(s.track.artists.empty() ? std::string() : s.track.artists[0].name);
        tracks[i].score = s.final_score;
        tracks[i].explanation = copy_string(explanation);
    }

    *out_tracks = tracks;
    *out_count = static_cast<int>(scored.size());
    return CADENCE_OK;
}

void cadence_free_queued_tracks(CadenceQueuedTrack* tracks, int count) {
    if (!tracks) return;
    for (int i = 0; i < count; ++i) {
        std::free(tracks[i].track_id);
        std::free(tracks[i].title);
        std::free(tracks[i].artist);
        std::free(tracks[i].explanation);
    }
    std::free(tracks);
}

void cadence_set_queue_config(CadenceEngine* engine, const CadenceQueueConfig* config) {
    if (!engine || !engine->engine) return;

    SmartQueueConfig queue;
    if (config) {
        queue.auto_queue_enabled = config->auto_queue_enabled != 0;
        queue.auto_queue_threshold = config->auto_queue_threshold;
        if (config->batch_size > 0) queue.batch_size = config->batch_size;
        queue.limit_artist_repetition = config->limit_artist_repetition != 0;
        if (config->max_artist_per_batch > 0) queue.max_artist_per_batch = config->max_artist_per_batch;
    }
    engine->engine->set_queue_config(queue);
}

void cadence_set_radio_config(CadenceEngine* engine, const CadenceRadioConfig* config) {
    if (!engine || !engine->engine) return;

    RadioConfig radio;
    if (config) {
        radio.seed_weight = utils::clamp(config->seed_weight, 0.0f, 1.0f);
        radio.progressive_drift = config->progressive_drift != 0;
        radio.drift_per_track = config->drift_per_track;
        radio.min_seed_weight = utils::clamp(config->min_seed_weight, 0.0f, 1.0f);
    }
    engine->engine->set_radio_config(radio);
}

/* ============================================================================
 * Maintenance and Persistence
 * ============================================================================ */

void cadence_run_maintenance(CadenceEngine* engine, int64_t now) {
    if (!engine || !engine->engine) return;
    engine->engine->run_maintenance(now > 0 ? now : utils::current_timestamp_ms());
}

CadenceError cadence_save(CadenceEngine* engine) {
    if (!engine || !engine->engine) return CADENCE_ERROR_INVALID_ARGUMENT;
    if (!engine->engine->save_all()) {
        engine->last_error = engine->engine->error();
        return CADENCE_ERROR_DATABASE_ERROR;
    }
    return CADENCE_OK;
}

CadenceError cadence_load_user(CadenceEngine* engine, const char* user_id) {
    if (!engine || !engine->engine || !user_id) return CADENCE_ERROR_INVALID_ARGUMENT;
    if (!engine->engine->load_user(user_id)) {
        engine->last_error = std::string("Stored state for ") + user_id + " was corrupt and has been reset";
        return CADENCE_ERROR_DATABASE_ERROR;
    }
    return CADENCE_OK;
}

CadenceError cadence_load_index(CadenceEngine* engine) {
    if (!engine || !engine->engine) return CADENCE_ERROR_INVALID_ARGUMENT;
    if (!engine->engine->load_index()) {
        engine->last_error = "Stored index was corrupt and has been rebuilt";
        return CADENCE_ERROR_DATABASE_ERROR;
    }
    return CADENCE_OK;
}
