/**
 * Cadence Engine - Main Engine Implementation
 */

#include "engine.h"
#include "../core/utils.h"
#include "../learning/event_recorder.h"
#include "../learning/preference_store.h"
#include "../profile/taste_profile.h"
#include <algorithm>

namespace cadence {

namespace {

constexpr size_t kProfileNeighbours = 50;

const char* kIndexKey = "index";
const char* kEmbeddingsKey = "embeddings";

std::string profile_key(const std::string& user_id) { return "profile:" + user_id; }
std::string prefs_key(const std::string& user_id) { return "prefs:" + user_id; }
std::string cooc_key(const std::string& user_id) { return "cooc:" + user_id; }

}

/* ============================================================================
 * User State
 * ============================================================================ */

struct Engine::UserState {
    std::mutex mutex;
    PreferenceStore preferences;
    TasteProfileManager profile;
    CoOccurrenceMatrix cooccurrence;
    std::unique_ptr<EventRecorder> recorder;
    std::unique_ptr<SmartQueueController> controller;

    explicit UserState(const EngineConfig& config)
        : preferences(config.preferences, config.utc_offset_minutes)
        , profile(config.profile, config.utc_offset_minutes)
        , cooccurrence(config.cooccurrence) {}
};

/* ============================================================================
 * Construction
 * ============================================================================ */

Engine::Engine(const std::string& db_path, const EngineConfig& config)
    : config_(config)
    , store_(std::make_shared<Store>(db_path))
    , providers_(std::make_shared<ProviderRegistry>())
    , scoring_(std::make_shared<ScoringEngine>(config.scoring, config.random_seed))
    , index_(config.index, kEmbeddingDim) {
    storage_ = store_;
    if (!store_->is_open()) {
        set_error("Failed to open database: " + store_->error());
        return;
    }
    load_library();
}

Engine::Engine(const EngineConfig& config, std::shared_ptr<StorageAdapter> storage)
    : config_(config)
    , storage_(storage ? std::move(storage) : std::make_shared<MemoryStorage>())
    , providers_(std::make_shared<ProviderRegistry>())
    , scoring_(std::make_shared<ScoringEngine>(config.scoring, config.random_seed))
    , index_(config.index, kEmbeddingDim) {}

Engine::~Engine() = default;

bool Engine::is_valid() const {
    return !store_ || store_->is_open();
}

std::string Engine::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void Engine::set_error(const std::string& message) {
    utils::log(utils::LogLevel::Error, "Engine", "%s", message.c_str());
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

TimeContext Engine::time_context(int64_t timestamp) const {
    return utils::make_time_context(timestamp, config_.utc_offset_minutes);
}

Engine::UserState& Engine::user_state(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    auto it = users_.find(user_id);
    if (it != users_.end()) return *it->second;

    auto state = std::make_unique<UserState>(config_);
    UserState* raw = state.get();

    state->recorder = std::make_unique<EventRecorder>(
        state->preferences, state->profile, state->cooccurrence,
        [this](const Track& track) { return embedding_of(track); });

    QueueCollaborators collaborators;
    collaborators.providers = providers_;
    collaborators.catalog = catalog_service_;
    collaborators.resolve_track = [this](const std::string& id) { return get_track(id); };
    collaborators.embedding_of = [this](const Track& track) { return embedding_of(track); };
    collaborators.similar_in_library = [this, raw](const Track& track, size_t limit,
                                                   const std::unordered_set<std::string>& exclude,
                                                   int64_t now) {
        auto query = embedding_of(track);
        std::vector<Track> tracks;
        for (const auto& c : neighbours(*raw, {track.id}, query ? &*query : nullptr, limit, exclude, now)) {
            if (auto t = get_track(c.track_id)) tracks.push_back(std::move(*t));
        }
        return tracks;
    };

    state->controller = std::make_unique<SmartQueueController>(
        config_.queue, config_.radio, scoring_, std::move(collaborators));

    utils::log(utils::LogLevel::Debug, "Engine", "Created state for user %s", user_id.c_str());
    return *users_.emplace(user_id, std::move(state)).first->second;
}

/* ============================================================================
 * Library
 * ============================================================================ */

void Engine::load_library() {
    auto tracks = store_->get_all_tracks();
    {
        std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
        for (const auto& track : tracks) catalog_[track.id] = track;
    }

    int failed = 0;
    for (const auto& track : tracks) {
        if (index_track(track).failed()) failed++;
    }
    utils::log(utils::LogLevel::Info, "Engine", "Loaded %zu tracks (%zu indexed, %d rejected)",
               tracks.size(), index_.size(), failed);
}

Result<bool> Engine::index_track(const Track& track) {
    auto embedding = embeddings_.get_or_create(track);
    if (!embedding) {
        utils::log(utils::LogLevel::Debug, "Engine", "Track %s has no embedding sources", track.id.c_str());
        return true;
    }

    InsertStatus status = index_.insert(track.id, embedding->vector);
    switch (status) {
        case InsertStatus::Inserted:
        case InsertStatus::Unchanged:
        case InsertStatus::Replaced:
            return true;
        case InsertStatus::CapacityExceeded:
        case InsertStatus::InvalidVector:
        case InsertStatus::DimensionMismatch:
            break;
    }

    std::string message = "Track " + track.id + " not indexed: " + insert_status_name(status);
    set_error(message);
    return ResultError{message};
}

Result<bool> Engine::add_track(const Track& track) {
    if (track.id.empty()) return ResultError{"Track id is empty"};

    if (store_) {
        auto stored = store_->upsert_track(track);
        if (stored.failed()) {
            set_error(stored.error());
            return ResultError{stored.error()};
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
        catalog_[track.id] = track;
    }
    return index_track(track);
}

std::optional<Track> Engine::get_track(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    auto it = catalog_.find(id);
    if (it == catalog_.end()) return std::nullopt;
    return it->second;
}

size_t Engine::track_count() const {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    return catalog_.size();
}

std::vector<Track> Engine::search_tracks(const std::string& pattern, size_t limit) const {
    std::string needle = utils::to_lower(pattern);
    std::vector<Track> result;
    {
        std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
        for (const auto& [id, track] : catalog_) {
            if (utils::contains(utils::to_lower(track.title), needle)) result.push_back(track);
        }
    }
    std::sort(result.begin(), result.end(), [](const Track& a, const Track& b) {
        return a.title != b.title ? a.title < b.title : a.id < b.id;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

std::optional<std::vector<float>> Engine::embedding_of(const Track& track) {
    auto embedding = embeddings_.get_or_create(track);
    if (!embedding) return std::nullopt;
    return embedding->vector;
}

void Engine::index_catalog() {
    std::vector<Track> tracks;
    {
        std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
        tracks.reserve(catalog_.size());
        for (const auto& [id, track] : catalog_) tracks.push_back(track);
    }
    std::sort(tracks.begin(), tracks.end(), [](const Track& a, const Track& b) { return a.id < b.id; });

    for (const auto& track : tracks) {
        auto indexed = index_track(track);
        if (indexed.failed()) {
            utils::log(utils::LogLevel::Warn, "Engine", "%s", indexed.error().c_str());
        }
    }
}

void Engine::rebuild_index() {
    index_.clear();
    index_catalog();
    utils::log(utils::LogLevel::Info, "Engine", "Rebuilt index with %zu tracks", index_.size());
}

/* ============================================================================
 * Collaborators
 * ============================================================================ */

Result<bool> Engine::register_provider(std::shared_ptr<FeatureProvider> provider) {
    return providers_->register_provider(std::move(provider));
}

bool Engine::unregister_provider(const std::string& id) {
    return providers_->unregister_provider(id);
}

void Engine::set_catalog_service(std::shared_ptr<CatalogService> catalog) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    catalog_service_ = catalog;
    for (auto& [id, state] : users_) state->controller->set_catalog(catalog);
}

/* ============================================================================
 * Events
 * ============================================================================ */

void Engine::record_event(const UserEvent& event) {
    UserState& state = user_state(event.user_id);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.recorder->record(event);
}

void Engine::record_track_list(const std::string& user_id, const std::vector<std::string>& track_ids,
                               CoOccurrenceContext context, int64_t timestamp) {
    UserState& state = user_state(user_id);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.cooccurrence.record_list(track_ids, context, timestamp);
}

/* ============================================================================
 * Recommendation
 * ============================================================================ */

UserSnapshot Engine::snapshot(UserState& state, const TimeContext& time) {
    std::lock_guard<std::mutex> lock(state.mutex);
    return UserSnapshot::capture(state.preferences, state.profile, time);
}

std::vector<Track> Engine::default_candidates(const UserSnapshot& user) {
    std::vector<Track> tracks;
    std::unordered_set<std::string> seen;

    std::vector<std::string> liked(user.liked.begin(), user.liked.end());
    std::sort(liked.begin(), liked.end());
    for (const auto& id : liked) {
        if (user.disliked.count(id)) continue;
        if (auto track = get_track(id)) {
            seen.insert(id);
            tracks.push_back(std::move(*track));
        }
    }

    if (user.taste_profile) {
        std::unordered_set<std::string> exclude(user.disliked);
        exclude.insert(seen.begin(), seen.end());
        for (const auto& hit : index_.search(*user.taste_profile, kProfileNeighbours, exclude)) {
            if (auto track = get_track(hit.id)) tracks.push_back(std::move(*track));
        }
    }
    return tracks;
}

std::vector<MergedCandidate> Engine::neighbours(UserState& state, const std::vector<std::string>& seed_ids,
                                                const std::vector<float>* query, size_t limit,
                                                const std::unordered_set<std::string>& exclude,
                                                int64_t now) {
    std::unordered_set<std::string> skip(exclude);
    skip.insert(seed_ids.begin(), seed_ids.end());

    std::vector<SearchHit> hits;
    if (query) hits = index_.search(*query, limit, skip);

    std::unordered_map<std::string, CoOccurrenceEntry> partners;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        // Days elapsed since the last decay are applied before counts are read
        if (now > 0) {
            state.cooccurrence.apply_decay(now);
            state.preferences.apply_decay(now);
        }
        for (const auto& seed : seed_ids) {
            for (const auto& entry : state.cooccurrence.get_co_occurring(seed, std::nullopt, limit * 2)) {
                if (skip.count(entry.track_id)) continue;
                auto& p = partners[entry.track_id];
                p.track_id = entry.track_id;
                p.count += entry.count;
                p.last_seen = std::max(p.last_seen, entry.last_seen);
            }
        }
    }

    std::vector<CoOccurrenceEntry> collaborative;
    collaborative.reserve(partners.size());
    for (auto& [id, entry] : partners) collaborative.push_back(std::move(entry));
    std::sort(collaborative.begin(), collaborative.end(), [](const auto& a, const auto& b) {
        return a.count != b.count ? a.count > b.count : a.track_id < b.track_id;
    });
    if (collaborative.size() > limit) collaborative.resize(limit);

    return CoOccurrenceMatrix::merge_candidates(hits, collaborative, limit);
}

std::vector<MergedCandidate> Engine::similar_tracks(const std::string& user_id,
                                                    const std::vector<std::string>& seed_ids,
                                                    size_t limit, int64_t now) {
    UserState& state = user_state(user_id);
    if (now == 0) now = utils::current_timestamp_ms();

    std::vector<float> query(kEmbeddingDim, 0.0f);
    bool has_query = false;
    for (const auto& id : seed_ids) {
        auto track = get_track(id);
        if (!track) continue;
        if (auto embedding = embedding_of(*track)) {
            for (size_t i = 0; i < query.size() && i < embedding->size(); ++i) query[i] += (*embedding)[i];
            has_query = true;
        }
    }
    if (has_query) has_query = utils::normalize_in_place(query);

    return neighbours(state, seed_ids, has_query ? &query : nullptr, limit, {}, now);
}

std::vector<ScoredTrack> Engine::rank_candidates(const std::string& user_id,
                                                 const std::vector<Track>& candidates,
                                                 const ScoringContext& context) {
    UserState& state = user_state(user_id);
    ScoringContext ctx = context;
    if (ctx.time.timestamp == 0) ctx.time = time_context(utils::current_timestamp_ms());

    UserSnapshot user = snapshot(state, ctx.time);
    auto scored = scoring_->score_batch(candidates, ctx, user,
                                        [this](const Track& track) { return embedding_of(track); });

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredTrack& a, const ScoredTrack& b) {
        return a.final_score > b.final_score;
    });
    return scored;
}

std::vector<ScoredTrack> Engine::get_next_tracks(const std::string& user_id, int count, FetchRequest request) {
    if (count <= 0) return {};
    UserState& state = user_state(user_id);
    if (request.time.timestamp == 0) request.time = time_context(utils::current_timestamp_ms());
    request.batch_size = count;

    UserSnapshot user = snapshot(state, request.time);
    if (request.available_tracks.empty()) request.available_tracks = default_candidates(user);

    return state.controller->fetch_more_tracks(request, user);
}

ReplenishResult Engine::check_and_replenish(const std::string& user_id, FetchRequest request) {
    UserState& state = user_state(user_id);
    if (request.time.timestamp == 0) request.time = time_context(utils::current_timestamp_ms());

    UserSnapshot user = snapshot(state, request.time);
    if (request.available_tracks.empty()) request.available_tracks = default_candidates(user);

    ReplenishResult result = state.controller->check_and_replenish(request, user);

    if (!result.added.empty() && state.controller->mode() == QueueMode::Radio) {
        auto seed = state.controller->radio_seed();
        if (seed && seed->type == RadioSeedType::Track) {
            std::vector<std::string> ids;
            for (const auto& queued : result.added) ids.push_back(queued.track.id);
            std::lock_guard<std::mutex> lock(state.mutex);
            state.cooccurrence.record_radio(seed->id, ids, request.time.timestamp);
        }
    }
    return result;
}

void Engine::record_track_played(const std::string& user_id, const Track& track, int64_t now) {
    user_state(user_id).controller->record_track_played(track, now);
}

std::optional<std::vector<float>> Engine::taste_profile(const std::string& user_id, const TimeContext& time) {
    UserState& state = user_state(user_id);
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.profile.get_profile(time);
}

/* ============================================================================
 * Queue Modes
 * ============================================================================ */

void Engine::start_radio(const std::string& user_id, const RadioSeed& seed, int64_t now) {
    RadioSeed enriched = seed;
    if (seed.type == RadioSeedType::Track) {
        if (auto track = get_track(seed.id)) {
            if (enriched.name.empty()) enriched.name = track->title;
            if (enriched.genres.empty()) enriched.genres = track->genres;
            if (enriched.artist_ids.empty()) {
                for (const auto& a : track->artists) enriched.artist_ids.push_back(a.id.empty() ? a.name : a.id);
            }
            if (!enriched.audio_features) enriched.audio_features = track->audio_features;
        }
    }
    user_state(user_id).controller->start_radio(enriched, now);
}

void Engine::stop_radio(const std::string& user_id) {
    user_state(user_id).controller->stop_radio();
}

bool Engine::enable_auto_queue(const std::string& user_id) {
    return user_state(user_id).controller->enable_auto_queue();
}

void Engine::disable_auto_queue(const std::string& user_id) {
    user_state(user_id).controller->disable_auto_queue();
}

QueueMode Engine::queue_mode(const std::string& user_id) {
    return user_state(user_id).controller->mode();
}

std::unordered_map<std::string, QueueSource> Engine::queue_sources(const std::string& user_id) {
    return user_state(user_id).controller->queue_sources();
}

std::string Engine::queue_error(const std::string& user_id) {
    return user_state(user_id).controller->last_error();
}

void Engine::set_queue_config(const SmartQueueConfig& config) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    config_.queue = config;
    for (auto& [id, state] : users_) state->controller->set_config(config);
}

void Engine::set_radio_config(const RadioConfig& config) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    config_.radio = config;
    for (auto& [id, state] : users_) state->controller->set_radio_config(config);
}

/* ============================================================================
 * Maintenance and Persistence
 * ============================================================================ */

void Engine::run_maintenance(int64_t now) {
    std::vector<std::pair<std::string, UserState*>> states;
    {
        std::lock_guard<std::mutex> lock(users_mutex_);
        for (auto& [id, state] : users_) states.emplace_back(id, state.get());
    }

    for (auto& [id, state] : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->preferences.apply_decay(now);
        size_t pruned = state->cooccurrence.apply_decay(now);
        if (pruned > 0) {
            utils::log(utils::LogLevel::Info, "Engine", "Pruned %zu co-occurrence pairs for %s",
                       pruned, id.c_str());
        }
    }
}

bool Engine::save_user(const std::string& user_id) {
    UserState& state = user_state(user_id);
    std::vector<uint8_t> profile, prefs, cooc;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        profile = state.profile.serialize();
        prefs = state.preferences.serialize();
        cooc = state.cooccurrence.serialize();
    }

    bool ok = storage_->set(profile_key(user_id), profile);
    ok = storage_->set(prefs_key(user_id), prefs) && ok;
    ok = storage_->set(cooc_key(user_id), cooc) && ok;
    if (!ok) set_error("Failed to save state for user " + user_id);
    return ok;
}

bool Engine::load_user(const std::string& user_id) {
    UserState& state = user_state(user_id);
    auto profile = storage_->get(profile_key(user_id));
    auto prefs = storage_->get(prefs_key(user_id));
    auto cooc = storage_->get(cooc_key(user_id));

    bool ok = true;
    std::lock_guard<std::mutex> lock(state.mutex);
    if (profile && !state.profile.deserialize(*profile)) {
        utils::log(utils::LogLevel::Warn, "Engine", "Discarding corrupt taste profile for %s", user_id.c_str());
        ok = false;
    }
    if (prefs && !state.preferences.deserialize(*prefs)) {
        utils::log(utils::LogLevel::Warn, "Engine", "Discarding corrupt preferences for %s", user_id.c_str());
        ok = false;
    }
    if (cooc && !state.cooccurrence.deserialize(*cooc)) {
        utils::log(utils::LogLevel::Warn, "Engine", "Discarding corrupt co-occurrence for %s", user_id.c_str());
        ok = false;
    }
    return ok;
}

bool Engine::save_index() {
    bool ok = storage_->set(kEmbeddingsKey, embeddings_.serialize());
    ok = storage_->set(kIndexKey, index_.serialize()) && ok;
    if (!ok) set_error("Failed to save index");
    return ok;
}

bool Engine::load_index() {
    bool ok = true;

    if (auto data = storage_->get(kEmbeddingsKey)) {
        if (!embeddings_.deserialize(*data)) {
            utils::log(utils::LogLevel::Warn, "Engine", "Discarding corrupt embedding cache");
            ok = false;
        }
    }

    if (auto data = storage_->get(kIndexKey)) {
        if (!index_.deserialize(*data)) {
            utils::log(utils::LogLevel::Warn, "Engine", "Stored index rejected, rebuilding from catalog");
            rebuild_index();
            return false;
        }
        // The stored graph predates tracks added since it was saved; those
        // are inserted now, persisted ones come back unchanged
        size_t stored = index_.size();
        index_catalog();
        utils::log(utils::LogLevel::Info, "Engine", "Loaded index with %zu tracks, %zu added from catalog",
                   stored, index_.size() - stored);
    }
    return ok;
}

bool Engine::save_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(users_mutex_);
        for (const auto& [id, state] : users_) ids.push_back(id);
    }

    bool ok = save_index();
    for (const auto& id : ids) ok = save_user(id) && ok;
    return ok;
}

} // namespace cadence
