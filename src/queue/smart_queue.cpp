/**
 * Cadence Engine - Smart Queue Controller Implementation
 */

#include "smart_queue.h"
#include "../core/async.h"
#include "../core/utils.h"
#include <algorithm>
#include <chrono>

namespace cadence {

namespace {

constexpr int kProviderSimilarLimit = 20;
constexpr size_t kLibrarySimilarLimit = 20;
constexpr size_t kTopGenreLimit = 10;
constexpr size_t kSearchResultLimit = 15;
constexpr size_t kMaxSearchQueries = 3;
constexpr size_t kTrendingLimit = 20;
constexpr size_t kSearchThreshold = 20;
constexpr size_t kTrendingThreshold = 10;

using Clock = std::chrono::steady_clock;

void append(std::vector<Track>& out, std::vector<Track> tracks, size_t limit = SIZE_MAX) {
    if (tracks.size() > limit) tracks.resize(limit);
    out.insert(out.end(), std::make_move_iterator(tracks.begin()), std::make_move_iterator(tracks.end()));
}

std::string artist_key(const Artist& artist) {
    return artist.id.empty() ? artist.name : artist.id;
}

}

const char* queue_source_type_name(QueueSourceType type) {
    switch (type) {
        case QueueSourceType::Manual: return "manual";
        case QueueSourceType::Artist: return "artist";
        case QueueSourceType::Album: return "album";
        case QueueSourceType::Genre: return "genre";
        case QueueSourceType::Similar: return "similar";
        case QueueSourceType::Radio: return "radio";
        case QueueSourceType::Mood: return "mood";
        case QueueSourceType::Discovery: return "discovery";
        case QueueSourceType::Trending: return "trending";
        case QueueSourceType::Search: return "search";
        case QueueSourceType::Liked: return "liked";
        case QueueSourceType::Playlist: return "playlist";
        case QueueSourceType::ML: return "ml";
        case QueueSourceType::Auto: return "auto";
    }
    return "auto";
}

SmartQueueController::SmartQueueController(const SmartQueueConfig& config,
                                           const RadioConfig& radio_config,
                                           std::shared_ptr<ScoringEngine> scoring,
                                           QueueCollaborators collaborators)
    : config_(config)
    , radio_config_(radio_config)
    , scoring_(std::move(scoring))
    , collaborators_(std::move(collaborators)) {
    if (config_.auto_queue_enabled) mode_ = QueueMode::AutoQueue;
}

SmartQueueConfig SmartQueueController::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void SmartQueueController::set_config(const SmartQueueConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool radio = mode_ == QueueMode::Radio;
    config_ = config;
    if (radio) {
        config_.auto_queue_enabled = false;
    } else {
        mode_ = config_.auto_queue_enabled ? QueueMode::AutoQueue : QueueMode::Manual;
    }
}

void SmartQueueController::set_radio_config(const RadioConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    radio_config_ = config;
}

void SmartQueueController::set_catalog(std::shared_ptr<CatalogService> catalog) {
    std::lock_guard<std::mutex> lock(mutex_);
    collaborators_.catalog = std::move(catalog);
}

/* ============================================================================
 * Modes
 * ============================================================================ */

bool SmartQueueController::enable_auto_queue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == QueueMode::Radio) {
        utils::log(utils::LogLevel::Info, "SmartQueue", "Auto-queue refused while radio is active");
        return false;
    }
    mode_ = QueueMode::AutoQueue;
    config_.auto_queue_enabled = true;
    return true;
}

void SmartQueueController::disable_auto_queue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == QueueMode::AutoQueue) mode_ = QueueMode::Manual;
    config_.auto_queue_enabled = false;
}

void SmartQueueController::start_radio(const RadioSeed& seed, int64_t now) {
    RadioSeed enriched = seed;
    if (seed.type == RadioSeedType::Track && !seed.audio_features) {
        if (auto features = fetch_audio_features(seed.id)) {
            enriched.audio_features = features;
            utils::log(utils::LogLevel::Info, "SmartQueue", "Enriched seed %s with audio features",
                       seed.id.c_str());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = QueueMode::Radio;
    config_.auto_queue_enabled = false;
    radio_seed_ = std::move(enriched);
    radio_tracks_played_ = 0;
    reset_session_locked(now);
    last_error_.clear();
    consecutive_failures_ = 0;

    utils::log(utils::LogLevel::Info, "SmartQueue", "Starting radio with seed %s",
               radio_seed_->name.empty() ? radio_seed_->id.c_str() : radio_seed_->name.c_str());
}

void SmartQueueController::stop_radio() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == QueueMode::Radio) mode_ = QueueMode::Manual;
    radio_seed_.reset();
    radio_tracks_played_ = 0;
    utils::log(utils::LogLevel::Info, "SmartQueue", "Radio stopped");
}

QueueMode SmartQueueController::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

std::optional<RadioSeed> SmartQueueController::radio_seed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return radio_seed_;
}

int SmartQueueController::radio_tracks_played() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return radio_tracks_played_;
}

std::string SmartQueueController::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

int SmartQueueController::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

std::vector<std::string> SmartQueueController::session_played_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(played_track_ids_.begin(), played_track_ids_.end());
}

std::unordered_map<std::string, QueueSource> SmartQueueController::queue_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_sources_;
}

std::optional<QueueSource> SmartQueueController::queue_source(const std::string& track_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queue_sources_.find(track_id);
    if (it == queue_sources_.end()) return std::nullopt;
    return it->second;
}

/* ============================================================================
 * Session
 * ============================================================================ */

void SmartQueueController::reset_session_locked(int64_t now) {
    played_track_ids_.clear();
    played_artist_ids_.clear();
    session_start_ = now;
    last_activity_ = now;
}

void SmartQueueController::record_track_played(const Track& track, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_activity_ != 0 && now - last_activity_ > config_.session_timeout_ms) {
        utils::log(utils::LogLevel::Info, "SmartQueue", "Session expired, starting a new one");
        reset_session_locked(now);
    }
    if (session_start_ == 0) session_start_ = now;

    played_track_ids_.push_back(track.id);
    for (const auto& artist : track.artists) played_artist_ids_.push_back(artist_key(artist));

    while (played_track_ids_.size() > config_.max_session_history) played_track_ids_.pop_front();
    while (played_artist_ids_.size() > config_.max_session_history * 2) played_artist_ids_.pop_front();

    if (mode_ == QueueMode::Radio) radio_tracks_played_++;
    last_activity_ = now;
}

/* ============================================================================
 * Collaborator Calls
 * ============================================================================ */

int64_t SmartQueueController::request_timeout_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.request_timeout_ms;
}

std::optional<AudioFeatures> SmartQueueController::fetch_audio_features(const std::string& track_id) {
    if (!collaborators_.providers || track_id.empty()) return std::nullopt;

    auto deadline = Clock::now() + std::chrono::milliseconds(request_timeout_ms());
    for (auto& provider : collaborators_.providers->with_capability(kCapabilityAudioFeatures)) {
        auto future = launch_detached([provider, track_id]() {
            auto features = provider->audio_features(track_id);
            return features ? std::vector<AudioFeatures>{*features} : std::vector<AudioFeatures>{};
        });
        auto result = await_branch(future, deadline, "SmartQueue", "Audio features");
        if (!result.empty() && !result.front().empty()) return result.front();
    }
    return std::nullopt;
}

std::unordered_map<std::string, float> SmartQueueController::fetch_plugin_scores(
    const std::vector<Track>& tracks) {
    std::unordered_map<std::string, float> scores;
    if (!collaborators_.providers || tracks.empty()) return scores;

    using ScoreList = std::vector<std::pair<std::string, float>>;
    auto providers = collaborators_.providers->with_capability(kCapabilityTrackScoring);
    auto deadline = Clock::now() + std::chrono::milliseconds(request_timeout_ms());

    std::vector<std::future<ScoreList>> futures;
    for (auto& provider : providers) {
        futures.push_back(launch_detached([provider, tracks]() {
            ScoreList list;
            for (const auto& track : tracks) {
                if (auto s = provider->score(track)) list.emplace_back(track.id, *s);
            }
            return list;
        }));
    }

    std::unordered_map<std::string, int> counts;
    for (auto& future : futures) {
        for (const auto& [id, s] : await_branch(future, deadline, "SmartQueue", "Plugin scoring")) {
            scores[id] += utils::clamp(s, 0.0f, 100.0f);
            counts[id]++;
        }
    }
    for (auto& [id, s] : scores) s /= static_cast<float>(counts[id]);
    return scores;
}

SmartQueueController::Candidates SmartQueueController::gather_candidates(
    const FetchRequest& request, const UserSnapshot& user,
    QueueMode mode, const std::optional<RadioSeed>& seed) {

    Candidates out;
    const Track* current = request.queue.current();
    auto deadline = Clock::now() + std::chrono::milliseconds(request_timeout_ms());

    // Local library
    out.local = request.available_tracks;

    // Provider similar tracks (ids, resolved locally)
    std::vector<std::future<std::vector<std::string>>> provider_futures;
    if (current && collaborators_.providers) {
        std::string id = current->id;
        for (auto& provider : collaborators_.providers->with_capability(kCapabilitySimilarTracks)) {
            provider_futures.push_back(launch_detached([provider, id]() {
                return provider->similar_tracks(id, kProviderSimilarLimit);
            }));
        }
    }

    // Catalog similar and recommended tracks
    std::shared_ptr<CatalogService> catalog;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog = collaborators_.catalog;
    }
    std::future<std::vector<Track>> api_similar, radio_recs, artist_recs, genre_recs;
    std::vector<std::future<std::vector<Track>>> top_genre_recs;

    if (catalog) {
        if (current) {
            std::string id = current->id;
            api_similar = launch_detached([catalog, id]() { return catalog->similar_tracks(id); });
        }

        if (mode == QueueMode::Radio && seed) {
            RecommendationKind kind = seed->type == RadioSeedType::Genre ? RecommendationKind::Genre
                                                                         : RecommendationKind::Artist;
            std::string key = seed->id;
            if (seed->type == RadioSeedType::Track && !seed->artist_ids.empty()) key = seed->artist_ids.front();
            if (seed->type == RadioSeedType::Genre && !seed->name.empty()) key = seed->name;
            radio_recs = launch_detached([catalog, kind, key]() { return catalog->recommended_tracks(kind, key); });
        }

        if (current && !current->artists.empty()) {
            std::string key = artist_key(current->artists.front());
            artist_recs = launch_detached([catalog, key]() {
                return catalog->recommended_tracks(RecommendationKind::Artist, key);
            });
        }

        std::string current_genre;
        if (current && !current->genres.empty()) {
            current_genre = current->genres.front();
            genre_recs = launch_detached([catalog, current_genre]() {
                return catalog->recommended_tracks(RecommendationKind::Genre, current_genre);
            });
        }

        for (size_t i = 0; i < user.top_genres.size() && i < 2; ++i) {
            std::string genre = user.top_genres[i];
            if (genre == utils::to_lower(current_genre)) continue;
            top_genre_recs.push_back(launch_detached([catalog, genre]() {
                return catalog->recommended_tracks(RecommendationKind::Genre, genre);
            }));
        }
    }

    // Local embedding/co-occurrence neighbours, computed while remote calls run
    std::vector<Track> library_similar;
    if (current && collaborators_.similar_in_library) {
        std::unordered_set<std::string> exclude{current->id};
        try {
            library_similar = collaborators_.similar_in_library(*current, kLibrarySimilarLimit, exclude,
                                                                request.time.timestamp);
        } catch (const std::exception& e) {
            utils::log(utils::LogLevel::Warn, "SmartQueue", "Library similarity failed: %s", e.what());
        } catch (...) {
            utils::log(utils::LogLevel::Warn, "SmartQueue", "Library similarity failed: unknown error");
        }
    }

    // Gather
    for (auto& future : provider_futures) {
        for (const auto& id : await_branch(future, deadline, "SmartQueue", "Provider similar")) {
            if (!collaborators_.resolve_track) break;
            if (auto track = collaborators_.resolve_track(id)) out.similar.push_back(std::move(*track));
        }
    }
    append(out.similar, await_branch(api_similar, deadline, "SmartQueue", "Catalog similar"));
    append(out.similar, std::move(library_similar));

    append(out.discovery, await_branch(radio_recs, deadline, "SmartQueue", "Radio seed recommendations"));
    append(out.discovery, await_branch(artist_recs, deadline, "SmartQueue", "Artist recommendations"));
    append(out.discovery, await_branch(genre_recs, deadline, "SmartQueue", "Genre recommendations"));
    for (auto& future : top_genre_recs) {
        append(out.discovery, await_branch(future, deadline, "SmartQueue", "Top genre recommendations"),
               kTopGenreLimit);
    }

    // Smart search queries
    if (catalog && out.discovery.size() < kSearchThreshold) {
        std::vector<std::string> queries;
        std::string current_artist;
        if (current && !current->artists.empty() && !current->artists.front().name.empty()) {
            current_artist = current->artists.front().name;
            queries.push_back(current_artist + " fans also like");
            queries.push_back("similar to " + current_artist);
        }
        if (current && !current->genres.empty()) {
            queries.push_back("best " + current->genres.front());
            queries.push_back(current->genres.front() + " playlist");
        }
        for (size_t i = 0; i < user.top_artists.size() && i < 3; ++i) {
            if (user.top_artists[i] != utils::to_lower(current_artist)) {
                queries.push_back(user.top_artists[i] + " popular songs");
            }
        }
        if (queries.size() > kMaxSearchQueries) queries.resize(kMaxSearchQueries);

        auto search_deadline = Clock::now() + std::chrono::milliseconds(request_timeout_ms());
        std::vector<std::future<std::vector<Track>>> searches;
        for (const auto& query : queries) {
            searches.push_back(launch_detached([catalog, query]() { return catalog->search(query); }));
        }
        for (auto& future : searches) {
            append(out.discovery, await_branch(future, search_deadline, "SmartQueue", "Search"),
                   kSearchResultLimit);
        }
    }

    // Trending fallback
    if (catalog && out.discovery.size() < kTrendingThreshold) {
        auto trending_deadline = Clock::now() + std::chrono::milliseconds(request_timeout_ms());
        auto trending = launch_detached([catalog]() { return catalog->trending(); });
        append(out.discovery, await_branch(trending, trending_deadline, "SmartQueue", "Trending"),
               kTrendingLimit);
    }

    // Cached search results
    append(out.discovery, request.cached_search_results);

    utils::log(utils::LogLevel::Debug, "SmartQueue", "Source breakdown - Local: %zu, Similar: %zu, Discovery: %zu",
               out.local.size(), out.similar.size(), out.discovery.size());
    return out;
}

/* ============================================================================
 * Selection
 * ============================================================================ */

std::vector<Track> SmartQueueController::interleave(const std::vector<Track>& similar,
                                                    const std::vector<Track>& discovery,
                                                    const std::vector<Track>& local) {
    std::vector<Track> out(similar);
    out.reserve(similar.size() + discovery.size() + local.size());

    size_t d = 0, l = 0;
    while (d < discovery.size() || l < local.size()) {
        if (d < discovery.size()) out.push_back(discovery[d++]);
        if (d < discovery.size()) out.push_back(discovery[d++]);
        if (l < local.size()) out.push_back(local[l++]);
    }
    return out;
}

ExplorationMode SmartQueueController::mode_for_ratio(size_t discovery_count, size_t local_count) {
    float ratio = static_cast<float>(discovery_count) /
                  static_cast<float>(std::max<size_t>(1, local_count + discovery_count));
    if (ratio > 0.6f) return ExplorationMode::Exploit;
    if (ratio < 0.3f) return ExplorationMode::Explore;
    return ExplorationMode::Balanced;
}

std::vector<ScoredTrack> SmartQueueController::apply_diversity_filter(const std::vector<ScoredTrack>& tracks,
                                                                      size_t limit, int max_per_artist) {
    std::vector<ScoredTrack> result;
    std::vector<bool> taken(tracks.size(), false);
    std::unordered_map<std::string, int> artist_counts;

    for (size_t i = 0; i < tracks.size() && result.size() < limit; ++i) {
        int& count = artist_counts[tracks[i].track.primary_artist()];
        if (count < max_per_artist) {
            result.push_back(tracks[i]);
            taken[i] = true;
            count++;
        }
    }

    // Back-fill from what the cap left out
    for (size_t i = 0; i < tracks.size() && result.size() < limit; ++i) {
        if (!taken[i]) result.push_back(tracks[i]);
    }
    return result;
}

std::vector<ScoredTrack> SmartQueueController::fetch_more_tracks(const FetchRequest& request,
                                                                 const UserSnapshot& user) {
    QueueMode mode;
    std::optional<RadioSeed> seed;
    int radio_played;
    RadioConfig radio_config;
    SmartQueueConfig config;
    std::unordered_set<std::string> exclude;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mode = mode_;
        seed = radio_seed_;
        radio_played = radio_tracks_played_;
        radio_config = radio_config_;
        config = config_;
        exclude.insert(played_track_ids_.begin(), played_track_ids_.end());
    }
    for (const auto& t : request.queue.tracks) exclude.insert(t.id);
    exclude.insert(user.disliked.begin(), user.disliked.end());

    const Track* current = request.queue.current();
    utils::log(utils::LogLevel::Debug, "SmartQueue", "Gathering candidates, current track: %s",
               current ? current->title.c_str() : "none");

    Candidates sources = gather_candidates(request, user, mode, seed);
    size_t local_count = sources.local.size();
    size_t discovery_count = sources.discovery.size() + sources.similar.size();

    // Deduplicate by id and by near-identical title
    std::unordered_set<std::string> seen;
    std::vector<std::string> seen_titles;
    if (current && !current->title.empty()) {
        seen_titles.push_back(utils::normalize_title(current->title));
    }
    int index = request.queue.index;
    if (index >= 0) {
        int last = std::min(index, static_cast<int>(request.queue.tracks.size()) - 1);
        for (int i = std::max(0, index - 3); i <= last; ++i) {
            std::string norm = utils::normalize_title(request.queue.tracks[i].title);
            if (norm.empty()) continue;
            if (std::find(seen_titles.begin(), seen_titles.end(), norm) == seen_titles.end()) {
                seen_titles.push_back(norm);
            }
        }
    }

    std::vector<Track> candidates;
    for (auto& track : interleave(sources.similar, sources.discovery, sources.local)) {
        if (track.id.empty() || seen.count(track.id) || exclude.count(track.id)) continue;

        std::string norm = utils::normalize_title(track.title);
        if (!norm.empty()) {
            bool too_similar = std::any_of(seen_titles.begin(), seen_titles.end(), [&](const std::string& t) {
                return norm == t || utils::titles_too_similar(track.title, t);
            });
            if (too_similar) {
                utils::log(utils::LogLevel::Debug, "SmartQueue", "Filtered out similar title: \"%s\"",
                           track.title.c_str());
                continue;
            }
            seen_titles.push_back(norm);
        }

        seen.insert(track.id);
        candidates.push_back(std::move(track));
    }

    utils::log(utils::LogLevel::Debug, "SmartQueue", "%zu unique candidates after deduplication",
               candidates.size());

    if (candidates.empty()) {
        utils::log(utils::LogLevel::Warn, "SmartQueue", "No candidates available");
        return {};
    }

    // Scoring context from the recent part of the queue
    ScoringContext context;
    context.time = request.time;
    context.mode = mode;
    context.exploration = mode_for_ratio(discovery_count, local_count);
    if (index >= 0) {
        int last = std::min(index, static_cast<int>(request.queue.tracks.size()) - 1);
        for (int i = std::max(0, index - 5); i <= last; ++i) {
            context.session_tracks.push_back(request.queue.tracks[i]);
        }
    }
    if (current) {
        context.previous_features = current->audio_features ? current->audio_features
                                                            : fetch_audio_features(current->id);
    }
    context.plugin_scores = fetch_plugin_scores(candidates);

    auto scored = scoring_->score_batch(candidates, context, user, collaborators_.embedding_of);

    if (mode == QueueMode::Radio && seed) {
        float weight = ScoringEngine::radio_seed_weight(radio_config, radio_played);
        for (auto& s : scored) {
            float relevance = ScoringEngine::seed_relevance(s.track, *seed);
            s.components.base = ScoringEngine::blend_radio(s.components.base, relevance, weight);
            s.final_score = ScoringEngine::combine(s.components, scoring_->weights(), context.exploration);
            if (relevance >= 50.0f) s.explanation.push_back("Close to the station seed");
        }
    }

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredTrack& a, const ScoredTrack& b) {
        return a.final_score > b.final_score;
    });

    for (size_t i = 0; i < scored.size() && i < 5; ++i) {
        utils::log(utils::LogLevel::Debug, "SmartQueue", "  %zu. %s by %s (%.1f)", i + 1,
                   scored[i].track.title.c_str(), scored[i].track.primary_artist().c_str(),
                   scored[i].final_score);
    }

    size_t batch = static_cast<size_t>(request.batch_size > 0 ? request.batch_size : config.batch_size);
    std::vector<ScoredTrack> selected;
    if (config.limit_artist_repetition) {
        selected = apply_diversity_filter(scored, batch, config.max_artist_per_batch);
    } else {
        selected.assign(scored.begin(), scored.begin() + std::min(batch, scored.size()));
    }

    utils::log(utils::LogLevel::Info, "SmartQueue", "Selected %zu tracks for queue", selected.size());
    return selected;
}

/* ============================================================================
 * Replenishment
 * ============================================================================ */

ReplenishResult SmartQueueController::check_and_replenish(const FetchRequest& request,
                                                          const UserSnapshot& user) {
    ReplenishResult result;
    const int64_t now = request.time.timestamp;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_ == QueueMode::Manual) return result;
        if (!config_.auto_queue_enabled && mode_ != QueueMode::Radio) return result;
        if (last_fetch_ != 0 && now - last_fetch_ < config_.min_fetch_interval_ms) return result;
        if (request.queue.remaining() > config_.auto_queue_threshold) return result;

        if (last_activity_ != 0 && now - last_activity_ > config_.session_timeout_ms) {
            reset_session_locked(now);
        }
    }

    bool expected = false;
    if (!fetching_.compare_exchange_strong(expected, true)) return result;

    struct FetchingGuard {
        std::atomic<bool>& flag;
        ~FetchingGuard() { flag = false; }
    } guard{fetching_};

    result.attempted = true;
    utils::log(utils::LogLevel::Info, "SmartQueue", "Replenishing queue, remaining: %d",
               request.queue.remaining());

    std::vector<ScoredTrack> selected;
    std::string error;
    try {
        selected = fetch_more_tracks(request, user);
    } catch (const std::exception& e) {
        error = e.what();
        utils::log(utils::LogLevel::Error, "SmartQueue", "Fetch error: %s", e.what());
    } catch (...) {
        error = "unknown error";
        utils::log(utils::LogLevel::Error, "SmartQueue", "Fetch error: unknown error");
    }

    const Track* current = request.queue.current();

    std::lock_guard<std::mutex> lock(mutex_);
    last_fetch_ = now;

    if (selected.empty()) {
        last_error_ = error.empty() ? "No matching tracks found" : error;
        consecutive_failures_++;
        result.error = last_error_;
        return result;
    }

    for (const auto& s : selected) {
        QueueSource source = source_locked(s.track, current, user, now);
        source.score = s.final_score;
        queue_sources_[s.track.id] = source;
        result.added.push_back({s.track, source});
    }
    last_error_.clear();
    consecutive_failures_ = 0;

    utils::log(utils::LogLevel::Info, "SmartQueue", "Added %zu tracks to queue", result.added.size());
    return result;
}

/* ============================================================================
 * Source Attribution
 * ============================================================================ */

QueueSource SmartQueueController::determine_track_source(const Track& track, const Track* current,
                                                         const UserSnapshot& user, int64_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return source_locked(track, current, user, now);
}

QueueSource SmartQueueController::source_locked(const Track& track, const Track* current,
                                                const UserSnapshot& user, int64_t now) const {
    QueueSource source;
    source.timestamp = now;

    if (mode_ == QueueMode::Radio && radio_seed_) {
        const RadioSeed& seed = *radio_seed_;

        if (seed.type == RadioSeedType::Artist) {
            bool from_seed = std::any_of(track.artists.begin(), track.artists.end(), [&](const Artist& a) {
                return a.id == seed.id || utils::to_lower(a.name) == utils::to_lower(seed.name);
            });
            if (from_seed) {
                source.type = QueueSourceType::Artist;
                source.label = "More from " + seed.name;
                source.context = seed.name;
                source.seed_track_id = seed.id;
                return source;
            }
        }

        if (seed.type == RadioSeedType::Genre) {
            source.type = QueueSourceType::Genre;
            source.label = seed.name + " radio";
            source.context = seed.name;
            return source;
        }

        if (seed.type == RadioSeedType::Track) {
            source.type = QueueSourceType::Similar;
            source.label = "Similar to " + seed.name;
            source.context = seed.name;
            source.seed_track_id = seed.id;
            return source;
        }

        source.type = QueueSourceType::Radio;
        source.label = seed.name + " Radio";
        source.context = seed.name;
        return source;
    }

    if (user.liked.count(track.id)) {
        source.type = QueueSourceType::Liked;
        source.label = "From your Likes";
        return source;
    }

    if (current) {
        for (const auto& a : track.artists) {
            bool shared = std::any_of(current->artists.begin(), current->artists.end(), [&](const Artist& ca) {
                return utils::to_lower(ca.name) == utils::to_lower(a.name) || (!a.id.empty() && ca.id == a.id);
            });
            if (shared) {
                source.type = QueueSourceType::Artist;
                source.label = "More from " + a.name;
                source.context = a.name;
                source.seed_track_id = current->id;
                return source;
            }
        }

        if (!current->album_id.empty() && track.album_id == current->album_id) {
            source.type = QueueSourceType::Album;
            source.label = "From " + current->album_title;
            source.context = current->album_title;
            source.seed_track_id = current->id;
            return source;
        }

        for (const auto& g : current->genres) {
            std::string genre = utils::to_lower(g);
            bool shared = std::any_of(track.genres.begin(), track.genres.end(), [&](const std::string& tg) {
                return utils::to_lower(tg) == genre;
            });
            if (shared) {
                source.type = QueueSourceType::Genre;
                source.label = g + " vibes";
                source.context = g;
                source.seed_track_id = current->id;
                return source;
            }
        }
    }

    source.type = QueueSourceType::ML;
    source.label = "Recommended for you";
    if (current) source.seed_track_id = current->id;
    return source;
}

} // namespace cadence
