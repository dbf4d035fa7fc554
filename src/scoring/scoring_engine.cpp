/**
 * Cadence Engine - Scoring Engine Implementation
 */

#include "scoring_engine.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace cadence {

namespace {

constexpr float kLikedGenreThreshold = 20.0f;
constexpr float kHighEnergy = 0.7f;
constexpr float kFocusEnergy = 0.5f;
constexpr float kRelaxEnergy = 0.4f;

std::vector<std::string> lower_genres(const Track& track) {
    std::vector<std::string> genres;
    genres.reserve(track.genres.size());
    for (const auto& g : track.genres) genres.push_back(utils::to_lower(g));
    return genres;
}

std::optional<AudioFeatures> previous_features(const ScoringContext& context) {
    if (context.previous_features) return context.previous_features;
    if (!context.session_tracks.empty()) return context.session_tracks.back().audio_features;
    return std::nullopt;
}

}

ScoringEngine::ScoringEngine(const ScoringWeights& weights, uint32_t seed)
    : weights_(weights), rng_(seed) {}

bool ScoringEngine::roll_epsilon() {
    if (weights_.epsilon <= 0.0f) return false;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(rng_) < weights_.epsilon;
}

float ScoringEngine::combine(const ScoreComponents& c, const ScoringWeights& w, ExplorationMode mode) {
    float final_score = w.base * c.base
                      + w.exploration * c.exploration
                      + w.serendipity * c.serendipity
                      + w.diversity * c.diversity
                      + w.flow * c.flow
                      + w.temporal * c.temporal
                      + w.plugin * c.plugin;

    if (mode == ExplorationMode::Explore) {
        final_score += c.exploration * 0.5f;
    } else if (mode == ExplorationMode::Exploit) {
        final_score += c.base * 0.2f;
    }
    return final_score;
}

/* ============================================================================
 * Base (taste profile + affinities)
 * ============================================================================ */

float ScoringEngine::base_score(const Track& track, const UserSnapshot& user,
                                const std::optional<std::vector<float>>& embedding,
                                std::vector<std::string>& explanation) {
    float score = 50.0f;

    float artist_affinity = user.artist_score(track.primary_artist());
    score += 0.3f * artist_affinity;
    if (artist_affinity > kLikedGenreThreshold) explanation.push_back("Artist you like");

    if (!track.genres.empty()) {
        float sum = 0.0f;
        for (const auto& g : lower_genres(track)) sum += user.genre_score(g);
        score += 0.2f * (sum / static_cast<float>(track.genres.size()));
    }

    if (embedding && user.taste_profile) {
        float similarity = utils::cosine_similarity(*embedding, *user.taste_profile);
        score += 30.0f * similarity;
        if (similarity > 0.5f) explanation.push_back("Matches your taste");
    }

    if (user.liked.count(track.id)) {
        score += 10.0f;
        explanation.push_back("In your liked tracks");
    }

    return utils::clamp(score, 0.0f, 100.0f);
}

/* ============================================================================
 * Exploration
 * ============================================================================ */

float ScoringEngine::exploration_score(const Track& track, const UserSnapshot& user,
                                       std::vector<std::string>& explanation) {
    float score = 0.0f;

    if (!user.artist_history.count(track.primary_artist())) {
        score += 15.0f;
        explanation.push_back("New artist");
    }

    auto genres = lower_genres(track);
    if (!genres.empty()) {
        bool known = std::any_of(genres.begin(), genres.end(), [&](const std::string& g) {
            return user.genre_history.count(g) > 0;
        });
        if (!known) {
            score += 10.0f;
            explanation.push_back("New genre");
        }
    }

    if (roll_epsilon()) {
        score += 12.5f;
        explanation.push_back("Exploration pick");
    }

    score = std::min(score, 25.0f);
    return score * static_cast<float>(std::pow(0.9, user.play_count(track.id)));
}

/* ============================================================================
 * Serendipity
 * ============================================================================ */

float ScoringEngine::serendipity_score(const Track& track, const ScoringContext& context,
                                       const UserSnapshot& user, std::vector<std::string>& explanation) {
    auto genres = lower_genres(track);
    if (genres.empty()) return 0.0f;

    std::unordered_set<std::string> session_genres;
    for (const auto& t : context.session_tracks) {
        for (const auto& g : t.genres) session_genres.insert(utils::to_lower(g));
    }

    bool has_liked_genre = false;
    bool jump_to_liked = false;
    int history_genres = 0;
    for (const auto& g : genres) {
        bool liked = user.genre_score(g) > kLikedGenreThreshold;
        has_liked_genre = has_liked_genre || liked;
        if (liked && !context.session_tracks.empty() && !session_genres.count(g)) {
            jump_to_liked = true;
        }
        if (user.genre_history.count(g)) history_genres++;
    }

    float score = 0.0f;
    if (jump_to_liked) {
        score += 15.0f;
        explanation.push_back("Change of genre you enjoy");
    }
    if (has_liked_genre && !user.artist_history.count(track.primary_artist())) {
        score += 20.0f;
        explanation.push_back("Unexpected artist in a genre you like");
    }
    if (history_genres >= 2) {
        score += 10.0f;
        explanation.push_back("Bridges genres you listen to");
    }
    return std::min(score, 30.0f);
}

/* ============================================================================
 * Diversity
 * ============================================================================ */

float ScoringEngine::diversity_score(const Track& track, const ScoringContext& context,
                                     const std::unordered_map<std::string, int>& batch_artist_counts,
                                     std::vector<std::string>& explanation) {
    float score = 0.0f;

    auto it = batch_artist_counts.find(track.primary_artist());
    if (it != batch_artist_counts.end() && it->second > 0) {
        score += std::max(-90.0f, -30.0f * static_cast<float>(it->second));
        explanation.push_back("Artist already in this batch");
    }

    if (context.session_tracks.empty() || track.genres.empty()) return score;

    std::unordered_map<std::string, int> genre_counts;
    int total = 0;
    for (const auto& t : context.session_tracks) {
        for (const auto& g : t.genres) {
            genre_counts[utils::to_lower(g)]++;
            total++;
        }
    }

    float max_ratio = 0.0f;
    bool new_to_session = true;
    for (const auto& g : lower_genres(track)) {
        auto found = genre_counts.find(g);
        if (found == genre_counts.end()) continue;
        new_to_session = false;
        if (total > 0) {
            max_ratio = std::max(max_ratio, static_cast<float>(found->second) / static_cast<float>(total));
        }
    }

    if (max_ratio > 0.4f) {
        score -= 10.0f * (max_ratio - 0.4f);
        explanation.push_back("Genre is frequent this session");
    }
    if (new_to_session) {
        score += 15.0f;
        explanation.push_back("Adds variety");
    }
    return score;
}

/* ============================================================================
 * Flow
 * ============================================================================ */

float ScoringEngine::flow_score(const Track& track, const ScoringContext& context,
                                std::vector<std::string>& explanation) {
    auto previous = previous_features(context);
    if (!previous || !track.audio_features) return 0.0f;

    const AudioFeatures& prev = *previous;
    const AudioFeatures& cur = *track.audio_features;
    float score = 0.0f;

    if (prev.energy && cur.energy) {
        float diff = std::abs(*cur.energy - *prev.energy);
        if (diff <= 0.3f) {
            score += 15.0f * (1.0f - diff / 0.3f);
            explanation.push_back("Smooth energy transition");
        } else {
            score -= 20.0f * (diff - 0.3f);
        }
    }

    if (prev.bpm && cur.bpm && *prev.bpm > 0.0f && *cur.bpm > 0.0f) {
        float ratio = utils::bpm_difference_ratio(*prev.bpm, *cur.bpm);
        if (ratio < 0.15f) {
            score += 10.0f;
            explanation.push_back("Similar tempo");
        } else if (ratio < 0.3f) {
            score += 5.0f;
        } else {
            score -= 10.0f;
        }
    }

    if (prev.key && cur.key) {
        float compat = utils::key_compatibility(*prev.key, *cur.key);
        if (utils::fifths_distance(*prev.key, *cur.key) >= 0) {
            score += compat * 10.0f;
            if (compat >= 0.8f) explanation.push_back("Harmonically compatible");
        }
    }

    return score;
}

/* ============================================================================
 * Temporal
 * ============================================================================ */

float ScoringEngine::temporal_score(const Track& track, const ScoringContext& context,
                                    const UserSnapshot& user, std::vector<std::string>& explanation) {
    int hour = std::clamp(context.time.hour, 0, 23);
    const TimePattern& pattern = user.time_patterns[hour];
    float score = 0.0f;

    float genre_pref = 0.0f;
    for (const auto& g : lower_genres(track)) {
        genre_pref = std::max(genre_pref, pattern.genre_share(g));
    }
    if (genre_pref > 0.0f) {
        score += genre_pref * 100.0f * 0.25f;
        explanation.push_back("Fits what you play at this hour");
    }

    auto energy = track.energy();
    if (energy) {
        if (auto preferred = pattern.mean_energy()) {
            score += (1.0f - std::abs(*energy - *preferred)) * 50.0f * 0.25f;
        }

        bool weekend = context.time.is_weekend();
        TimeSlot slot = context.time.slot();
        if (weekend && *energy >= kHighEnergy) {
            score += 5.0f;
            explanation.push_back("Weekend energy");
        }
        if (!weekend && slot == TimeSlot::Morning && *energy <= kFocusEnergy) {
            score += 5.0f;
            explanation.push_back("Good for morning focus");
        }
        if (!weekend && slot == TimeSlot::Evening && *energy <= kRelaxEnergy) {
            score += 5.0f;
            explanation.push_back("Evening wind-down");
        }
    }

    return score;
}

/* ============================================================================
 * Scoring
 * ============================================================================ */

ScoredTrack ScoringEngine::score(const Track& track,
                                 const ScoringContext& context,
                                 const UserSnapshot& user,
                                 const std::optional<std::vector<float>>& embedding,
                                 const std::unordered_map<std::string, int>& batch_artist_counts) {
    ScoredTrack result;
    result.track = track;

    auto& c = result.components;
    c.base = base_score(track, user, embedding, result.explanation);
    c.exploration = exploration_score(track, user, result.explanation);
    c.serendipity = serendipity_score(track, context, user, result.explanation);
    c.diversity = diversity_score(track, context, batch_artist_counts, result.explanation);
    c.flow = flow_score(track, context, result.explanation);
    c.temporal = temporal_score(track, context, user, result.explanation);

    auto plugin = context.plugin_scores.find(track.id);
    if (plugin != context.plugin_scores.end()) {
        c.plugin = utils::clamp(plugin->second, 0.0f, 100.0f);
    }

    result.final_score = combine(c, weights_, context.exploration);
    return result;
}

std::vector<ScoredTrack> ScoringEngine::score_batch(const std::vector<Track>& tracks,
                                                    const ScoringContext& context,
                                                    const UserSnapshot& user,
                                                    const EmbeddingLookup& embedding_of) {
    std::vector<ScoredTrack> results;
    results.reserve(tracks.size());

    std::unordered_map<std::string, int> batch_artist_counts;
    for (const auto& track : tracks) {
        std::optional<std::vector<float>> embedding;
        if (embedding_of) embedding = embedding_of(track);

        results.push_back(score(track, context, user, embedding, batch_artist_counts));
        batch_artist_counts[track.primary_artist()]++;
    }
    return results;
}

/* ============================================================================
 * Radio
 * ============================================================================ */

float ScoringEngine::seed_relevance(const Track& track, const RadioSeed& seed) {
    float score = 0.0f;

    std::unordered_set<std::string> seed_genres;
    for (const auto& g : seed.genres) seed_genres.insert(utils::to_lower(g));
    if (seed.type == RadioSeedType::Genre) seed_genres.insert(utils::to_lower(seed.name));

    bool genre_match = std::any_of(track.genres.begin(), track.genres.end(), [&](const std::string& g) {
        return seed_genres.count(utils::to_lower(g)) > 0;
    });

    bool artist_match = false;
    for (const auto& artist : track.artists) {
        if (std::find(seed.artist_ids.begin(), seed.artist_ids.end(), artist.id) != seed.artist_ids.end()) {
            artist_match = true;
        }
        if (seed.type == RadioSeedType::Artist && !seed.name.empty() &&
            utils::to_lower(artist.name) == utils::to_lower(seed.name)) {
            artist_match = true;
        }
    }

    switch (seed.type) {
        case RadioSeedType::Track:
            if (artist_match) score += 30.0f;
            if (genre_match) score += 20.0f;
            break;
        case RadioSeedType::Artist:
            if (artist_match) score += 50.0f;
            if (genre_match) score += 20.0f;
            break;
        case RadioSeedType::Genre:
            if (genre_match) score += 60.0f;
            break;
    }

    if (seed.audio_features && track.audio_features) {
        const AudioFeatures& s = *seed.audio_features;
        const AudioFeatures& t = *track.audio_features;

        if (s.bpm && t.bpm && *s.bpm > 0.0f) {
            float ratio = utils::bpm_difference_ratio(*s.bpm, *t.bpm);
            if (ratio <= 0.1f) score += 12.0f;
            else if (ratio <= 0.2f) score += 8.0f;
            else if (ratio <= 0.3f) score += 4.0f;
        }

        if (s.energy && t.energy) {
            float diff = std::abs(*s.energy - *t.energy);
            if (diff <= 0.15f) score += 12.0f;
            else if (diff <= 0.25f) score += 8.0f;
            else if (diff <= 0.35f) score += 4.0f;
        }

        if (s.key && t.key && utils::fifths_distance(*s.key, *t.key) >= 0) {
            score += std::round(utils::key_compatibility(*s.key, *t.key) * 10.0f);
        }

        if (s.valence && t.valence) {
            float diff = std::abs(*s.valence - *t.valence);
            if (diff <= 0.2f) score += 6.0f;
            else if (diff <= 0.35f) score += 3.0f;
        }
    }

    return std::min(score, 100.0f);
}

float ScoringEngine::radio_seed_weight(const RadioConfig& config, int tracks_played) {
    if (!config.progressive_drift) return config.seed_weight;
    float weight = config.seed_weight - config.drift_per_track * static_cast<float>(std::max(0, tracks_played));
    return std::max(config.min_seed_weight, weight);
}

float ScoringEngine::blend_radio(float raw_score, float seed_relevance, float seed_weight) {
    return raw_score * (1.0f - seed_weight) + seed_relevance * seed_weight;
}

} // namespace cadence
