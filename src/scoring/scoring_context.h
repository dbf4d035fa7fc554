/**
 * Cadence Engine - Scoring Context
 *
 * Read-only inputs to the scoring engine. A UserSnapshot is captured under
 * the user's lock and then scored against without further locking.
 */

#ifndef CADENCE_SCORING_CONTEXT_H
#define CADENCE_SCORING_CONTEXT_H

#include "cadence/types.h"
#include "../learning/preference_store.h"
#include "../profile/taste_profile.h"
#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadence {

struct UserSnapshot {
    std::unordered_map<std::string, float> artist_affinity;
    std::unordered_map<std::string, float> genre_affinity;
    std::unordered_set<std::string> artist_history;
    std::unordered_set<std::string> genre_history;
    std::unordered_map<std::string, int> play_counts;
    std::unordered_set<std::string> liked;
    std::unordered_set<std::string> disliked;
    std::array<TimePattern, 24> time_patterns;
    std::optional<std::vector<float>> taste_profile;
    std::vector<std::string> top_artists;
    std::vector<std::string> top_genres;

    static UserSnapshot capture(const PreferenceStore& preferences,
                                const TasteProfileManager& profile,
                                const TimeContext& time);

    float artist_score(const std::string& artist) const {
        auto it = artist_affinity.find(artist);
        return it == artist_affinity.end() ? 0.0f : it->second;
    }

    float genre_score(const std::string& genre) const {
        auto it = genre_affinity.find(genre);
        return it == genre_affinity.end() ? 0.0f : it->second;
    }

    int play_count(const std::string& track_id) const {
        auto it = play_counts.find(track_id);
        return it == play_counts.end() ? 0 : it->second;
    }
};

struct ScoringContext {
    TimeContext time;
    std::vector<Track> session_tracks;              // Most recent last
    std::optional<AudioFeatures> previous_features; // Track playing before the candidate
    QueueMode mode = QueueMode::Manual;
    ExplorationMode exploration = ExplorationMode::Balanced;
    std::unordered_map<std::string, float> plugin_scores;   // Track id -> 0-100
};

} // namespace cadence

#endif // CADENCE_SCORING_CONTEXT_H
