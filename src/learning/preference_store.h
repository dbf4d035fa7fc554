/**
 * Cadence Engine - Preference Store
 */

#ifndef CADENCE_PREFERENCE_STORE_H
#define CADENCE_PREFERENCE_STORE_H

#include "cadence/types.h"
#include <array>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cadence {

struct Affinity {
    float score = 0.0f;                 // -100 to 100
    int play_count = 0;
    int64_t last_updated = 0;
    int64_t last_decayed = 0;
};

/**
 * Listening habits for one hour of the day.
 */
struct TimePattern {
    std::unordered_map<std::string, int> genre_counts;
    int total_plays = 0;
    float energy_sum = 0.0f;
    int energy_samples = 0;

    float genre_share(const std::string& genre) const {
        if (total_plays == 0) return 0.0f;
        auto it = genre_counts.find(genre);
        return it == genre_counts.end() ? 0.0f
                                        : static_cast<float>(it->second) / static_cast<float>(total_plays);
    }

    std::optional<float> mean_energy() const {
        if (energy_samples == 0) return std::nullopt;
        return energy_sum / static_cast<float>(energy_samples);
    }
};

/**
 * Artist and genre affinities plus listening statistics for one user.
 *
 * Affinities decay by daily_decay per elapsed day. Stored scores are decayed
 * lazily when touched; reads report the value decayed to the given time.
 */
class PreferenceStore {
public:
    explicit PreferenceStore(const PreferenceConfig& config = PreferenceConfig{},
                             int utc_offset_minutes = 0);

    /**
     * Apply an event's affinity deltas and statistics.
     */
    void record(const UserEvent& event);

    void adjust_artist(const std::string& artist, float delta, int64_t timestamp);
    void adjust_genre(const std::string& genre, float delta, int64_t timestamp);

    float artist_affinity(const std::string& artist, int64_t now) const;
    float genre_affinity(const std::string& genre, int64_t now) const;

    std::unordered_map<std::string, float> artist_affinities(int64_t now) const;
    std::unordered_map<std::string, float> genre_affinities(int64_t now) const;

    std::vector<std::pair<std::string, float>> top_artists(size_t n, int64_t now) const;
    std::vector<std::pair<std::string, float>> top_genres(size_t n, int64_t now) const;

    /**
     * Materialize decay on every stored affinity.
     */
    void apply_decay(int64_t now);

    bool is_liked(const std::string& track_id) const { return liked_.count(track_id) > 0; }
    bool is_disliked(const std::string& track_id) const { return disliked_.count(track_id) > 0; }
    const std::unordered_set<std::string>& liked_tracks() const { return liked_; }
    const std::unordered_set<std::string>& disliked_tracks() const { return disliked_; }

    int play_count(const std::string& track_id) const;
    const std::unordered_map<std::string, int>& play_counts() const { return play_counts_; }
    const std::unordered_set<std::string>& artist_history() const { return artist_history_; }
    const std::unordered_set<std::string>& genre_history() const { return genre_history_; }
    const std::array<TimePattern, 24>& time_patterns() const { return time_patterns_; }

    float decay_factor(int64_t from, int64_t to) const;

    std::vector<uint8_t> serialize() const;
    bool deserialize(const std::vector<uint8_t>& data);

private:
    using AffinityMap = std::unordered_map<std::string, Affinity>;

    void adjust(AffinityMap& map, const std::string& key, float delta, int64_t timestamp, bool count_play);
    float decayed(const Affinity& a, int64_t now) const;
    std::unordered_map<std::string, float> decayed_all(const AffinityMap& map, int64_t now) const;
    std::vector<std::pair<std::string, float>> top(const AffinityMap& map, size_t n, int64_t now) const;

    PreferenceConfig config_;
    int utc_offset_minutes_;

    AffinityMap artists_;
    AffinityMap genres_;
    std::unordered_set<std::string> liked_;
    std::unordered_set<std::string> disliked_;
    std::unordered_map<std::string, int> play_counts_;
    std::unordered_set<std::string> artist_history_;
    std::unordered_set<std::string> genre_history_;
    std::array<TimePattern, 24> time_patterns_;
};

} // namespace cadence

#endif // CADENCE_PREFERENCE_STORE_H
