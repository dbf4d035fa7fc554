/**
 * Cadence Engine - Scoring Context
 */

#include "scoring_context.h"

namespace cadence {

UserSnapshot UserSnapshot::capture(const PreferenceStore& preferences,
                                   const TasteProfileManager& profile,
                                   const TimeContext& time) {
    UserSnapshot snapshot;
    snapshot.artist_affinity = preferences.artist_affinities(time.timestamp);
    snapshot.genre_affinity = preferences.genre_affinities(time.timestamp);
    snapshot.artist_history = preferences.artist_history();
    snapshot.genre_history = preferences.genre_history();
    snapshot.play_counts = preferences.play_counts();
    snapshot.liked = preferences.liked_tracks();
    snapshot.disliked = preferences.disliked_tracks();
    snapshot.time_patterns = preferences.time_patterns();
    snapshot.taste_profile = profile.get_profile(time);

    for (const auto& [artist, score] : preferences.top_artists(5, time.timestamp)) {
        snapshot.top_artists.push_back(artist);
    }
    for (const auto& [genre, score] : preferences.top_genres(5, time.timestamp)) {
        snapshot.top_genres.push_back(genre);
    }
    return snapshot;
}

} // namespace cadence
