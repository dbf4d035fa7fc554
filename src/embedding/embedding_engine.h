/**
 * Cadence Engine - Embedding Engine
 */

#ifndef CADENCE_EMBEDDING_ENGINE_H
#define CADENCE_EMBEDDING_ENGINE_H

#include "cadence/types.h"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence {

struct EmbeddingConfidence {
    float audio = 0.0f;
    float genre = 0.0f;
    float mood = 0.0f;
};

struct TrackEmbedding {
    std::string track_id;
    std::vector<float> vector;          // kEmbeddingDim, unit length
    EmbeddingConfidence confidence;
    uint64_t fingerprint = 0;
};

/**
 * Maps track metadata (audio features, genre and mood tags) into a
 * deterministic 128-dim unit vector.
 *
 * Layout:
 *   0-99    five audio features, 20 dims each (golden-ratio phases)
 *   100-105 energy x valence
 *   106-111 danceability x tempo
 *   genre and mood tags expand from 8-dim base vectors over all 128 dims
 */
class EmbeddingEngine {
public:
    static constexpr int kRegionSize = 20;
    static constexpr int kInteractionOffset = 100;
    static constexpr int kInteractionSize = 6;
    static constexpr int kTagBaseDim = 8;

    static constexpr float kAudioConfidence = 0.8f;
    static constexpr float kGenreConfidence = 0.6f;

    using TagVector = std::array<float, kTagBaseDim>;

    EmbeddingEngine() = default;

    /**
     * Compute an embedding without touching the cache.
     * Returns nullopt when the track has no audio features, genres or moods.
     */
    std::optional<TrackEmbedding> generate(const Track& track) const;

    /**
     * Cached embedding for a track, regenerated when its metadata changed.
     */
    std::optional<TrackEmbedding> get_or_create(const Track& track);

    std::optional<TrackEmbedding> get(const std::string& track_id) const;
    void invalidate(const std::string& track_id);
    void clear();
    size_t size() const;

    /**
     * Hash of the metadata an embedding is derived from.
     */
    static uint64_t fingerprint(const Track& track);

    static float mood_confidence(size_t mood_count);

    /**
     * Base vector for a genre or mood name: table lookup, then substring
     * match, then a stable hash of the lower-cased name.
     */
    static TagVector genre_base(const std::string& genre);
    static TagVector mood_base(const std::string& mood);

    std::vector<uint8_t> serialize() const;
    bool deserialize(const std::vector<uint8_t>& data);

private:
    static void add_audio_region(std::vector<float>& out, int offset, int size, float value);
    static void add_tag_expansion(std::vector<float>& out, const TagVector& base);
    static TagVector hashed_base(const std::string& name);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TrackEmbedding> cache_;
};

} // namespace cadence

#endif // CADENCE_EMBEDDING_ENGINE_H
