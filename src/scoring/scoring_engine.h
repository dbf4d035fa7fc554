/**
 * Cadence Engine - Scoring Engine
 */

#ifndef CADENCE_SCORING_ENGINE_H
#define CADENCE_SCORING_ENGINE_H

#include "cadence/types.h"
#include "scoring_context.h"
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence {

/**
 * Multi-component candidate scoring.
 *
 *   final = 0.40 base + 0.10 exploration + 0.15 serendipity
 *         + 0.15 diversity + 0.10 flow + 0.05 temporal + 0.05 plugin
 */
class ScoringEngine {
public:
    using EmbeddingLookup = std::function<std::optional<std::vector<float>>(const Track&)>;

    explicit ScoringEngine(const ScoringWeights& weights = ScoringWeights::defaults(),
                           uint32_t seed = 0x5eed);

    /**
     * Score one candidate.
     * @param batch_artist_counts Same-artist occurrences already placed in the
     *                            current batch (keyed by primary artist)
     */
    ScoredTrack score(const Track& track,
                      const ScoringContext& context,
                      const UserSnapshot& user,
                      const std::optional<std::vector<float>>& embedding,
                      const std::unordered_map<std::string, int>& batch_artist_counts);

    /**
     * Score candidates in order, counting each artist as it is placed.
     * Results keep the input order.
     */
    std::vector<ScoredTrack> score_batch(const std::vector<Track>& tracks,
                                         const ScoringContext& context,
                                         const UserSnapshot& user,
                                         const EmbeddingLookup& embedding_of);

    static float combine(const ScoreComponents& components,
                         const ScoringWeights& weights,
                         ExplorationMode mode = ExplorationMode::Balanced);

    /* ========================================================================
     * Components
     * ======================================================================== */

    static float base_score(const Track& track, const UserSnapshot& user,
                            const std::optional<std::vector<float>>& embedding,
                            std::vector<std::string>& explanation);

    float exploration_score(const Track& track, const UserSnapshot& user,
                            std::vector<std::string>& explanation);

    static float serendipity_score(const Track& track, const ScoringContext& context,
                                   const UserSnapshot& user, std::vector<std::string>& explanation);

    static float diversity_score(const Track& track, const ScoringContext& context,
                                 const std::unordered_map<std::string, int>& batch_artist_counts,
                                 std::vector<std::string>& explanation);

    static float flow_score(const Track& track, const ScoringContext& context,
                            std::vector<std::string>& explanation);

    static float temporal_score(const Track& track, const ScoringContext& context,
                                const UserSnapshot& user, std::vector<std::string>& explanation);

    /* ========================================================================
     * Radio
     * ======================================================================== */

    /**
     * Relevance of a candidate to a radio seed (0-100).
     */
    static float seed_relevance(const Track& track, const RadioSeed& seed);

    /**
     * Seed weight after `tracks_played` radio tracks.
     */
    static float radio_seed_weight(const RadioConfig& config, int tracks_played);

    static float blend_radio(float raw_score, float seed_relevance, float seed_weight);

    void set_weights(const ScoringWeights& weights) { weights_ = weights; }
    const ScoringWeights& weights() const { return weights_; }

private:
    bool roll_epsilon();

    ScoringWeights weights_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

} // namespace cadence

#endif // CADENCE_SCORING_ENGINE_H
