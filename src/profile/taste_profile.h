/**
 * Cadence Engine - Taste Profile Manager
 */

#ifndef CADENCE_TASTE_PROFILE_H
#define CADENCE_TASTE_PROFILE_H

#include "cadence/types.h"
#include <deque>
#include <optional>
#include <vector>

namespace cadence {

enum class InteractionType {
    LikeStrong,
    LikeRegular,
    Download,
    PlaylistAdd,
    CompletedListen,
    PartialListen
};

/**
 * Per-user taste vector built from positive interactions.
 *
 * Contributions are stored with their base weight and decayed at read time,
 * so a profile read at time t weights each contribution by
 * base * 0.5^(days_since / half_life).
 */
class TasteProfileManager {
public:
    explicit TasteProfileManager(const ProfileConfig& config = ProfileConfig{},
                                 int utc_offset_minutes = 0);

    /**
     * Base weight of an interaction (multiplier x points).
     * @param listen_ratio Played fraction, used by PartialListen only
     */
    static float base_weight(InteractionType type, float listen_ratio = 1.0f);

    /**
     * 0.5^(days / half_life); 1 for contributions from the future.
     */
    static float recency_factor(double days, float half_life_days);

    /**
     * Add a contribution. Returns false for an empty or zero embedding.
     */
    bool record_interaction(const std::vector<float>& embedding, InteractionType type,
                            int64_t timestamp, float listen_ratio = 1.0f);

    /**
     * Blended profile for a moment in time, or nullopt until enough
     * interactions have been recorded.
     */
    std::optional<std::vector<float>> get_profile(const TimeContext& context) const;

    size_t interaction_count() const { return contributions_.size(); }
    bool is_valid() const { return contributions_.size() >= config_.min_interactions; }

    void clear() { contributions_.clear(); }

    std::vector<uint8_t> serialize() const;
    bool deserialize(const std::vector<uint8_t>& data);

private:
    struct Contribution {
        std::vector<float> vector;
        float weight = 0.0f;
        int64_t timestamp = 0;
        TimeSlot slot = TimeSlot::Morning;
        bool weekend = false;
    };

    ProfileConfig config_;
    int utc_offset_minutes_;
    std::deque<Contribution> contributions_;
};

} // namespace cadence

#endif // CADENCE_TASTE_PROFILE_H
