/**
 * Cadence Engine - Taste Profile Manager Implementation
 */

#include "taste_profile.h"
#include "../core/serialize.h"
#include "../core/utils.h"
#include <cmath>

namespace cadence {

namespace {
constexpr uint32_t kProfileMagic = 0x50545643;  // "CVTP"
constexpr uint32_t kProfileVersion = 1;
}

TasteProfileManager::TasteProfileManager(const ProfileConfig& config, int utc_offset_minutes)
    : config_(config), utc_offset_minutes_(utc_offset_minutes) {}

float TasteProfileManager::base_weight(InteractionType type, float listen_ratio) {
    switch (type) {
        case InteractionType::LikeStrong:      return 3.0f * 15.0f;
        case InteractionType::LikeRegular:     return 3.0f * 10.0f;
        case InteractionType::Download:        return 3.6f * 10.0f;
        case InteractionType::PlaylistAdd:     return 2.4f * 10.0f;
        case InteractionType::CompletedListen: return 1.0f * 5.0f;
        case InteractionType::PartialListen:
            return 1.0f * utils::clamp(listen_ratio, 0.0f, 1.0f) * 3.0f;
    }
    return 0.0f;
}

float TasteProfileManager::recency_factor(double days, float half_life_days) {
    if (days <= 0.0 || half_life_days <= 0.0f) return 1.0f;
    return static_cast<float>(std::pow(0.5, days / half_life_days));
}

bool TasteProfileManager::record_interaction(const std::vector<float>& embedding,
                                             InteractionType type, int64_t timestamp,
                                             float listen_ratio) {
    if (embedding.size() != static_cast<size_t>(kEmbeddingDim)) return false;

    float weight = base_weight(type, listen_ratio);
    if (weight <= 0.0f) return false;

    Contribution c;
    c.vector = embedding;
    if (!utils::normalize_in_place(c.vector)) return false;

    TimeContext ctx = utils::make_time_context(timestamp, utc_offset_minutes_);
    c.weight = weight;
    c.timestamp = timestamp;
    c.slot = ctx.slot();
    c.weekend = ctx.is_weekend();

    contributions_.push_back(std::move(c));
    while (contributions_.size() > config_.max_contributions) {
        contributions_.pop_front();
    }
    return true;
}

std::optional<std::vector<float>> TasteProfileManager::get_profile(const TimeContext& context) const {
    if (!is_valid()) return std::nullopt;

    std::vector<float> main_vec(kEmbeddingDim, 0.0f);
    std::vector<float> slot_vec(kEmbeddingDim, 0.0f);
    std::vector<float> day_vec(kEmbeddingDim, 0.0f);

    TimeSlot slot = context.slot();
    bool weekend = context.is_weekend();

    for (const auto& c : contributions_) {
        double days = utils::days_between(c.timestamp, context.timestamp);
        float w = c.weight * recency_factor(days, config_.half_life_days);
        bool in_slot = c.slot == slot;
        bool in_day = c.weekend == weekend;
        for (int d = 0; d < kEmbeddingDim; ++d) {
            float v = c.vector[d] * w;
            main_vec[d] += v;
            if (in_slot) slot_vec[d] += v;
            if (in_day) day_vec[d] += v;
        }
    }

    if (!utils::normalize_in_place(main_vec)) return std::nullopt;

    float main_weight = config_.main_weight;
    float slot_weight = config_.slot_weight;
    float day_weight = config_.day_type_weight;

    // A context without contributions hands its share to the main vector
    if (!utils::normalize_in_place(slot_vec)) {
        main_weight += slot_weight;
        slot_weight = 0.0f;
    }
    if (!utils::normalize_in_place(day_vec)) {
        main_weight += day_weight;
        day_weight = 0.0f;
    }

    std::vector<float> profile(kEmbeddingDim, 0.0f);
    for (int d = 0; d < kEmbeddingDim; ++d) {
        profile[d] = main_weight * main_vec[d] + slot_weight * slot_vec[d] + day_weight * day_vec[d];
    }

    if (!utils::normalize_in_place(profile)) return std::nullopt;
    return profile;
}

std::vector<uint8_t> TasteProfileManager::serialize() const {
    BinaryWriter w;
    w.put_u32(kProfileMagic);
    w.put_u32(kProfileVersion);
    w.put_u32(static_cast<uint32_t>(contributions_.size()));
    for (const auto& c : contributions_) {
        w.put_floats(c.vector);
        w.put_f32(c.weight);
        w.put_i64(c.timestamp);
        w.put_u8(static_cast<uint8_t>(c.slot));
        w.put_u8(c.weekend ? 1 : 0);
    }
    return w.take();
}

bool TasteProfileManager::deserialize(const std::vector<uint8_t>& data) {
    BinaryReader r(data);
    if (r.get_u32() != kProfileMagic || r.get_u32() != kProfileVersion) {
        return false;
    }

    std::deque<Contribution> loaded;
    uint32_t count = r.get_u32();
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        Contribution c;
        c.vector = r.get_floats();
        c.weight = r.get_f32();
        c.timestamp = r.get_i64();
        uint8_t slot = r.get_u8();
        c.weekend = r.get_u8() != 0;
        if (c.vector.size() != static_cast<size_t>(kEmbeddingDim) || slot > 3 ||
            !std::isfinite(c.weight)) {
            r.fail();
            break;
        }
        c.slot = static_cast<TimeSlot>(slot);
        loaded.push_back(std::move(c));
    }

    if (!r.ok()) {
        utils::log(utils::LogLevel::Warn, "TasteProfile", "Profile data is corrupt, starting empty");
        return false;
    }

    while (loaded.size() > config_.max_contributions) loaded.pop_front();
    contributions_ = std::move(loaded);
    return true;
}

} // namespace cadence
