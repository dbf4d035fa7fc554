/**
 * Cadence Engine - Preference Store Implementation
 */

#include "preference_store.h"
#include "../core/serialize.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>

namespace cadence {

namespace {
constexpr uint32_t kPrefsMagic = 0x50505643;  // "CVPP"
constexpr uint32_t kPrefsVersion = 1;

struct Deltas {
    float artist;
    float genre;
};
}

PreferenceStore::PreferenceStore(const PreferenceConfig& config, int utc_offset_minutes)
    : config_(config), utc_offset_minutes_(utc_offset_minutes) {}

float PreferenceStore::decay_factor(int64_t from, int64_t to) const {
    double days = utils::days_between(from, to);
    if (days <= 0.0) return 1.0f;
    return static_cast<float>(std::pow(static_cast<double>(config_.daily_decay), days));
}

float PreferenceStore::decayed(const Affinity& a, int64_t now) const {
    return a.score * decay_factor(a.last_decayed, now);
}

void PreferenceStore::adjust(AffinityMap& map, const std::string& key, float delta,
                             int64_t timestamp, bool count_play) {
    if (key.empty()) return;

    auto& a = map[key];
    if (a.last_decayed == 0) a.last_decayed = timestamp;

    a.score = utils::clamp(decayed(a, timestamp) + delta, config_.min_score, config_.max_score);
    a.last_decayed = std::max(a.last_decayed, timestamp);
    a.last_updated = timestamp;
    if (count_play) a.play_count++;
}

void PreferenceStore::adjust_artist(const std::string& artist, float delta, int64_t timestamp) {
    adjust(artists_, utils::to_lower(artist), delta, timestamp, false);
}

void PreferenceStore::adjust_genre(const std::string& genre, float delta, int64_t timestamp) {
    adjust(genres_, utils::to_lower(genre), delta, timestamp, false);
}

void PreferenceStore::record(const UserEvent& event) {
    const Track& track = event.track;
    const std::string artist = track.primary_artist();
    const int64_t ts = event.timestamp;

    Deltas d{0.0f, 0.0f};
    bool is_play = false;

    switch (event.type) {
        case EventType::Listen: {
            float ratio = event.listen_ratio();
            d = {2.0f * ratio, 1.0f * ratio};
            is_play = true;
            break;
        }
        case EventType::Skip:
            if (event.played_duration < config_.early_skip_seconds) {
                d = {-5.0f, -2.0f};
            } else {
                d = {-2.0f, -1.0f};
            }
            break;
        case EventType::Like:
            d = event.strength >= 2 ? Deltas{15.0f, 8.0f} : Deltas{10.0f, 5.0f};
            liked_.insert(track.id);
            disliked_.erase(track.id);
            break;
        case EventType::Download:
            d = {12.0f, 6.0f};
            break;
        case EventType::PlaylistAdd:
            d = {8.0f, 4.0f};
            break;
        case EventType::Dislike: {
            std::string reason = utils::to_lower(event.dislike_reason);
            if (reason == "artist") {
                d = {-30.0f, 0.0f};
            } else if (reason == "genre") {
                d = {0.0f, -20.0f};
            } else {
                d = {-10.0f, -5.0f};
            }
            disliked_.insert(track.id);
            liked_.erase(track.id);
            break;
        }
    }

    if (d.artist != 0.0f || is_play) {
        adjust(artists_, artist, d.artist, ts, is_play);
    }
    if (d.genre != 0.0f || is_play) {
        for (const auto& g : track.genres) {
            adjust(genres_, utils::to_lower(g), d.genre, ts, is_play);
        }
    }

    if (is_play) {
        play_counts_[track.id]++;
        artist_history_.insert(artist);

        TimeContext ctx = utils::make_time_context(ts, utc_offset_minutes_);
        auto& pattern = time_patterns_[ctx.hour];
        pattern.total_plays++;
        for (const auto& g : track.genres) {
            std::string genre = utils::to_lower(g);
            genre_history_.insert(genre);
            pattern.genre_counts[genre]++;
        }
        if (auto energy = track.energy()) {
            pattern.energy_sum += *energy;
            pattern.energy_samples++;
        }
    }
}

float PreferenceStore::artist_affinity(const std::string& artist, int64_t now) const {
    auto it = artists_.find(utils::to_lower(artist));
    return it == artists_.end() ? 0.0f : decayed(it->second, now);
}

float PreferenceStore::genre_affinity(const std::string& genre, int64_t now) const {
    auto it = genres_.find(utils::to_lower(genre));
    return it == genres_.end() ? 0.0f : decayed(it->second, now);
}

std::unordered_map<std::string, float> PreferenceStore::decayed_all(const AffinityMap& map, int64_t now) const {
    std::unordered_map<std::string, float> result;
    result.reserve(map.size());
    for (const auto& [key, a] : map) result[key] = decayed(a, now);
    return result;
}

std::unordered_map<std::string, float> PreferenceStore::artist_affinities(int64_t now) const {
    return decayed_all(artists_, now);
}

std::unordered_map<std::string, float> PreferenceStore::genre_affinities(int64_t now) const {
    return decayed_all(genres_, now);
}

std::vector<std::pair<std::string, float>> PreferenceStore::top(const AffinityMap& map, size_t n,
                                                                int64_t now) const {
    std::vector<std::pair<std::string, float>> entries;
    for (const auto& [key, a] : map) {
        float score = decayed(a, now);
        if (score > 0.0f) entries.emplace_back(key, score);
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (entries.size() > n) entries.resize(n);
    return entries;
}

std::vector<std::pair<std::string, float>> PreferenceStore::top_artists(size_t n, int64_t now) const {
    return top(artists_, n, now);
}

std::vector<std::pair<std::string, float>> PreferenceStore::top_genres(size_t n, int64_t now) const {
    return top(genres_, n, now);
}

void PreferenceStore::apply_decay(int64_t now) {
    for (auto* map : {&artists_, &genres_}) {
        for (auto& [key, a] : *map) {
            if (now <= a.last_decayed) continue;
            a.score = decayed(a, now);
            a.last_decayed = now;
        }
    }
}

int PreferenceStore::play_count(const std::string& track_id) const {
    auto it = play_counts_.find(track_id);
    return it == play_counts_.end() ? 0 : it->second;
}

/* ============================================================================
 * Persistence
 * ============================================================================ */

namespace {

void write_affinities(BinaryWriter& w, const std::unordered_map<std::string, Affinity>& map) {
    w.put_u32(static_cast<uint32_t>(map.size()));
    for (const auto& [key, a] : map) {
        w.put_string(key);
        w.put_f32(a.score);
        w.put_u32(static_cast<uint32_t>(a.play_count));
        w.put_i64(a.last_updated);
        w.put_i64(a.last_decayed);
    }
}

void read_affinities(BinaryReader& r, std::unordered_map<std::string, Affinity>& map,
                     const PreferenceConfig& config) {
    uint32_t count = r.get_u32();
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        std::string key = r.get_string();
        Affinity a;
        a.score = r.get_f32();
        a.play_count = static_cast<int>(r.get_u32());
        a.last_updated = r.get_i64();
        a.last_decayed = r.get_i64();
        if (!std::isfinite(a.score)) {
            r.fail();
            break;
        }
        a.score = utils::clamp(a.score, config.min_score, config.max_score);
        map[key] = a;
    }
}

void write_set(BinaryWriter& w, const std::unordered_set<std::string>& set) {
    w.put_strings(std::vector<std::string>(set.begin(), set.end()));
}

std::unordered_set<std::string> read_set(BinaryReader& r) {
    auto values = r.get_strings();
    return std::unordered_set<std::string>(values.begin(), values.end());
}

}

std::vector<uint8_t> PreferenceStore::serialize() const {
    BinaryWriter w;
    w.put_u32(kPrefsMagic);
    w.put_u32(kPrefsVersion);

    write_affinities(w, artists_);
    write_affinities(w, genres_);
    write_set(w, liked_);
    write_set(w, disliked_);
    write_set(w, artist_history_);
    write_set(w, genre_history_);

    w.put_u32(static_cast<uint32_t>(play_counts_.size()));
    for (const auto& [id, count] : play_counts_) {
        w.put_string(id);
        w.put_u32(static_cast<uint32_t>(count));
    }

    for (const auto& pattern : time_patterns_) {
        w.put_u32(static_cast<uint32_t>(pattern.total_plays));
        w.put_f32(pattern.energy_sum);
        w.put_u32(static_cast<uint32_t>(pattern.energy_samples));
        w.put_u32(static_cast<uint32_t>(pattern.genre_counts.size()));
        for (const auto& [genre, count] : pattern.genre_counts) {
            w.put_string(genre);
            w.put_u32(static_cast<uint32_t>(count));
        }
    }
    return w.take();
}

bool PreferenceStore::deserialize(const std::vector<uint8_t>& data) {
    BinaryReader r(data);
    if (r.get_u32() != kPrefsMagic || r.get_u32() != kPrefsVersion) {
        return false;
    }

    PreferenceStore loaded(config_, utc_offset_minutes_);
    read_affinities(r, loaded.artists_, config_);
    read_affinities(r, loaded.genres_, config_);
    loaded.liked_ = read_set(r);
    loaded.disliked_ = read_set(r);
    loaded.artist_history_ = read_set(r);
    loaded.genre_history_ = read_set(r);

    uint32_t plays = r.get_u32();
    for (uint32_t i = 0; i < plays && r.ok(); ++i) {
        std::string id = r.get_string();
        loaded.play_counts_[id] = static_cast<int>(r.get_u32());
    }

    for (auto& pattern : loaded.time_patterns_) {
        if (!r.ok()) break;
        pattern.total_plays = static_cast<int>(r.get_u32());
        pattern.energy_sum = r.get_f32();
        pattern.energy_samples = static_cast<int>(r.get_u32());
        uint32_t genres = r.get_u32();
        for (uint32_t i = 0; i < genres && r.ok(); ++i) {
            std::string genre = r.get_string();
            pattern.genre_counts[genre] = static_cast<int>(r.get_u32());
        }
    }

    if (!r.ok()) {
        utils::log(utils::LogLevel::Warn, "Preferences", "Preference data is corrupt, starting empty");
        return false;
    }

    *this = std::move(loaded);
    return true;
}

} // namespace cadence
