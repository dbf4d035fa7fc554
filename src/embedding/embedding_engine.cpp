/**
 * Cadence Engine - Embedding Engine Implementation
 */

#include "embedding_engine.h"
#include "../core/serialize.h"
#include "../core/utils.h"
#include <cmath>
#include <cstdio>

namespace cadence {

namespace {

// Base dimensions: energy, acoustic, electronic, vocal, dark, tempo, complexity, mainstream
struct TagEntry {
    const char* name;
    EmbeddingEngine::TagVector base;
};

const TagEntry kGenreTable[] = {
    {"rock",        {{ 0.7f, -0.2f, -0.5f,  0.4f,  0.2f,  0.4f,  0.3f,  0.5f}}},
    {"metal",       {{ 1.0f, -0.6f, -0.3f,  0.2f,  0.9f,  0.7f,  0.6f, -0.2f}}},
    {"punk",        {{ 0.9f, -0.4f, -0.6f,  0.5f,  0.3f,  0.9f, -0.4f,  0.0f}}},
    {"pop",         {{ 0.5f, -0.2f,  0.2f,  0.9f, -0.5f,  0.3f, -0.3f,  1.0f}}},
    {"hip hop",     {{ 0.6f, -0.5f,  0.4f,  1.0f,  0.2f,  0.0f,  0.2f,  0.7f}}},
    {"rap",         {{ 0.6f, -0.6f,  0.4f,  1.0f,  0.3f,  0.1f,  0.2f,  0.6f}}},
    {"r&b",         {{ 0.2f, -0.1f,  0.2f,  0.9f, -0.2f, -0.2f,  0.1f,  0.6f}}},
    {"soul",        {{ 0.2f,  0.3f, -0.4f,  0.9f, -0.1f, -0.2f,  0.3f,  0.3f}}},
    {"jazz",        {{-0.1f,  0.8f, -0.7f,  0.0f,  0.0f,  0.0f,  1.0f, -0.4f}}},
    {"blues",       {{ 0.1f,  0.7f, -0.7f,  0.6f,  0.3f, -0.3f,  0.4f, -0.2f}}},
    {"classical",   {{-0.3f,  1.0f, -0.9f, -0.8f,  0.0f, -0.2f,  1.0f, -0.6f}}},
    {"folk",        {{-0.3f,  1.0f, -0.8f,  0.7f, -0.1f, -0.3f,  0.1f, -0.2f}}},
    {"country",     {{ 0.2f,  0.8f, -0.7f,  0.8f, -0.3f,  0.0f,  0.0f,  0.4f}}},
    {"electronic",  {{ 0.6f, -0.9f,  1.0f, -0.4f,  0.0f,  0.5f,  0.3f,  0.2f}}},
    {"house",       {{ 0.8f, -0.9f,  1.0f, -0.2f, -0.2f,  0.6f,  0.0f,  0.4f}}},
    {"techno",      {{ 0.9f, -1.0f,  1.0f, -0.8f,  0.5f,  0.8f,  0.2f, -0.3f}}},
    {"trance",      {{ 0.8f, -0.9f,  1.0f, -0.3f, -0.1f,  0.9f,  0.1f,  0.1f}}},
    {"drum and bass", {{ 1.0f, -0.9f,  0.9f, -0.4f,  0.4f,  1.0f,  0.5f, -0.2f}}},
    {"dubstep",     {{ 1.0f, -1.0f,  1.0f, -0.3f,  0.7f,  0.3f,  0.3f, -0.1f}}},
    {"ambient",     {{-0.9f,  0.0f,  0.7f, -0.9f,  0.1f, -0.9f,  0.4f, -0.7f}}},
    {"lo-fi",       {{-0.6f,  0.2f,  0.5f, -0.6f, -0.1f, -0.6f,  0.0f, -0.1f}}},
    {"indie",       {{ 0.3f,  0.3f, -0.1f,  0.6f,  0.0f,  0.2f,  0.3f, -0.3f}}},
    {"alternative", {{ 0.5f,  0.1f, -0.2f,  0.5f,  0.3f,  0.3f,  0.3f,  0.0f}}},
    {"reggae",      {{ 0.2f,  0.3f, -0.3f,  0.7f, -0.4f, -0.3f,  0.0f,  0.2f}}},
    {"latin",       {{ 0.7f,  0.3f,  0.0f,  0.8f, -0.5f,  0.5f,  0.2f,  0.5f}}},
    {"funk",        {{ 0.7f,  0.2f, -0.2f,  0.5f, -0.5f,  0.3f,  0.5f,  0.2f}}},
    {"disco",       {{ 0.8f, -0.2f,  0.4f,  0.6f, -0.7f,  0.6f,  0.0f,  0.5f}}},
    {"soundtrack",  {{-0.2f,  0.6f,  0.0f, -0.7f,  0.2f, -0.2f,  0.8f, -0.3f}}},
};

const TagEntry kMoodTable[] = {
    {"happy",       {{ 0.6f,  0.0f,  0.1f,  0.4f, -1.0f,  0.4f, -0.2f,  0.6f}}},
    {"sad",         {{-0.6f,  0.5f, -0.2f,  0.5f,  0.7f, -0.6f,  0.2f, -0.1f}}},
    {"energetic",   {{ 1.0f, -0.3f,  0.3f,  0.2f, -0.2f,  0.9f,  0.0f,  0.3f}}},
    {"calm",        {{-0.9f,  0.6f,  0.0f, -0.3f, -0.4f, -0.8f,  0.1f, -0.1f}}},
    {"relaxed",     {{-0.8f,  0.5f,  0.1f, -0.2f, -0.5f, -0.7f,  0.0f,  0.0f}}},
    {"aggressive",  {{ 1.0f, -0.6f,  0.2f,  0.3f,  0.9f,  0.8f,  0.2f, -0.3f}}},
    {"dark",        {{ 0.1f, -0.2f,  0.3f, -0.1f,  1.0f, -0.1f,  0.4f, -0.4f}}},
    {"romantic",    {{-0.3f,  0.5f, -0.2f,  0.8f, -0.4f, -0.4f,  0.1f,  0.4f}}},
    {"melancholic", {{-0.5f,  0.6f, -0.1f,  0.4f,  0.6f, -0.5f,  0.4f, -0.3f}}},
    {"uplifting",   {{ 0.7f,  0.0f,  0.3f,  0.3f, -0.8f,  0.5f,  0.1f,  0.4f}}},
    {"dreamy",      {{-0.5f,  0.1f,  0.5f, -0.2f, -0.2f, -0.5f,  0.4f, -0.3f}}},
    {"party",       {{ 0.9f, -0.5f,  0.6f,  0.5f, -0.7f,  0.8f, -0.3f,  0.8f}}},
};

template<size_t N>
const EmbeddingEngine::TagVector* find_tag(const TagEntry (&table)[N], const std::string& name) {
    // Exact match first, then the first table entry contained in the name
    for (const auto& entry : table) {
        if (name == entry.name) return &entry.base;
    }
    for (const auto& entry : table) {
        if (utils::contains(name, entry.name)) return &entry.base;
    }
    return nullptr;
}

// Audio region values normalized to 0-1
std::optional<float> tempo_value(const AudioFeatures& f) {
    if (!f.bpm || *f.bpm <= 0.0f) return std::nullopt;
    return utils::normalize(*f.bpm, 60.0f, 200.0f);
}

std::optional<float> key_value(const AudioFeatures& f) {
    if (!f.key) return std::nullopt;
    int pos = utils::circle_of_fifths_position(*f.key);
    if (pos < 0) return std::nullopt;
    return static_cast<float>(pos) / 11.0f;
}

} // namespace

void EmbeddingEngine::add_audio_region(std::vector<float>& out, int offset, int size, float value) {
    value = utils::clamp(value, 0.0f, 1.0f);
    for (int i = 0; i < size; ++i) {
        int d = offset + i;
        double phase = 2.0 * utils::kPi * utils::fract((d + 1) * utils::kGoldenRatio);
        out[d] += static_cast<float>(std::cos(phase - value * utils::kPi / 2.0));
    }
}

void EmbeddingEngine::add_tag_expansion(std::vector<float>& out, const TagVector& base) {
    for (int d = 0; d < kEmbeddingDim; ++d) {
        double sum = 0.0;
        for (int j = 0; j < kTagBaseDim; ++j) {
            double phase = 2.0 * utils::kPi * utils::fract((d + 1) * (j + 1) * utils::kGoldenRatio);
            sum += base[j] * std::cos(phase);
        }
        out[d] += static_cast<float>(sum);
    }
}

EmbeddingEngine::TagVector EmbeddingEngine::hashed_base(const std::string& name) {
    TagVector base{};
    uint64_t h = utils::fnv1a(name);
    for (int j = 0; j < kTagBaseDim; ++j) {
        uint8_t byte = static_cast<uint8_t>(h >> (j * 8));
        base[j] = static_cast<float>(byte) / 127.5f - 1.0f;
    }
    return base;
}

EmbeddingEngine::TagVector EmbeddingEngine::genre_base(const std::string& genre) {
    std::string name = utils::to_lower(genre);
    if (auto* base = find_tag(kGenreTable, name)) return *base;
    return hashed_base("genre:" + name);
}

EmbeddingEngine::TagVector EmbeddingEngine::mood_base(const std::string& mood) {
    std::string name = utils::to_lower(mood);
    if (auto* base = find_tag(kMoodTable, name)) return *base;
    return hashed_base("mood:" + name);
}

float EmbeddingEngine::mood_confidence(size_t mood_count) {
    if (mood_count == 0) return 0.0f;
    return 0.3f + 0.1f * static_cast<float>(std::min<size_t>(mood_count, 4));
}

uint64_t EmbeddingEngine::fingerprint(const Track& track) {
    std::string key;
    if (track.audio_features) {
        const auto& f = *track.audio_features;
        char buf[160];
        std::snprintf(buf, sizeof(buf), "e%.5f|v%.5f|d%.5f|b%.3f|",
                      f.energy.value_or(-1.0f), f.valence.value_or(-1.0f),
                      f.danceability.value_or(-1.0f), f.bpm.value_or(-1.0f));
        key += buf;
        key += "k" + f.key.value_or("-");
    }
    key += "|g";
    for (const auto& g : track.genres) key += utils::to_lower(g) + ",";
    key += "|m";
    for (const auto& m : track.moods) key += utils::to_lower(m) + ",";
    return utils::fnv1a(key);
}

std::optional<TrackEmbedding> EmbeddingEngine::generate(const Track& track) const {
    std::vector<float> combined(kEmbeddingDim, 0.0f);
    EmbeddingConfidence confidence;

    // Audio features
    if (track.audio_features && !track.audio_features->empty()) {
        const auto& f = *track.audio_features;
        std::vector<float> audio(kEmbeddingDim, 0.0f);

        std::optional<float> values[5] = {f.energy, f.valence, f.danceability,
                                          tempo_value(f), key_value(f)};
        for (int i = 0; i < 5; ++i) {
            if (values[i]) add_audio_region(audio, i * kRegionSize, kRegionSize, *values[i]);
        }

        if (f.energy && f.valence) {
            add_audio_region(audio, kInteractionOffset, kInteractionSize, *f.energy * *f.valence);
        }
        if (f.danceability && values[3]) {
            add_audio_region(audio, kInteractionOffset + kInteractionSize, kInteractionSize,
                             *f.danceability * *values[3]);
        }

        if (utils::normalize_in_place(audio)) {
            confidence.audio = kAudioConfidence;
            for (int d = 0; d < kEmbeddingDim; ++d) combined[d] += audio[d] * confidence.audio;
        }
    }

    // Genre tags
    if (!track.genres.empty()) {
        std::vector<float> genre(kEmbeddingDim, 0.0f);
        for (const auto& g : track.genres) add_tag_expansion(genre, genre_base(g));
        if (utils::normalize_in_place(genre)) {
            confidence.genre = kGenreConfidence;
            for (int d = 0; d < kEmbeddingDim; ++d) combined[d] += genre[d] * confidence.genre;
        }
    }

    // Mood tags
    if (!track.moods.empty()) {
        std::vector<float> mood(kEmbeddingDim, 0.0f);
        for (const auto& m : track.moods) add_tag_expansion(mood, mood_base(m));
        if (utils::normalize_in_place(mood)) {
            confidence.mood = mood_confidence(track.moods.size());
            for (int d = 0; d < kEmbeddingDim; ++d) combined[d] += mood[d] * confidence.mood;
        }
    }

    if (!utils::normalize_in_place(combined)) {
        return std::nullopt;
    }

    TrackEmbedding embedding;
    embedding.track_id = track.id;
    embedding.vector = std::move(combined);
    embedding.confidence = confidence;
    embedding.fingerprint = fingerprint(track);
    return embedding;
}

std::optional<TrackEmbedding> EmbeddingEngine::get_or_create(const Track& track) {
    uint64_t fp = fingerprint(track);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(track.id);
        if (it != cache_.end() && it->second.fingerprint == fp) {
            return it->second;
        }
    }

    auto embedding = generate(track);

    std::lock_guard<std::mutex> lock(mutex_);
    if (embedding) {
        cache_[track.id] = *embedding;
    } else {
        cache_.erase(track.id);
    }
    return embedding;
}

std::optional<TrackEmbedding> EmbeddingEngine::get(const std::string& track_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(track_id);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

void EmbeddingEngine::invalidate(const std::string& track_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(track_id);
}

void EmbeddingEngine::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t EmbeddingEngine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

/* ============================================================================
 * Persistence
 * ============================================================================ */

namespace {
constexpr uint32_t kEmbeddingMagic = 0x4D455643;  // "CVEM"
constexpr uint32_t kEmbeddingVersion = 1;

// Cached vectors are normalized when computed
bool is_unit_vector(const std::vector<float>& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return std::abs(utils::l2_norm(v) - 1.0f) <= 1e-3f;
}
}

std::vector<uint8_t> EmbeddingEngine::serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    BinaryWriter w;
    w.put_u32(kEmbeddingMagic);
    w.put_u32(kEmbeddingVersion);
    w.put_u32(static_cast<uint32_t>(cache_.size()));
    for (const auto& [id, e] : cache_) {
        w.put_string(id);
        w.put_floats(e.vector);
        w.put_f32(e.confidence.audio);
        w.put_f32(e.confidence.genre);
        w.put_f32(e.confidence.mood);
        w.put_u64(e.fingerprint);
    }
    return w.take();
}

bool EmbeddingEngine::deserialize(const std::vector<uint8_t>& data) {
    BinaryReader r(data);
    if (r.get_u32() != kEmbeddingMagic || r.get_u32() != kEmbeddingVersion) {
        utils::log(utils::LogLevel::Warn, "Embedding", "Ignoring unrecognized embedding cache");
        return false;
    }

    std::unordered_map<std::string, TrackEmbedding> loaded;
    uint32_t count = r.get_u32();
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        TrackEmbedding e;
        e.track_id = r.get_string();
        e.vector = r.get_floats();
        e.confidence.audio = r.get_f32();
        e.confidence.genre = r.get_f32();
        e.confidence.mood = r.get_f32();
        e.fingerprint = r.get_u64();
        if (e.vector.size() != static_cast<size_t>(kEmbeddingDim) || !is_unit_vector(e.vector)) r.fail();
        if (r.ok()) loaded[e.track_id] = std::move(e);
    }

    if (!r.ok()) {
        utils::log(utils::LogLevel::Warn, "Embedding", "Embedding cache is corrupt, starting empty");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = std::move(loaded);
    return true;
}

} // namespace cadence
