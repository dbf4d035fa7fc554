/**
 * Cadence Engine - Co-occurrence Matrix Implementation
 */

#include "cooccurrence.h"
#include "../core/serialize.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>

namespace cadence {

namespace {
constexpr uint32_t kCoocMagic = 0x4F435643;  // "CVCO"
constexpr uint32_t kCoocVersion = 1;
constexpr char kKeySeparator = '\x1f';
}

CoOccurrenceMatrix::CoOccurrenceMatrix(const CoOccurrenceConfig& config)
    : config_(config) {}

std::string CoOccurrenceMatrix::pair_key(const std::string& a, const std::string& b,
                                         CoOccurrenceContext context) {
    std::string key;
    key.reserve(a.size() + b.size() + 3);
    key += a;
    key += kKeySeparator;
    key += b;
    key += kKeySeparator;
    key += static_cast<char>('0' + static_cast<int>(context));
    return key;
}

void CoOccurrenceMatrix::insert_pair(const std::string& key, Pair pair) {
    eviction_.insert(EvictionKey{pair.count, pair.last_seen, key});
    partners_[pair.a].insert(key);
    partners_[pair.b].insert(key);
    pairs_[key] = std::move(pair);
}

void CoOccurrenceMatrix::unlink_partner(const std::string& track_id, const std::string& key) {
    auto it = partners_.find(track_id);
    if (it == partners_.end()) return;
    it->second.erase(key);
    if (it->second.empty()) partners_.erase(it);
}

void CoOccurrenceMatrix::erase_pair(const std::string& key) {
    auto it = pairs_.find(key);
    if (it == pairs_.end()) return;

    eviction_.erase(EvictionKey{it->second.count, it->second.last_seen, key});
    unlink_partner(it->second.a, key);
    unlink_partner(it->second.b, key);
    pairs_.erase(it);
}

void CoOccurrenceMatrix::record(const std::string& a, const std::string& b,
                                CoOccurrenceContext context, int64_t timestamp) {
    if (a.empty() || b.empty() || a == b) return;

    const std::string& lo = std::min(a, b);
    const std::string& hi = std::max(a, b);
    std::string key = pair_key(lo, hi, context);

    auto it = pairs_.find(key);
    if (it != pairs_.end()) {
        Pair updated = it->second;
        updated.count += 1.0f;
        updated.last_seen = std::max(updated.last_seen, timestamp);
        erase_pair(key);
        insert_pair(key, std::move(updated));
        return;
    }

    if (pairs_.size() >= config_.max_pairs && !eviction_.empty()) {
        // Lowest count, then oldest
        std::string victim = std::get<2>(*eviction_.begin());
        erase_pair(victim);
    }

    Pair pair;
    pair.a = lo;
    pair.b = hi;
    pair.context = context;
    pair.count = 1.0f;
    pair.last_seen = timestamp;
    insert_pair(key, std::move(pair));

    if (last_decay_ == 0) last_decay_ = timestamp;
}

void CoOccurrenceMatrix::record_list(const std::vector<std::string>& track_ids,
                                     CoOccurrenceContext context, int64_t timestamp) {
    size_t n = std::min(track_ids.size(), config_.max_list_tracks);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            record(track_ids[i], track_ids[j], context, timestamp);
        }
    }
}

void CoOccurrenceMatrix::record_radio(const std::string& seed_id,
                                      const std::vector<std::string>& track_ids,
                                      int64_t timestamp) {
    for (const auto& id : track_ids) {
        record(seed_id, id, CoOccurrenceContext::Radio, timestamp);
    }
}

void CoOccurrenceMatrix::record_session_play(const std::string& track_id, int64_t timestamp) {
    if (track_id.empty()) return;

    if (!session_tracks_.empty() && timestamp - session_last_play_ > config_.session_window_ms) {
        session_tracks_.clear();
    }

    for (const auto& other : session_tracks_) {
        record(other, track_id, CoOccurrenceContext::Session, timestamp);
    }

    auto existing = std::find(session_tracks_.begin(), session_tracks_.end(), track_id);
    if (existing != session_tracks_.end()) session_tracks_.erase(existing);

    session_tracks_.push_back(track_id);
    while (session_tracks_.size() > config_.max_session_tracks) {
        session_tracks_.pop_front();
    }
    session_last_play_ = timestamp;
}

std::vector<CoOccurrenceEntry> CoOccurrenceMatrix::get_co_occurring(
    const std::string& track_id, std::optional<CoOccurrenceContext> context, size_t limit) const {

    auto it = partners_.find(track_id);
    if (it == partners_.end() || limit == 0) return {};

    std::unordered_map<std::string, CoOccurrenceEntry> merged;
    for (const auto& key : it->second) {
        const Pair& pair = pairs_.at(key);
        if (context && pair.context != *context) continue;

        const std::string& partner = pair.a == track_id ? pair.b : pair.a;
        auto& entry = merged[partner];
        entry.track_id = partner;
        entry.count += pair.count;
        entry.last_seen = std::max(entry.last_seen, pair.last_seen);
    }

    std::vector<CoOccurrenceEntry> entries;
    entries.reserve(merged.size());
    for (auto& [id, entry] : merged) entries.push_back(std::move(entry));

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.count != b.count) return a.count > b.count;
        if (a.last_seen != b.last_seen) return a.last_seen > b.last_seen;
        return a.track_id < b.track_id;
    });

    if (entries.size() > limit) entries.resize(limit);
    return entries;
}

float CoOccurrenceMatrix::count(const std::string& a, const std::string& b,
                                std::optional<CoOccurrenceContext> context) const {
    const std::string& lo = std::min(a, b);
    const std::string& hi = std::max(a, b);

    float total = 0.0f;
    for (auto ctx : {CoOccurrenceContext::Queue, CoOccurrenceContext::Playlist,
                     CoOccurrenceContext::Session, CoOccurrenceContext::Radio}) {
        if (context && ctx != *context) continue;
        auto it = pairs_.find(pair_key(lo, hi, ctx));
        if (it != pairs_.end()) total += it->second.count;
    }
    return total;
}

size_t CoOccurrenceMatrix::apply_decay(int64_t now) {
    if (last_decay_ == 0) {
        last_decay_ = now;
        return 0;
    }

    int64_t days = (now - last_decay_) / utils::kMillisPerDay;
    if (days < 1) return 0;

    float factor = static_cast<float>(std::pow(static_cast<double>(config_.daily_decay),
                                               static_cast<double>(days)));
    last_decay_ += days * utils::kMillisPerDay;

    size_t pruned = 0;
    std::vector<std::string> to_prune;
    eviction_.clear();
    for (auto& [key, pair] : pairs_) {
        pair.count *= factor;
        if (pair.count < config_.min_count) {
            to_prune.push_back(key);
        } else {
            eviction_.insert(EvictionKey{pair.count, pair.last_seen, key});
        }
    }

    for (const auto& key : to_prune) {
        auto it = pairs_.find(key);
        unlink_partner(it->second.a, key);
        unlink_partner(it->second.b, key);
        pairs_.erase(it);
        pruned++;
    }

    if (pruned > 0) {
        utils::log(utils::LogLevel::Debug, "CoOccurrence", "Decayed %lld day(s), pruned %zu pairs",
                   static_cast<long long>(days), pruned);
    }
    return pruned;
}

void CoOccurrenceMatrix::clear() {
    pairs_.clear();
    partners_.clear();
    eviction_.clear();
    session_tracks_.clear();
    session_last_play_ = 0;
    last_decay_ = 0;
}

std::vector<MergedCandidate> CoOccurrenceMatrix::merge_candidates(
    const std::vector<SearchHit>& embedding,
    const std::vector<CoOccurrenceEntry>& collaborative,
    size_t limit) {

    std::unordered_map<std::string, MergedCandidate> merged;
    std::vector<std::string> order;

    for (const auto& hit : embedding) {
        auto& c = merged[hit.id];
        if (c.track_id.empty()) {
            c.track_id = hit.id;
            order.push_back(hit.id);
        }
        c.embedding_score = std::max(c.embedding_score, utils::clamp(hit.similarity, 0.0f, 1.0f) * 100.0f);
    }

    float max_count = 0.0f;
    for (const auto& entry : collaborative) max_count = std::max(max_count, entry.count);

    for (const auto& entry : collaborative) {
        if (max_count <= 0.0f) break;
        auto& c = merged[entry.track_id];
        if (c.track_id.empty()) {
            c.track_id = entry.track_id;
            order.push_back(entry.track_id);
        }
        c.collaborative_score = std::max(c.collaborative_score, entry.count / max_count * 100.0f);
    }

    std::vector<MergedCandidate> results;
    results.reserve(order.size());
    for (const auto& id : order) {
        MergedCandidate c = merged[id];
        c.score = 0.6f * c.embedding_score + 0.4f * c.collaborative_score;
        if (c.embedding_score > 0.0f && c.collaborative_score > 0.0f && c.score > 0.0f) {
            c.score += std::log(c.score) * 0.1f;
        }
        results.push_back(std::move(c));
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    if (results.size() > limit) results.resize(limit);
    return results;
}

/* ============================================================================
 * Persistence
 * ============================================================================ */

std::vector<uint8_t> CoOccurrenceMatrix::serialize() const {
    BinaryWriter w;
    w.put_u32(kCoocMagic);
    w.put_u32(kCoocVersion);
    w.put_i64(last_decay_);
    w.put_i64(session_last_play_);
    w.put_strings(std::vector<std::string>(session_tracks_.begin(), session_tracks_.end()));

    w.put_u32(static_cast<uint32_t>(pairs_.size()));
    for (const auto& [key, pair] : pairs_) {
        w.put_string(pair.a);
        w.put_string(pair.b);
        w.put_u8(static_cast<uint8_t>(pair.context));
        w.put_f32(pair.count);
        w.put_i64(pair.last_seen);
    }
    return w.take();
}

bool CoOccurrenceMatrix::deserialize(const std::vector<uint8_t>& data) {
    BinaryReader r(data);
    if (r.get_u32() != kCoocMagic || r.get_u32() != kCoocVersion) {
        return false;
    }

    CoOccurrenceMatrix loaded(config_);
    loaded.last_decay_ = r.get_i64();
    loaded.session_last_play_ = r.get_i64();
    auto session = r.get_strings();
    loaded.session_tracks_.assign(session.begin(), session.end());

    uint32_t count = r.get_u32();
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        Pair pair;
        pair.a = r.get_string();
        pair.b = r.get_string();
        uint8_t ctx = r.get_u8();
        pair.count = r.get_f32();
        pair.last_seen = r.get_i64();
        if (ctx > static_cast<uint8_t>(CoOccurrenceContext::Radio) || pair.a.empty() ||
            pair.a >= pair.b || !std::isfinite(pair.count)) {
            r.fail();
            break;
        }
        pair.context = static_cast<CoOccurrenceContext>(ctx);
        std::string key = pair_key(pair.a, pair.b, pair.context);
        if (loaded.pairs_.size() < config_.max_pairs) {
            loaded.insert_pair(key, std::move(pair));
        }
    }

    if (!r.ok()) {
        utils::log(utils::LogLevel::Warn, "CoOccurrence", "Co-occurrence data is corrupt, starting empty");
        return false;
    }

    *this = std::move(loaded);
    return true;
}

} // namespace cadence
