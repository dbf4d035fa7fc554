/**
 * Cadence Engine - Co-occurrence Matrix
 */

#ifndef CADENCE_COOCCURRENCE_H
#define CADENCE_COOCCURRENCE_H

#include "cadence/types.h"
#include "../index/vector_index.h"
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadence {

enum class CoOccurrenceContext : uint8_t {
    Queue,
    Playlist,
    Session,
    Radio
};

struct CoOccurrenceEntry {
    std::string track_id;               // The partner track
    float count = 0.0f;
    int64_t last_seen = 0;
};

struct MergedCandidate {
    std::string track_id;
    float score = 0.0f;                 // 0-100 plus overlap bonus
    float embedding_score = 0.0f;
    float collaborative_score = 0.0f;
};

/**
 * Symmetric track-pair counters, kept per context.
 *
 * Capped at max_pairs; at the cap the lowest-count pair (oldest on ties)
 * is evicted. Decay runs in whole-day batches.
 */
class CoOccurrenceMatrix {
public:
    explicit CoOccurrenceMatrix(const CoOccurrenceConfig& config = CoOccurrenceConfig{});

    void record(const std::string& a, const std::string& b, CoOccurrenceContext context,
                int64_t timestamp);

    /**
     * Pair every track with every other (first max_list_tracks entries).
     */
    void record_list(const std::vector<std::string>& track_ids, CoOccurrenceContext context,
                     int64_t timestamp);

    /**
     * Pair the radio seed with each track the station produced.
     */
    void record_radio(const std::string& seed_id, const std::vector<std::string>& track_ids,
                      int64_t timestamp);

    /**
     * Add a play to the rolling listening session and pair it with the
     * session's earlier tracks. A gap longer than the session window
     * starts a new session.
     */
    void record_session_play(const std::string& track_id, int64_t timestamp);

    /**
     * Partners of a track by count, highest first. Without a context the
     * counts of all contexts are summed.
     */
    std::vector<CoOccurrenceEntry> get_co_occurring(const std::string& track_id,
                                                    std::optional<CoOccurrenceContext> context,
                                                    size_t limit) const;

    float count(const std::string& a, const std::string& b,
                std::optional<CoOccurrenceContext> context = std::nullopt) const;

    /**
     * Apply daily decay for every full day since the last decay and prune
     * pairs that fall below min_count.
     * @return Number of pruned pairs
     */
    size_t apply_decay(int64_t now);

    size_t pair_count() const { return pairs_.size(); }
    void clear();

    /**
     * Blend embedding neighbours with collaborative partners:
     * 0.6 embedding + 0.4 collaborative (both scaled to 0-100), plus
     * log(score) * 0.1 for candidates found by both.
     */
    static std::vector<MergedCandidate> merge_candidates(const std::vector<SearchHit>& embedding,
                                                         const std::vector<CoOccurrenceEntry>& collaborative,
                                                         size_t limit);

    std::vector<uint8_t> serialize() const;
    bool deserialize(const std::vector<uint8_t>& data);

private:
    struct Pair {
        std::string a;                  // a < b
        std::string b;
        CoOccurrenceContext context = CoOccurrenceContext::Queue;
        float count = 0.0f;
        int64_t last_seen = 0;
    };

    using EvictionKey = std::tuple<float, int64_t, std::string>;

    static std::string pair_key(const std::string& a, const std::string& b, CoOccurrenceContext context);

    void insert_pair(const std::string& key, Pair pair);
    void erase_pair(const std::string& key);
    void unlink_partner(const std::string& track_id, const std::string& key);

    CoOccurrenceConfig config_;
    std::unordered_map<std::string, Pair> pairs_;
    std::unordered_map<std::string, std::unordered_set<std::string>> partners_;    // track -> pair keys
    std::set<EvictionKey> eviction_;
    int64_t last_decay_ = 0;

    std::deque<std::string> session_tracks_;
    int64_t session_last_play_ = 0;
};

} // namespace cadence

#endif // CADENCE_COOCCURRENCE_H
