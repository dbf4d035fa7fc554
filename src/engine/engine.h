/**
 * Cadence Engine - Main Engine Class
 */

#ifndef CADENCE_ENGINE_H
#define CADENCE_ENGINE_H

#include "cadence/types.h"
#include "../core/storage.h"
#include "../core/store.h"
#include "../embedding/embedding_engine.h"
#include "../index/vector_index.h"
#include "../learning/cooccurrence.h"
#include "../queue/providers.h"
#include "../queue/smart_queue.h"
#include "../scoring/scoring_engine.h"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadence {

/**
 * Main Cadence Engine class.
 *
 * Owns the shared track catalog, embedding cache and vector index, plus one
 * keyed state per user (preferences, taste profile, co-occurrence and queue
 * controller). Per-user mutation is serialized by that user's lock; scoring
 * runs on a snapshot taken under it.
 */
class Engine {
public:
    /**
     * Open (or create) a SQLite library database and load its tracks.
     */
    explicit Engine(const std::string& db_path, const EngineConfig& config = EngineConfig{});

    /**
     * Engine over an arbitrary storage adapter, with an empty catalog.
     * A null adapter is replaced by in-memory storage.
     */
    explicit Engine(const EngineConfig& config, std::shared_ptr<StorageAdapter> storage = nullptr);

    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool is_valid() const;
    std::string error() const;

    const EngineConfig& config() const { return config_; }

    /* ========================================================================
     * Library
     * ======================================================================== */

    /**
     * Add or update a track: persist it (when backed by a database), embed
     * it and insert it into the index. A track that cannot be embedded is
     * still added to the catalog.
     */
    Result<bool> add_track(const Track& track);

    std::optional<Track> get_track(const std::string& id) const;
    size_t track_count() const;
    size_t indexed_count() const { return index_.size(); }

    /**
     * Tracks whose title contains the pattern (case-insensitive).
     */
    std::vector<Track> search_tracks(const std::string& pattern, size_t limit = 50) const;

    /* ========================================================================
     * Collaborators
     * ======================================================================== */

    Result<bool> register_provider(std::shared_ptr<FeatureProvider> provider);
    bool unregister_provider(const std::string& id);
    void set_catalog_service(std::shared_ptr<CatalogService> catalog);

    /* ========================================================================
     * Events
     * ======================================================================== */

    void record_event(const UserEvent& event);

    /**
     * Count co-occurrence for tracks the user queued or put in a playlist.
     */
    void record_track_list(const std::string& user_id, const std::vector<std::string>& track_ids,
                           CoOccurrenceContext context, int64_t timestamp);

    /* ========================================================================
     * Recommendation
     * ======================================================================== */

    /**
     * Score candidates against the user's current state, best first.
     */
    std::vector<ScoredTrack> rank_candidates(const std::string& user_id,
                                             const std::vector<Track>& candidates,
                                             const ScoringContext& context);

    /**
     * Next tracks for the user's queue. When the request names no local
     * candidates, liked tracks and taste-profile neighbours are used.
     */
    std::vector<ScoredTrack> get_next_tracks(const std::string& user_id, int count, FetchRequest request);

    ReplenishResult check_and_replenish(const std::string& user_id, FetchRequest request);

    void record_track_played(const std::string& user_id, const Track& track, int64_t now);

    /**
     * Catalog tracks close to the seeds by embedding, fused with the user's
     * co-occurrence counts decayed to `now` (0 = current time).
     */
    std::vector<MergedCandidate> similar_tracks(const std::string& user_id,
                                                const std::vector<std::string>& seed_ids,
                                                size_t limit, int64_t now);

    std::optional<std::vector<float>> taste_profile(const std::string& user_id, const TimeContext& time);

    TimeContext time_context(int64_t timestamp) const;

    /* ========================================================================
     * Queue Modes
     * ======================================================================== */

    void start_radio(const std::string& user_id, const RadioSeed& seed, int64_t now);
    void stop_radio(const std::string& user_id);
    bool enable_auto_queue(const std::string& user_id);
    void disable_auto_queue(const std::string& user_id);
    QueueMode queue_mode(const std::string& user_id);
    std::unordered_map<std::string, QueueSource> queue_sources(const std::string& user_id);
    std::string queue_error(const std::string& user_id);

    void set_queue_config(const SmartQueueConfig& config);
    void set_radio_config(const RadioConfig& config);

    /* ========================================================================
     * Maintenance and Persistence
     * ======================================================================== */

    /**
     * Apply affinity and co-occurrence decay for every loaded user.
     */
    void run_maintenance(int64_t now);

    bool save_user(const std::string& user_id);

    /**
     * Restore a user's state. Missing keys leave defaults; corrupt blobs are
     * discarded. Returns false if any stored blob was rejected.
     */
    bool load_user(const std::string& user_id);

    bool save_index();

    /**
     * Restore embeddings and the index graph, then index catalog tracks the
     * stored graph lacks. A rejected graph is rebuilt from the catalog.
     */
    bool load_index();

    bool save_all();

private:
    struct UserState;

    void load_library();
    Result<bool> index_track(const Track& track);
    UserState& user_state(const std::string& user_id);
    std::optional<std::vector<float>> embedding_of(const Track& track);
    std::vector<Track> default_candidates(const UserSnapshot& user);
    std::vector<MergedCandidate> neighbours(UserState& state, const std::vector<std::string>& seed_ids,
                                            const std::vector<float>* query, size_t limit,
                                            const std::unordered_set<std::string>& exclude,
                                            int64_t now);
    UserSnapshot snapshot(UserState& state, const TimeContext& time);
    void index_catalog();
    void rebuild_index();
    void set_error(const std::string& message);

    EngineConfig config_;
    std::shared_ptr<Store> store_;
    std::shared_ptr<StorageAdapter> storage_;
    std::shared_ptr<ProviderRegistry> providers_;
    std::shared_ptr<ScoringEngine> scoring_;

    mutable std::shared_mutex catalog_mutex_;
    std::unordered_map<std::string, Track> catalog_;
    std::shared_ptr<CatalogService> catalog_service_;

    EmbeddingEngine embeddings_;
    VectorIndex index_;

    std::mutex users_mutex_;
    std::unordered_map<std::string, std::unique_ptr<UserState>> users_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace cadence

#endif // CADENCE_ENGINE_H
