/**
 * Cadence Engine - Smart Queue Controller
 */

#ifndef CADENCE_SMART_QUEUE_H
#define CADENCE_SMART_QUEUE_H

#include "cadence/types.h"
#include "providers.h"
#include "../scoring/scoring_engine.h"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadence {

/**
 * The host's play queue as seen by the controller.
 */
struct QueueState {
    std::vector<Track> tracks;
    int index = -1;                     // Currently playing entry, -1 if none

    const Track* current() const {
        if (index < 0 || index >= static_cast<int>(tracks.size())) return nullptr;
        return &tracks[index];
    }

    int remaining() const {
        return static_cast<int>(tracks.size()) - index - 1;
    }
};

struct FetchRequest {
    QueueState queue;
    std::vector<Track> available_tracks;        // Local library candidates
    std::vector<Track> cached_search_results;   // Low-priority discovery
    TimeContext time;
    int batch_size = 0;                         // 0 = configured batch size
};

struct ReplenishResult {
    bool attempted = false;
    std::vector<QueuedTrack> added;
    std::string error;
};

struct QueueCollaborators {
    std::shared_ptr<ProviderRegistry> providers;
    std::shared_ptr<CatalogService> catalog;

    // Look up a track in the local catalog by id
    std::function<std::optional<Track>(const std::string&)> resolve_track;

    // Embedding + co-occurrence neighbours of a track from the local library,
    // as of the request time
    std::function<std::vector<Track>(const Track&, size_t,
                                     const std::unordered_set<std::string>&, int64_t)> similar_in_library;

    ScoringEngine::EmbeddingLookup embedding_of;
};

/**
 * Auto-queue and radio for one user.
 *
 * Gathers candidates from the local library, feature providers and the
 * catalog concurrently, scores them and returns a diversity-filtered batch.
 * Replenishment is guarded by an in-flight flag and a minimum interval
 * instead of cancellation.
 */
class SmartQueueController {
public:
    SmartQueueController(const SmartQueueConfig& config,
                         const RadioConfig& radio_config,
                         std::shared_ptr<ScoringEngine> scoring,
                         QueueCollaborators collaborators);

    /* ========================================================================
     * Modes
     * ======================================================================== */

    /**
     * Switch to auto-queue. Refused (returns false) while radio is active.
     */
    bool enable_auto_queue();
    void disable_auto_queue();

    /**
     * Start a radio station. A track seed without audio features is
     * enriched from providers that supply them.
     */
    void start_radio(const RadioSeed& seed, int64_t now);
    void stop_radio();

    QueueMode mode() const;
    std::optional<RadioSeed> radio_seed() const;
    int radio_tracks_played() const;

    /* ========================================================================
     * Queue
     * ======================================================================== */

    /**
     * Gather, score and select the next batch of tracks.
     */
    std::vector<ScoredTrack> fetch_more_tracks(const FetchRequest& request, const UserSnapshot& user);

    /**
     * Replenish the queue when few tracks remain. Does nothing in manual
     * mode, while a fetch is in flight, or within the minimum interval
     * since the last fetch.
     */
    ReplenishResult check_and_replenish(const FetchRequest& request, const UserSnapshot& user);

    void record_track_played(const Track& track, int64_t now);

    /**
     * Why a track was queued, relative to the current track.
     */
    QueueSource determine_track_source(const Track& track, const Track* current,
                                       const UserSnapshot& user, int64_t now) const;

    std::unordered_map<std::string, QueueSource> queue_sources() const;
    std::optional<QueueSource> queue_source(const std::string& track_id) const;

    bool is_fetching() const { return fetching_.load(); }
    std::string last_error() const;
    int consecutive_failures() const;
    std::vector<std::string> session_played_ids() const;

    /**
     * Keep at most `limit` tracks, no more than `max_per_artist` per primary
     * artist, then back-fill from the remainder in order.
     */
    static std::vector<ScoredTrack> apply_diversity_filter(const std::vector<ScoredTrack>& tracks,
                                                           size_t limit, int max_per_artist);

    /**
     * Similar first, then two discovery tracks for every local track.
     */
    static std::vector<Track> interleave(const std::vector<Track>& similar,
                                         const std::vector<Track>& discovery,
                                         const std::vector<Track>& local);

    static ExplorationMode mode_for_ratio(size_t discovery_count, size_t local_count);

    SmartQueueConfig config() const;
    void set_config(const SmartQueueConfig& config);
    void set_radio_config(const RadioConfig& config);
    void set_catalog(std::shared_ptr<CatalogService> catalog);

private:
    struct Candidates {
        std::vector<Track> similar;
        std::vector<Track> discovery;
        std::vector<Track> local;
    };

    Candidates gather_candidates(const FetchRequest& request, const UserSnapshot& user,
                                 QueueMode mode, const std::optional<RadioSeed>& seed);
    std::optional<AudioFeatures> fetch_audio_features(const std::string& track_id);
    std::unordered_map<std::string, float> fetch_plugin_scores(const std::vector<Track>& tracks);
    void reset_session_locked(int64_t now);
    int64_t request_timeout_ms() const;
    QueueSource source_locked(const Track& track, const Track* current,
                              const UserSnapshot& user, int64_t now) const;

    SmartQueueConfig config_;
    RadioConfig radio_config_;
    std::shared_ptr<ScoringEngine> scoring_;
    QueueCollaborators collaborators_;

    mutable std::mutex mutex_;
    QueueMode mode_ = QueueMode::Manual;
    std::optional<RadioSeed> radio_seed_;
    int radio_tracks_played_ = 0;

    std::deque<std::string> played_track_ids_;
    std::deque<std::string> played_artist_ids_;
    int64_t session_start_ = 0;
    int64_t last_activity_ = 0;

    std::atomic<bool> fetching_{false};
    int64_t last_fetch_ = 0;
    std::string last_error_;
    int consecutive_failures_ = 0;
    std::unordered_map<std::string, QueueSource> queue_sources_;
};

const char* queue_source_type_name(QueueSourceType type);

} // namespace cadence

#endif // CADENCE_SMART_QUEUE_H
