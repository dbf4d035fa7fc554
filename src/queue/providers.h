/**
 * Cadence Engine - Feature Providers and Catalog Service
 */

#ifndef CADENCE_PROVIDERS_H
#define CADENCE_PROVIDERS_H

#include "cadence/types.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

enum ProviderCapability : uint32_t {
    kCapabilityNone = 0,
    kCapabilitySimilarTracks = 1u << 0,
    kCapabilityAudioFeatures = 1u << 1,
    kCapabilityTrackScoring = 1u << 2
};

/**
 * External source of similar tracks, audio features or per-track scores.
 * Only the operations named by capabilities() are called.
 */
class FeatureProvider {
public:
    virtual ~FeatureProvider() = default;

    virtual std::string id() const = 0;
    virtual uint32_t capabilities() const = 0;

    /**
     * Ids of tracks similar to the given one.
     */
    virtual std::vector<std::string> similar_tracks(const std::string& track_id, int limit) {
        (void)track_id;
        (void)limit;
        return {};
    }

    virtual std::optional<AudioFeatures> audio_features(const std::string& track_id) {
        (void)track_id;
        return std::nullopt;
    }

    /**
     * Provider's own 0-100 score for a track.
     */
    virtual std::optional<float> score(const Track& track) {
        (void)track;
        return std::nullopt;
    }
};

/**
 * Registered providers, with the capability set each declared when it
 * was registered.
 */
class ProviderRegistry {
public:
    Result<bool> register_provider(std::shared_ptr<FeatureProvider> provider);
    bool unregister_provider(const std::string& id);

    std::vector<std::shared_ptr<FeatureProvider>> with_capability(ProviderCapability capability) const;
    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<FeatureProvider> provider;
        std::string id;
        uint32_t capabilities = kCapabilityNone;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

enum class RecommendationKind {
    Artist,
    Genre
};

/**
 * Remote music catalog (similar tracks, recommendations, search, trending).
 * Calls may block; the queue controller runs them off the caller's thread
 * with a timeout.
 */
class CatalogService {
public:
    virtual ~CatalogService() = default;

    virtual std::vector<Track> similar_tracks(const std::string& track_id) = 0;
    virtual std::vector<Track> recommended_tracks(RecommendationKind kind, const std::string& id) = 0;
    virtual std::vector<Track> search(const std::string& query) = 0;
    virtual std::vector<Track> trending() = 0;
};

} // namespace cadence

#endif // CADENCE_PROVIDERS_H
