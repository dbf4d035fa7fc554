/**
 * Cadence Engine - Provider Registry
 */

#include "providers.h"
#include "../core/utils.h"
#include <algorithm>

namespace cadence {

Result<bool> ProviderRegistry::register_provider(std::shared_ptr<FeatureProvider> provider) {
    if (!provider) return ResultError{"Provider is null"};

    std::string id = provider->id();
    uint32_t capabilities = provider->capabilities();
    uint32_t known = kCapabilitySimilarTracks | kCapabilityAudioFeatures | kCapabilityTrackScoring;

    if (id.empty()) return ResultError{"Provider id is empty"};
    if ((capabilities & known) == 0) {
        return ResultError{"Provider " + id + " declares no capabilities"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.id == id) return ResultError{"Provider " + id + " is already registered"};
    }

    entries_.push_back({std::move(provider), id, capabilities & known});
    utils::log(utils::LogLevel::Info, "Providers", "Registered %s (capabilities 0x%x)",
               id.c_str(), capabilities & known);
    return true;
}

bool ProviderRegistry::unregister_provider(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

std::vector<std::shared_ptr<FeatureProvider>> ProviderRegistry::with_capability(
    ProviderCapability capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<FeatureProvider>> result;
    for (const auto& entry : entries_) {
        if (entry.capabilities & capability) result.push_back(entry.provider);
    }
    return result;
}

size_t ProviderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cadence
