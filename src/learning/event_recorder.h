/**
 * Cadence Engine - Event Recorder
 */

#ifndef CADENCE_EVENT_RECORDER_H
#define CADENCE_EVENT_RECORDER_H

#include "cadence/types.h"
#include "preference_store.h"
#include "cooccurrence.h"
#include "../profile/taste_profile.h"
#include <functional>
#include <optional>
#include <vector>

namespace cadence {

/**
 * Routes one user's events into their preference store, taste profile and
 * listening-session co-occurrence.
 */
class EventRecorder {
public:
    using EmbeddingLookup = std::function<std::optional<std::vector<float>>(const Track&)>;

    EventRecorder(PreferenceStore& preferences, TasteProfileManager& profile,
                  CoOccurrenceMatrix& cooccurrence, EmbeddingLookup embedding_of);

    void record(const UserEvent& event);

    /**
     * Taste-profile interaction for an event, or nullopt for events that do
     * not shape the taste vector (skips, dislikes, empty listens).
     */
    static std::optional<InteractionType> interaction_for(const UserEvent& event);

private:
    PreferenceStore& preferences_;
    TasteProfileManager& profile_;
    CoOccurrenceMatrix& cooccurrence_;
    EmbeddingLookup embedding_of_;
};

} // namespace cadence

#endif // CADENCE_EVENT_RECORDER_H
