/**
 * Cadence Engine - Event Recorder Implementation
 */

#include "event_recorder.h"
#include "../core/utils.h"

namespace cadence {

EventRecorder::EventRecorder(PreferenceStore& preferences, TasteProfileManager& profile,
                             CoOccurrenceMatrix& cooccurrence, EmbeddingLookup embedding_of)
    : preferences_(preferences)
    , profile_(profile)
    , cooccurrence_(cooccurrence)
    , embedding_of_(std::move(embedding_of)) {}

std::optional<InteractionType> EventRecorder::interaction_for(const UserEvent& event) {
    switch (event.type) {
        case EventType::Like:
            return event.strength >= 2 ? InteractionType::LikeStrong : InteractionType::LikeRegular;
        case EventType::Download:
            return InteractionType::Download;
        case EventType::PlaylistAdd:
            return InteractionType::PlaylistAdd;
        case EventType::Listen:
            if (event.completed) return InteractionType::CompletedListen;
            if (event.listen_ratio() > 0.0f) return InteractionType::PartialListen;
            return std::nullopt;
        case EventType::Skip:
        case EventType::Dislike:
            return std::nullopt;
    }
    return std::nullopt;
}

void EventRecorder::record(const UserEvent& event) {
    preferences_.record(event);

    if (auto interaction = interaction_for(event)) {
        std::optional<std::vector<float>> embedding;
        if (embedding_of_) embedding = embedding_of_(event.track);

        if (embedding) {
            if (!profile_.record_interaction(*embedding, *interaction, event.timestamp,
                                             event.listen_ratio())) {
                utils::log(utils::LogLevel::Debug, "Events", "Interaction for %s not recorded",
                           event.track.id.c_str());
            }
        } else {
            utils::log(utils::LogLevel::Debug, "Events", "Track %s has no embedding, profile unchanged",
                       event.track.id.c_str());
        }
    }

    if (event.type == EventType::Listen) {
        cooccurrence_.record_session_play(event.track.id, event.timestamp);
    }
}

} // namespace cadence
