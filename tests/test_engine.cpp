/**
 * Cadence Engine - Engine and C API Tests
 */

#include "cadence/cadence.h"
#include "cadence/types.h"
#include "../src/core/utils.h"
#include "../src/core/storage.h"
#include "../src/engine/engine.h"

#include <iostream>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <unordered_set>

using namespace cadence;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(float actual, float expected, float tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

constexpr int64_t kMonday = 1704067200000LL;    // 2024-01-01 00:00 UTC

const char* kTitles[] = {"Alpha", "Bravo", "Charlie", "Delta", "Echo",
                         "Foxtrot", "Golf", "Hotel", "India", "Juliet"};

Track make_track(const std::string& id, const std::string& title, const std::string& artist,
                 const std::string& genre, float energy, float bpm, const char* key) {
    Track t;
    t.id = id;
    t.title = title;
    t.artists.push_back({"ar-" + id, artist});
    t.genres.push_back(genre);
    t.duration = 200.0f;
    AudioFeatures f;
    f.energy = energy;
    f.valence = 0.5f;
    f.danceability = energy;
    f.bpm = bpm;
    f.key = std::string(key);
    t.audio_features = f;
    return t;
}

Track bare_track(const std::string& id, const std::string& title) {
    Track t;
    t.id = id;
    t.title = title;
    t.artists.push_back({"ar-" + id, "Artist " + id});
    return t;
}

// r0..r4 are energetic rock, c0..c4 quiet classical; every track has its own artist
std::vector<Track> library() {
    std::vector<Track> tracks;
    for (int i = 0; i < 5; ++i) {
        tracks.push_back(make_track("r" + std::to_string(i), kTitles[i], "Band " + std::to_string(i),
                                    "rock", 0.8f + 0.02f * i, 128.0f + i, "E"));
    }
    for (int i = 0; i < 5; ++i) {
        tracks.push_back(make_track("c" + std::to_string(i), kTitles[5 + i], "Orchestra " + std::to_string(i),
                                    "classical", 0.1f, 70.0f + i, "Dm"));
    }
    return tracks;
}

EngineConfig quiet_config() {
    EngineConfig config;
    config.scoring.epsilon = 0.0f;
    return config;
}

void add_library(Engine& engine) {
    for (const auto& t : library()) {
        assert_true(engine.add_track(t).ok(), "Library track added");
    }
}

UserEvent event_for(Engine& engine, EventType type, const std::string& user, const std::string& track_id,
                    int64_t timestamp) {
    auto track = engine.get_track(track_id);
    if (!track) throw std::runtime_error("Unknown test track " + track_id);
    UserEvent e;
    e.type = type;
    e.user_id = user;
    e.track = *track;
    e.timestamp = timestamp;
    return e;
}

void like_rock(Engine& engine, const std::string& user) {
    for (int i = 0; i < 5; ++i) {
        engine.record_event(event_for(engine, EventType::Like, user, "r" + std::to_string(i),
                                      kMonday + i * utils::kMillisPerHour));
    }
}

bool contains_id(const std::vector<MergedCandidate>& items, const std::string& id) {
    return std::any_of(items.begin(), items.end(), [&](const MergedCandidate& c) { return c.track_id == id; });
}

/* ============================================================================
 * Library Tests
 * ============================================================================ */

TEST(engine_add_and_lookup) {
    Engine engine(quiet_config());
    assert_true(engine.is_valid(), "In-memory engine is valid");
    add_library(engine);
    assert_true(engine.track_count() == 10 && engine.indexed_count() == 10, "All tracks indexed");

    auto t = engine.get_track("r0");
    assert_true(t && t->title == "Alpha" && t->genres[0] == "rock", "Lookup by id");
    assert_true(!engine.get_track("missing"), "Unknown id");

    assert_true(engine.add_track(bare_track("b1", "Night Drive")).ok(), "Track without sources accepted");
    assert_true(engine.track_count() == 11 && engine.indexed_count() == 10, "Catalogued but not indexed");

    assert_true(engine.add_track(bare_track("", "Nameless")).failed(), "Empty id rejected");
    assert_true(engine.track_count() == 11, "Nothing added");

    Track updated = library()[0];
    updated.title = "Alpha (Remastered)";
    assert_true(engine.add_track(updated).ok(), "Update");
    assert_true(engine.track_count() == 11 && engine.get_track("r0")->title == "Alpha (Remastered)", "Replaced");
}

TEST(engine_search_tracks) {
    Engine engine(quiet_config());
    engine.add_track(bare_track("n2", "Night Drive"));
    engine.add_track(bare_track("n1", "Night Drive"));
    engine.add_track(bare_track("m1", "Midnight City"));
    engine.add_track(bare_track("d1", "Daylight"));

    auto hits = engine.search_tracks("NIGHT");
    assert_true(hits.size() == 3, "Case-insensitive containment");
    assert_true(hits[0].id == "m1" && hits[1].id == "n1" && hits[2].id == "n2", "Sorted by title then id");
    assert_true(engine.search_tracks("night", 1).size() == 1, "Limit");
    assert_true(engine.search_tracks("polka").empty(), "No match");
}

TEST(engine_index_capacity_error) {
    EngineConfig config = quiet_config();
    config.index.capacity = 2;
    Engine engine(config);
    auto tracks = library();

    assert_true(engine.add_track(tracks[0]).ok() && engine.add_track(tracks[1]).ok(), "Within capacity");
    auto rejected = engine.add_track(tracks[2]);
    assert_true(rejected.failed(), "Over capacity");
    assert_true(rejected.error().find("capacity exceeded") != std::string::npos, "Reason reported");
    assert_true(engine.error().find("r2") != std::string::npos, "Last error names the track");
    assert_true(engine.track_count() == 3 && engine.indexed_count() == 2, "Catalogued, not indexed");
}

/* ============================================================================
 * Recommendation Tests
 * ============================================================================ */

TEST(engine_similar_tracks_by_embedding) {
    Engine engine(quiet_config());
    add_library(engine);

    auto similar = engine.similar_tracks("u", {"r0"}, 4, kMonday);
    assert_true(similar.size() == 4, "Limit");
    for (const auto& c : similar) {
        assert_true(c.track_id[0] == 'r', "Rock neighbours first");
        assert_true(c.track_id != "r0", "Seed excluded");
        assert_true(c.embedding_score > 0.0f && c.collaborative_score == 0.0f, "Embedding only");
    }

    auto multi = engine.similar_tracks("u", {"r0", "c0"}, 20, kMonday);
    assert_true(!contains_id(multi, "r0") && !contains_id(multi, "c0"), "All seeds excluded");
    assert_true(engine.similar_tracks("u", {"missing"}, 5, kMonday).empty(), "Unknown seed");
}

TEST(engine_cooccurrence_neighbours_and_decay) {
    Engine engine(quiet_config());
    add_library(engine);
    engine.add_track(bare_track("b1", "Night Drive"));

    engine.record_track_list("u", {"r0", "b1"}, CoOccurrenceContext::Playlist, kMonday);
    auto similar = engine.similar_tracks("u", {"r0"}, 10, kMonday);
    auto it = std::find_if(similar.begin(), similar.end(), [](const MergedCandidate& c) { return c.track_id == "b1"; });
    assert_true(it != similar.end(), "Unindexed track reached through co-occurrence");
    assert_true(it->collaborative_score > 0.0f && it->embedding_score == 0.0f, "Collaborative only");

    assert_true(!contains_id(engine.similar_tracks("other", {"r0"}, 10, kMonday), "b1"), "Co-occurrence is per user");

    engine.run_maintenance(kMonday + 2 * utils::kMillisPerDay);
    assert_true(!contains_id(engine.similar_tracks("u", {"r0"}, 10, kMonday + 2 * utils::kMillisPerDay), "b1"),
                "Weak pair pruned by decay");
}

TEST(engine_cooccurrence_decays_between_maintenance_runs) {
    Engine engine(quiet_config());
    add_library(engine);
    engine.add_track(bare_track("b1", "Night Drive"));
    engine.add_track(bare_track("b2", "Low Tide"));

    for (int i = 0; i < 5; ++i) {
        engine.record_track_list("u", {"r0", "b1"}, CoOccurrenceContext::Playlist, kMonday);
    }
    for (int i = 0; i < 3; ++i) {
        engine.record_track_list("u", {"r0", "b2"}, CoOccurrenceContext::Playlist, kMonday);
    }
    assert_true(contains_id(engine.similar_tracks("u", {"r0"}, 10, kMonday), "b2"), "Fresh pair present");

    // 5 * 0.98^30 = 2.73 survives the minimum count of 2; 3 * 0.98^30 = 1.64 does not
    int64_t month_later = kMonday + 30 * utils::kMillisPerDay;
    auto similar = engine.similar_tracks("u", {"r0"}, 10, month_later);
    assert_true(contains_id(similar, "b1"), "Strong pair survives a month of decay");
    assert_true(!contains_id(similar, "b2"), "Decay applied without a maintenance run");
}

TEST(engine_events_build_taste_profile) {
    Engine engine(quiet_config());
    add_library(engine);
    TimeContext later = engine.time_context(kMonday + 10 * utils::kMillisPerHour);

    engine.record_event(event_for(engine, EventType::Like, "u", "r0", kMonday));
    assert_true(!engine.taste_profile("u", later), "Too few interactions");

    like_rock(engine, "u");
    auto profile = engine.taste_profile("u", later);
    assert_true(profile.has_value(), "Profile after enough likes");
    assert_near(utils::l2_norm(*profile), 1.0f, 1e-4f, "Unit norm");
    assert_true(!engine.taste_profile("someone-else", later), "Profiles are per user");

    auto rock = *engine.get_track("r2");
    auto classical = *engine.get_track("c2");
    auto ranked = engine.rank_candidates("u", {classical, rock}, ScoringContext{later});
    assert_true(ranked[0].track.id == "r2", "Profile favours rock");
}

TEST(engine_rank_candidates_uses_preferences) {
    Engine engine(quiet_config());
    engine.add_track(make_track("l1", "Loud One", "Loud", "rock", 0.8f, 128.0f, "E"));
    engine.add_track(make_track("q1", "Quiet One", "Quiet", "rock", 0.8f, 128.0f, "E"));

    engine.record_event(event_for(engine, EventType::Like, "u", "l1", kMonday));
    UserEvent dislike = event_for(engine, EventType::Dislike, "u", "q1", kMonday);
    dislike.dislike_reason = "artist";
    engine.record_event(dislike);

    Track loud = make_track("l2", "Loud Two", "Loud", "rock", 0.8f, 128.0f, "E");
    Track quiet = make_track("q2", "Quiet Two", "Quiet", "rock", 0.8f, 128.0f, "E");
    loud.artists[0].id = "ar-l1";
    quiet.artists[0].id = "ar-q1";

    ScoringContext context;
    context.time = engine.time_context(kMonday + utils::kMillisPerHour);
    auto ranked = engine.rank_candidates("u", {quiet, loud}, context);
    assert_true(ranked.size() == 2, "Every candidate scored");
    assert_true(ranked[0].track.id == "l2", "Liked artist ranks first");
    assert_true(ranked[0].components.base > ranked[1].components.base, "Affinity in the base score");

    assert_true(engine.rank_candidates("u", {}, context).empty(), "No candidates");
}

TEST(engine_next_tracks_from_liked) {
    Engine engine(quiet_config());
    add_library(engine);

    FetchRequest request;
    request.time = engine.time_context(kMonday + 10 * utils::kMillisPerHour);
    assert_true(engine.get_next_tracks("u", 5, request).empty(), "Nothing known about the user");
    assert_true(engine.get_next_tracks("u", 0, request).empty(), "Zero count");

    engine.record_event(event_for(engine, EventType::Like, "u", "r0", kMonday));
    engine.record_event(event_for(engine, EventType::Like, "u", "c3", kMonday));
    auto next = engine.get_next_tracks("u", 5, request);
    assert_true(next.size() == 2, "Only liked tracks before a profile exists");
    for (const auto& s : next) {
        assert_true(s.track.id == "r0" || s.track.id == "c3", "Liked track");
    }
}

TEST(engine_next_tracks_from_profile) {
    Engine engine(quiet_config());
    add_library(engine);
    like_rock(engine, "u");

    UserEvent dislike = event_for(engine, EventType::Dislike, "u", "c0", kMonday + 6 * utils::kMillisPerHour);
    engine.record_event(dislike);

    FetchRequest request;
    request.time = engine.time_context(kMonday + 10 * utils::kMillisPerHour);
    auto next = engine.get_next_tracks("u", 20, request);
    assert_true(next.size() > 5, "Profile neighbours join the liked tracks");
    std::unordered_set<std::string> ids;
    for (const auto& s : next) ids.insert(s.track.id);
    assert_true(ids.size() == next.size(), "No duplicates");
    assert_true(!ids.count("c0"), "Disliked track never recommended");
    for (size_t i = 1; i < next.size(); ++i) {
        assert_true(next[i - 1].final_score >= next[i].final_score, "Best first");
    }

    auto three = engine.get_next_tracks("u", 3, request);
    assert_true(three.size() == 3, "Count respected");
}

TEST(engine_radio_records_cooccurrence) {
    Engine engine(quiet_config());
    add_library(engine);
    int64_t now = kMonday + 10 * utils::kMillisPerHour;

    RadioSeed seed;
    seed.type = RadioSeedType::Track;
    seed.id = "r0";
    engine.start_radio("u", seed, now);
    assert_true(engine.queue_mode("u") == QueueMode::Radio, "Radio mode");
    assert_true(!engine.enable_auto_queue("u"), "Auto-queue refused during radio");

    FetchRequest request;
    request.time = engine.time_context(now);
    request.queue.tracks.push_back(*engine.get_track("r0"));
    request.queue.index = 0;
    for (const auto& t : library()) {
        if (t.id != "r0") request.available_tracks.push_back(t);
    }

    auto result = engine.check_and_replenish("u", request);
    assert_true(result.attempted && !result.added.empty(), "Radio replenished");
    assert_true(engine.queue_error("u").empty(), "No queue error");

    auto sources = engine.queue_sources("u");
    const std::string& first = result.added[0].track.id;
    assert_true(sources.count(first) == 1, "Source stamped");

    auto similar = engine.similar_tracks("u", {"r0"}, 20, now);
    auto it = std::find_if(similar.begin(), similar.end(), [&](const MergedCandidate& c) { return c.track_id == first; });
    assert_true(it != similar.end() && it->collaborative_score > 0.0f, "Radio pairs counted against the seed");

    engine.stop_radio("u");
    assert_true(engine.queue_mode("u") == QueueMode::Manual, "Back to manual");
    assert_true(engine.enable_auto_queue("u"), "Auto-queue allowed");
    assert_true(engine.queue_mode("u") == QueueMode::AutoQueue, "Auto-queue mode");
}

/* ============================================================================
 * Persistence Tests
 * ============================================================================ */

TEST(engine_state_roundtrip) {
    auto storage = std::make_shared<MemoryStorage>();
    TimeContext later;
    std::vector<float> saved_profile;
    {
        Engine engine(quiet_config(), storage);
        add_library(engine);
        like_rock(engine, "u");
        engine.record_track_list("u", {"r0", "c0"}, CoOccurrenceContext::Queue, kMonday);
        later = engine.time_context(kMonday + 10 * utils::kMillisPerHour);
        saved_profile = *engine.taste_profile("u", later);
        assert_true(engine.save_all(), "Saved");
    }

    for (const char* key : {"profile:u", "prefs:u", "cooc:u", "embeddings", "index"}) {
        assert_true(storage->get(key).has_value(), key);
    }

    Engine restored(quiet_config(), storage);
    add_library(restored);
    assert_true(restored.load_index(), "Index loaded");
    assert_true(restored.indexed_count() == 10, "Index size");
    assert_true(restored.load_user("u"), "User loaded");

    auto profile = restored.taste_profile("u", later);
    assert_true(profile.has_value(), "Profile restored");
    assert_near(utils::cosine_similarity(*profile, saved_profile), 1.0f, 1e-5f, "Same profile");

    auto similar = restored.similar_tracks("u", {"r0"}, 20, later.timestamp);
    auto it = std::find_if(similar.begin(), similar.end(), [](const MergedCandidate& c) { return c.track_id == "c0"; });
    assert_true(it != similar.end() && it->collaborative_score > 0.0f, "Co-occurrence restored");

    FetchRequest request;
    request.time = later;
    assert_true(!restored.get_next_tracks("u", 5, request).empty(), "Liked set restored");

    assert_true(restored.load_user("nobody"), "Missing user keeps defaults");
}

TEST(engine_corrupt_state_rejected) {
    auto storage = std::make_shared<MemoryStorage>();
    {
        Engine engine(quiet_config(), storage);
        add_library(engine);
        like_rock(engine, "u");
        assert_true(engine.save_all(), "Saved");
    }
    storage->set("prefs:u", {1, 2, 3});
    storage->set("index", {9, 9, 9, 9});

    Engine restored(quiet_config(), storage);
    add_library(restored);
    assert_true(!restored.load_user("u"), "Corrupt preferences reported");
    assert_true(restored.taste_profile("u", restored.time_context(kMonday + utils::kMillisPerDay)).has_value(),
                "Intact profile still loaded");

    assert_true(!restored.load_index(), "Corrupt index reported");
    assert_true(restored.indexed_count() == 10, "Index rebuilt from the catalog");
    assert_true(!restored.similar_tracks("u", {"r0"}, 3, kMonday).empty(), "Rebuilt index searchable");
}

TEST(engine_database_reload) {
    std::string path = "/tmp/cadence_test_engine.db";
    std::remove(path.c_str());
    {
        Engine engine(path, quiet_config());
        assert_true(engine.is_valid(), "Database opened");
        add_library(engine);
        like_rock(engine, "u");
        assert_true(engine.save_all(), "Saved");
    }
    {
        Engine engine(path, quiet_config());
        assert_true(engine.track_count() == 10, "Tracks reloaded");
        assert_true(engine.indexed_count() == 10, "Tracks re-indexed");
        auto t = engine.get_track("c2");
        assert_true(t && t->genres.size() == 1 && t->genres[0] == "classical", "Metadata kept");
        assert_true(t->audio_features && t->audio_features->bpm, "Features kept");
        assert_near(*t->audio_features->bpm, 72.0f, 1e-4f, "Tempo");

        assert_true(engine.load_index(), "Index blob loaded");
        assert_true(engine.load_user("u"), "User loaded");
        assert_true(engine.taste_profile("u", engine.time_context(kMonday + utils::kMillisPerDay)).has_value(),
                    "Profile restored");
    }
    std::remove(path.c_str());
}

TEST(engine_index_reload_keeps_tracks_added_after_save) {
    auto storage = std::make_shared<MemoryStorage>();
    auto tracks = library();
    {
        Engine engine(quiet_config(), storage);
        for (size_t i = 0; i < 5; ++i) engine.add_track(tracks[i]);
        assert_true(engine.save_index(), "Saved with five tracks");
    }

    Engine restored(quiet_config(), storage);
    add_library(restored);
    assert_true(restored.load_index(), "Index loaded");
    assert_true(restored.indexed_count() == 10, "Tracks added after the save stay indexed");

    auto similar = restored.similar_tracks("u", {"c0"}, 4, kMonday);
    assert_true(similar.size() == 4, "Neighbours found");
    for (const auto& c : similar) assert_true(c.track_id[0] == 'c', "Later tracks searchable");
}

TEST(engine_database_index_reload_after_additions) {
    std::string path = "/tmp/cadence_test_engine_additions.db";
    std::remove(path.c_str());
    auto tracks = library();
    {
        Engine engine(path, quiet_config());
        for (size_t i = 0; i < 5; ++i) engine.add_track(tracks[i]);
        assert_true(engine.save_index(), "Saved with five tracks");
        for (size_t i = 5; i < tracks.size(); ++i) engine.add_track(tracks[i]);
    }
    {
        Engine engine(path, quiet_config());
        assert_true(engine.track_count() == 10, "All tracks stored");
        assert_true(engine.load_index(), "Index blob loaded");
        assert_true(engine.indexed_count() == 10, "Unsaved additions re-indexed");
    }
    std::remove(path.c_str());
}

/* ============================================================================
 * C API Tests
 * ============================================================================ */

CadenceTrack c_track(const char* id, const char* title, const char* artist, const char** genres,
                     float energy, float bpm) {
    CadenceTrack t{};
    t.id = id;
    t.title = title;
    t.artist_id = artist;
    t.artist_name = artist;
    t.album_id = nullptr;
    t.album_title = nullptr;
    t.genres = genres;
    t.moods = nullptr;
    t.duration = 200.0f;
    t.energy = energy;
    t.valence = -1.0f;
    t.danceability = -1.0f;
    t.bpm = bpm;
    t.key = nullptr;
    return t;
}

CadenceEvent c_event(CadenceEventType type, const char* user, const char* track) {
    CadenceEvent e{};
    e.type = type;
    e.user_id = user;
    e.track_id = track;
    e.timestamp = kMonday;
    return e;
}

TEST(api_lifecycle) {
    cadence_set_log_level(CADENCE_LOG_OFF);
    CadenceEngine* engine = cadence_create(nullptr);
    assert_true(engine != nullptr, "In-memory engine");

    const char* rock[] = {"rock", nullptr};
    const char* jazz[] = {"jazz", nullptr};
    CadenceTrack tracks[] = {
        c_track("a", "Alpha", "Nova", rock, 0.8f, 128.0f),
        c_track("b", "Bravo", "Pulse", rock, 0.75f, 125.0f),
        c_track("c", "Charlie", "Drift", jazz, 0.3f, 90.0f),
        c_track("d", "Delta", "Tide", jazz, 0.35f, 92.0f),
    };
    for (const auto& t : tracks) {
        assert_true(cadence_add_track(engine, &t) == CADENCE_OK, "Track added");
    }
    assert_true(cadence_get_track_count(engine) == 4, "Track count");
    assert_true(cadence_add_track(engine, nullptr) == CADENCE_ERROR_INVALID_ARGUMENT, "Null track");

    CadenceEvent like = c_event(CADENCE_EVENT_LIKE, "u", "b");
    assert_true(cadence_record_event(engine, &like) == CADENCE_OK, "Like recorded");
    CadenceEvent listen = c_event(CADENCE_EVENT_LISTEN, "u", "a");
    listen.completed = 1;
    assert_true(cadence_record_event(engine, &listen) == CADENCE_OK, "Listen recorded");
    CadenceEvent unknown = c_event(CADENCE_EVENT_LIKE, "u", "zzz");
    assert_true(cadence_record_event(engine, &unknown) == CADENCE_ERROR_NOT_FOUND, "Unknown track");
    assert_true(std::string(cadence_get_error(engine)).find("zzz") != std::string::npos, "Error message");

    CadenceQueuedTrack* out = nullptr;
    int n = 0;
    assert_true(cadence_get_next_tracks(engine, "u", "a", 3, &out, &n) == CADENCE_OK, "Next tracks");
    assert_true(n > 0 && n <= 3 && out != nullptr, "Some tracks");
    for (int i = 0; i < n; ++i) {
        assert_true(std::string(out[i].track_id) != "a", "Current track excluded");
        assert_true(out[i].title && out[i].artist && out[i].explanation, "Strings filled");
    }
    cadence_free_queued_tracks(out, n);

    assert_true(cadence_get_next_tracks(engine, "fresh", nullptr, 3, &out, &n) == CADENCE_ERROR_NO_CANDIDATES,
                "No candidates for an unknown user");
    assert_true(out == nullptr && n == 0, "Outputs cleared");
    assert_true(cadence_get_next_tracks(engine, "u", "zzz", 3, &out, &n) == CADENCE_ERROR_NOT_FOUND,
                "Unknown current track");

    cadence_destroy(engine);
}

TEST(api_queue_modes) {
    cadence_set_log_level(CADENCE_LOG_OFF);
    CadenceEngine* engine = cadence_create(nullptr);
    const char* rock[] = {"rock", nullptr};
    CadenceTrack t = c_track("a", "Alpha", "Nova", rock, 0.8f, 128.0f);
    cadence_add_track(engine, &t);

    assert_true(cadence_get_queue_mode(engine, "u") == CADENCE_MODE_MANUAL, "Manual by default");
    assert_true(cadence_start_radio(engine, "u", CADENCE_SEED_TRACK, "zzz", nullptr) == CADENCE_ERROR_NOT_FOUND,
                "Unknown seed track");
    assert_true(cadence_start_radio(engine, "u", CADENCE_SEED_TRACK, "a", nullptr) == CADENCE_OK, "Radio");
    assert_true(cadence_get_queue_mode(engine, "u") == CADENCE_MODE_RADIO, "Radio mode");
    assert_true(cadence_enable_auto_queue(engine, "u") == CADENCE_ERROR_INVALID_ARGUMENT, "Refused during radio");

    assert_true(cadence_stop_radio(engine, "u") == CADENCE_OK, "Stopped");
    assert_true(cadence_enable_auto_queue(engine, "u") == CADENCE_OK, "Auto-queue");
    assert_true(cadence_get_queue_mode(engine, "u") == CADENCE_MODE_AUTO_QUEUE, "Auto-queue mode");
    assert_true(cadence_disable_auto_queue(engine, "u") == CADENCE_OK, "Disabled");
    assert_true(cadence_get_queue_mode(engine, "u") == CADENCE_MODE_MANUAL, "Manual again");

    assert_true(cadence_start_radio(engine, "u", CADENCE_SEED_GENRE, "rock", "Rock") == CADENCE_OK, "Genre radio");
    assert_true(cadence_get_queue_mode(engine, "u") == CADENCE_MODE_RADIO, "Radio mode");

    CadenceQueueConfig queue{};
    queue.auto_queue_enabled = 1;
    queue.auto_queue_threshold = 3;
    queue.batch_size = 5;
    queue.limit_artist_repetition = 1;
    queue.max_artist_per_batch = 1;
    cadence_set_queue_config(engine, &queue);
    cadence_set_queue_config(engine, nullptr);
    CadenceRadioConfig radio{};
    radio.seed_weight = 0.9f;
    radio.progressive_drift = 0;
    cadence_set_radio_config(engine, &radio);

    cadence_run_maintenance(engine, kMonday + 3 * utils::kMillisPerDay);
    assert_true(cadence_save(engine) == CADENCE_OK, "Saved");
    assert_true(cadence_load_index(engine) == CADENCE_OK, "Index reloaded");
    assert_true(cadence_load_user(engine, "u") == CADENCE_OK, "User reloaded");

    cadence_destroy(engine);
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    utils::set_log_level(utils::LogLevel::Off);

    std::cout << "Cadence Engine - Engine Tests\n";
    std::cout << "=============================\n\n";

    std::cout << "--- Library ---\n";
    RUN_TEST(engine_add_and_lookup);
    RUN_TEST(engine_search_tracks);
    RUN_TEST(engine_index_capacity_error);

    std::cout << "\n--- Recommendation ---\n";
    RUN_TEST(engine_similar_tracks_by_embedding);
    RUN_TEST(engine_cooccurrence_neighbours_and_decay);
    RUN_TEST(engine_cooccurrence_decays_between_maintenance_runs);
    RUN_TEST(engine_events_build_taste_profile);
    RUN_TEST(engine_rank_candidates_uses_preferences);
    RUN_TEST(engine_next_tracks_from_liked);
    RUN_TEST(engine_next_tracks_from_profile);
    RUN_TEST(engine_radio_records_cooccurrence);

    std::cout << "\n--- Persistence ---\n";
    RUN_TEST(engine_state_roundtrip);
    RUN_TEST(engine_corrupt_state_rejected);
    RUN_TEST(engine_database_reload);
    RUN_TEST(engine_index_reload_keeps_tracks_added_after_save);
    RUN_TEST(engine_database_index_reload_after_additions);

    std::cout << "\n--- C API ---\n";
    RUN_TEST(api_lifecycle);
    RUN_TEST(api_queue_modes);

    std::cout << "\n=============================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
