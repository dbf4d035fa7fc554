/**
 * Cadence Engine - Smart Queue Tests
 */

#include "cadence/types.h"
#include "../src/core/utils.h"
#include "../src/queue/providers.h"
#include "../src/queue/smart_queue.h"

#include <iostream>
#include <cmath>
#include <map>
#include <mutex>
#include <stdexcept>

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

// Monday 2024-01-01 00:00 UTC
constexpr int64_t kMonday = 1704067200000LL;

static const char* kTitles[] = {
    "Alpha", "Bravo", "Charlie", "Delta", "Echo", "Foxtrot", "Golf", "Hotel",
    "India", "Juliet", "Kilo", "Lima", "Mike", "November", "Oscar", "Papa"
};

Track make_track(const std::string& id, const std::string& title, const std::string& artist,
                 const std::string& genre) {
    Track t;
    t.id = id;
    t.title = title;
    t.artists.push_back({"id-" + utils::to_lower(artist), artist});
    if (!genre.empty()) t.genres.push_back(genre);
    t.duration = 200.0f;
    return t;
}

std::vector<Track> library(size_t count, const std::string& artist, const std::string& genre,
                           size_t offset = 0) {
    std::vector<Track> out;
    for (size_t i = 0; i < count; ++i) {
        size_t n = offset + i;
        out.push_back(make_track("lib-" + std::to_string(n), kTitles[n % 16], artist, genre));
    }
    return out;
}

ScoredTrack scored(const std::string& id, const std::string& artist, float score) {
    ScoredTrack s;
    s.track = make_track(id, "Title " + id, artist, "");
    s.final_score = score;
    return s;
}

std::shared_ptr<ScoringEngine> quiet_scoring() {
    ScoringWeights w;
    w.epsilon = 0.0f;
    return std::make_shared<ScoringEngine>(w);
}

FetchRequest make_request(std::vector<Track> queue, int index, std::vector<Track> available,
                          int64_t now = kMonday) {
    FetchRequest request;
    request.queue.tracks = std::move(queue);
    request.queue.index = index;
    request.available_tracks = std::move(available);
    request.time = utils::make_time_context(now);
    return request;
}

bool has_reason(const std::vector<std::string>& explanation, const std::string& reason) {
    for (const auto& e : explanation) {
        if (e == reason) return true;
    }
    return false;
}

/* ============================================================================
 * Test Doubles
 * ============================================================================ */

class FakeCatalog : public CatalogService {
public:
    std::vector<Track> similar;
    std::vector<Track> recommended;
    std::vector<Track> search_results;
    std::vector<Track> trending_tracks;

    std::vector<Track> similar_tracks(const std::string& track_id) override {
        note("similar:" + track_id);
        return similar;
    }

    std::vector<Track> recommended_tracks(RecommendationKind kind, const std::string& id) override {
        note(std::string(kind == RecommendationKind::Artist ? "artist:" : "genre:") + id);
        return recommended;
    }

    std::vector<Track> search(const std::string& query) override {
        note("search:" + query);
        return search_results;
    }

    std::vector<Track> trending() override {
        note("trending");
        return trending_tracks;
    }

    bool called(const std::string& call) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& c : calls_) {
            if (c == call) return true;
        }
        return false;
    }

    size_t calls_starting_with(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.compare(0, prefix.size(), prefix) == 0) n++;
        }
        return n;
    }

private:
    void note(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

class SimilarProvider : public FeatureProvider {
public:
    explicit SimilarProvider(std::vector<std::string> ids) : ids_(std::move(ids)) {}
    std::string id() const override { return "similar"; }
    uint32_t capabilities() const override { return kCapabilitySimilarTracks; }
    std::vector<std::string> similar_tracks(const std::string&, int) override { return ids_; }

private:
    std::vector<std::string> ids_;
};

class FeaturesProvider : public FeatureProvider {
public:
    std::string id() const override { return "features"; }
    uint32_t capabilities() const override { return kCapabilityAudioFeatures | kCapabilityTrackScoring; }

    std::optional<AudioFeatures> audio_features(const std::string&) override {
        AudioFeatures f;
        f.bpm = 124.0f;
        f.energy = 0.8f;
        return f;
    }

    std::optional<float> score(const Track&) override { return 80.0f; }
};

class BrokenProvider : public FeatureProvider {
public:
    std::string id() const override { return "broken"; }
    uint32_t capabilities() const override {
        return kCapabilitySimilarTracks | kCapabilityAudioFeatures | kCapabilityTrackScoring;
    }

    std::vector<std::string> similar_tracks(const std::string&, int) override {
        throw std::runtime_error("service unavailable");
    }

    std::optional<AudioFeatures> audio_features(const std::string&) override {
        throw std::runtime_error("service unavailable");
    }

    std::optional<float> score(const Track&) override {
        throw std::runtime_error("service unavailable");
    }
};

// Throws values that are not std::exception, as some client libraries do
class RawThrowCatalog : public CatalogService {
public:
    std::vector<Track> similar_tracks(const std::string&) override { throw "upstream 503"; }
    std::vector<Track> recommended_tracks(RecommendationKind, const std::string&) override { throw 503; }
    std::vector<Track> search(const std::string&) override { throw "upstream 503"; }
    std::vector<Track> trending() override { throw "upstream 503"; }
};

/* ============================================================================
 * Selection Tests
 * ============================================================================ */

TEST(queue_diversity_filter_caps_artists) {
    std::vector<ScoredTrack> ranked = {
        scored("1", "Nova", 90), scored("2", "Nova", 85), scored("3", "Nova", 80),
        scored("4", "Drift", 70), scored("5", "Echo", 60)
    };

    auto capped = SmartQueueController::apply_diversity_filter(ranked, 4, 2);
    assert_true(capped.size() == 4, "Limit");
    assert_true(capped[0].track.id == "1" && capped[1].track.id == "2", "Best tracks kept");
    assert_true(capped[2].track.id == "4" && capped[3].track.id == "5", "Third Nova track skipped");

    auto filled = SmartQueueController::apply_diversity_filter(ranked, 5, 2);
    assert_true(filled.size() == 5 && filled[4].track.id == "3", "Back-filled at the end");

    assert_true(SmartQueueController::apply_diversity_filter(ranked, 0, 2).empty(), "Zero limit");
}

TEST(queue_interleave_order) {
    auto similar = library(1, "S", "");
    auto discovery = library(3, "D", "", 1);
    auto local = library(2, "L", "", 4);

    auto out = SmartQueueController::interleave(similar, discovery, local);
    std::vector<std::string> expected = {"lib-0", "lib-1", "lib-2", "lib-4", "lib-3", "lib-5"};
    assert_true(out.size() == expected.size(), "All tracks kept");
    for (size_t i = 0; i < expected.size(); ++i) {
        assert_true(out[i].id == expected[i], "Similar, then two discovery per local");
    }
}

TEST(queue_mode_for_ratio) {
    assert_true(SmartQueueController::mode_for_ratio(7, 3) == ExplorationMode::Exploit, "Mostly discovery");
    assert_true(SmartQueueController::mode_for_ratio(1, 9) == ExplorationMode::Explore, "Mostly local");
    assert_true(SmartQueueController::mode_for_ratio(5, 5) == ExplorationMode::Balanced, "Even split");
    assert_true(SmartQueueController::mode_for_ratio(0, 0) == ExplorationMode::Explore, "No candidates");
}

/* ============================================================================
 * Mode Tests
 * ============================================================================ */

TEST(queue_mode_transitions) {
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), QueueCollaborators{});
    assert_true(controller.mode() == QueueMode::Manual, "Manual by default");

    assert_true(controller.enable_auto_queue(), "Enable");
    assert_true(controller.mode() == QueueMode::AutoQueue && controller.config().auto_queue_enabled, "Auto");

    RadioSeed seed;
    seed.type = RadioSeedType::Genre;
    seed.name = "Jazz";
    controller.start_radio(seed, kMonday);
    assert_true(controller.mode() == QueueMode::Radio, "Radio");
    assert_true(!controller.config().auto_queue_enabled, "Radio turns auto-queue off");
    assert_true(!controller.enable_auto_queue(), "Auto-queue refused during radio");

    SmartQueueConfig config;
    config.auto_queue_enabled = true;
    controller.set_config(config);
    assert_true(controller.mode() == QueueMode::Radio, "Config change keeps radio");

    controller.stop_radio();
    assert_true(controller.mode() == QueueMode::Manual && !controller.radio_seed(), "Stopped");
    assert_true(controller.enable_auto_queue(), "Enable after radio");
    controller.disable_auto_queue();
    assert_true(controller.mode() == QueueMode::Manual, "Disabled");
}

class SilentProvider : public FeatureProvider {
public:
    std::string id() const override { return "silent"; }
    uint32_t capabilities() const override { return kCapabilityNone; }
};

TEST(queue_provider_registry) {
    ProviderRegistry registry;
    assert_true(registry.register_provider(std::make_shared<FeaturesProvider>()).ok(), "Register");
    assert_true(registry.register_provider(std::make_shared<SimilarProvider>(std::vector<std::string>{"x"})).ok(),
                "Second provider");

    auto duplicate = registry.register_provider(std::make_shared<FeaturesProvider>());
    assert_true(duplicate.failed(), "Duplicate id rejected");
    assert_true(duplicate.error().find("already registered") != std::string::npos, "Reason");
    assert_true(registry.register_provider(std::make_shared<SilentProvider>()).failed(), "No capabilities");
    assert_true(registry.register_provider(nullptr).failed(), "Null provider");

    assert_true(registry.size() == 2, "Two registered");
    assert_true(registry.with_capability(kCapabilityTrackScoring).size() == 1, "Scoring providers");
    assert_true(registry.with_capability(kCapabilitySimilarTracks).size() == 1, "Similar providers");

    assert_true(registry.unregister_provider("features"), "Unregister");
    assert_true(!registry.unregister_provider("features"), "Already gone");
    assert_true(registry.with_capability(kCapabilityAudioFeatures).empty(), "Capability removed with it");
}

TEST(queue_radio_seed_enrichment) {
    auto providers = std::make_shared<ProviderRegistry>();
    assert_true(providers->register_provider(std::make_shared<BrokenProvider>()).ok(), "Register broken");
    assert_true(providers->register_provider(std::make_shared<FeaturesProvider>()).ok(), "Register features");

    QueueCollaborators collaborators;
    collaborators.providers = providers;
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), collaborators);

    RadioSeed seed;
    seed.type = RadioSeedType::Track;
    seed.id = "seed";
    seed.name = "Alpha";
    controller.start_radio(seed, kMonday);

    auto active = controller.radio_seed();
    assert_true(active && active->audio_features, "Seed enriched past the failing provider");
    assert_near(*active->audio_features->bpm, 124.0f, 1e-6f, "Features from provider");
}

TEST(queue_session_tracking) {
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), QueueCollaborators{});
    Track a = make_track("a", "Alpha", "Nova", "Rock");
    Track b = make_track("b", "Bravo", "Nova", "Rock");

    controller.record_track_played(a, kMonday);
    controller.record_track_played(b, kMonday + 60 * 1000);
    assert_true(controller.session_played_ids().size() == 2, "Both played");

    controller.record_track_played(a, kMonday + 5 * utils::kMillisPerHour);
    auto ids = controller.session_played_ids();
    assert_true(ids.size() == 1 && ids[0] == "a", "Timed-out session restarts");

    RadioSeed seed;
    seed.type = RadioSeedType::Genre;
    seed.name = "Rock";
    controller.start_radio(seed, kMonday + 6 * utils::kMillisPerHour);
    assert_true(controller.session_played_ids().empty(), "Radio starts a new session");
    controller.record_track_played(b, kMonday + 6 * utils::kMillisPerHour + 1000);
    assert_true(controller.radio_tracks_played() == 1, "Radio counter");
}

/* ============================================================================
 * Fetch Tests
 * ============================================================================ */

TEST(queue_fetch_from_library) {
    SmartQueueConfig config;
    config.batch_size = 5;
    SmartQueueController controller(config, RadioConfig{}, quiet_scoring(), QueueCollaborators{});

    std::vector<Track> available = library(4, "Nova", "Rock");
    auto drift = library(2, "Drift", "Ambient", 4);
    auto echo = library(1, "Echo", "Jazz", 6);
    available.insert(available.end(), drift.begin(), drift.end());
    available.insert(available.end(), echo.begin(), echo.end());
    available.push_back(make_track("dup", "Alpha (Remastered)", "Other", "Pop"));
    available.push_back(make_track("hated", "Zulu", "Other", "Pop"));

    std::vector<Track> queue = {make_track("playing", "Alpha", "Someone", "Rock"), available[1]};
    UserSnapshot user;
    user.disliked.insert("hated");

    auto result = controller.fetch_more_tracks(make_request(queue, 0, available), user);
    assert_true(result.size() == 5, "Batch size");

    std::map<std::string, int> per_artist;
    for (const auto& s : result) {
        assert_true(s.track.id != "lib-1", "Already queued");
        assert_true(s.track.id != "dup", "Same title as the current track");
        assert_true(s.track.id != "hated", "Disliked");
        per_artist[s.track.primary_artist()]++;
    }
    for (const auto& [artist, count] : per_artist) {
        assert_true(count <= 2, "At most two per artist");
    }
    for (size_t i = 1; i < result.size(); ++i) {
        assert_true(result[i].final_score <= result[i - 1].final_score || per_artist["nova"] == 2,
                    "Ranked by score within the artist cap");
    }
}

TEST(queue_fetch_isolates_failing_provider) {
    auto providers = std::make_shared<ProviderRegistry>();
    assert_true(providers->register_provider(std::make_shared<BrokenProvider>()).ok(), "Register broken");
    assert_true(providers->register_provider(
        std::make_shared<SimilarProvider>(std::vector<std::string>{"remote-1", "unknown"})).ok(), "Register similar");
    assert_true(providers->register_provider(std::make_shared<FeaturesProvider>()).ok(), "Register features");

    Track remote = make_track("remote-1", "Kilo", "Far", "Rock");
    QueueCollaborators collaborators;
    collaborators.providers = providers;
    collaborators.resolve_track = [remote](const std::string& id) -> std::optional<Track> {
        if (id == remote.id) return remote;
        return std::nullopt;
    };
    collaborators.similar_in_library = [](const Track&, size_t, const std::unordered_set<std::string>&, int64_t)
        -> std::vector<Track> {
        throw std::runtime_error("index unavailable");
    };

    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), collaborators);
    std::vector<Track> queue = {make_track("playing", "Papa", "Someone", "Rock")};
    auto result = controller.fetch_more_tracks(make_request(queue, 0, library(3, "Nova", "Rock")), UserSnapshot{});

    assert_true(result.size() == 4, "Library plus resolved provider track");
    bool found_remote = false;
    for (const auto& s : result) {
        if (s.track.id == "remote-1") found_remote = true;
        assert_near(s.components.plugin, 80.0f, 1e-4f, "Plugin score from the working provider");
    }
    assert_true(found_remote, "Provider similar id resolved");
}

TEST(queue_fetch_survives_non_standard_throws) {
    QueueCollaborators collaborators;
    collaborators.catalog = std::make_shared<RawThrowCatalog>();
    collaborators.similar_in_library = [](const Track&, size_t, const std::unordered_set<std::string>&, int64_t)
        -> std::vector<Track> {
        throw "index offline";
    };
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), collaborators);

    UserSnapshot user;
    user.top_genres = {"jazz"};
    std::vector<Track> queue = {make_track("playing", "Papa", "Someone", "Rock")};
    auto result = controller.fetch_more_tracks(make_request(queue, 0, library(3, "Nova", "Rock")), user);
    assert_true(result.size() == 3, "Local tracks still returned");

    SmartQueueConfig config;
    config.auto_queue_enabled = true;
    SmartQueueController auto_queue(config, RadioConfig{}, quiet_scoring(), collaborators);
    auto replenish = auto_queue.check_and_replenish(make_request(queue, 0, library(3, "Nova", "Rock")), user);
    assert_true(replenish.attempted && replenish.added.size() == 3, "Replenish unaffected");
    assert_true(auto_queue.last_error().empty(), "No error recorded");
}

TEST(queue_fetch_uses_catalog_fallbacks) {
    auto catalog = std::make_shared<FakeCatalog>();
    catalog->similar = {make_track("api-1", "Bravo", "Drift", "Rock")};
    catalog->search_results = {make_track("search-1", "Charlie", "Echo", "Rock")};
    catalog->trending_tracks = {make_track("trend-1", "Delta", "Zed", "Pop")};

    QueueCollaborators collaborators;
    collaborators.catalog = catalog;
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), collaborators);

    UserSnapshot user;
    user.top_genres = {"jazz"};
    std::vector<Track> queue = {make_track("playing", "Alpha", "Nova", "Rock")};
    auto result = controller.fetch_more_tracks(make_request(queue, 0, {}), user);

    assert_true(catalog->called("similar:playing"), "Catalog similar");
    assert_true(catalog->called("artist:id-nova"), "Artist recommendations");
    assert_true(catalog->called("genre:Rock"), "Current genre recommendations");
    assert_true(catalog->called("genre:jazz"), "Top genre recommendations");
    assert_true(catalog->called("search:Nova fans also like"), "Artist search");
    assert_true(catalog->called("search:best Rock"), "Genre search");
    assert_true(catalog->calls_starting_with("search:") == 3, "At most three searches");
    assert_true(catalog->called("trending"), "Trending fallback");

    // Three searches return the same track; it is kept once
    assert_true(result.size() == 3, "Similar, search and trending tracks");
}

TEST(queue_radio_fetch) {
    auto catalog = std::make_shared<FakeCatalog>();
    catalog->recommended = library(3, "Nova", "Rock", 8);
    catalog->trending_tracks = {make_track("trend-1", "Papa", "Zed", "Pop")};

    QueueCollaborators collaborators;
    collaborators.catalog = catalog;
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), collaborators);

    RadioSeed seed;
    seed.type = RadioSeedType::Track;
    seed.id = "seed";
    seed.name = "Alpha";
    seed.artist_ids = {"id-nova"};
    seed.genres = {"Rock"};
    controller.start_radio(seed, kMonday);

    auto result = controller.fetch_more_tracks(make_request({}, -1, {}), UserSnapshot{});
    assert_true(catalog->called("artist:id-nova"), "Seed artist recommendations");
    assert_true(!result.empty(), "Station tracks");
    assert_true(result.front().track.primary_artist() == "nova", "Seed artist ranks first");
    assert_true(has_reason(result.front().explanation, "Close to the station seed"), "Radio reason");
}

/* ============================================================================
 * Replenishment Tests
 * ============================================================================ */

TEST(queue_replenish_guards) {
    SmartQueueController manual(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), QueueCollaborators{});
    auto lib = library(8, "Nova", "Rock");
    std::vector<Track> queue = library(10, "Queue", "Pop", 8);

    assert_true(!manual.check_and_replenish(make_request(queue, 8, lib), UserSnapshot{}).attempted,
                "Manual mode never replenishes");

    SmartQueueConfig config;
    config.auto_queue_enabled = true;
    SmartQueueController controller(config, RadioConfig{}, quiet_scoring(), QueueCollaborators{});

    assert_true(!controller.check_and_replenish(make_request(queue, 0, lib), UserSnapshot{}).attempted,
                "Enough tracks remain");

    auto first = controller.check_and_replenish(make_request(queue, 8, lib), UserSnapshot{});
    assert_true(first.attempted && !first.added.empty(), "Replenished");
    assert_true(first.error.empty() && controller.last_error().empty(), "No error");
    assert_true(!controller.is_fetching(), "In-flight flag cleared");

    for (const auto& q : first.added) {
        auto source = controller.queue_source(q.track.id);
        assert_true(source.has_value() && source->score.has_value(), "Source recorded with score");
        assert_true(source->timestamp == kMonday, "Stamped with request time");
    }

    assert_true(!controller.check_and_replenish(make_request(queue, 8, lib, kMonday + 1000), UserSnapshot{}).attempted,
                "Minimum interval");
    assert_true(controller.check_and_replenish(make_request(queue, 8, lib, kMonday + 6000), UserSnapshot{}).attempted,
                "After the interval");
}

TEST(queue_replenish_failure_counts) {
    SmartQueueConfig config;
    config.auto_queue_enabled = true;
    config.min_fetch_interval_ms = 0;
    SmartQueueController controller(config, RadioConfig{}, quiet_scoring(), QueueCollaborators{});

    std::vector<Track> queue = {make_track("playing", "Alpha", "Nova", "Rock")};
    auto result = controller.check_and_replenish(make_request(queue, 0, {}), UserSnapshot{});
    assert_true(result.attempted && result.added.empty(), "Nothing to add");
    assert_true(result.error == "No matching tracks found", "Error reported");
    assert_true(controller.consecutive_failures() == 1, "Failure counted");

    controller.check_and_replenish(make_request(queue, 0, {}, kMonday + 1), UserSnapshot{});
    assert_true(controller.consecutive_failures() == 2, "Consecutive failures");

    auto ok = controller.check_and_replenish(make_request(queue, 0, library(2, "Drift", "Ambient"), kMonday + 2),
                                             UserSnapshot{});
    assert_true(!ok.added.empty() && controller.consecutive_failures() == 0, "Reset on success");
}

/* ============================================================================
 * Source Attribution Tests
 * ============================================================================ */

TEST(queue_track_sources) {
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), QueueCollaborators{});
    Track current = make_track("cur", "Alpha", "Nova", "Rock");
    current.album_id = "al1";
    current.album_title = "First Light";

    UserSnapshot user;
    user.liked.insert("liked");

    auto liked = controller.determine_track_source(make_track("liked", "Bravo", "Nova", "Rock"), &current, user, 1);
    assert_true(liked.type == QueueSourceType::Liked && liked.label == "From your Likes", "Liked first");

    auto artist = controller.determine_track_source(make_track("t1", "Charlie", "Nova", "Pop"), &current, user, 1);
    assert_true(artist.type == QueueSourceType::Artist && artist.label == "More from Nova", "Same artist");
    assert_true(artist.seed_track_id == std::optional<std::string>("cur"), "Seed is the current track");

    Track same_album = make_track("t2", "Delta", "Guest", "Pop");
    same_album.album_id = "al1";
    auto album = controller.determine_track_source(same_album, &current, user, 1);
    assert_true(album.type == QueueSourceType::Album && album.label == "From First Light", "Same album");

    auto genre = controller.determine_track_source(make_track("t3", "Echo", "Drift", "rock"), &current, user, 1);
    assert_true(genre.type == QueueSourceType::Genre && genre.label == "Rock vibes", "Shared genre");

    auto other = controller.determine_track_source(make_track("t4", "Golf", "Drift", "Jazz"), &current, user, 1);
    assert_true(other.type == QueueSourceType::ML && other.label == "Recommended for you", "Fallback");
    assert_true(std::string(queue_source_type_name(other.type)) == "ml", "Type name");
}

TEST(queue_radio_sources) {
    SmartQueueController controller(SmartQueueConfig{}, RadioConfig{}, quiet_scoring(), QueueCollaborators{});
    Track track = make_track("t1", "Bravo", "Nova", "Jazz");

    RadioSeed genre;
    genre.type = RadioSeedType::Genre;
    genre.name = "Jazz";
    controller.start_radio(genre, kMonday);
    auto g = controller.determine_track_source(track, nullptr, UserSnapshot{}, kMonday);
    assert_true(g.type == QueueSourceType::Genre && g.label == "Jazz radio", "Genre station");

    RadioSeed artist;
    artist.type = RadioSeedType::Artist;
    artist.id = "id-nova";
    artist.name = "Nova";
    controller.start_radio(artist, kMonday);
    auto a = controller.determine_track_source(track, nullptr, UserSnapshot{}, kMonday);
    assert_true(a.type == QueueSourceType::Artist && a.label == "More from Nova", "Seed artist");
    auto other = controller.determine_track_source(make_track("t2", "Golf", "Drift", "Jazz"), nullptr,
                                                   UserSnapshot{}, kMonday);
    assert_true(other.type == QueueSourceType::Radio && other.label == "Nova Radio", "Other station track");

    RadioSeed seed_track;
    seed_track.type = RadioSeedType::Track;
    seed_track.id = "seed";
    seed_track.name = "Alpha";
    controller.start_radio(seed_track, kMonday);
    auto s = controller.determine_track_source(track, nullptr, UserSnapshot{}, kMonday);
    assert_true(s.type == QueueSourceType::Similar && s.label == "Similar to Alpha", "Track station");
    assert_true(s.seed_track_id == std::optional<std::string>("seed"), "Seed id");
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "Cadence Engine - Smart Queue Tests\n";
    std::cout << "==================================\n\n";

    std::cout << "--- Selection ---\n";
    RUN_TEST(queue_diversity_filter_caps_artists);
    RUN_TEST(queue_interleave_order);
    RUN_TEST(queue_mode_for_ratio);

    std::cout << "\n--- Modes ---\n";
    RUN_TEST(queue_mode_transitions);
    RUN_TEST(queue_provider_registry);
    RUN_TEST(queue_radio_seed_enrichment);
    RUN_TEST(queue_session_tracking);

    std::cout << "\n--- Fetch ---\n";
    RUN_TEST(queue_fetch_from_library);
    RUN_TEST(queue_fetch_isolates_failing_provider);
    RUN_TEST(queue_fetch_survives_non_standard_throws);
    RUN_TEST(queue_fetch_uses_catalog_fallbacks);
    RUN_TEST(queue_radio_fetch);

    std::cout << "\n--- Replenishment ---\n";
    RUN_TEST(queue_replenish_guards);
    RUN_TEST(queue_replenish_failure_counts);

    std::cout << "\n--- Sources ---\n";
    RUN_TEST(queue_track_sources);
    RUN_TEST(queue_radio_sources);

    std::cout << "\n==================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
