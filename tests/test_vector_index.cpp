/**
 * Cadence Engine - Vector Index Tests
 */

#include "cadence/types.h"
#include "../src/core/utils.h"
#include "../src/index/vector_index.h"

#include <iostream>
#include <cmath>
#include <random>
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

constexpr int kDim = 32;

std::vector<std::vector<float>> random_vectors(size_t count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::vector<float>> out(count, std::vector<float>(kDim));
    for (auto& v : out) {
        for (auto& x : v) x = dist(rng);
    }
    return out;
}

std::vector<float> axis(int d, float scale = 1.0f) {
    std::vector<float> v(kDim, 0.0f);
    v[d] = scale;
    return v;
}

/* ============================================================================
 * Insert Tests
 * ============================================================================ */

TEST(index_initial_state) {
    VectorIndex index(IndexConfig{}, kDim);
    assert_true(index.state() == IndexState::Empty, "Empty");
    assert_true(index.size() == 0, "No vectors");
    assert_true(index.search(axis(0), 5).empty(), "Empty search");

    assert_true(index.insert("a", axis(0)) == InsertStatus::Inserted, "Insert");
    assert_true(index.state() == IndexState::Ready, "Ready after insert");
    assert_true(index.contains("a") && index.size() == 1, "Contains");
}

TEST(index_rejects_bad_vectors) {
    VectorIndex index(IndexConfig{}, kDim);
    assert_true(index.insert("z", std::vector<float>(kDim, 0.0f)) == InsertStatus::InvalidVector, "Zero vector");
    assert_true(index.insert("short", std::vector<float>(3, 1.0f)) == InsertStatus::DimensionMismatch, "Wrong dim");
    assert_true(index.size() == 0, "Nothing stored");
    assert_true(index.search(std::vector<float>(3, 1.0f), 5).empty(), "Wrong-dim query");
}

TEST(index_unchanged_and_replaced) {
    VectorIndex index(IndexConfig{}, kDim);
    index.insert("a", axis(0));
    index.insert("b", axis(1));

    assert_true(index.insert("a", axis(0, 3.0f)) == InsertStatus::Unchanged, "Same direction is unchanged");
    assert_true(index.insert("a", axis(2)) == InsertStatus::Replaced, "New vector replaces");
    assert_true(index.size() == 2, "Live count unchanged");
    assert_true(index.node_count() == 3, "Old node is marked deleted, not removed");

    auto hits = index.search(axis(2), 5);
    assert_true(hits.size() == 2, "One hit per live id");
    assert_true(hits[0].id == "a", "Replacement vector is searched");
    assert_near(hits[0].similarity, 1.0f, 1e-6f);

    auto old_hits = index.search(axis(0), 1);
    assert_true(old_hits[0].id == "a" && old_hits[0].similarity < 0.5f, "Old vector no longer matches");
}

TEST(index_capacity_rejects) {
    IndexConfig config;
    config.capacity = 3;
    VectorIndex index(config, kDim);

    for (int i = 0; i < 3; ++i) {
        assert_true(index.insert("t" + std::to_string(i), axis(i)) == InsertStatus::Inserted, "Within capacity");
    }
    assert_true(index.insert("t3", axis(3)) == InsertStatus::CapacityExceeded, "Over capacity");
    assert_true(index.insert("t0", axis(5)) == InsertStatus::CapacityExceeded, "Replacement needs a node too");
    assert_true(index.insert("t0", axis(0)) == InsertStatus::Unchanged, "Unchanged needs no node");

    assert_true(index.size() == 3 && !index.contains("t3"), "Rejected id absent");
    auto hits = index.search(axis(1), 1);
    assert_true(!hits.empty() && hits[0].id == "t1", "Index still usable");
}

TEST(index_replaced_node_skipped_by_graph_search) {
    IndexConfig config;
    config.brute_force_threshold = 1;       // Graph path even for a tiny index
    VectorIndex index(config, kDim);
    for (int i = 0; i < 6; ++i) index.insert("t" + std::to_string(i), axis(i));

    assert_true(index.insert("t0", axis(7)) == InsertStatus::Replaced, "Replaced");
    assert_true(index.node_count() == 7 && index.size() == 6, "Deleted node kept in the graph");

    auto hits = index.search(axis(0), 6);
    assert_true(hits.size() == 6, "Every live id returned once");
    for (const auto& h : hits) {
        assert_true(h.similarity < 0.5f || h.id != "t0", "Old t0 vector never matches");
    }

    auto top = index.search(axis(7), 1);
    assert_true(!top.empty() && top[0].id == "t0", "New t0 vector found by the graph");
    assert_near(top[0].similarity, 1.0f, 1e-6f, "Exact match");
}

TEST(index_ties_go_to_earlier_insert) {
    IndexConfig config;
    config.brute_force_threshold = 1;
    VectorIndex index(config, kDim);
    std::vector<float> diagonal = axis(0);
    diagonal[1] = 1.0f;
    index.insert("first", axis(0));
    index.insert("second", axis(1));
    index.insert("third", axis(2));

    auto graph = index.search(diagonal, 2);
    assert_true(graph.size() == 2 && graph[0].id == "first" && graph[1].id == "second", "Graph tie order");
    auto exact = index.search_brute_force(diagonal, 2);
    assert_true(exact[0].id == "first" && exact[1].id == "second", "Exact tie order");
}

/* ============================================================================
 * Search Tests
 * ============================================================================ */

TEST(index_brute_force_ordering_and_exclusion) {
    VectorIndex index(IndexConfig{}, kDim);
    std::vector<float> base = axis(0);
    for (int i = 0; i < 5; ++i) {
        std::vector<float> v = axis(0);
        v[1] = 0.25f * static_cast<float>(i);     // Drifts away from the x axis
        index.insert("n" + std::to_string(i), v);
    }

    auto hits = index.search(base, 3);
    assert_true(hits.size() == 3, "k results");
    assert_true(hits[0].id == "n0" && hits[1].id == "n1" && hits[2].id == "n2", "Most similar first");
    for (size_t i = 1; i < hits.size(); ++i) {
        assert_true(hits[i - 1].similarity >= hits[i].similarity, "Descending similarity");
    }

    auto filtered = index.search(base, 3, {"n0", "n1"});
    assert_true(filtered.size() == 3 && filtered[0].id == "n2", "Excluded ids skipped");
    assert_true(index.search(base, 10).size() == 5, "k larger than corpus");
}

TEST(index_hnsw_matches_brute_force) {
    VectorIndex index(IndexConfig{}, kDim);
    auto vectors = random_vectors(100, 7);
    for (size_t i = 0; i < vectors.size(); ++i) {
        index.insert("v" + std::to_string(i), vectors[i]);
    }

    auto queries = random_vectors(10, 99);
    for (const auto& q : queries) {
        auto exact = index.search_brute_force(q, 10);
        auto graph = index.search_hnsw(q, 10, {}, 100);
        assert_true(exact.size() == 10 && graph.size() == 10, "Full result sets");
        for (size_t i = 0; i < exact.size(); ++i) {
            assert_true(exact[i].id == graph[i].id, "Same ids in the same order");
            assert_near(exact[i].similarity, graph[i].similarity, 1e-6f, "Same similarity");
        }
    }
}

TEST(index_hnsw_recall_above_threshold) {
    IndexConfig config;
    config.brute_force_threshold = 10;       // Force the graph path in search()
    VectorIndex index(config, kDim);
    auto vectors = random_vectors(300, 11);
    for (size_t i = 0; i < vectors.size(); ++i) {
        index.insert("v" + std::to_string(i), vectors[i]);
    }

    size_t found = 0, total = 0;
    for (const auto& q : random_vectors(20, 5)) {
        auto exact = index.search_brute_force(q, 10);
        auto approx = index.search(q, 10);
        std::unordered_set<std::string> ids;
        for (const auto& h : approx) ids.insert(h.id);
        for (const auto& h : exact) {
            if (ids.count(h.id)) found++;
            total++;
        }
    }
    float recall = static_cast<float>(found) / static_cast<float>(total);
    assert_true(recall >= 0.9f, "Graph search recall");
}

TEST(index_hnsw_exclusion_widens_beam) {
    IndexConfig config;
    config.brute_force_threshold = 1;
    config.ef_search = 5;
    VectorIndex index(config, kDim);
    auto vectors = random_vectors(60, 3);
    for (size_t i = 0; i < vectors.size(); ++i) {
        index.insert("v" + std::to_string(i), vectors[i]);
    }

    auto top = index.search_brute_force(vectors[0], 20);
    std::unordered_set<std::string> exclude;
    for (size_t i = 0; i < 15; ++i) exclude.insert(top[i].id);

    auto hits = index.search(vectors[0], 5, exclude);
    assert_true(hits.size() == 5, "Exclusions do not starve the result");
    for (const auto& h : hits) assert_true(!exclude.count(h.id), "No excluded ids");
}

/* ============================================================================
 * Persistence Tests
 * ============================================================================ */

TEST(index_deterministic_build) {
    auto vectors = random_vectors(80, 21);
    VectorIndex a(IndexConfig{}, kDim), b(IndexConfig{}, kDim);
    for (size_t i = 0; i < vectors.size(); ++i) {
        a.insert("v" + std::to_string(i), vectors[i]);
        b.insert("v" + std::to_string(i), vectors[i]);
    }
    assert_true(a.max_level() == b.max_level(), "Same levels");
    assert_true(a.serialize() == b.serialize(), "Same graph for the same seed and inserts");
}

TEST(index_persistence_roundtrip) {
    IndexConfig config;
    config.brute_force_threshold = 1;
    VectorIndex index(config, kDim);
    auto vectors = random_vectors(50, 8);
    for (size_t i = 0; i < vectors.size(); ++i) {
        index.insert("v" + std::to_string(i), vectors[i]);
    }
    index.insert("v0", vectors[49]);     // One deleted node

    VectorIndex restored(config, kDim);
    assert_true(restored.deserialize(index.serialize()), "Deserialize");
    assert_true(restored.size() == index.size(), "Live count");
    assert_true(restored.node_count() == index.node_count(), "Node count");
    assert_true(restored.state() == IndexState::Ready, "Ready");

    auto q = random_vectors(1, 77)[0];
    auto before = index.search(q, 8);
    auto after = restored.search(q, 8);
    assert_true(before.size() == after.size(), "Same hit count");
    for (size_t i = 0; i < before.size(); ++i) {
        assert_true(before[i].id == after[i].id, "Same hits");
    }
}

TEST(index_corrupt_blob_leaves_empty_index) {
    VectorIndex index(IndexConfig{}, kDim);
    for (int i = 0; i < 4; ++i) index.insert("t" + std::to_string(i), axis(i));
    auto data = index.serialize();

    VectorIndex restored(IndexConfig{}, kDim);
    restored.insert("existing", axis(9));

    auto truncated = data;
    truncated.resize(truncated.size() / 2);
    assert_true(!restored.deserialize(truncated), "Truncated blob rejected");
    assert_true(restored.size() == 0 && restored.state() == IndexState::Empty, "Default state");

    VectorIndex other_dim(IndexConfig{}, kDim * 2);
    assert_true(!other_dim.deserialize(data), "Dimension mismatch rejected");

    assert_true(restored.insert("fresh", axis(1)) == InsertStatus::Inserted, "Usable after rejection");
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "Cadence Engine - Vector Index Tests\n";
    std::cout << "===================================\n\n";

    std::cout << "--- Insert ---\n";
    RUN_TEST(index_initial_state);
    RUN_TEST(index_rejects_bad_vectors);
    RUN_TEST(index_unchanged_and_replaced);
    RUN_TEST(index_capacity_rejects);
    RUN_TEST(index_replaced_node_skipped_by_graph_search);
    RUN_TEST(index_ties_go_to_earlier_insert);

    std::cout << "\n--- Search ---\n";
    RUN_TEST(index_brute_force_ordering_and_exclusion);
    RUN_TEST(index_hnsw_matches_brute_force);
    RUN_TEST(index_hnsw_recall_above_threshold);
    RUN_TEST(index_hnsw_exclusion_widens_beam);

    std::cout << "\n--- Persistence ---\n";
    RUN_TEST(index_deterministic_build);
    RUN_TEST(index_persistence_roundtrip);
    RUN_TEST(index_corrupt_blob_leaves_empty_index);

    std::cout << "\n===================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
