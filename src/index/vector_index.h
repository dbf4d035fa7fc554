/**
 * Cadence Engine - Vector Index (HNSW)
 */

#ifndef CADENCE_VECTOR_INDEX_H
#define CADENCE_VECTOR_INDEX_H

#include "cadence/types.h"
#include <hnswlib/hnswlib.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadence {

enum class IndexState {
    Empty,
    Building,
    Ready
};

enum class InsertStatus {
    Inserted,
    Unchanged,          // Same id, same vector
    Replaced,           // Same id, new vector; the old node is marked deleted
    CapacityExceeded,
    InvalidVector,      // Zero vector
    DimensionMismatch
};

const char* insert_status_name(InsertStatus status);

struct SearchHit {
    std::string id;
    float similarity = 0.0f;
};

/**
 * Approximate nearest-neighbour index over unit vectors (cosine similarity).
 *
 * hnswlib graph over the inner-product space. Below the brute-force
 * threshold searches scan every vector exactly. Inserts take an exclusive
 * lock; searches share a reader lock.
 */
class VectorIndex {
public:
    explicit VectorIndex(const IndexConfig& config = IndexConfig{}, int dim = kEmbeddingDim);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    InsertStatus insert(const std::string& id, const std::vector<float>& vector);

    /**
     * Top-k most similar vectors, highest similarity first. Ties go to the
     * earlier insertion. Ids in `exclude` are never returned.
     */
    std::vector<SearchHit> search(const std::vector<float>& query, size_t k,
                                  const std::unordered_set<std::string>& exclude = {}) const;

    std::vector<SearchHit> search_brute_force(const std::vector<float>& query, size_t k,
                                              const std::unordered_set<std::string>& exclude = {}) const;

    /**
     * Graph search with an explicit beam width (0 = configured ef_search).
     */
    std::vector<SearchHit> search_hnsw(const std::vector<float>& query, size_t k,
                                       const std::unordered_set<std::string>& exclude = {},
                                       int ef = 0) const;

    bool contains(const std::string& id) const;
    size_t size() const;            // Searchable vectors
    size_t node_count() const;      // Including replaced nodes
    int max_level() const;
    IndexState state() const { return state_.load(); }
    const IndexConfig& config() const { return config_; }

    void clear();

    std::vector<uint8_t> serialize() const;

    /**
     * Restore from serialize() output. A corrupt blob leaves the index empty.
     */
    bool deserialize(const std::vector<uint8_t>& data);

private:
    using Graph = hnswlib::HierarchicalNSW<float>;

    struct Candidate {
        float similarity;
        hnswlib::labeltype label;
    };

    static bool better(const Candidate& a, const Candidate& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.label < b.label;
    }

    std::unique_ptr<Graph> make_graph(size_t max_elements) const;
    bool reserve_locked(size_t count);
    float similarity_to(const std::vector<float>& query, hnswlib::labeltype label) const;
    bool prepare_query(const std::vector<float>& query, std::vector<float>& normalized) const;
    std::vector<SearchHit> brute_force_locked(const std::vector<float>& query, size_t k,
                                              const std::unordered_set<std::string>& exclude) const;
    std::vector<SearchHit> hnsw_locked(const std::vector<float>& query, size_t k,
                                       const std::unordered_set<std::string>& exclude,
                                       size_t ef) const;
    void reset_locked();

    IndexConfig config_;
    int dim_;

    std::unique_ptr<hnswlib::InnerProductSpace> space_;
    std::unique_ptr<Graph> graph_;

    // Labels are assigned in insertion order; a replaced label stays in the
    // graph, marked deleted, with an empty vector here
    std::vector<std::string> labels_;
    std::vector<std::vector<float>> vectors_;
    std::unordered_map<std::string, hnswlib::labeltype> live_;
    size_t deleted_count_ = 0;

    std::atomic<IndexState> state_{IndexState::Empty};
    mutable std::shared_mutex mutex_;
};

} // namespace cadence

#endif // CADENCE_VECTOR_INDEX_H
