/**
 * Cadence Engine - Vector Index Implementation
 */

#include "vector_index.h"
#include "../core/serialize.h"
#include "../core/utils.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>

namespace cadence {

namespace {
constexpr uint32_t kIndexMagic = 0x58495643;  // "CVIX"
constexpr uint32_t kIndexVersion = 2;
constexpr size_t kInitialElements = 1024;

// Same-id re-insert within this cosine distance is a no-op
constexpr float kUnchangedEpsilon = 1e-6f;

// hnswlib persists through files; blobs pass through a scratch file
class ScratchFile {
public:
    ScratchFile() {
        static std::atomic<uint64_t> counter{0};
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        if (ec) dir = ".";
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = dir / ("cadence-index-" + std::to_string(stamp) + "-" +
                       std::to_string(counter.fetch_add(1)) + ".bin");
    }

    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    std::string path() const { return path_.string(); }

    bool read(std::vector<uint8_t>& out) const {
        std::ifstream in(path_, std::ios::binary);
        if (!in) return false;
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return !in.bad();
    }

    bool write(const std::vector<uint8_t>& bytes) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(out);
    }

private:
    std::filesystem::path path_;
};

uint64_t checksum(const std::vector<uint8_t>& bytes) {
    return utils::fnv1a(std::string(bytes.begin(), bytes.end()));
}

class ExcludeFilter : public hnswlib::BaseFilterFunctor {
public:
    ExcludeFilter(const std::vector<std::string>& labels, const std::unordered_set<std::string>& exclude)
        : labels_(labels), exclude_(exclude) {}

    bool operator()(hnswlib::labeltype label) override {
        return label < labels_.size() && exclude_.count(labels_[label]) == 0;
    }

private:
    const std::vector<std::string>& labels_;
    const std::unordered_set<std::string>& exclude_;
};
}

const char* insert_status_name(InsertStatus status) {
    switch (status) {
        case InsertStatus::Inserted: return "inserted";
        case InsertStatus::Unchanged: return "unchanged";
        case InsertStatus::Replaced: return "replaced";
        case InsertStatus::CapacityExceeded: return "capacity exceeded";
        case InsertStatus::InvalidVector: return "invalid vector";
        case InsertStatus::DimensionMismatch: return "dimension mismatch";
    }
    return "unknown";
}

VectorIndex::VectorIndex(const IndexConfig& config, int dim)
    : config_(config), dim_(dim) {
    if (config_.m_max < 2) config_.m_max = 2;
    if (config_.ef_construction < config_.m_max) config_.ef_construction = config_.m_max;
    if (config_.ef_search < 1) config_.ef_search = 1;

    space_ = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dim_));
    graph_ = make_graph(std::min(config_.capacity, kInitialElements));
}

VectorIndex::~VectorIndex() = default;

std::unique_ptr<VectorIndex::Graph> VectorIndex::make_graph(size_t max_elements) const {
    auto graph = std::make_unique<Graph>(space_.get(), std::max<size_t>(max_elements, 1),
                                         static_cast<size_t>(config_.m_max),
                                         static_cast<size_t>(config_.ef_construction),
                                         static_cast<size_t>(config_.level_seed));
    graph->setEf(static_cast<size_t>(config_.ef_search));
    return graph;
}

bool VectorIndex::reserve_locked(size_t count) {
    size_t current = graph_->getMaxElements();
    if (count <= current) return true;
    if (count > config_.capacity) return false;

    size_t target = std::min(config_.capacity, std::max(count, current * 2));
    try {
        graph_->resizeIndex(target);
    } catch (const std::exception& e) {
        utils::log(utils::LogLevel::Error, "VectorIndex", "Resize to %zu failed: %s", target, e.what());
        return false;
    }
    return true;
}

float VectorIndex::similarity_to(const std::vector<float>& query, hnswlib::labeltype label) const {
    // Stored vectors and queries are unit length
    return utils::clamp(utils::dot(query, vectors_[label]), -1.0f, 1.0f);
}

InsertStatus VectorIndex::insert(const std::string& id, const std::vector<float>& vector) {
    if (static_cast<int>(vector.size()) != dim_) {
        return InsertStatus::DimensionMismatch;
    }

    std::vector<float> normalized = vector;
    if (!utils::normalize_in_place(normalized)) {
        return InsertStatus::InvalidVector;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool replacing = false;
    hnswlib::labeltype previous = 0;
    auto existing = live_.find(id);
    if (existing != live_.end()) {
        previous = existing->second;
        if (utils::dot(vectors_[previous], normalized) >= 1.0f - kUnchangedEpsilon) {
            return InsertStatus::Unchanged;
        }
        replacing = true;
    }

    hnswlib::labeltype label = labels_.size();
    if (!reserve_locked(label + 1)) {
        utils::log(utils::LogLevel::Warn, "VectorIndex", "Capacity %zu reached, rejecting %s",
                   config_.capacity, id.c_str());
        return InsertStatus::CapacityExceeded;
    }

    state_ = IndexState::Building;
    try {
        graph_->addPoint(normalized.data(), label);
    } catch (const std::runtime_error& e) {
        state_ = live_.empty() ? IndexState::Empty : IndexState::Ready;
        utils::log(utils::LogLevel::Warn, "VectorIndex", "Rejecting %s: %s", id.c_str(), e.what());
        return InsertStatus::CapacityExceeded;
    }

    labels_.push_back(id);
    vectors_.push_back(std::move(normalized));

    if (replacing) {
        graph_->markDelete(previous);
        vectors_[previous].clear();
        vectors_[previous].shrink_to_fit();
        deleted_count_++;
    }
    live_[id] = label;

    state_ = IndexState::Ready;
    return replacing ? InsertStatus::Replaced : InsertStatus::Inserted;
}

bool VectorIndex::prepare_query(const std::vector<float>& query, std::vector<float>& normalized) const {
    if (static_cast<int>(query.size()) != dim_) return false;
    normalized = query;
    return utils::normalize_in_place(normalized);
}

std::vector<SearchHit> VectorIndex::brute_force_locked(
    const std::vector<float>& query, size_t k,
    const std::unordered_set<std::string>& exclude) const {

    std::vector<Candidate> scored;
    scored.reserve(live_.size());
    for (hnswlib::labeltype label = 0; label < labels_.size(); ++label) {
        if (vectors_[label].empty() || exclude.count(labels_[label])) continue;
        scored.push_back({similarity_to(query, label), label});
    }

    size_t count = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + count, scored.end(), better);

    std::vector<SearchHit> hits;
    hits.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        hits.push_back({labels_[scored[i].label], scored[i].similarity});
    }
    return hits;
}

std::vector<SearchHit> VectorIndex::hnsw_locked(
    const std::vector<float>& query, size_t k,
    const std::unordered_set<std::string>& exclude, size_t ef) const {

    if (live_.empty()) return {};

    // searchKnn walks a beam of max(ef, k); asking for `ef` results keeps
    // ties at the cut-off so the label order below decides them
    ExcludeFilter filter(labels_, exclude);
    auto found = graph_->searchKnn(query.data(), std::max(ef, k),
                                   exclude.empty() ? nullptr : &filter);

    std::vector<Candidate> scored;
    scored.reserve(found.size());
    while (!found.empty()) {
        hnswlib::labeltype label = found.top().second;
        found.pop();
        if (label >= labels_.size() || vectors_[label].empty()) continue;
        scored.push_back({similarity_to(query, label), label});
    }
    std::sort(scored.begin(), scored.end(), better);
    if (scored.size() > k) scored.resize(k);

    std::vector<SearchHit> hits;
    hits.reserve(scored.size());
    for (const auto& c : scored) {
        hits.push_back({labels_[c.label], c.similarity});
    }
    return hits;
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float>& query, size_t k,
                                           const std::unordered_set<std::string>& exclude) const {
    std::vector<float> q;
    if (k == 0 || !prepare_query(query, q)) return {};

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (live_.empty()) return {};

    if (live_.size() < config_.brute_force_threshold) {
        return brute_force_locked(q, k, exclude);
    }

    // Widen the beam so filtered nodes do not starve the result
    size_t ef = std::max(static_cast<size_t>(config_.ef_search),
                         k + exclude.size() + deleted_count_);
    ef = std::min(ef, labels_.size());
    return hnsw_locked(q, k, exclude, ef);
}

std::vector<SearchHit> VectorIndex::search_brute_force(const std::vector<float>& query, size_t k,
                                                       const std::unordered_set<std::string>& exclude) const {
    std::vector<float> q;
    if (k == 0 || !prepare_query(query, q)) return {};

    std::shared_lock<std::shared_mutex> lock(mutex_);
    return brute_force_locked(q, k, exclude);
}

std::vector<SearchHit> VectorIndex::search_hnsw(const std::vector<float>& query, size_t k,
                                                const std::unordered_set<std::string>& exclude,
                                                int ef) const {
    std::vector<float> q;
    if (k == 0 || !prepare_query(query, q)) return {};

    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t beam = static_cast<size_t>(ef > 0 ? ef : config_.ef_search);
    return hnsw_locked(q, k, exclude, beam);
}

bool VectorIndex::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return live_.count(id) > 0;
}

size_t VectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return live_.size();
}

size_t VectorIndex::node_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return labels_.size();
}

int VectorIndex::max_level() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return labels_.empty() ? -1 : graph_->maxlevel_;
}

void VectorIndex::reset_locked() {
    graph_ = make_graph(std::min(config_.capacity, kInitialElements));
    labels_.clear();
    vectors_.clear();
    live_.clear();
    deleted_count_ = 0;
    state_ = IndexState::Empty;
}

void VectorIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked();
}

/* ============================================================================
 * Persistence
 *
 * Header (ids and deleted flags) followed by the hnswlib graph image and its
 * checksum.
 * ============================================================================ */

std::vector<uint8_t> VectorIndex::serialize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<uint8_t> graph_bytes;
    if (!labels_.empty()) {
        ScratchFile scratch;
        try {
            graph_->saveIndex(scratch.path());
        } catch (const std::exception& e) {
            utils::log(utils::LogLevel::Error, "VectorIndex", "Saving graph failed: %s", e.what());
            return {};
        }
        if (!scratch.read(graph_bytes)) {
            utils::log(utils::LogLevel::Error, "VectorIndex", "Reading graph image failed");
            return {};
        }
    }

    BinaryWriter w;
    w.put_u32(kIndexMagic);
    w.put_u32(kIndexVersion);
    w.put_u32(static_cast<uint32_t>(dim_));
    w.put_u32(static_cast<uint32_t>(labels_.size()));
    for (size_t label = 0; label < labels_.size(); ++label) {
        w.put_string(labels_[label]);
        w.put_u8(vectors_[label].empty() ? 1 : 0);
    }
    w.put_u64(checksum(graph_bytes));
    w.put_bytes(graph_bytes);
    return w.take();
}

bool VectorIndex::deserialize(const std::vector<uint8_t>& data) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked();

    BinaryReader r(data);
    if (r.get_u32() != kIndexMagic || r.get_u32() != kIndexVersion ||
        static_cast<int>(r.get_u32()) != dim_) {
        utils::log(utils::LogLevel::Warn, "VectorIndex", "Ignoring unrecognized index blob");
        return false;
    }

    uint32_t count = r.get_u32();
    if (!r.ok() || count > config_.capacity) r.fail();

    std::vector<std::string> labels;
    std::vector<char> deleted;
    std::unordered_map<std::string, hnswlib::labeltype> live;
    size_t deleted_count = 0;
    for (uint32_t label = 0; label < count && r.ok(); ++label) {
        labels.push_back(r.get_string());
        deleted.push_back(r.get_u8() != 0 ? 1 : 0);
        if (deleted.back()) {
            deleted_count++;
        } else if (!live.emplace(labels.back(), label).second) {
            r.fail();
        }
    }

    uint64_t expected = r.get_u64();
    std::vector<uint8_t> graph_bytes = r.get_bytes();
    if (!r.ok() || !r.at_end() || checksum(graph_bytes) != expected ||
        graph_bytes.empty() != (count == 0)) {
        r.fail();
    }

    std::unique_ptr<Graph> graph;
    std::vector<std::vector<float>> vectors(labels.size());
    if (r.ok() && count > 0) {
        ScratchFile scratch;
        if (!scratch.write(graph_bytes)) {
            utils::log(utils::LogLevel::Error, "VectorIndex", "Writing graph image failed");
            return false;
        }
        try {
            size_t max_elements = std::min(config_.capacity, std::max<size_t>(count, kInitialElements));
            graph = std::make_unique<Graph>(space_.get(), scratch.path(), false, max_elements);
            if (graph->getCurrentElementCount() != count) r.fail();
            for (hnswlib::labeltype label = 0; label < count && r.ok(); ++label) {
                if (deleted[label]) continue;
                vectors[label] = graph->getDataByLabel<float>(label);
                if (vectors[label].size() != static_cast<size_t>(dim_)) r.fail();
            }
        } catch (const std::exception& e) {
            utils::log(utils::LogLevel::Warn, "VectorIndex", "Graph image rejected: %s", e.what());
            r.fail();
        }
    }

    if (!r.ok()) {
        utils::log(utils::LogLevel::Warn, "VectorIndex", "Index blob is corrupt, starting empty");
        return false;
    }

    if (graph) {
        graph->setEf(static_cast<size_t>(config_.ef_search));
        graph_ = std::move(graph);
    }
    labels_ = std::move(labels);
    vectors_ = std::move(vectors);
    live_ = std::move(live);
    deleted_count_ = deleted_count;
    state_ = live_.empty() ? IndexState::Empty : IndexState::Ready;
    return true;
}

} // namespace cadence
