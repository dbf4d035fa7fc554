/**
 * Cadence Engine - Storage Adapter
 */

#ifndef CADENCE_STORAGE_H
#define CADENCE_STORAGE_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence {

/**
 * Key/value persistence contract used for embeddings, the index structure,
 * taste profiles, preferences and co-occurrence tables.
 */
class StorageAdapter {
public:
    virtual ~StorageAdapter() = default;

    virtual std::optional<std::vector<uint8_t>> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::vector<uint8_t>& value) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool clear() = 0;
};

/**
 * In-process storage.
 */
class MemoryStorage : public StorageAdapter {
public:
    std::optional<std::vector<uint8_t>> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    bool set(const std::string& key, const std::vector<uint8_t>& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
        return true;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.erase(key) > 0;
    }

    bool clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint8_t>> values_;
};

} // namespace cadence

#endif // CADENCE_STORAGE_H
