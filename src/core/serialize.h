/**
 * Cadence Engine - Binary Serialization Helpers
 *
 * Little-endian, length-prefixed encoding used for persisted engine state.
 * Every read is bounds-checked; a failed read poisons the reader so callers
 * can check once at the end and fall back to default state.
 */

#ifndef CADENCE_SERIALIZE_H
#define CADENCE_SERIALIZE_H

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace cadence {

class BinaryWriter {
public:
    void put_u8(uint8_t v) { data_.push_back(v); }

    void put_u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) data_.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }

    void put_u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) data_.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }

    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }

    void put_f32(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u32(bits);
    }

    void put_string(const std::string& s) {
        put_u32(static_cast<uint32_t>(s.size()));
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void put_floats(const std::vector<float>& values) {
        put_u32(static_cast<uint32_t>(values.size()));
        for (float v : values) put_f32(v);
    }

    void put_bytes(const std::vector<uint8_t>& values) {
        put_u64(static_cast<uint64_t>(values.size()));
        data_.insert(data_.end(), values.begin(), values.end());
    }

    void put_strings(const std::vector<std::string>& values) {
        put_u32(static_cast<uint32_t>(values.size()));
        for (const auto& v : values) put_string(v);
    }

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> take() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

class BinaryReader {
public:
    explicit BinaryReader(const std::vector<uint8_t>& data) : data_(data) {}

    bool ok() const { return ok_; }
    bool at_end() const { return pos_ == data_.size(); }

    uint8_t get_u8() {
        if (!require(1)) return 0;
        return data_[pos_++];
    }

    uint32_t get_u32() {
        if (!require(4)) return 0;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    uint64_t get_u64() {
        if (!require(8)) return 0;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    int64_t get_i64() { return static_cast<int64_t>(get_u64()); }

    float get_f32() {
        uint32_t bits = get_u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string get_string() {
        uint32_t len = get_u32();
        if (!require(len)) return {};
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    std::vector<float> get_floats() {
        uint32_t count = get_u32();
        if (!require(static_cast<size_t>(count) * 4)) return {};
        std::vector<float> values(count);
        for (auto& v : values) v = get_f32();
        return values;
    }

    std::vector<uint8_t> get_bytes() {
        uint64_t count = get_u64();
        if (!require(count)) return {};
        std::vector<uint8_t> values(data_.begin() + pos_, data_.begin() + pos_ + count);
        pos_ += count;
        return values;
    }

    std::vector<std::string> get_strings() {
        uint32_t count = get_u32();
        // Each string needs at least its 4-byte length prefix
        if (!require(static_cast<size_t>(count) * 4)) return {};
        std::vector<std::string> values;
        values.reserve(count);
        for (uint32_t i = 0; i < count && ok_; ++i) values.push_back(get_string());
        return values;
    }

    /**
     * Mark the payload as invalid (e.g. a semantic check failed).
     */
    void fail() { ok_ = false; }

private:
    bool require(size_t n) {
        if (!ok_ || data_.size() - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
    bool ok_ = true;
};

} // namespace cadence

#endif // CADENCE_SERIALIZE_H
