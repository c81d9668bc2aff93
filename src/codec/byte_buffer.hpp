#pragma once

/// @file src/codec/byte_buffer.hpp
/// @brief Little-endian writer and bounds-checked reader for WKB payloads.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tempus::codec::detail {

// ─── ByteWriter ───────────────────────────────────────────────────────────────

class ByteWriter {
public:
    void u8(std::uint8_t v) { out_.push_back(v); }

    void u32(std::uint32_t v) { put_le(v, 4); }
    void i32(std::int32_t v) { put_le(static_cast<std::uint32_t>(v), 4); }
    void i64(std::int64_t v) { put_le(static_cast<std::uint64_t>(v), 8); }
    void f64(double v) { put_le(std::bit_cast<std::uint64_t>(v), 8); }

    void raw(const void* data, std::size_t n) {
        const auto* p = static_cast<const std::uint8_t*>(data);
        out_.insert(out_.end(), p, p + n);
    }

    [[nodiscard]] std::vector<std::uint8_t> take() && { return std::move(out_); }

private:
    void put_le(std::uint64_t v, int bytes) {
        for (int i = 0; i < bytes; ++i) {
            out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    std::vector<std::uint8_t> out_;
};

// ─── ByteReader ───────────────────────────────────────────────────────────────

/// Every read returns nullopt instead of running past the end.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

    [[nodiscard]] std::optional<std::uint8_t> u8() noexcept {
        if (remaining() < 1) return std::nullopt;
        return bytes_[pos_++];
    }

    [[nodiscard]] std::optional<std::uint32_t> u32() noexcept {
        const auto v = get_le(4);
        if (!v) return std::nullopt;
        return static_cast<std::uint32_t>(*v);
    }

    [[nodiscard]] std::optional<std::int32_t> i32() noexcept {
        const auto v = get_le(4);
        if (!v) return std::nullopt;
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(*v));
    }

    [[nodiscard]] std::optional<std::int64_t> i64() noexcept {
        const auto v = get_le(8);
        if (!v) return std::nullopt;
        return static_cast<std::int64_t>(*v);
    }

    [[nodiscard]] std::optional<double> f64() noexcept {
        const auto v = get_le(8);
        if (!v) return std::nullopt;
        return std::bit_cast<double>(*v);
    }

    /// `n` raw bytes.
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> raw(std::size_t n) noexcept {
        if (remaining() < n) return std::nullopt;
        auto out = bytes_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

private:
    std::optional<std::uint64_t> get_le(int bytes) noexcept {
        if (remaining() < static_cast<std::size_t>(bytes)) return std::nullopt;
        std::uint64_t v = 0;
        for (int i = 0; i < bytes; ++i) {
            v |= static_cast<std::uint64_t>(bytes_[pos_ + i]) << (8 * i);
        }
        pos_ += static_cast<std::size_t>(bytes);
        return v;
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t                   pos_ = 0;
};

}  // namespace tempus::codec::detail
