#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cortexgrid::protocol {

// Little-endian writer for wire payloads.
class ByteWriter {
public:
    void write_u8(std::uint8_t value) { buffer_.push_back(value); }
    void write_u16(std::uint16_t value);
    void write_u32(std::uint32_t value);
    void write_u64(std::uint64_t value);
    void write_raw(std::span<const std::uint8_t> bytes);
    // u32 length prefix followed by the bytes.
    void write_blob(std::span<const std::uint8_t> bytes);
    void write_string(const std::string& value);

    template <std::size_t N>
    void write_array(const std::array<std::uint8_t, N>& bytes) {
        write_raw(bytes);
    }

    const std::vector<std::uint8_t>& bytes() const noexcept { return buffer_; }
    std::vector<std::uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

// Little-endian reader. A short read latches failure and yields zeroes from then on.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t read_u8();
    std::uint16_t read_u16();
    std::uint32_t read_u32();
    std::uint64_t read_u64();
    std::vector<std::uint8_t> read_blob();
    std::string read_string();

    template <std::size_t N>
    std::array<std::uint8_t, N> read_array() {
        std::array<std::uint8_t, N> out{};
        if (!require(N)) {
            return out;
        }
        for (std::size_t i = 0; i < N; ++i) {
            out[i] = data_[offset_ + i];
        }
        offset_ += N;
        return out;
    }

    void invalidate() noexcept { ok_ = false; }
    [[nodiscard]] bool ok() const noexcept { return ok_; }
    std::size_t remaining() const noexcept { return ok_ ? data_.size() - offset_ : 0; }

private:
    bool require(std::size_t count);

    std::span<const std::uint8_t> data_;
    std::size_t offset_{0};
    bool ok_{true};
};

}  // namespace cortexgrid::protocol
