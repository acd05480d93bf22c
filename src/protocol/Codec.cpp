#include "cortexgrid/protocol/Codec.hpp"

namespace cortexgrid::protocol {

void ByteWriter::write_u16(std::uint16_t value) {
    buffer_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteWriter::write_u32(std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void ByteWriter::write_u64(std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void ByteWriter::write_raw(std::span<const std::uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::write_blob(std::span<const std::uint8_t> bytes) {
    write_u32(static_cast<std::uint32_t>(bytes.size()));
    write_raw(bytes);
}

void ByteWriter::write_string(const std::string& value) {
    const auto* data = reinterpret_cast<const std::uint8_t*>(value.data());
    write_blob(std::span<const std::uint8_t>(data, value.size()));
}

bool ByteReader::require(std::size_t count) {
    if (!ok_ || data_.size() - offset_ < count) {
        ok_ = false;
        return false;
    }
    return true;
}

std::uint8_t ByteReader::read_u8() {
    if (!require(1)) {
        return 0;
    }
    return data_[offset_++];
}

std::uint16_t ByteReader::read_u16() {
    if (!require(2)) {
        return 0;
    }
    const auto value = static_cast<std::uint16_t>(data_[offset_] | (data_[offset_ + 1] << 8));
    offset_ += 2;
    return value;
}

std::uint32_t ByteReader::read_u32() {
    if (!require(4)) {
        return 0;
    }
    std::uint32_t value = 0;
    for (int index = 3; index >= 0; --index) {
        value = (value << 8) | static_cast<std::uint32_t>(data_[offset_ + static_cast<std::size_t>(index)]);
    }
    offset_ += 4;
    return value;
}

std::uint64_t ByteReader::read_u64() {
    if (!require(8)) {
        return 0;
    }
    std::uint64_t value = 0;
    for (int index = 7; index >= 0; --index) {
        value = (value << 8) | static_cast<std::uint64_t>(data_[offset_ + static_cast<std::size_t>(index)]);
    }
    offset_ += 8;
    return value;
}

std::vector<std::uint8_t> ByteReader::read_blob() {
    const auto length = read_u32();
    if (!require(length)) {
        return {};
    }
    std::vector<std::uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                                  data_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
    offset_ += length;
    return out;
}

std::string ByteReader::read_string() {
    const auto blob = read_blob();
    return std::string(blob.begin(), blob.end());
}

}  // namespace cortexgrid::protocol
