// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_UTIL_SERIALIZE_H
#define CANARY_UTIL_SERIALIZE_H

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * CDataStream - little-endian binary buffer for the persisted key bundle.
 *
 * Reads throw std::runtime_error when they would run past the end or when a
 * length prefix exceeds the caller's limit; decoders turn that into a
 * corruption error.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;
    size_t read_pos;

public:
    CDataStream() : read_pos(0) {}

    explicit CDataStream(const std::vector<uint8_t>& data_in)
        : data(data_in), read_pos(0) {}

    size_t size() const { return data.size(); }
    bool eof() const { return read_pos >= data.size(); }
    size_t remaining() const {
        return read_pos < data.size() ? data.size() - read_pos : 0;
    }

    const std::vector<uint8_t>& GetData() const { return data; }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void WriteUint32(uint32_t value) {
        uint8_t buf[4];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
        write(buf, 4);
    }

    // uint32 length prefix followed by the bytes
    void WriteBytes(const std::vector<uint8_t>& src) {
        WriteUint32(static_cast<uint32_t>(src.size()));
        write(src.data(), src.size());
    }

    void WriteString(const std::string& str) {
        WriteUint32(static_cast<uint32_t>(str.size()));
        write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }

    // --- Read Operations ---

    void read(uint8_t* dst, size_t len) {
        if (len > remaining()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        if (len > 0) {
            memcpy(dst, &data[read_pos], len);
        }
        read_pos += len;
    }

    uint32_t ReadUint32() {
        uint8_t buf[4];
        read(buf, 4);
        return static_cast<uint32_t>(buf[0]) |
               (static_cast<uint32_t>(buf[1]) << 8) |
               (static_cast<uint32_t>(buf[2]) << 16) |
               (static_cast<uint32_t>(buf[3]) << 24);
    }

    std::vector<uint8_t> ReadBytes(size_t max_len) {
        uint32_t len = ReadUint32();
        if (len > max_len) {
            throw std::runtime_error("CDataStream: field too large");
        }
        std::vector<uint8_t> result(len);
        read(result.data(), len);
        return result;
    }

    std::string ReadString(size_t max_len) {
        std::vector<uint8_t> buf = ReadBytes(max_len);
        return std::string(buf.begin(), buf.end());
    }
};

#endif // CANARY_UTIL_SERIALIZE_H
