#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace cdjmeta::dbserver {

/**
 * Source of bytes for field and message decoding.
 */
class DataReader {
public:
    virtual ~DataReader() = default;

    /**
     * Fill the buffer completely or throw.
     *
     * @throws std::runtime_error on timeout, short read or end of data
     */
    virtual void readFully(uint8_t* data, size_t length) = 0;

    uint8_t readByte() {
        uint8_t value = 0;
        readFully(&value, 1);
        return value;
    }
};

/**
 * Reads from a connected dbserver socket, giving up when no data arrives within the timeout.
 */
class SocketDataReader : public DataReader {
public:
    SocketDataReader(asio::ip::tcp::socket& socket, std::chrono::milliseconds timeout);

    void readFully(uint8_t* data, size_t length) override;

private:
    asio::ip::tcp::socket& socket_;
    std::chrono::milliseconds timeout_;
};

/**
 * Reads from an in-memory buffer, such as an entry loaded from a metadata cache.
 */
class ByteArrayDataReader : public DataReader {
public:
    explicit ByteArrayDataReader(std::vector<uint8_t> bytes);

    void readFully(uint8_t* data, size_t length) override;

    size_t remaining() const { return bytes_.size() - position_; }
    bool atEnd() const { return position_ >= bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
    size_t position_ = 0;
};

} // namespace cdjmeta::dbserver
