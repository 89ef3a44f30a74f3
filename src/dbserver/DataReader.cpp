#include "cdjmeta/dbserver/DataReader.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <sys/select.h>
#include <sys/socket.h>
#endif

namespace cdjmeta::dbserver {

SocketDataReader::SocketDataReader(asio::ip::tcp::socket& socket, std::chrono::milliseconds timeout)
    : socket_(socket)
    , timeout_(timeout)
{
}

void SocketDataReader::readFully(uint8_t* data, size_t length) {
    size_t totalRead = 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    const auto socketHandle = socket_.native_handle();

    while (totalRead < length) {
        if (timeout_.count() > 0) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                throw std::runtime_error("Timed out reading from dbserver socket");
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            timeval tv{};
            tv.tv_sec = static_cast<long>(remaining.count() / 1000);
            tv.tv_usec = static_cast<long>((remaining.count() % 1000) * 1000);

            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(socketHandle, &readfds);
#ifdef _WIN32
            const int ready = ::select(0, &readfds, nullptr, nullptr, &tv);
#else
            const int ready = ::select(socketHandle + 1, &readfds, nullptr, nullptr, &tv);
#endif
            if (ready == 0) {
                throw std::runtime_error("Timed out reading from dbserver socket");
            }
            if (ready < 0) {
                throw std::runtime_error("Error waiting for dbserver socket readiness");
            }
        }

        asio::error_code ec;
        const size_t received = socket_.read_some(asio::buffer(data + totalRead, length - totalRead), ec);
        if (ec) {
            throw std::runtime_error("Failed to read from dbserver socket: " + ec.message());
        }
        totalRead += received;
    }
}

ByteArrayDataReader::ByteArrayDataReader(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes))
{
}

void ByteArrayDataReader::readFully(uint8_t* data, size_t length) {
    if (length > remaining()) {
        throw std::runtime_error("Unexpected end of data: needed " + std::to_string(length) +
                                 " bytes, only " + std::to_string(remaining()) + " remain");
    }
    if (length > 0) {
        std::memcpy(data, bytes_.data() + position_, length);
        position_ += length;
    }
}

} // namespace cdjmeta::dbserver
