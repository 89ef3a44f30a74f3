#pragma once

#include "Util.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace cdjmeta {

/**
 * A device seen on the network, as reported by the discovery transport.
 */
class DeviceAnnouncement {
public:
    /**
     * The expected size of a device announcement packet.
     */
    static constexpr size_t PACKET_SIZE = 0x36;

    static constexpr size_t NAME_OFFSET = 0x0c;
    static constexpr size_t NAME_LENGTH = 20;
    static constexpr size_t NUMBER_OFFSET = 0x24;

    /**
     * Construct from a raw keep-alive packet.
     *
     * @throws std::invalid_argument if the packet is not 54 bytes long
     */
    DeviceAnnouncement(const uint8_t* data, size_t length, const asio::ip::address_v4& senderAddress)
        : address_(senderAddress)
        , timestamp_(std::chrono::steady_clock::now())
    {
        if (length != PACKET_SIZE) {
            throw std::invalid_argument("Device announcement packet must be 54 bytes long");
        }
        name_ = Util::extractString(data, NAME_OFFSET, NAME_LENGTH);
        number_ = data[NUMBER_OFFSET];
    }

    DeviceAnnouncement(int deviceNumber, std::string name, const asio::ip::address_v4& address)
        : address_(address)
        , timestamp_(std::chrono::steady_clock::now())
        , name_(std::move(name))
        , number_(deviceNumber)
    {
    }

    asio::ip::address_v4 getAddress() const { return address_; }
    std::chrono::steady_clock::time_point getTimestamp() const { return timestamp_; }
    const std::string& getDeviceName() const { return name_; }
    int getDeviceNumber() const { return number_; }

    std::string toString() const {
        return "DeviceAnnouncement[device:" + std::to_string(number_) +
               ", name:" + name_ +
               ", address:" + address_.to_string() + "]";
    }

private:
    asio::ip::address_v4 address_;
    std::chrono::steady_clock::time_point timestamp_;
    std::string name_;
    int number_ = 0;
};

} // namespace cdjmeta
