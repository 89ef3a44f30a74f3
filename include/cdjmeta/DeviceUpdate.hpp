#pragma once

#include "Util.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cdjmeta {

/**
 * Base class for status packets received from devices on the network.
 */
class DeviceUpdate {
public:
    /**
     * The offset at which the device number can be found.
     */
    static constexpr size_t DEVICE_NUMBER_OFFSET = 0x21;

    /**
     * The offset and width of the device name.
     */
    static constexpr size_t DEVICE_NAME_OFFSET = 0x0b;
    static constexpr size_t DEVICE_NAME_LENGTH = 20;

    virtual ~DeviceUpdate() = default;

    asio::ip::address_v4 getAddress() const { return address_; }
    std::chrono::steady_clock::time_point getTimestamp() const { return timestamp_; }
    const std::string& getDeviceName() const { return deviceName_; }
    int getDeviceNumber() const { return deviceNumber_; }
    const std::vector<uint8_t>& getPacketBytes() const { return packetBytes_; }

    virtual std::string toString() const {
        return "DeviceUpdate[deviceNumber:" + std::to_string(deviceNumber_) +
               ", deviceName:" + deviceName_ +
               ", address:" + address_.to_string() + "]";
    }

protected:
    /**
     * Caller must have checked that the packet is large enough to hold the name and device number.
     */
    DeviceUpdate(std::span<const uint8_t> data, const asio::ip::address_v4& senderAddress)
        : address_(senderAddress)
        , timestamp_(std::chrono::steady_clock::now())
        , packetBytes_(data.begin(), data.end())
    {
        deviceName_ = Util::extractString(data.data(), DEVICE_NAME_OFFSET, DEVICE_NAME_LENGTH);
        deviceNumber_ = data[DEVICE_NUMBER_OFFSET];
    }

    asio::ip::address_v4 address_;
    std::chrono::steady_clock::time_point timestamp_;
    std::string deviceName_;
    int deviceNumber_ = 0;
    std::vector<uint8_t> packetBytes_;
};

} // namespace cdjmeta
