#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cdjmeta {

/**
 * Byte-level helpers shared by the packet parsers and the dbserver codec.
 */
class Util {
public:
    /**
     * Reconstructs a number from bytes in big-endian order. The caller is
     * responsible for making sure the range lies inside the buffer.
     */
    [[nodiscard]] static int64_t bytesToNumber(const uint8_t* buffer, size_t start, size_t length) noexcept {
        int64_t result = 0;
        for (size_t i = start; i < start + length; ++i) {
            result = (result << 8) + buffer[i];
        }
        return result;
    }

    [[nodiscard]] static int64_t bytesToNumber(std::span<const uint8_t> buffer, size_t start, size_t length) noexcept {
        return bytesToNumber(buffer.data(), start, length);
    }

    /**
     * Reconstructs a number from bytes in little-endian order, as used inside beat grid blobs.
     */
    [[nodiscard]] static int64_t bytesToNumberLittleEndian(const uint8_t* buffer, size_t start, size_t length) noexcept {
        int64_t result = 0;
        for (size_t i = start + length; i > start; --i) {
            result = (result << 8) + buffer[i - 1];
        }
        return result;
    }

    /**
     * Writes a number into the buffer in big-endian order.
     */
    static void numberToBytes(int64_t number, uint8_t* buffer, size_t start, size_t length) noexcept {
        for (size_t i = start + length; i > start; --i) {
            buffer[i - 1] = static_cast<uint8_t>(number & 0xff);
            number >>= 8;
        }
    }

    /**
     * Appends a number to the vector in big-endian order.
     */
    static void appendNumber(std::vector<uint8_t>& out, int64_t number, size_t length) {
        const size_t start = out.size();
        out.resize(start + length);
        numberToBytes(number, out.data(), start, length);
    }

    /**
     * Extract a fixed-width, NUL padded ASCII string from a packet.
     */
    [[nodiscard]] static std::string extractString(const uint8_t* buffer, size_t offset, size_t length) {
        std::string result(reinterpret_cast<const char*>(buffer + offset), length);
        const auto end = result.find('\0');
        if (end != std::string::npos) {
            result.resize(end);
        }
        while (!result.empty() && result.back() == ' ') {
            result.pop_back();
        }
        return result;
    }

    /**
     * Check whether a player number refers to a real CDJ-style player that can host media.
     */
    [[nodiscard]] static constexpr bool isPlayerNumber(int number) noexcept {
        return number >= 1 && number <= 4;
    }
};

} // namespace cdjmeta
