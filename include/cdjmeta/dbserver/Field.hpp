#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace cdjmeta::dbserver {

class DataReader;

/**
 * A typed value in the dbserver protocol. Every field starts with a one byte
 * type tag; when a field is used as a message argument it is also described
 * by an argument tag in the message's tag blob.
 */
class Field {
public:
    static constexpr uint8_t TYPE_TAG_NUMBER_1 = 0x0f;
    static constexpr uint8_t TYPE_TAG_NUMBER_2 = 0x10;
    static constexpr uint8_t TYPE_TAG_NUMBER_4 = 0x11;
    static constexpr uint8_t TYPE_TAG_BINARY = 0x14;
    static constexpr uint8_t TYPE_TAG_STRING = 0x26;

    static constexpr uint8_t ARGUMENT_TAG_STRING = 0x02;
    static constexpr uint8_t ARGUMENT_TAG_BINARY = 0x03;
    static constexpr uint8_t ARGUMENT_TAG_NUMBER = 0x06;

    virtual ~Field() = default;

    /**
     * The exact bytes that represent this field on the wire, type tag included.
     */
    virtual std::span<const uint8_t> getBytes() const = 0;

    /**
     * The size of the value: the byte count of a number or blob, or of the UTF-16 text of a string.
     */
    virtual size_t getSize() const = 0;
    virtual uint8_t getTypeTag() const = 0;
    virtual uint8_t getArgumentTag() const = 0;
    virtual std::string toString() const = 0;

    void appendTo(std::vector<uint8_t>& out) const;

    /**
     * Read the next field from the stream, choosing the field class by its type tag.
     *
     * @throws ProtocolError if the tag is not one we know how to read
     */
    static std::shared_ptr<Field> read(DataReader& reader);

protected:
    std::string getHexString() const;
};

using FieldPtr = std::shared_ptr<Field>;

} // namespace cdjmeta::dbserver
