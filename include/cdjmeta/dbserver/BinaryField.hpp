#pragma once

#include "Field.hpp"

#include <vector>

namespace cdjmeta::dbserver {

/**
 * An opaque blob preceded by a four byte length.
 *
 * On its own an empty blob is written as its tag and a zero length. Inside a
 * message, players leave out an empty blob that follows a zero length
 * argument; Message handles that case on both sides.
 */
class BinaryField : public Field {
public:
    explicit BinaryField(DataReader& reader);
    explicit BinaryField(std::vector<uint8_t> bytes);
    explicit BinaryField(std::span<const uint8_t> bytes);

    std::span<const uint8_t> getValue() const { return value_; }
    std::vector<uint8_t> getValueAsArray() const { return value_; }

    uint8_t getTypeTag() const override { return TYPE_TAG_BINARY; }
    uint8_t getArgumentTag() const override { return ARGUMENT_TAG_BINARY; }
    size_t getSize() const override { return value_.size(); }
    std::span<const uint8_t> getBytes() const override { return buffer_; }
    std::string toString() const override;

private:
    void buildBuffer();

    std::vector<uint8_t> value_;
    std::vector<uint8_t> buffer_;
};

} // namespace cdjmeta::dbserver
