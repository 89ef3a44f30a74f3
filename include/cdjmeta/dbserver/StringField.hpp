#pragma once

#include "Field.hpp"

#include <string>
#include <vector>

namespace cdjmeta::dbserver {

/**
 * A NUL terminated UTF-16BE string. The length prefix counts UTF-16 code
 * units including the terminator; the value is exposed as UTF-8.
 */
class StringField : public Field {
public:
    explicit StringField(DataReader& reader);
    explicit StringField(const std::string& text);

    const std::string& getValue() const { return value_; }

    uint8_t getTypeTag() const override { return TYPE_TAG_STRING; }
    uint8_t getArgumentTag() const override { return ARGUMENT_TAG_STRING; }
    size_t getSize() const override { return size_; }
    std::span<const uint8_t> getBytes() const override { return buffer_; }
    std::string toString() const override;

    static std::string decodeUtf16Be(const uint8_t* data, size_t length);
    static std::vector<uint8_t> encodeUtf16Be(const std::string& text);

private:
    size_t size_ = 0;
    std::string value_;
    std::vector<uint8_t> buffer_;
};

} // namespace cdjmeta::dbserver
