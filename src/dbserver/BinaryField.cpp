#include "cdjmeta/dbserver/BinaryField.hpp"

#include "cdjmeta/Util.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

namespace cdjmeta::dbserver {

BinaryField::BinaryField(DataReader& reader) {
    uint8_t sizeBytes[4] = {};
    reader.readFully(sizeBytes, sizeof(sizeBytes));
    const auto size = static_cast<size_t>(Util::bytesToNumber(sizeBytes, 0, 4));
    value_.resize(size);
    if (size > 0) {
        reader.readFully(value_.data(), size);
    }
    buildBuffer();
}

BinaryField::BinaryField(std::vector<uint8_t> bytes)
    : value_(std::move(bytes))
{
    buildBuffer();
}

BinaryField::BinaryField(std::span<const uint8_t> bytes)
    : BinaryField(std::vector<uint8_t>(bytes.begin(), bytes.end()))
{
}

void BinaryField::buildBuffer() {
    buffer_.clear();
    buffer_.reserve(value_.size() + 5);
    buffer_.push_back(TYPE_TAG_BINARY);
    Util::appendNumber(buffer_, static_cast<int64_t>(value_.size()), 4);
    buffer_.insert(buffer_.end(), value_.begin(), value_.end());
}

std::string BinaryField::toString() const {
    return fmt::format("BinaryField[ size: {}, bytes: {}]", value_.size(), getHexString());
}

} // namespace cdjmeta::dbserver
