#include "cdjmeta/dbserver/NumberField.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/Util.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace cdjmeta::dbserver {

const NumberField NumberField::WORD_0 = NumberField(0, 4);
const NumberField NumberField::WORD_1 = NumberField(1, 4);

size_t NumberField::sizeForTypeTag(uint8_t typeTag) {
    switch (typeTag) {
        case TYPE_TAG_NUMBER_1: return 1;
        case TYPE_TAG_NUMBER_2: return 2;
        case TYPE_TAG_NUMBER_4: return 4;
        default: return 0;
    }
}

NumberField::NumberField(uint8_t typeTag, DataReader& reader)
    : typeTag_(typeTag)
    , size_(sizeForTypeTag(typeTag))
    , value_(0)
{
    if (size_ == 0) {
        throw ProtocolError(fmt::format("NumberField cannot have tag 0x{:02x}", typeTag_));
    }
    buffer_.resize(size_ + 1);
    buffer_[0] = typeTag_;
    reader.readFully(buffer_.data() + 1, size_);
    value_ = Util::bytesToNumber(buffer_.data(), 1, size_);
}

NumberField::NumberField(int64_t value, size_t size)
    : typeTag_(0)
    , size_(size)
    , value_(0)
{
    switch (size_) {
        case 1: typeTag_ = TYPE_TAG_NUMBER_1; break;
        case 2: typeTag_ = TYPE_TAG_NUMBER_2; break;
        case 4: typeTag_ = TYPE_TAG_NUMBER_4; break;
        default:
            throw std::invalid_argument("NumberField cannot have size " + std::to_string(size_));
    }
    const int64_t mask = (size_ == 4) ? 0xffffffffLL : ((1LL << (8 * size_)) - 1);
    value_ = value & mask;

    buffer_.resize(size_ + 1);
    buffer_[0] = typeTag_;
    Util::numberToBytes(value_, buffer_.data(), 1, size_);
}

NumberField::NumberField(int64_t value)
    : NumberField(value, 4)
{
}

std::string NumberField::toString() const {
    return fmt::format("NumberField[ size: {}, value: {}, bytes: {}]", size_, value_, getHexString());
}

} // namespace cdjmeta::dbserver
