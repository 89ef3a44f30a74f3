#include "cdjmeta/dbserver/Field.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/dbserver/BinaryField.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"
#include "cdjmeta/dbserver/NumberField.hpp"
#include "cdjmeta/dbserver/StringField.hpp"

#include <fmt/format.h>

namespace cdjmeta::dbserver {

void Field::appendTo(std::vector<uint8_t>& out) const {
    auto bytes = getBytes();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::shared_ptr<Field> Field::read(DataReader& reader) {
    const uint8_t tag = reader.readByte();
    switch (tag) {
        case TYPE_TAG_NUMBER_1:
        case TYPE_TAG_NUMBER_2:
        case TYPE_TAG_NUMBER_4:
            return std::make_shared<NumberField>(tag, reader);
        case TYPE_TAG_BINARY:
            return std::make_shared<BinaryField>(reader);
        case TYPE_TAG_STRING:
            return std::make_shared<StringField>(reader);
        default:
            throw ProtocolError(fmt::format("Unable to read a field with type tag 0x{:02x}", tag));
    }
}

std::string Field::getHexString() const {
    std::string result;
    for (auto b : getBytes()) {
        result += fmt::format("{:02x} ", b);
    }
    return result;
}

} // namespace cdjmeta::dbserver
