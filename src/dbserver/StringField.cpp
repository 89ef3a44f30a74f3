#include "cdjmeta/dbserver/StringField.hpp"

#include "cdjmeta/Util.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

namespace cdjmeta::dbserver {

namespace {

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

void appendUtf16Unit(std::vector<uint8_t>& out, uint32_t unit) {
    out.push_back(static_cast<uint8_t>((unit >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(unit & 0xFF));
}

// Decodes one UTF-8 sequence starting at text[i], advancing i. Returns false for a truncated or invalid lead byte.
bool nextCodePoint(const std::string& text, size_t& i, uint32_t& codePoint) {
    const auto lead = static_cast<uint8_t>(text[i]);
    size_t extra = 0;
    if (lead < 0x80) {
        codePoint = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        codePoint = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        codePoint = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        codePoint = lead & 0x07;
        extra = 3;
    } else {
        ++i;
        return false;
    }
    if (i + extra >= text.size()) {
        i = text.size();
        return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
        codePoint = (codePoint << 6) | (static_cast<uint8_t>(text[i + k]) & 0x3F);
    }
    i += extra + 1;
    return true;
}

} // namespace

std::string StringField::decodeUtf16Be(const uint8_t* data, size_t length) {
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i + 1 < length; i += 2) {
        uint32_t unit = (static_cast<uint32_t>(data[i]) << 8) | data[i + 1];
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 3 < length) {
            const uint32_t low = (static_cast<uint32_t>(data[i + 2]) << 8) | data[i + 3];
            if (low >= 0xDC00 && low <= 0xDFFF) {
                unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                i += 2;
            }
        }
        appendUtf8(result, unit);
    }
    return result;
}

std::vector<uint8_t> StringField::encodeUtf16Be(const std::string& text) {
    std::vector<uint8_t> result;
    result.reserve(text.size() * 2);
    size_t i = 0;
    while (i < text.size()) {
        uint32_t codePoint = 0;
        if (!nextCodePoint(text, i, codePoint)) {
            continue;
        }
        if (codePoint >= 0x10000) {
            codePoint -= 0x10000;
            appendUtf16Unit(result, 0xD800 + ((codePoint >> 10) & 0x3FF));
            appendUtf16Unit(result, 0xDC00 + (codePoint & 0x3FF));
        } else {
            appendUtf16Unit(result, codePoint);
        }
    }
    return result;
}

StringField::StringField(DataReader& reader) {
    uint8_t sizeBytes[4] = {};
    reader.readFully(sizeBytes, sizeof(sizeBytes));
    size_ = static_cast<size_t>(Util::bytesToNumber(sizeBytes, 0, 4)) * 2;

    buffer_.resize(size_ + 5);
    buffer_[0] = TYPE_TAG_STRING;
    std::copy(sizeBytes, sizeBytes + 4, buffer_.begin() + 1);
    if (size_ > 0) {
        reader.readFully(buffer_.data() + 5, size_);
    }

    // The trailing NUL is part of the wire length but not of the value.
    value_ = (size_ >= 2) ? decodeUtf16Be(buffer_.data() + 5, size_ - 2) : std::string{};
}

StringField::StringField(const std::string& text)
    : value_(text)
{
    auto utf16 = encodeUtf16Be(text);
    appendUtf16Unit(utf16, 0);
    size_ = utf16.size();

    buffer_.reserve(size_ + 5);
    buffer_.push_back(TYPE_TAG_STRING);
    Util::appendNumber(buffer_, static_cast<int64_t>(size_ / 2), 4);
    buffer_.insert(buffer_.end(), utf16.begin(), utf16.end());
}

std::string StringField::toString() const {
    return fmt::format("StringField[ size: {}, value: \"{}\", bytes: {}]", size_, value_, getHexString());
}

} // namespace cdjmeta::dbserver
