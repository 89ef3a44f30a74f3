#pragma once

#include <fmt/format.h>

#include <string>

namespace cdjmeta::data {

/**
 * A metadata value that is also a database key on the player, such as an
 * artist or genre: the player can build menus of tracks that share it.
 */
class SearchableItem {
public:
    SearchableItem(int id, std::string label)
        : id_(id)
        , label_(std::move(label))
    {
    }

    int getId() const { return id_; }
    const std::string& getLabel() const { return label_; }

    std::string toString() const {
        return fmt::format("SearchableItem[id:{}, label:{}]", id_, label_);
    }

    bool operator==(const SearchableItem& other) const {
        return id_ == other.id_ && label_ == other.label_;
    }

    bool operator!=(const SearchableItem& other) const {
        return !(*this == other);
    }

private:
    int id_;
    std::string label_;
};

} // namespace cdjmeta::data
