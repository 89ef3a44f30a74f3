#pragma once

#include <fmt/format.h>

#include <string>

#include "SearchableItem.hpp"

namespace cdjmeta::data {

/**
 * The color label rekordbox users can assign to a track. The id selects one
 * of eight fixed colors; the label is the name the user gave it.
 */
class ColorItem : public SearchableItem {
public:
    ColorItem(int id, std::string label)
        : SearchableItem(id, std::move(label))
        , colorName_(colorNameForId(id))
    {
    }

    const std::string& getColorName() const { return colorName_; }

    bool isNoColor() const { return getId() == 0; }

    std::string toString() const {
        return fmt::format("ColorItem[id:{}, label:{}, colorName:{}]", getId(), getLabel(), colorName_);
    }

    bool operator==(const ColorItem& other) const {
        return static_cast<const SearchableItem&>(*this) == static_cast<const SearchableItem&>(other);
    }

    bool operator!=(const ColorItem& other) const {
        return !(*this == other);
    }

    static std::string colorNameForId(int colorId) {
        switch (colorId) {
            case 0:
                return "No Color";
            case 1:
                return "Pink";
            case 2:
                return "Red";
            case 3:
                return "Orange";
            case 4:
                return "Yellow";
            case 5:
                return "Green";
            case 6:
                return "Aqua";
            case 7:
                return "Blue";
            case 8:
                return "Purple";
            default:
                return "Unknown Color";
        }
    }

private:
    std::string colorName_;
};

} // namespace cdjmeta::data
