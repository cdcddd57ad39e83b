#include "layout/StackPanel.hpp"
#include <algorithm>

void StackPanel::arrange() {
    bool vertical = (orientation_ == Orientation::Vertical);

    int contentW = std::max(0, width  - 2 * padding_);
    int contentH = std::max(0, height - 2 * padding_);
    int crossLimit = vertical ? contentW : contentH;

    int cursor = (vertical ? y : x) + padding_;
    int crossOrigin = (vertical ? x : y) + padding_;

    std::unordered_map<const Node*, CrossSize> seen;

    for (auto& child : children()) {
        int& cross = vertical ? child->width : child->height;

        // The requested size survives clipping unless someone resized
        // the child since our last pass
        auto it = cross_.find(child.get());
        int natural = (it != cross_.end() && it->second.assigned == cross)
                    ? it->second.natural : cross;

        if (!child->visible) {
            seen[child.get()] = {natural, cross};
            continue;
        }

        // A zero cross size means "fill the content area"
        cross = natural == 0 ? crossLimit : std::min(natural, crossLimit);
        seen[child.get()] = {natural, cross};

        if (vertical) {
            child->setPosition(crossOrigin, cursor);
            cursor += child->height + spacing_;
        } else {
            child->setPosition(cursor, crossOrigin);
            cursor += child->width + spacing_;
        }
    }
    cross_.swap(seen);
}

int StackPanel::contentExtent() const {
    bool vertical = (orientation_ == Orientation::Vertical);
    int total = 0;
    int count = 0;
    for (auto& child : children()) {
        if (!child->visible) continue;
        total += vertical ? child->height : child->width;
        count++;
    }
    if (count > 1) total += spacing_ * (count - 1);
    return total + 2 * padding_;
}
