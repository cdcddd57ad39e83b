#include "layout/GridPanel.hpp"
#include <algorithm>

std::vector<int> resolveTracks(const std::vector<Track>& tracks, int extent) {
    std::vector<int> sizes(tracks.size(), 0);

    int fixedTotal  = 0;
    int totalWeight = 0;
    int lastWeighted = -1;
    for (size_t i = 0; i < tracks.size(); i++) {
        if (tracks[i].kind == Track::Kind::Fixed) {
            sizes[i] = std::max(0, tracks[i].value);
            fixedTotal += sizes[i];
        } else {
            totalWeight += std::max(0, tracks[i].value);
            lastWeighted = static_cast<int>(i);
        }
    }

    int remaining = std::max(0, extent - fixedTotal);
    if (lastWeighted < 0) return sizes;

    int assigned = 0;
    for (size_t i = 0; i < tracks.size(); i++) {
        if (tracks[i].kind != Track::Kind::Weighted) continue;
        if (static_cast<int>(i) == lastWeighted) {
            sizes[i] = remaining - assigned;
        } else {
            int w = std::max(0, tracks[i].value);
            sizes[i] = totalWeight > 0 ? remaining * w / totalWeight : 0;
            assigned += sizes[i];
        }
    }
    return sizes;
}

GridPanel::GridPanel(std::vector<Track> rows, std::vector<Track> columns,
                     std::string name)
    : Node(std::move(name))
    , rows_(std::move(rows))
    , columns_(std::move(columns))
{
    if (rows_.empty())    rows_.push_back(Track::weighted(1));
    if (columns_.empty()) columns_.push_back(Track::weighted(1));
}

Node* GridPanel::addChildAt(std::unique_ptr<Node> child, int row, int column) {
    Node* raw = addChild(std::move(child));
    if (raw) placements_[raw] = {row, column};
    return raw;
}

void GridPanel::setCell(const Node* child, int row, int column) {
    if (!child || child->parent() != this) return;
    placements_[child] = {row, column};
}

void GridPanel::childRemoved(const Node& child) {
    placements_.erase(&child);
}

void GridPanel::arrange() {
    rowSizes_    = resolveTracks(rows_, height);
    columnSizes_ = resolveTracks(columns_, width);

    // Offsets of each track start
    std::vector<int> rowStart(rowSizes_.size(), 0);
    for (size_t i = 1; i < rowSizes_.size(); i++)
        rowStart[i] = rowStart[i - 1] + rowSizes_[i - 1];

    std::vector<int> colStart(columnSizes_.size(), 0);
    for (size_t i = 1; i < columnSizes_.size(); i++)
        colStart[i] = colStart[i - 1] + columnSizes_[i - 1];

    int lastRow = static_cast<int>(rowSizes_.size()) - 1;
    int lastCol = static_cast<int>(columnSizes_.size()) - 1;

    for (auto& child : children()) {
        if (!child->visible) continue;

        Placement p;
        auto it = placements_.find(child.get());
        if (it != placements_.end()) p = it->second;

        int r = std::clamp(p.row, 0, lastRow);
        int c = std::clamp(p.column, 0, lastCol);

        child->setPosition(x + colStart[c], y + rowStart[r]);
        child->setSize(columnSizes_[c], rowSizes_[r]);
    }
}
