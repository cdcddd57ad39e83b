#pragma once
#include "ui/Node.hpp"
#include <unordered_map>
#include <vector>

// Row or column definition
struct Track {
    enum class Kind { Fixed, Weighted } kind = Kind::Weighted;
    int value = 1;   // cells for Fixed, weight for Weighted

    static Track fixed(int cells)   { return {Kind::Fixed, cells}; }
    static Track weighted(int w)    { return {Kind::Weighted, w}; }
};

// Splits an extent across tracks: Fixed tracks get their size, the rest is
// shared by Weighted tracks in proportion to weight (floor division, the
// remainder going to the last weighted track).
std::vector<int> resolveTracks(const std::vector<Track>& tracks, int extent);

// Places each child in a (row, column) cell and sizes it to that cell.
// Indices outside the declared tracks clamp to the last track.
class GridPanel : public Node {
public:
    GridPanel(std::vector<Track> rows, std::vector<Track> columns,
              std::string name = "grid");

    // Adds a child at the given cell
    Node* addChildAt(std::unique_ptr<Node> child, int row, int column);

    template <typename T, typename... Args>
    T& emplaceAt(int row, int column, Args&&... args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *child;
        addChildAt(std::move(child), row, column);
        return ref;
    }

    // Ignored for nodes that are not our children
    void setCell(const Node* child, int row, int column);

    void arrange() override;
    bool isPanel() const override { return true; }

    const std::vector<Track>& rows() const    { return rows_; }
    const std::vector<Track>& columns() const { return columns_; }

    // Sizes from the last arrange()
    const std::vector<int>& rowSizes() const    { return rowSizes_; }
    const std::vector<int>& columnSizes() const { return columnSizes_; }

    size_t placementCount() const { return placements_.size(); }

protected:
    void childRemoved(const Node& child) override;

private:
    struct Placement {
        int row = 0;
        int column = 0;
    };

    std::vector<Track> rows_;
    std::vector<Track> columns_;
    std::unordered_map<const Node*, Placement> placements_;
    std::vector<int> rowSizes_;
    std::vector<int> columnSizes_;
};
