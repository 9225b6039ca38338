#include "core/grid_layout_planner.hpp"
#include "logging/logger.hpp"
#include <cmath>

GridDimensions GridLayoutPlanner::plan(size_t clip_count)
{
    GridDimensions best;
    if (clip_count <= 1)
    {
        return best;
    }

    const long long target = static_cast<long long>(clip_count);
    const int max_cols = static_cast<int>(std::sqrt(static_cast<double>(clip_count))) + kSearchMargin;
    long long best_slots = -1;

    for (int cols = 1; cols <= max_cols; ++cols)
    {
        for (int rows = cols; rows <= cols + 2; ++rows)
        {
            long long slots = static_cast<long long>(rows) * cols;
            if (slots < target)
                continue;
            if (best_slots < 0 || slots < best_slots)
            {
                best_slots = slots;
                best.rows = rows;
                best.cols = cols;
            }
        }
    }

    if (best_slots < 0)
    {
        // Not reachable for a non-negative margin; a square always fits
        int side = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(clip_count))));
        best.rows = side;
        best.cols = side;
    }
    return best;
}

GridLayout GridLayoutPlanner::place(const std::vector<ClipArtifact> &clips, const GridDimensions &dimensions)
{
    GridLayout layout;
    layout.dimensions = dimensions;

    const size_t capacity = dimensions.rows > 0 && dimensions.cols > 0
                                ? static_cast<size_t>(dimensions.capacity())
                                : 0;
    const size_t placed = clips.size() < capacity ? clips.size() : capacity;

    layout.cells.reserve(placed);
    for (size_t i = 0; i < placed; ++i)
    {
        GridCell cell;
        cell.row = static_cast<int>(i / dimensions.cols) + 1;
        cell.col = static_cast<int>(i % dimensions.cols) + 1;
        cell.clip = clips[i];
        layout.cells.push_back(cell);
    }

    layout.dropped_count = clips.size() - placed;
    if (layout.dropped_count > 0)
    {
        Logger::warn("Too many clips (" + std::to_string(clips.size()) + ") for " +
                     std::to_string(dimensions.rows) + "x" + std::to_string(dimensions.cols) +
                     " grid. Dropping " + std::to_string(layout.dropped_count) + ".");
    }
    return layout;
}

GridLayout GridLayoutPlanner::layout(const std::vector<ClipArtifact> &clips)
{
    return place(clips, plan(clips.size()));
}
