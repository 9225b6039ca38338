#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief A completed clip, ready to be placed on a button
 */
struct ClipArtifact
{
    std::string path;
    std::string output_name;
    std::string label;
};

struct GridDimensions
{
    int rows = 1;
    int cols = 1;

    int capacity() const { return rows * cols; }
};

/**
 * @brief One occupied grid cell; row and col are 1-based
 */
struct GridCell
{
    int row = 1;
    int col = 1;
    ClipArtifact clip;
};

struct GridLayout
{
    GridDimensions dimensions;
    std::vector<GridCell> cells; // Row-major, in completion order
    size_t dropped_count = 0;
};

/**
 * @brief Maps a number of clips onto a rectangular button grid
 *
 * Computed grids are never wider than tall and never more than two rows
 * taller than wide, and waste as few cells as those bounds allow.
 */
class GridLayoutPlanner
{
public:
    // Candidate column counts are searched up to floor(sqrt(n)) + kSearchMargin
    static constexpr int kSearchMargin = 5;

    /**
     * @brief Smallest grid with rows >= cols, rows - cols <= 2 and room for clip_count
     *
     * 0 and 1 clips give a 1x1 grid. Ties on slot count keep the candidate
     * with fewer columns.
     */
    static GridDimensions plan(size_t clip_count);

    /**
     * @brief Assign clips to cells row-major
     *
     * Clips beyond the grid capacity are dropped and counted in
     * GridLayout::dropped_count, with a warning.
     */
    static GridLayout place(const std::vector<ClipArtifact> &clips, const GridDimensions &dimensions);

    /**
     * @brief plan() followed by place()
     */
    static GridLayout layout(const std::vector<ClipArtifact> &clips);
};
