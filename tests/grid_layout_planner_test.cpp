#include <gtest/gtest.h>
#include "core/grid_layout_planner.hpp"
#include "logging/logger.hpp"
#include <utility>

namespace
{
    std::vector<ClipArtifact> makeClips(size_t count)
    {
        std::vector<ClipArtifact> clips;
        for (size_t i = 0; i < count; ++i)
        {
            ClipArtifact clip;
            clip.output_name = "clip" + std::to_string(i);
            clip.path = "/clips/" + clip.output_name + ".wav";
            clip.label = "Clip" + std::to_string(i);
            clips.push_back(clip);
        }
        return clips;
    }
}

class GridLayoutPlannerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
    }
};

TEST_F(GridLayoutPlannerTest, ZeroAndOneClipGiveSingleCell)
{
    for (size_t n : {0u, 1u})
    {
        GridDimensions dims = GridLayoutPlanner::plan(n);
        EXPECT_EQ(dims.rows, 1);
        EXPECT_EQ(dims.cols, 1);
    }
}

TEST_F(GridLayoutPlannerTest, AspectAndCapacityHoldForAllCountsUpTo200)
{
    for (size_t n = 0; n <= 200; ++n)
    {
        GridDimensions dims = GridLayoutPlanner::plan(n);
        SCOPED_TRACE("n=" + std::to_string(n));
        EXPECT_GE(static_cast<size_t>(dims.capacity()), n);
        EXPECT_GE(dims.rows, dims.cols);
        EXPECT_LE(dims.rows - dims.cols, 2);
        EXPECT_GT(dims.cols, 0);
    }
}

TEST_F(GridLayoutPlannerTest, NoSmallerGridSatisfiesTheBounds)
{
    for (size_t n = 2; n <= 200; ++n)
    {
        GridDimensions dims = GridLayoutPlanner::plan(n);
        for (int cols = 1; cols * cols <= static_cast<int>(n) + 1; ++cols)
        {
            for (int rows = cols; rows <= cols + 2; ++rows)
            {
                if (static_cast<size_t>(rows * cols) >= n)
                {
                    EXPECT_LE(dims.capacity(), rows * cols) << "n=" << n;
                }
            }
        }
    }
}

TEST_F(GridLayoutPlannerTest, ExactRectangularFitsWasteNothing)
{
    for (size_t n : {4u, 6u, 9u, 12u, 20u, 30u, 42u})
    {
        EXPECT_EQ(static_cast<size_t>(GridLayoutPlanner::plan(n).capacity()), n) << "n=" << n;
    }
}

TEST_F(GridLayoutPlannerTest, KnownLayouts)
{
    const std::vector<std::pair<size_t, std::pair<int, int>>> expected = {
        {2, {2, 1}}, {3, {3, 1}}, {5, {3, 2}}, {7, {4, 2}}, {10, {4, 3}}, {15, {5, 3}}, {16, {4, 4}}, {24, {6, 4}}, {36, {6, 6}}, {100, {10, 10}}};

    for (const auto &entry : expected)
    {
        GridDimensions dims = GridLayoutPlanner::plan(entry.first);
        EXPECT_EQ(dims.rows, entry.second.first) << "n=" << entry.first;
        EXPECT_EQ(dims.cols, entry.second.second) << "n=" << entry.first;
    }
}

TEST_F(GridLayoutPlannerTest, TwentyEightClipsUseSixByFive)
{
    // 7x4 would fit exactly but is three rows taller than wide
    GridDimensions dims = GridLayoutPlanner::plan(28);
    EXPECT_EQ(dims.rows, 6);
    EXPECT_EQ(dims.cols, 5);
}

TEST_F(GridLayoutPlannerTest, PlacementIsRowMajorInCompletionOrder)
{
    GridLayout layout = GridLayoutPlanner::layout(makeClips(5));

    ASSERT_EQ(layout.dimensions.rows, 3);
    ASSERT_EQ(layout.dimensions.cols, 2);
    ASSERT_EQ(layout.cells.size(), 5u);
    EXPECT_EQ(layout.dropped_count, 0u);

    const std::vector<std::pair<int, int>> positions = {{1, 1}, {1, 2}, {2, 1}, {2, 2}, {3, 1}};
    for (size_t i = 0; i < positions.size(); ++i)
    {
        EXPECT_EQ(layout.cells[i].row, positions[i].first);
        EXPECT_EQ(layout.cells[i].col, positions[i].second);
        EXPECT_EQ(layout.cells[i].clip.output_name, "clip" + std::to_string(i));
    }
}

TEST_F(GridLayoutPlannerTest, FixedLayoutTruncatesExcessClips)
{
    GridDimensions fixed;
    fixed.rows = 2;
    fixed.cols = 3;

    GridLayout layout = GridLayoutPlanner::place(makeClips(8), fixed);

    EXPECT_EQ(layout.cells.size(), 6u);
    EXPECT_EQ(layout.dropped_count, 2u);
    EXPECT_EQ(layout.cells.back().clip.output_name, "clip5");
    for (const auto &cell : layout.cells)
    {
        EXPECT_GE(cell.row, 1);
        EXPECT_LE(cell.row, 2);
        EXPECT_GE(cell.col, 1);
        EXPECT_LE(cell.col, 3);
    }
}

TEST_F(GridLayoutPlannerTest, ComputedLayoutNeverDrops)
{
    for (size_t n = 0; n <= 60; ++n)
    {
        GridLayout layout = GridLayoutPlanner::layout(makeClips(n));
        EXPECT_EQ(layout.cells.size(), n);
        EXPECT_EQ(layout.dropped_count, 0u);
    }
}
