/**
 * @file test_cursor_cell.cpp
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <convo/delivery/CursorCell.hpp>

using namespace convo::delivery;

TEST(CursorCellTest, StartsAtBeginning)
{
    CursorCell cell;
    EXPECT_EQ(cell.get(), kBeginning);
}

TEST(CursorCellTest, AdvancesForwardOnly)
{
    CursorCell cell(StreamEntryId(10, 0));

    EXPECT_TRUE(cell.advance(StreamEntryId(10, 1)));
    EXPECT_FALSE(cell.advance(StreamEntryId(10, 1)));
    EXPECT_FALSE(cell.advance(StreamEntryId(9, 99)));
    EXPECT_EQ(cell.get(), StreamEntryId(10, 1));
}

TEST(CursorCellTest, ConcurrentAdvanceKeepsTheMaximum)
{
    CursorCell cell;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&cell, t]
                             {
                                 for (std::uint64_t i = 0; i < 1000; ++i)
                                     cell.advance(StreamEntryId(i, static_cast<std::uint64_t>(t))); });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(cell.get(), StreamEntryId(999, 3));
}
