#include "tests/grid_test_common.h"
#include <stdexcept>

using namespace gridcore;
using namespace grid_test;

// =============================================================================
// Insert
// =============================================================================

TEST(CellModelStructureTest, InsertRowsAndColumnsAtStart) {
    CellModel model = makeModel();

    model.insertRows(0, 3);

    EXPECT_EQ(model.getRowCount(), 9);
    EXPECT_DOUBLE_EQ(model.getHeight(), 270.0);
    for (int row = 0; row < 3; ++row) {
        for (int column = 0; column < 6; ++column) {
            EXPECT_EQ(model.getCell(row, column), nullptr) << row << "," << column;
        }
    }
    EXPECT_EQ(intValue(model.getCell(3, 0)), 0);
    EXPECT_EQ(intValue(model.getCell(4, 2)), 2);
    expectRange(model.getCell(4, 2)->range, 4, 4, 2, 2);

    model.insertColumns(0, 5);

    EXPECT_EQ(model.getColumnCount(), 11);
    EXPECT_DOUBLE_EQ(model.getWidth(), 1100.0);
    EXPECT_EQ(intValue(model.getCell(8, 5)), 0);
    EXPECT_EQ(textValue(model.getCell(8, 10)), "Last cell");
    EXPECT_DOUBLE_EQ(model.getRowOffset(4), 120.0);
    EXPECT_DOUBLE_EQ(model.getColumnOffset(7), 700.0);
}

TEST(CellModelStructureTest, InsertAtEnd) {
    CellModel model = makeModel();

    model.insertRows(6, 2);
    model.insertColumns(6, 1);

    EXPECT_EQ(model.getRowCount(), 8);
    EXPECT_EQ(model.getColumnCount(), 7);
    EXPECT_EQ(model.getCell(7, 0), nullptr);
    EXPECT_EQ(model.getCell(0, 6), nullptr);
    EXPECT_EQ(textValue(model.getCell(5, 5)), "Last cell");
    EXPECT_DOUBLE_EQ(model.getHeight(), 240.0);
    EXPECT_DOUBLE_EQ(model.getWidth(), 700.0);
}

TEST(CellModelStructureTest, InsertCopiesNeighbourSize) {
    CellModel model = makeModel();
    model.resizeRows({2}, 45.0);

    model.insertRows(3, 2);
    EXPECT_DOUBLE_EQ(model.getRowSize(3), 45.0);
    EXPECT_DOUBLE_EQ(model.getRowSize(4), 45.0);
    EXPECT_DOUBLE_EQ(model.getRowSize(5), 30.0);

    model.resizeColumns({0}, 70.0);
    model.insertColumns(0, 1);
    EXPECT_DOUBLE_EQ(model.getColumnSize(0), 70.0);
}

TEST(CellModelStructureTest, InsertShiftsHiddenIndices) {
    CellModel model = makeModel({2, 4}, {0, 1});

    model.insertRows(2, 3);
    model.insertColumns(2, 5);

    EXPECT_FALSE(model.isRowHidden(2));
    EXPECT_TRUE(model.isRowHidden(5));
    EXPECT_TRUE(model.isRowHidden(7));
    EXPECT_TRUE(model.isColumnHidden(0));
    EXPECT_TRUE(model.isColumnHidden(1));
    EXPECT_DOUBLE_EQ(model.getWidth(), 900.0);
    EXPECT_DOUBLE_EQ(model.getHeight(), 210.0);
}

TEST(CellModelStructureTest, InsertInsideMergedCellGrowsIt) {
    CellModel model = makeModel({2, 4}, {0, 1});
    ASSERT_TRUE(model.mergeCells(CellRange{1, 4, 1, 4}));

    model.insertRows(3, 3);
    model.insertColumns(3, 3);

    const Cell* merged = model.getCell(1, 1);
    ASSERT_NE(merged, nullptr);
    expectRange(merged->range, 1, 7, 1, 7);
    EXPECT_EQ(model.getCell(3, 3), merged);
    EXPECT_EQ(model.getCell(5, 7), merged);
    EXPECT_EQ(model.getCell(7, 4), merged);

    EXPECT_DOUBLE_EQ(model.getWidth(), 700.0);
    EXPECT_DOUBLE_EQ(model.getHeight(), 210.0);
    EXPECT_DOUBLE_EQ(model.getColumnOffset(1), 0.0);
    EXPECT_DOUBLE_EQ(model.getColumnOffset(3), 100.0);
    EXPECT_DOUBLE_EQ(model.getRowOffset(2), 60.0);
    EXPECT_DOUBLE_EQ(model.getRowOffset(3), 60.0);
    EXPECT_DOUBLE_EQ(model.getRowOffset(7), 180.0);
    EXPECT_DOUBLE_EQ(model.getRowOffset(8), 180.0);
}

TEST(CellModelStructureTest, InsertBelowMergedCellLeavesItAlone) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{1, 2, 1, 1}));

    model.insertRows(3, 1);

    expectRange(model.getCell(1, 1)->range, 1, 2, 1, 1);
    EXPECT_EQ(model.getCell(3, 1), nullptr);
    EXPECT_EQ(intValue(model.getCell(4, 1)), 3);
}

TEST(CellModelStructureTest, InsertUsesCellInitializer) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{0, 3, 0, 0}));

    model.insertRows(2, 1, [](int row, int column) -> std::optional<Cell> {
        if (column == 4) return std::nullopt;
        Cell cell;
        cell.range = CellRange{0, 9, 0, 9};
        cell.value = static_cast<std::int64_t>(100 + row * 10 + column);
        return cell;
    });

    // The merged cell straddles the insertion point and owns the new slot.
    EXPECT_EQ(intValue(model.getCell(2, 0)), 0);
    expectRange(model.getCell(2, 0)->range, 0, 4, 0, 0);

    EXPECT_EQ(intValue(model.getCell(2, 1)), 121);
    expectRange(model.getCell(2, 1)->range, 2, 2, 1, 1);
    EXPECT_EQ(model.getCell(2, 4), nullptr);
    EXPECT_EQ(intValue(model.getCell(3, 1)), 2);
}

TEST(CellModelStructureTest, InsertRejectsBadArguments) {
    CellModel model = makeModel();
    EXPECT_THROW(model.insertRows(7, 1), std::out_of_range);
    EXPECT_THROW(model.insertColumns(-1, 1), std::out_of_range);
    EXPECT_THROW(model.insertRows(0, -2), std::invalid_argument);
    EXPECT_EQ(model.getRowCount(), 6);
}

TEST(CellModelStructureTest, InsertThenDeleteRestoresModel) {
    CellModel model = makeModel({1}, {4});
    model.resizeRows({3}, 55.0);
    ASSERT_TRUE(model.mergeCells(CellRange{2, 4, 2, 3}));

    const double width = model.getWidth();
    const double height = model.getHeight();

    model.insertRows(3, 2);
    model.insertColumns(1, 3);
    model.deleteColumns(1, 3);
    model.deleteRows(3, 2);

    EXPECT_EQ(model.getRowCount(), 6);
    EXPECT_EQ(model.getColumnCount(), 6);
    EXPECT_DOUBLE_EQ(model.getWidth(), width);
    EXPECT_DOUBLE_EQ(model.getHeight(), height);
    EXPECT_TRUE(model.isRowHidden(1));
    EXPECT_TRUE(model.isColumnHidden(4));
    EXPECT_DOUBLE_EQ(model.getRowSize(3), 55.0);
    expectRange(model.getCell(3, 3)->range, 2, 4, 2, 3);
    EXPECT_EQ(intValue(model.getCell(2, 3)), 4);
    EXPECT_EQ(intValue(model.getCell(5, 1)), 5);
}

// =============================================================================
// Delete
// =============================================================================

TEST(CellModelStructureTest, DeleteAtStart) {
    CellModel model = makeModel();

    model.deleteRows(0, 2);
    model.deleteColumns(0, 1);

    EXPECT_EQ(model.getRowCount(), 4);
    EXPECT_EQ(model.getColumnCount(), 5);
    for (int row = 0; row < 4; ++row) {
        for (int column = 0; column < 5; ++column) {
            if (row == 3 && column == 4) {
                EXPECT_EQ(textValue(model.getCell(row, column)), "Last cell");
                continue;
            }
            EXPECT_EQ(intValue(model.getCell(row, column)), (row + 2) * (column + 1));
            expectRange(model.getCell(row, column)->range, row, row, column, column);
        }
    }
    EXPECT_DOUBLE_EQ(model.getHeight(), 120.0);
    EXPECT_DOUBLE_EQ(model.getWidth(), 500.0);
}

TEST(CellModelStructureTest, DeleteAtEnd) {
    CellModel model = makeModel();

    model.deleteRows(4, 2);
    model.deleteColumns(5, 1);

    EXPECT_EQ(model.getRowCount(), 4);
    EXPECT_EQ(model.getColumnCount(), 5);
    EXPECT_EQ(intValue(model.getCell(3, 4)), 12);
    EXPECT_EQ(model.getCell(4, 0), nullptr);
}

TEST(CellModelStructureTest, DeleteInMiddle) {
    CellModel model = makeModel();

    model.deleteRows(2, 2);
    model.deleteColumns(1, 3);

    EXPECT_EQ(model.getRowCount(), 4);
    EXPECT_EQ(model.getColumnCount(), 3);
    const int rows[] = {0, 1, 4, 5};
    const int columns[] = {0, 4, 5};
    for (int row = 0; row < 4; ++row) {
        for (int column = 0; column < 3; ++column) {
            if (row == 3 && column == 2) continue;
            EXPECT_EQ(intValue(model.getCell(row, column)), rows[row] * columns[column]);
        }
    }
    EXPECT_EQ(textValue(model.getCell(3, 2)), "Last cell");
}

TEST(CellModelStructureTest, DeleteCountIsClamped) {
    CellModel model = makeModel();

    model.deleteRows(4, 10);

    EXPECT_EQ(model.getRowCount(), 4);
    EXPECT_THROW(model.deleteRows(4, 1), std::out_of_range);
    EXPECT_THROW(model.deleteColumns(0, -1), std::invalid_argument);
}

TEST(CellModelStructureTest, DeleteShiftsHiddenIndices) {
    CellModel model = makeModel({4}, {1, 5});

    model.deleteRows(2, 2);
    model.deleteColumns(2, 2);

    EXPECT_TRUE(model.isRowHidden(2));
    EXPECT_FALSE(model.isRowHidden(3));
    EXPECT_TRUE(model.isColumnHidden(1));
    EXPECT_FALSE(model.isColumnHidden(2));
    EXPECT_TRUE(model.isColumnHidden(3));
    EXPECT_DOUBLE_EQ(model.getHeight(), 90.0);
    EXPECT_DOUBLE_EQ(model.getWidth(), 200.0);
}

TEST(CellModelStructureTest, DeleteDropsHiddenIndicesInDeletedSpan) {
    CellModel model = makeModel({2, 3}, {});

    model.deleteRows(2, 2);

    EXPECT_FALSE(model.isRowHidden(2));
    EXPECT_FALSE(model.isRowHidden(3));
    EXPECT_DOUBLE_EQ(model.getHeight(), 120.0);
}

TEST(CellModelStructureTest, DeleteThroughMergedCells) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{0, 5, 0, 0}));
    ASSERT_TRUE(model.mergeCells(CellRange{1, 2, 1, 4}));

    model.deleteRows(2, 2);
    model.deleteColumns(2, 2);

    const std::vector<std::vector<CellValue>> expected = {
        {std::int64_t{0}, std::int64_t{0}, std::int64_t{0}, std::int64_t{0}},
        {std::int64_t{0}, std::int64_t{1}, std::int64_t{1}, std::int64_t{5}},
        {std::int64_t{0}, std::int64_t{4}, std::int64_t{16}, std::int64_t{20}},
        {std::int64_t{0}, std::int64_t{5}, std::int64_t{20}, std::string("Last cell")},
    };
    ASSERT_EQ(model.getRowCount(), 4);
    ASSERT_EQ(model.getColumnCount(), 4);
    for (int row = 0; row < 4; ++row) {
        for (int column = 0; column < 4; ++column) {
            const Cell* cell = model.getCell(row, column);
            ASSERT_NE(cell, nullptr);
            EXPECT_EQ(cell->value, expected[row][column]) << row << "," << column;
        }
    }

    expectRange(model.getCell(3, 0)->range, 0, 3, 0, 0);
    expectRange(model.getCell(1, 2)->range, 1, 1, 1, 2);
}

TEST(CellModelStructureTest, DeleteRowThroughMergedColumns) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{2, 5, 1, 1}));
    ASSERT_TRUE(model.mergeCells(CellRange{4, 5, 2, 2}));
    ASSERT_TRUE(model.mergeCells(CellRange{0, 5, 3, 3}));
    ASSERT_TRUE(model.mergeCells(CellRange{0, 2, 4, 4}));

    model.deleteRows(2, 1);

    expectRange(model.getCell(4, 1)->range, 2, 4, 1, 1);
    expectRange(model.getCell(4, 2)->range, 3, 4, 2, 2);
    expectRange(model.getCell(2, 3)->range, 0, 4, 3, 3);
    expectRange(model.getCell(0, 4)->range, 0, 1, 4, 4);

    const std::int64_t expected[5][5] = {
        {0, 0, 0, 0, 0},
        {0, 1, 2, 0, 0},
        {0, 2, 6, 0, 12},
        {0, 2, 8, 0, 16},
        {0, 2, 8, 0, 20},
    };
    for (int row = 0; row < 5; ++row) {
        for (int column = 0; column < 5; ++column) {
            EXPECT_EQ(intValue(model.getCell(row, column)), expected[row][column]) << row << "," << column;
        }
        if (row < 4) {
            EXPECT_EQ(intValue(model.getCell(row, 5)), row == 0 ? 0 : (row == 1 ? 5 : (row + 1) * 5));
        }
    }
    EXPECT_EQ(textValue(model.getCell(4, 5)), "Last cell");
}

TEST(CellModelStructureTest, DeleteColumnThroughMergedRows) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{1, 1, 2, 5}));
    ASSERT_TRUE(model.mergeCells(CellRange{2, 2, 4, 5}));
    ASSERT_TRUE(model.mergeCells(CellRange{3, 3, 0, 5}));
    ASSERT_TRUE(model.mergeCells(CellRange{4, 4, 0, 2}));

    model.deleteColumns(2, 1);

    expectRange(model.getCell(1, 4)->range, 1, 1, 2, 4);
    expectRange(model.getCell(2, 4)->range, 2, 2, 3, 4);
    expectRange(model.getCell(3, 2)->range, 3, 3, 0, 4);
    expectRange(model.getCell(4, 0)->range, 4, 4, 0, 1);

    EXPECT_EQ(intValue(model.getCell(1, 2)), 2);
    EXPECT_EQ(intValue(model.getCell(2, 2)), 6);
    EXPECT_EQ(intValue(model.getCell(4, 1)), 0);
    EXPECT_EQ(intValue(model.getCell(4, 2)), 12);
}

TEST(CellModelStructureTest, DeleteWholeMergedCell) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{2, 3, 0, 1}));

    model.deleteRows(2, 2);

    EXPECT_EQ(model.getRowCount(), 4);
    EXPECT_EQ(intValue(model.getCell(2, 0)), 0);
    EXPECT_EQ(intValue(model.getCell(2, 1)), 4);
    expectRange(model.getCell(2, 1)->range, 2, 2, 1, 1);
}

// =============================================================================
// Merge / split
// =============================================================================

TEST(CellModelStructureTest, MergeCells) {
    CellModel model = makeModel();

    EXPECT_TRUE(model.mergeCells(CellRange{2, 4, 2, 4}));

    const Cell* merged = model.getCell(2, 2);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(intValue(merged), 4);
    for (int row = 2; row <= 4; ++row) {
        for (int column = 2; column <= 4; ++column) {
            EXPECT_EQ(model.getCell(row, column), merged);
        }
    }
    expectRange(merged->range, 2, 4, 2, 4);
    EXPECT_EQ(model.getCells(CellRange{2, 4, 2, 4}).size(), 1u);
}

TEST(CellModelStructureTest, MergeOverMergedCellFails) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{2, 4, 2, 4}));

    EXPECT_FALSE(model.mergeCells(CellRange{1, 4, 2, 4}));
    EXPECT_FALSE(model.mergeCells(CellRange{4, 5, 4, 5}));

    // Nothing changed.
    expectRange(model.getCell(3, 3)->range, 2, 4, 2, 4);
    EXPECT_EQ(intValue(model.getCell(1, 2)), 2);
    expectRange(model.getCell(1, 2)->range, 1, 1, 2, 2);
    EXPECT_EQ(intValue(model.getCell(5, 4)), 20);
}

TEST(CellModelStructureTest, MergeEmptySlotsCreatesAnchor) {
    CellModel model = makeEmptyModel(4, 4);

    ASSERT_TRUE(model.mergeCells(CellRange{0, 1, 0, 1}));

    const Cell* merged = model.getCell(1, 1);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(model.getCell(0, 0), merged);
    expectRange(merged->range, 0, 1, 0, 1);
    EXPECT_FALSE(hasValue(merged->value));
}

TEST(CellModelStructureTest, MergeRejectsBadRanges) {
    CellModel model = makeModel();
    EXPECT_THROW(model.mergeCells(CellRange{3, 2, 0, 0}), std::invalid_argument);
    EXPECT_THROW(model.mergeCells(CellRange{4, 6, 0, 0}), std::out_of_range);
}

TEST(CellModelStructureTest, SplitCell) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{2, 4, 2, 4}));

    model.splitCell(3, 4);

    const Cell* anchor = model.getCell(2, 2);
    ASSERT_NE(anchor, nullptr);
    expectRange(anchor->range, 2, 2, 2, 2);
    EXPECT_EQ(intValue(anchor), 4);
    for (int row = 2; row <= 4; ++row) {
        for (int column = 2; column <= 4; ++column) {
            if (row == 2 && column == 2) continue;
            EXPECT_EQ(model.getCell(row, column), nullptr) << row << "," << column;
        }
    }
}

TEST(CellModelStructureTest, SplitSingleCellIsNoOp) {
    CellModel model = makeModel();

    model.splitCell(1, 1);

    EXPECT_EQ(intValue(model.getCell(1, 1)), 1);
    EXPECT_THROW(model.splitCell(6, 0), std::out_of_range);
}

TEST(CellModelStructureTest, SplitKeepsOutlineBorder) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{1, 2, 1, 2}));

    BorderSide side;
    side.priority = 1;
    model.getCell(1, 1)->border = Border{side, side, side, side};

    model.splitCell(1, 1);

    const Cell* topLeft = model.getCell(1, 1);
    ASSERT_TRUE(topLeft->border.has_value());
    EXPECT_TRUE(topLeft->border->top.has_value());
    EXPECT_TRUE(topLeft->border->left.has_value());
    EXPECT_FALSE(topLeft->border->bottom.has_value());
    EXPECT_FALSE(topLeft->border->right.has_value());

    const Cell* topRight = model.getCell(1, 2);
    ASSERT_NE(topRight, nullptr);
    EXPECT_TRUE(topRight->border->top.has_value());
    EXPECT_TRUE(topRight->border->right.has_value());
    EXPECT_FALSE(topRight->border->left.has_value());
    EXPECT_FALSE(hasValue(topRight->value));

    const Cell* bottomLeft = model.getCell(2, 1);
    ASSERT_NE(bottomLeft, nullptr);
    EXPECT_TRUE(bottomLeft->border->bottom.has_value());
    EXPECT_TRUE(bottomLeft->border->left.has_value());
    EXPECT_FALSE(bottomLeft->border->top.has_value());

    const Cell* bottomRight = model.getCell(2, 2);
    ASSERT_NE(bottomRight, nullptr);
    EXPECT_TRUE(bottomRight->border->bottom.has_value());
    EXPECT_TRUE(bottomRight->border->right.has_value());
    expectRange(bottomRight->range, 2, 2, 2, 2);
}

TEST(CellModelStructureTest, SplitThenMergeAgain) {
    CellModel model = makeModel();
    ASSERT_TRUE(model.mergeCells(CellRange{0, 1, 3, 5}));
    model.splitCell(1, 5);

    ASSERT_TRUE(model.mergeCells(CellRange{0, 1, 3, 5}));

    const Cell* merged = model.getCell(1, 4);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(intValue(merged), 0);
    expectRange(merged->range, 0, 1, 3, 5);
}
