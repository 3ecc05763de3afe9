#pragma once
/**
 * @file viewport.h
 * @brief Scroll-offset arithmetic for a table control with a fixed number of visible rows.
 *
 * Table rules (IW32 operations table):
 * - The control renders visibleRows rows starting at the scrollbar position.
 * - Cell ids inside the table are relative to that first rendered row, so
 *   the long-text button of row N is addressed as [8, N - scrollPosition].
 * - Rows 0..visibleRows-1 are reached without scrolling.
 * - Any later row is brought to the last visible slot; the position only
 *   grows as rows are processed in order.
 *
 * Pure arithmetic, no SAP access. Run parameters are range-checked by
 * WorkflowEngine::validateRequest before this is reached.
 */

struct RowVisibility
{
    int scrollPosition = 0; ///< index of the first rendered row
    int relativeRow = 0;    ///< target row inside the viewport, 0..visibleRows-1
};

/**
 * @brief Where to scroll so that @p absoluteRow is on screen.
 *
 * Rows inside the first page keep the table at the top; anything below is
 * pinned to the last visible slot. @p absoluteRow must be >= 0 and
 * @p visibleRows > 0.
 */
RowVisibility computeRowVisibility(int absoluteRow, int visibleRows);
