#include "viewport.h"

RowVisibility computeRowVisibility(int absoluteRow, int visibleRows)
{
    RowVisibility v;
    if (absoluteRow < visibleRows)
        v.scrollPosition = 0;
    else
        v.scrollPosition = absoluteRow - (visibleRows - 1);
    v.relativeRow = absoluteRow - v.scrollPosition;
    return v;
}
