#include <QtTest/QtTest>

#include "src/core/viewport.h"

class tst_Viewport : public QObject
{
    Q_OBJECT

private slots:
    void firstPageKeepsTableAtTop();
    void rowsBelowArePinnedToLastSlot();
    void singleVisibleRow();
    void relativeRowStaysInsideViewport();
};

void tst_Viewport::firstPageKeepsTableAtTop()
{
    const RowVisibility a = computeRowVisibility(0, 15);
    QCOMPARE(a.scrollPosition, 0);
    QCOMPARE(a.relativeRow, 0);

    const RowVisibility b = computeRowVisibility(14, 15);
    QCOMPARE(b.scrollPosition, 0);
    QCOMPARE(b.relativeRow, 14);
}

void tst_Viewport::rowsBelowArePinnedToLastSlot()
{
    const RowVisibility a = computeRowVisibility(15, 15);
    QCOMPARE(a.scrollPosition, 1);
    QCOMPARE(a.relativeRow, 14);

    const RowVisibility b = computeRowVisibility(100, 15);
    QCOMPARE(b.scrollPosition, 86);
    QCOMPARE(b.relativeRow, 14);
}

void tst_Viewport::singleVisibleRow()
{
    for (int row = 0; row < 5; ++row)
    {
        const RowVisibility v = computeRowVisibility(row, 1);
        QCOMPARE(v.scrollPosition, row);
        QCOMPARE(v.relativeRow, 0);
    }
}

void tst_Viewport::relativeRowStaysInsideViewport()
{
    for (int visible = 1; visible <= 20; ++visible)
    {
        for (int row = 0; row < 60; ++row)
        {
            const RowVisibility v = computeRowVisibility(row, visible);
            QVERIFY(v.scrollPosition >= 0);
            QVERIFY(v.relativeRow >= 0);
            QVERIFY(v.relativeRow < visible);
            QCOMPARE(v.scrollPosition + v.relativeRow, row);
        }
    }
}

QTEST_GUILESS_MAIN(tst_Viewport)
#include "tst_viewport.moc"
