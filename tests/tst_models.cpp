#include <QtTest/QtTest>

#include <limits>

#include "src/core/models.h"

class tst_Models : public QObject
{
    Q_OBJECT

private slots:
    void coerceWorkOrderId_data();
    void coerceWorkOrderId();
    void coerceNonFinite();
    void pushErrorSetAndClear();
};

void tst_Models::coerceWorkOrderId_data()
{
    QTest::addColumn<QVariant>("cell");
    QTest::addColumn<QString>("expected");

    QTest::newRow("double") << QVariant(6000794541.0) << QStringLiteral("6000794541");
    QTest::newRow("double fraction") << QVariant(42.9) << QStringLiteral("42");
    QTest::newRow("huge double") << QVariant(1e20) << QStringLiteral("100000000000000000000");
    QTest::newRow("huge negative double") << QVariant(-1e20) << QStringLiteral("-100000000000000000000");
    QTest::newRow("int") << QVariant(1234) << QStringLiteral("1234");
    QTest::newRow("longlong") << QVariant(qlonglong(6000794541LL)) << QStringLiteral("6000794541");
    QTest::newRow("text") << QVariant(QStringLiteral("  6000794541 ")) << QStringLiteral("6000794541");
    QTest::newRow("text with .0") << QVariant(QStringLiteral("6000794541.0")) << QStringLiteral("6000794541");
    QTest::newRow("alphanumeric") << QVariant(QStringLiteral("OS-77")) << QStringLiteral("OS-77");
    QTest::newRow("blank text") << QVariant(QStringLiteral("   ")) << QString();
    QTest::newRow("invalid") << QVariant() << QString();
}

void tst_Models::coerceWorkOrderId()
{
    QFETCH(QVariant, cell);
    QFETCH(QString, expected);
    QCOMPARE(::coerceWorkOrderId(cell), expected);
}

void tst_Models::coerceNonFinite()
{
    QVERIFY(::coerceWorkOrderId(QVariant(std::numeric_limits<double>::quiet_NaN())).isEmpty());
    QVERIFY(::coerceWorkOrderId(QVariant(std::numeric_limits<double>::infinity())).isEmpty());
}

void tst_Models::pushErrorSetAndClear()
{
    PushError err;
    QVERIFY(!err.isSet());

    err.set(PushErrorKind::Timeout, QStringLiteral("busy"));
    QVERIFY(err.isSet());
    QCOMPARE(pushErrorKindToString(err.kind), QStringLiteral("Timeout"));

    err.clear();
    QVERIFY(!err.isSet());
    QVERIFY(err.message.isEmpty());
}

QTEST_GUILESS_MAIN(tst_Models)
#include "tst_models.moc"
