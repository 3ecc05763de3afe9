#include <QtTest/QtTest>

#include "src/services/clipboardservice.h"

class tst_Clipboard : public QObject
{
    Q_OBJECT

private slots:
    void normalizeLineEndings_data();
    void normalizeLineEndings();
    void systemClipboardOffWindows();
};

void tst_Clipboard::normalizeLineEndings_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("lf") << QStringLiteral("a\nb") << QStringLiteral("a\r\nb");
    QTest::newRow("crlf") << QStringLiteral("a\r\nb") << QStringLiteral("a\r\nb");
    QTest::newRow("cr") << QStringLiteral("a\rb") << QStringLiteral("a\r\nb");
    QTest::newRow("mixed") << QStringLiteral("a\r\nb\nc\rd") << QStringLiteral("a\r\nb\r\nc\r\nd");
    QTest::newRow("blank line") << QStringLiteral("a\n\nb") << QStringLiteral("a\r\n\r\nb");
    QTest::newRow("single line") << QStringLiteral("Verificar") << QStringLiteral("Verificar");
    QTest::newRow("empty") << QString() << QString();
}

void tst_Clipboard::normalizeLineEndings()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(::normalizeLineEndings(input), expected);
}

void tst_Clipboard::systemClipboardOffWindows()
{
#ifdef Q_OS_WIN
    QSKIP("Windows clipboard is only exercised against a live desktop.");
#else
    SystemClipboard clipboard;
    PushError err;
    QVERIFY(!clipboard.setText(QStringLiteral("x"), err));
    QCOMPARE(err.kind, PushErrorKind::UnsupportedPlatform);
#endif
}

QTEST_GUILESS_MAIN(tst_Clipboard)
#include "tst_clipboard.moc"
