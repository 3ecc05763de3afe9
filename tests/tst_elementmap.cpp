#include <QtTest/QtTest>

#include "src/core/elementmap.h"

class tst_ElementMap : public QObject
{
    Q_OBJECT

private slots:
    void defaultsCoverEveryKey();
    void rowPlaceholderIsSubstituted();
    void rowTemplateNeedsRow();
    void unknownKeyFails();
    void overrideReplacesDefault();
};

void tst_ElementMap::defaultsCoverEveryKey()
{
    const ElementMap m = ElementMap::iw32Defaults();
    const char* const keys[] = {
        ElementKey::kMainWindow, ElementKey::kCommandField, ElementKey::kOrderField,
        ElementKey::kOperationsTab, ElementKey::kOperationsTable, ElementKey::kLongTextButton,
        ElementKey::kLongTextEditor, ElementKey::kBackButton, ElementKey::kSaveButton
    };
    for (const char* key : keys)
        QVERIFY2(m.contains(key), key);
    QCOMPARE(m.keys().size(), 9);
}

void tst_ElementMap::rowPlaceholderIsSubstituted()
{
    const ElementMap m = ElementMap::iw32Defaults();
    QString address;
    PushError err;
    QVERIFY(m.resolve(ElementKey::kLongTextButton, address, err, 7));
    QVERIFY(address.endsWith(QStringLiteral("/btnLTICON-LTOPR[8,7]")));
    QVERIFY(address.startsWith(m.addressTemplate(ElementKey::kOperationsTable)));
    QVERIFY(!err.isSet());
}

void tst_ElementMap::rowTemplateNeedsRow()
{
    const ElementMap m = ElementMap::iw32Defaults();
    QString address;
    PushError err;
    QVERIFY(!m.resolve(ElementKey::kLongTextButton, address, err));
    QCOMPARE(err.kind, PushErrorKind::InvalidArgument);
    QVERIFY(address.isEmpty());
}

void tst_ElementMap::unknownKeyFails()
{
    const ElementMap m = ElementMap::iw32Defaults();
    QString address;
    PushError err;
    QVERIFY(!m.resolve(QStringLiteral("noSuchElement"), address, err));
    QCOMPARE(err.kind, PushErrorKind::InvalidArgument);
    QVERIFY(err.message.contains(QStringLiteral("noSuchElement")));
}

void tst_ElementMap::overrideReplacesDefault()
{
    ElementMap m = ElementMap::iw32Defaults();
    m.set(ElementKey::kSaveButton, QStringLiteral("  wnd[0]/tbar[0]/btn[99] "));

    QString address;
    PushError err;
    QVERIFY(m.resolve(ElementKey::kSaveButton, address, err, 3));
    QCOMPARE(address, QStringLiteral("wnd[0]/tbar[0]/btn[99]"));
}

QTEST_GUILESS_MAIN(tst_ElementMap)
#include "tst_elementmap.moc"
