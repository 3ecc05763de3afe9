#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "xlsxdocument.h"

#include "src/core/excelimporter.h"

class tst_ExcelImporter : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void groupsRowsPerWorkOrder();
    void coercesNumericWorkOrders();
    void dropsRowsWithoutWorkOrder();
    void matchesAliasesCaseInsensitive();
    void headerRowIsConfigurable();
    void namedSheet();
    void missingColumnListsHeaders();
    void missingSheetFails();
    void rejectsNonXlsx();
    void missingFileFails();

private:
    QString writeStandardSheet(const QString& name);

    QTemporaryDir m_dir;
};

void tst_ExcelImporter::initTestCase()
{
    QVERIFY(m_dir.isValid());
}

// Title block on rows 1-3, header on row 4 (headerRow = 3), data below.
QString tst_ExcelImporter::writeStandardSheet(const QString& name)
{
    QXlsx::Document doc;
    doc.write(1, 1, QStringLiteral("Plano de manutenção"));
    doc.write(4, 1, QStringLiteral("Item"));
    doc.write(4, 2, QStringLiteral("OS"));
    doc.write(4, 3, QStringLiteral("Máscara"));

    doc.write(5, 1, 1);
    doc.write(5, 2, 6000794541.0);
    doc.write(5, 3, QStringLiteral("Verificar rolamento"));

    doc.write(6, 1, 2);
    doc.write(6, 2, 6000794541.0);
    doc.write(6, 3, QStringLiteral("Lubrificar\nReapertar"));

    doc.write(7, 1, 3);
    doc.write(7, 2, QStringLiteral("6000800001"));
    doc.write(7, 3, QStringLiteral("Trocar filtro"));

    // no work order: ignored
    doc.write(8, 1, 4);
    doc.write(8, 3, QStringLiteral("sem ordem"));

    doc.write(9, 1, 5);
    doc.write(9, 2, 6000794541.0);

    const QString path = m_dir.filePath(name);
    if (!doc.saveAs(path))
        return QString();
    return path;
}

void tst_ExcelImporter::groupsRowsPerWorkOrder()
{
    const QString path = writeStandardSheet(QStringLiteral("plan.xlsx"));
    QVERIFY(!path.isEmpty());

    ExcelImporter importer;
    QString err;
    QVERIFY2(importer.loadXlsx(path, SheetConfig(), err), qPrintable(err));

    QCOMPARE(importer.workOrders(), (QStringList{ QStringLiteral("6000794541"), QStringLiteral("6000800001") }));
    QCOMPARE(importer.rows().size(), 4);

    const QStringList texts = importer.longTextsFor(QStringLiteral("6000794541"));
    QCOMPARE(texts.size(), 3);
    QCOMPARE(texts.at(0), QStringLiteral("Verificar rolamento"));
    QCOMPARE(texts.at(1), QStringLiteral("Lubrificar\nReapertar"));
    QVERIFY(texts.at(2).isEmpty());

    const QVector<SheetRow> rows = importer.rowsForWorkOrder(QStringLiteral("6000800001"));
    QCOMPARE(rows.size(), 1);
    QCOMPARE(rows.first().excelRow, 7);
    QCOMPARE(importer.workOrderColumn(), 2);
    QCOMPARE(importer.longTextColumn(), 3);
    QCOMPARE(importer.sourcePath(), path);
}

void tst_ExcelImporter::coercesNumericWorkOrders()
{
    const QString path = writeStandardSheet(QStringLiteral("numeric.xlsx"));
    ExcelImporter importer;
    QString err;
    QVERIFY2(importer.loadXlsx(path, SheetConfig(), err), qPrintable(err));

    for (const SheetRow& r : importer.rows())
    {
        QVERIFY(!r.workOrder.contains(QChar('.')));
        QVERIFY(!r.workOrder.contains(QChar('e'), Qt::CaseInsensitive));
    }
}

void tst_ExcelImporter::dropsRowsWithoutWorkOrder()
{
    const QString path = writeStandardSheet(QStringLiteral("gaps.xlsx"));
    ExcelImporter importer;
    QString err;
    QVERIFY2(importer.loadXlsx(path, SheetConfig(), err), qPrintable(err));

    QCOMPARE(importer.skippedRows(), 1);
    for (const SheetRow& r : importer.rows())
        QVERIFY(r.excelRow != 8);
}

void tst_ExcelImporter::matchesAliasesCaseInsensitive()
{
    QXlsx::Document doc;
    doc.write(1, 1, QStringLiteral(" os "));
    doc.write(1, 2, QStringLiteral("MASCARA"));
    doc.write(2, 1, QStringLiteral("A-1"));
    doc.write(2, 2, QStringLiteral("texto"));
    const QString path = m_dir.filePath(QStringLiteral("aliases.xlsx"));
    QVERIFY(doc.saveAs(path));

    SheetConfig cfg;
    cfg.headerRow = 0;

    ExcelImporter importer;
    QString err;
    QVERIFY2(importer.loadXlsx(path, cfg, err), qPrintable(err));
    QCOMPARE(importer.longTextsFor(QStringLiteral("A-1")), QStringList{ QStringLiteral("texto") });
}

void tst_ExcelImporter::headerRowIsConfigurable()
{
    const QString path = writeStandardSheet(QStringLiteral("header.xlsx"));

    SheetConfig cfg;
    cfg.headerRow = 0; // row 1 holds the title only
    ExcelImporter importer;
    QString err;
    QVERIFY(!importer.loadXlsx(path, cfg, err));
    QVERIFY(err.contains(QStringLiteral("OS")));
    QVERIFY(importer.rows().isEmpty());
}

void tst_ExcelImporter::namedSheet()
{
    QXlsx::Document doc;
    doc.write(1, 1, QStringLiteral("ignored"));
    QVERIFY(doc.addSheet(QStringLiteral("Dados")));
    QVERIFY(doc.selectSheet(QStringLiteral("Dados")));
    doc.write(1, 1, QStringLiteral("OS"));
    doc.write(1, 2, QStringLiteral("Mascara"));
    doc.write(2, 1, 77);
    doc.write(2, 2, QStringLiteral("x"));
    const QString path = m_dir.filePath(QStringLiteral("named.xlsx"));
    QVERIFY(doc.saveAs(path));

    SheetConfig cfg;
    cfg.sheetName = QStringLiteral("Dados");
    cfg.headerRow = 0;

    ExcelImporter importer;
    QString err;
    QVERIFY2(importer.loadXlsx(path, cfg, err), qPrintable(err));
    QCOMPARE(importer.sheetName(), QStringLiteral("Dados"));
    QCOMPARE(importer.sheetNames().size(), 2);
    QCOMPARE(importer.workOrders(), QStringList{ QStringLiteral("77") });
}

void tst_ExcelImporter::missingColumnListsHeaders()
{
    QXlsx::Document doc;
    doc.write(1, 1, QStringLiteral("OS"));
    doc.write(1, 2, QStringLiteral("Descricao"));
    doc.write(2, 1, 1);
    const QString path = m_dir.filePath(QStringLiteral("nocol.xlsx"));
    QVERIFY(doc.saveAs(path));

    SheetConfig cfg;
    cfg.headerRow = 0;
    ExcelImporter importer;
    QString err;
    QVERIFY(!importer.loadXlsx(path, cfg, err));
    QVERIFY(err.contains(QStringLiteral("Descricao")));
}

void tst_ExcelImporter::missingSheetFails()
{
    const QString path = writeStandardSheet(QStringLiteral("sheets.xlsx"));
    SheetConfig cfg;
    cfg.sheetName = QStringLiteral("Nope");
    ExcelImporter importer;
    QString err;
    QVERIFY(!importer.loadXlsx(path, cfg, err));
    QVERIFY(err.contains(QStringLiteral("Nope")));
}

void tst_ExcelImporter::rejectsNonXlsx()
{
    const QString path = m_dir.filePath(QStringLiteral("plan.csv"));
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("OS;Mascara\n1;x\n");
    f.close();

    ExcelImporter importer;
    QString err;
    QVERIFY(!importer.loadXlsx(path, SheetConfig(), err));
    QVERIFY(err.contains(QStringLiteral(".xlsx")));
}

void tst_ExcelImporter::missingFileFails()
{
    ExcelImporter importer;
    QString err;
    QVERIFY(!importer.loadXlsx(m_dir.filePath(QStringLiteral("absent.xlsx")), SheetConfig(), err));
    QVERIFY(!err.isEmpty());
}

QTEST_GUILESS_MAIN(tst_ExcelImporter)
#include "tst_excelimporter.moc"
