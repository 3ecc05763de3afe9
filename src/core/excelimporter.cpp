#include "excelimporter.h"

#include <QFileInfo>
#include <QSet>
#include <QVariant>

#include "xlsxdocument.h"
#include "xlsxcellrange.h"
#include "xlsxworksheet.h"

using QXlsx::CellRange;
using QXlsx::Document;
using QXlsx::Worksheet;

ExcelImporter::ExcelImporter(QObject *parent)
    : QObject(parent)
{
}

void ExcelImporter::clear()
{
    m_sourcePath.clear();
    m_sheetNames.clear();
    m_sheetName.clear();
    m_rows.clear();
    m_workOrderColumn = 0;
    m_longTextColumn = 0;
    m_skippedRows = 0;
}

QStringList ExcelImporter::workOrders() const
{
    QStringList out;
    QSet<QString> seen;
    for (const auto& r : m_rows)
    {
        if (seen.contains(r.workOrder))
            continue;
        seen.insert(r.workOrder);
        out << r.workOrder;
    }
    return out;
}

QVector<SheetRow> ExcelImporter::rowsForWorkOrder(const QString& workOrder) const
{
    QVector<SheetRow> out;
    for (const auto& r : m_rows)
    {
        if (r.workOrder == workOrder)
            out.push_back(r);
    }
    return out;
}

QStringList ExcelImporter::longTextsFor(const QString& workOrder) const
{
    QStringList out;
    for (const auto& r : m_rows)
    {
        if (r.workOrder == workOrder)
            out << r.longText;
    }
    return out;
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------
static QString cellText(const QVariant& v)
{
    if (!v.isValid() || v.isNull())
        return QString();
    return v.toString();
}

static bool isRowEmpty(Document& doc, int row, int firstCol, int lastCol)
{
    for (int c = firstCol; c <= lastCol; ++c)
    {
        if (!cellText(doc.read(row, c)).trimmed().isEmpty())
            return false;
    }
    return true;
}

static bool matchesAlias(const QString& header, const QStringList& aliases)
{
    const QString h = header.trimmed();
    if (h.isEmpty())
        return false;
    for (const auto& a : aliases)
    {
        if (h.compare(a.trimmed(), Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

static int findColumn(Document& doc, int headerRow, int firstCol, int lastCol, const QStringList& aliases)
{
    for (int c = firstCol; c <= lastCol; ++c)
    {
        if (matchesAlias(cellText(doc.read(headerRow, c)), aliases))
            return c;
    }
    return 0;
}

static QStringList headerTexts(Document& doc, int headerRow, int firstCol, int lastCol)
{
    QStringList out;
    for (int c = firstCol; c <= lastCol; ++c)
    {
        const QString t = cellText(doc.read(headerRow, c)).trimmed();
        if (!t.isEmpty())
            out << t;
    }
    return out;
}

// ----------------------------------------------------------------------------
// Main entry
// ----------------------------------------------------------------------------
bool ExcelImporter::loadXlsx(const QString &path, const SheetConfig &sheet, QString &errMsg)
{
    errMsg.clear();
    clear();

    QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile())
    {
        errMsg = QStringLiteral("File not found: %1").arg(path);
        return false;
    }
    if (fi.suffix().compare(QStringLiteral("xlsx"), Qt::CaseInsensitive) != 0)
    {
        errMsg = QStringLiteral("Only .xlsx is supported: %1").arg(path);
        return false;
    }

    Document doc(path);
    if (!doc.load())
    {
        errMsg = QStringLiteral("Failed to open Excel (maybe locked or corrupted): %1").arg(path);
        return false;
    }

    m_sheetNames = doc.sheetNames();
    if (m_sheetNames.isEmpty())
    {
        errMsg = QStringLiteral("Workbook has no sheets.");
        return false;
    }

    const QString wanted = sheet.sheetName.isEmpty() ? m_sheetNames.first() : sheet.sheetName;
    if (!m_sheetNames.contains(wanted) || !doc.selectSheet(wanted))
    {
        errMsg = QStringLiteral("Sheet \"%1\" not found (available: %2).")
                     .arg(wanted, m_sheetNames.join(QStringLiteral(", ")));
        return false;
    }
    m_sheetName = wanted;

    Worksheet* ws = doc.currentWorksheet();
    if (!ws)
    {
        errMsg = QStringLiteral("No worksheet available.");
        return false;
    }

    const CellRange range = doc.dimension();
    if (!range.isValid())
    {
        errMsg = QStringLiteral("Excel sheet is empty (invalid dimension).");
        return false;
    }

    const int lastRow  = range.lastRow();
    const int firstCol = range.firstColumn();
    const int lastCol  = range.lastColumn();

    const int headerRow = sheet.headerRow + 1; // Excel rows are 1-based
    if (headerRow > lastRow)
    {
        errMsg = QStringLiteral("Header row %1 is beyond the last used row (%2).").arg(headerRow).arg(lastRow);
        return false;
    }

    m_workOrderColumn = findColumn(doc, headerRow, firstCol, lastCol, sheet.workOrderAliases);
    if (m_workOrderColumn <= 0)
    {
        errMsg = QStringLiteral("Row %1: work-order column (%2) not found. Headers: %3")
                     .arg(headerRow)
                     .arg(sheet.workOrderAliases.join(QStringLiteral("/")),
                          headerTexts(doc, headerRow, firstCol, lastCol).join(QStringLiteral(", ")));
        return false;
    }

    m_longTextColumn = findColumn(doc, headerRow, firstCol, lastCol, sheet.longTextAliases);
    if (m_longTextColumn <= 0)
    {
        errMsg = QStringLiteral("Row %1: long-text column (%2) not found. Headers: %3")
                     .arg(headerRow)
                     .arg(sheet.longTextAliases.join(QStringLiteral("/")),
                          headerTexts(doc, headerRow, firstCol, lastCol).join(QStringLiteral(", ")));
        return false;
    }

    for (int r = headerRow + 1; r <= lastRow; ++r)
    {
        const QString workOrder = coerceWorkOrderId(doc.read(r, m_workOrderColumn));
        if (workOrder.isEmpty())
        {
            if (!isRowEmpty(doc, r, firstCol, lastCol))
                ++m_skippedRows;
            continue;
        }

        SheetRow row;
        row.excelRow = r;
        row.workOrder = workOrder;
        row.longText = cellText(doc.read(r, m_longTextColumn));
        m_rows.push_back(row);
    }

    if (m_rows.isEmpty())
    {
        errMsg = QStringLiteral("No valid work order found in sheet \"%1\".").arg(m_sheetName);
        return false;
    }

    m_sourcePath = path;
    return true;
}
