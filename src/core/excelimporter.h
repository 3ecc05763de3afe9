#pragma once
/**
 * @file excelimporter.h
 * @brief Excel (.xlsx) importer built on QXlsx. Reads one sheet into SheetRow items.
 *
 * Excel rules (summarised):
 * - Only .xlsx is accepted; the configured sheet is read, or the first one.
 * - The header line sits on SheetConfig::headerRow (0-based, counted from the
 *   top of the sheet). Everything below it is data.
 * - The work-order and long-text columns are found by header text; each has a
 *   list of aliases compared trimmed and case-insensitively.
 * - Work-order cells are coerced (6000794541.0 -> "6000794541"); rows whose
 *   work order ends up empty are dropped.
 * - Row order is kept: it is the on-screen order of the operations table.
 */

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "models.h"
#include "../config/appsettings.h"

class ExcelImporter : public QObject
{
    Q_OBJECT
public:
    explicit ExcelImporter(QObject* parent = nullptr);

    /**
     * @brief Read .xlsx and collect the rows that carry a work order.
     * @param path   .xlsx file path
     * @param sheet  sheet / header / column mapping
     * @param errMsg failure reason (for UI)
     * @return true on success
     */
    bool loadXlsx(const QString& path, const SheetConfig& sheet, QString& errMsg);

    /**
     * @brief Clear imported data.
     */
    void clear();

    const QVector<SheetRow>& rows() const { return m_rows; }

    /**
     * @brief Distinct work orders in order of first appearance.
     */
    QStringList workOrders() const;

    QVector<SheetRow> rowsForWorkOrder(const QString& workOrder) const;

    /**
     * @brief Long texts of one work order, in sheet order (the push payload).
     */
    QStringList longTextsFor(const QString& workOrder) const;

    QStringList sheetNames() const { return m_sheetNames; }
    QString sheetName() const { return m_sheetName; }

    /// 1-based Excel columns of the mapped headers
    int workOrderColumn() const { return m_workOrderColumn; }
    int longTextColumn() const { return m_longTextColumn; }

    /// Non-blank data rows dropped because the work order was empty
    int skippedRows() const { return m_skippedRows; }

    QString sourcePath() const { return m_sourcePath; }

private:
    QString m_sourcePath;
    QStringList m_sheetNames;
    QString m_sheetName;
    QVector<SheetRow> m_rows;
    int m_workOrderColumn = 0;
    int m_longTextColumn = 0;
    int m_skippedRows = 0;
};
