#pragma once
/**
 * @file models.h
 * @brief Core data models shared across the app.
 */

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>

/**
 * @brief One data row of the imported sheet.
 */
struct SheetRow
{
    int excelRow = 0;        ///< 1-based Excel row index
    QString workOrder;       ///< coerced identifier (never empty for imported rows)
    QString longText;        ///< long-text payload, empty if the cell was empty
};

/**
 * @brief Parameters of a single push run.
 */
struct PushRequest
{
    QString workOrder;
    QStringList longTexts;    ///< one entry per operation row, in sheet order
    int visibleRows = 15;
    bool saveAfter = true;
    int connectionIndex = 0;
    int sessionIndex = 0;
};

/**
 * @brief Failure categories reported by the automation layer.
 */
enum class PushErrorKind
{
    None = 0,
    UnsupportedPlatform,
    Timeout,
    ResourceUnavailable,
    ElementNotFound,
    ElementCallFailed,
    InvalidArgument
};

struct PushError
{
    PushErrorKind kind = PushErrorKind::None;
    QString message;

    bool isSet() const { return kind != PushErrorKind::None; }

    void set(PushErrorKind k, const QString& msg)
    {
        kind = k;
        message = msg;
    }

    void clear()
    {
        kind = PushErrorKind::None;
        message.clear();
    }
};

inline QString pushErrorKindToString(PushErrorKind k)
{
    switch (k)
    {
    case PushErrorKind::None:                return QStringLiteral("None");
    case PushErrorKind::UnsupportedPlatform: return QStringLiteral("UnsupportedPlatform");
    case PushErrorKind::Timeout:             return QStringLiteral("Timeout");
    case PushErrorKind::ResourceUnavailable: return QStringLiteral("ResourceUnavailable");
    case PushErrorKind::ElementNotFound:     return QStringLiteral("ElementNotFound");
    case PushErrorKind::ElementCallFailed:   return QStringLiteral("ElementCallFailed");
    case PushErrorKind::InvalidArgument:     return QStringLiteral("InvalidArgument");
    }
    return QStringLiteral("?");
}

/**
 * @brief Coerce a spreadsheet cell into a canonical work-order string.
 *
 * Numbers arrive from Excel as doubles (6000794541.0), so floating values are
 * truncated to their integral part. Text is trimmed and a trailing ".0" is
 * dropped. Empty or invalid cells give an empty string.
 */
QString coerceWorkOrderId(const QVariant& cell);
