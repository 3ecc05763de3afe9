#include "models.h"

#include <QtGlobal>
#include <cmath>

QString coerceWorkOrderId(const QVariant& cell)
{
    if (!cell.isValid() || cell.isNull())
        return QString();

#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    const int typeId = cell.typeId();
#else
    const int typeId = static_cast<int>(cell.type());
#endif

    switch (typeId)
    {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
        return QString::number(cell.toLongLong());
    case QMetaType::Double:
    case QMetaType::Float:
    {
        const double v = cell.toDouble();
        if (std::isnan(v) || std::isinf(v))
            return QString();
        const double whole = std::trunc(v);
        // beyond qlonglong: format the double itself, no cast
        if (std::fabs(whole) >= 9.2e18)
            return QString::number(whole, 'f', 0);
        return QString::number(static_cast<qlonglong>(whole));
    }
    default:
        break;
    }

    QString s = cell.toString().trimmed();
    if (s.endsWith(QStringLiteral(".0")))
        s.chop(2);
    return s;
}
