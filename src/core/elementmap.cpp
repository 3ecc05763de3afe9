#include "elementmap.h"

#include <algorithm>

namespace
{
const QString kRowPlaceholder = QStringLiteral("{row}");

const QString kOperationsBase = QStringLiteral(
    "wnd[0]/usr/subSUB_ALL:SAPLCOIH:3001/ssubSUB_LEVEL:SAPLCOIH:1107/tabsTS_1100/tabpVGUE");
}

ElementMap ElementMap::iw32Defaults()
{
    const QString table = kOperationsBase
        + QStringLiteral("/ssubSUB_AUFTRAG:SAPLCOVG:3010/tblSAPLCOVGTCTRL_3010");

    ElementMap m;
    m.set(ElementKey::kMainWindow,      QStringLiteral("wnd[0]"));
    m.set(ElementKey::kCommandField,    QStringLiteral("wnd[0]/tbar[0]/okcd"));
    m.set(ElementKey::kOrderField,      QStringLiteral("wnd[0]/usr/ctxtCAUFVD-AUFNR"));
    m.set(ElementKey::kOperationsTab,   kOperationsBase);
    m.set(ElementKey::kOperationsTable, table);
    m.set(ElementKey::kLongTextButton,  table + QStringLiteral("/btnLTICON-LTOPR[8,{row}]"));
    m.set(ElementKey::kLongTextEditor,  QStringLiteral("wnd[0]/usr/cntlSCMSW_CONTAINER_2102/shellcont/shell"));
    m.set(ElementKey::kBackButton,      QStringLiteral("wnd[0]/tbar[0]/btn[3]"));
    m.set(ElementKey::kSaveButton,      QStringLiteral("wnd[0]/tbar[0]/btn[11]"));
    return m;
}

void ElementMap::set(const QString& key, const QString& addressTemplate)
{
    m_templates.insert(key, addressTemplate.trimmed());
}

QStringList ElementMap::keys() const
{
    QStringList out = m_templates.keys();
    std::sort(out.begin(), out.end());
    return out;
}

bool ElementMap::resolve(const QString& key, QString& address, PushError& err, int row) const
{
    address.clear();

    const auto it = m_templates.constFind(key);
    if (it == m_templates.constEnd() || it.value().isEmpty())
    {
        err.set(PushErrorKind::InvalidArgument,
                QStringLiteral("No element address configured for \"%1\".").arg(key));
        return false;
    }

    QString out = it.value();
    if (out.contains(kRowPlaceholder))
    {
        if (row < 0)
        {
            err.set(PushErrorKind::InvalidArgument,
                    QStringLiteral("Element \"%1\" needs a row position.").arg(key));
            return false;
        }
        out.replace(kRowPlaceholder, QString::number(row));
    }

    address = out;
    return true;
}
