#pragma once
/**
 * @file elementmap.h
 * @brief Logical action name -> scripting element address (IW32 screen layout).
 *
 * Addresses are plain scripting ids ("wnd[0]/tbar[0]/okcd"). The long-text
 * button template carries a "{row}" placeholder that is replaced with the
 * row position relative to the table viewport.
 *
 * Keys are the ones in ElementKey; any of them can be overridden from the
 * [elements] group of config.ini when the client layout differs.
 */

#include <QHash>
#include <QString>
#include <QStringList>

#include "models.h"

namespace ElementKey
{
    static const char* const kMainWindow     = "mainWindow";
    static const char* const kCommandField   = "commandField";
    static const char* const kOrderField     = "orderField";
    static const char* const kOperationsTab  = "operationsTab";
    static const char* const kOperationsTable= "operationsTable";
    static const char* const kLongTextButton = "longTextButton";
    static const char* const kLongTextEditor = "longTextEditor";
    static const char* const kBackButton     = "backButton";
    static const char* const kSaveButton     = "saveButton";
}

class ElementMap
{
public:
    /**
     * @brief Built-in addresses for the IW32 "Operations" tab.
     */
    static ElementMap iw32Defaults();

    void set(const QString& key, const QString& addressTemplate);
    bool contains(const QString& key) const { return m_templates.contains(key); }
    QString addressTemplate(const QString& key) const { return m_templates.value(key); }
    QStringList keys() const;

    /**
     * @brief Substitute the template for @p key.
     * @param row relative table row for templates with "{row}"; ignored otherwise
     * @return false (InvalidArgument) for an unknown key or a missing row
     */
    bool resolve(const QString& key, QString& address, PushError& err, int row = -1) const;

private:
    QHash<QString, QString> m_templates;
};
