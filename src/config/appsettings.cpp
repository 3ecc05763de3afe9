/**
 * @file appsettings.cpp
 * @brief AppSettings implementation: QSettings(ini) persistence.
 *
 * - Defaults target IW32 with a 15-row operations table
 * - Element addresses are written back in full so the ini documents them
 */

#include "appsettings.h"

#include <QSettings>
#include <QCoreApplication>
#include <QDir>

// ==============================
// Key definitions
// ==============================
namespace Keys
{
    // app
    static const char* kLastExcelPath   = "app/lastExcelPath";

    // sheet
    static const char* kSheetName       = "sheet/name";
    static const char* kSheetHeaderRow  = "sheet/headerRow";
    static const char* kColWorkOrder    = "columns/workOrder";
    static const char* kColLongText     = "columns/longText";

    // run
    static const char* kRunVisibleRows  = "run/visibleRows";
    static const char* kRunSaveAfter    = "run/saveAfter";
    static const char* kRunConnection   = "run/connectionIndex";
    static const char* kRunSession      = "run/sessionIndex";

    // timing
    static const char* kBusyTimeoutMs   = "timing/busyTimeoutMs";
    static const char* kPollIntervalMs  = "timing/pollIntervalMs";

    // automation
    static const char* kTransaction     = "automation/transaction";
    static const char* kApplyMethod     = "automation/applyDocumentMethod";

    // element addresses: elements/<key>
    static const char* kElementsGroup   = "elements";
}

// Header aliases are not ASCII ("Máscara"); Qt 6 reads ini files as UTF-8 already.
static void useUtf8(QSettings& s)
{
#if (QT_VERSION < QT_VERSION_CHECK(6, 0, 0))
    s.setIniCodec("UTF-8");
#else
    Q_UNUSED(s);
#endif
}

// An unquoted comma in a hand-edited ini value comes back as a string list.
static QString readText(const QVariant& v)
{
    if (v.userType() == QMetaType::QStringList)
        return v.toStringList().join(QChar(','));
    return v.toString();
}

static QString joinAliases(const QStringList& aliases)
{
    return aliases.join(QChar('|'));
}

QString AppSettings::defaultIniPath()
{
    const QString dir = QCoreApplication::applicationDirPath();
    return QDir(dir).filePath("config.ini");
}

QStringList AppSettings::splitAliases(const QString& text)
{
    QStringList out;
    const QStringList parts = text.split(QChar('|'));
    for (const QString& p : parts)
    {
        const QString t = p.trimmed();
        if (!t.isEmpty())
            out << t;
    }
    return out;
}

// ==============================
// Read
// ==============================
SettingsData AppSettings::load()
{
    return loadFrom(defaultIniPath());
}

SettingsData AppSettings::loadFrom(const QString& iniPath)
{
    QSettings s(iniPath, QSettings::IniFormat);
    useUtf8(s);
    SettingsData d;

    d.lastExcelPath = s.value(Keys::kLastExcelPath, "").toString();

    // sheet
    d.sheet.sheetName = s.value(Keys::kSheetName, "").toString().trimmed();
    d.sheet.headerRow = s.value(Keys::kSheetHeaderRow, d.sheet.headerRow).toInt();
    if (d.sheet.headerRow < 0)
        d.sheet.headerRow = 0;

    const QStringList woAliases = splitAliases(
        s.value(Keys::kColWorkOrder, joinAliases(d.sheet.workOrderAliases)).toString());
    if (!woAliases.isEmpty())
        d.sheet.workOrderAliases = woAliases;

    const QStringList ltAliases = splitAliases(
        s.value(Keys::kColLongText, joinAliases(d.sheet.longTextAliases)).toString());
    if (!ltAliases.isEmpty())
        d.sheet.longTextAliases = ltAliases;

    // run
    d.run.visibleRows     = s.value(Keys::kRunVisibleRows, d.run.visibleRows).toInt();
    d.run.saveAfter       = s.value(Keys::kRunSaveAfter, d.run.saveAfter).toBool();
    d.run.connectionIndex = s.value(Keys::kRunConnection, d.run.connectionIndex).toInt();
    d.run.sessionIndex    = s.value(Keys::kRunSession, d.run.sessionIndex).toInt();

    // timing
    d.timing.timeoutMs      = s.value(Keys::kBusyTimeoutMs, d.timing.timeoutMs).toInt();
    d.timing.pollIntervalMs = s.value(Keys::kPollIntervalMs, d.timing.pollIntervalMs).toInt();
    if (d.timing.pollIntervalMs <= 0)
        d.timing.pollIntervalMs = 100;
    if (d.timing.timeoutMs < 0)
        d.timing.timeoutMs = 60000;

    // automation
    const QString tx = s.value(Keys::kTransaction, d.automation.transactionCode).toString().trimmed();
    if (!tx.isEmpty())
        d.automation.transactionCode = tx;
    const QString method = s.value(Keys::kApplyMethod, d.automation.applyDocumentMethod).toString().trimmed();
    if (!method.isEmpty())
        d.automation.applyDocumentMethod = method;

    s.beginGroup(Keys::kElementsGroup);
    const QStringList overridden = s.childKeys();
    for (const QString& key : overridden)
    {
        const QString address = readText(s.value(key)).trimmed();
        if (!address.isEmpty())
            d.automation.elements.set(key, address);
    }
    s.endGroup();

    return d;
}

// ==============================
// Write (overwrite)
// ==============================
void AppSettings::save(const SettingsData& data)
{
    saveTo(defaultIniPath(), data);
}

void AppSettings::saveTo(const QString& iniPath, const SettingsData& data)
{
    QSettings s(iniPath, QSettings::IniFormat);
    useUtf8(s);

    s.setValue(Keys::kLastExcelPath, data.lastExcelPath);

    s.setValue(Keys::kSheetName, data.sheet.sheetName);
    s.setValue(Keys::kSheetHeaderRow, data.sheet.headerRow);
    s.setValue(Keys::kColWorkOrder, joinAliases(data.sheet.workOrderAliases));
    s.setValue(Keys::kColLongText, joinAliases(data.sheet.longTextAliases));

    s.setValue(Keys::kRunVisibleRows, data.run.visibleRows);
    s.setValue(Keys::kRunSaveAfter, data.run.saveAfter);
    s.setValue(Keys::kRunConnection, data.run.connectionIndex);
    s.setValue(Keys::kRunSession, data.run.sessionIndex);

    s.setValue(Keys::kBusyTimeoutMs, data.timing.timeoutMs);
    s.setValue(Keys::kPollIntervalMs, data.timing.pollIntervalMs);

    s.setValue(Keys::kTransaction, data.automation.transactionCode);
    s.setValue(Keys::kApplyMethod, data.automation.applyDocumentMethod);

    s.remove(Keys::kElementsGroup);
    s.beginGroup(Keys::kElementsGroup);
    const QStringList keys = data.automation.elements.keys();
    for (const QString& key : keys)
        s.setValue(key, data.automation.elements.addressTemplate(key));
    s.endGroup();

    s.sync();
}

void AppSettings::saveLastExcelPath(const QString& path)
{
    QSettings s(defaultIniPath(), QSettings::IniFormat);
    useUtf8(s);
    s.setValue(Keys::kLastExcelPath, path);
    s.sync();
}
