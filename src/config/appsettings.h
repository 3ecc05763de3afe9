#pragma once
/**
 * @file appsettings.h
 * @brief Local configuration (QSettings/ini) for the long-text push.
 *
 * Everything the operator may need to adjust lives in ./config.ini next to
 * the executable:
 *   - sheet name / header row and the column header aliases
 *   - run parameters (visible rows, save at end, connection/session index)
 *   - busy-wait timing
 *   - transaction code, apply-document method and element addresses
 *   - last Excel path
 *
 * Missing keys fall back to the IW32 defaults below.
 */

#include <QString>
#include <QStringList>

#include "../core/busywaiter.h"
#include "../core/elementmap.h"

/**
 * @brief Which sheet and which columns hold the data.
 */
struct SheetConfig
{
    QString sheetName;                 ///< empty = first sheet
    int headerRow = 3;                 ///< 0-based row of the header line
    QStringList workOrderAliases = { QStringLiteral("OS") };
    QStringList longTextAliases  = { QStringLiteral("Máscara"), QStringLiteral("Mascara") };
};

/**
 * @brief Defaults for each push run.
 */
struct RunConfig
{
    int visibleRows = 15;
    bool saveAfter = true;
    int connectionIndex = 0;
    int sessionIndex = 0;
};

struct AutomationConfig
{
    QString transactionCode = QStringLiteral("/nIW32");
    QString applyDocumentMethod = QStringLiteral("setDocum");
    ElementMap elements = ElementMap::iw32Defaults();
};

struct SettingsData
{
    QString lastExcelPath;

    SheetConfig sheet;
    RunConfig run;
    WaitPolicy timing;
    AutomationConfig automation;
};

class AppSettings
{
public:
    // ---- config.ini next to the executable ----
    static SettingsData load();
    static void save(const SettingsData& data);
    static void saveLastExcelPath(const QString& path);

    // ---- explicit file ----
    static SettingsData loadFrom(const QString& iniPath);
    static void saveTo(const QString& iniPath, const SettingsData& data);

    static QString defaultIniPath();

    /**
     * @brief "OS|Ordem" -> {"OS", "Ordem"}; blanks dropped.
     */
    static QStringList splitAliases(const QString& text);
};
