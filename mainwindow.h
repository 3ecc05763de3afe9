#pragma once
/**
 * @brief Main window: pick the .xlsx, choose a work order, push its long texts to IW32.
 *
 * Run parameters, column mapping and element addresses come from config.ini
 * (AppSettings); the window only shows what a run needs.
 */

#include <QMainWindow>
#include <QPointer>

#include "src/config/appsettings.h"
#include "src/core/models.h"

class QLineEdit;
class QPushButton;
class QComboBox;
class QCheckBox;
class QLabel;
class QProgressBar;
class QPlainTextEdit;
class QCloseEvent;

class WorkflowEngine;
class ExcelImporter;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    // Ignored while a run is in progress.
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onPickExcel();
    void onLoadExcel();
    void onWorkOrderChanged(int index);
    void onRun();

    // Engine callbacks
    void onEngineProgress(double fraction);
    void onEngineLogLine(const QString& line);

private:
    void buildUi();
    void wireSignals();
    void applyUiState();

    bool importExcel(const QString& path, QString& err);
    void configureEngine();
    PushRequest buildRequest() const;
    void reportFailure(const PushError& err);

private:
    friend class tst_MainWindow;

    enum class UiRunState { NoData, Ready, Running };
    UiRunState m_uiState = UiRunState::NoData;

    SettingsData m_settings;
    QString m_excelPath;
    bool m_platformOk = false;

    QPointer<WorkflowEngine> m_engine;
    QPointer<ExcelImporter>  m_importer;

    QLineEdit* m_editExcelPath = nullptr;
    QPushButton* m_btnPickExcel = nullptr;
    QPushButton* m_btnLoadExcel = nullptr;
    QComboBox* m_cmbWorkOrder = nullptr;
    QLabel* m_lblRowCount = nullptr;
    QLabel* m_lblRunParams = nullptr;
    QLabel* m_lblPlatform = nullptr;
    QCheckBox* m_chkAck = nullptr;
    QPushButton* m_btnRun = nullptr;
    QProgressBar* m_progress = nullptr;
    QPlainTextEdit* m_logView = nullptr;
};
