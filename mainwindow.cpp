#include "mainwindow.h"

#include <QWidget>
#include <QLineEdit>
#include <QPushButton>
#include <QComboBox>
#include <QCheckBox>
#include <QLabel>
#include <QProgressBar>
#include <QPlainTextEdit>
#include <QGroupBox>
#include <QMessageBox>
#include <QFileDialog>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFileInfo>
#include <QDebug>
#include <QApplication>
#include <QStatusBar>
#include <QCloseEvent>
#include <memory>

#include "src/config/appsettings.h"
#include "src/core/excelimporter.h"
#include "src/core/workflowengine.h"
#include "src/services/sapconnector.h"
#include "src/services/clipboardservice.h"

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    m_engine   = new WorkflowEngine(this);
    m_importer = new ExcelImporter(this);

    m_settings = AppSettings::load();
    m_platformOk = SapConnector::platformSupported();

    buildUi();
    wireSignals();

    m_excelPath = m_settings.lastExcelPath;
    m_editExcelPath->setText(m_excelPath);

    m_uiState = UiRunState::NoData;
    applyUiState();
}

MainWindow::~MainWindow()
{
    AppSettings::save(m_settings);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_uiState == UiRunState::Running)
    {
        statusBar()->showMessage(tr("Run in progress; wait for it to finish before closing."));
        event->ignore();
        return;
    }
    QMainWindow::closeEvent(event);
}

void MainWindow::buildUi()
{
    setWindowTitle(tr("IW32 - Long text by work order (SAP GUI Scripting)"));

    auto* central = new QWidget(this);
    auto* root = new QVBoxLayout(central);

    // Source
    auto* grpSource = new QGroupBox(tr("1) Spreadsheet (.xlsx)"), central);
    auto* srcLayout = new QHBoxLayout(grpSource);
    m_editExcelPath = new QLineEdit(grpSource);
    m_btnPickExcel = new QPushButton(tr("Browse..."), grpSource);
    m_btnLoadExcel = new QPushButton(tr("Load"), grpSource);
    srcLayout->addWidget(m_editExcelPath, 1);
    srcLayout->addWidget(m_btnPickExcel);
    srcLayout->addWidget(m_btnLoadExcel);
    root->addWidget(grpSource);

    // Work order
    auto* grpOrder = new QGroupBox(tr("2) Work order"), central);
    auto* orderLayout = new QHBoxLayout(grpOrder);
    m_cmbWorkOrder = new QComboBox(grpOrder);
    m_cmbWorkOrder->setMinimumWidth(180);
    m_lblRowCount = new QLabel(grpOrder);
    orderLayout->addWidget(m_cmbWorkOrder);
    orderLayout->addWidget(m_lblRowCount, 1);
    root->addWidget(grpOrder);

    // Run
    auto* grpRun = new QGroupBox(tr("3) Send to SAP (IW32)"), central);
    auto* runLayout = new QVBoxLayout(grpRun);
    m_lblRunParams = new QLabel(grpRun);
    m_lblRunParams->setText(tr("Visible rows: %1 | Save at end: %2 | Connection: %3 | Session: %4 (config.ini)")
                                .arg(m_settings.run.visibleRows)
                                .arg(m_settings.run.saveAfter ? tr("yes") : tr("no"))
                                .arg(m_settings.run.connectionIndex)
                                .arg(m_settings.run.sessionIndex));
    m_lblPlatform = new QLabel(grpRun);
    m_lblPlatform->setWordWrap(true);
    if (!m_platformOk)
        m_lblPlatform->setText(tr("Sending to SAP only works on Windows (SAP GUI Scripting via COM)."));
    else
        m_lblPlatform->setText(tr("Do not touch SAP (mouse/keyboard) while the run is in progress."));
    m_chkAck = new QCheckBox(tr("SAP GUI is open and I am logged in. Run the automation."), grpRun);
    m_btnRun = new QPushButton(tr("Push long texts to SAP"), grpRun);
    m_progress = new QProgressBar(grpRun);
    m_progress->setRange(0, 100);
    m_progress->setValue(0);
    runLayout->addWidget(m_lblRunParams);
    runLayout->addWidget(m_lblPlatform);
    runLayout->addWidget(m_chkAck);
    runLayout->addWidget(m_btnRun);
    runLayout->addWidget(m_progress);
    root->addWidget(grpRun);

    // Log
    m_logView = new QPlainTextEdit(central);
    m_logView->setReadOnly(true);
    m_logView->setMaximumBlockCount(500);
    root->addWidget(m_logView, 1);

    setCentralWidget(central);
    resize(760, 560);
}

void MainWindow::wireSignals()
{
    connect(m_btnPickExcel, &QPushButton::clicked, this, &MainWindow::onPickExcel);
    connect(m_btnLoadExcel, &QPushButton::clicked, this, &MainWindow::onLoadExcel);
    connect(m_cmbWorkOrder, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onWorkOrderChanged);
    connect(m_chkAck, &QCheckBox::toggled, this, [this](bool) { applyUiState(); });
    connect(m_btnRun, &QPushButton::clicked, this, &MainWindow::onRun);

    connect(m_engine, &WorkflowEngine::progressUpdated, this, &MainWindow::onEngineProgress);
    connect(m_engine, &WorkflowEngine::logLine, this, &MainWindow::onEngineLogLine);
}

void MainWindow::applyUiState()
{
    const bool running = (m_uiState == UiRunState::Running);
    const bool hasData = (m_uiState != UiRunState::NoData);

    m_btnPickExcel->setEnabled(!running);
    m_btnLoadExcel->setEnabled(!running);
    m_editExcelPath->setEnabled(!running);
    m_cmbWorkOrder->setEnabled(hasData && !running);
    m_chkAck->setEnabled(m_platformOk && !running);
    m_btnRun->setEnabled(m_platformOk && hasData && !running && m_chkAck->isChecked());

    switch (m_uiState)
    {
    case UiRunState::NoData:  statusBar()->showMessage(tr("No spreadsheet loaded")); break;
    case UiRunState::Ready:   statusBar()->showMessage(tr("Ready")); break;
    case UiRunState::Running: statusBar()->showMessage(tr("Running...")); break;
    }
}

// ================= Source =================
void MainWindow::onPickExcel()
{
    const QString initDir = m_excelPath.isEmpty() ? QString() : QFileInfo(m_excelPath).absolutePath();
    const QString path = QFileDialog::getOpenFileName(this, tr("Select spreadsheet"), initDir, tr("Excel Files (*.xlsx)"));
    if (path.isEmpty()) return;
    m_excelPath = path;
    m_editExcelPath->setText(path);
    m_settings.lastExcelPath = path;
    AppSettings::saveLastExcelPath(path);
}

bool MainWindow::importExcel(const QString &path, QString &errMsg)
{
    if (!m_importer->loadXlsx(path, m_settings.sheet, errMsg))
        return false;
    return true;
}

void MainWindow::onLoadExcel()
{
    m_excelPath = m_editExcelPath->text().trimmed();
    if (m_excelPath.isEmpty())
    {
        QMessageBox::warning(this, tr("Notice"), tr("Select a .xlsx file first."));
        return;
    }

    QString err;
    if (!importExcel(m_excelPath, err))
    {
        m_cmbWorkOrder->clear();
        m_lblRowCount->clear();
        m_uiState = UiRunState::NoData;
        applyUiState();
        QMessageBox::warning(this, tr("Import failed"), err);
        return;
    }

    m_settings.lastExcelPath = m_excelPath;

    const QStringList orders = m_importer->workOrders();
    m_cmbWorkOrder->clear();
    m_cmbWorkOrder->addItems(orders);

    onEngineLogLine(tr("Loaded sheet \"%1\": %2 row(s), %3 work order(s).")
                        .arg(m_importer->sheetName())
                        .arg(m_importer->rows().size())
                        .arg(orders.size()));
    if (m_importer->skippedRows() > 0)
        onEngineLogLine(tr("%1 row(s) without work order were ignored.").arg(m_importer->skippedRows()));

    m_uiState = UiRunState::Ready;
    applyUiState();
}

void MainWindow::onWorkOrderChanged(int index)
{
    if (index < 0 || !m_importer)
    {
        m_lblRowCount->clear();
        return;
    }
    const int n = m_importer->longTextsFor(m_cmbWorkOrder->itemText(index)).size();
    m_lblRowCount->setText(tr("%1 operation row(s)").arg(n));
}

// ================= Run =================
void MainWindow::configureEngine()
{
    m_engine->setElementMap(m_settings.automation.elements);
    m_engine->setWaitPolicy(m_settings.timing);
    m_engine->setTransactionCode(m_settings.automation.transactionCode);
    m_engine->setApplyDocumentMethod(m_settings.automation.applyDocumentMethod);
}

PushRequest MainWindow::buildRequest() const
{
    PushRequest req;
    req.workOrder = m_cmbWorkOrder->currentText();
    req.longTexts = m_importer->longTextsFor(req.workOrder);
    req.visibleRows = m_settings.run.visibleRows;
    req.saveAfter = m_settings.run.saveAfter;
    req.connectionIndex = m_settings.run.connectionIndex;
    req.sessionIndex = m_settings.run.sessionIndex;
    return req;
}

void MainWindow::onRun()
{
    if (m_uiState != UiRunState::Ready)
        return;

    const PushRequest req = buildRequest();
    PushError err;
    if (!WorkflowEngine::validateRequest(req, err))
    {
        reportFailure(err);
        return;
    }

    std::unique_ptr<SapSession> session = SapConnector::open(req.connectionIndex, req.sessionIndex, err);
    if (!session)
    {
        reportFailure(err);
        return;
    }

    SystemClipboard clipboard;
    configureEngine();
    m_engine->setSession(session.get());
    m_engine->setClipboard(&clipboard);

    m_progress->setValue(0);
    m_uiState = UiRunState::Running;
    applyUiState();

    const bool ok = m_engine->run(req, err);

    m_engine->setSession(nullptr);
    m_engine->setClipboard(nullptr);
    m_uiState = UiRunState::Ready;
    applyUiState();

    if (!ok)
    {
        reportFailure(err);
        return;
    }
    onEngineLogLine(tr("Done: %1 long text(s) sent for order %2.").arg(req.longTexts.size()).arg(req.workOrder));
    QMessageBox::information(this, tr("Finished"), tr("Long texts sent successfully."));
}

void MainWindow::reportFailure(const PushError &err)
{
    onEngineLogLine(tr("Failed (%1): %2").arg(pushErrorKindToString(err.kind), err.message));
    QString text = tr("Run failed: %1").arg(err.message);
    if (err.kind != PushErrorKind::UnsupportedPlatform)
        text += QStringLiteral("\n\n")
              + tr("If SAP has more than one session open, adjust run/connectionIndex and run/sessionIndex in config.ini.");
    QMessageBox::critical(this, tr("Run failed"), text);
}

// ================= Engine callbacks =================
void MainWindow::onEngineProgress(double fraction)
{
    m_progress->setValue(qBound(0, qRound(fraction * 100.0), 100));
    // The run blocks the GUI thread; let the bar and the log repaint.
    QApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
}

void MainWindow::onEngineLogLine(const QString &line)
{
    m_logView->appendPlainText(line);
    qDebug() << line;
    if (m_uiState == UiRunState::Running)
        QApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
}
