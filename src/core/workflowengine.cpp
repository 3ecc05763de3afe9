#include "workflowengine.h"

#include "viewport.h"
#include "../services/sapsession.h"
#include "../services/clipboardservice.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>

#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    #include <QStringConverter>
#endif

namespace
{
const int kVKeyEnter = 0;
const int kMaxVisibleRows = 100;
const int kMaxIndex = 9;
}

WorkflowEngine::WorkflowEngine(QObject* parent)
    : QObject(parent)
{
}

bool WorkflowEngine::validateRequest(const PushRequest& req, PushError& err)
{
    if (req.workOrder.trimmed().isEmpty())
    {
        err.set(PushErrorKind::InvalidArgument, QStringLiteral("Work order is empty."));
        return false;
    }
    if (req.visibleRows < 1 || req.visibleRows > kMaxVisibleRows)
    {
        err.set(PushErrorKind::InvalidArgument,
                QStringLiteral("Visible rows must be between 1 and %1 (got %2).").arg(kMaxVisibleRows).arg(req.visibleRows));
        return false;
    }
    if (req.connectionIndex < 0 || req.connectionIndex > kMaxIndex)
    {
        err.set(PushErrorKind::InvalidArgument,
                QStringLiteral("Connection index must be between 0 and %1 (got %2).").arg(kMaxIndex).arg(req.connectionIndex));
        return false;
    }
    if (req.sessionIndex < 0 || req.sessionIndex > kMaxIndex)
    {
        err.set(PushErrorKind::InvalidArgument,
                QStringLiteral("Session index must be between 0 and %1 (got %2).").arg(kMaxIndex).arg(req.sessionIndex));
        return false;
    }
    return true;
}

bool WorkflowEngine::run(const PushRequest& req, PushError& err)
{
    err.clear();
    if (!validateRequest(req, err))
        return false;
    if (!m_session || !m_clipboard)
    {
        err.set(PushErrorKind::ResourceUnavailable, QStringLiteral("No scripting session attached."));
        return false;
    }

    startNewRunLog();
    m_scrollPosition = 0;

    const int total = req.longTexts.size();
    trace(QStringLiteral("START"), -1,
          QStringLiteral("order=%1 rows=%2 visible=%3 save=%4 conn=%5 sess=%6")
              .arg(req.workOrder)
              .arg(total)
              .arg(req.visibleRows)
              .arg(req.saveAfter ? 1 : 0)
              .arg(req.connectionIndex)
              .arg(req.sessionIndex));

    auto abort = [&]() {
        trace(QStringLiteral("ERROR"), -1,
              QStringLiteral("%1: %2").arg(pushErrorKindToString(err.kind), err.message));
        closeRunLog();
        return false;
    };

    say(QStringLiteral("Opening transaction %1 and loading order %2...").arg(m_transaction, req.workOrder));

    if (!openWorkOrder(req.workOrder, err))
        return abort();
    if (!selectOperationsTab(err))
        return abort();

    for (int i = 0; i < total; ++i)
    {
        if (!pushRow(i, req.longTexts[i], req.visibleRows, err))
            return abort();

        emit progressUpdated(static_cast<double>(i + 1) / total);
        say(QStringLiteral("Row %1/%2: long text applied.").arg(i + 1).arg(total));
    }

    if (req.saveAfter)
    {
        say(QStringLiteral("Saving order %1...").arg(req.workOrder));
        if (!saveOrder(err))
            return abort();
    }

    emit progressUpdated(1.0);
    trace(QStringLiteral("DONE"), -1, QStringLiteral("%1 row(s)").arg(total));
    closeRunLog();
    return true;
}

bool WorkflowEngine::openWorkOrder(const QString& workOrder, PushError& err)
{
    QString msg;

    auto wnd = find(ElementKey::kMainWindow, err);
    if (!wnd || !check(wnd->maximize(msg), msg, err))
        return false;

    auto okcd = find(ElementKey::kCommandField, err);
    if (!okcd || !check(okcd->setText(m_transaction, msg), msg, err))
        return false;
    if (!check(wnd->sendVKey(kVKeyEnter, msg), msg, err) || !waitIdle(err))
        return false;
    trace(QStringLiteral("NAVIGATE"), -1, m_transaction);

    auto orderField = find(ElementKey::kOrderField, err);
    if (!orderField)
        return false;
    if (!check(orderField->setText(workOrder, msg), msg, err)
        || !check(orderField->setCaretPosition(workOrder.size(), msg), msg, err))
        return false;
    if (!check(wnd->sendVKey(kVKeyEnter, msg), msg, err) || !waitIdle(err))
        return false;
    trace(QStringLiteral("ORDER"), -1, workOrder);
    return true;
}

bool WorkflowEngine::selectOperationsTab(PushError& err)
{
    QString msg;
    auto tab = find(ElementKey::kOperationsTab, err);
    if (!tab || !check(tab->select(msg), msg, err) || !waitIdle(err))
        return false;
    trace(QStringLiteral("TAB"), -1, tab->id());
    return true;
}

bool WorkflowEngine::pushRow(int row, const QString& text, int visibleRows, PushError& err)
{
    QString msg;

    const RowVisibility vis = computeRowVisibility(row, visibleRows);
    auto table = find(ElementKey::kOperationsTable, err);
    if (!table || !check(table->setVerticalScrollPosition(vis.scrollPosition, msg), msg, err))
        return false;
    m_scrollPosition = vis.scrollPosition;
    trace(QStringLiteral("SCROLL"), row,
          QStringLiteral("position=%1 relative=%2").arg(vis.scrollPosition).arg(vis.relativeRow));
    emit rowApplied(row, vis.scrollPosition, vis.relativeRow);

    auto button = find(ElementKey::kLongTextButton, err, vis.relativeRow);
    if (!button || !check(button->press(msg), msg, err) || !waitIdle(err))
        return false;

    if (!m_clipboard->setText(text, err))
        return false;
    auto editor = find(ElementKey::kLongTextEditor, err);
    if (!editor || !check(editor->callMethod(m_applyMethod, msg), msg, err) || !waitIdle(err))
        return false;
    trace(QStringLiteral("PASTE"), row, QStringLiteral("%1 chars").arg(text.size()));

    auto back = find(ElementKey::kBackButton, err);
    if (!back || !check(back->press(msg), msg, err) || !waitIdle(err))
        return false;
    return true;
}

bool WorkflowEngine::saveOrder(PushError& err)
{
    QString msg;
    auto save = find(ElementKey::kSaveButton, err);
    if (!save || !check(save->press(msg), msg, err) || !waitIdle(err))
        return false;
    trace(QStringLiteral("SAVE"), -1, save->id());
    return true;
}

std::unique_ptr<SapElement> WorkflowEngine::find(const QString& key, PushError& err, int row)
{
    QString address;
    if (!m_elements.resolve(key, address, err, row))
        return nullptr;

    QString msg;
    std::unique_ptr<SapElement> e = m_session->findById(address, msg);
    if (!e)
    {
        err.set(PushErrorKind::ElementNotFound,
                msg.isEmpty() ? QStringLiteral("Element not found: %1").arg(address) : msg);
        return nullptr;
    }
    return e;
}

bool WorkflowEngine::check(bool ok, const QString& errMsg, PushError& err)
{
    if (!ok)
        err.set(PushErrorKind::ElementCallFailed, errMsg);
    return ok;
}

bool WorkflowEngine::waitIdle(PushError& err)
{
    return waitUntilIdle(*m_session, m_wait, err);
}

void WorkflowEngine::say(const QString& message)
{
    emit logLine(message);
    trace(QStringLiteral("INFO"), -1, message);
}

void WorkflowEngine::trace(const QString& step, int row, const QString& detail)
{
    const qint64 ms = m_runTimer.isValid() ? m_runTimer.elapsed() : -1;
    writeLogLine(QStringLiteral("[%1] [%2] [%3] [%4]")
                     .arg(QString::number(ms), step, QString::number(row), detail));
}

void WorkflowEngine::startNewRunLog()
{
    closeRunLog();
    m_runTimer.start();

    const QString baseDir = m_logDir.isEmpty()
        ? QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("logs"))
        : m_logDir;
    QDir d(baseDir);
    if (!d.exists())
        d.mkpath(QStringLiteral("."));

    const QString ts = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss_zzz");
    const QString filePath = d.filePath(QStringLiteral("%1.log").arg(ts));

    m_logFile.setFileName(filePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Text))
    {
        m_logReady = false;
        emit logLine(QStringLiteral("Could not create log file: %1").arg(filePath));
        return;
    }

    m_logStream.setDevice(&m_logFile);
#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    m_logStream.setEncoding(QStringConverter::Utf8);
#else
    m_logStream.setCodec("UTF-8");
#endif

    m_logReady = true;
}

void WorkflowEngine::closeRunLog()
{
    if (m_logFile.isOpen())
    {
        m_logStream.flush();
        m_logFile.close();
    }
    m_logReady = false;
}

void WorkflowEngine::writeLogLine(const QString& line)
{
    if (m_logReady && m_logFile.isOpen())
    {
        m_logStream << line << "\n";
        m_logStream.flush();
    }
}
