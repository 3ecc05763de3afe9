#pragma once
/**
 * @file workflowengine.h
 * @brief Drives IW32 row by row: open order, Operations tab, then per row
 *        scroll / long-text button / paste + apply / back, optional save.
 *
 * Runs synchronously on the calling thread. Every state-changing call is
 * followed by a busy-wait on the session. The first failure aborts the run;
 * rows already pushed stay applied in the order.
 */

#include <QObject>
#include <QFile>
#include <QTextStream>
#include <QElapsedTimer>
#include <memory>

#include "models.h"
#include "busywaiter.h"
#include "elementmap.h"

class SapSession;
class SapElement;
class TextClipboard;

class WorkflowEngine : public QObject
{
    Q_OBJECT
public:
    explicit WorkflowEngine(QObject* parent = nullptr);

    void setSession(SapSession* s) { m_session = s; }
    void setClipboard(TextClipboard* c) { m_clipboard = c; }

    void setElementMap(const ElementMap& map) { m_elements = map; }
    void setWaitPolicy(const WaitPolicy& policy) { m_wait = policy; }
    void setTransactionCode(const QString& code) { m_transaction = code; }
    void setApplyDocumentMethod(const QString& method) { m_applyMethod = method; }

    /**
     * @brief Directory for per-run log files. Empty means <app dir>/logs.
     */
    void setLogDirectory(const QString& dir) { m_logDir = dir; }
    QString lastLogFilePath() const { return m_logFile.fileName(); }

    /**
     * @brief Range checks on the run parameters (no cross-field checks).
     */
    static bool validateRequest(const PushRequest& req, PushError& err);

    /**
     * @brief Push every long text of @p req into the order.
     * @return false with @p err describing the first failure
     */
    bool run(const PushRequest& req, PushError& err);

    int scrollPosition() const { return m_scrollPosition; }

signals:
    void progressUpdated(double fraction);
    void rowApplied(int row, int scrollPosition, int relativeRow);
    void logLine(const QString& line);

private:
    bool openWorkOrder(const QString& workOrder, PushError& err);
    bool selectOperationsTab(PushError& err);
    bool pushRow(int row, const QString& text, int visibleRows, PushError& err);
    bool saveOrder(PushError& err);

    std::unique_ptr<SapElement> find(const QString& key, PushError& err, int row = -1);
    bool check(bool ok, const QString& errMsg, PushError& err);
    bool waitIdle(PushError& err);

    void say(const QString& message);
    void trace(const QString& step, int row, const QString& detail);
    void startNewRunLog();
    void closeRunLog();
    void writeLogLine(const QString& line);

private:
    SapSession* m_session = nullptr;
    TextClipboard* m_clipboard = nullptr;

    ElementMap m_elements = ElementMap::iw32Defaults();
    WaitPolicy m_wait;
    QString m_transaction = QStringLiteral("/nIW32");
    QString m_applyMethod = QStringLiteral("setDocum");

    int m_scrollPosition = 0;

    QString m_logDir;
    QFile m_logFile;
    QTextStream m_logStream;
    bool m_logReady = false;
    QElapsedTimer m_runTimer;
};
