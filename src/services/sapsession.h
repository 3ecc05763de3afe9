#pragma once
/**
 * @file sapsession.h
 * @brief Minimal view of a GUI scripting session: element lookup, busy flag, element calls.
 *
 * The workflow only talks to these interfaces. SapConnector provides the COM
 * backed implementation on Windows; tests drive the workflow with fakes.
 *
 * Every call returns false and fills errMsg when the scripting host raised.
 */

#include <QString>
#include <memory>

class SapElement
{
public:
    virtual ~SapElement() = default;

    virtual QString id() const = 0;

    virtual bool setText(const QString& text, QString& errMsg) = 0;
    virtual bool setCaretPosition(int position, QString& errMsg) = 0;
    virtual bool press(QString& errMsg) = 0;
    virtual bool select(QString& errMsg) = 0;
    virtual bool maximize(QString& errMsg) = 0;
    virtual bool sendVKey(int vkey, QString& errMsg) = 0;

    /// Table controls only: VerticalScrollbar.Position
    virtual bool setVerticalScrollPosition(int position, QString& errMsg) = 0;

    /// Invoke a parameterless method by name (e.g. the editor's apply-document call)
    virtual bool callMethod(const QString& method, QString& errMsg) = 0;
};

class SapSession
{
public:
    virtual ~SapSession() = default;

    /**
     * @brief Read the session busy flag.
     * @param busy true while the client is still processing the last command
     * @return false with errMsg set when the flag could not be read
     */
    virtual bool isBusy(bool& busy, QString& errMsg) const = 0;

    /**
     * @brief Resolve a scripting id.
     * @return nullptr with errMsg set when the id does not resolve
     */
    virtual std::unique_ptr<SapElement> findById(const QString& id, QString& errMsg) = 0;
};
