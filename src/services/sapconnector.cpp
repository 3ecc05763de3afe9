/**
 * @file sapconnector.cpp
 * @brief COM binding via ActiveQt. Runs on the GUI thread, which QApplication has OLE-initialized.
 */

#include "sapconnector.h"

#ifdef Q_OS_WIN
    #include <windows.h>
    #include <objbase.h>
    #include <QAxObject>
#endif

namespace
{
const char* const kUnsupportedPlatform = "SAP GUI scripting requires Windows (COM).";
}

namespace SapConnector
{
bool platformSupported()
{
#ifdef Q_OS_WIN
    return true;
#else
    return false;
#endif
}

bool checkPlatform(PushError& err)
{
    if (platformSupported())
        return true;
    err.set(PushErrorKind::UnsupportedPlatform, QString::fromLatin1(kUnsupportedPlatform));
    return false;
}
}

#ifdef Q_OS_WIN
namespace
{
QString formatComError(int code, const QString& source, const QString& desc)
{
    return QStringLiteral("%1 [%2, 0x%3]")
        .arg(desc.isEmpty() ? QStringLiteral("COM call failed") : desc.trimmed())
        .arg(source)
        .arg(static_cast<quint32>(code), 8, 16, QChar('0'));
}

void captureExceptions(QAxObject* obj, QString* sink)
{
    QObject::connect(obj, &QAxObject::exception, obj,
                     [sink](int code, const QString& source, const QString& desc, const QString&) {
                         *sink = formatComError(code, source, desc);
                     });
}

class AxSapElement : public SapElement
{
public:
    AxSapElement(QAxObject* obj, const QString& id)
        : m_obj(obj)
        , m_id(id)
    {
        captureExceptions(m_obj.get(), &m_lastError);
    }

    QString id() const override { return m_id; }

    bool setText(const QString& text, QString& errMsg) override
    {
        return writeProperty("text", text, errMsg);
    }

    bool setCaretPosition(int position, QString& errMsg) override
    {
        return writeProperty("caretPosition", position, errMsg);
    }

    bool press(QString& errMsg) override { return call("press()", QVariant(), errMsg); }
    bool select(QString& errMsg) override { return call("select()", QVariant(), errMsg); }
    bool maximize(QString& errMsg) override { return call("maximize()", QVariant(), errMsg); }
    bool sendVKey(int vkey, QString& errMsg) override { return call("sendVKey(int)", vkey, errMsg); }

    bool setVerticalScrollPosition(int position, QString& errMsg) override
    {
        m_lastError.clear();
        QString barError;
        std::unique_ptr<QAxObject> bar(m_obj->querySubObject("VerticalScrollbar"));
        if (!bar)
        {
            errMsg = QStringLiteral("%1 has no vertical scrollbar. %2").arg(m_id, m_lastError);
            return false;
        }
        captureExceptions(bar.get(), &barError);
        const bool ok = bar->setProperty("Position", position);
        if (!ok || !barError.isEmpty())
        {
            errMsg = QStringLiteral("%1: cannot scroll to %2. %3").arg(m_id).arg(position).arg(barError);
            return false;
        }
        return true;
    }

    bool callMethod(const QString& method, QString& errMsg) override
    {
        return call((method + QStringLiteral("()")).toLatin1().constData(), QVariant(), errMsg);
    }

private:
    bool writeProperty(const char* name, const QVariant& value, QString& errMsg)
    {
        m_lastError.clear();
        const bool ok = m_obj->setProperty(name, value);
        if (!ok || !m_lastError.isEmpty())
        {
            errMsg = QStringLiteral("%1.%2: %3").arg(m_id, QString::fromLatin1(name),
                                                   m_lastError.isEmpty() ? QStringLiteral("property not writable") : m_lastError);
            return false;
        }
        return true;
    }

    bool call(const char* signature, const QVariant& arg, QString& errMsg)
    {
        m_lastError.clear();
        if (arg.isValid())
            m_obj->dynamicCall(signature, arg);
        else
            m_obj->dynamicCall(signature);
        if (!m_lastError.isEmpty())
        {
            errMsg = QStringLiteral("%1 %2: %3").arg(m_id, QString::fromLatin1(signature), m_lastError);
            return false;
        }
        return true;
    }

    std::unique_ptr<QAxObject> m_obj;
    QString m_id;
    QString m_lastError;
};

class AxSapSession : public SapSession
{
public:
    AxSapSession(std::unique_ptr<QAxObject> root, QAxObject* session)
        : m_root(std::move(root))
        , m_session(session)
    {
        captureExceptions(m_session, &m_lastError);
    }

    bool isBusy(bool& busy, QString& errMsg) const override
    {
        m_lastError.clear();
        const QVariant v = m_session->property("Busy");
        if (!v.isValid() || !m_lastError.isEmpty())
        {
            busy = true;
            errMsg = QStringLiteral("Cannot read session busy flag. %1").arg(m_lastError);
            return false;
        }
        busy = v.toBool();
        return true;
    }

    std::unique_ptr<SapElement> findById(const QString& id, QString& errMsg) override
    {
        m_lastError.clear();
        QAxObject* obj = m_session->querySubObject("findById(QString)", id);
        if (!obj)
        {
            errMsg = QStringLiteral("Element not found: %1. %2").arg(id, m_lastError);
            return nullptr;
        }
        return std::unique_ptr<SapElement>(new AxSapElement(obj, id));
    }

private:
    std::unique_ptr<QAxObject> m_root; // owns engine/connection/session as QObject children
    QAxObject* m_session = nullptr;
    mutable QString m_lastError; // set by the exception signal
};

IDispatch* bindRunningObject(const wchar_t* displayName, HRESULT& hr)
{
    IBindCtx* ctx = nullptr;
    hr = CreateBindCtx(0, &ctx);
    if (FAILED(hr))
        return nullptr;

    ULONG eaten = 0;
    IMoniker* moniker = nullptr;
    hr = MkParseDisplayName(ctx, displayName, &eaten, &moniker);
    if (FAILED(hr))
    {
        ctx->Release();
        return nullptr;
    }

    IDispatch* disp = nullptr;
    hr = moniker->BindToObject(ctx, nullptr, IID_IDispatch, reinterpret_cast<void**>(&disp));
    moniker->Release();
    ctx->Release();
    return SUCCEEDED(hr) ? disp : nullptr;
}

QAxObject* childAt(QAxObject* parent, int index, const QString& what, PushError& err)
{
    QAxObject* children = parent->querySubObject("Children");
    if (!children)
    {
        err.set(PushErrorKind::ResourceUnavailable, QStringLiteral("Cannot enumerate %1s.").arg(what));
        return nullptr;
    }

    const int count = children->property("Count").toInt();
    if (index < 0 || index >= count)
    {
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("%1 index %2 is out of range (%3 open).").arg(what).arg(index).arg(count));
        return nullptr;
    }

    QAxObject* child = children->querySubObject("ElementAt(int)", index);
    if (!child)
    {
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("Cannot open %1 %2.").arg(what).arg(index));
        return nullptr;
    }
    return child;
}
}

namespace SapConnector
{
std::unique_ptr<SapSession> open(int connectionIndex, int sessionIndex, PushError& err)
{
    if (!checkPlatform(err))
        return nullptr;

    HRESULT hr = S_OK;
    IDispatch* disp = bindRunningObject(L"SAPGUI", hr);
    if (!disp)
    {
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("SAP GUI is not running or scripting is disabled (0x%1).")
                    .arg(static_cast<quint32>(hr), 8, 16, QChar('0')));
        return nullptr;
    }

    std::unique_ptr<QAxObject> root(new QAxObject(disp));
    disp->Release(); // QAxObject holds its own reference

    QAxObject* engine = root->querySubObject("GetScriptingEngine()");
    if (!engine)
    {
        err.set(PushErrorKind::ResourceUnavailable, QStringLiteral("Scripting engine is not available."));
        return nullptr;
    }

    QAxObject* connection = childAt(engine, connectionIndex, QStringLiteral("Connection"), err);
    if (!connection)
        return nullptr;

    QAxObject* session = childAt(connection, sessionIndex, QStringLiteral("Session"), err);
    if (!session)
        return nullptr;

    return std::unique_ptr<SapSession>(new AxSapSession(std::move(root), session));
}
}
#else
namespace SapConnector
{
std::unique_ptr<SapSession> open(int connectionIndex, int sessionIndex, PushError& err)
{
    Q_UNUSED(connectionIndex);
    Q_UNUSED(sessionIndex);
    err.set(PushErrorKind::UnsupportedPlatform, QString::fromLatin1(kUnsupportedPlatform));
    return nullptr;
}
}
#endif
