#include "clipboardservice.h"

#ifdef Q_OS_WIN
    #include <windows.h>
    #include <cstring>
#endif

QString normalizeLineEndings(const QString& text)
{
    QString out = text;
    out.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    out.replace(QChar('\r'), QChar('\n'));
    out.replace(QStringLiteral("\n"), QStringLiteral("\r\n"));
    return out;
}

#ifdef Q_OS_WIN
namespace
{
// Open/Close pair; CloseClipboard runs on every exit path.
class ClipboardLock
{
public:
    ClipboardLock() : m_open(OpenClipboard(nullptr) != FALSE) {}
    ~ClipboardLock()
    {
        if (m_open)
            CloseClipboard();
    }
    ClipboardLock(const ClipboardLock&) = delete;
    ClipboardLock& operator=(const ClipboardLock&) = delete;

    bool isOpen() const { return m_open; }

private:
    bool m_open = false;
};
}

bool SystemClipboard::setText(const QString& text, PushError& err)
{
    const QString payload = normalizeLineEndings(text);

    ClipboardLock lock;
    if (!lock.isOpen())
    {
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("Clipboard is in use by another program (error %1).").arg(GetLastError()));
        return false;
    }

    if (!EmptyClipboard())
    {
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("Failed to empty the clipboard (error %1).").arg(GetLastError()));
        return false;
    }

    const SIZE_T bytes = static_cast<SIZE_T>(payload.size() + 1) * sizeof(wchar_t);
    HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE, bytes);
    if (!mem)
    {
        err.set(PushErrorKind::ResourceUnavailable, QStringLiteral("Out of memory for clipboard text."));
        return false;
    }

    void* dst = GlobalLock(mem);
    if (!dst)
    {
        GlobalFree(mem);
        err.set(PushErrorKind::ResourceUnavailable, QStringLiteral("Failed to lock clipboard memory."));
        return false;
    }
    std::memcpy(dst, payload.utf16(), bytes - sizeof(wchar_t));
    static_cast<wchar_t*>(dst)[payload.size()] = L'\0';
    GlobalUnlock(mem);

    if (!SetClipboardData(CF_UNICODETEXT, mem))
    {
        GlobalFree(mem);
        err.set(PushErrorKind::ResourceUnavailable,
                QStringLiteral("Failed to set clipboard data (error %1).").arg(GetLastError()));
        return false;
    }
    // The system owns mem after SetClipboardData succeeds.
    return true;
}
#else
bool SystemClipboard::setText(const QString& text, PushError& err)
{
    Q_UNUSED(text);
    err.set(PushErrorKind::UnsupportedPlatform,
            QStringLiteral("Clipboard staging for the scripting host requires Windows."));
    return false;
}
#endif
