#pragma once
/**
 * @file clipboardservice.h
 * @brief Stage long text on the system clipboard for the scripting host to pick up.
 *
 * The long-text editor reads the clipboard when its apply-document method is
 * invoked, so the text must be on the clipboard with CRLF line breaks before
 * that call.
 */

#include <QString>

#include "../core/models.h"

class TextClipboard
{
public:
    virtual ~TextClipboard() = default;

    /**
     * @brief Replace the clipboard contents with @p text.
     * @return false with ResourceUnavailable when the clipboard is held elsewhere
     */
    virtual bool setText(const QString& text, PushError& err) = 0;
};

/**
 * @brief Win32 clipboard (CF_UNICODETEXT). Other platforms fail with UnsupportedPlatform.
 */
class SystemClipboard : public TextClipboard
{
public:
    bool setText(const QString& text, PushError& err) override;
};

/**
 * @brief Convert every line break (CRLF, CR, LF) to CRLF.
 */
QString normalizeLineEndings(const QString& text);
