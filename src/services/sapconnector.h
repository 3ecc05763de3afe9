#pragma once
/**
 * @file sapconnector.h
 * @brief Attach to a running SAP GUI through the Running Object Table ("SAPGUI" moniker).
 *
 * Windows only: the scripting engine is a COM object exposed by saplogon.exe.
 * GUI scripting must be enabled on both client and server side.
 */

#include <memory>

#include "sapsession.h"
#include "../core/models.h"

namespace SapConnector
{
    /**
     * @brief Whether this build can drive the scripting host at all.
     */
    bool platformSupported();

    /**
     * @brief Fail fast with UnsupportedPlatform on anything but Windows.
     */
    bool checkPlatform(PushError& err);

    /**
     * @brief GetObject("SAPGUI").GetScriptingEngine.Children(conn).Children(sess)
     * @return nullptr with UnsupportedPlatform or ResourceUnavailable on failure
     */
    std::unique_ptr<SapSession> open(int connectionIndex, int sessionIndex, PushError& err);
}
