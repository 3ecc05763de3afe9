#pragma once
/**
 * @file busywaiter.h
 * @brief Blocking poll on the session busy flag.
 *
 * Wait rules:
 * - Called after every call that changes the SAP screen (Enter, select,
 *   press, apply document); the client updates asynchronously.
 * - The flag is sampled every pollIntervalMs on the calling thread.
 * - Still busy after timeoutMs -> Timeout.
 * - Flag cannot be read (session dropped, COM error) -> ResourceUnavailable.
 *   An unreadable flag never counts as idle.
 *
 * 💡 Defaults (60 s / 100 ms) come from config.ini [timing].
 */

#include "models.h"

class SapSession;

struct WaitPolicy
{
    int timeoutMs = 60000;
    int pollIntervalMs = 100;
};

/**
 * @brief Sleep in pollIntervalMs steps until @p session is no longer busy.
 * @return false with Timeout once timeoutMs has elapsed, or ResourceUnavailable
 *         when the flag cannot be read
 */
bool waitUntilIdle(const SapSession& session, const WaitPolicy& policy, PushError& err);
