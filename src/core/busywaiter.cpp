#include "busywaiter.h"

#include "../services/sapsession.h"

#include <QElapsedTimer>
#include <QThread>

bool waitUntilIdle(const SapSession& session, const WaitPolicy& policy, PushError& err)
{
    const int interval = policy.pollIntervalMs > 0 ? policy.pollIntervalMs : 1;

    QElapsedTimer timer;
    timer.start();
    for (;;)
    {
        bool busy = true;
        QString msg;
        if (!session.isBusy(busy, msg))
        {
            err.set(PushErrorKind::ResourceUnavailable,
                    msg.isEmpty() ? QStringLiteral("Session busy flag is unreadable.") : msg);
            return false;
        }
        if (!busy)
            return true;

        if (timer.elapsed() > policy.timeoutMs)
        {
            err.set(PushErrorKind::Timeout,
                    QStringLiteral("Session stayed busy for more than %1 ms.").arg(policy.timeoutMs));
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(interval));
    }
}
