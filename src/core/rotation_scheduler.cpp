/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "rotation_scheduler.h"
#include "logging_categories.h"
#include "secret_store.h"
#include "session_context.h"
#include "token_window.h"
#include "utils/secure_logging.h"

#include <QTimer>
#include <KLocalizedString>

namespace PassKey {
namespace Core {
using Shared::ErrorCode;

RotationScheduler::RotationScheduler(const SecretStore &secret,
                                     std::chrono::seconds interval,
                                     TokenWindow &window,
                                     SessionContext *context,
                                     Clock clock,
                                     QObject *parent)
    : QObject(parent)
    , m_secret(secret)
    , m_interval(interval)
    , m_window(window)
    , m_clock(std::move(clock))
    , m_context(context)
{
    Q_ASSERT(m_interval.count() > 0);
    Q_ASSERT(m_context);

    if (!m_clock) {
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
    }

    m_thread.setObjectName(QStringLiteral("passkey-rotation"));

    // Direct: cancel() may come from any thread and must not wait for our loop
    connect(m_context, &SessionContext::cancelled,
            this, &RotationScheduler::onCancelled, Qt::DirectConnection);
}

RotationScheduler::~RotationScheduler()
{
    m_running = false;
    if (m_thread.isRunning()) {
        m_thread.quit();
        m_thread.wait();
    }
    qCDebug(RotationLog) << "Scheduler destroyed";
}

Result<void> RotationScheduler::start()
{
    if (m_started) {
        return Result<void>::error(ErrorCode::AlreadyRunning,
                                   i18n("Rotation scheduler was already started"));
    }

    if (m_context->isCancelled()) {
        return Result<void>::error(ErrorCode::Cancelled,
                                   i18n("Session was cancelled before rotation started"));
    }

    m_started = true;

    const QDateTime now = m_clock();
    const QByteArray &key = m_secret.key();

    // previous has no valid predecessor at cold start
    m_window.store(Slot::Previous, 0);
    m_window.store(Slot::Current, TokenRotator::derive(key, m_interval, Slot::Current, now));
    m_window.store(Slot::Next, TokenRotator::derive(key, m_interval, Slot::Next, now));

    qCDebug(RotationLog) << "Window initialized, current" << SecureLogging::maskCode(m_window.current())
                         << "next" << SecureLogging::maskCode(m_window.next());

    m_timer = new QTimer();
    m_timer->setSingleShot(true);
    m_timer->setTimerType(Qt::PreciseTimer);
    m_timer->moveToThread(&m_thread);

    connect(m_timer, &QTimer::timeout, m_timer, [this]() { onTick(); });
    connect(&m_thread, &QThread::finished, m_timer, &QObject::deleteLater);

    m_running = true;
    m_thread.start();

    const std::chrono::milliseconds firstDelay(msecsUntilNextBoundary());
    QMetaObject::invokeMethod(m_timer, [timer = m_timer, firstDelay]() {
        timer->start(firstDelay);
    }, Qt::QueuedConnection);

    qCInfo(RotationLog) << "Rotation started, interval" << m_interval.count() << "s,"
                        << "first tick in" << firstDelay.count() << "ms";
    return Result<void>::success();
}

bool RotationScheduler::isRunning() const
{
    return m_running.load();
}

void RotationScheduler::rotate()
{
    const quint64 freshNext = TokenRotator::derive(m_secret.key(), m_interval, Slot::Next, m_clock());
    m_window.rotate(freshNext);

    qCDebug(RotationLog) << "Rotated, current" << SecureLogging::maskCode(m_window.current())
                         << "next" << SecureLogging::maskCode(freshNext);
    Q_EMIT rotated();
}

qint64 RotationScheduler::msecsUntilNextBoundary() const
{
    const QDateTime now = m_clock();
    const qint64 boundaryMs = TokenRotator::timeBucket(m_interval, Slot::Next, now) * 1000;
    return qMax<qint64>(0, boundaryMs - now.toMSecsSinceEpoch()) + BOUNDARY_GRACE_MS;
}

void RotationScheduler::onTick()
{
    if (!m_running.load()) {
        return;
    }

    rotate();

    // Re-aim at the next boundary every tick so timer drift never accumulates
    m_timer->start(std::chrono::milliseconds(msecsUntilNextBoundary()));
}

void RotationScheduler::onCancelled()
{
    if (!m_running.exchange(false)) {
        return;
    }

    qCInfo(RotationLog) << "Session cancelled, stopping rotation";

    // No join here; the destructor joins
    m_thread.quit();
    Q_EMIT stopped();
}

} // namespace Core
} // namespace PassKey
