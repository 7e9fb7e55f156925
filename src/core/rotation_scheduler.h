/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "token_rotator.h"
#include "common/result.h"

#include <QDateTime>
#include <QObject>
#include <QThread>
#include <atomic>
#include <chrono>
#include <functional>

class QTimer;

namespace PassKey {
namespace Core {
using Shared::Result;

class SecretStore;
class SessionContext;
class TokenWindow;

/**
 * @brief Keeps a TokenWindow fresh, one rotation per interval
 *
 * States: Stopped -> Running -> Stopped. One scheduler serves one session;
 * a new session builds a new scheduler, which re-initializes the window.
 *
 * - start() derives current and next immediately and resets previous to
 *   the sentinel, then starts a QTimer on a dedicated QThread. The timer
 *   fires at every interval boundary of the clock.
 * - Each tick calls rotate(): current -> previous, next -> current, fresh
 *   next derived.
 * - The SessionContext given at construction is the shutdown path. Its
 *   cancelled() signal stops the timer thread without waiting for it; a
 *   rotation already running completes.
 * - The destructor joins the thread.
 *
 * The secret must not change while the scheduler runs.
 */
class RotationScheduler : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    /**
     * @param secret Key material, must outlive the scheduler
     * @param interval Rotation period, must be positive
     * @param window Window to maintain, must outlive the scheduler
     * @param context Cancellation signal for this session
     * @param clock Time source; system UTC clock when empty
     */
    RotationScheduler(const SecretStore &secret,
                      std::chrono::seconds interval,
                      TokenWindow &window,
                      SessionContext *context,
                      Clock clock = Clock(),
                      QObject *parent = nullptr);
    ~RotationScheduler() override;

    /**
     * @brief Populates the window and starts periodic rotation
     * @return ErrorCode::Cancelled if the context is already cancelled,
     *         ErrorCode::AlreadyRunning on a second call
     */
    Result<void> start();

    bool isRunning() const;

    std::chrono::seconds interval() const { return m_interval; }

    /**
     * @brief Performs one rotation step at the clock's current time
     *
     * Called by the timer thread. Tests drive it directly with a fake
     * clock; it must not race with a live timer tick.
     */
    void rotate();

    /**
     * @brief Milliseconds from the clock's now until just past the next bucket boundary
     */
    qint64 msecsUntilNextBoundary() const;

Q_SIGNALS:
    /**
     * @brief Emitted after each rotation, from the thread that rotated
     */
    void rotated();

    /**
     * @brief Emitted once when cancellation stops the scheduler
     */
    void stopped();

private:
    void onCancelled();
    void onTick();

    const SecretStore &m_secret;
    const std::chrono::seconds m_interval;
    TokenWindow &m_window;
    Clock m_clock;

    SessionContext *m_context;

    QThread m_thread;
    QTimer *m_timer = nullptr; ///< Lives in m_thread, deleted when it finishes
    std::atomic<bool> m_running{false};
    bool m_started = false;

    /// Fire slightly after the boundary so the clock is past it
    static constexpr qint64 BOUNDARY_GRACE_MS = 5;
};

} // namespace Core
} // namespace PassKey
