/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QObject>
#include <atomic>

namespace PassKey {
namespace Core {

/**
 * @brief Cancellation signal bound to a session's lifetime
 *
 * Handed to an Engine (and through it to its RotationScheduler) when the
 * session starts. cancel() is the one shutdown path for background rotation.
 * Cancellation is final: a cancelled context cannot be reused, start a new
 * session with a new context.
 *
 * cancel() may be called from any thread; cancelled() is emitted once, from
 * the calling thread.
 */
class SessionContext : public QObject
{
    Q_OBJECT

public:
    explicit SessionContext(QObject *parent = nullptr);

    /**
     * @brief Requests shutdown of everything bound to this context
     *
     * Does not wait for the background task to finish.
     */
    void cancel();

    bool isCancelled() const;

Q_SIGNALS:
    void cancelled();

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace Core
} // namespace PassKey
