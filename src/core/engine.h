/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "rotation_scheduler.h"
#include "secret_store.h"
#include "token_window.h"
#include "validator.h"
#include "common/result.h"

#include <QObject>
#include <QString>
#include <chrono>
#include <memory>

namespace PassKey {
namespace Core {
using Shared::Result;

class SessionContext;

/**
 * @brief One PassKey session: secret, interval, window and its rotation
 *
 * Server, Client and Command each own an Engine and delegate to it.
 *
 * Usage:
 * @code
 * SessionContext context;
 * Engine engine;
 * engine.setInterval(std::chrono::seconds(15));
 * if (auto set = engine.setEncodedSecret(secret); !set) {
 *     qCritical() << set.error();
 *     return 1;
 * }
 * if (auto started = engine.start(&context); !started) {
 *     qCritical() << started.error();
 *     return 1;
 * }
 * @endcode
 */
class Engine : public QObject
{
    Q_OBJECT

public:
    static constexpr std::chrono::seconds DEFAULT_INTERVAL{60};

    explicit Engine(QObject *parent = nullptr);
    ~Engine() override;

    /**
     * @brief Sets the rotation period
     * @param interval Zero or negative selects DEFAULT_INTERVAL
     */
    Result<void> setInterval(std::chrono::seconds interval);

    /**
     * @brief Effective rotation period, DEFAULT_INTERVAL while unset
     */
    std::chrono::seconds interval() const
    {
        return m_interval.count() > 0 ? m_interval : DEFAULT_INTERVAL;
    }

    Result<void> setRawSecret(const QByteArray &key);
    Result<void> setEncodedSecret(const QString &encoded);

    /**
     * @brief base32 form of the secret in use
     */
    QString encodedSecret() const;

    bool hasSecret() const;

    /**
     * @brief Generates a secret if none is set
     * @return true if a secret was generated (secretGenerated() was emitted),
     *         ErrorCode::RandomnessUnavailable if generation failed
     */
    Result<bool> ensureSecret();

    /**
     * @brief Derives one slot's code without touching the window
     *
     * One-shot queries use this instead of start().
     *
     * @return ErrorCode::InvalidSecret while no secret is set
     */
    Result<quint64> codeAt(Slot slot, const QDateTime &now) const;

    /**
     * @brief Starts a session bound to @p context
     *
     * Applies the default interval if none is set. With no secret, generates
     * one and emits secretGenerated() before rotation begins.
     *
     * @return ErrorCode::RandomnessUnavailable if no secret could be
     *         generated; startup must be aborted
     */
    Result<void> start(SessionContext *context);

    bool isRunning() const;

    /**
     * @brief Replaces the time source of sessions started afterwards
     */
    void setClock(RotationScheduler::Clock clock);

    const TokenWindow &window() const { return m_window; }
    const Validator &validator() const { return m_validator; }

    /**
     * @brief The code of the current bucket
     */
    quint64 currentCode() const { return m_window.current(); }

    /**
     * @brief The running scheduler, nullptr before the first start()
     */
    RotationScheduler *scheduler() const { return m_scheduler.get(); }

Q_SIGNALS:
    /**
     * @brief Emitted when start() had to generate the secret
     * @param encodedSecret base32 form, to be shown to the operator once
     */
    void secretGenerated(const QString &encodedSecret);

private:
    SecretStore m_secret;
    std::chrono::seconds m_interval{0};
    TokenWindow m_window;
    Validator m_validator;
    RotationScheduler::Clock m_clock;
    std::unique_ptr<RotationScheduler> m_scheduler;
};

} // namespace Core
} // namespace PassKey
