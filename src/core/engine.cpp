/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "engine.h"
#include "logging_categories.h"
#include "session_context.h"
#include "utils/secure_logging.h"

#include <KLocalizedString>

namespace PassKey {
namespace Core {
using Shared::ErrorCode;

Engine::Engine(QObject *parent)
    : QObject(parent)
    , m_validator(m_window)
{
}

Engine::~Engine() = default;

Result<void> Engine::setInterval(std::chrono::seconds interval)
{
    if (isRunning()) {
        return Result<void>::error(ErrorCode::AlreadyRunning,
                                   i18n("Interval cannot change while rotation is running"));
    }

    if (interval.count() <= 0) {
        m_interval = DEFAULT_INTERVAL;
    } else {
        m_interval = interval;
    }
    return Result<void>::success();
}

Result<void> Engine::setRawSecret(const QByteArray &key)
{
    if (isRunning()) {
        return Result<void>::error(ErrorCode::AlreadyRunning,
                                   i18n("Secret cannot change while rotation is running"));
    }
    return m_secret.setRawSecret(key);
}

Result<void> Engine::setEncodedSecret(const QString &encoded)
{
    if (isRunning()) {
        return Result<void>::error(ErrorCode::AlreadyRunning,
                                   i18n("Secret cannot change while rotation is running"));
    }
    return m_secret.setEncodedSecret(encoded);
}

QString Engine::encodedSecret() const
{
    return m_secret.encoded();
}

bool Engine::hasSecret() const
{
    return !m_secret.isSentinel();
}

Result<bool> Engine::ensureSecret()
{
    if (!m_secret.isSentinel()) {
        return Result<bool>::success(false);
    }

    const Result<void> generated = m_secret.generate();
    if (!generated) {
        qCCritical(EngineLog) << "Cannot generate secret:" << generated.error();
        return generated.propagate<bool>();
    }

    qCWarning(EngineLog) << "No secret configured, generated a new one"
                         << SecureLogging::safeByteInfo(m_secret.key());
    Q_EMIT secretGenerated(m_secret.encoded());
    return Result<bool>::success(true);
}

Result<quint64> Engine::codeAt(Slot slot, const QDateTime &now) const
{
    if (m_secret.isSentinel()) {
        return Result<quint64>::error(ErrorCode::InvalidSecret, i18n("No secret is set"));
    }

    return Result<quint64>::success(TokenRotator::derive(m_secret.key(), interval(), slot, now));
}

Result<void> Engine::start(SessionContext *context)
{
    if (!context) {
        return Result<void>::error(ErrorCode::Cancelled, i18n("A session context is required"));
    }

    if (isRunning()) {
        return Result<void>::error(ErrorCode::AlreadyRunning, i18n("Session is already running"));
    }

    if (m_interval.count() <= 0) {
        m_interval = DEFAULT_INTERVAL;
    }

    const Result<bool> secret = ensureSecret();
    if (!secret) {
        return secret.propagate<void>();
    }

    // Join the previous session's thread before its window is re-initialized
    m_scheduler.reset();
    m_window.reset();

    m_scheduler = std::make_unique<RotationScheduler>(m_secret, m_interval, m_window, context, m_clock);
    const Result<void> started = m_scheduler->start();
    if (!started) {
        qCWarning(EngineLog) << "Rotation did not start:" << started.error();
        return started;
    }

    qCInfo(EngineLog) << "Session started, interval" << m_interval.count() << "s";
    return Result<void>::success();
}

bool Engine::isRunning() const
{
    return m_scheduler && m_scheduler->isRunning();
}

void Engine::setClock(RotationScheduler::Clock clock)
{
    m_clock = std::move(clock);
}

} // namespace Core
} // namespace PassKey
