/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "core/engine.h"
#include "common/result.h"

#include <QDateTime>
#include <QString>
#include <chrono>

namespace PassKey {
namespace Endpoints {
using Shared::Result;

/**
 * @brief One-shot token generation, no background rotation
 *
 * Backs the pkgen tool: computes the current bucket's token on demand.
 */
class Command
{
public:
    Command();

    /**
     * @brief Sets the rotation period; zero selects the default
     */
    Result<void> setInterval(std::chrono::seconds interval);

    /**
     * @brief Returns the transport token valid at @p now
     * @param encodedSecret base32 secret; empty generates a random one
     *        (retrieve it with show())
     * @return ErrorCode::InvalidSecret for a non-empty secret that does not
     *         decode, ErrorCode::RandomnessUnavailable if generation failed
     */
    Result<QByteArray> current(const QString &encodedSecret,
                               const QDateTime &now = QDateTime::currentDateTimeUtc());

    /**
     * @brief base32 form of the secret used by the last current() call
     */
    QString show() const;

    const Core::Engine &engine() const { return m_engine; }

private:
    Core::Engine m_engine;
};

} // namespace Endpoints
} // namespace PassKey
