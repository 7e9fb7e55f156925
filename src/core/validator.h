/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include "common/result.h"

namespace PassKey {
namespace Core {
using Shared::Result;

class TokenWindow;

/**
 * @brief Checks presented transport tokens against a live window
 *
 * Transport independent: takes the raw header value, returns
 * - success when the code is previous, current or next
 * - ErrorCode::MalformedCredential when the token does not decode to
 *   HeaderCodec::TOKEN_SIZE bytes (missing header included)
 * - ErrorCode::UnauthorizedCredential when it decodes but is not live
 *
 * Runs on the caller's thread; safe to call concurrently with rotation.
 */
class Validator
{
public:
    explicit Validator(const TokenWindow &window);

    Result<void> check(const QByteArray &headerValue) const;

    /**
     * @brief Checks an already decoded code
     */
    bool isLive(quint64 code) const;

private:
    const TokenWindow &m_window;
};

} // namespace Core
} // namespace PassKey
