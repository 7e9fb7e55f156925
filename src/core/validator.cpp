/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "validator.h"
#include "header_codec.h"
#include "logging_categories.h"
#include "token_window.h"
#include "utils/secure_logging.h"

#include <KLocalizedString>

namespace PassKey {
namespace Core {
using Shared::ErrorCode;

Validator::Validator(const TokenWindow &window)
    : m_window(window)
{
}

Result<void> Validator::check(const QByteArray &headerValue) const
{
    const Result<quint64> code = HeaderCodec::decode(headerValue);
    if (!code) {
        qCDebug(ValidatorLog) << "Malformed token" << SecureLogging::maskToken(headerValue)
                              << "-" << code.error();
        return code.propagate<void>();
    }

    if (!isLive(code.value())) {
        qCDebug(ValidatorLog) << "Token not in live window" << SecureLogging::maskToken(headerValue);
        return Result<void>::error(ErrorCode::UnauthorizedCredential,
                                   i18n("Token is not valid for the current time window"));
    }

    return Result<void>::success();
}

bool Validator::isLive(quint64 code) const
{
    return m_window.contains(code);
}

} // namespace Core
} // namespace PassKey
