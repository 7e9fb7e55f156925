/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PASSKEY_SECURE_LOGGING_H
#define PASSKEY_SECURE_LOGGING_H

#include <QString>
#include <QByteArray>

namespace PassKey {
namespace Core {

/**
 * @brief Helpers for logging without exposing credentials.
 *
 * SECURITY POLICY:
 * - NEVER log the shared secret, raw or encoded
 * - NEVER log a derived code or a transport token in full
 * - Log sizes and short fingerprints instead
 */
namespace SecureLogging {

/**
 * @brief Only shows length, never content.
 */
inline QString safeByteInfo(const QByteArray &data)
{
    return QStringLiteral("[%1 bytes]").arg(data.length());
}

/**
 * @brief Shows the lowest 16 bits of a code, enough to correlate log lines.
 */
inline QString maskCode(quint64 code)
{
    if (code == 0) {
        return QStringLiteral("(unset)");
    }
    return QStringLiteral("****%1").arg(code & 0xFFFF, 4, 16, QLatin1Char('0'));
}

/**
 * @brief Shows the first two characters of a transport token.
 */
inline QString maskToken(const QByteArray &token)
{
    if (token.isEmpty()) {
        return QStringLiteral("(empty)");
    }
    if (token.length() <= 2) {
        return QStringLiteral("****");
    }
    return QString::fromLatin1(token.left(2)) + QStringLiteral("**** [%1 chars]").arg(token.length());
}

} // namespace SecureLogging
} // namespace Core
} // namespace PassKey

#endif // PASSKEY_SECURE_LOGGING_H
