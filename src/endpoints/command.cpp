/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "command.h"
#include "core/header_codec.h"
#include "core/logging_categories.h"

namespace PassKey {
namespace Endpoints {

Command::Command() = default;

Result<void> Command::setInterval(std::chrono::seconds interval)
{
    return m_engine.setInterval(interval);
}

Result<QByteArray> Command::current(const QString &encodedSecret, const QDateTime &now)
{
    if (!encodedSecret.isEmpty()) {
        const Result<void> secret = m_engine.setEncodedSecret(encodedSecret);
        if (!secret) {
            return secret.propagate<QByteArray>();
        }
    }

    const Result<bool> ensured = m_engine.ensureSecret();
    if (!ensured) {
        return ensured.propagate<QByteArray>();
    }

    const Result<quint64> code = m_engine.codeAt(Core::Slot::Current, now);
    if (!code) {
        return code.propagate<QByteArray>();
    }

    qCDebug(EndpointLog) << "Issued one-shot token, interval" << m_engine.interval().count() << "s";
    return Result<QByteArray>::success(Core::HeaderCodec::encode(code.value()));
}

QString Command::show() const
{
    return m_engine.encodedSecret();
}

} // namespace Endpoints
} // namespace PassKey
