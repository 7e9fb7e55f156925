/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "client.h"
#include "core/header_codec.h"
#include "core/logging_categories.h"

#include <QNetworkRequest>

namespace PassKey {
namespace Endpoints {

Client::Client(QObject *parent)
    : QObject(parent)
    , m_headerKey(DEFAULT_HEADER_KEY)
{
}

Result<void> Client::start(Core::SessionContext *context, const QString &encodedSecret)
{
    if (!encodedSecret.isEmpty()) {
        const Result<void> secret = m_engine.setEncodedSecret(encodedSecret);
        if (!secret) {
            qCWarning(EndpointLog) << "Client secret rejected:" << secret.error();
            return secret;
        }
    }
    return m_engine.start(context);
}

Client &Client::setHeaderKey(const std::optional<QByteArray> &headerKey)
{
    if (!headerKey || headerKey->isEmpty()) {
        m_headerKey = DEFAULT_HEADER_KEY;
    } else {
        m_headerKey = *headerKey;
    }
    return *this;
}

QByteArray Client::headerValue() const
{
    return Core::HeaderCodec::encode(m_engine.currentCode());
}

void Client::setHeader(QNetworkRequest &request) const
{
    request.setRawHeader(m_headerKey, headerValue());
}

void Client::setHeader(Http::Request &request) const
{
    request.setHeader(m_headerKey, headerValue());
}

} // namespace Endpoints
} // namespace PassKey
