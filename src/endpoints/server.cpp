/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "server.h"
#include "core/logging_categories.h"

namespace PassKey {
namespace Endpoints {
using Shared::ErrorCode;

Server::Server(QObject *parent)
    : QObject(parent)
    , m_headerKey(DEFAULT_HEADER_KEY)
{
}

Result<void> Server::start(Core::SessionContext *context, const QString &encodedSecret)
{
    if (!encodedSecret.isEmpty()) {
        const Result<void> secret = m_engine.setEncodedSecret(encodedSecret);
        if (!secret) {
            qCWarning(EndpointLog) << "Server secret rejected:" << secret.error();
            return secret;
        }
    }
    return m_engine.start(context);
}

Server &Server::setHeaderKey(const QByteArray &headerKey)
{
    m_headerKey = headerKey.isEmpty() ? QByteArray(DEFAULT_HEADER_KEY) : headerKey;
    return *this;
}

Result<void> Server::validate(const QByteArray &headerValue) const
{
    return m_engine.validator().check(headerValue);
}

Http::Status Server::statusFor(const Result<void> &validation)
{
    if (validation) {
        return Http::Status::Ok;
    }
    if (validation.code() == ErrorCode::UnauthorizedCredential) {
        return Http::Status::Unauthorized;
    }
    return Http::Status::BadRequest;
}

Http::Handler Server::isValid(Http::Handler next) const
{
    return [this, next = std::move(next)](const Http::Request &request) {
        const Result<void> validation = validate(request.header(m_headerKey));
        if (!validation) {
            qCDebug(EndpointLog) << request.method << request.path << "rejected:" << validation.error();
            return Http::Response::withStatus(statusFor(validation));
        }
        return next(request);
    };
}

} // namespace Endpoints
} // namespace PassKey
