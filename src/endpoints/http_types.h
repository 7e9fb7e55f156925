/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <functional>

namespace PassKey {
namespace Http {

/**
 * @brief Status codes the middleware produces
 */
enum class Status {
    Ok = 200,
    BadRequest = 400,
    Unauthorized = 401
};

/**
 * @brief Minimal request view handed to handlers
 *
 * Header names are case-insensitive; they are stored lower-cased.
 */
struct Request {
    QByteArray method = QByteArrayLiteral("GET");
    QString path;
    QByteArray body;

    void setHeader(const QByteArray &name, const QByteArray &value)
    {
        m_headers.insert(name.toLower(), value);
    }

    /**
     * @return Header value, or an empty array if absent
     */
    QByteArray header(const QByteArray &name) const
    {
        return m_headers.value(name.toLower());
    }

    bool hasHeader(const QByteArray &name) const
    {
        return m_headers.contains(name.toLower());
    }

    const QMap<QByteArray, QByteArray> &headers() const { return m_headers; }

private:
    QMap<QByteArray, QByteArray> m_headers;
};

struct Response {
    int status = static_cast<int>(Status::Ok);
    QByteArray body;
    QByteArray contentType = QByteArrayLiteral("text/plain");

    static Response withStatus(Status status)
    {
        Response response;
        response.status = static_cast<int>(status);
        response.contentType.clear();
        return response;
    }
};

using Handler = std::function<Response(const Request &)>;

} // namespace Http
} // namespace PassKey
