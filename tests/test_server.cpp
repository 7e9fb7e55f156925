/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "endpoints/server.h"
#include "endpoints/client.h"
#include "core/header_codec.h"
#include "core/session_context.h"

#include <QtTest>
#include <QTimeZone>

using namespace PassKey;
using namespace PassKey::Endpoints;
using PassKey::Shared::ErrorCode;
using namespace std::chrono_literals;

namespace {

const QString EXAMPLE_SECRET = QStringLiteral("PASSKEYXXBASE32XXSECRETXXEXAMPLE");

QDateTime fixedNow()
{
    return QDateTime::fromSecsSinceEpoch(1700000000, QTimeZone::UTC);
}

Http::Response hello(const Http::Request &)
{
    Http::Response response;
    response.body = QByteArrayLiteral("Hello, world!");
    return response;
}

} // namespace

/**
 * @brief Tests for the server role and its validation middleware
 */
class TestServer : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testStart_InvalidSecret();
    void testHeaderKey_Default();
    void testStatusFor();
    void testMiddleware_MissingHeader();
    void testMiddleware_Malformed();
    void testMiddleware_Unauthorized();
    void testMiddleware_Valid();
    void testMiddleware_CustomHeaderKey();
    void testMiddleware_ClientRoundTrip();
    void testMiddleware_ColdStartRejectsPrevious();

private:
    Http::Request requestWith(const QByteArray &token) const
    {
        Http::Request request;
        request.path = QStringLiteral("/hello");
        request.setHeader(QByteArrayLiteral("token"), token);
        return request;
    }

    Server *m_server = nullptr;
    Core::SessionContext *m_context = nullptr;
};

void TestServer::init()
{
    m_context = new Core::SessionContext(this);
    m_server = new Server(this);
    m_server->engine().setClock(fixedNow);
    QVERIFY(m_server->engine().setInterval(15s).isSuccess());
}

void TestServer::cleanup()
{
    m_context->cancel();
    delete m_server;
    m_server = nullptr;
    delete m_context;
    m_context = nullptr;
}

void TestServer::testStart_InvalidSecret()
{
    const auto result = m_server->start(m_context, QStringLiteral("NOT-A-SECRET"));
    QCOMPARE(result.code(), ErrorCode::InvalidSecret);
    QVERIFY(!m_server->engine().isRunning());
}

void TestServer::testHeaderKey_Default()
{
    QCOMPARE(m_server->headerKey(), QByteArrayLiteral("token"));

    m_server->setHeaderKey(QByteArrayLiteral("X-PassKey"));
    QCOMPARE(m_server->headerKey(), QByteArrayLiteral("X-PassKey"));

    m_server->setHeaderKey(QByteArray());
    QCOMPARE(m_server->headerKey(), QByteArrayLiteral("token"));
}

void TestServer::testStatusFor()
{
    using Shared::Result;

    QCOMPARE(Server::statusFor(Result<void>::success()), Http::Status::Ok);
    QCOMPARE(Server::statusFor(Result<void>::error(ErrorCode::UnauthorizedCredential, QString())),
             Http::Status::Unauthorized);
    QCOMPARE(Server::statusFor(Result<void>::error(ErrorCode::MalformedCredential, QString())),
             Http::Status::BadRequest);
}

void TestServer::testMiddleware_MissingHeader()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    Http::Request request;
    request.path = QStringLiteral("/hello");

    const Http::Response response = handler(request);
    QCOMPARE(response.status, 400);
    QVERIFY(response.body.isEmpty());
}

void TestServer::testMiddleware_Malformed()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    QCOMPARE(handler(requestWith(QByteArrayLiteral("garbage"))).status, 400);
    QCOMPARE(handler(requestWith(QByteArrayLiteral("AAAAAAAAAAAAAAA="))).status, 400);
}

void TestServer::testMiddleware_Unauthorized()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    const Http::Response response = handler(requestWith(Core::HeaderCodec::encode(1234)));
    QCOMPARE(response.status, 401);
    QVERIFY(response.body.isEmpty());
}

void TestServer::testMiddleware_Valid()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    // Current and next are both accepted
    const Http::Response current = handler(requestWith(Core::HeaderCodec::encode(8644107498317547602ULL)));
    QCOMPARE(current.status, 200);
    QCOMPARE(current.body, QByteArrayLiteral("Hello, world!"));

    const Http::Response next = handler(requestWith(Core::HeaderCodec::encode(14507433846011194379ULL)));
    QCOMPARE(next.status, 200);
}

void TestServer::testMiddleware_CustomHeaderKey()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    m_server->setHeaderKey(QByteArrayLiteral("X-PassKey"));
    const Http::Handler handler = m_server->isValid(hello);

    const QByteArray token = Core::HeaderCodec::encode(m_server->engine().currentCode());

    // Default header no longer consulted
    QCOMPARE(handler(requestWith(token)).status, 400);

    // Header names match case-insensitively
    Http::Request request;
    request.setHeader(QByteArrayLiteral("x-passkey"), token);
    QCOMPARE(handler(request).status, 200);
}

void TestServer::testMiddleware_ClientRoundTrip()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    Client client;
    client.engine().setClock(fixedNow);
    QVERIFY(client.engine().setInterval(15s).isSuccess());
    QVERIFY(client.start(m_context, EXAMPLE_SECRET).isSuccess());

    Http::Request request;
    client.setHeader(request);

    QCOMPARE(handler(request).status, 200);
}

void TestServer::testMiddleware_ColdStartRejectsPrevious()
{
    QVERIFY(m_server->start(m_context, EXAMPLE_SECRET).isSuccess());
    const Http::Handler handler = m_server->isValid(hello);

    // Valid for the bucket before start, but previous is empty until the first rotation
    QCOMPARE(handler(requestWith(Core::HeaderCodec::encode(4799645867104616598ULL))).status, 401);
    QCOMPARE(handler(requestWith(Core::HeaderCodec::encode(0))).status, 401);
}

QTEST_MAIN(TestServer)
#include "test_server.moc"
