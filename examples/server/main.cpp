/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

/*
 * Example server: "/" is open, "/hello" requires a valid token header.
 * Uses a 15 second interval so the rolling codes are easy to watch.
 */

#include "../common/example_settings.h"
#include "core/session_context.h"
#include "endpoints/server.h"

#include <QCoreApplication>
#include <QHttpHeaders>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QTcpServer>
#include <KLocalizedString>

using namespace PassKey;

namespace {

Http::Request toRequest(const QHttpServerRequest &request)
{
    Http::Request converted;
    converted.path = request.url().path();

    const QHttpHeaders headers = request.headers();
    for (qsizetype i = 0; i < headers.size(); ++i) {
        const QLatin1StringView name = headers.nameAt(i);
        converted.setHeader(QByteArray(name.data(), name.size()), headers.valueAt(i).toByteArray());
    }
    return converted;
}

QHttpServerResponse toResponse(const Http::Response &response)
{
    const auto status = static_cast<QHttpServerResponse::StatusCode>(response.status);
    if (response.body.isEmpty()) {
        return QHttpServerResponse(status);
    }
    return QHttpServerResponse(response.contentType, response.body, status);
}

Http::Response getRoot(const Http::Request &)
{
    qCInfo(EndpointLog) << "got / request";
    Http::Response response;
    response.body = QByteArrayLiteral("try /hello");
    return response;
}

Http::Response getHello(const Http::Request &)
{
    qCInfo(EndpointLog) << "got /hello request";
    Http::Response response;
    response.body = QByteArrayLiteral("Hello!");
    return response;
}

} // namespace

int main(int argc, char *argv[])
{
    const QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("passkey-example-server"));
    KLocalizedString::setApplicationDomain("passkey");

    const Config::PassKeyConfiguration config;
    const Shared::Result<Examples::ExampleSettings> settings = Examples::loadExampleSettings(config);
    if (!settings) {
        qCritical() << settings.error();
        return 1;
    }

    Core::SessionContext context;
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &context, &Core::SessionContext::cancel);

    Endpoints::Server passkey;
    passkey.setHeaderKey(settings.value().headerKey);

    const Shared::Result<void> interval = passkey.engine().setInterval(settings.value().interval);
    if (!interval) {
        qCritical() << interval.error();
        return 1;
    }

    const Shared::Result<void> started = passkey.start(&context, settings.value().secret);
    if (!started) {
        qCritical() << started.error();
        return 1;
    }

    const Http::Handler root = getRoot;
    const Http::Handler hello = passkey.isValid(getHello);

    QHttpServer server;
    server.route(QStringLiteral("/"), [root](const QHttpServerRequest &request) {
        return toResponse(root(toRequest(request)));
    });
    server.route(QStringLiteral("/hello"), [hello](const QHttpServerRequest &request) {
        return toResponse(hello(toRequest(request)));
    });

    auto *tcpServer = new QTcpServer(&server);
    if (!tcpServer->listen(QHostAddress::Any, Examples::EXAMPLE_PORT) || !server.bind(tcpServer)) {
        qCritical() << "Cannot listen on port" << Examples::EXAMPLE_PORT << ":" << tcpServer->errorString();
        return 1;
    }

    qCInfo(EndpointLog) << "Listening on port" << tcpServer->serverPort();
    return app.exec();
}
