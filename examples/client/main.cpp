/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

/*
 * Example client: calls the example server's /hello fifteen times, one
 * third of an interval apart, so requests span several rotations.
 */

#include "../common/example_settings.h"
#include "core/session_context.h"
#include "endpoints/client.h"

#include <QCoreApplication>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <KLocalizedString>

#include <functional>

using namespace PassKey;

namespace {
constexpr int REQUEST_COUNT = 15;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("passkey-example-client"));
    KLocalizedString::setApplicationDomain("passkey");

    const Config::PassKeyConfiguration config;
    const Shared::Result<Examples::ExampleSettings> settings = Examples::loadExampleSettings(config);
    if (!settings) {
        qCritical() << settings.error();
        return 1;
    }

    Core::SessionContext context;
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &context, &Core::SessionContext::cancel);

    Endpoints::Client passkey;
    passkey.setHeaderKey(settings.value().headerKey);

    const std::chrono::seconds interval = settings.value().interval;
    const Shared::Result<void> configured = passkey.engine().setInterval(interval);
    if (!configured) {
        qCritical() << configured.error();
        return 1;
    }

    const Shared::Result<void> started = passkey.start(&context, settings.value().secret);
    if (!started) {
        qCritical() << started.error();
        return 1;
    }

    QNetworkAccessManager network;
    network.setTransferTimeout(
        static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(interval).count()));

    const QUrl url(QStringLiteral("http://localhost:%1/hello").arg(Examples::EXAMPLE_PORT));
    const std::chrono::milliseconds pause = std::chrono::duration_cast<std::chrono::milliseconds>(interval) / 3;
    int remaining = REQUEST_COUNT;

    std::function<void()> sendNext;
    sendNext = [&]() {
        QNetworkRequest request(url);
        passkey.setHeader(request);

        QNetworkReply *reply = network.get(request);
        QObject::connect(reply, &QNetworkReply::finished, &app, [&, reply]() {
            reply->deleteLater();

            const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            if (reply->error() != QNetworkReply::NoError && status == 0) {
                qCWarning(EndpointLog) << reply->errorString();
                app.exit(1);
                return;
            }
            if (status != 200) {
                qCWarning(EndpointLog) << "http:" << status;
                app.exit(1);
                return;
            }

            qCInfo(EndpointLog) << reply->readAll();

            if (--remaining == 0) {
                app.quit();
                return;
            }
            QTimer::singleShot(pause, &app, sendNext);
        });
    };

    QTimer::singleShot(0, &app, sendNext);
    return app.exec();
}
