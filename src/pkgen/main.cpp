/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

/*
 * pkgen: generates shared secrets, and tokens from a base32 secret for
 * command-line testing or single interactions
 *
 *   % pkgen
 *   LMK3UEETD52M4EHZWAQ3CJHZ37OI3GQA
 *
 *   % pkgen LMK3UEETD52M4EHZWAQ3CJHZ37OI3GQA 15
 *   ZOGFKOQPDOG5TI5S
 *
 *   % curl -H token:$(pkgen LMK3UEETD52M4EHZWAQ3CJHZ37OI3GQA) http://localhost:8080/hello
 */

#include "endpoints/command.h"
#include "pkgen_options.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <KLocalizedString>

using namespace PassKey;
using PassKey::Shared::Result;

int main(int argc, char *argv[])
{
    const QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pkgen"));
    KLocalizedString::setApplicationDomain("passkey");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        i18n("Emits a new shared secret, or the current token for a secret.\n"
             "Without arguments the secret is read from SECRET or ~/.pkgen;\n"
             "the interval from INTERVAL (seconds, default 60)."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("secret"), i18n("32-character Base32 shared secret"),
                                 QStringLiteral("[secret]"));
    parser.addPositionalArgument(QStringLiteral("seconds"), i18n("Rotation interval in seconds"),
                                 QStringLiteral("[seconds]"));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const Result<Pkgen::Options> options = Pkgen::resolveOptions(
        parser.positionalArguments(), qEnvironmentVariable("SECRET"),
        qEnvironmentVariable("INTERVAL"), Pkgen::readHomeSecret());
    if (!options) {
        err << options.error() << Qt::endl;
        return 1;
    }

    Endpoints::Command command;
    const Result<void> interval = command.setInterval(options.value().interval);
    if (!interval) {
        err << interval.error() << Qt::endl;
        return 1;
    }

    const Result<QByteArray> current = command.current(options.value().secret);
    if (!current) {
        err << current.error() << Qt::endl;
        return 1;
    }

    if (options.value().secret.isEmpty()) {
        out << command.show() << Qt::endl;
        return 0;
    }

    out << QString::fromLatin1(current.value()) << Qt::endl;
    return 0;
}
