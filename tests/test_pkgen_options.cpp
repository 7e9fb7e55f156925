/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pkgen/pkgen_options.h"

#include <QtTest>
#include <QFile>
#include <QTemporaryDir>

using namespace PassKey::Pkgen;
using PassKey::Shared::ErrorCode;
using namespace std::chrono_literals;

namespace {

const QString EXAMPLE_SECRET = QStringLiteral("PASSKEYXXBASE32XXSECRETXXEXAMPLE");
const QString HOME_SECRET = QStringLiteral("LMK3UEETD52M4EHZWAQ3CJHZ37OI3GQA");

} // namespace

/**
 * @brief Tests for pkgen argument and environment resolution
 */
class TestPkgenOptions : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanupTestCase();

    void testResolve_NothingGiven();
    void testResolve_PositionalSecret();
    void testResolve_EnvironmentWins();
    void testResolve_HomeSecretWhenNoArguments();
    void testResolve_PositionalInterval();
    void testResolve_InvalidInterval();

    void testReadHomeSecret();
    void testReadHomeSecret_Missing();

private:
    QByteArray m_savedHome;
};

void TestPkgenOptions::initTestCase()
{
    m_savedHome = qgetenv("HOME");
}

void TestPkgenOptions::cleanupTestCase()
{
    qputenv("HOME", m_savedHome);
}

void TestPkgenOptions::testResolve_NothingGiven()
{
    const auto options = resolveOptions({}, QString(), QString(), QString());
    QVERIFY(options.isSuccess());
    QVERIFY(options.value().secret.isEmpty());
    QVERIFY(options.value().interval == 0s);
}

void TestPkgenOptions::testResolve_PositionalSecret()
{
    const auto options = resolveOptions({EXAMPLE_SECRET}, QString(), QString(), HOME_SECRET);
    QVERIFY(options.isSuccess());
    QCOMPARE(options.value().secret, EXAMPLE_SECRET);
}

void TestPkgenOptions::testResolve_EnvironmentWins()
{
    const auto options = resolveOptions({HOME_SECRET, QStringLiteral("15")},
                                        EXAMPLE_SECRET, QStringLiteral("30"), QString());
    QVERIFY(options.isSuccess());
    QCOMPARE(options.value().secret, EXAMPLE_SECRET);
    QVERIFY(options.value().interval == 30s);
}

void TestPkgenOptions::testResolve_HomeSecretWhenNoArguments()
{
    const auto options = resolveOptions({}, QString(), QString(), HOME_SECRET);
    QVERIFY(options.isSuccess());
    QCOMPARE(options.value().secret, HOME_SECRET);
}

void TestPkgenOptions::testResolve_PositionalInterval()
{
    const auto options = resolveOptions({EXAMPLE_SECRET, QStringLiteral("15")},
                                        QString(), QString(), QString());
    QVERIFY(options.isSuccess());
    QVERIFY(options.value().interval == 15s);
}

void TestPkgenOptions::testResolve_InvalidInterval()
{
    const auto positional = resolveOptions({EXAMPLE_SECRET, QStringLiteral("soon")},
                                           QString(), QString(), QString());
    QCOMPARE(positional.code(), ErrorCode::InvalidInterval);

    const auto negative = resolveOptions({EXAMPLE_SECRET, QStringLiteral("-1")},
                                         QString(), QString(), QString());
    QCOMPARE(negative.code(), ErrorCode::InvalidInterval);

    const auto fromEnv = resolveOptions({}, QString(), QStringLiteral("15s"), QString());
    QCOMPARE(fromEnv.code(), ErrorCode::InvalidInterval);
}

void TestPkgenOptions::testReadHomeSecret()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    qputenv("HOME", QFile::encodeName(home.path()));

    QFile file(home.filePath(QStringLiteral(".pkgen")));
    QVERIFY(file.open(QIODevice::WriteOnly));
    // Anything past the first 32 characters is ignored
    file.write(HOME_SECRET.toLatin1() + QByteArrayLiteral("\ntrailing notes\n"));
    file.close();

    QCOMPARE(readHomeSecret(), HOME_SECRET);
}

void TestPkgenOptions::testReadHomeSecret_Missing()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    qputenv("HOME", QFile::encodeName(home.path()));

    QVERIFY(readHomeSecret().isEmpty());
}

QTEST_MAIN(TestPkgenOptions)
#include "test_pkgen_options.moc"
