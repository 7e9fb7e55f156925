/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "config/passkey_configuration.h"

#include <QtTest>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>

using namespace PassKey::Config;
using PassKey::Shared::ErrorCode;
using namespace std::chrono_literals;

/**
 * @brief Tests for PassKeyConfiguration (KConfig file plus environment overrides)
 */
class TestPassKeyConfiguration : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testEmptyFile_Defaults();
    void testReadsFile();
    void testSecret_EnvironmentOverrides();
    void testInterval_EnvironmentOverrides();
    void testInterval_Invalid();
    void testInterval_Negative();
    void testReload_EmitsAndRereads();
    void testFileWatcher_EmitsOnChange();

private:
    QString writeConfig(const QByteArray &contents);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestPassKeyConfiguration::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    qunsetenv("PASSKEY_SECRET");
    qunsetenv("PASSKEY_INTERVAL");
}

void TestPassKeyConfiguration::cleanup()
{
    qunsetenv("PASSKEY_SECRET");
    qunsetenv("PASSKEY_INTERVAL");
    m_dir.reset();
}

QString TestPassKeyConfiguration::writeConfig(const QByteArray &contents)
{
    const QString path = m_dir->filePath(QStringLiteral("passkeyrc"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(contents);
    file.close();
    return path;
}

void TestPassKeyConfiguration::testEmptyFile_Defaults()
{
    const QString path = writeConfig(QByteArray());
    QVERIFY(!path.isEmpty());

    PassKeyConfiguration config(path);

    QCOMPARE(config.configPath(), path);
    QVERIFY(config.secret().isEmpty());
    QVERIFY(config.interval().isSuccess());
    QVERIFY(config.interval().value() == 0s);
    QCOMPARE(config.headerKey(), QByteArrayLiteral("token"));
}

void TestPassKeyConfiguration::testReadsFile()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Secret=PASSKEYXXBASE32XXSECRETXXEXAMPLE\n"
        "Interval=15\n"
        "HeaderKey=X-PassKey\n"));

    PassKeyConfiguration config(path);

    QCOMPARE(config.secret(), QStringLiteral("PASSKEYXXBASE32XXSECRETXXEXAMPLE"));
    QVERIFY(config.interval().value() == 15s);
    QCOMPARE(config.headerKey(), QByteArrayLiteral("X-PassKey"));
}

void TestPassKeyConfiguration::testSecret_EnvironmentOverrides()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Secret=AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAB\n"));

    qputenv("PASSKEY_SECRET", "PASSKEYXXBASE32XXSECRETXXEXAMPLE");
    PassKeyConfiguration config(path);

    QCOMPARE(config.secret(), QStringLiteral("PASSKEYXXBASE32XXSECRETXXEXAMPLE"));
}

void TestPassKeyConfiguration::testInterval_EnvironmentOverrides()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Interval=15\n"));

    qputenv("PASSKEY_INTERVAL", "30");
    PassKeyConfiguration config(path);

    QVERIFY(config.interval().value() == 30s);
}

void TestPassKeyConfiguration::testInterval_Invalid()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Interval=fifteen\n"));

    PassKeyConfiguration config(path);

    const auto interval = config.interval();
    QVERIFY(interval.isError());
    QCOMPARE(interval.code(), ErrorCode::InvalidInterval);

    qputenv("PASSKEY_INTERVAL", "1m");
    QCOMPARE(config.interval().code(), ErrorCode::InvalidInterval);
}

void TestPassKeyConfiguration::testInterval_Negative()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Interval=-5\n"));

    PassKeyConfiguration config(path);
    QCOMPARE(config.interval().code(), ErrorCode::InvalidInterval);
}

void TestPassKeyConfiguration::testReload_EmitsAndRereads()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Interval=15\n"));

    PassKeyConfiguration config(path);
    QSignalSpy changedSpy(&config, &PassKeyConfiguration::configurationChanged);
    QVERIFY(config.interval().value() == 15s);

    QVERIFY(!writeConfig(QByteArrayLiteral(
        "[General]\n"
        "Interval=45\n")).isEmpty());
    config.reload();

    QVERIFY(changedSpy.count() >= 1);
    QVERIFY(config.interval().value() == 45s);
}

void TestPassKeyConfiguration::testFileWatcher_EmitsOnChange()
{
    const QString path = writeConfig(QByteArrayLiteral(
        "[General]\n"
        "HeaderKey=first\n"));

    PassKeyConfiguration config(path);
    QSignalSpy changedSpy(&config, &PassKeyConfiguration::configurationChanged);

    QVERIFY(!writeConfig(QByteArrayLiteral(
        "[General]\n"
        "HeaderKey=second\n")).isEmpty());

    QTRY_COMPARE_WITH_TIMEOUT(config.headerKey(), QByteArrayLiteral("second"), 5000);
    QVERIFY(changedSpy.count() >= 1);
}

QTEST_MAIN(TestPassKeyConfiguration)
#include "test_passkey_configuration.moc"
