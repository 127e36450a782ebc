#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugDroppedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testLogDirOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("HOSTFORM_LOG_DIR");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/hostform/logs/hostform-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    hostform::logging::initLogging(QStringLiteral("hostform-test"), false);

    hostform::logging::logEvent(hostform::logging::LogLevel::Info,
                                QStringLiteral("hostform-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                hostform::logging::defaultWho(),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugDroppedWithoutTrace()
{
    hostform::logging::initLogging(QStringLiteral("hostform-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    hostform::logging::logEvent(hostform::logging::LogLevel::Debug,
                                QStringLiteral("hostform-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testDebugDroppedWithoutTrace"),
                                QStringLiteral("test_debug"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                hostform::logging::defaultWho(),
                                QString(),
                                nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
}

void LoggingTests::testTraceWrites()
{
    hostform::logging::initLogging(QStringLiteral("hostform-test"), true);
    QVERIFY(hostform::logging::isTraceEnabled());

    hostform::logging::logEvent(hostform::logging::LogLevel::Debug,
                                QStringLiteral("hostform-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testTraceWrites"),
                                QStringLiteral("test_trace"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                hostform::logging::defaultWho(),
                                QStringLiteral("corr-2"),
                                nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    hostform::logging::initLogging(QStringLiteral("hostform-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    hostform::logging::initLogging(QStringLiteral("hostform-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));
    hostform::logging::setCorrelationId(QStringLiteral("outer"));

    {
        const hostform::logging::CorrelationScope scope(QStringLiteral("run-42"));
        QCOMPARE(hostform::logging::currentCorrelationId(), QStringLiteral("run-42"));
        HFLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   hostform::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QCOMPARE(hostform::logging::currentCorrelationId(), QStringLiteral("outer"));
    hostform::logging::setCorrelationId(QString());

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("run-42"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("hostform-test"));
}

void LoggingTests::testLogDirOverride()
{
    QTemporaryDir overrideDir;
    QVERIFY(overrideDir.isValid());
    qputenv("HOSTFORM_LOG_DIR", overrideDir.path().toUtf8());

    QCOMPARE(hostform::logging::logsDirPath(), overrideDir.path());

    hostform::logging::initLogging(QStringLiteral("hostform-test"), false);
    hostform::logging::logEvent(hostform::logging::LogLevel::Warn,
                                QStringLiteral("hostform-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogDirOverride"),
                                QStringLiteral("test_override"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                hostform::logging::defaultWho(),
                                QString(),
                                nlohmann::json::object());
    qunsetenv("HOSTFORM_LOG_DIR");

    QVERIFY(QFile::exists(overrideDir.path() + "/hostform-test.log"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
