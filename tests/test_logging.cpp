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
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScopeRestores();
    void testNewCorrelationIdFormat();
    void testInvalidUtf8ContextIsReplaced();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logsDir() const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logsDir() const
{
    return m_tempDir.path() + "/.local/share/vita/logs";
}

void LoggingTests::testLogEventWrites()
{
    vita::logging::initLogging(QStringLiteral("vita-test"), false);
    const QString logPath = logsDir() + "/vita-test.log";

    vita::logging::logEvent(vita::logging::LogLevel::Info,
                            QStringLiteral("vita-test"),
                            QStringLiteral("Test"),
                            QStringLiteral("testLogEventWrites"),
                            QStringLiteral("test_log"),
                            QStringLiteral("unit_test"),
                            QStringLiteral("direct_call"),
                            vita::logging::defaultWho(),
                            QStringLiteral("corr-1"),
                            nlohmann::json{{"key", "value"}});

    QFile file(logPath);
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    vita::logging::initLogging(QStringLiteral("vita-quiet"), false);
    QVERIFY(!vita::logging::isTraceEnabled());

    vita::logging::logEvent(vita::logging::LogLevel::Debug,
                            QStringLiteral("vita-quiet"),
                            QStringLiteral("Test"),
                            QStringLiteral("testDebugSkippedWithoutTrace"),
                            QStringLiteral("debug_line"),
                            QStringLiteral("unit_test"),
                            QStringLiteral("direct_call"),
                            vita::logging::defaultWho(),
                            QString(),
                            nlohmann::json::object());

    QVERIFY(!QFile::exists(logsDir() + "/vita-quiet.log"));
    QVERIFY(!QFile::exists(logsDir() + "/vita-quiet-trace.log"));
}

void LoggingTests::testTraceWrites()
{
    vita::logging::initLogging(QStringLiteral("vita-test"), true);
    const QString tracePath = logsDir() + "/vita-test-trace.log";

    vita::logging::logEvent(vita::logging::LogLevel::Debug,
                            QStringLiteral("vita-test"),
                            QStringLiteral("Test"),
                            QStringLiteral("testTraceWrites"),
                            QStringLiteral("test_trace"),
                            QStringLiteral("unit_test"),
                            QStringLiteral("direct_call"),
                            vita::logging::defaultWho(),
                            QStringLiteral("corr-2"),
                            nlohmann::json::object());

    QFile file(tracePath);
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    vita::logging::initLogging(QStringLiteral("vita-test"), false);
}

void LoggingTests::testCorrelationScopeRestores()
{
    vita::logging::setCorrelationId(QStringLiteral("outer"));
    {
        vita::logging::CorrelationScope scope(QStringLiteral("session-abc123"));
        QCOMPARE(vita::logging::currentCorrelationId(), QStringLiteral("session-abc123"));
    }
    QCOMPARE(vita::logging::currentCorrelationId(), QStringLiteral("outer"));
    vita::logging::setCorrelationId(QString());
}

void LoggingTests::testNewCorrelationIdFormat()
{
    const QString first = vita::logging::newCorrelationId(QStringLiteral("session"));
    const QString second = vita::logging::newCorrelationId(QStringLiteral("session"));

    QVERIFY(first.startsWith(QStringLiteral("session-")));
    QCOMPARE(first.size(), QStringLiteral("session-").size() + 6);
    QVERIFY(first != second);
}

void LoggingTests::testInvalidUtf8ContextIsReplaced()
{
    vita::logging::initLogging(QStringLiteral("vita-latin1"), false);

    vita::logging::logEvent(vita::logging::LogLevel::Info,
                            QStringLiteral("vita-latin1"),
                            QStringLiteral("Test"),
                            QStringLiteral("testInvalidUtf8ContextIsReplaced"),
                            QStringLiteral("latin1_symptom"),
                            QStringLiteral("unit_test"),
                            QStringLiteral("direct_call"),
                            vita::logging::defaultWho(),
                            QStringLiteral("corr-3"),
                            nlohmann::json{{"symptom", "caf\xe9"}});

    QFile file(logsDir() + "/vita-latin1.log");
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed["context"].value("symptom", "")),
             QString::fromUtf8("caf\xef\xbf\xbd"));

    vita::logging::initLogging(QStringLiteral("vita-test"), false);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
