#include <QtTest>
#include "core/Logging.hpp"

using boost::log::trivial::severity_level;

class TestLogging : public QObject {
    Q_OBJECT
private slots:
    void testParseLogLevel_data()
    {
        QTest::addColumn<QString>("name");
        QTest::addColumn<int>("level");

        QTest::newRow("trace") << "trace" << int(severity_level::trace);
        QTest::newRow("debug") << "debug" << int(severity_level::debug);
        QTest::newRow("info mixed case") << " Info " << int(severity_level::info);
        QTest::newRow("warn") << "warn" << int(severity_level::warning);
        QTest::newRow("warning") << "warning" << int(severity_level::warning);
        QTest::newRow("error") << "error" << int(severity_level::error);
        QTest::newRow("fatal") << "fatal" << int(severity_level::fatal);
    }

    void testParseLogLevel()
    {
        QFETCH(QString, name);
        QFETCH(int, level);

        severity_level parsed = severity_level::fatal;
        QVERIFY(odb::parseLogLevel(name, parsed));
        QCOMPARE(int(parsed), level);
    }

    void testUnknownLevel()
    {
        severity_level parsed = severity_level::info;
        QVERIFY(!odb::parseLogLevel("verbose", parsed));
        QVERIFY(!odb::parseLogLevel("", parsed));
        QCOMPARE(int(parsed), int(severity_level::info));
    }

    void testInitLoggingRoutesQtMessages()
    {
        odb::initLogging("nonsense");
        // Goes through the installed handler without aborting
        qWarning() << "[TestLogging] routed";
        odb::initLogging("info");
        qDebug() << "[TestLogging] filtered";
        qInstallMessageHandler(nullptr);
    }
};

QTEST_GUILESS_MAIN(TestLogging)
#include "test_logging.moc"
