#include <QtTest/QtTest>

#include <QTcpServer>
#include <QTemporaryDir>

#include "engine/connectivity_checker.hpp"

using namespace nvdm;

class ConnectivityTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testListeningPortIsReachable();
    void testClosedPortIsUnreachable();
    void testInvalidTargetIsUnreachable();

private:
    QTemporaryDir m_tempDir;
};

void ConnectivityTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NVDM_BASE", m_tempDir.path().toUtf8());
}

void ConnectivityTests::cleanupTestCase()
{
    qunsetenv("NVDM_BASE");
}

void ConnectivityTests::testListeningPortIsReachable()
{
    QTcpServer server;
    QVERIFY(server.listen(QHostAddress::LocalHost, 0));

    TcpConnectivityChecker checker;
    QVERIFY(checker.isReachable("127.0.0.1", server.serverPort(), std::chrono::milliseconds(2000)));
}

void ConnectivityTests::testClosedPortIsUnreachable()
{
    quint16 port = 0;
    {
        QTcpServer server;
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        port = server.serverPort();
    }

    TcpConnectivityChecker checker;
    QVERIFY(!checker.isReachable("127.0.0.1", port, std::chrono::milliseconds(2000)));
}

void ConnectivityTests::testInvalidTargetIsUnreachable()
{
    TcpConnectivityChecker checker;
    QVERIFY(!checker.isReachable("", 443, std::chrono::milliseconds(100)));
    QVERIFY(!checker.isReachable("127.0.0.1", 0, std::chrono::milliseconds(100)));
    QVERIFY(!checker.isReachable("127.0.0.1", 70000, std::chrono::milliseconds(100)));
}

QTEST_MAIN(ConnectivityTests)
#include "test_connectivity.moc"
