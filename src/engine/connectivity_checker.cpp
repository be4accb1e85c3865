#include "engine/connectivity_checker.hpp"

#include <QTcpSocket>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace nvdm {

bool TcpConnectivityChecker::isReachable(const std::string &host,
                                         int port,
                                         std::chrono::milliseconds timeout)
{
    if (host.empty() || port <= 0 || port > 65535) {
        return false;
    }

    QTcpSocket socket;
    socket.connectToHost(QString::fromStdString(host), static_cast<quint16>(port));
    const bool connected = socket.waitForConnected(static_cast<int>(timeout.count()));
    if (connected) {
        socket.disconnectFromHost();
    }

    NVDM_LOG_DEBUG(QStringLiteral("ConnectivityChecker"),
                   QStringLiteral("isReachable"),
                   connected ? QStringLiteral("host_reachable")
                             : QStringLiteral("host_unreachable"),
                   QStringLiteral("preflight"),
                   QStringLiteral("tcp_connect"),
                   QStringLiteral("system"),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"host", host},
                                   {"port", port},
                                   {"timeoutMs", timeout.count()},
                                   {"error", connected ? std::string()
                                                       : socket.errorString().toStdString()}}));
    return connected;
}

} // namespace nvdm
