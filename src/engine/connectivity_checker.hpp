#pragma once

#include <chrono>
#include <string>

namespace nvdm {

// Unreachability is a normal answer, never an exception.
class ConnectivityChecker {
public:
    virtual ~ConnectivityChecker() = default;

    virtual bool isReachable(const std::string &host,
                             int port,
                             std::chrono::milliseconds timeout) = 0;
};

class TcpConnectivityChecker : public ConnectivityChecker {
public:
    bool isReachable(const std::string &host,
                     int port,
                     std::chrono::milliseconds timeout) override;
};

} // namespace nvdm
