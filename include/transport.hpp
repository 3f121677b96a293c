#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "types.hpp"

// Called on the transport's own execution context
using FrameHandler = std::function<void(const std::string& payload)>;
using LinkLostHandler = std::function<void()>;

// An open connection to one device. Failures are reported as TransportException.
class SensorLink {
public:
    virtual ~SensorLink() = default;
    virtual bool isConnected() const = 0;
    virtual void subscribe(const std::string& channel, FrameHandler handler) = 0;
    virtual void unsubscribe(const std::string& channel) = 0;
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Every device advertising during the scan window, unfiltered and unsorted
    virtual std::vector<DeviceIdentity> scan(double timeout_s) = 0;

    /**
     * @brief Open a link; may block up to timeout_s.
     * on_link_lost fires whenever the link goes down, including after close().
     * @throws TransportException on failure or timeout
     */
    virtual std::shared_ptr<SensorLink> open(const std::string& address, double timeout_s,
                                             LinkLostHandler on_link_lost) = 0;
};
