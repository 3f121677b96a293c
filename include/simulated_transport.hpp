#pragma once
#include <map>
#include <mutex>
#include "transport.hpp"

/**
 * @brief In-process stand-in for the wireless stack.
 *
 * Devices are registered up front. Frames are either pushed by hand with
 * injectFrame() or streamed by a background thread when frame_interval_ms > 0.
 * Link loss is raised with dropLink(). Both run their callbacks on the calling
 * thread, which plays the part of the transport's own context.
 */
class SimulatedTransport : public Transport {
public:
    struct DeviceProfile {
        std::string address;
        std::string name;
        bool fail_open = false;           // open() throws
        bool open_not_connected = false;  // open() returns a link that is not connected
        double base_value = 20000.0;      // V3 level while streaming
        double noise_amplitude = 5.0;
        uint32_t frame_interval_ms = 0;   // 0: manual frames only
    };

    SimulatedTransport();
    ~SimulatedTransport() override;

    void addDevice(const DeviceProfile& profile);
    void setOpenFailure(const std::string& address, bool fail);

    // Delivers one payload to every handler subscribed on the device's link
    bool injectFrame(const std::string& address, const std::string& payload);
    // Simulates an unexpected drop of the device's current link
    bool dropLink(const std::string& address);

    bool isLinkOpen(const std::string& address) const;
    size_t openCount(const std::string& address) const;
    size_t subscriberCount(const std::string& address) const;

    std::vector<DeviceIdentity> scan(double timeout_s) override;
    std::shared_ptr<SensorLink> open(const std::string& address, double timeout_s,
                                     LinkLostHandler on_link_lost) override;

private:
    class Link;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceProfile> devices_;
    std::map<std::string, std::weak_ptr<Link>> links_;
    std::map<std::string, size_t> open_counts_;

    std::shared_ptr<Link> currentLink(const std::string& address) const;
};
