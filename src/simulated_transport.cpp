#include "../include/simulated_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/frame_parser.hpp"
#include "../include/logger.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <thread>

class SimulatedTransport::Link : public SensorLink {
public:
    Link(const DeviceProfile& profile, bool connected, LinkLostHandler on_link_lost)
        : profile_(profile), connected_(connected), on_link_lost_(std::move(on_link_lost)) {
        if (connected && profile_.frame_interval_ms > 0) {
            streamer_ = std::thread(&Link::streamLoop, this);
        }
    }

    ~Link() override { stopStreaming(); }

    bool isConnected() const override { return connected_.load(); }

    void subscribe(const std::string& channel, FrameHandler handler) override {
        if (!connected_.load()) {
            throw TransportException("subscribe on closed link to " + profile_.address);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[channel] = std::move(handler);
    }

    void unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handlers_.erase(channel) == 0) {
            throw TransportException("no subscription on " + channel);
        }
    }

    void close() override { goDown(); }
    void drop() { goDown(); }

    void deliver(const std::string& payload) {
        if (!connected_.load()) return;
        std::vector<FrameHandler> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : handlers_) targets.push_back(entry.second);
        }
        for (const auto& handler : targets) handler(payload);
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    DeviceProfile profile_;
    std::atomic<bool> connected_;
    LinkLostHandler on_link_lost_;
    mutable std::mutex mutex_;
    std::map<std::string, FrameHandler> handlers_;

    std::thread streamer_;
    std::mutex join_mutex_;
    std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool stream_stop_ = false;

    void goDown() {
        bool was_connected = connected_.exchange(false);
        stopStreaming();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_.clear();
        }
        if (was_connected && on_link_lost_) on_link_lost_();
    }

    void stopStreaming() {
        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            stream_stop_ = true;
        }
        stream_cv_.notify_all();
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (streamer_.joinable() && streamer_.get_id() != std::this_thread::get_id()) {
            streamer_.join();
        }
    }

    void streamLoop() {
        const auto interval = std::chrono::milliseconds(profile_.frame_interval_ms);
        int64_t device_ms = 0;
        uint32_t tick = 0;
        std::unique_lock<std::mutex> lock(stream_mutex_);
        while (!stream_cv_.wait_for(lock, interval, [this] { return stream_stop_; })) {
            lock.unlock();
            SensorFrame frame;
            frame.device_time_ms = device_ms;
            double wobble = profile_.noise_amplitude * std::sin(0.37 * (double)tick);
            frame.v1 = profile_.base_value * 0.25 + wobble;
            frame.v2 = profile_.base_value * 0.50 + wobble;
            frame.v3 = profile_.base_value + wobble;
            frame.v4 = profile_.base_value * 0.75 + wobble;
            deliver(formatSensorFrame(frame));
            device_ms += profile_.frame_interval_ms;
            tick++;
            lock.lock();
        }
    }
};

SimulatedTransport::SimulatedTransport() {}

SimulatedTransport::~SimulatedTransport() {}

void SimulatedTransport::addDevice(const DeviceProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[profile.address] = profile;
}

void SimulatedTransport::setOpenFailure(const std::string& address, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it != devices_.end()) it->second.fail_open = fail;
}

std::shared_ptr<SimulatedTransport::Link> SimulatedTransport::currentLink(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(address);
    if (it == links_.end()) return nullptr;
    return it->second.lock();
}

bool SimulatedTransport::injectFrame(const std::string& address, const std::string& payload) {
    std::shared_ptr<Link> link = currentLink(address);
    if (!link || !link->isConnected()) return false;
    link->deliver(payload);
    return true;
}

bool SimulatedTransport::dropLink(const std::string& address) {
    std::shared_ptr<Link> link = currentLink(address);
    if (!link || !link->isConnected()) return false;
    Logger::info("[SimBLE] Dropping link to %s", address.c_str());
    link->drop();
    return true;
}

bool SimulatedTransport::isLinkOpen(const std::string& address) const {
    std::shared_ptr<Link> link = currentLink(address);
    return link && link->isConnected();
}

size_t SimulatedTransport::openCount(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_counts_.find(address);
    return it == open_counts_.end() ? 0 : it->second;
}

size_t SimulatedTransport::subscriberCount(const std::string& address) const {
    std::shared_ptr<Link> link = currentLink(address);
    return link ? link->subscriberCount() : 0;
}

std::vector<DeviceIdentity> SimulatedTransport::scan(double timeout_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceIdentity> found;
    for (const auto& entry : devices_) {
        found.push_back(DeviceIdentity{entry.second.address, entry.second.name});
    }
    Logger::debug("[SimBLE] Scan (%.1f s) found %u devices", timeout_s, (unsigned)found.size());
    return found;
}

std::shared_ptr<SensorLink> SimulatedTransport::open(const std::string& address, double timeout_s,
                                                     LinkLostHandler on_link_lost) {
    DeviceProfile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(address);
        if (it == devices_.end()) {
            throw TransportException("Device " + address + " not found within " +
                                     std::to_string(timeout_s) + " s", ERR_TRANSPORT_TIMEOUT);
        }
        profile = it->second;
        open_counts_[address]++;
    }
    if (profile.fail_open) {
        throw TransportException("Connection to " + address + " refused");
    }

    auto link = std::make_shared<Link>(profile, !profile.open_not_connected, std::move(on_link_lost));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        links_[address] = link;
    }
    return link;
}
