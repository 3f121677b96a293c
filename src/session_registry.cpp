#include "../include/session_registry.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

SessionRegistry::SessionRegistry(Transport& transport,
                                 const ConfigManager& config,
                                 CalibrationTable table,
                                 const SessionCallbacks& callbacks)
    : transport_(transport),
      recorder_(config.getAcquisitionConfig().readings_dir,
                DespikeConfig{config.getAcquisitionConfig().despike_window,
                              config.getAcquisitionConfig().despike_n_sigmas}),
      table_(std::move(table)),
      callbacks_(callbacks) {
    TransportConfig transport_cfg = config.getTransportConfig();
    CalibrationConfig calibration_cfg = config.getCalibrationConfig();
    AcquisitionConfig acquisition_cfg = config.getAcquisitionConfig();

    settings_.notify_channel = transport_cfg.notify_channel;
    settings_.connect_timeout_s = transport_cfg.connect_timeout_s;
    settings_.baseline_window_ms = acquisition_cfg.baseline_window_ms;
    settings_.save_prompt_timeout_ms = acquisition_cfg.save_prompt_timeout_ms;
    settings_.method = ForceCalibrator::parseMethod(calibration_cfg.method);
    settings_.allow_extrapolation = calibration_cfg.allow_extrapolation;

    if (!table_) {
        table_ = ForceCalibrator::loadTable(calibration_cfg.table_path);
    }
    Logger::info("[Registry] Ready: %u calibration points, method %s, readings in %s",
                 (unsigned)table_->size(), ForceCalibrator::methodName(settings_.method),
                 recorder_.baseDir().c_str());
}

SessionRegistry::~SessionRegistry() {
    try {
        clear();
    } catch (const std::exception& e) {
        Logger::error("[Registry] Shutdown failed: %s", e.what());
    }
    worker_.stop();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
}

DeviceSession* SessionRegistry::findSession(const std::string& address) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(address);
    return it == sessions_.end() ? nullptr : it->second.get();
}

DeviceSession& SessionRegistry::obtainSession(const DeviceIdentity& device) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(device.address);
    if (it != sessions_.end()) return *it->second;
    std::unique_ptr<DeviceSession> session(
        new DeviceSession(device, worker_, transport_, table_, settings_, recorder_, callbacks_));
    DeviceSession& ref = *session;
    sessions_[device.address] = std::move(session);
    Logger::debug("[Registry] Session created for %s (%s)", device.address.c_str(), device.name.c_str());
    return ref;
}

std::future<std::vector<DeviceIdentity>> SessionRegistry::scanDevices(const std::string& name_filter,
                                                                      double timeout_s) {
    return worker_.submit([this, name_filter, timeout_s]() {
        Logger::info("[Registry] Scanning for %.1f s", timeout_s);
        std::vector<DeviceIdentity> found = transport_.scan(timeout_s);
        std::string needle = toLower(name_filter);
        std::vector<DeviceIdentity> matches;
        for (const auto& device : found) {
            if (toLower(device.name).find(needle) != std::string::npos) {
                matches.push_back(device);
            }
        }
        std::sort(matches.begin(), matches.end(), [](const DeviceIdentity& a, const DeviceIdentity& b) {
            return toLower(a.name) < toLower(b.name);
        });
        Logger::info("[Registry] Found %u matching devices", (unsigned)matches.size());
        return matches;
    });
}

std::future<bool> SessionRegistry::connect(const DeviceIdentity& device) {
    auto promise = std::make_shared<std::promise<bool>>();
    std::future<bool> result = promise->get_future();
    worker_.post([this, device, promise]() {
        try {
            obtainSession(device).connect([promise](bool ok) { promise->set_value(ok); });
        } catch (const std::exception& e) {
            Logger::error("[Registry] Connect %s failed: %s", device.address.c_str(), e.what());
            promise->set_exception(std::current_exception());
        }
    });
    return result;
}

std::future<bool> SessionRegistry::disconnect(const std::string& address) {
    return worker_.submit([this, address]() {
        DeviceSession* session = findSession(address);
        return session ? session->disconnect() : true;
    });
}

std::future<bool> SessionRegistry::startReading(const std::string& address, const SessionMeta& meta) {
    return worker_.submit([this, address, meta]() {
        DeviceSession* session = findSession(address);
        if (!session) {
            Logger::warn("[Registry] Start reading: unknown device %s", address.c_str());
            return false;
        }
        return session->startReading(meta);
    });
}

std::future<std::string> SessionRegistry::stopReading(const std::string& address, const SessionMeta& meta) {
    return worker_.submit([this, address, meta]() {
        DeviceSession* session = findSession(address);
        if (!session) return std::string();
        return session->stopReading(meta);
    });
}

std::future<std::vector<BatchResult>> SessionRegistry::connectMany(const std::vector<DeviceIdentity>& devices) {
    auto batch = std::make_shared<ConnectBatch>();
    batch->devices = devices;
    std::future<std::vector<BatchResult>> result = batch->done.get_future();
    worker_.post([this, batch]() { connectNext(batch, 0); });
    return result;
}

void SessionRegistry::connectNext(std::shared_ptr<ConnectBatch> batch, size_t index) {
    if (index >= batch->devices.size()) {
        batch->done.set_value(batch->results);
        return;
    }
    const DeviceIdentity& device = batch->devices[index];
    try {
        obtainSession(device).connect([this, batch, index](bool ok) {
            BatchResult r;
            r.address = batch->devices[index].address;
            r.ok = ok;
            if (!ok) r.error = "connect failed";
            batch->results.push_back(r);
            // Next device only once this one has settled
            worker_.post([this, batch, index]() { connectNext(batch, index + 1); });
        });
    } catch (const std::exception& e) {
        Logger::error("[Registry] Connect %s failed: %s", device.address.c_str(), e.what());
        BatchResult r;
        r.address = device.address;
        r.error = e.what();
        batch->results.push_back(r);
        worker_.post([this, batch, index]() { connectNext(batch, index + 1); });
    }
}

std::future<std::vector<BatchResult>> SessionRegistry::disconnectMany(const std::vector<std::string>& addresses) {
    return worker_.submit([this, addresses]() {
        std::vector<BatchResult> results;
        for (const auto& address : addresses) {
            BatchResult r;
            r.address = address;
            try {
                DeviceSession* session = findSession(address);
                r.ok = session ? session->disconnect() : true;
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            results.push_back(r);
        }
        return results;
    });
}

std::future<std::vector<BatchResult>> SessionRegistry::startMany(const std::vector<std::string>& addresses,
                                                                 const SessionMeta& meta) {
    return worker_.submit([this, addresses, meta]() {
        std::vector<BatchResult> results;
        for (const auto& address : addresses) {
            BatchResult r;
            r.address = address;
            try {
                DeviceSession* session = findSession(address);
                r.ok = session && session->startReading(meta);
                if (!r.ok) r.error = session ? "not armed" : "unknown device";
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            results.push_back(r);
        }
        return results;
    });
}

std::future<std::vector<BatchResult>> SessionRegistry::stopMany(const std::vector<std::string>& addresses,
                                                                const SessionMeta& meta) {
    return worker_.submit([this, addresses, meta]() {
        std::vector<BatchResult> results;
        for (const auto& address : addresses) {
            BatchResult r;
            r.address = address;
            try {
                DeviceSession* session = findSession(address);
                if (session) {
                    r.artifact = session->stopReading(meta);
                    r.ok = true;
                } else {
                    r.error = "unknown device";
                }
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            results.push_back(r);
        }
        return results;
    });
}

std::future<void> SessionRegistry::disconnectAll() {
    return worker_.submit([this]() {
        std::vector<DeviceSession*> targets;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (auto& entry : sessions_) targets.push_back(entry.second.get());
        }
        for (DeviceSession* session : targets) {
            try {
                session->disconnect();
            } catch (const std::exception& e) {
                Logger::warn("[Registry] Disconnect %s failed: %s", session->identity().address.c_str(), e.what());
            }
        }
    });
}

std::future<bool> SessionRegistry::removeDevice(const std::string& address) {
    return worker_.submit([this, address]() {
        DeviceSession* session = findSession(address);
        if (!session) return false;
        session->disconnect();
        std::unique_ptr<DeviceSession> removed;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(address);
            removed = std::move(it->second);
            sessions_.erase(it);
        }
        Logger::info("[Registry] Removed %s", address.c_str());
        return true;
    });
}

void SessionRegistry::clear() {
    if (worker_.isWorkerThread()) {
        throw std::logic_error("SessionRegistry::clear() called from the session worker");
    }
    disconnectAll().get();
    worker_.submit([this]() {
        std::map<std::string, std::unique_ptr<DeviceSession>> removed;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            removed.swap(sessions_);
        }
        if (!removed.empty()) {
            Logger::info("[Registry] Cleared %u sessions", (unsigned)removed.size());
        }
    }).get();
}

bool SessionRegistry::hasSession(const std::string& address) const {
    return findSession(address) != nullptr;
}

bool SessionRegistry::status(const std::string& address, SessionStatus& out) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(address);
    if (it == sessions_.end()) return false;
    out = it->second->status();
    return true;
}

std::vector<SessionStatus> SessionRegistry::statuses() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<SessionStatus> out;
    for (const auto& entry : sessions_) out.push_back(entry.second->status());
    return out;
}

std::vector<std::string> SessionRegistry::connectedAddresses() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> out;
    for (const auto& entry : sessions_) {
        if (entry.second->isConnected()) out.push_back(entry.second->identity().address);
    }
    return out;
}
