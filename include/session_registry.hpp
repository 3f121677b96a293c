#pragma once
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "device_session.hpp"
#include "session_recorder.hpp"
#include "session_worker.hpp"
#include "transport.hpp"

// Outcome of one device within a batch operation
struct BatchResult {
    std::string address;
    bool ok = false;
    std::string error;
    std::string artifact;   // stopMany only
};

/**
 * @brief Owns the device sessions and the worker that drives them.
 *
 * All operations are queued on the worker and answered through futures, so
 * they may be called from any thread except the worker itself. Batch
 * operations handle devices one after another; a failing device is reported
 * in its BatchResult and does not stop the rest.
 */
class SessionRegistry {
public:
    SessionRegistry(Transport& transport,
                    const ConfigManager& config,
                    CalibrationTable table,
                    const SessionCallbacks& callbacks = SessionCallbacks());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Devices whose name contains name_filter (case-insensitive), sorted by name
    std::future<std::vector<DeviceIdentity>> scanDevices(const std::string& name_filter, double timeout_s);

    std::future<bool> connect(const DeviceIdentity& device);
    std::future<bool> disconnect(const std::string& address);
    std::future<bool> startReading(const std::string& address, const SessionMeta& meta);
    // Artifact path or empty; PersistenceException surfaces through the future
    std::future<std::string> stopReading(const std::string& address, const SessionMeta& meta);

    std::future<std::vector<BatchResult>> connectMany(const std::vector<DeviceIdentity>& devices);
    std::future<std::vector<BatchResult>> disconnectMany(const std::vector<std::string>& addresses);
    std::future<std::vector<BatchResult>> startMany(const std::vector<std::string>& addresses, const SessionMeta& meta);
    std::future<std::vector<BatchResult>> stopMany(const std::vector<std::string>& addresses, const SessionMeta& meta);

    // Best effort; failures are logged, never raised
    std::future<void> disconnectAll();
    std::future<bool> removeDevice(const std::string& address);
    // Disconnects everything and forgets all sessions; blocks until done
    void clear();

    bool hasSession(const std::string& address) const;
    bool status(const std::string& address, SessionStatus& out) const;
    std::vector<SessionStatus> statuses() const;
    std::vector<std::string> connectedAddresses() const;

    const SessionSettings& settings() const { return settings_; }
    SessionWorker& worker() { return worker_; }

private:
    struct ConnectBatch {
        std::vector<DeviceIdentity> devices;
        std::vector<BatchResult> results;
        std::promise<std::vector<BatchResult>> done;
    };

    Transport& transport_;
    SessionSettings settings_;
    SessionRecorder recorder_;
    CalibrationTable table_;
    SessionCallbacks callbacks_;
    SessionWorker worker_;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::unique_ptr<DeviceSession>> sessions_;

    DeviceSession* findSession(const std::string& address) const;
    DeviceSession& obtainSession(const DeviceIdentity& device);
    void connectNext(std::shared_ptr<ConnectBatch> batch, size_t index);
};
