#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/force_calibrator.hpp"
#include "../include/logger.hpp"
#include "../include/session_recorder.hpp"
#include "../include/session_registry.hpp"
#include "../include/simulated_transport.hpp"

namespace {

struct PendingPrompt {
    std::string device_id;
    std::string device_name;
    std::shared_ptr<std::promise<bool>> answer;
};

std::mutex prompt_mutex;
std::deque<PendingPrompt> pending_prompts;

// Directory of devices seen by SCAN, so CONNECT can pass the advertised name
std::map<std::string, DeviceIdentity> known_devices;
std::map<std::string, SessionMeta> started_meta;

std::future<bool> askToSave(const std::string& device_id, const std::string& device_name) {
    PendingPrompt prompt;
    prompt.device_id = device_id;
    prompt.device_name = device_name;
    prompt.answer = std::make_shared<std::promise<bool>>();
    std::future<bool> result = prompt.answer->get_future();
    {
        std::lock_guard<std::mutex> lock(prompt_mutex);
        pending_prompts.push_back(prompt);
    }
    printf("\n[PROMPT] %s (%s) disconnected during a reading. Save the partial data? [Y/N]\n",
           device_name.c_str(), device_id.c_str());
    fflush(stdout);
    return result;
}

bool answerPrompt(const std::string& word) {
    std::lock_guard<std::mutex> lock(prompt_mutex);
    if (pending_prompts.empty()) return false;
    bool yes = word == "Y" || word == "YES";
    bool no = word == "N" || word == "NO";
    if (!yes && !no) return false;
    PendingPrompt prompt = pending_prompts.front();
    pending_prompts.pop_front();
    prompt.answer->set_value(yes);
    printf("[PROMPT] %s: %s\n", prompt.device_name.c_str(), yes ? "saving" : "discarding");
    return true;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool parseNumber(const std::string& text, double& out) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
}

DeviceIdentity identityFor(const std::string& address) {
    auto it = known_devices.find(address);
    if (it != known_devices.end()) return it->second;
    return DeviceIdentity{address, address};
}

void printHelp() {
    printf("\n========== AVAILABLE COMMANDS ==========\n");
    printf("SCAN [filter]                         - List sensors whose name contains filter\n");
    printf("CONNECT <addr...>                     - Connect and take the baseline\n");
    printf("DISCONNECT <addr...>                  - Disconnect without saving\n");
    printf("START <athlete> <dist_cm> <kg> [addr] - Start reading (all connected if no addr)\n");
    printf("STOP [addr...]                        - Stop reading and save\n");
    printf("STATUS                                - Show every session\n");
    printf("DROP <addr>                           - Simulate a lost link\n");
    printf("Y / N                                 - Answer a pending save prompt\n");
    printf("HELP or ?                             - Show this help menu\n");
    printf("QUIT                                  - Disconnect everything and exit\n");
    printf("=========================================\n\n");
}

void printResults(const char* action, const std::vector<BatchResult>& results) {
    for (const auto& r : results) {
        if (r.ok) {
            printf("[%s] %s: ok%s%s\n", action, r.address.c_str(),
                   r.artifact.empty() ? "" : " -> ", r.artifact.c_str());
        } else {
            printf("[%s] %s: FAILED (%s)\n", action, r.address.c_str(), r.error.c_str());
        }
    }
}

void printStatus(const SessionRegistry& registry) {
    std::vector<SessionStatus> all = registry.statuses();
    if (all.empty()) {
        printf("[STATUS] No sessions\n");
        return;
    }
    for (const auto& s : all) {
        printf("[STATUS] %-18s %-14s %-24s baseline=%.2f samples=%u%s\n",
               s.identity.address.c_str(), s.identity.name.c_str(), sessionStateName(s.state),
               s.baseline, (unsigned)s.buffered, s.link_error ? " LINK ERROR" : "");
        if (!s.last_artifact.empty()) {
            printf("[STATUS]   last file: %s\n", s.last_artifact.c_str());
        }
    }
}

void processCommand(const std::string& line, SessionRegistry& registry, SimulatedTransport& transport,
                    const TransportConfig& transport_cfg, bool& quit) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    cmd = upper(cmd);
    std::vector<std::string> args;
    std::string arg;
    while (in >> arg) args.push_back(arg);

    if (cmd.empty()) return;
    if (answerPrompt(cmd)) return;

    if (cmd == "HELP" || cmd == "?") {
        printHelp();
    }
    else if (cmd == "SCAN") {
        std::string filter = args.empty() ? transport_cfg.name_filter : args[0];
        std::vector<DeviceIdentity> found = registry.scanDevices(filter, transport_cfg.scan_timeout_s).get();
        for (const auto& device : found) {
            known_devices[device.address] = device;
            printf("[SCAN] %s  %s\n", device.address.c_str(), device.name.c_str());
        }
        if (found.empty()) printf("[SCAN] No devices matching '%s'\n", filter.c_str());
    }
    else if (cmd == "CONNECT") {
        if (args.empty()) {
            printf("[CMD] Use: CONNECT <addr...>\n");
            return;
        }
        std::vector<DeviceIdentity> devices;
        for (const auto& address : args) devices.push_back(identityFor(address));
        printResults("CONNECT", registry.connectMany(devices).get());
    }
    else if (cmd == "DISCONNECT") {
        std::vector<std::string> targets = args.empty() ? registry.connectedAddresses() : args;
        printResults("DISCONNECT", registry.disconnectMany(targets).get());
    }
    else if (cmd == "START") {
        if (args.size() < 3) {
            printf("[CMD] Use: START <athlete> <distance_cm> <weight_kg> [addr...]\n");
            return;
        }
        SessionMeta meta;
        meta.athlete_id = args[0];
        if (!parseNumber(args[1], meta.distance_cm) || !parseNumber(args[2], meta.weight_kg)) {
            printf("[START] Distance and weight must be numbers\n");
            return;
        }
        std::string reason;
        if (!SessionRecorder::validateMeta(meta, reason)) {
            printf("[START] %s\n", reason.c_str());
            return;
        }
        std::vector<std::string> targets(args.begin() + 3, args.end());
        if (targets.empty()) targets = registry.connectedAddresses();
        if (targets.empty()) {
            printf("[START] No connected devices\n");
            return;
        }
        std::vector<BatchResult> results = registry.startMany(targets, meta).get();
        for (const auto& r : results) {
            if (r.ok) started_meta[r.address] = meta;
        }
        printResults("START", results);
    }
    else if (cmd == "STOP") {
        std::vector<std::string> targets = args;
        if (targets.empty()) {
            for (const auto& s : registry.statuses()) {
                if (s.reading) targets.push_back(s.identity.address);
            }
        }
        // Each file is labelled with what START was given for that device
        std::vector<BatchResult> results;
        for (const auto& address : targets) {
            BatchResult r;
            r.address = address;
            try {
                r.artifact = registry.stopReading(address, started_meta[address]).get();
                r.ok = true;
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            started_meta.erase(address);
            results.push_back(r);
        }
        printResults("STOP", results);
    }
    else if (cmd == "STATUS") {
        printStatus(registry);
    }
    else if (cmd == "DROP") {
        if (args.empty()) {
            printf("[CMD] Use: DROP <addr>\n");
            return;
        }
        if (!transport.dropLink(args[0])) printf("[DROP] %s has no open link\n", args[0].c_str());
    }
    else if (cmd == "QUIT" || cmd == "EXIT") {
        quit = true;
    }
    else {
        printf("[CMD] Unknown command: %s (type HELP for commands)\n", cmd.c_str());
    }
}

} // namespace

int main(int argc, char** argv) {
    const char* config_path = ConfigManager::DEFAULT_CONFIG_FILE;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            fprintf(stderr, "Usage: %s [--config <path>]\n", argv[0]);
            return 2;
        }
    }

    ConfigManager config(config_path);
    Logger::begin(config.getLoggingConfig());
    TransportConfig transport_cfg = config.getTransportConfig();

    SimulatedTransport transport;
    SimulatedTransport::DeviceProfile sensor_a;
    sensor_a.address = "D4:36:39:6F:A1:01";
    sensor_a.name = "ForceSensor-A";
    sensor_a.base_value = 20000.0;
    sensor_a.frame_interval_ms = 20;
    transport.addDevice(sensor_a);
    SimulatedTransport::DeviceProfile sensor_b;
    sensor_b.address = "D4:36:39:6F:A1:02";
    sensor_b.name = "ForceSensor-B";
    sensor_b.base_value = 21500.0;
    sensor_b.frame_interval_ms = 20;
    transport.addDevice(sensor_b);

    SessionCallbacks callbacks;
    callbacks.confirm_save = askToSave;

    std::unique_ptr<SessionRegistry> registry;
    try {
        CalibrationTable table = ForceCalibrator::loadTable(config.getCalibrationConfig().table_path);
        registry.reset(new SessionRegistry(transport, config, table, callbacks));
    } catch (const CalibrationException& e) {
        Logger::error("Calibration table unusable: %s", e.what());
        Logger::shutdown();
        return 1;
    }

    Logger::info("GripSense console ready");
    printHelp();

    bool quit = false;
    std::string line;
    while (!quit && std::getline(std::cin, line)) {
        try {
            processCommand(line, *registry, transport, transport_cfg, quit);
        } catch (const std::exception& e) {
            printf("[CMD] Failed: %s\n", e.what());
        }
    }

    Logger::info("Shutting down");
    registry->clear();
    {
        // Unblock any recovery still waiting on an answer
        std::lock_guard<std::mutex> lock(prompt_mutex);
        for (auto& prompt : pending_prompts) prompt.answer->set_value(true);
        pending_prompts.clear();
    }
    registry.reset();
    Logger::shutdown();
    return 0;
}
