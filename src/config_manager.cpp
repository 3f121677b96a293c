#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(const char* config_file) {
    initializeDefaults();
    if (config_file == nullptr) return;

    std::ifstream probe(config_file);
    if (!probe.good()) {
        Logger::info("[Config] No config file at %s, using defaults", config_file);
        return;
    }
    probe.close();
    if (!loadFromFile(config_file)) {
        Logger::error("[Config] Failed to load %s, using defaults", config_file);
    }
}

void ConfigManager::initializeDefaults() {
    logging_config_.log_level = "INFO";
    logging_config_.log_file = "";
    logging_config_.flush_on_write = true;

    transport_config_.name_filter = "force";
    transport_config_.scan_timeout_s = 6.0;
    transport_config_.connect_timeout_s = 20.0;
    transport_config_.notify_channel = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";  // NUS TX

    calibration_config_.table_path = "calibrationWeight/V3_calibration.csv";
    calibration_config_.method = "piecewise";
    calibration_config_.allow_extrapolation = true;

    acquisition_config_.baseline_window_ms = 5000;
    acquisition_config_.despike_window = 11;
    acquisition_config_.despike_n_sigmas = 5.0;
    acquisition_config_.readings_dir = "readings";
    acquisition_config_.save_prompt_timeout_ms = 60000;
}

ConfigManager::~ConfigManager() {}

LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
TransportConfig ConfigManager::getTransportConfig() const { return transport_config_; }
CalibrationConfig ConfigManager::getCalibrationConfig() const { return calibration_config_; }
AcquisitionConfig ConfigManager::getAcquisitionConfig() const { return acquisition_config_; }

void ConfigManager::setAcquisitionConfig(const AcquisitionConfig& cfg) { acquisition_config_ = cfg; }
void ConfigManager::setCalibrationConfig(const CalibrationConfig& cfg) { calibration_config_ = cfg; }
void ConfigManager::setTransportConfig(const TransportConfig& cfg) { transport_config_ = cfg; }

bool ConfigManager::loadFromFile(const char* config_file) {
    std::ifstream in(config_file);
    if (!in) {
        Logger::error("[Config] Failed to open %s for reading", config_file);
        return false;
    }
    std::stringstream content;
    content << in.rdbuf();
    Logger::info("[Config] Loading %s", config_file);
    return loadFromString(content.str());
}

bool ConfigManager::loadFromString(const std::string& json) {
    DynamicJsonDocument doc(4096);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        Logger::error("[Config] JSON parse error: %s", error.c_str());
        return false;
    }

    bool all_valid = true;
    std::string reason;

    JsonObjectConst logging = doc["logging"].as<JsonObjectConst>();
    if (!logging.isNull()) {
        if (logging.containsKey("log_level")) {
            std::string level = logging["log_level"].as<std::string>();
            if (validateLogLevel(level, reason)) {
                logging_config_.log_level = level;
            } else {
                Logger::error("[Config] logging.log_level rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (logging["log_file"].is<const char*>()) {
            logging_config_.log_file = logging["log_file"].as<std::string>();
        }
        if (logging["flush_on_write"].is<bool>()) {
            logging_config_.flush_on_write = logging["flush_on_write"].as<bool>();
        }
    }

    JsonObjectConst transport = doc["transport"].as<JsonObjectConst>();
    if (!transport.isNull()) {
        if (transport["name_filter"].is<const char*>()) {
            transport_config_.name_filter = transport["name_filter"].as<std::string>();
        }
        if (transport.containsKey("scan_timeout_s")) {
            double v = transport["scan_timeout_s"].as<double>();
            if (validateTimeout(v, reason)) {
                transport_config_.scan_timeout_s = v;
            } else {
                Logger::error("[Config] transport.scan_timeout_s rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (transport.containsKey("connect_timeout_s")) {
            double v = transport["connect_timeout_s"].as<double>();
            if (validateTimeout(v, reason)) {
                transport_config_.connect_timeout_s = v;
            } else {
                Logger::error("[Config] transport.connect_timeout_s rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (transport.containsKey("notify_channel")) {
            std::string channel = transport["notify_channel"].as<std::string>();
            if (!channel.empty()) {
                transport_config_.notify_channel = channel;
            } else {
                Logger::error("[Config] transport.notify_channel rejected: empty");
                all_valid = false;
            }
        }
    }

    JsonObjectConst calibration = doc["calibration"].as<JsonObjectConst>();
    if (!calibration.isNull()) {
        if (calibration["table_path"].is<const char*>()) {
            calibration_config_.table_path = calibration["table_path"].as<std::string>();
        }
        if (calibration.containsKey("method")) {
            std::string method = calibration["method"].as<std::string>();
            if (validateCalibrationMethod(method, reason)) {
                calibration_config_.method = method;
            } else {
                Logger::error("[Config] calibration.method rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (calibration["allow_extrapolation"].is<bool>()) {
            calibration_config_.allow_extrapolation = calibration["allow_extrapolation"].as<bool>();
        }
    }

    JsonObjectConst acquisition = doc["acquisition"].as<JsonObjectConst>();
    if (!acquisition.isNull()) {
        if (acquisition.containsKey("baseline_window_ms")) {
            long v = acquisition["baseline_window_ms"].as<long>();
            if (v > 0 && validateBaselineWindow((uint32_t)v, reason)) {
                acquisition_config_.baseline_window_ms = (uint32_t)v;
            } else {
                if (v <= 0) reason = "Baseline window must be positive";
                Logger::error("[Config] acquisition.baseline_window_ms rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (acquisition.containsKey("despike_window")) {
            long v = acquisition["despike_window"].as<long>();
            if (v > 0 && validateDespikeWindow((uint32_t)v, reason)) {
                acquisition_config_.despike_window = (uint32_t)v;
            } else {
                if (v <= 0) reason = "Despike window must be positive";
                Logger::error("[Config] acquisition.despike_window rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (acquisition.containsKey("despike_n_sigmas")) {
            double v = acquisition["despike_n_sigmas"].as<double>();
            if (validateDespikeSigmas(v, reason)) {
                acquisition_config_.despike_n_sigmas = v;
            } else {
                Logger::error("[Config] acquisition.despike_n_sigmas rejected: %s", reason.c_str());
                all_valid = false;
            }
        }
        if (acquisition.containsKey("readings_dir")) {
            std::string dir = acquisition["readings_dir"].as<std::string>();
            if (!dir.empty()) {
                acquisition_config_.readings_dir = dir;
            } else {
                Logger::error("[Config] acquisition.readings_dir rejected: empty");
                all_valid = false;
            }
        }
        if (acquisition.containsKey("save_prompt_timeout_ms")) {
            long v = acquisition["save_prompt_timeout_ms"].as<long>();
            if (v >= 0) {
                acquisition_config_.save_prompt_timeout_ms = (uint32_t)v;
            } else {
                Logger::error("[Config] acquisition.save_prompt_timeout_ms rejected: negative");
                all_valid = false;
            }
        }
    }

    Logger::debug("[Config] method=%s baseline=%u ms despike=%u/%.2f readings=%s",
                  calibration_config_.method.c_str(),
                  acquisition_config_.baseline_window_ms,
                  acquisition_config_.despike_window,
                  acquisition_config_.despike_n_sigmas,
                  acquisition_config_.readings_dir.c_str());
    return all_valid;
}

bool ConfigManager::validateLogLevel(const std::string& level, std::string& reason) const {
    if (level == "DEBUG" || level == "INFO" || level == "WARN" || level == "ERROR") return true;
    reason = "Unknown log level: " + level + " (expected DEBUG, INFO, WARN or ERROR)";
    return false;
}

bool ConfigManager::validateTimeout(double seconds, std::string& reason) const {
    if (seconds > 0.0) return true;
    reason = "Timeout must be positive (got " + std::to_string(seconds) + " s)";
    return false;
}

bool ConfigManager::validateBaselineWindow(uint32_t window_ms, std::string& reason) const {
    if (window_ms < 1) {
        reason = "Baseline window too low (min: 1 ms)";
        return false;
    }
    if (window_ms > 60000) {
        reason = "Baseline window too high (max: 60000 ms)";
        return false;
    }
    return true;
}

bool ConfigManager::validateDespikeWindow(uint32_t window, std::string& reason) const {
    if (window < 3) {
        reason = "Despike window too small (min: 3)";
        return false;
    }
    if (window % 2 == 0) {
        reason = "Despike window must be odd (got " + std::to_string(window) + ")";
        return false;
    }
    return true;
}

bool ConfigManager::validateDespikeSigmas(double n_sigmas, std::string& reason) const {
    if (n_sigmas > 0.0) return true;
    reason = "Despike threshold must be positive (got " + std::to_string(n_sigmas) + ")";
    return false;
}

bool ConfigManager::validateCalibrationMethod(const std::string& method, std::string& reason) const {
    if (method == "piecewise" || method == "linear_fit") return true;
    reason = "Unknown calibration method: " + method + " (expected piecewise or linear_fit)";
    return false;
}
