#pragma once
#include <stdint.h>
#include <string>

struct LoggingConfig {
    std::string log_level;
    std::string log_file;
    bool flush_on_write;
};

struct TransportConfig {
    std::string name_filter;
    double scan_timeout_s;
    double connect_timeout_s;
    std::string notify_channel;
};

struct CalibrationConfig {
    std::string table_path;
    std::string method;
    bool allow_extrapolation;
};

struct AcquisitionConfig {
    uint32_t baseline_window_ms;
    uint32_t despike_window;
    double despike_n_sigmas;
    std::string readings_dir;
    uint32_t save_prompt_timeout_ms;
};

class ConfigManager {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "config/gripsense.json";

    // nullptr: built-in defaults only
    ConfigManager(const char* config_file = nullptr);
    ~ConfigManager();

    LoggingConfig getLoggingConfig() const;
    TransportConfig getTransportConfig() const;
    CalibrationConfig getCalibrationConfig() const;
    AcquisitionConfig getAcquisitionConfig() const;

    void setAcquisitionConfig(const AcquisitionConfig& cfg);
    void setCalibrationConfig(const CalibrationConfig& cfg);
    void setTransportConfig(const TransportConfig& cfg);

    // Overlays a JSON document on the current values; invalid entries keep their old value
    bool loadFromFile(const char* config_file);
    bool loadFromString(const std::string& json);

    bool validateLogLevel(const std::string& level, std::string& reason) const;
    bool validateTimeout(double seconds, std::string& reason) const;
    bool validateBaselineWindow(uint32_t window_ms, std::string& reason) const;
    bool validateDespikeWindow(uint32_t window, std::string& reason) const;
    bool validateDespikeSigmas(double n_sigmas, std::string& reason) const;
    bool validateCalibrationMethod(const std::string& method, std::string& reason) const;

private:
    LoggingConfig logging_config_;
    TransportConfig transport_config_;
    CalibrationConfig calibration_config_;
    AcquisitionConfig acquisition_config_;

    void initializeDefaults();
};
