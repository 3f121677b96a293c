/**
 * Configuration test program
 */

#include "test_common.hpp"
#include "../include/config_manager.hpp"
#include "../include/logger.hpp"

bool test_defaults() {
    printTestHeader("TEST 1: Built-in Defaults");
    ConfigManager config;
    LoggingConfig logging = config.getLoggingConfig();
    TransportConfig transport = config.getTransportConfig();
    CalibrationConfig calibration = config.getCalibrationConfig();
    AcquisitionConfig acquisition = config.getAcquisitionConfig();

    bool ok = logging.log_level == "INFO" && logging.log_file.empty() && logging.flush_on_write;
    ok &= transport.name_filter == "force";
    ok &= transport.scan_timeout_s == 6.0 && transport.connect_timeout_s == 20.0;
    ok &= transport.notify_channel == "6e400003-b5a3-f393-e0a9-e50e24dcca9e";
    ok &= calibration.table_path == "calibrationWeight/V3_calibration.csv";
    ok &= calibration.method == "piecewise" && calibration.allow_extrapolation;
    ok &= acquisition.baseline_window_ms == 5000;
    ok &= acquisition.despike_window == 11 && acquisition.despike_n_sigmas == 5.0;
    ok &= acquisition.readings_dir == "readings";
    ok &= acquisition.save_prompt_timeout_ms == 60000;
    return ok;
}

bool test_missing_file() {
    printTestHeader("TEST 2: Missing File Means Defaults");
    ConfigManager config("/nonexistent/gripsense.json");
    return config.getAcquisitionConfig().baseline_window_ms == 5000 &&
           config.getCalibrationConfig().method == "piecewise";
}

bool test_file_overrides() {
    printTestHeader("TEST 3: File Overrides Defaults");
    std::string dir = makeTempDir("config");
    std::string path = dir + "/gripsense.json";
    writeTextFile(path, R"({
        "logging": { "log_level": "DEBUG", "flush_on_write": false },
        "transport": { "name_filter": "grip", "connect_timeout_s": 7.5 },
        "calibration": { "method": "linear_fit", "allow_extrapolation": false,
                         "table_path": "tables/v3.csv" },
        "acquisition": { "baseline_window_ms": 250, "despike_window": 7,
                         "despike_n_sigmas": 3.5, "readings_dir": "out",
                         "save_prompt_timeout_ms": 0 }
    })");

    ConfigManager config(path.c_str());
    bool ok = config.getLoggingConfig().log_level == "DEBUG";
    ok &= !config.getLoggingConfig().flush_on_write;
    ok &= config.getTransportConfig().name_filter == "grip";
    ok &= config.getTransportConfig().connect_timeout_s == 7.5;
    ok &= config.getTransportConfig().scan_timeout_s == 6.0;
    ok &= config.getCalibrationConfig().method == "linear_fit";
    ok &= !config.getCalibrationConfig().allow_extrapolation;
    ok &= config.getCalibrationConfig().table_path == "tables/v3.csv";
    AcquisitionConfig acquisition = config.getAcquisitionConfig();
    ok &= acquisition.baseline_window_ms == 250;
    ok &= acquisition.despike_window == 7;
    ok &= acquisition.despike_n_sigmas == 3.5;
    ok &= acquisition.readings_dir == "out";
    ok &= acquisition.save_prompt_timeout_ms == 0;
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_invalid_values_rejected() {
    printTestHeader("TEST 4: Invalid Values Keep Defaults");
    ConfigManager config;
    bool loaded = config.loadFromString(R"({
        "logging": { "log_level": "VERBOSE" },
        "transport": { "scan_timeout_s": -1 },
        "calibration": { "method": "spline" },
        "acquisition": { "baseline_window_ms": 120000, "despike_window": 8,
                         "despike_n_sigmas": 0, "readings_dir": "" }
    })");

    bool ok = !loaded;
    ok &= config.getLoggingConfig().log_level == "INFO";
    ok &= config.getTransportConfig().scan_timeout_s == 6.0;
    ok &= config.getCalibrationConfig().method == "piecewise";
    ok &= config.getAcquisitionConfig().baseline_window_ms == 5000;
    ok &= config.getAcquisitionConfig().despike_window == 11;
    ok &= config.getAcquisitionConfig().despike_n_sigmas == 5.0;
    ok &= config.getAcquisitionConfig().readings_dir == "readings";

    ok &= !config.loadFromString("{ not json");
    return ok;
}

bool test_validators() {
    printTestHeader("TEST 5: Validators Explain Rejections");
    ConfigManager config;
    std::string reason;
    bool ok = config.validateDespikeWindow(11, reason);
    ok &= !config.validateDespikeWindow(10, reason) && reason.find("odd") != std::string::npos;
    ok &= !config.validateDespikeWindow(1, reason) && !reason.empty();
    ok &= config.validateBaselineWindow(1, reason) && config.validateBaselineWindow(60000, reason);
    ok &= !config.validateBaselineWindow(60001, reason) && reason.find("max") != std::string::npos;
    ok &= !config.validateTimeout(0.0, reason);
    ok &= config.validateCalibrationMethod("linear_fit", reason);
    ok &= !config.validateCalibrationMethod("Piecewise", reason);
    ok &= config.validateLogLevel("WARN", reason) && !config.validateLogLevel("warn", reason);
    ok &= !config.validateDespikeSigmas(-2.0, reason);
    printf("  last reason: %s\n", reason.c_str());

    ok &= Logger::parseLevel("ERROR") == Logger::ERROR;
    ok &= Logger::parseLevel("bogus", Logger::WARN) == Logger::WARN;
    return ok;
}

int main() {
    Logger::setLevel(Logger::ERROR);

    printTestResult("Defaults", test_defaults());
    printTestResult("Missing file", test_missing_file());
    printTestResult("File overrides", test_file_overrides());
    printTestResult("Invalid values rejected", test_invalid_values_rejected());
    printTestResult("Validators", test_validators());
    return printSummary("test_config");
}
