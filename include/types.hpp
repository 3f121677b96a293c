#pragma once
#include <cstdint>
#include <string>

// Transport-level address plus the advertised name
struct DeviceIdentity {
    std::string address;
    std::string name;
};

struct CalibrationPoint {
    double force_n = 0.0;
    double raw_count = 0.0;
};

struct Sample {
    double host_time = 0.0;   // Unix seconds, captured on frame arrival
    double value = 0.0;
};

// Labels a capture; snapshotted at start/stop so a dropped link can still name it
struct SessionMeta {
    std::string athlete_id = "UNKNOWN";
    double distance_cm = 0.0;
    double weight_kg = 0.0;
};

// One decoded notification record: Time:<int>,V1:..,V2:..,V3:..,V4:..
struct SensorFrame {
    int64_t device_time_ms = 0;
    double v1 = 0.0;
    double v2 = 0.0;
    double v3 = 0.0;
    double v4 = 0.0;
};
