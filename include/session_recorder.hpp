#pragma once
#include <cstddef>
#include <ctime>
#include <string>
#include <vector>
#include "despike_filter.hpp"
#include "types.hpp"

// Raw and force samples, index-aligned: every append adds one of each
class SampleBuffer {
public:
    void append(double host_time, double raw, double force);
    void clear();
    size_t size() const;
    bool empty() const { return size() == 0; }
    const std::vector<Sample>& raw() const { return raw_; }
    const std::vector<Sample>& force() const { return force_; }
private:
    std::vector<Sample> raw_;
    std::vector<Sample> force_;
};

class SessionRecorder {
public:
    static constexpr const char* CSV_HEADER = "Host_Time_s,Raw_V3,Force_N,Raw_V3_Filtered";

    SessionRecorder(const std::string& base_dir = "readings", const DespikeConfig& despike = DespikeConfig());

    /**
     * @brief Write one capture as CSV.
     * @return Path of the written file, or an empty string when the buffer holds nothing
     * @throws PersistenceException when the directory or file cannot be written
     */
    std::string save(const SampleBuffer& buffer, const SessionMeta& meta) const;
    std::string save(const SampleBuffer& buffer, const SessionMeta& meta, std::time_t now) const;

    // Distance and weight must be finite and below this magnitude to label a file
    static constexpr double MAX_LABEL_VALUE = 1e9;
    static bool validateMeta(const SessionMeta& meta, std::string& reason);

    // <base>/<YYYY-MM-DD>[_<athlete>]/<unix>_<distance>cm_<weight>kg_grip_data.csv
    // Throws PersistenceException when the meta fails validateMeta()
    static std::string artifactPath(const std::string& base_dir, const SessionMeta& meta, std::time_t now);

    const std::string& baseDir() const { return base_dir_; }

private:
    std::string base_dir_;
    DespikeFilter filter_;
};
