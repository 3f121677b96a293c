#include "../include/session_recorder.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

void SampleBuffer::append(double host_time, double raw, double force) {
    raw_.push_back(Sample{host_time, raw});
    force_.push_back(Sample{host_time, force});
}

void SampleBuffer::clear() {
    raw_.clear();
    force_.clear();
}

size_t SampleBuffer::size() const {
    return std::min(raw_.size(), force_.size());
}

SessionRecorder::SessionRecorder(const std::string& base_dir, const DespikeConfig& despike)
    : base_dir_(base_dir), filter_(despike) {}

static std::string trimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool SessionRecorder::validateMeta(const SessionMeta& meta, std::string& reason) {
    if (!std::isfinite(meta.distance_cm) || std::fabs(meta.distance_cm) >= MAX_LABEL_VALUE) {
        reason = "distance_cm must be a finite number below 1e9";
        return false;
    }
    if (!std::isfinite(meta.weight_kg) || std::fabs(meta.weight_kg) >= MAX_LABEL_VALUE) {
        reason = "weight_kg must be a finite number below 1e9";
        return false;
    }
    return true;
}

std::string SessionRecorder::artifactPath(const std::string& base_dir, const SessionMeta& meta, std::time_t now) {
    std::string reason;
    if (!validateMeta(meta, reason)) {
        throw PersistenceException("Invalid capture label: " + reason);
    }

    std::tm local_tm;
    localtime_r(&now, &local_tm);
    char date_buf[16];
    strftime(date_buf, sizeof(date_buf), "%Y-%m-%d", &local_tm);

    std::string athlete = trimmed(meta.athlete_id);
    // The athlete id becomes part of a directory name
    std::replace(athlete.begin(), athlete.end(), '/', '_');
    std::replace(athlete.begin(), athlete.end(), '\\', '_');

    std::string dir = base_dir + "/" + date_buf;
    if (!athlete.empty()) dir += "_" + athlete;

    char file_buf[96];
    snprintf(file_buf, sizeof(file_buf), "%lld_%lldcm_%lldkg_grip_data.csv",
             (long long)now, (long long)meta.distance_cm, (long long)meta.weight_kg);
    return dir + "/" + file_buf;
}

// Two devices stopped in the same second with the same labels get _1, _2, ... suffixes
static std::string uniquePath(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return path;
    const std::string ext = ".csv";
    std::string stem = path.substr(0, path.size() - ext.size());
    for (int n = 1;; ++n) {
        std::string candidate = stem + "_" + std::to_string(n) + ext;
        if (!std::filesystem::exists(candidate, ec)) return candidate;
    }
}

std::string SessionRecorder::save(const SampleBuffer& buffer, const SessionMeta& meta) const {
    return save(buffer, meta, std::time(nullptr));
}

std::string SessionRecorder::save(const SampleBuffer& buffer, const SessionMeta& meta, std::time_t now) const {
    const size_t count = buffer.size();
    if (count == 0) {
        Logger::info("[Recorder] No data to save.");
        return "";
    }

    std::string path = artifactPath(base_dir_, meta, now);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        throw PersistenceException("Cannot create directory for " + path + ": " + ec.message());
    }
    path = uniquePath(path);

    const std::vector<Sample>& raw = buffer.raw();
    const std::vector<Sample>& force = buffer.force();
    std::vector<double> raw_values;
    raw_values.reserve(count);
    for (size_t i = 0; i < count; ++i) raw_values.push_back(raw[i].value);
    std::vector<double> filtered = filter_.apply(raw_values);

    FILE* fh = fopen(path.c_str(), "w");
    if (!fh) {
        throw PersistenceException("Cannot open " + path + " for writing: " + strerror(errno));
    }
    bool ok = fprintf(fh, "%s\n", CSV_HEADER) > 0;
    for (size_t i = 0; ok && i < count; ++i) {
        ok = fprintf(fh, "%.6f,%.10g,%.10g,%.10g\n",
                     raw[i].host_time, raw[i].value, force[i].value, filtered[i]) > 0;
    }
    if (fclose(fh) != 0) ok = false;
    if (!ok) {
        throw PersistenceException("Write failed for " + path);
    }

    Logger::info("[Recorder] Saved %u samples to %s", (unsigned)count, path.c_str());
    return path;
}
