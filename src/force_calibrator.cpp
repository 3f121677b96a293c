#include "../include/force_calibrator.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

// Splits one CSV record; double-quoted fields may contain commas and "" escapes.
static std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

static bool parseNumber(const std::string& text, double& value) {
    size_t b = text.find_first_not_of(" \t");
    if (b == std::string::npos) return false;
    size_t e = text.find_last_not_of(" \t");
    std::string trimmed = text.substr(b, e - b + 1);
    const char* begin = trimmed.c_str();
    char* end = nullptr;
    errno = 0;
    double v = strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    if (!std::isfinite(v)) return false;
    value = v;
    return true;
}

ForceCalibrator::ForceCalibrator(const std::vector<CalibrationPoint>& points,
                                 CalibrationMethod method,
                                 bool allow_extrapolation)
    : points_(points), method_(method), allow_extrapolation_(allow_extrapolation) {
    if (points_.size() < 2) {
        throw CalibrationException("Need at least 2 calibration points, got " + std::to_string(points_.size()));
    }

    // Sorted by raw count so interpolation works even when Force_N is not monotonic
    std::stable_sort(points_.begin(), points_.end(),
                     [](const CalibrationPoint& a, const CalibrationPoint& b) {
                         return a.raw_count < b.raw_count;
                     });

    raw_.reserve(points_.size());
    force_.reserve(points_.size());
    for (const auto& p : points_) {
        raw_.push_back(p.raw_count);
        force_.push_back(p.force_n);
    }

    std::pair<double, double> fit = linearFit(raw_, force_);
    slope_ = fit.first;
    intercept_ = fit.second;
}

std::vector<CalibrationPoint> ForceCalibrator::loadPoints(const std::string& csv_path) {
    std::ifstream in(csv_path);
    if (!in) {
        throw CalibrationException("Cannot open calibration table: " + csv_path);
    }

    std::string line;
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        // Tolerate a UTF-8 byte order mark on the header
        if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
        header = splitCsvLine(line);
        break;
    }
    if (header.empty()) {
        throw CalibrationException("Calibration table has no header: " + csv_path);
    }

    auto force_it = std::find(header.begin(), header.end(), "Force_N");
    auto raw_it = std::find(header.begin(), header.end(), "V3_mean");
    if (force_it == header.end() || raw_it == header.end()) {
        throw CalibrationException("Calibration table must contain columns Force_N and V3_mean: " + csv_path);
    }
    size_t force_col = (size_t)(force_it - header.begin());
    size_t raw_col = (size_t)(raw_it - header.begin());

    std::vector<CalibrationPoint> points;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::vector<std::string> fields = splitCsvLine(line);
        CalibrationPoint p;
        if (force_col >= fields.size() || raw_col >= fields.size() ||
            !parseNumber(fields[force_col], p.force_n) ||
            !parseNumber(fields[raw_col], p.raw_count)) {
            skipped++;
            continue;
        }
        points.push_back(p);
    }

    if (skipped > 0) {
        Logger::warn("[Calib] Skipped %u unparsable rows in %s", (unsigned)skipped, csv_path.c_str());
    }
    if (points.size() < 2) {
        throw CalibrationException("Need at least 2 calibration points in " + csv_path +
                                   ", got " + std::to_string(points.size()));
    }
    Logger::info("[Calib] Loaded %u calibration points from %s", (unsigned)points.size(), csv_path.c_str());
    return points;
}

CalibrationTable ForceCalibrator::loadTable(const std::string& csv_path) {
    return std::make_shared<const std::vector<CalibrationPoint>>(loadPoints(csv_path));
}

CalibrationMethod ForceCalibrator::parseMethod(const std::string& name) {
    if (name == "piecewise") return CalibrationMethod::PIECEWISE;
    if (name == "linear_fit") return CalibrationMethod::LINEAR_FIT;
    throw CalibrationException("method must be 'piecewise' or 'linear_fit', got '" + name + "'");
}

const char* ForceCalibrator::methodName(CalibrationMethod method) {
    switch (method) {
        case CalibrationMethod::PIECEWISE: return "piecewise";
        case CalibrationMethod::LINEAR_FIT: return "linear_fit";
    }
    return "unknown";
}

std::pair<double, double> ForceCalibrator::linearFit(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n == 0) return std::make_pair(0.0, 0.0);

    double mean_x = 0.0, mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= (double)n;
    mean_y /= (double)n;

    double sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - mean_x;
        sxx += dx * dx;
        sxy += dx * (y[i] - mean_y);
    }
    if (sxx == 0.0) return std::make_pair(0.0, mean_y);

    double slope = sxy / sxx;
    return std::make_pair(slope, mean_y - slope * mean_x);
}

double ForceCalibrator::convert(double raw, double baseline) const {
    const double offset = baseline - raw_.front();
    if (method_ == CalibrationMethod::LINEAR_FIT) {
        // Equivalent to fitting the shifted table
        return slope_ * (raw - offset) + intercept_;
    }

    std::vector<double> shifted(raw_);
    for (double& r : shifted) r += offset;

    if (allow_extrapolation_) {
        const size_t last = shifted.size() - 1;
        if (raw <= shifted.front()) return extrapolate(raw, shifted, 0, 1);
        if (raw >= shifted.back()) return extrapolate(raw, shifted, last - 1, last);
    }
    return interpolate(raw, shifted);
}

std::pair<double, double> ForceCalibrator::convertWithMass(double raw, double baseline, double g) const {
    double force = convert(raw, baseline);
    return std::make_pair(force, force / g);
}

double ForceCalibrator::extrapolate(double x, const std::vector<double>& raw_axis, size_t i0, size_t i1) const {
    double x0 = raw_axis[i0], y0 = force_[i0];
    double x1 = raw_axis[i1], y1 = force_[i1];
    if (x1 == x0) return y0;
    double slope = (y1 - y0) / (x1 - x0);
    return y0 + slope * (x - x0);
}

// Linear interpolation clamped to the boundary forces
double ForceCalibrator::interpolate(double x, const std::vector<double>& raw_axis) const {
    if (x <= raw_axis.front()) return force_.front();
    if (x >= raw_axis.back()) return force_.back();

    // raw_axis[j] <= x < raw_axis[k], so the segment has a non-zero width
    size_t k = (size_t)(std::upper_bound(raw_axis.begin(), raw_axis.end(), x) - raw_axis.begin());
    size_t j = k - 1;
    double t = (x - raw_axis[j]) / (raw_axis[k] - raw_axis[j]);
    return force_[j] + t * (force_[k] - force_[j]);
}
