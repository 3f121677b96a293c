#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

enum class CalibrationMethod {
    PIECEWISE,
    LINEAR_FIT
};

// Shared, read-only calibration table
using CalibrationTable = std::shared_ptr<const std::vector<CalibrationPoint>>;

/**
 * @brief Raw count to force conversion against a Force_N / V3_mean table.
 *
 * The raw axis of the table is re-anchored on every conversion so that its first
 * point sits on the session baseline. Immutable after construction; each device
 * session owns its own instance.
 */
class ForceCalibrator {
public:
    /**
     * @param points Calibration points, any order (sorted by raw count here)
     * @param method PIECEWISE interpolation or LINEAR_FIT least squares
     * @param allow_extrapolation PIECEWISE only: extend the boundary segments instead of clamping
     * @throws CalibrationException with fewer than 2 points
     */
    ForceCalibrator(const std::vector<CalibrationPoint>& points,
                    CalibrationMethod method = CalibrationMethod::PIECEWISE,
                    bool allow_extrapolation = true);

    /**
     * @brief Load points from a CSV with at least the Force_N and V3_mean columns.
     * Rows that do not parse are skipped.
     * @throws CalibrationException if the file, header or columns are missing, or fewer than 2 rows parse
     */
    static std::vector<CalibrationPoint> loadPoints(const std::string& csv_path);

    static CalibrationTable loadTable(const std::string& csv_path);

    // "piecewise" / "linear_fit"; throws CalibrationException otherwise
    static CalibrationMethod parseMethod(const std::string& name);
    static const char* methodName(CalibrationMethod method);

    /**
     * @brief Convert a raw reading to Newtons.
     * @param raw Raw V3 reading
     * @param baseline Session baseline; the raw axis is shifted by baseline - first raw point
     */
    double convert(double raw, double baseline) const;

    // {force_n, mass_kg} with mass = force / g (hanging-weight rig)
    std::pair<double, double> convertWithMass(double raw, double baseline, double g = 9.81) const;

    // {slope, intercept} of Force = slope * raw + intercept over the unshifted table
    std::pair<double, double> linearModel() const { return std::make_pair(slope_, intercept_); }

    const std::vector<CalibrationPoint>& points() const { return points_; }
    CalibrationMethod method() const { return method_; }
    bool allowsExtrapolation() const { return allow_extrapolation_; }

    // Least-squares line through (x, y); a zero-variance x gives slope 0, intercept mean(y)
    static std::pair<double, double> linearFit(const std::vector<double>& x, const std::vector<double>& y);

private:
    std::vector<CalibrationPoint> points_;
    std::vector<double> raw_;
    std::vector<double> force_;
    double slope_ = 0.0;
    double intercept_ = 0.0;
    CalibrationMethod method_;
    bool allow_extrapolation_;

    double extrapolate(double x, const std::vector<double>& raw_axis, size_t i0, size_t i1) const;
    double interpolate(double x, const std::vector<double>& raw_axis) const;
};
