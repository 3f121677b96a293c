/**
 * Calibration engine test program
 *
 * Covers table loading, the piecewise and linear_fit methods, baseline
 * shifting and the boundary behaviour with and without extrapolation.
 */

#include "test_common.hpp"
#include "../include/exceptions.hpp"
#include "../include/force_calibrator.hpp"
#include "../include/logger.hpp"

static std::vector<CalibrationPoint> sampleTable() {
    // Deliberately unsorted; F = 0.01 * raw - 10 at every point
    return {
        CalibrationPoint{30.0, 4000.0},
        CalibrationPoint{0.0, 1000.0},
        CalibrationPoint{10.0, 2000.0},
    };
}

/**
 * TEST 1: Piecewise interpolation inside the table
 */
bool test_piecewise_interpolation() {
    printTestHeader("TEST 1: Piecewise Interpolation");
    ForceCalibrator cal(sampleTable(), CalibrationMethod::PIECEWISE, true);

    bool ok = true;
    ok &= expectNear(cal.convert(1000.0, 1000.0), 0.0, 1e-9, "first point");
    ok &= expectNear(cal.convert(1500.0, 1000.0), 5.0, 1e-9, "mid first segment");
    ok &= expectNear(cal.convert(2000.0, 1000.0), 10.0, 1e-9, "interior point");
    ok &= expectNear(cal.convert(3000.0, 1000.0), 20.0, 1e-9, "mid second segment");
    ok &= expectNear(cal.convert(4000.0, 1000.0), 30.0, 1e-9, "last point");

    ok &= cal.points().front().raw_count == 1000.0;
    ok &= cal.points().back().raw_count == 4000.0;
    return ok;
}

/**
 * TEST 2: Boundary segments extend or clamp
 */
bool test_extrapolation_and_clamping() {
    printTestHeader("TEST 2: Extrapolation and Clamping");
    ForceCalibrator extend(sampleTable(), CalibrationMethod::PIECEWISE, true);
    ForceCalibrator clamp(sampleTable(), CalibrationMethod::PIECEWISE, false);

    bool ok = true;
    ok &= expectNear(extend.convert(5000.0, 1000.0), 40.0, 1e-9, "above range, extended");
    ok &= expectNear(extend.convert(500.0, 1000.0), -5.0, 1e-9, "below range, extended");
    ok &= expectNear(clamp.convert(5000.0, 1000.0), 30.0, 1e-9, "above range, clamped");
    ok &= expectNear(clamp.convert(500.0, 1000.0), 0.0, 1e-9, "below range, clamped");
    ok &= expectNear(clamp.convert(3000.0, 1000.0), 20.0, 1e-9, "inside range unaffected");
    return ok;
}

/**
 * TEST 3: Continuity at the shifted boundary points
 */
bool test_continuity_at_boundaries() {
    printTestHeader("TEST 3: Continuity at Shifted Points");
    const double baseline = 1234.5;
    const double offset = baseline - 1000.0;
    const double eps = 1e-6;

    bool ok = true;
    for (bool extrapolate : {true, false}) {
        ForceCalibrator cal(sampleTable(), CalibrationMethod::PIECEWISE, extrapolate);
        for (double raw : {1000.0, 2000.0, 4000.0}) {
            double x = raw + offset;
            double below = cal.convert(x - eps, baseline);
            double at = cal.convert(x, baseline);
            double above = cal.convert(x + eps, baseline);
            ok &= expectNear(below, at, 1e-4, "left limit");
            ok &= expectNear(above, at, 1e-4, "right limit");
        }
    }
    return ok;
}

/**
 * TEST 4: Baseline shift moves the raw axis only
 */
bool test_baseline_shift() {
    printTestHeader("TEST 4: Baseline Shift");
    ForceCalibrator cal(sampleTable(), CalibrationMethod::PIECEWISE, true);
    const double b1 = 1000.0;
    const double b2 = 1750.25;

    bool ok = true;
    for (double raw : {400.0, 1000.0, 1333.0, 2500.0, 3999.0, 6000.0}) {
        double shifted = cal.convert(raw + (b2 - b1), b2);
        ok &= expectNear(shifted, cal.convert(raw, b1), 1e-9, "shift invariance");
    }
    // The baseline itself always maps to the first point's force
    ok &= expectNear(cal.convert(b2, b2), 0.0, 1e-9, "baseline maps to first force");
    return ok;
}

/**
 * TEST 5: Least-squares method
 */
bool test_linear_fit() {
    printTestHeader("TEST 5: Linear Fit");
    ForceCalibrator cal(sampleTable(), CalibrationMethod::LINEAR_FIT, false);

    bool ok = true;
    std::pair<double, double> model = cal.linearModel();
    ok &= expectNear(model.first, 0.01, 1e-12, "slope");
    ok &= expectNear(model.second, -10.0, 1e-9, "intercept");

    ok &= expectNear(cal.convert(3000.0, 1000.0), 20.0, 1e-9, "on the line");
    // Linear fit never clamps
    ok &= expectNear(cal.convert(6000.0, 1000.0), 50.0, 1e-9, "beyond the table");
    // Baseline 500 counts higher: same line moved right by 500
    ok &= expectNear(cal.convert(3000.0, 1500.0), 15.0, 1e-9, "shifted baseline");

    std::pair<double, double> flat = ForceCalibrator::linearFit({5.0, 5.0, 5.0}, {1.0, 2.0, 6.0});
    ok &= expectNear(flat.first, 0.0, 1e-12, "zero-variance slope");
    ok &= expectNear(flat.second, 3.0, 1e-12, "zero-variance intercept");
    return ok;
}

/**
 * TEST 6: Mass conversion
 */
bool test_mass_conversion() {
    printTestHeader("TEST 6: Force to Mass");
    ForceCalibrator cal(sampleTable());
    std::pair<double, double> fm = cal.convertWithMass(2962.0, 1000.0);
    bool ok = expectNear(fm.first, 19.62, 1e-9, "force");
    ok &= expectNear(fm.second, 2.0, 1e-9, "mass");
    return ok;
}

/**
 * TEST 7: Loading a CSV table
 */
bool test_load_table() {
    printTestHeader("TEST 7: Load Calibration Table");
    std::string dir = makeTempDir("calib");
    std::string path = dir + "/V3_calibration.csv";
    writeTextFile(path,
                  "\xEF\xBB\xBF" "Mass_kg,\"Force_N\",V1_mean,V3_mean,Notes\r\n"
                  "2,19.62,100,2962,\"two, kg\"\r\n"
                  "0,0,90,1000,empty\r\n"
                  "x,not-a-number,0,1500,bad row\r\n"
                  "\r\n"
                  "1,9.81,95,1981,\r\n");

    bool ok = true;
    try {
        std::vector<CalibrationPoint> points = ForceCalibrator::loadPoints(path);
        ok &= points.size() == 3;
        if (points.size() == 3) {
            ok &= expectNear(points[0].force_n, 19.62, 1e-12, "row 1 force");
            ok &= expectNear(points[0].raw_count, 2962.0, 1e-12, "row 1 raw");
            ok &= expectNear(points[2].raw_count, 1981.0, 1e-12, "row 3 raw");
        }
        CalibrationTable table = ForceCalibrator::loadTable(path);
        ok &= table && table->size() == 3;
    } catch (const CalibrationException& e) {
        printf("  unexpected: %s\n", e.what());
        ok = false;
    }
    std::filesystem::remove_all(dir);
    return ok;
}

/**
 * TEST 8: Unusable tables are rejected
 */
bool test_invalid_tables() {
    printTestHeader("TEST 8: Invalid Tables");
    std::string dir = makeTempDir("calib_bad");
    bool ok = true;

    auto rejects = [](const std::string& path) {
        try {
            ForceCalibrator::loadPoints(path);
        } catch (const CalibrationException& e) {
            printf("  rejected: %s\n", e.what());
            return e.code() == ERR_CALIBRATION;
        }
        return false;
    };

    ok &= rejects(dir + "/missing.csv");

    writeTextFile(dir + "/no_column.csv", "Force_N,V1_mean\n1,2\n3,4\n");
    ok &= rejects(dir + "/no_column.csv");

    writeTextFile(dir + "/one_row.csv", "Force_N,V3_mean\n9.81,1981\nbad,row\n");
    ok &= rejects(dir + "/one_row.csv");

    writeTextFile(dir + "/empty.csv", "");
    ok &= rejects(dir + "/empty.csv");

    try {
        ForceCalibrator cal(std::vector<CalibrationPoint>{CalibrationPoint{1.0, 2.0}});
        ok = false;
    } catch (const CalibrationException&) {
    }

    try {
        ForceCalibrator::parseMethod("cubic");
        ok = false;
    } catch (const CalibrationException&) {
    }
    ok &= ForceCalibrator::parseMethod("linear_fit") == CalibrationMethod::LINEAR_FIT;
    ok &= std::string(ForceCalibrator::methodName(CalibrationMethod::PIECEWISE)) == "piecewise";

    std::filesystem::remove_all(dir);
    return ok;
}

int main() {
    Logger::setLevel(Logger::WARN);

    printTestResult("Piecewise interpolation", test_piecewise_interpolation());
    printTestResult("Extrapolation and clamping", test_extrapolation_and_clamping());
    printTestResult("Continuity at boundaries", test_continuity_at_boundaries());
    printTestResult("Baseline shift", test_baseline_shift());
    printTestResult("Linear fit", test_linear_fit());
    printTestResult("Mass conversion", test_mass_conversion());
    printTestResult("Load table", test_load_table());
    printTestResult("Invalid tables", test_invalid_tables());

    return printSummary("test_calibration");
}
