#include "../include/frame_parser.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Matches "-?digits" at p; on success advances p past it.
static bool scanInteger(const char*& p, int64_t& value) {
    const char* start = p;
    const char* q = p;
    if (*q == '-') q++;
    if (!isdigit((unsigned char)*q)) return false;
    while (isdigit((unsigned char)*q)) q++;
    value = strtoll(start, nullptr, 10);
    p = q;
    return true;
}

// Matches "-?digits(.digits)?" at p. A dot without following digits is not
// part of the number.
static bool scanDecimal(const char*& p, double& value) {
    const char* q = p;
    if (*q == '-') q++;
    if (!isdigit((unsigned char)*q)) return false;
    while (isdigit((unsigned char)*q)) q++;
    if (*q == '.' && isdigit((unsigned char)q[1])) {
        q++;
        while (isdigit((unsigned char)*q)) q++;
    }
    // strtod alone would also take exponents, which the frame format does not allow
    value = strtod(std::string(p, q).c_str(), nullptr);
    p = q;
    return true;
}

static bool expectLiteral(const char*& p, const char* literal) {
    size_t len = strlen(literal);
    if (strncmp(p, literal, len) != 0) return false;
    p += len;
    return true;
}

bool parseSensorFrame(const std::string& payload, SensorFrame& out) {
    const char* p = payload.c_str();
    while (*p && isspace((unsigned char)*p)) p++;

    SensorFrame frame;
    if (!expectLiteral(p, "Time:") || !scanInteger(p, frame.device_time_ms)) return false;
    if (!expectLiteral(p, ",V1:") || !scanDecimal(p, frame.v1)) return false;
    if (!expectLiteral(p, ",V2:") || !scanDecimal(p, frame.v2)) return false;
    if (!expectLiteral(p, ",V3:") || !scanDecimal(p, frame.v3)) return false;
    if (!expectLiteral(p, ",V4:") || !scanDecimal(p, frame.v4)) return false;

    out = frame;
    return true;
}

std::string formatSensorFrame(const SensorFrame& frame) {
    char line[160];
    snprintf(line, sizeof(line), "Time:%lld,V1:%.2f,V2:%.2f,V3:%.2f,V4:%.2f",
             (long long)frame.device_time_ms, frame.v1, frame.v2, frame.v3, frame.v4);
    return std::string(line);
}
