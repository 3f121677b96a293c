#pragma once

#include <string>
#include "types.hpp"

// Decodes one notification record "Time:<int>,V1:<f>,V2:<f>,V3:<f>,V4:<f>".
// Surrounding whitespace is ignored and the record must start the payload;
// anything after the V4 value is ignored. Returns false on a malformed payload.
bool parseSensorFrame(const std::string& payload, SensorFrame& out);

// Formats a record in the same wire layout (used by the simulator)
std::string formatSensorFrame(const SensorFrame& frame);
