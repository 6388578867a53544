#pragma once

#include <string>
#include <vector>

namespace network_export {

struct VehicleTypeSpec {
    const char* id;
    double accel;
    double decel;
    double sigma;
    double length;
    double min_gap;
    double max_speed;
    const char* gui_shape;
};

// Always written, in this order, at the top of the routes document.
const VehicleTypeSpec standard_vehicle_types[] = {
    { "car", 2.6, 4.5, 0.5, 5, 2.5, 16.67, "passenger" },
    { "motorcycle", 3.0, 5.0, 0.5, 2.5, 1.5, 20.83, "motorcycle" },
    { "bus", 1.2, 4.5, 0.5, 12, 3, 13.89, "bus" },
    { "truck", 1.3, 4.5, 0.5, 8, 3, 11.11, "truck" },
};

inline bool is_standard_vehicle_type(const std::string& id) {
    for (const auto& t : standard_vehicle_types)
        if (id == t.id) return true;
    return false;
}

} // namespace network_export
