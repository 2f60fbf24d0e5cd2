#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include "offgrid_twin.hpp"
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace fixtures {

inline Appliance makeAppliance(const std::string& id, LoadCategory category, double power_w,
                               std::optional<AllowedWindow> window = std::nullopt, int duration_steps = 0,
                               int daily_quota_steps = 0) {
    Appliance a;
    a.id = id;
    a.name = id;
    a.category = category;
    a.unit_power_w = power_w;
    a.window = window;
    a.duration_steps = duration_steps;
    a.daily_quota_steps = daily_quota_steps;
    return a;
}

inline AllowedWindow window(int start_hour, int end_hour) {
    return AllowedWindow{start_hour * 60, end_hour * 60};
}

/// Small household used by the loop and batch tests.
inline std::vector<Appliance> householdCatalog() {
    return {
        makeAppliance("fridge", LoadCategory::CRITICAL, 150.0),
        makeAppliance("lights", LoadCategory::CRITICAL, 60.0),
        makeAppliance("washer", LoadCategory::FLEXIBLE, 500.0, window(8, 18), 6),
        makeAppliance("pump", LoadCategory::FLEXIBLE, 750.0),
        makeAppliance("scooter", LoadCategory::DEFERRABLE, 300.0, std::nullopt, 0, 8),
    };
}

inline std::vector<IrradiancePoint> flatForecast(double ghi, int points, int spacing_minutes,
                                                 std::time_t start = 0) {
    std::vector<IrradiancePoint> forecast;
    for (int i = 0; i < points; ++i) {
        forecast.push_back({start + static_cast<std::time_t>(i) * spacing_minutes * 60, ghi});
    }
    return forecast;
}

} // namespace fixtures

#endif // TEST_HELPERS_H
