#include "forecast.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace {

double sanitize(double v) {
    return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

} // namespace

std::vector<double> ForecastResolver::resample(const std::vector<IrradiancePoint>& ordered, std::time_t start,
                                               int total_steps, int step_minutes) {
    std::vector<double> out;
    if (total_steps <= 0) return out;
    out.reserve(static_cast<std::size_t>(total_steps));

    if (ordered.empty()) {
        out.assign(static_cast<std::size_t>(total_steps), 0.0);
        return out;
    }

    const std::time_t step_seconds = static_cast<std::time_t>(std::max(1, step_minutes)) * 60;
    for (int i = 0; i < total_steps; ++i) {
        const std::time_t t = start + static_cast<std::time_t>(i) * step_seconds;
        auto hi = std::lower_bound(ordered.begin(), ordered.end(), t,
                                   [](const IrradiancePoint& p, std::time_t ts) { return p.timestamp < ts; });
        if (hi == ordered.end()) {
            out.push_back(sanitize(ordered.back().ghi_wm2));
        } else if (hi == ordered.begin() || hi->timestamp == t) {
            out.push_back(sanitize(hi->ghi_wm2));
        } else {
            // lo->timestamp < t < hi->timestamp
            const auto lo = std::prev(hi);
            const double frac =
                static_cast<double>(t - lo->timestamp) / static_cast<double>(hi->timestamp - lo->timestamp);
            const double a = sanitize(lo->ghi_wm2);
            const double b = sanitize(hi->ghi_wm2);
            out.push_back(std::max(0.0, a + (b - a) * frac));
        }
    }
    return out;
}

std::vector<IrradiancePoint> ForecastResolver::syntheticProfile(std::time_t start, int steps, int step_minutes,
                                                                double peak_ghi_wm2) {
    std::vector<IrradiancePoint> points;
    if (steps <= 0) return points;
    step_minutes = std::max(1, step_minutes);
    points.reserve(static_cast<std::size_t>(steps));

    for (int i = 0; i < steps; ++i) {
        const std::time_t ts = start + static_cast<std::time_t>(i) * step_minutes * 60;
        const long seconds_of_day = static_cast<long>(((ts % 86400) + 86400) % 86400);
        const double hour = seconds_of_day / 3600.0;

        double ghi = 0.0;
        if (hour >= 6.0 && hour <= 18.0) {
            const double x = (hour - 6.0) / 12.0;
            ghi = peak_ghi_wm2 * (4.0 * x * (1.0 - x));
        }
        points.push_back({ts, std::max(0.0, ghi)});
    }
    return points;
}

bool ForecastResolver::isUsable(const std::vector<IrradiancePoint>& points) {
    return std::any_of(points.begin(), points.end(), [](const IrradiancePoint& p) {
        return std::isfinite(p.ghi_wm2) && p.ghi_wm2 >= 0.0;
    });
}

ResolvedForecast ForecastResolver::resolve(const std::vector<IrradiancePoint>& points, std::time_t start,
                                           int total_steps, int step_minutes) {
    ResolvedForecast resolved;
    std::vector<IrradiancePoint> ordered;
    if (isUsable(points)) {
        ordered = points;
        std::stable_sort(ordered.begin(), ordered.end(), [](const IrradiancePoint& a, const IrradiancePoint& b) {
            return a.timestamp < b.timestamp;
        });
    } else {
        ordered = syntheticProfile(start, total_steps, step_minutes);
        resolved.provenance = ForecastProvenance::FALLBACK;
    }

    resolved.ghi_wm2 = resample(ordered, start, total_steps, step_minutes);
    return resolved;
}
