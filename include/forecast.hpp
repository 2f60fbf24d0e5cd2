#ifndef FORECAST_H
#define FORECAST_H

#include "offgrid_twin.hpp"
#include <ctime>
#include <vector>

/**
 * @struct ResolvedForecast
 * @brief Irradiance aligned one-to-one with simulation steps.
 */
struct ResolvedForecast {
    std::vector<double> ghi_wm2;
    ForecastProvenance provenance = ForecastProvenance::FORECAST;
};

/**
 * @class ForecastResolver
 * @brief Turns whatever the forecast collaborator delivered into exactly one
 *        non-negative irradiance value per simulation step.
 */
class ForecastResolver {
public:
    static constexpr double kFallbackPeakGhiWm2 = 850.0;

    /**
     * @brief Samples a time-ordered series at every step of a run.
     *
     * Step i sits at start + i * step_minutes. Its value is linearly
     * interpolated between the points bracketing that time. Steps before the
     * first point or after the last take the nearest point's value. Points
     * whose timestamps equal the step times pass through unchanged. Negative or
     * non-finite samples count as zero.
     *
     * @param ordered Points sorted by timestamp.
     * @return total_steps values; all zero if ordered is empty.
     */
    static std::vector<double> resample(const std::vector<IrradiancePoint>& ordered, std::time_t start,
                                        int total_steps, int step_minutes);

    /**
     * @brief Deterministic bell-shaped daytime profile (06:00 to 18:00 UTC).
     * @param start Timestamp of the first step.
     * @param steps Number of samples to produce.
     * @param step_minutes Spacing between samples.
     */
    static std::vector<IrradiancePoint> syntheticProfile(std::time_t start, int steps, int step_minutes,
                                                         double peak_ghi_wm2 = kFallbackPeakGhiWm2);

    /// @brief True if the series has at least one finite, non-negative sample.
    static bool isUsable(const std::vector<IrradiancePoint>& points);

    /**
     * @brief Produces total_steps irradiance values for a run.
     *
     * Falls back to syntheticProfile() and marks the provenance when the
     * supplied points are unusable. Never throws for bad forecast data.
     */
    static ResolvedForecast resolve(const std::vector<IrradiancePoint>& points, std::time_t start,
                                    int total_steps, int step_minutes);
};

#endif // FORECAST_H
