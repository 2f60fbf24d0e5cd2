#ifndef PV_MODEL_H
#define PV_MODEL_H

#include <vector>

/**
 * @class PvConversionModel
 * @brief Stateless irradiance to electrical power conversion.
 */
class PvConversionModel {
public:
    static constexpr double kReferenceIrradianceWm2 = 1000.0;

    /**
     * @brief capacity x (ghi / 1000) x efficiency, clamped to [0, capacity].
     * @param ghi_wm2 Global horizontal irradiance in W/m2.
     * @param capacity_kw PV nameplate capacity.
     * @param efficiency System derate.
     */
    static double pvPower(double ghi_wm2, double capacity_kw, double efficiency);

    static std::vector<double> pvSeries(const std::vector<double>& ghi_wm2, double capacity_kw, double efficiency);
};

#endif // PV_MODEL_H
