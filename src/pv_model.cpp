#include "pv_model.hpp"
#include <algorithm>
#include <cmath>

double PvConversionModel::pvPower(double ghi_wm2, double capacity_kw, double efficiency) {
    if (!std::isfinite(ghi_wm2) || capacity_kw <= 0.0) {
        return 0.0;
    }
    const double kw = capacity_kw * (ghi_wm2 / kReferenceIrradianceWm2) * efficiency;
    return std::clamp(kw, 0.0, capacity_kw);
}

std::vector<double> PvConversionModel::pvSeries(const std::vector<double>& ghi_wm2, double capacity_kw,
                                                double efficiency) {
    std::vector<double> out;
    out.reserve(ghi_wm2.size());
    for (double ghi : ghi_wm2) {
        out.push_back(pvPower(ghi, capacity_kw, efficiency));
    }
    return out;
}
