#ifndef GUIDANCE_H
#define GUIDANCE_H

#include "offgrid_twin.hpp"
#include <string>
#include <vector>

/**
 * @struct Guidance
 * @brief Display text derived from one step record.
 */
struct Guidance {
    std::string headline;
    std::string explanation;
    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<ReasonCode> reason_codes;
};

/**
 * @class GuidanceBuilder
 * @brief Maps reason codes to household-facing text.
 *
 * Only reads the record. Risk and reason codes are copied through unchanged.
 */
class GuidanceBuilder {
public:
    static Guidance fromRecord(const StepRecord& record);

    /**
     * @brief Finds the step most in need of guidance.
     * @return The first record with the highest risk level, nullptr if records is empty.
     */
    static const StepRecord* mostSevere(const std::vector<StepRecord>& records);
};

#endif // GUIDANCE_H
