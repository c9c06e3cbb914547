#pragma once

#include "RuleModel.h"

#include <string>
#include <vector>

/**
 * A generalized numeric bin. [lower, upper) except for the last bin of a parameter set,
 * which is closed at max_value. `representative` is the value decode() returns for `label`.
 */
struct GeneralizedRange {
    double lower = 0.0;
    double upper = 0.0;
    std::string label;
    double representative = 0.0;
    bool clamped = false;
};

namespace RangeCodec {

/**
 * @brief Maps a value to its bin under `params`.
 * @details When bin_size, min_value and max_value are all integral, labels show inclusive integer
 *          bounds ("45-49"); otherwise the exclusive upper bound is printed. Values outside
 *          [min_value, max_value] are placed in the nearest boundary bin with clamped = true.
 * @pre params passed RuleModel::validateParameters.
 */
GeneralizedRange encode(double value, const NumericBinParams& params);

/**
 * @brief Every bin of a parameter set in ascending order. Bins are contiguous and cover [min, max].
 */
std::vector<GeneralizedRange> enumerate(const NumericBinParams& params);

/**
 * @brief Representative numeric value of a generalized label.
 * @details Accepts range labels ("45-49", "-10--6", "0.5-1"), plain numbers, masked digit codes
 *          ("941**" decodes to the middle of 94100..94199) and ISO dates (days since 1970-01-01).
 * @throws Obscura::RangeDecodeError for anything else.
 */
double decode(const std::string& label);

// decode() without the exception; false when the label is not decodable.
bool tryDecode(const std::string& label, double& out);

std::string formatNumber(double value);

} // namespace RangeCodec
