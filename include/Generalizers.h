#pragma once

#include "RuleModel.h"
#include "TabularDataset.h"

#include <memory>
#include <string>

struct GeneralizedValue {
    std::string value;
    bool clamped = false;
};

/**
 * Type-specific generalization. One implementation per SemanticType that supports coarsening;
 * the strategy engine dispatches on the column's declared type.
 */
class Generalizer {
public:
    virtual ~Generalizer() = default;

    virtual SemanticType type() const = 0;

    /**
     * @brief Coarsens one non-null value.
     * @throws Obscura::InvalidParameterError when `params` holds another type's parameter family.
     * @throws Obscura::UnsupportedStrategyError when the value is not of this generalizer's type.
     */
    virtual GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const = 0;
};

class NumericGeneralizer : public Generalizer {
public:
    SemanticType type() const override { return SemanticType::NUMERIC; }
    GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const override;
};

// Digit codes ("94103") are masked after `precision` digits; decimal coordinates keep
// `precision` significant digits.
class LocationGeneralizer : public Generalizer {
public:
    SemanticType type() const override { return SemanticType::LOCATION; }
    GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const override;
};

class DateGeneralizer : public Generalizer {
public:
    SemanticType type() const override { return SemanticType::DATE; }
    GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const override;
};

// Comma separated "street, city, state, country"; the first component is the street when there are several.
class AddressGeneralizer : public Generalizer {
public:
    SemanticType type() const override { return SemanticType::ADDRESS; }
    GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const override;
};

class IpGeneralizer : public Generalizer {
public:
    SemanticType type() const override { return SemanticType::IP_ADDRESS; }
    GeneralizedValue generalize(const std::string& value, const GeneralizeParams& params) const override;
};

/**
 * @brief Generalizer for a declared column type.
 * @throws Obscura::UnsupportedStrategyError for categorical and free text columns.
 */
std::unique_ptr<Generalizer> makeGeneralizer(SemanticType type);
