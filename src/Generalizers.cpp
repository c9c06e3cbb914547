#include "Generalizers.h"
#include "CommonUtils.h"
#include "DateUtils.h"
#include "ObscuraExceptions.h"
#include "RangeCodec.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace {
template <typename Family>
const Family& requireFamily(const GeneralizeParams& params, SemanticType type, const char* expected) {
    const Family* family = std::get_if<Family>(&params);
    if (!family) {
        throw Obscura::InvalidParameterError(std::string(semanticTypeName(type)) + " generalization expects " +
                                             expected + " parameters");
    }
    return *family;
}

[[noreturn]] void rejectValue(SemanticType type, const std::string& value) {
    throw Obscura::UnsupportedStrategyError("generalize cannot treat '" + value + "' as " + semanticTypeName(type));
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

// "[-]digits[.digits]" in plain notation; exponent forms are rewritten first.
std::string plainDecimal(const std::string& s, double parsed) {
    bool plain = true;
    for (char c : s) {
        if (c == 'e' || c == 'E') plain = false;
    }
    if (plain) return s.front() == '+' ? s.substr(1) : s;

    char buf[128];
    std::snprintf(buf, sizeof(buf), "%.10f", parsed);
    std::string out(buf);
    while (!out.empty() && out.back() == '0') out.pop_back();
    if (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

std::string truncateSignificant(const std::string& decimal, size_t precision) {
    std::string sign;
    std::string body = decimal;
    if (!body.empty() && body.front() == '-') {
        sign = "-";
        body.erase(body.begin());
    }
    const size_t dot = body.find('.');
    std::string intPart = body.substr(0, dot);
    std::string fracPart = (dot == std::string::npos) ? std::string() : body.substr(dot + 1);

    size_t significant = 0;
    for (char& c : intPart) {
        if (significant >= precision) {
            c = '0';
        } else if (significant > 0 || c != '0') {
            ++significant;
        }
    }
    std::string keptFrac;
    for (char c : fracPart) {
        if (significant >= precision) break;
        keptFrac.push_back(c);
        if (significant > 0 || c != '0') ++significant;
    }

    if (intPart.empty()) intPart = "0";
    std::string out = intPart;
    if (!keptFrac.empty()) out += "." + keptFrac;

    bool zero = true;
    for (char c : out) {
        if (c != '0' && c != '.') zero = false;
    }
    return zero ? out : sign + out;
}

std::vector<std::string> splitComponents(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t comma = value.find(',', start);
        const std::string piece = CommonUtils::trim(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!piece.empty()) parts.push_back(piece);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return parts;
}

std::string joinComponents(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (!out.empty()) out += ", ";
        out += parts[i];
    }
    return out;
}

std::string stripHouseNumber(const std::string& street) {
    const size_t space = street.find(' ');
    if (space == std::string::npos) return street;
    const std::string first = street.substr(0, space);
    bool hasDigit = false;
    for (unsigned char c : first) {
        if (std::isdigit(c)) hasDigit = true;
    }
    return hasDigit ? CommonUtils::trim(street.substr(space + 1)) : street;
}
} // namespace

GeneralizedValue NumericGeneralizer::generalize(const std::string& value, const GeneralizeParams& params) const {
    const auto& bins = requireFamily<NumericBinParams>(params, type(), "numeric (bin_size, min_value, max_value)");
    double v = 0.0;
    if (!CommonUtils::parseDouble(value, v)) rejectValue(type(), value);

    const GeneralizedRange range = RangeCodec::encode(v, bins);
    return {range.label, range.clamped};
}

GeneralizedValue LocationGeneralizer::generalize(const std::string& value, const GeneralizeParams& params) const {
    const auto& loc = requireFamily<LocationParams>(params, type(), "location (precision)");
    const std::string s = CommonUtils::trim(value);

    if (allDigits(s)) {
        if (loc.precision >= s.size()) return {s, false};
        return {s.substr(0, loc.precision) + std::string(s.size() - loc.precision, '*'), false};
    }

    double parsed = 0.0;
    if (!CommonUtils::parseDouble(s, parsed)) rejectValue(type(), value);
    return {truncateSignificant(plainDecimal(s, parsed), loc.precision), false};
}

GeneralizedValue DateGeneralizer::generalize(const std::string& value, const GeneralizeParams& params) const {
    const auto& date = requireFamily<DateParams>(params, type(), "date (granularity)");
    DateUtils::CivilDate parsed;
    if (!DateUtils::parseDate(CommonUtils::trim(value), parsed)) rejectValue(type(), value);
    return {DateUtils::formatIsoDate(DateUtils::truncate(parsed, date.granularity)), false};
}

GeneralizedValue AddressGeneralizer::generalize(const std::string& value, const GeneralizeParams& params) const {
    const auto& addr = requireFamily<AddressParams>(params, type(), "address (level)");
    std::vector<std::string> parts = splitComponents(value);
    if (parts.empty()) rejectValue(type(), value);

    // Street is component 0 only when locality components follow it.
    const size_t localityStart = parts.size() > 1 ? 1 : 0;
    const size_t localityCount = parts.size() - localityStart;
    auto keepLast = [&](size_t n) {
        const size_t keep = std::min(n, localityCount);
        return joinComponents(parts, parts.size() - keep);
    };

    switch (addr.level) {
        case AddressLevel::FULL:
            return {CommonUtils::trim(value), false};
        case AddressLevel::STREET:
            if (localityStart == 1) parts[0] = stripHouseNumber(parts[0]);
            return {joinComponents(parts, 0), false};
        case AddressLevel::CITY:
            return {keepLast(3), false};
        case AddressLevel::STATE:
            return {keepLast(2), false};
        case AddressLevel::COUNTRY:
            return {keepLast(1), false};
    }
    return {CommonUtils::trim(value), false};
}

GeneralizedValue IpGeneralizer::generalize(const std::string& value, const GeneralizeParams& params) const {
    const auto& ip = requireFamily<IpParams>(params, type(), "ip (octets)");
    std::array<int, 4> octets{};
    if (!CommonUtils::parseIpv4(value, octets)) rejectValue(type(), value);

    std::string out;
    for (int i = 0; i < 4; ++i) {
        if (i > 0) out.push_back('.');
        out += std::to_string(i < ip.octets ? octets[static_cast<size_t>(i)] : 0);
    }
    return {out, false};
}

std::unique_ptr<Generalizer> makeGeneralizer(SemanticType type) {
    switch (type) {
        case SemanticType::NUMERIC: return std::make_unique<NumericGeneralizer>();
        case SemanticType::LOCATION: return std::make_unique<LocationGeneralizer>();
        case SemanticType::DATE: return std::make_unique<DateGeneralizer>();
        case SemanticType::ADDRESS: return std::make_unique<AddressGeneralizer>();
        case SemanticType::IP_ADDRESS: return std::make_unique<IpGeneralizer>();
        case SemanticType::CATEGORICAL:
        case SemanticType::FREE_TEXT:
            break;
    }
    throw Obscura::UnsupportedStrategyError(std::string("generalize is not defined for ") + semanticTypeName(type) +
                                            " columns");
}
