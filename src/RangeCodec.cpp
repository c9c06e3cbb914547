#include "RangeCodec.h"
#include "CommonUtils.h"
#include "DateUtils.h"
#include "ObscuraExceptions.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace {
bool isIntegral(double v) {
    return std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15;
}

bool integralMode(const NumericBinParams& p) {
    return isIntegral(p.binSize) && isIntegral(p.minValue) && isIntegral(p.maxValue);
}

size_t binCount(const NumericBinParams& p) {
    const double span = (p.maxValue - p.minValue) / p.binSize;
    const double bins = std::ceil(span - 1e-9);
    return static_cast<size_t>(std::max(1.0, bins));
}

GeneralizedRange makeBin(size_t idx, const NumericBinParams& p) {
    const size_t bins = binCount(p);
    const bool last = (idx + 1 == bins);

    GeneralizedRange r;
    r.lower = p.minValue + static_cast<double>(idx) * p.binSize;
    r.upper = last ? p.maxValue : r.lower + p.binSize;

    // Label bounds; integral bins print their inclusive last integer except the max-absorbing last bin.
    double labelHi = r.upper;
    if (integralMode(p) && !last) labelHi = r.upper - 1.0;

    r.label = RangeCodec::formatNumber(r.lower) + "-" + RangeCodec::formatNumber(labelHi);
    r.representative = (r.lower + labelHi) / 2.0;
    return r;
}

// Parses one number at the front of `s`, leading '+' not allowed. Returns chars consumed or 0.
size_t parseLeadingNumber(std::string_view s, double& out) {
    if (s.empty()) return 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out, std::chars_format::general);
    if (ec != std::errc{} || !std::isfinite(out)) return 0;
    return static_cast<size_t>(p - s.data());
}

bool decodeRangeLabel(const std::string& s, double& out) {
    double lo = 0.0;
    const size_t first = parseLeadingNumber(s, lo);
    if (first == 0 || first >= s.size() || s[first] != '-') return false;

    double hi = 0.0;
    const std::string_view rest(s.data() + first + 1, s.size() - first - 1);
    const size_t second = parseLeadingNumber(rest, hi);
    if (second == 0 || second != rest.size() || hi < lo) return false;

    out = (lo + hi) / 2.0;
    return true;
}

bool decodeMaskedDigits(const std::string& s, double& out) {
    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) ++digits;
    if (digits == 0 || digits == s.size() || s.size() > 18) return false;
    for (size_t i = digits; i < s.size(); ++i) {
        if (s[i] != '*') return false;
    }

    double lo = 0.0;
    for (size_t i = 0; i < digits; ++i) lo = lo * 10.0 + static_cast<double>(s[i] - '0');
    const double scale = std::pow(10.0, static_cast<double>(s.size() - digits));
    lo *= scale;
    const double hi = lo + scale - 1.0;
    out = (lo + hi) / 2.0;
    return true;
}
} // namespace

namespace RangeCodec {

std::string formatNumber(double value) {
    if (isIntegral(value)) {
        if (value == 0.0) return "0";
        return std::to_string(static_cast<long long>(value));
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.10g", value);
    return buf;
}

GeneralizedRange encode(double value, const NumericBinParams& params) {
    const bool below = value < params.minValue;
    const bool above = value > params.maxValue;
    const double v = below ? params.minValue : (above ? params.maxValue : value);

    const size_t bins = binCount(params);
    const double raw = std::floor((v - params.minValue) / params.binSize);
    size_t idx = raw <= 0.0 ? 0 : static_cast<size_t>(raw);
    if (idx >= bins) idx = bins - 1;

    GeneralizedRange r = makeBin(idx, params);
    r.clamped = below || above;
    return r;
}

std::vector<GeneralizedRange> enumerate(const NumericBinParams& params) {
    const size_t bins = binCount(params);
    std::vector<GeneralizedRange> out;
    out.reserve(bins);
    for (size_t i = 0; i < bins; ++i) out.push_back(makeBin(i, params));
    return out;
}

bool tryDecode(const std::string& label, double& out) {
    const std::string s = CommonUtils::trim(label);
    if (s.empty()) return false;

    DateUtils::CivilDate date;
    if (DateUtils::parseIsoDate(s, date)) {
        out = static_cast<double>(DateUtils::daysFromCivil(date.year,
                                                           static_cast<unsigned>(date.month),
                                                           static_cast<unsigned>(date.day)));
        return true;
    }
    if (CommonUtils::parseDouble(s, out)) return true;
    if (decodeMaskedDigits(s, out)) return true;
    return decodeRangeLabel(s, out);
}

double decode(const std::string& label) {
    double out = 0.0;
    if (!tryDecode(label, out)) {
        throw Obscura::RangeDecodeError("cannot decode generalized value '" + label + "'");
    }
    return out;
}

} // namespace RangeCodec
