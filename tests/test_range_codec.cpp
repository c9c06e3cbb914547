#include <gtest/gtest.h>

#include "DateUtils.h"
#include "ObscuraExceptions.h"
#include "RangeCodec.h"

#include <cmath>

namespace {
NumericBinParams bins(double size, double lo, double hi) {
    return NumericBinParams{size, lo, hi};
}
} // namespace

TEST(RangeCodecTest, AgeFortySevenMapsToFortyFiveFortyNine) {
    const GeneralizedRange r = RangeCodec::encode(47, bins(5, 0, 100));
    EXPECT_EQ(r.label, "45-49");
    EXPECT_FALSE(r.clamped);
    EXPECT_DOUBLE_EQ(RangeCodec::decode("45-49"), 47.0);
    EXPECT_DOUBLE_EQ(RangeCodec::decode(r.label), r.representative);
}

TEST(RangeCodecTest, BinsAreClosedOpenAtInteriorBoundaries) {
    const NumericBinParams p = bins(5, 0, 100);
    EXPECT_EQ(RangeCodec::encode(45, p).label, "45-49");
    EXPECT_EQ(RangeCodec::encode(49.999, p).label, "45-49");
    EXPECT_EQ(RangeCodec::encode(50, p).label, "50-54");
    EXPECT_EQ(RangeCodec::encode(0, p).label, "0-4");
}

TEST(RangeCodecTest, LastBinIsClosedAtMaxValue) {
    const NumericBinParams p = bins(5, 0, 90);
    const GeneralizedRange atMax = RangeCodec::encode(90, p);
    EXPECT_EQ(atMax.label, "85-90");
    EXPECT_FALSE(atMax.clamped);
    EXPECT_DOUBLE_EQ(atMax.upper, 90.0);
    EXPECT_EQ(RangeCodec::encode(85, p).label, "85-90");
    EXPECT_EQ(RangeCodec::encode(84.5, p).label, "80-84");
}

TEST(RangeCodecTest, OutOfRangeValuesClampToBoundaryBins) {
    const NumericBinParams p = bins(5, 0, 90);
    const GeneralizedRange low = RangeCodec::encode(-3, p);
    EXPECT_EQ(low.label, "0-4");
    EXPECT_TRUE(low.clamped);

    const GeneralizedRange high = RangeCodec::encode(120, p);
    EXPECT_EQ(high.label, "85-90");
    EXPECT_TRUE(high.clamped);
}

TEST(RangeCodecTest, PartialLastBinEndsAtMaxValue) {
    const NumericBinParams p = bins(5, 18, 90);
    const auto all = RangeCodec::enumerate(p);
    ASSERT_EQ(all.size(), 15u);
    EXPECT_EQ(all.front().label, "18-22");
    EXPECT_EQ(all.back().label, "88-90");
    EXPECT_EQ(RangeCodec::encode(90, p).label, "88-90");
}

TEST(RangeCodecTest, EnumeratedBinsAreContiguousAndDecodable) {
    for (const NumericBinParams& p : {bins(5, 18, 90), bins(10, 0, 100), bins(0.25, -1, 1), bins(7, -20, 20)}) {
        const auto all = RangeCodec::enumerate(p);
        ASSERT_FALSE(all.empty());
        EXPECT_DOUBLE_EQ(all.front().lower, p.minValue);
        EXPECT_DOUBLE_EQ(all.back().upper, p.maxValue);
        for (size_t i = 0; i < all.size(); ++i) {
            if (i + 1 < all.size()) EXPECT_DOUBLE_EQ(all[i].upper, all[i + 1].lower);
            EXPECT_LT(all[i].lower, all[i].upper);
            EXPECT_DOUBLE_EQ(RangeCodec::decode(all[i].label), all[i].representative) << all[i].label;
        }
    }
}

TEST(RangeCodecTest, DecodedValueStaysInsideItsBinAndWithinOneBinWidth) {
    const NumericBinParams p = bins(5, 18, 90);
    for (double v = 18.0; v <= 90.0; v += 0.5) {
        const GeneralizedRange r = RangeCodec::encode(v, p);
        const double decoded = RangeCodec::decode(r.label);
        EXPECT_GE(decoded, r.lower) << v;
        EXPECT_LE(decoded, r.upper) << v;
        EXPECT_LE(std::fabs(decoded - v), p.binSize) << v;
    }
}

TEST(RangeCodecTest, FractionalBinsPrintExclusiveUpperBound) {
    const GeneralizedRange r = RangeCodec::encode(0.7, bins(0.5, 0, 2));
    EXPECT_EQ(r.label, "0.5-1");
    EXPECT_DOUBLE_EQ(RangeCodec::decode(r.label), 0.75);
}

TEST(RangeCodecTest, NegativeBoundsRoundTrip) {
    const GeneralizedRange r = RangeCodec::encode(-8, bins(5, -20, 20));
    EXPECT_EQ(r.label, "-10--6");
    EXPECT_DOUBLE_EQ(RangeCodec::decode("-10--6"), -8.0);
}

TEST(RangeCodecTest, DecodesOtherGeneralizedForms) {
    EXPECT_DOUBLE_EQ(RangeCodec::decode("941**"), 94149.5);
    EXPECT_DOUBLE_EQ(RangeCodec::decode("12.5"), 12.5);
    EXPECT_DOUBLE_EQ(RangeCodec::decode("-120"), -120.0);
    EXPECT_DOUBLE_EQ(RangeCodec::decode("2024-03-01"),
                     static_cast<double>(DateUtils::daysFromCivil(2024, 3, 1)));
}

TEST(RangeCodecTest, RejectsUndecodableLabels) {
    for (const char* label : {"abc", "[REDACTED]", "UNKNOWN", "10-5", "", "45-", "4*5"}) {
        EXPECT_THROW(RangeCodec::decode(label), Obscura::RangeDecodeError) << label;
        double out = 0.0;
        EXPECT_FALSE(RangeCodec::tryDecode(label, out)) << label;
    }
}
