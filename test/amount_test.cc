#include "txproc/amount.h"

#include <cstdint>
#include <optional>
#include <sstream>

#include <gtest/gtest.h>

using txproc::Amount;

TEST(AmountTest, ParseAcceptsUpToFourFractionDigits) {
  EXPECT_EQ(Amount::Parse("12")->Raw(), 120000);
  EXPECT_EQ(Amount::Parse("1.5")->Raw(), 15000);
  EXPECT_EQ(Amount::Parse("0.0001")->Raw(), 1);
  EXPECT_EQ(Amount::Parse(".25")->Raw(), 2500);
  EXPECT_EQ(Amount::Parse("3.")->Raw(), 30000);
  EXPECT_EQ(Amount::Parse("0")->Raw(), 0);
}

TEST(AmountTest, ParseRejectsMalformedInput) {
  EXPECT_FALSE(Amount::Parse("").has_value());
  EXPECT_FALSE(Amount::Parse(".").has_value());
  EXPECT_FALSE(Amount::Parse("-1").has_value());
  EXPECT_FALSE(Amount::Parse("+1").has_value());
  EXPECT_FALSE(Amount::Parse("1e3").has_value());
  EXPECT_FALSE(Amount::Parse("1.23456").has_value());
  EXPECT_FALSE(Amount::Parse("1.2.3").has_value());
  EXPECT_FALSE(Amount::Parse("abc").has_value());
  EXPECT_FALSE(Amount::Parse(" 1").has_value());
}

TEST(AmountTest, ParseRejectsOverflow) {
  EXPECT_TRUE(Amount::Parse("922337203685477").has_value());
  EXPECT_FALSE(Amount::Parse("922337203685478").has_value());
  EXPECT_FALSE(Amount::Parse("99999999999999999999").has_value());
}

TEST(AmountTest, CheckedAddDetectsOverflow) {
  const Amount large = *Amount::Parse("500000000000000");
  EXPECT_EQ(Amount::FromUnits(2).CheckedAdd(Amount::FromUnits(3)), Amount::FromUnits(5));
  EXPECT_EQ(large.CheckedAdd(large), std::nullopt);
  EXPECT_EQ(Amount::FromRaw(INT64_MAX).CheckedAdd(Amount()), Amount::FromRaw(INT64_MAX));
  EXPECT_EQ(Amount::FromRaw(INT64_MAX).CheckedAdd(Amount::FromRaw(1)), std::nullopt);
}

TEST(AmountTest, ToStringAlwaysPrintsFourDecimals) {
  EXPECT_EQ(Amount::FromUnits(15).ToString(), "15.0000");
  EXPECT_EQ(Amount::FromRaw(15000).ToString(), "1.5000");
  EXPECT_EQ(Amount::FromRaw(1).ToString(), "0.0001");
  EXPECT_EQ(Amount().ToString(), "0.0000");
  EXPECT_EQ(Amount::FromRaw(-25000).ToString(), "-2.5000");

  std::ostringstream os;
  os << Amount::FromRaw(123456);
  EXPECT_EQ(os.str(), "12.3456");
}

TEST(AmountTest, ArithmeticIsExact) {
  Amount sum;
  for (int i = 0; i < 10; ++i) {
    sum += *Amount::Parse("0.1");
  }
  EXPECT_EQ(sum, Amount::FromUnits(1));
  EXPECT_EQ(Amount::FromUnits(3) - *Amount::Parse("0.0001"), *Amount::Parse("2.9999"));
  EXPECT_LT(Amount::FromRaw(1), Amount::FromRaw(2));
  EXPECT_TRUE((Amount() - Amount::FromRaw(1)).IsNegative());
}
