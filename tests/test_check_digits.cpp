#include <gtest/gtest.h>
#include "cnpj/check_digits.h"
#include <string>

using namespace cnpj;

class CheckDigitsTest : public ::testing::Test {
protected:
    // Digits as string, or "" if the body was rejected
    std::string digitsOf(const std::string& body) {
        auto result = computeCheckDigits(body);
        return result.success ? result.digits.toString() : std::string();
    }
};

// =============================================================================
// Known Vectors
// =============================================================================

TEST_F(CheckDigitsTest, NumericBodyRegressionVector) {
    auto result = computeCheckDigits("110144004848");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.digits.first, 6);
    EXPECT_EQ(result.digits.second, 2);
    EXPECT_EQ(result.digits.toString(), "62");
    EXPECT_TRUE(result.error.empty());
}

TEST_F(CheckDigitsTest, PublishedAlphanumericExample) {
    // 12.ABC.345/01DE-35
    EXPECT_EQ(digitsOf("12ABC34501DE"), "35");
}

TEST_F(CheckDigitsTest, RegisteredNumericCNPJs) {
    EXPECT_EQ(digitsOf("112223330001"), "81");
    EXPECT_EQ(digitsOf("114447770001"), "61");
}

TEST_F(CheckDigitsTest, LetterOnlyBodies) {
    EXPECT_EQ(digitsOf("AAAAAAAAAAAA"), "45");
    EXPECT_EQ(digitsOf("ZZZZZZZZZZZZ"), "62");
}

TEST_F(CheckDigitsTest, LowRemainderMapsToZero) {
    // First digit 0 (sum1 % 11 < 2)
    EXPECT_EQ(digitsOf("000000000028"), "01");
    EXPECT_EQ(digitsOf("000000000006"), "04");
    // Second digit 0
    EXPECT_EQ(digitsOf("000000000019"), "10");
}

TEST_F(CheckDigitsTest, ZeroDigitIsNotFailure) {
    auto result = computeCheckDigits("000000000028");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.digits.first, 0);
    EXPECT_EQ(result.digits.second, 1);
}

TEST_F(CheckDigitsTest, FirstDigitFeedsSecondSum) {
    // Same second-sum body contribution, different first digit
    // 000000000001: sum1 = 2 -> 9, sum2 = 3 + 9*2 = 21 -> 1
    EXPECT_EQ(digitsOf("000000000001"), "91");
}

// =============================================================================
// Normalization of the Body
// =============================================================================

TEST_F(CheckDigitsTest, MaskedBody) {
    EXPECT_EQ(digitsOf("12.ABC.345/01DE"), "35");
    EXPECT_EQ(digitsOf("11.014.400/4848"), "62");
}

TEST_F(CheckDigitsTest, LowercaseBody) {
    EXPECT_EQ(digitsOf("12abc34501de"), "35");
}

TEST_F(CheckDigitsTest, Deterministic) {
    auto reference = computeCheckDigits("A1B2C3D4E5F6");
    ASSERT_TRUE(reference.success);
    for (int i = 0; i < 10; i++) {
        auto again = computeCheckDigits("A1B2C3D4E5F6");
        ASSERT_TRUE(again.success);
        EXPECT_TRUE(again.digits == reference.digits);
        EXPECT_EQ(digitsOf("A1B2C3D4E5F6"), "68");
    }
}

TEST_F(CheckDigitsTest, DigitsEquality) {
    auto a = computeCheckDigits("12ABC34501DE").digits;
    auto b = computeCheckDigits("12abc34501de").digits;
    auto c = computeCheckDigits("110144004848").digits;
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a != b);
    EXPECT_TRUE(a != c);
    EXPECT_FALSE(a == c);
}

// =============================================================================
// Rejected Bodies
// =============================================================================

TEST_F(CheckDigitsTest, RejectsEmpty) {
    auto result = computeCheckDigits("");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(CheckDigitsTest, RejectsWrongLength) {
    EXPECT_FALSE(computeCheckDigits("11014400484").success);
    EXPECT_FALSE(computeCheckDigits("1101440048480").success);
    EXPECT_FALSE(computeCheckDigits("11014400484862").success);
}

TEST_F(CheckDigitsTest, RejectsAllZeroBody) {
    auto result = computeCheckDigits("000000000000");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());

    EXPECT_FALSE(computeCheckDigits("00.000.000/0000").success);
}

TEST_F(CheckDigitsTest, RejectsDisallowedCharacters) {
    EXPECT_FALSE(computeCheckDigits("12ABC34501D#").success);
    EXPECT_FALSE(computeCheckDigits("12ABC 4501DE").success);
    // Would be 12 characters only after dropping the space
    EXPECT_FALSE(computeCheckDigits("12ABC34501DE ").success);
}

TEST_F(CheckDigitsTest, CharacterValues) {
    EXPECT_EQ(characterValue('0'), 0);
    EXPECT_EQ(characterValue('9'), 9);
    EXPECT_EQ(characterValue('A'), 17);
    EXPECT_EQ(characterValue('Z'), 42);
}

TEST_F(CheckDigitsTest, WeightTable) {
    const int expected[] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    for (size_t i = 0; i <= BODY_LENGTH; i++) {
        EXPECT_EQ(CHECK_DIGIT_WEIGHTS[i], expected[i]) << "index " << i;
    }
}
