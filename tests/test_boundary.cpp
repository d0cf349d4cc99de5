#include <gtest/gtest.h>
#include "cnpj/cnpj.h"
#include <algorithm>
#include <string>

using namespace cnpj;

// =============================================================================
// Boundary Condition Tests
// Edge cases of length, character ranges and digit values
// =============================================================================

class BoundaryTest : public ::testing::Test {
protected:
    // Full identifier for a body, or "" if the body is rejected
    std::string complete(const std::string& body) {
        auto dv = computeCheckDigits(body);
        return dv.success ? body + dv.digits.toString() : std::string();
    }
};

// =============================================================================
// Length Boundaries
// =============================================================================

TEST_F(BoundaryTest, EveryLengthUpToTwenty) {
    // Only length 14 can be valid; the prefix of a valid id never is
    const std::string valid = "11014400484862";
    for (size_t len = 0; len <= 20; len++) {
        std::string candidate = valid.substr(0, std::min(len, valid.size()));
        while (candidate.size() < len) {
            candidate += '2';
        }
        EXPECT_EQ(validate(candidate), len == CNPJ_LENGTH) << "length " << len;
    }
}

TEST_F(BoundaryTest, OnlyMaskCharacters) {
    auto result = validateDetailed("../--//..");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, ValidationError::INVALID_LENGTH);
    EXPECT_TRUE(result.normalized.empty());
}

TEST_F(BoundaryTest, MaskDoesNotCountTowardsLength) {
    // 13 significant characters padded to 18 with mask characters
    EXPECT_FALSE(validate("12.ABC.345/01DE-3."));
    // 15 significant characters in the masked layout
    EXPECT_FALSE(validate("12.ABC.345/01DE-355"));
}

TEST_F(BoundaryTest, BodyLengthBoundaries) {
    EXPECT_FALSE(computeCheckDigits(std::string(11, '1')).success);
    EXPECT_TRUE(computeCheckDigits(std::string(12, '1')).success);
    EXPECT_FALSE(computeCheckDigits(std::string(13, '1')).success);
}

// =============================================================================
// Character Range Boundaries
// =============================================================================

TEST_F(BoundaryTest, ExtremeBodyCharacters) {
    EXPECT_TRUE(validate(complete("000000000001")));
    EXPECT_TRUE(validate(complete("999999999999")));
    EXPECT_TRUE(validate(complete("AAAAAAAAAAAA")));
    EXPECT_TRUE(validate(complete("ZZZZZZZZZZZZ")));
    EXPECT_TRUE(validate(complete("Z0Z0Z0Z0Z0Z0")));
}

TEST_F(BoundaryTest, NeighboursOfAllowedRanges) {
    // '/' and '-' are mask characters, so use ':' '@' '[' '`' '{'
    const std::string base = "12ABC34501DE35";
    for (char c : std::string(":@[`{")) {
        std::string candidate = base;
        candidate[5] = c;
        auto result = validateDetailed(candidate);
        EXPECT_FALSE(result.valid) << candidate;
        EXPECT_EQ(result.error, ValidationError::DISALLOWED_CHARACTER) << candidate;
    }
}

TEST_F(BoundaryTest, MaskCharactersBetweenDigitsAndLetters) {
    // '/' (0x2F) sits right below '0' but is stripped, never counted
    EXPECT_TRUE(validate("/12ABC34501DE35/"));
}

TEST_F(BoundaryTest, LowercaseCheckDigitPositionStillNonNumeric) {
    EXPECT_EQ(validateDetailed("12ABC34501DE3z").error,
              ValidationError::NON_NUMERIC_CHECK_DIGITS);
}

// =============================================================================
// Digit Value Boundaries
// =============================================================================

TEST_F(BoundaryTest, CheckDigitsZeroZeroAccepted) {
    // Search a small numeric range for a body whose digits are "00"
    bool found = false;
    for (int n = 1; n < 100000 && !found; n++) {
        std::string body = std::to_string(n);
        body.insert(0, BODY_LENGTH - body.size(), '0');
        auto dv = computeCheckDigits(body);
        ASSERT_TRUE(dv.success);
        if (dv.digits.first == 0 && dv.digits.second == 0) {
            found = true;
            EXPECT_TRUE(validate(body + "00"));
            EXPECT_EQ(dv.digits.toString(), "00");
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(BoundaryTest, AllZeroBodyAnyDigits) {
    for (int d = 0; d < 100; d++) {
        std::string digits = (d < 10 ? "0" : "") + std::to_string(d);
        auto result = validateDetailed("000000000000" + digits);
        EXPECT_FALSE(result.valid);
        EXPECT_EQ(result.error, ValidationError::ALL_ZERO);
    }
}

TEST_F(BoundaryTest, SingleNonZeroCharacterBodies) {
    for (size_t pos = 0; pos < BODY_LENGTH; pos++) {
        std::string body(BODY_LENGTH, '0');
        body[pos] = 'A';
        std::string id = complete(body);
        ASSERT_FALSE(id.empty()) << body;
        EXPECT_TRUE(validate(id)) << id;
    }
}
