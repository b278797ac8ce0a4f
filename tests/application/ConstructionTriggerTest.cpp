/**
 * @file ConstructionTriggerTest.cpp
 * @brief Unit tests for ConstructionTrigger
 */

#include <gtest/gtest.h>
#include "application/ConstructionTrigger.hpp"
#include "mocks/TestContracts.hpp"

using namespace realty;
using namespace realty::domain;
using realty::application::ConstructionTrigger;
using realty::tests::fixtures::php;

class ConstructionTriggerTest : public ::testing::Test {
protected:
    Property property = tests::fixtures::property();
    Money total = php(1'000'000);
};

TEST_F(ConstructionTriggerTest, ThresholdIsExactPercentage) {
    EXPECT_EQ(ConstructionTrigger::thresholdAmount(total, Percent::fromWhole(50)), php(500'000));
    EXPECT_EQ(ConstructionTrigger::thresholdAmount(total, Percent::fromWhole(85)), php(850'000));
}

TEST_F(ConstructionTriggerTest, ThresholdRoundsUp) {
    // 0.01 * 50% = 0.005 -> порог 0.01, иначе 0.00 уже "достигло" 50%
    EXPECT_EQ(ConstructionTrigger::thresholdAmount(Money::fromMinor(1), Percent::fromWhole(50)).amount, 1);
    EXPECT_EQ(ConstructionTrigger::thresholdAmount(Money::fromMinor(333), Percent::fromWhole(50)).amount, 167);
}

TEST_F(ConstructionTriggerTest, ConstructionStartsAtThreshold) {
    EXPECT_FALSE(ConstructionTrigger::canStartConstruction(property, total, php(499'999)));
    EXPECT_TRUE(ConstructionTrigger::canStartConstruction(property, total, php(500'000)));
}

TEST_F(ConstructionTriggerTest, TurnoverReadiness) {
    EXPECT_FALSE(ConstructionTrigger::isTurnoverReady(property, total, Money::parse("849999.99")));
    EXPECT_TRUE(ConstructionTrigger::isTurnoverReady(property, total, php(850'000)));
}

TEST_F(ConstructionTriggerTest, CustomPropertyPercentages) {
    property.constructionTriggerPercentage = Percent::fromString("30.5");

    EXPECT_FALSE(ConstructionTrigger::canStartConstruction(property, total, php(304'999)));
    EXPECT_TRUE(ConstructionTrigger::canStartConstruction(property, total, php(305'000)));
}

TEST_F(ConstructionTriggerTest, EvaluateSnapshot) {
    auto status = ConstructionTrigger::evaluate(property, total, php(600'000));

    EXPECT_EQ(status.principalPaid, php(600'000));
    EXPECT_EQ(status.constructionThreshold, php(500'000));
    EXPECT_EQ(status.turnoverThreshold, php(850'000));
    EXPECT_TRUE(status.canStartConstruction);
    EXPECT_FALSE(status.isTurnoverReady);
    EXPECT_EQ(status.progressBasisPoints, 6000);
}
