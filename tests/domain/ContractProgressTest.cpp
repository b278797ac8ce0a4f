/**
 * @file ContractProgressTest.cpp
 * @brief Unit tests for computed contract properties
 */

#include <gtest/gtest.h>
#include "domain/ContractProgress.hpp"
#include "application/PaymentScheduleBuilder.hpp"
#include "mocks/TestContracts.hpp"

using namespace realty;
using namespace realty::domain;
using realty::tests::fixtures::php;

class ContractProgressTest : public ::testing::Test {
protected:
    void SetUp() override {
        contract = tests::fixtures::smallContract();
        contract.installments = application::PaymentScheduleBuilder().build(contract);
    }

    Contract contract;
};

TEST_F(ContractProgressTest, IsFullySignedRequiresAgentOnlyWhenAssigned) {
    contract.signatures.client.isSigned = true;
    contract.signatures.landlord.isSigned = true;
    EXPECT_TRUE(progress::isFullySigned(contract));

    contract.agentId = "agent-1";
    EXPECT_FALSE(progress::isFullySigned(contract));

    contract.signatures.agent.isSigned = true;
    EXPECT_TRUE(progress::isFullySigned(contract));
}

TEST_F(ContractProgressTest, PrincipalPaidExcludesPenalties) {
    contract.installments[0].paidAmount = php(40'000);
    contract.installments[1].paidAmount = php(10'000);
    contract.installments[1].penaltyAmount = php(400);
    contract.installments[1].penaltyPaid = php(400);

    EXPECT_EQ(progress::principalPaid(contract), php(50'000));
    EXPECT_EQ(progress::outstandingPrincipal(contract), php(50'000));
    EXPECT_TRUE(progress::outstandingPenalty(contract).isZero());
}

TEST_F(ContractProgressTest, PaymentProgressInBasisPoints) {
    contract.installments[0].paidAmount = php(40'000);

    auto result = progress::paymentProgress(contract);

    EXPECT_EQ(result.totalAmount, php(100'000));
    EXPECT_EQ(result.totalPaid, php(40'000));
    EXPECT_EQ(result.remaining, php(60'000));
    EXPECT_EQ(result.progressBasisPoints, 4000);
}

TEST_F(ContractProgressTest, IsFullyPaidIgnoresUnscheduledPrepayments) {
    for (auto& installment : contract.installments) {
        installment.paidAmount = installment.amount;
    }
    EXPECT_TRUE(progress::isFullyPaid(contract));

    contract.installments[2].paidAmount = php(0);
    ScheduledInstallment prepayment = contract.installments[2];
    prepayment.installmentNumber = 4;
    prepayment.unscheduled = true;
    prepayment.amount = php(20'000);
    prepayment.paidAmount = php(20'000);
    contract.installments.push_back(prepayment);

    // Сумма оплат равна total, но плановый взнос №3 ещё открыт
    EXPECT_EQ(progress::principalPaid(contract), php(100'000));
    EXPECT_FALSE(progress::isFullyPaid(contract));
}

TEST_F(ContractProgressTest, OverdueInstallmentsSkipsSettled) {
    contract.installments[0].isOverdue = true;
    contract.installments[1].isOverdue = true;
    contract.installments[1].paidAmount = contract.installments[1].amount;

    auto overdue = progress::overdueInstallments(contract);

    ASSERT_EQ(overdue.size(), 1u);
    EXPECT_EQ(overdue[0].installmentNumber, 1);
}

TEST_F(ContractProgressTest, TotalCommissionSumsAllRecords) {
    CommissionRecord paid;
    paid.computedAmount = php(5'000);
    paid.payoutTransactionId = "txn-1";
    CommissionRecord open;
    open.computedAmount = php(2'000);

    EXPECT_EQ(progress::totalCommission({paid, open}, "PHP"), php(7'000));
}
