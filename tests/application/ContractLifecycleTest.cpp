/**
 * @file ContractLifecycleTest.cpp
 * @brief Unit tests for ContractLifecycle state machine
 */

#include <gtest/gtest.h>
#include "application/ContractLifecycle.hpp"
#include "application/PaymentScheduleBuilder.hpp"
#include "domain/LedgerErrors.hpp"
#include "mocks/TestContracts.hpp"

using namespace realty;
using namespace realty::domain;
using realty::application::ContractLifecycle;

class ContractLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        contract = tests::fixtures::smallContract();
        contract.installments = application::PaymentScheduleBuilder().build(contract);
    }

    void signAll() {
        lifecycle.recordSignature(contract, SignatureParty::CLIENT, "client-sig", at);
        lifecycle.recordSignature(contract, SignatureParty::LANDLORD, "dev-sig", at);
    }

    ContractLifecycle lifecycle;
    Contract contract;
    Timestamp at = Timestamp::fromDate(2025, 1, 10);
};

// ============================================================================
// TRANSITION TABLE TESTS
// ============================================================================

TEST_F(ContractLifecycleTest, TransitionTable) {
    EXPECT_TRUE(ContractLifecycle::canTransition(ContractStatus::DRAFT, ContractStatus::PENDING_SIGNATURE));
    EXPECT_TRUE(ContractLifecycle::canTransition(ContractStatus::PENDING_SIGNATURE, ContractStatus::ACTIVE));
    EXPECT_TRUE(ContractLifecycle::canTransition(ContractStatus::ACTIVE, ContractStatus::COMPLETED));
    EXPECT_TRUE(ContractLifecycle::canTransition(ContractStatus::ACTIVE, ContractStatus::EXPIRED));

    // Через ступень нельзя
    EXPECT_FALSE(ContractLifecycle::canTransition(ContractStatus::DRAFT, ContractStatus::ACTIVE));
    EXPECT_FALSE(ContractLifecycle::canTransition(ContractStatus::PENDING_SIGNATURE, ContractStatus::COMPLETED));

    // Из финальных статусов никуда
    for (auto terminal : {ContractStatus::COMPLETED, ContractStatus::TERMINATED,
                          ContractStatus::CANCELLED, ContractStatus::EXPIRED}) {
        for (auto to : {ContractStatus::DRAFT, ContractStatus::ACTIVE, ContractStatus::TERMINATED,
                        ContractStatus::CANCELLED}) {
            EXPECT_FALSE(ContractLifecycle::canTransition(terminal, to)) << toString(terminal);
        }
    }
}

// ============================================================================
// SIGNATURE TESTS
// ============================================================================

TEST_F(ContractLifecycleTest, SubmitRequiresSchedule) {
    contract.installments.clear();
    EXPECT_THROW(lifecycle.submitForSignature(contract, at), InvalidTransitionError);
    EXPECT_EQ(contract.status, ContractStatus::DRAFT);
}

TEST_F(ContractLifecycleTest, FullSignatureActivatesPendingContract) {
    lifecycle.submitForSignature(contract, at);

    EXPECT_FALSE(lifecycle.recordSignature(contract, SignatureParty::CLIENT, "client-sig", at));
    EXPECT_EQ(contract.status, ContractStatus::PENDING_SIGNATURE);

    EXPECT_TRUE(lifecycle.recordSignature(contract, SignatureParty::LANDLORD, "dev-sig", at));
    EXPECT_EQ(contract.status, ContractStatus::ACTIVE);
    EXPECT_EQ(contract.signatures.landlord.blob, "dev-sig");
    ASSERT_TRUE(contract.signatures.client.signedAt.has_value());
}

TEST_F(ContractLifecycleTest, AssignedAgentMustSign) {
    contract.agentId = "agent-1";
    lifecycle.submitForSignature(contract, at);
    signAll();
    EXPECT_EQ(contract.status, ContractStatus::PENDING_SIGNATURE);

    EXPECT_THROW(lifecycle.activate(contract, at), InvalidTransitionError);

    EXPECT_TRUE(lifecycle.recordSignature(contract, SignatureParty::AGENT, "agent-sig", at));
    EXPECT_EQ(contract.status, ContractStatus::ACTIVE);
}

TEST_F(ContractLifecycleTest, AgentSignatureWithoutAgentRejected) {
    EXPECT_THROW(lifecycle.recordSignature(contract, SignatureParty::AGENT, "sig", at), InvalidTransitionError);
}

TEST_F(ContractLifecycleTest, SigningInDraftDoesNotActivate) {
    signAll();
    EXPECT_EQ(contract.status, ContractStatus::DRAFT);

    lifecycle.submitForSignature(contract, at);
    lifecycle.activate(contract, at);
    EXPECT_EQ(contract.status, ContractStatus::ACTIVE);
}

TEST_F(ContractLifecycleTest, SigningActiveContractRejected) {
    lifecycle.submitForSignature(contract, at);
    signAll();

    EXPECT_THROW(lifecycle.recordSignature(contract, SignatureParty::CLIENT, "again", at), InvalidTransitionError);
}

// ============================================================================
// COMPLETION AND EXPIRY TESTS
// ============================================================================

TEST_F(ContractLifecycleTest, CompleteIfPaid) {
    lifecycle.submitForSignature(contract, at);
    signAll();

    EXPECT_FALSE(lifecycle.completeIfPaid(contract, at));

    for (auto& installment : contract.installments) {
        installment.paidAmount = installment.amount;
    }
    EXPECT_TRUE(lifecycle.completeIfPaid(contract, at));
    EXPECT_EQ(contract.status, ContractStatus::COMPLETED);
    EXPECT_FALSE(lifecycle.completeIfPaid(contract, at));
}

TEST_F(ContractLifecycleTest, ExpireIfDue) {
    contract.endDate = Timestamp::fromDate(2026, 1, 15);
    lifecycle.submitForSignature(contract, at);
    signAll();

    EXPECT_FALSE(lifecycle.expireIfDue(contract, Timestamp::fromDate(2026, 1, 15)));
    EXPECT_TRUE(lifecycle.expireIfDue(contract, Timestamp::fromDate(2026, 1, 16)));
    EXPECT_EQ(contract.status, ContractStatus::EXPIRED);
}

TEST_F(ContractLifecycleTest, NoEndDateNeverExpires) {
    lifecycle.submitForSignature(contract, at);
    signAll();

    EXPECT_FALSE(lifecycle.expireIfDue(contract, Timestamp::fromDate(2100, 1, 1)));
    EXPECT_EQ(contract.status, ContractStatus::ACTIVE);
}

// ============================================================================
// TERMINATION TESTS
// ============================================================================

TEST_F(ContractLifecycleTest, TerminateRecordsReason) {
    lifecycle.submitForSignature(contract, at);
    signAll();

    lifecycle.terminate(contract, "buyer default", at);

    EXPECT_EQ(contract.status, ContractStatus::TERMINATED);
    EXPECT_EQ(contract.cancellationReason, "buyer default");
}

TEST_F(ContractLifecycleTest, CancelDraft) {
    lifecycle.cancel(contract, "changed mind", at);
    EXPECT_EQ(contract.status, ContractStatus::CANCELLED);
}

TEST_F(ContractLifecycleTest, TerminalStatusRejectsEverything) {
    lifecycle.cancel(contract, "changed mind", at);

    EXPECT_THROW(lifecycle.terminate(contract, "again", at), InvalidTransitionError);
    EXPECT_THROW(lifecycle.submitForSignature(contract, at), InvalidTransitionError);
    EXPECT_THROW(lifecycle.recordSignature(contract, SignatureParty::CLIENT, "sig", at), InvalidTransitionError);
    EXPECT_EQ(contract.cancellationReason, "changed mind");
}
