/**
 * @file LedgerCommandHandlerTest.cpp
 * @brief Unit tests for LedgerCommandHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/LedgerCommandHandler.hpp"
#include "domain/LedgerErrors.hpp"
#include "ports/input/ILedgerService.hpp"
#include "mocks/TestContracts.hpp"

#include <nlohmann/json.hpp>

using namespace realty;
using namespace realty::adapters::primary;
using realty::tests::fixtures::php;
using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockLedgerService : public ports::input::ILedgerService {
public:
    MOCK_METHOD(void, registerProperty, (const domain::Property &), (override));
    MOCK_METHOD(domain::Contract, registerContract, (const domain::Contract &), (override));
    MOCK_METHOD(domain::Contract, prepareSchedule, (const std::string &), (override));
    MOCK_METHOD(domain::Contract, recordSignature, (const std::string &, domain::SignatureParty, const std::string &), (override));
    MOCK_METHOD(domain::Contract, activate, (const std::string &), (override));
    MOCK_METHOD(domain::Contract, terminate, (const std::string &, const std::string &), (override));
    MOCK_METHOD(domain::Contract, cancel, (const std::string &, const std::string &), (override));
    MOCK_METHOD(std::vector<std::string>, expireContracts, (), (override));
    MOCK_METHOD(domain::Transaction, applyPayment, (const domain::PaymentRecord &), (override));
    MOCK_METHOD(domain::Transaction, reverseTransaction, (const std::string &, const std::string &), (override));
    MOCK_METHOD(domain::Transaction, refund, (const std::string &, const domain::Money &, const std::string &), (override));
    MOCK_METHOD(domain::Transaction, payoutCommission, (const std::string &), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, assessPenalties, (const std::string &), (override));
    MOCK_METHOD(std::optional<domain::Contract>, getContract, (const std::string &), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, getTransactions, (const std::string &), (override));
    MOCK_METHOD(std::vector<domain::CommissionRecord>, getCommissions, (const std::string &), (override));
    MOCK_METHOD(domain::PaymentProgress, getPaymentProgress, (const std::string &), (override));
    MOCK_METHOD(application::ConstructionStatus, getConstructionStatus, (const std::string &), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerCommandHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockLedgerService_ = std::make_shared<MockLedgerService>();
        handler_ = std::make_unique<LedgerCommandHandler>(mockLedgerService_);
    }

    nlohmann::json run(const nlohmann::json &request)
    {
        return nlohmann::json::parse(handler_->handle(request.dump()));
    }

    domain::Transaction paymentTransaction()
    {
        domain::Transaction transaction;
        transaction.id = "txn-1";
        transaction.contractId = "ctr-1";
        transaction.type = domain::TransactionType::PAYMENT;
        transaction.amount = php(50'000);
        transaction.balanceBefore = php(0);
        transaction.balanceAfter = php(50'000);
        return transaction;
    }

    std::shared_ptr<MockLedgerService> mockLedgerService_;
    std::unique_ptr<LedgerCommandHandler> handler_;
};

// ============================================================================
// Request validation
// ============================================================================

TEST_F(LedgerCommandHandlerTest, InvalidJsonReturnsInvalidRequest)
{
    auto response = nlohmann::json::parse(handler_->handle("{not json"));

    EXPECT_EQ(response["status"], "error");
    EXPECT_EQ(response["error"], "InvalidRequest");
}

TEST_F(LedgerCommandHandlerTest, MissingOrUnknownCommand)
{
    EXPECT_EQ(run({{"contractId", "ctr-1"}})["error"], "InvalidRequest");
    EXPECT_EQ(run({{"command", "dropDatabase"}})["error"], "InvalidRequest");
}

TEST_F(LedgerCommandHandlerTest, FractionalAmountRejected)
{
    EXPECT_CALL(*mockLedgerService_, applyPayment(_)).Times(0);

    auto response = run({
        {"command", "applyPayment"},
        {"contractId", "ctr-1"},
        {"amount", {{"amount", 500.25}, {"currency", "PHP"}}}
    });

    EXPECT_EQ(response["status"], "error");
    EXPECT_EQ(response["error"], "InvalidRequest");
}

TEST_F(LedgerCommandHandlerTest, OutOfRangeRateRejected)
{
    EXPECT_CALL(*mockLedgerService_, registerProperty(_)).Times(0);

    auto response = run({
        {"command", "registerProperty"},
        {"property", {
            {"id", "prop-1"},
            {"price", {{"amount", 100'000'000}, {"currency", "PHP"}}},
            {"constructionTriggerPercentage", 92'233'720'368'547'758LL}
        }}
    });

    EXPECT_EQ(response["status"], "error");
    EXPECT_EQ(response["error"], "InvalidRequest");
}

TEST_F(LedgerCommandHandlerTest, MissingContractIdRejected)
{
    EXPECT_CALL(*mockLedgerService_, prepareSchedule(_)).Times(0);

    auto response = run({{"command", "prepareSchedule"}});

    EXPECT_EQ(response["error"], "InvalidRequest");
}

// ============================================================================
// Payments
// ============================================================================

TEST_F(LedgerCommandHandlerTest, ApplyPaymentPassesMinorUnits)
{
    domain::PaymentRecord captured;
    EXPECT_CALL(*mockLedgerService_, applyPayment(_))
        .WillOnce(::testing::DoAll(SaveArg<0>(&captured), Return(paymentTransaction())));

    auto response = run({
        {"command", "applyPayment"},
        {"contractId", "ctr-1"},
        {"amount", {{"amount", 5'000'000}, {"currency", "PHP"}}},
        {"receivedAt", "2025-04-01T00:00:00Z"},
        {"externalReference", "gw-123"}
    });

    EXPECT_EQ(response["status"], "ok");
    EXPECT_EQ(response["result"]["id"], "txn-1");
    EXPECT_EQ(response["result"]["amount"]["amount"], 5'000'000);

    EXPECT_EQ(captured.contractId, "ctr-1");
    EXPECT_EQ(captured.amount, php(50'000));
    EXPECT_EQ(captured.receivedAt, domain::Timestamp::fromDate(2025, 4, 1));
    EXPECT_EQ(captured.externalReference, "gw-123");
}

TEST_F(LedgerCommandHandlerTest, LedgerErrorMappedByName)
{
    EXPECT_CALL(*mockLedgerService_, applyPayment(_))
        .WillOnce(Throw(domain::OverpaymentError("exceeds outstanding principal")));

    auto response = run({
        {"command", "applyPayment"},
        {"contractId", "ctr-1"},
        {"amount", {{"amount", 100}, {"currency", "PHP"}}}
    });

    EXPECT_EQ(response["status"], "error");
    EXPECT_EQ(response["error"], "OverpaymentError");
    EXPECT_EQ(response["message"], "exceeds outstanding principal");
}

TEST_F(LedgerCommandHandlerTest, ReverseAndRefundCommands)
{
    auto reversal = paymentTransaction();
    reversal.type = domain::TransactionType::REVERSAL;
    reversal.amount = php(-50'000);
    EXPECT_CALL(*mockLedgerService_, reverseTransaction("txn-1", "chargeback")).WillOnce(Return(reversal));
    EXPECT_CALL(*mockLedgerService_, reverseTransaction("txn-1", "again"))
        .WillOnce(Throw(domain::AlreadyReversedError("already reversed")));
    EXPECT_CALL(*mockLedgerService_, refund("ctr-1", php(1'000), "cancelled"))
        .WillOnce(Throw(domain::ContractNotPayableError("contract is ACTIVE")));

    EXPECT_EQ(run({{"command", "reverse"}, {"transactionId", "txn-1"}, {"reason", "chargeback"}})["result"]["type"],
              "REVERSAL");
    EXPECT_EQ(run({{"command", "reverse"}, {"transactionId", "txn-1"}, {"reason", "again"}})["error"],
              "AlreadyReversedError");
    EXPECT_EQ(run({{"command", "refund"}, {"contractId", "ctr-1"},
                   {"amount", {{"amount", 100'000}, {"currency", "PHP"}}}, {"reason", "cancelled"}})["error"],
              "ContractNotPayableError");
}

// ============================================================================
// Contracts
// ============================================================================

TEST_F(LedgerCommandHandlerTest, RegisterContractParsesTerms)
{
    domain::Contract captured;
    EXPECT_CALL(*mockLedgerService_, registerContract(_))
        .WillOnce(::testing::DoAll(SaveArg<0>(&captured), Return(tests::fixtures::purchaseContract())));

    auto response = run({
        {"command", "registerContract"},
        {"contract", {
            {"id", "ctr-1"},
            {"type", "PURCHASE_AGREEMENT"},
            {"propertyId", "prop-1"},
            {"clientId", "client-1"},
            {"developerId", "dev-1"},
            {"agentId", "agent-1"},
            {"totalAmount", {{"amount", 100'000'000}, {"currency", "PHP"}}},
            {"downpaymentAmount", {{"amount", 20'000'000}, {"currency", "PHP"}}},
            {"equityAmount", {{"amount", 20'000'000}, {"currency", "PHP"}}},
            {"loanableAmount", {{"amount", 60'000'000}, {"currency", "PHP"}}},
            {"downpaymentMonths", 12},
            {"termMonths", 24},
            {"startDate", "2025-01-15"},
            {"commissionRateAgent", "5.00"}
        }}
    });

    EXPECT_EQ(response["status"], "ok");
    EXPECT_EQ(captured.id, "ctr-1");
    ASSERT_TRUE(captured.agentId.has_value());
    EXPECT_FALSE(captured.brokerId.has_value());
    EXPECT_EQ(captured.downpaymentMonths, 12);
    EXPECT_EQ(captured.equityMonths, 1);
    EXPECT_EQ(captured.reservationFee, domain::Money::zero("PHP"));
    ASSERT_TRUE(captured.commissionRateAgent.has_value());
    EXPECT_EQ(captured.commissionRateAgent->basisPoints, 500);
    EXPECT_EQ(captured.startDate, domain::Timestamp::fromDate(2025, 1, 15));
}

TEST_F(LedgerCommandHandlerTest, SignWithUnknownPartyRejected)
{
    EXPECT_CALL(*mockLedgerService_, recordSignature(_, _, _)).Times(0);

    auto response = run({{"command", "sign"}, {"contractId", "ctr-1"}, {"party", "NOTARY"}});

    EXPECT_EQ(response["error"], "InvalidRequest");
}

TEST_F(LedgerCommandHandlerTest, GetContractNotFound)
{
    EXPECT_CALL(*mockLedgerService_, getContract("ctr-x")).WillOnce(Return(std::nullopt));

    auto response = run({{"command", "getContract"}, {"contractId", "ctr-x"}});

    EXPECT_EQ(response["error"], "NotFoundError");
}

TEST_F(LedgerCommandHandlerTest, ConstructionStatusSerialized)
{
    application::ConstructionStatus status;
    status.principalPaid = php(600'000);
    status.constructionThreshold = php(500'000);
    status.turnoverThreshold = php(850'000);
    status.canStartConstruction = true;
    status.progressBasisPoints = 6000;
    EXPECT_CALL(*mockLedgerService_, getConstructionStatus("ctr-1")).WillOnce(Return(status));

    auto result = run({{"command", "getConstructionStatus"}, {"contractId", "ctr-1"}})["result"];

    EXPECT_TRUE(result["canStartConstruction"].get<bool>());
    EXPECT_FALSE(result["isTurnoverReady"].get<bool>());
    EXPECT_EQ(result["constructionThreshold"]["amount"], 50'000'000);
    EXPECT_EQ(result["progressBasisPoints"], 6000);
}
