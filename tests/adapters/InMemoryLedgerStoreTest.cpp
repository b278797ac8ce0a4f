/**
 * @file InMemoryLedgerStoreTest.cpp
 * @brief Unit tests for InMemoryLedgerStore
 */

#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include "mocks/TestContracts.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace realty;
using namespace realty::domain;
using realty::adapters::secondary::InMemoryLedgerStore;
using realty::ports::output::LedgerChangeSet;
using realty::tests::fixtures::php;

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<InMemoryLedgerStore>();
        store->saveProperty(tests::fixtures::property());
        ASSERT_TRUE(store->createContract(tests::fixtures::smallContract("ctr-1")));
    }

    Transaction transaction(const std::string& id, TransactionType type, const Money& amount) {
        Transaction t;
        t.id = id;
        t.contractId = "ctr-1";
        t.type = type;
        t.amount = amount;
        t.balanceBefore = php(0);
        t.balanceAfter = php(0);
        return t;
    }

    LedgerChangeSet changesFor(const Contract& contract) {
        LedgerChangeSet changes;
        changes.contract = contract;
        changes.expectedVersion = contract.version;
        return changes;
    }

    std::shared_ptr<InMemoryLedgerStore> store;
};

// ============================================================================
// CONTRACT TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, CreateContractStartsAtVersionOne) {
    auto contract = store->findContract("ctr-1");

    ASSERT_TRUE(contract.has_value());
    EXPECT_EQ(contract->version, 1);
    EXPECT_FALSE(store->createContract(tests::fixtures::smallContract("ctr-1")));
    EXPECT_FALSE(store->findContract("missing").has_value());
}

TEST_F(InMemoryLedgerStoreTest, FindContractsByStatus) {
    ASSERT_TRUE(store->createContract(tests::fixtures::smallContract("ctr-2")));
    auto active = *store->findContract("ctr-2");
    active.status = ContractStatus::ACTIVE;
    store->commit(changesFor(active));

    auto drafts = store->findContractsByStatus(ContractStatus::DRAFT);
    auto actives = store->findContractsByStatus(ContractStatus::ACTIVE);

    ASSERT_EQ(drafts.size(), 1u);
    EXPECT_EQ(drafts[0].id, "ctr-1");
    ASSERT_EQ(actives.size(), 1u);
    EXPECT_EQ(actives[0].id, "ctr-2");
}

TEST_F(InMemoryLedgerStoreTest, PropertyRoundTrip) {
    auto property = store->findProperty("prop-1");

    ASSERT_TRUE(property.has_value());
    EXPECT_EQ(property->constructionTriggerPercentage, Percent::fromWhole(50));
    EXPECT_FALSE(store->findProperty("prop-x").has_value());
}

// ============================================================================
// COMMIT TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, CommitBumpsVersionAndAppendsTransactions) {
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    contract.ledgerBalance = php(100);
    changes.contract = contract;
    changes.newTransactions.push_back(transaction("txn-1", TransactionType::PENALTY, php(1)));
    changes.newTransactions.push_back(transaction("txn-2", TransactionType::PAYMENT, php(100)));

    auto committed = store->commit(changes);

    EXPECT_EQ(committed.version, 2);
    EXPECT_EQ(store->findContract("ctr-1")->ledgerBalance, php(100));

    auto ledger = store->findTransactionsByContract("ctr-1");
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[0].id, "txn-1");
    EXPECT_EQ(ledger[1].id, "txn-2");
    EXPECT_TRUE(store->findTransaction("txn-2").has_value());
}

TEST_F(InMemoryLedgerStoreTest, StaleVersionConflicts) {
    auto contract = *store->findContract("ctr-1");
    store->commit(changesFor(contract));

    // Второй писатель со старой версией
    auto stale = changesFor(contract);
    stale.newTransactions.push_back(transaction("txn-late", TransactionType::PAYMENT, php(5)));

    EXPECT_THROW(store->commit(stale), ConcurrencyConflictError);
    EXPECT_FALSE(store->findTransaction("txn-late").has_value());
    EXPECT_EQ(store->findContract("ctr-1")->version, 2);
}

TEST_F(InMemoryLedgerStoreTest, CommitUnknownContractThrows) {
    auto contract = tests::fixtures::smallContract("ghost");
    EXPECT_THROW(store->commit(changesFor(contract)), NotFoundError);
}

TEST_F(InMemoryLedgerStoreTest, ReversalIsUniquePerOriginal) {
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    changes.newTransactions.push_back(transaction("txn-pay", TransactionType::PAYMENT, php(100)));
    contract = store->commit(changes);

    auto reversal = transaction("txn-rev-1", TransactionType::REVERSAL, php(-100));
    reversal.reversedTransactionId = "txn-pay";
    auto first = changesFor(contract);
    first.newTransactions.push_back(reversal);
    contract = store->commit(first);

    ASSERT_TRUE(store->findReversalOf("txn-pay").has_value());
    EXPECT_EQ(*store->findReversalOf("txn-pay"), "txn-rev-1");

    auto duplicate = reversal;
    duplicate.id = "txn-rev-2";
    auto second = changesFor(contract);
    second.newTransactions.push_back(duplicate);

    EXPECT_THROW(store->commit(second), AlreadyReversedError);
    EXPECT_FALSE(store->findTransaction("txn-rev-2").has_value());
}

TEST_F(InMemoryLedgerStoreTest, DuplicateReversalInOneBatchRejected) {
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    for (const char* id : {"txn-rev-a", "txn-rev-b"}) {
        auto reversal = transaction(id, TransactionType::REVERSAL, php(-1));
        reversal.reversedTransactionId = "txn-x";
        changes.newTransactions.push_back(reversal);
    }

    EXPECT_THROW(store->commit(changes), AlreadyReversedError);
    EXPECT_TRUE(store->findTransactionsByContract("ctr-1").empty());
}

TEST_F(InMemoryLedgerStoreTest, PaymentReferenceIsUnique) {
    ASSERT_TRUE(store->createContract(tests::fixtures::smallContract("ctr-2")));
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    auto paid = transaction("txn-pay", TransactionType::PAYMENT, php(100));
    paid.externalReference = "gw-42";
    changes.newTransactions.push_back(paid);
    store->commit(changes);

    auto found = store->findPaymentByExternalReference("gw-42");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "txn-pay");
    EXPECT_FALSE(store->findPaymentByExternalReference("gw-missing").has_value());

    auto other = *store->findContract("ctr-2");
    auto reuse = changesFor(other);
    auto again = transaction("txn-pay-2", TransactionType::PAYMENT, php(100));
    again.contractId = "ctr-2";
    again.externalReference = "gw-42";
    reuse.newTransactions.push_back(again);

    EXPECT_THROW(store->commit(reuse), DuplicatePaymentError);
    EXPECT_FALSE(store->findTransaction("txn-pay-2").has_value());
    EXPECT_EQ(store->findContract("ctr-2")->version, 1);
}

TEST_F(InMemoryLedgerStoreTest, ReferenceIndexCoversPaymentsOnly) {
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    auto refund = transaction("txn-refund", TransactionType::REFUND, php(100));
    refund.externalReference = "bank-7";
    changes.newTransactions.push_back(refund);
    for (const char* id : {"txn-a", "txn-b"}) {
        changes.newTransactions.push_back(transaction(id, TransactionType::PAYMENT, php(1)));
    }

    EXPECT_NO_THROW(store->commit(changes));
    EXPECT_FALSE(store->findPaymentByExternalReference("bank-7").has_value());
    EXPECT_FALSE(store->findPaymentByExternalReference("").has_value());
}

TEST_F(InMemoryLedgerStoreTest, FailedCommitWritesNothing) {
    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    contract.ledgerBalance = php(999);
    changes.contract = contract;
    changes.newTransactions.push_back(transaction("txn-ok", TransactionType::PAYMENT, php(999)));
    auto foreign = transaction("txn-foreign", TransactionType::PAYMENT, php(1));
    foreign.contractId = "ctr-other";
    changes.newTransactions.push_back(foreign);

    EXPECT_THROW(store->commit(changes), std::invalid_argument);

    EXPECT_FALSE(store->findTransaction("txn-ok").has_value());
    EXPECT_TRUE(store->findContract("ctr-1")->ledgerBalance.isZero());
    EXPECT_EQ(store->findContract("ctr-1")->version, 1);
}

// ============================================================================
// COMMISSION TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, CommissionUpsertAndPaidImmutability) {
    CommissionRecord record;
    record.id = "com-1";
    record.contractId = "ctr-1";
    record.computedAmount = php(5'000);

    auto contract = *store->findContract("ctr-1");
    auto changes = changesFor(contract);
    changes.commissionUpserts.push_back(record);
    contract = store->commit(changes);

    record.computedAmount = php(7'500);
    record.payoutTransactionId = "txn-payout";
    changes = changesFor(contract);
    changes.commissionUpserts.push_back(record);
    contract = store->commit(changes);

    auto records = store->findCommissionsByContract("ctr-1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].computedAmount, php(7'500));

    record.computedAmount = php(1);
    changes = changesFor(contract);
    changes.commissionUpserts.push_back(record);
    EXPECT_THROW(store->commit(changes), AlreadyPaidError);
    EXPECT_EQ(store->findCommission("com-1")->computedAmount, php(7'500));
}

// ============================================================================
// CONCURRENCY TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, ConcurrentCommitsFromSameVersion_OneWins) {
    auto contract = *store->findContract("ctr-1");
    std::atomic<int> wins(0);
    std::atomic<int> conflicts(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &contract, &wins, &conflicts, i]() {
            auto changes = changesFor(contract);
            changes.newTransactions.push_back(transaction("txn-" + std::to_string(i), TransactionType::PAYMENT, php(1)));
            try {
                store->commit(changes);
                wins++;
            } catch (const ConcurrencyConflictError&) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins, 1);
    EXPECT_EQ(conflicts, 7);
    EXPECT_EQ(store->findTransactionsByContract("ctr-1").size(), 1u);
}
