#include <gtest/gtest.h>

#include <algorithm>

#include "FeedSimulator.hh"
#include "InstructionScanner.hh"

namespace {

Address filled(uint8_t value) {
    Address address;
    address.fill(value);
    return address;
}

EventRule test_rule() {
    EventRule rule;
    rule.name = "create";
    rule.discriminator = {24, 30, 200, 40, 5, 28, 7, 119};
    rule.token_index = 0;
    rule.bonding_curve_index = 2;
    rule.creator_index = 7;
    return rule;
}

ScannerConfig config_of(const EventRule& rule) {
    ScannerConfig config;
    config.rules.push_back(rule);
    return config;
}

// Keys 0..9 are filled(0x10 + i); the instruction references them in order
Transaction transaction_with(const std::vector<uint8_t>& data, size_t num_accounts, uint8_t program_index = 9) {
    Transaction tx;
    Signature signature;
    signature.fill(0xEE);
    tx.signatures.push_back(signature);
    for (uint8_t i = 0; i < 10; ++i) {
        tx.message.account_keys.push_back(filled(static_cast<uint8_t>(0x10 + i)));
    }
    CompiledInstruction ix;
    ix.program_id_index = program_index;
    for (size_t i = 0; i < num_accounts; ++i) {
        ix.accounts.push_back(static_cast<uint8_t>(i));
    }
    ix.data = data;
    tx.message.instructions.push_back(ix);
    return tx;
}

std::vector<uint8_t> create_data() {
    return {24, 30, 200, 40, 5, 28, 7, 119, 1, 2, 3};
}

} // namespace

TEST(InstructionScanner, EmptyEntriesGiveNoRecords) {
    InstructionScanner scanner(config_of(test_rule()));
    EXPECT_TRUE(scanner.scan({}).empty());
}

TEST(InstructionScanner, MatchExtractsConfiguredPositions) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    entry.transactions.push_back(transaction_with(create_data(), 8));

    const auto records = scanner.scan({entry}, 42);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].event_name, "create");
    EXPECT_EQ(records[0].token, filled(0x10));
    EXPECT_EQ(records[0].bonding_curve, filled(0x12));
    EXPECT_EQ(records[0].creator, filled(0x17));
    EXPECT_EQ(records[0].signature[0], 0xEE);
    EXPECT_EQ(records[0].sequence, 42u);
    EXPECT_EQ(records[0].entry_count, 1u);
    EXPECT_EQ(records[0].transaction_count, 1u);
}

TEST(InstructionScanner, AccountReferencesAreResolvedThroughMessageKeys) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    Transaction tx = transaction_with(create_data(), 8);
    // Reverse the references: position 0 now points at key 7
    auto& accounts = tx.message.instructions[0].accounts;
    std::reverse(accounts.begin(), accounts.end());
    entry.transactions.push_back(tx);

    const auto records = scanner.scan({entry});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].token, filled(0x17));
    EXPECT_EQ(records[0].bonding_curve, filled(0x15));
    EXPECT_EQ(records[0].creator, filled(0x10));
}

TEST(InstructionScanner, TooFewAccountsIsSkippedSilently) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    entry.transactions.push_back(transaction_with(create_data(), 7));
    EXPECT_TRUE(scanner.scan({entry}).empty());
}

TEST(InstructionScanner, ReferenceOutsideStaticKeysIsSkipped) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    Transaction tx = transaction_with(create_data(), 8);
    tx.message.instructions[0].accounts[7] = 200; // loaded from a lookup table
    entry.transactions.push_back(tx);
    EXPECT_TRUE(scanner.scan({entry}).empty());
}

TEST(InstructionScanner, ShortDataNeverMatches) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    entry.transactions.push_back(transaction_with({24, 30, 200, 40, 5, 28, 7}, 8));
    entry.transactions.push_back(transaction_with({}, 8));
    EXPECT_TRUE(scanner.scan({entry}).empty());
}

TEST(InstructionScanner, DifferentDiscriminatorDoesNotMatch) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    auto data = create_data();
    data[7] = 0;
    entry.transactions.push_back(transaction_with(data, 8));
    EXPECT_TRUE(scanner.scan({entry}).empty());
}

TEST(InstructionScanner, FirstMatchPerTransactionWins) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    Transaction tx = transaction_with(create_data(), 8);
    CompiledInstruction second = tx.message.instructions[0];
    std::reverse(second.accounts.begin(), second.accounts.end());
    tx.message.instructions.push_back(second);
    entry.transactions.push_back(tx);

    const auto records = scanner.scan({entry});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].token, filled(0x10));
}

TEST(InstructionScanner, MalformedMatchEndsTransaction) {
    InstructionScanner scanner(config_of(test_rule()));
    LedgerEntry entry;
    Transaction tx = transaction_with(create_data(), 3);
    CompiledInstruction good = tx.message.instructions[0];
    for (uint8_t i = 3; i < 8; ++i) {
        good.accounts.push_back(i);
    }
    tx.message.instructions.push_back(good);
    entry.transactions.push_back(tx);
    // The next transaction is still scanned
    entry.transactions.push_back(transaction_with(create_data(), 8));

    const auto records = scanner.scan({entry});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].transaction_count, 2u);
}

TEST(InstructionScanner, ProgramIdFilter) {
    EventRule rule = test_rule();
    rule.program_id = filled(0x19);
    InstructionScanner scanner(config_of(rule));

    LedgerEntry entry;
    entry.transactions.push_back(transaction_with(create_data(), 8, 9));  // key 9 is the program
    entry.transactions.push_back(transaction_with(create_data(), 8, 8));  // some other program
    entry.transactions.push_back(transaction_with(create_data(), 8, 50)); // unresolvable

    const auto records = scanner.scan({entry});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].transaction_count, 3u);
}

TEST(InstructionScanner, SeveralRulesInOnePass) {
    EventRule other;
    other.name = "trade";
    other.discriminator = {1, 2, 3, 4, 5, 6, 7, 8};
    other.token_index = 1;
    other.bonding_curve_index = 0;
    other.creator_index = 1;

    ScannerConfig config = config_of(test_rule());
    config.rules.push_back(other);
    InstructionScanner scanner(config);

    LedgerEntry first;
    first.transactions.push_back(transaction_with({1, 2, 3, 4, 5, 6, 7, 8}, 2));
    LedgerEntry second;
    second.transactions.push_back(transaction_with(create_data(), 8));
    second.transactions.push_back(transaction_with({9, 9}, 2));

    const auto records = scanner.scan({first, second}, 3);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].event_name, "trade");
    EXPECT_EQ(records[0].token, filled(0x11));
    EXPECT_EQ(records[1].event_name, "create");
    EXPECT_EQ(records[0].entry_count, 2u);
    EXPECT_EQ(records[1].transaction_count, 3u);
}

TEST(InstructionScanner, DoesNotModifyEntries) {
    FeedSimulator simulator(21);
    const EventRule rule = ScannerConfig::pump_create().rules[0];
    const auto entries = simulator.make_batch(rule, 2, 6, 3);
    const auto copy = entries;

    InstructionScanner scanner(ScannerConfig::pump_create());
    const auto first = scanner.scan(entries);
    const auto second = scanner.scan(entries);
    EXPECT_EQ(first.size(), 3u);
    ASSERT_EQ(second.size(), first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].token, second[i].token);
    }
    EXPECT_EQ(entries[1].transactions[5].message.account_keys, copy[1].transactions[5].message.account_keys);
}

TEST(InstructionScanner, PumpCreateDefaults) {
    const ScannerConfig config = ScannerConfig::pump_create();
    ASSERT_EQ(config.rules.size(), 1u);
    const EventRule& rule = config.rules[0];
    EXPECT_EQ(rule.discriminator, (Discriminator{24, 30, 200, 40, 5, 28, 7, 119}));
    EXPECT_TRUE(rule.program_id.has_value());
    EXPECT_EQ(rule.token_index, 0u);
    EXPECT_EQ(rule.bonding_curve_index, 2u);
    EXPECT_EQ(rule.creator_index, 7u);
    EXPECT_EQ(rule.max_account_index(), 7u);
}

TEST(InstructionScanner, CountTransactions) {
    LedgerEntry a;
    a.transactions.resize(3);
    LedgerEntry b;
    LedgerEntry c;
    c.transactions.resize(2);
    EXPECT_EQ(count_transactions({a, b, c}), 5u);
    EXPECT_EQ(count_transactions({}), 0u);
}
