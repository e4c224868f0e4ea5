// FeedSimulator.hh
#ifndef FEEDSIMULATOR_H
#define FEEDSIMULATOR_H
#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include "InstructionScanner.hh"
#include "LedgerEntry.hh"

/*
Builds synthetic ledger batches for the sender tool and the tests: filler transfers
plus transactions carrying an instruction that matches a rule.
*/
class FeedSimulator {
public:
    explicit FeedSimulator(uint64_t seed = 1) : m_gen(seed) {}

    Address random_address();

    // A transaction whose only instruction matches the rule, with the given addresses placed
    // at the rule's account positions and random keys everywhere else.
    Transaction make_event_transaction(const EventRule& rule, const Address& token,
                                       const Address& bonding_curve, const Address& creator);

    // A transaction with one short transfer-like instruction that no rule matches.
    Transaction make_filler_transaction();

    // num_entries entries of txs_per_entry transactions, event_count of them carrying the rule.
    std::vector<LedgerEntry> make_batch(const EventRule& rule, size_t num_entries, size_t txs_per_entry,
                                        size_t event_count);

private:
    Signature random_signature();

    std::mt19937_64 m_gen;
};

#endif
