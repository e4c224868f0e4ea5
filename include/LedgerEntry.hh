// LedgerEntry.hh
#ifndef LEDGERENTRY_H
#define LEDGERENTRY_H
#pragma once
#include <array>
#include <cstdint>
#include <vector>

using Address = std::array<uint8_t, 32>;
using Hash = std::array<uint8_t, 32>;
using Signature = std::array<uint8_t, 64>;

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed_accounts = 0;
    uint8_t num_readonly_unsigned_accounts = 0;
};

// A single directive. program_id_index and accounts index into the message's account keys.
struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> accounts;
    std::vector<uint8_t> data;
};

struct AddressTableLookup {
    Address account_key{};
    std::vector<uint8_t> writable_indexes;
    std::vector<uint8_t> readonly_indexes;
};

struct TransactionMessage {
    bool versioned = false; // false for legacy messages, true for v0
    MessageHeader header;
    std::vector<Address> account_keys; // static keys only
    Hash recent_blockhash{};
    std::vector<CompiledInstruction> instructions;
    std::vector<AddressTableLookup> address_table_lookups; // v0 only
};

struct Transaction {
    std::vector<Signature> signatures;
    TransactionMessage message;
};

// One decoded batch from the feed
struct LedgerEntry {
    uint64_t num_hashes = 0;
    Hash hash{};
    std::vector<Transaction> transactions;
};

#endif
