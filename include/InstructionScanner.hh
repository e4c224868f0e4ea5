// InstructionScanner.hh
#ifndef INSTRUCTIONSCANNER_H
#define INSTRUCTIONSCANNER_H
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "LedgerEntry.hh"

using Discriminator = std::array<uint8_t, 8>;

/*
One detectable event type. An instruction matches when its data starts with the
discriminator (and, if program_id is set, it targets that program). The three
indices are positions in the instruction's own account list, fixed by the target
program's instruction layout.
*/
struct EventRule {
    std::string name;
    Discriminator discriminator{};
    std::optional<Address> program_id;
    size_t token_index = 0;
    size_t bonding_curve_index = 0;
    size_t creator_index = 0;

    size_t max_account_index() const;
};

struct ScannerConfig {
    std::vector<EventRule> rules;

    // Token create instruction of the pump bonding-curve program.
    static ScannerConfig pump_create();
};

struct DetectionRecord {
    std::string event_name;
    Address token{};
    Address bonding_curve{};
    Address creator{};
    Signature signature{}; // first signature of the transaction, zero if unsigned
    uint64_t sequence = 0;
    size_t entry_count = 0;
    size_t transaction_count = 0;
};

size_t count_transactions(const std::vector<LedgerEntry>& entries);

/*
Stateless walk over entries -> transactions -> instructions. Holds only its immutable
config, so one instance may be shared between threads.
*/
class InstructionScanner {
public:
    explicit InstructionScanner(ScannerConfig config);

    // Records in entry, transaction, instruction order, at most one per transaction.
    std::vector<DetectionRecord> scan(const std::vector<LedgerEntry>& entries, uint64_t sequence = 0) const;

    const ScannerConfig& config() const { return m_config; }

private:
    enum class Match { None, Malformed, Extracted };

    Match try_extract(const EventRule& rule, const TransactionMessage& message,
                      const CompiledInstruction& ix, DetectionRecord& record) const;

    const ScannerConfig m_config;
};
#endif // INSTRUCTIONSCANNER_H
