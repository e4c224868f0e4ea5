#include "InstructionScanner.hh"
#include "Base58.hh"
#include "Log.hh"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace {

const char* kPumpProgramId = "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P";
const Discriminator kPumpCreateDiscriminator = {24, 30, 200, 40, 5, 28, 7, 119};

// Account positions in the create instruction:
// 0 mint, 1 mint authority, 2 bonding curve, 3 associated bonding curve,
// 4 global, 5 metadata program, 6 metadata, 7 user
constexpr size_t kPumpMintIndex = 0;
constexpr size_t kPumpBondingCurveIndex = 2;
constexpr size_t kPumpUserIndex = 7;

bool resolve_account(const TransactionMessage& message, const CompiledInstruction& ix,
                     size_t position, Address& out) {
    if (position >= ix.accounts.size()) {
        return false;
    }
    const size_t key_index = ix.accounts[position];
    if (key_index >= message.account_keys.size()) {
        // Loaded from an address table, not resolvable from the message alone
        return false;
    }
    out = message.account_keys[key_index];
    return true;
}

} // namespace

size_t EventRule::max_account_index() const {
    return std::max({token_index, bonding_curve_index, creator_index});
}

ScannerConfig ScannerConfig::pump_create() {
    EventRule rule;
    rule.name = "create";
    rule.discriminator = kPumpCreateDiscriminator;
    Address program_id;
    if (!parse_address(kPumpProgramId, program_id)) {
        throw std::logic_error("Invalid built-in program id");
    }
    rule.program_id = program_id;
    rule.token_index = kPumpMintIndex;
    rule.bonding_curve_index = kPumpBondingCurveIndex;
    rule.creator_index = kPumpUserIndex;

    ScannerConfig config;
    config.rules.push_back(rule);
    return config;
}

size_t count_transactions(const std::vector<LedgerEntry>& entries) {
    size_t total = 0;
    for (const auto& entry : entries) {
        total += entry.transactions.size();
    }
    return total;
}

InstructionScanner::InstructionScanner(ScannerConfig config)
    : m_config(std::move(config)) {}

std::vector<DetectionRecord> InstructionScanner::scan(const std::vector<LedgerEntry>& entries,
                                                      uint64_t sequence) const {
    std::vector<DetectionRecord> records;
    if (entries.empty() || m_config.rules.empty()) {
        return records;
    }

    const size_t transaction_count = count_transactions(entries);

    for (const auto& entry : entries) {
        for (const auto& tx : entry.transactions) {
            bool matched = false;
            for (const auto& ix : tx.message.instructions) {
                // Length check first, short instructions never match
                if (ix.data.size() < sizeof(Discriminator)) {
                    continue;
                }
                for (const auto& rule : m_config.rules) {
                    DetectionRecord record;
                    const Match match = try_extract(rule, tx.message, ix, record);
                    if (match == Match::None) {
                        continue;
                    }
                    matched = true;
                    if (match == Match::Extracted) {
                        record.event_name = rule.name;
                        if (!tx.signatures.empty()) {
                            record.signature = tx.signatures.front();
                        }
                        record.sequence = sequence;
                        record.entry_count = entries.size();
                        record.transaction_count = transaction_count;
                        records.push_back(std::move(record));
                    }
                    break;
                }
                if (matched) {
                    break; // first matching instruction ends the transaction, malformed or not
                }
            }
        }
    }
    return records;
}

InstructionScanner::Match InstructionScanner::try_extract(const EventRule& rule, const TransactionMessage& message,
                                                          const CompiledInstruction& ix,
                                                          DetectionRecord& record) const {
    if (std::memcmp(ix.data.data(), rule.discriminator.data(), rule.discriminator.size()) != 0) {
        return Match::None;
    }

    if (rule.program_id) {
        if (ix.program_id_index >= message.account_keys.size() ||
            message.account_keys[ix.program_id_index] != *rule.program_id) {
            return Match::None;
        }
    }

    if (ix.accounts.size() <= rule.max_account_index() ||
        !resolve_account(message, ix, rule.token_index, record.token) ||
        !resolve_account(message, ix, rule.bonding_curve_index, record.bonding_curve) ||
        !resolve_account(message, ix, rule.creator_index, record.creator)) {
        if (log_enabled(LogLevel::Debug)) {
            std::cout << "[Scanner] Skipping malformed '" << rule.name << "' instruction with "
                      << ix.accounts.size() << " account references" << std::endl;
        }
        return Match::Malformed;
    }
    return Match::Extracted;
}
