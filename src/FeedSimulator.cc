#include "FeedSimulator.hh"

#include <algorithm>

Address FeedSimulator::random_address() {
    Address address;
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (auto& b : address) {
        b = static_cast<uint8_t>(byte_dist(m_gen));
    }
    return address;
}

Signature FeedSimulator::random_signature() {
    Signature signature;
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (auto& b : signature) {
        b = static_cast<uint8_t>(byte_dist(m_gen));
    }
    return signature;
}

Transaction FeedSimulator::make_event_transaction(const EventRule& rule, const Address& token,
                                                  const Address& bonding_curve, const Address& creator) {
    const size_t num_accounts = rule.max_account_index() + 1;

    Transaction tx;
    tx.signatures.push_back(random_signature());
    tx.message.header.num_required_signatures = 1;
    tx.message.recent_blockhash = random_address();

    // Key 0 is the fee payer, the instruction's accounts follow, the program id goes last
    tx.message.account_keys.push_back(creator);
    CompiledInstruction ix;
    for (size_t i = 0; i < num_accounts; ++i) {
        if (i == rule.token_index) {
            tx.message.account_keys.push_back(token);
        } else if (i == rule.bonding_curve_index) {
            tx.message.account_keys.push_back(bonding_curve);
        } else if (i == rule.creator_index) {
            tx.message.account_keys.push_back(creator);
        } else {
            tx.message.account_keys.push_back(random_address());
        }
        ix.accounts.push_back(static_cast<uint8_t>(tx.message.account_keys.size() - 1));
    }
    tx.message.account_keys.push_back(rule.program_id ? *rule.program_id : random_address());
    ix.program_id_index = static_cast<uint8_t>(tx.message.account_keys.size() - 1);

    ix.data.assign(rule.discriminator.begin(), rule.discriminator.end());
    // Arguments after the discriminator are opaque to the scanner
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (int i = 0; i < 24; ++i) {
        ix.data.push_back(static_cast<uint8_t>(byte_dist(m_gen)));
    }
    tx.message.instructions.push_back(std::move(ix));
    return tx;
}

Transaction FeedSimulator::make_filler_transaction() {
    Transaction tx;
    tx.signatures.push_back(random_signature());
    tx.message.header.num_required_signatures = 1;
    tx.message.header.num_readonly_unsigned_accounts = 1;
    tx.message.account_keys = {random_address(), random_address(), Address{}};
    tx.message.recent_blockhash = random_address();

    CompiledInstruction ix;
    ix.program_id_index = 2;
    ix.accounts = {0, 1};
    ix.data = {2, 0, 0, 0, 0x40, 0x42, 0x0f, 0x00, 0, 0, 0, 0}; // transfer of 1000000
    tx.message.instructions.push_back(std::move(ix));
    return tx;
}

std::vector<LedgerEntry> FeedSimulator::make_batch(const EventRule& rule, size_t num_entries, size_t txs_per_entry,
                                                   size_t event_count) {
    std::vector<LedgerEntry> entries(num_entries);
    const size_t total = num_entries * txs_per_entry;
    event_count = std::min(event_count, total);

    std::uniform_int_distribution<uint64_t> hashes_dist(1, 12500);
    size_t placed = 0;
    for (size_t e = 0; e < num_entries; ++e) {
        entries[e].num_hashes = hashes_dist(m_gen);
        entries[e].hash = random_address();
        for (size_t t = 0; t < txs_per_entry; ++t) {
            // Spread the events evenly through the batch
            const size_t position = e * txs_per_entry + t;
            if (placed < event_count && position * event_count >= placed * total) {
                entries[e].transactions.push_back(
                    make_event_transaction(rule, random_address(), random_address(), random_address()));
                ++placed;
            } else {
                entries[e].transactions.push_back(make_filler_transaction());
            }
        }
    }
    return entries;
}
