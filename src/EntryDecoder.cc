#include "EntryDecoder.hh"
#include "BinaryReader.hh"

#include <string>

namespace {

constexpr uint8_t kVersionPrefixMask = 0x80;
// Smallest encodings, used to reject counts the remaining bytes cannot hold.
constexpr size_t kMinEntrySize = 8 + 32 + 8;
constexpr size_t kMinTransactionSize = 1 + 3 + 1 + 32 + 1;

std::vector<uint8_t> read_byte_vec(BinaryReader& reader) {
    std::vector<uint8_t> bytes;
    reader.read_bytes(bytes, reader.read_short_vec_len());
    return bytes;
}

CompiledInstruction read_instruction(BinaryReader& reader) {
    CompiledInstruction ix;
    ix.program_id_index = reader.read_u8();
    ix.accounts = read_byte_vec(reader);
    ix.data = read_byte_vec(reader);
    return ix;
}

TransactionMessage read_message(BinaryReader& reader) {
    TransactionMessage message;

    const uint8_t first = reader.peek_u8();
    if (first & kVersionPrefixMask) {
        const uint8_t version = reader.read_u8() & static_cast<uint8_t>(~kVersionPrefixMask);
        if (version != 0) {
            throw DecodeError("Unsupported message version " + std::to_string(version));
        }
        message.versioned = true;
    }

    message.header.num_required_signatures = reader.read_u8();
    message.header.num_readonly_signed_accounts = reader.read_u8();
    message.header.num_readonly_unsigned_accounts = reader.read_u8();

    const uint16_t num_keys = reader.read_short_vec_len();
    message.account_keys.resize(num_keys);
    for (auto& key : message.account_keys) {
        reader.read(key);
    }

    reader.read(message.recent_blockhash);

    const uint16_t num_instructions = reader.read_short_vec_len();
    message.instructions.reserve(num_instructions);
    for (uint16_t i = 0; i < num_instructions; ++i) {
        message.instructions.push_back(read_instruction(reader));
    }

    if (message.versioned) {
        const uint16_t num_lookups = reader.read_short_vec_len();
        message.address_table_lookups.reserve(num_lookups);
        for (uint16_t i = 0; i < num_lookups; ++i) {
            AddressTableLookup lookup;
            reader.read(lookup.account_key);
            lookup.writable_indexes = read_byte_vec(reader);
            lookup.readonly_indexes = read_byte_vec(reader);
            message.address_table_lookups.push_back(std::move(lookup));
        }
    }
    return message;
}

Transaction read_transaction(BinaryReader& reader) {
    Transaction tx;
    const uint16_t num_signatures = reader.read_short_vec_len();
    tx.signatures.resize(num_signatures);
    for (auto& signature : tx.signatures) {
        reader.read(signature);
    }
    tx.message = read_message(reader);
    return tx;
}

// Writers for the encode side
void write_u8(std::vector<uint8_t>& out, uint8_t v) { out.push_back(v); }

void write_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

void write_short_vec_len(std::vector<uint8_t>& out, size_t len) {
    if (len > 0xFFFF) {
        throw std::length_error("Short vec length overflows u16");
    }
    uint32_t rem = static_cast<uint32_t>(len);
    while (true) {
        uint8_t byte = rem & 0x7F;
        rem >>= 7;
        if (rem == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

template <typename Container>
void write_raw(std::vector<uint8_t>& out, const Container& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void write_byte_vec(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    write_short_vec_len(out, bytes.size());
    write_raw(out, bytes);
}

void write_message(std::vector<uint8_t>& out, const TransactionMessage& message) {
    if (message.versioned) {
        write_u8(out, kVersionPrefixMask);
    }
    write_u8(out, message.header.num_required_signatures);
    write_u8(out, message.header.num_readonly_signed_accounts);
    write_u8(out, message.header.num_readonly_unsigned_accounts);

    write_short_vec_len(out, message.account_keys.size());
    for (const auto& key : message.account_keys) {
        write_raw(out, key);
    }
    write_raw(out, message.recent_blockhash);

    write_short_vec_len(out, message.instructions.size());
    for (const auto& ix : message.instructions) {
        write_u8(out, ix.program_id_index);
        write_byte_vec(out, ix.accounts);
        write_byte_vec(out, ix.data);
    }

    if (message.versioned) {
        write_short_vec_len(out, message.address_table_lookups.size());
        for (const auto& lookup : message.address_table_lookups) {
            write_raw(out, lookup.account_key);
            write_byte_vec(out, lookup.writable_indexes);
            write_byte_vec(out, lookup.readonly_indexes);
        }
    }
}

} // namespace

std::vector<LedgerEntry> decode_entries(const std::vector<uint8_t>& payload) {
    return decode_entries(payload.data(), payload.size());
}

std::vector<LedgerEntry> decode_entries(const uint8_t* data, size_t size) {
    BinaryReader reader(data, size);
    std::vector<LedgerEntry> entries;

    try {
        const uint64_t num_entries = reader.read_le<uint64_t>();
        if (num_entries > reader.remaining() / kMinEntrySize) {
            throw DecodeError("Entry count " + std::to_string(num_entries) + " exceeds payload size");
        }
        entries.reserve(static_cast<size_t>(num_entries));

        for (uint64_t i = 0; i < num_entries; ++i) {
            LedgerEntry entry;
            entry.num_hashes = reader.read_le<uint64_t>();
            reader.read(entry.hash);

            const uint64_t num_transactions = reader.read_le<uint64_t>();
            if (num_transactions > reader.remaining() / kMinTransactionSize) {
                throw DecodeError("Transaction count " + std::to_string(num_transactions) +
                                  " exceeds payload size");
            }
            entry.transactions.reserve(static_cast<size_t>(num_transactions));
            for (uint64_t t = 0; t < num_transactions; ++t) {
                entry.transactions.push_back(read_transaction(reader));
            }
            entries.push_back(std::move(entry));
        }
    } catch (const std::out_of_range& e) {
        throw DecodeError(std::string(e.what()) + " at offset " + std::to_string(reader.get_position()));
    }

    if (!reader.at_end()) {
        throw DecodeError(std::to_string(reader.remaining()) + " trailing bytes after last entry");
    }
    return entries;
}

std::vector<uint8_t> encode_entries(const std::vector<LedgerEntry>& entries) {
    std::vector<uint8_t> out;
    write_u64(out, entries.size());
    for (const auto& entry : entries) {
        write_u64(out, entry.num_hashes);
        write_raw(out, entry.hash);
        write_u64(out, entry.transactions.size());
        for (const auto& tx : entry.transactions) {
            write_short_vec_len(out, tx.signatures.size());
            for (const auto& signature : tx.signatures) {
                write_raw(out, signature);
            }
            write_message(out, tx.message);
        }
    }
    return out;
}
