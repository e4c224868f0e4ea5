#include <gtest/gtest.h>

#include "BinaryReader.hh"
#include "EntryDecoder.hh"
#include "FeedSimulator.hh"

namespace {

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void put_fill(std::vector<uint8_t>& out, size_t count, uint8_t value) {
    out.insert(out.end(), count, value);
}

// One entry, one legacy transaction, one instruction, written out by hand
std::vector<uint8_t> handmade_payload() {
    std::vector<uint8_t> out;
    put_u64(out, 1);          // entries
    put_u64(out, 5);          // num_hashes
    put_fill(out, 32, 0xAB);  // hash
    put_u64(out, 1);          // transactions
    out.push_back(1);         // signatures
    put_fill(out, 64, 0x11);
    out.insert(out.end(), {1, 0, 1});  // header
    out.push_back(2);                  // account keys
    put_fill(out, 32, 0x01);
    put_fill(out, 32, 0x02);
    put_fill(out, 32, 0x03);           // blockhash
    out.push_back(1);                  // instructions
    out.push_back(1);                  // program_id_index
    out.insert(out.end(), {1, 0});     // accounts
    out.insert(out.end(), {3, 9, 9, 9}); // data
    return out;
}

} // namespace

TEST(EntryDecoder, DecodesHandmadeLegacyTransaction) {
    const auto entries = decode_entries(handmade_payload());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].num_hashes, 5u);
    EXPECT_EQ(entries[0].hash[31], 0xAB);
    ASSERT_EQ(entries[0].transactions.size(), 1u);

    const Transaction& tx = entries[0].transactions[0];
    ASSERT_EQ(tx.signatures.size(), 1u);
    EXPECT_EQ(tx.signatures[0][0], 0x11);
    EXPECT_FALSE(tx.message.versioned);
    EXPECT_EQ(tx.message.header.num_required_signatures, 1);
    EXPECT_EQ(tx.message.header.num_readonly_unsigned_accounts, 1);
    ASSERT_EQ(tx.message.account_keys.size(), 2u);
    EXPECT_EQ(tx.message.account_keys[1][0], 0x02);
    EXPECT_EQ(tx.message.recent_blockhash[0], 0x03);
    ASSERT_EQ(tx.message.instructions.size(), 1u);
    EXPECT_EQ(tx.message.instructions[0].program_id_index, 1);
    EXPECT_EQ(tx.message.instructions[0].accounts, (std::vector<uint8_t>{0}));
    EXPECT_EQ(tx.message.instructions[0].data, (std::vector<uint8_t>{9, 9, 9}));
}

TEST(EntryDecoder, EncoderMatchesHandmadeBytes) {
    const auto entries = decode_entries(handmade_payload());
    EXPECT_EQ(encode_entries(entries), handmade_payload());
}

TEST(EntryDecoder, EmptyBatch) {
    const std::vector<uint8_t> payload(8, 0);
    EXPECT_TRUE(decode_entries(payload).empty());
}

TEST(EntryDecoder, VersionedMessageWithLookups) {
    FeedSimulator simulator(3);
    LedgerEntry entry;
    Transaction tx = simulator.make_filler_transaction();
    tx.message.versioned = true;
    AddressTableLookup lookup;
    lookup.account_key = simulator.random_address();
    lookup.writable_indexes = {1, 4};
    lookup.readonly_indexes = {7};
    tx.message.address_table_lookups.push_back(lookup);
    entry.transactions.push_back(tx);

    const auto decoded = decode_entries(encode_entries({entry}));
    ASSERT_EQ(decoded.size(), 1u);
    const TransactionMessage& message = decoded[0].transactions[0].message;
    EXPECT_TRUE(message.versioned);
    ASSERT_EQ(message.address_table_lookups.size(), 1u);
    EXPECT_EQ(message.address_table_lookups[0].account_key, lookup.account_key);
    EXPECT_EQ(message.address_table_lookups[0].writable_indexes, lookup.writable_indexes);
    EXPECT_EQ(message.address_table_lookups[0].readonly_indexes, lookup.readonly_indexes);
    EXPECT_EQ(message.instructions[0].data, tx.message.instructions[0].data);
}

TEST(EntryDecoder, LongDataUsesMultiByteLength) {
    LedgerEntry entry;
    Transaction tx = FeedSimulator(5).make_filler_transaction();
    tx.message.instructions[0].data.assign(300, 0x5A);
    entry.transactions.push_back(tx);

    const auto payload = encode_entries({entry});
    const auto decoded = decode_entries(payload);
    EXPECT_EQ(decoded[0].transactions[0].message.instructions[0].data.size(), 300u);
}

TEST(EntryDecoder, TruncatedPayloadIsDecodeError) {
    auto payload = handmade_payload();
    for (size_t cut : {size_t(0), size_t(4), size_t(20), payload.size() - 1}) {
        std::vector<uint8_t> truncated(payload.begin(), payload.begin() + cut);
        EXPECT_THROW(decode_entries(truncated), DecodeError) << "cut at " << cut;
    }
}

TEST(EntryDecoder, TrailingBytesAreDecodeError) {
    auto payload = handmade_payload();
    payload.push_back(0);
    EXPECT_THROW(decode_entries(payload), DecodeError);
}

TEST(EntryDecoder, ImplausibleEntryCountIsDecodeError) {
    std::vector<uint8_t> payload;
    put_u64(payload, 1ull << 40);
    put_fill(payload, 64, 0);
    EXPECT_THROW(decode_entries(payload), DecodeError);
}

TEST(EntryDecoder, UnknownMessageVersionIsDecodeError) {
    auto payload = handmade_payload();
    // Header starts after 8 + 8 + 32 + 8 + 1 + 64 bytes
    const size_t message_offset = 8 + 8 + 32 + 8 + 1 + 64;
    payload.insert(payload.begin() + message_offset, 0x81);
    EXPECT_THROW(decode_entries(payload), DecodeError);
}

TEST(EntryDecoder, SameBytesSameResult) {
    FeedSimulator simulator(11);
    const auto payload = encode_entries(simulator.make_batch(ScannerConfig::pump_create().rules[0], 3, 5, 2));
    const auto first = decode_entries(payload);
    const auto second = decode_entries(payload);
    EXPECT_EQ(encode_entries(first), encode_entries(second));
    EXPECT_EQ(encode_entries(first), payload);
}

TEST(BinaryReader, ShortVecLengths) {
    const std::vector<uint8_t> one = {0x05};
    EXPECT_EQ(BinaryReader(one).read_short_vec_len(), 5);
    const std::vector<uint8_t> two = {0x80, 0x01};
    EXPECT_EQ(BinaryReader(two).read_short_vec_len(), 128);
    const std::vector<uint8_t> three = {0xFF, 0xFF, 0x03};
    EXPECT_EQ(BinaryReader(three).read_short_vec_len(), 0xFFFF);
}

TEST(BinaryReader, RejectsBadShortVec) {
    const std::vector<uint8_t> alias = {0x80, 0x00};
    EXPECT_THROW(BinaryReader(alias).read_short_vec_len(), std::out_of_range);
    const std::vector<uint8_t> overflow = {0xFF, 0xFF, 0x04};
    EXPECT_THROW(BinaryReader(overflow).read_short_vec_len(), std::out_of_range);
    const std::vector<uint8_t> too_long = {0x80, 0x80, 0x80, 0x01};
    EXPECT_THROW(BinaryReader(too_long).read_short_vec_len(), std::out_of_range);
}

TEST(BinaryReader, LittleEndianIntegers) {
    const std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    BinaryReader reader(data);
    EXPECT_EQ(reader.read_le<uint16_t>(), 0x0201);
    EXPECT_EQ(reader.read_le<uint32_t>(), 0x06050403u);
    EXPECT_EQ(reader.remaining(), 2u);
    EXPECT_THROW(reader.read_le<uint32_t>(), std::out_of_range);
}
