// EntryDecoder.hh
#ifndef ENTRYDECODER_H
#define ENTRYDECODER_H
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "LedgerEntry.hh"

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/*
Decodes a reassembled payload into ledger entries. The payload is a u64 entry count
followed by the entries, integers little-endian, signatures / keys / instructions
prefixed with compact-u16 lengths. Throws DecodeError for anything malformed, including
trailing bytes. The same bytes always produce the same entries or the same error.
*/
std::vector<LedgerEntry> decode_entries(const std::vector<uint8_t>& payload);
std::vector<LedgerEntry> decode_entries(const uint8_t* data, size_t size);

// Inverse of decode_entries, used to build feeds for replay and tests.
std::vector<uint8_t> encode_entries(const std::vector<LedgerEntry>& entries);

#endif
