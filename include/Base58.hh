// Base58.hh
#ifndef BASE58_H
#define BASE58_H
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "LedgerEntry.hh"

// Bitcoin alphabet, the textual form of addresses and signatures on the feed.
std::string base58_encode(const uint8_t* data, size_t size);
std::string base58_encode(const std::vector<uint8_t>& data);
std::string base58_encode(const Address& address);

// Returns false on characters outside the alphabet.
bool base58_decode(const std::string& text, std::vector<uint8_t>& out);

// Decodes exactly 32 bytes. Returns false for bad characters or the wrong length.
bool parse_address(const std::string& text, Address& address);

#endif
