#include "Base58.hh"

#include <algorithm>
#include <cstring>

namespace {

const char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int alphabet_index(char c) {
    const char* p = std::strchr(kAlphabet, c);
    if (c == '\0' || p == nullptr) {
        return -1;
    }
    return static_cast<int>(p - kAlphabet);
}

} // namespace

std::string base58_encode(const uint8_t* data, size_t size) {
    size_t zeros = 0;
    while (zeros < size && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) is a bit under 1.37
    std::vector<uint8_t> digits((size - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < size; ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }
    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += kAlphabet[*it];
    }
    return result;
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    return base58_encode(data.data(), data.size());
}

std::string base58_encode(const Address& address) {
    return base58_encode(address.data(), address.size());
}

bool base58_decode(const std::string& text, std::vector<uint8_t>& out) {
    size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') {
        ++ones;
    }

    // log(58) / log(256) is a bit under 0.733
    std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = ones; i < text.size(); ++i) {
        int carry = alphabet_index(text[i]);
        if (carry < 0) {
            return false;
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }
    out.assign(ones, 0);
    out.insert(out.end(), it, bytes.end());
    return true;
}

bool parse_address(const std::string& text, Address& address) {
    std::vector<uint8_t> bytes;
    if (!base58_decode(text, bytes) || bytes.size() != address.size()) {
        return false;
    }
    std::copy(bytes.begin(), bytes.end(), address.begin());
    return true;
}
