/**
 * @file handshake.cpp
 * @brief ARSDK TCP handshake payload codec implementation
 *
 * The scanner is a small JSON tokenizer that only tracks what it needs:
 * string boundaries (with escapes), nesting depth, and whether the string
 * just closed at depth 1 is followed by a ':' (i.e. is a key).
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "handshake.hpp"
#include <cstdio>
#include <cstring>

namespace sumo_mitm::protocol {

namespace {

bool is_space(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(uint8_t c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief Parse the value token starting at pos
 */
HandshakeResult parse_port_value(const uint8_t* data, size_t end, size_t pos, PortField& field) {
    while (pos < end && is_space(data[pos])) {
        pos++;
    }

    if (pos >= end) {
        return HandshakeResult::InvalidValue;
    }

    if (data[pos] == '-') {
        // "-0" is still not a port anyone listens on
        return (pos + 1 < end && is_digit(data[pos + 1]))
            ? HandshakeResult::ValueOutOfRange
            : HandshakeResult::InvalidValue;
    }

    if (!is_digit(data[pos])) {
        return HandshakeResult::InvalidValue;
    }

    size_t start = pos;
    uint32_t value = 0;
    bool overflow = false;
    while (pos < end && is_digit(data[pos])) {
        value = value * 10 + (data[pos] - '0');
        if (value > 65535) {
            overflow = true;
            value = 65536;  // keep accumulating digits without wrapping
        }
        pos++;
    }

    // Fractions and exponents are not ports
    if (pos < end && (data[pos] == '.' || data[pos] == 'e' || data[pos] == 'E')) {
        return HandshakeResult::InvalidValue;
    }

    if (overflow) {
        return HandshakeResult::ValueOutOfRange;
    }

    field.offset = start;
    field.length = pos - start;
    field.value = static_cast<uint16_t>(value);
    return HandshakeResult::Success;
}

} // anonymous namespace

bool find_terminator(const uint8_t* data, size_t size, size_t& length) {
    const void* nul = std::memchr(data, HANDSHAKE_TERMINATOR, size);
    if (nul == nullptr) {
        return false;
    }
    length = static_cast<size_t>(static_cast<const uint8_t*>(nul) - data) + 1;
    return true;
}

HandshakeResult find_port_field(const uint8_t* data, size_t size, const char* key, PortField& field) {
    size_t end = 0;
    if (!find_terminator(data, size, end)) {
        return HandshakeResult::Unterminated;
    }
    end -= 1;  // scan stops before the NUL

    const size_t key_len = std::strlen(key);
    int depth = 0;
    size_t pos = 0;
    size_t value_pos = 0;
    bool found = false;

    while (pos < end) {
        uint8_t c = data[pos];

        if (c == '{' || c == '[') {
            depth++;
            pos++;
            continue;
        }
        if (c == '}' || c == ']') {
            depth--;
            pos++;
            continue;
        }
        if (c != '"') {
            pos++;
            continue;
        }

        // String token: find the closing quote, honouring escapes
        size_t str_start = pos + 1;
        size_t str_end = str_start;
        while (str_end < end && data[str_end] != '"') {
            if (data[str_end] == '\\') {
                str_end++;
            }
            str_end++;
        }
        if (str_end >= end) {
            return HandshakeResult::KeyNotFound;  // unterminated string
        }
        pos = str_end + 1;

        if (depth != 1) {
            continue;
        }

        size_t after = pos;
        while (after < end && is_space(data[after])) {
            after++;
        }
        if (after >= end || data[after] != ':') {
            continue;  // a value, not a key
        }

        if (str_end - str_start == key_len &&
            std::memcmp(data + str_start, key, key_len) == 0) {
            value_pos = after + 1;
            found = true;
        }

        pos = after + 1;
    }

    if (!found) {
        return HandshakeResult::KeyNotFound;
    }

    // A repeated key means the last occurrence, as JSON decoders read it
    return parse_port_value(data, end, value_pos, field);
}

HandshakeResult read_port(const std::vector<uint8_t>& payload, const char* key, uint16_t& port) {
    PortField field{};
    HandshakeResult result = find_port_field(payload.data(), payload.size(), key, field);
    if (result == HandshakeResult::Success) {
        port = field.value;
    }
    return result;
}

HandshakeResult rewrite_port(std::vector<uint8_t>& payload, const char* key, uint16_t port) {
    PortField field{};
    HandshakeResult result = find_port_field(payload.data(), payload.size(), key, field);
    if (result != HandshakeResult::Success) {
        return result;
    }

    char digits[8];
    int len = std::snprintf(digits, sizeof(digits), "%u", static_cast<unsigned>(port));

    auto first = payload.begin() + static_cast<std::ptrdiff_t>(field.offset);
    payload.erase(first, first + static_cast<std::ptrdiff_t>(field.length));
    payload.insert(payload.begin() + static_cast<std::ptrdiff_t>(field.offset),
                   digits, digits + len);

    return HandshakeResult::Success;
}

} // namespace sumo_mitm::protocol
