/**
 * @file handshake_tests.cpp
 * @brief Unit tests for the ARSDK handshake codec
 *
 * Covers terminator detection, top-level field lookup and the in-place
 * port rewrite that must leave every other byte untouched.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "protocol/handshake.hpp"

#include <string>
#include <vector>

using namespace sumo_mitm::protocol;

namespace {

std::vector<uint8_t> message(const std::string& json) {
    std::vector<uint8_t> bytes(json.begin(), json.end());
    bytes.push_back(HANDSHAKE_TERMINATOR);
    return bytes;
}

std::string text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // anonymous namespace

// ============================================================================
// Terminator
// ============================================================================

TEST(terminator_found_with_length_including_nul) {
    const uint8_t data[] = {'{', '}', 0, 'x', 'y'};
    size_t length = 0;
    ASSERT_TRUE(find_terminator(data, sizeof(data), length));
    ASSERT_EQ(length, 3u);
}

TEST(terminator_missing) {
    const uint8_t data[] = {'{', '"', 'a', '"', '}'};
    size_t length = 0;
    ASSERT_FALSE(find_terminator(data, sizeof(data), length));
}

TEST(unterminated_payload_rejected) {
    std::string json = "{\"d2c_port\":54321}";
    std::vector<uint8_t> bytes(json.begin(), json.end());
    uint16_t port = 0;
    ASSERT_EQ(read_port(bytes, D2C_PORT_KEY, port), HandshakeResult::Unterminated);
}

// ============================================================================
// Field lookup
// ============================================================================

TEST(read_client_request_port) {
    auto request = message("{\"controller_type\":\"computer\",\"controller_name\":\"sumo\","
                           "\"d2c_port\":54321}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 54321);
}

TEST(read_device_response_port) {
    auto response = message("{ \"status\": 0, \"c2d_port\" : 54320, \"arstream_fragment_size\": 1000 }");
    uint16_t port = 0;
    ASSERT_EQ(read_port(response, C2D_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 54320);
}

TEST(busy_device_reports_zero) {
    auto response = message("{\"status\":-1,\"c2d_port\":0}");
    uint16_t port = 1;
    ASSERT_EQ(read_port(response, C2D_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, DEVICE_BUSY_PORT);
}

TEST(key_missing) {
    auto request = message("{\"controller_type\":\"computer\"}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::KeyNotFound);
}

TEST(nested_key_ignored) {
    auto request = message("{\"extra\":{\"d2c_port\":1},\"d2c_port\":54321}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 54321);
}

TEST(key_text_inside_string_value_ignored) {
    auto request = message("{\"name\":\"\\\"d2c_port\\\":7\",\"d2c_port\":54321}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 54321);
}

TEST(string_value_is_invalid) {
    auto request = message("{\"d2c_port\":\"54321\"}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::InvalidValue);
}

TEST(fraction_is_invalid) {
    auto request = message("{\"d2c_port\":5432.1}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::InvalidValue);
}

TEST(negative_is_out_of_range) {
    auto request = message("{\"d2c_port\":-5}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::ValueOutOfRange);
}

TEST(too_large_is_out_of_range) {
    auto request = message("{\"d2c_port\":65536}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::ValueOutOfRange);
}

TEST(repeated_key_reads_last_occurrence) {
    auto request = message("{\"d2c_port\":1111,\"x\":{\"d2c_port\":3},\"d2c_port\":2222}");
    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 2222);
}

TEST(bytes_after_terminator_not_scanned) {
    std::vector<uint8_t> bytes = message("{\"a\":1}");
    std::string tail = "{\"d2c_port\":1}";
    bytes.insert(bytes.end(), tail.begin(), tail.end());
    uint16_t port = 0;
    ASSERT_EQ(read_port(bytes, D2C_PORT_KEY, port), HandshakeResult::KeyNotFound);
}

// ============================================================================
// Rewrite
// ============================================================================

TEST(rewrite_changes_only_the_digits) {
    auto request = message("{\"controller_type\":\"computer\",\"d2c_port\":54321,\"z\":true}");
    ASSERT_EQ(rewrite_port(request, D2C_PORT_KEY, 54322), HandshakeResult::Success);
    ASSERT_TRUE(text(request) ==
                std::string("{\"controller_type\":\"computer\",\"d2c_port\":54322,\"z\":true}") +
                std::string(1, '\0'));
}

TEST(rewrite_keeps_whitespace_around_value) {
    auto response = message("{ \"c2d_port\" :  54320 , \"status\": 0 }");
    ASSERT_EQ(rewrite_port(response, C2D_PORT_KEY, 54319), HandshakeResult::Success);
    ASSERT_TRUE(text(response) ==
                std::string("{ \"c2d_port\" :  54319 , \"status\": 0 }") + std::string(1, '\0'));
}

TEST(rewrite_grows_payload_by_digit_difference) {
    auto request = message("{\"d2c_port\":9999}");
    size_t before = request.size();
    ASSERT_EQ(rewrite_port(request, D2C_PORT_KEY, 10000), HandshakeResult::Success);
    ASSERT_EQ(request.size(), before + 1);

    uint16_t port = 0;
    ASSERT_EQ(read_port(request, D2C_PORT_KEY, port), HandshakeResult::Success);
    ASSERT_EQ(port, 10000);
}

TEST(rewrite_shrinks_payload_by_digit_difference) {
    auto response = message("{\"c2d_port\":10000}");
    size_t before = response.size();
    ASSERT_EQ(rewrite_port(response, C2D_PORT_KEY, 9999), HandshakeResult::Success);
    ASSERT_EQ(response.size(), before - 1);
    ASSERT_EQ(response.back(), HANDSHAKE_TERMINATOR);
}

TEST(rewrite_repeated_key_touches_last_only) {
    auto request = message("{\"d2c_port\":1111,\"d2c_port\":2222}");
    ASSERT_EQ(rewrite_port(request, D2C_PORT_KEY, 2223), HandshakeResult::Success);
    ASSERT_TRUE(text(request) ==
                std::string("{\"d2c_port\":1111,\"d2c_port\":2223}") + std::string(1, '\0'));
}

TEST(rewrite_then_reverse_restores_original) {
    const auto original = message("{\"controller_type\":\"computer\",\"d2c_port\":54321}");
    auto request = original;
    ASSERT_EQ(rewrite_port(request, D2C_PORT_KEY, 54322), HandshakeResult::Success);
    ASSERT_EQ(rewrite_port(request, D2C_PORT_KEY, 54321), HandshakeResult::Success);
    ASSERT_TRUE(request == original);
}

TEST(rewrite_missing_key_leaves_payload) {
    const auto original = message("{\"status\":0}");
    auto response = original;
    ASSERT_EQ(rewrite_port(response, C2D_PORT_KEY, 1), HandshakeResult::KeyNotFound);
    ASSERT_TRUE(response == original);
}

TEST(result_strings) {
    ASSERT_STREQ(handshake_result_to_string(HandshakeResult::Success), "Success");
    ASSERT_STREQ(handshake_result_to_string(HandshakeResult::KeyNotFound), "KeyNotFound");
}

int main() {
    return run_all_tests("Handshake");
}
