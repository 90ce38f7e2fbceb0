#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "otp/otp_token.hpp"

using namespace std;

namespace {

Secret ascii_secret(const string& text) { return Secret(vector<unsigned char>(text.begin(), text.end())); }

Token make_token(TokenType type, const string& algorithm, int digits, Secret secret)
{
    Token token;
    token.type = type;
    token.algorithm = algorithm;
    token.digits = digits;
    token.secret = std::move(secret);
    return token;
}

const vector<string> RFC4226_CODES = {"755224", "287082", "359152", "969429", "338314",
                                      "254676", "287922", "162583", "399871", "520489"};

struct TotpVector
{
    int64_t time;
    const char* sha1;
    const char* sha256;
    const char* sha512;
};

const vector<TotpVector> RFC6238_VECTORS = {
    {59, "94287082", "46119246", "90693936"},
    {1111111109, "07081804", "68084774", "25091201"},
    {1111111111, "14050471", "67062674", "99943326"},
    {1234567890, "89005924", "91819424", "93441116"},
    {2000000000, "69279037", "90698825", "38618901"},
    {20000000000, "65353130", "77737706", "47863826"},
};

class FakeSecurid : public SecuridComputer
{
public:
    string now(const Token&) override { return "246810"; }
    optional<int> time_left(const Token&, int64_t) override { return 42; }
};

class BrokenSecurid : public SecuridComputer
{
public:
    string now(const Token&) override { throw runtime_error("seed file missing"); }
    optional<int> time_left(const Token&, int64_t) override { throw runtime_error("seed file missing"); }
};

}  // namespace

// ==================== HOTP ====================

TEST(HotpTest, rfc4226_vectors_with_counter_argument)
{
    Token token = make_token(TokenType::HOTP, "SHA1", 6, Secret::from_hex("3132333435363738393031323334353637383930"));
    for (size_t i = 0; i < RFC4226_CODES.size(); ++i)
    {
        EXPECT_EQ(token.calculate(nullopt, static_cast<int64_t>(i)), RFC4226_CODES[i]) << "counter " << i;
    }
}

TEST(HotpTest, rfc4226_vectors_with_stored_counter)
{
    for (size_t i = 0; i < RFC4226_CODES.size(); ++i)
    {
        Token token =
            make_token(TokenType::HOTP, "SHA1", 6, Secret::from_hex("3132333435363738393031323334353637383930"));
        token.counter = static_cast<int64_t>(i);
        EXPECT_EQ(token.calculate(), RFC4226_CODES[i]) << "counter " << i;
    }
}

TEST(HotpTest, counter_argument_overrides_stored_counter)
{
    Token token = make_token(TokenType::HOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    token.counter = 5;
    EXPECT_EQ(token.calculate(), "254676");
    EXPECT_EQ(token.calculate(nullopt, 7), "162583");
    EXPECT_EQ(token.counter, 5);
}

TEST(HotpTest, missing_counter_uses_zero)
{
    Token token = make_token(TokenType::HOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(), "755224");
}

TEST(HotpTest, time_left_is_empty)
{
    Token token = make_token(TokenType::HOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_FALSE(token.time_left(1000000020).has_value());
    EXPECT_EQ(token.spinner("abcde", 1000000020), "");
}

TEST(HotpTest, md5_codes)
{
    Token token = make_token(TokenType::HOTP, "MD5", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(nullopt, 1), "532013");
    EXPECT_EQ(token.calculate(nullopt, 3), "848120");
}

TEST(HotpTest, md5_offset_past_digest_reads_zero_bytes)
{
    // MD5 다이제스트는 16바이트: 카운터 0은 offset 15, 카운터 4는 offset 13
    Token token = make_token(TokenType::HOTP, "MD5", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(nullopt, 0), "270976");
    EXPECT_EQ(token.calculate(nullopt, 4), "488896");
}

// ==================== TOTP ====================

TEST(TotpTest, rfc6238_vectors)
{
    Token sha1 = make_token(TokenType::TOTP, "SHA1", 8, ascii_secret("12345678901234567890"));
    Token sha256 = make_token(TokenType::TOTP, "SHA256", 8, ascii_secret("12345678901234567890123456789012"));
    Token sha512 = make_token(TokenType::TOTP, "SHA512", 8,
                              ascii_secret("1234567890123456789012345678901234567890123456789012345678901234"));
    for (const auto& row : RFC6238_VECTORS)
    {
        EXPECT_EQ(sha1.calculate(row.time), row.sha1) << "T=" << row.time;
        EXPECT_EQ(sha256.calculate(row.time), row.sha256) << "T=" << row.time;
        EXPECT_EQ(sha512.calculate(row.time), row.sha512) << "T=" << row.time;
    }
}

TEST(TotpTest, algorithm_name_is_case_insensitive)
{
    Token token = make_token(TokenType::TOTP, "sha256", 8, ascii_secret("12345678901234567890123456789012"));
    EXPECT_EQ(token.calculate(59), "46119246");
}

TEST(TotpTest, counter_argument_is_ignored)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 8, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(59, 99), "94287082");
}

TEST(TotpTest, accepts_system_clock_time_point)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 8, ascii_secret("12345678901234567890"));
    auto when = chrono::system_clock::from_time_t(1111111109) + chrono::milliseconds(900);
    EXPECT_EQ(token.calculate(when), "07081804");
}

TEST(TotpTest, six_digit_codes_are_zero_padded)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(1111111109), "081804");
}

TEST(TotpTest, ten_digit_codes_keep_leading_zeros)
{
    Token token = make_token(TokenType::TOTP, "SHA1", MAX_DIGITS, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(59), "1094287082");
}

TEST(TotpTest, invalid_parameters_throw)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 0, ascii_secret("12345678901234567890"));
    EXPECT_THROW(token.calculate(59), invalid_argument);

    token.digits = MAX_DIGITS + 1;
    EXPECT_THROW(token.calculate(59), invalid_argument);

    token.digits = 6;
    token.period = 0;
    EXPECT_THROW(token.calculate(59), invalid_argument);
    EXPECT_THROW(token.time_left(59), invalid_argument);
}

TEST(TotpTest, time_left_follows_the_minute)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.time_left(1000000020), 30);
    EXPECT_EQ(token.time_left(1000000035), 15);
    EXPECT_EQ(token.time_left(1000000049), 1);
    EXPECT_EQ(token.time_left(1000000065), 15);
}

TEST(TotpTest, time_left_never_returns_zero)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    for (int64_t t = 1000000000; t < 1000000120; ++t)
    {
        optional<int> left = token.time_left(t);
        ASSERT_TRUE(left.has_value());
        EXPECT_GE(*left, 1);
        EXPECT_LE(*left, token.period);
    }
}

TEST(TotpTest, spinner_maps_time_left_to_glyph)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.spinner("abcde", 1000000020), "e");  // 30초 남음
    EXPECT_EQ(token.spinner("abcde", 1000000035), "c");  // 15초 남음
    EXPECT_EQ(token.spinner("abcde", 1000000049), "a");  // 1초 남음
    EXPECT_EQ(token.spinner("", 1000000020), "");
}

TEST(TotpTest, spinner_splits_utf8_glyphs)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.spinner("◯◔◒◕●", 1000000020), "●");
    EXPECT_EQ(token.spinner("◯◔◒◕●", 1000000049), "◯");
}

// ==================== SecurID ====================

TEST(SecuridTest, without_computer_returns_placeholder)
{
    Token token = make_token(TokenType::SECURID, "SHA1", 8, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(), "????????");
    EXPECT_FALSE(token.time_left(1000000020).has_value());
}

TEST(SecuridTest, invalid_digits_still_return_placeholder)
{
    Token token = make_token(TokenType::SECURID, "SHA1", 0, ascii_secret("12345678901234567890"));
    EXPECT_EQ(token.calculate(), "?");

    token.digits = -5;
    EXPECT_NO_THROW(token.calculate());
    token.digits = 2000000000;
    EXPECT_EQ(token.calculate(), string(MAX_DIGITS, '?'));
}

TEST(SecuridTest, uses_injected_computer)
{
    Token token = make_token(TokenType::SECURID, "SHA1", 6, ascii_secret("12345678901234567890"));
    token.securid = make_shared<FakeSecurid>();
    EXPECT_EQ(token.calculate(), "246810");
    EXPECT_EQ(token.time_left(1000000020), 42);
}

TEST(SecuridTest, computer_failure_returns_placeholder)
{
    Token token = make_token(TokenType::SECURID, "SHA1", 6, ascii_secret("12345678901234567890"));
    token.securid = make_shared<BrokenSecurid>();
    EXPECT_EQ(token.calculate(), "??????");
    EXPECT_FALSE(token.time_left(1000000020).has_value());
}

// ==================== 표시 / 변환 ====================

TEST(TokenTest, to_string_prefers_issuer_and_label)
{
    Token token;
    EXPECT_EQ(token.to_string(), "?");

    token.rowid = 7;
    EXPECT_EQ(token.to_string(), "#7");

    token.label = " alice ";
    EXPECT_EQ(token.to_string(), "alice");

    token.set_issuer(string(" Example "));
    EXPECT_EQ(token.to_string(), "Example:alice");

    token.label.reset();
    EXPECT_EQ(token.to_string(), "Example");
}

TEST(TokenTest, set_issuer_updates_legacy_fields)
{
    Token token;
    token.set_issuer(string("GitHub"));
    EXPECT_EQ(token.issuer, "GitHub");
    EXPECT_EQ(token.issuer_int, "GitHub");
    EXPECT_EQ(token.issuer_ext, "GitHub");

    token.set_issuer(nullopt);
    EXPECT_FALSE(token.issuer_int.has_value());
    EXPECT_FALSE(token.issuer_ext.has_value());
}

TEST(TokenTest, details_lists_every_field)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, Secret::from_base32("JBSWY3DPEHPK3PXP"));
    token.set_issuer(string("Example"));
    token.label = "alice";

    string details = token.details();
    EXPECT_EQ(details.substr(0, details.find('\n')), "Type:      TOTP");
    EXPECT_NE(details.find("Counter:   -"), string::npos);
    EXPECT_NE(details.find("Issuer:    Example"), string::npos);
    EXPECT_NE(details.find("Label:     alice"), string::npos);
    EXPECT_NE(details.find("Period:    30"), string::npos);
    EXPECT_NE(details.find("Secret:    JBSWY3DPEHPK3PXP"), string::npos);
    EXPECT_EQ(details.find("Serial:"), string::npos);
}

TEST(TokenTest, remove_without_store_returns_false)
{
    Token token = make_token(TokenType::TOTP, "SHA1", 6, ascii_secret("12345678901234567890"));
    EXPECT_FALSE(token.remove());
    token.rowid = 1;
    EXPECT_FALSE(token.remove());
}

TEST(TokenTest, to_dict_encodes_secret)
{
    Token token = make_token(TokenType::HOTP, "SHA1", 6, Secret::from_hex("0102ff"));
    token.counter = 3;

    json as_list = token.to_dict();
    EXPECT_EQ(as_list["type"], "HOTP");
    EXPECT_EQ(as_list["counter"], 3);
    EXPECT_EQ(as_list["secret"], json::array({1, 2, 255}));
    EXPECT_TRUE(as_list["issuer"].is_null());

    EXPECT_EQ(token.to_dict(EncodeType::HEX)["secret"], "0102ff");
    EXPECT_EQ(token.to_dict(EncodeType::BASE32)["secret"], "AEBP6===");
}

TEST(TokenTest, parse_token_type_is_case_insensitive)
{
    EXPECT_EQ(parse_token_type("totp"), TokenType::TOTP);
    EXPECT_EQ(parse_token_type("Hotp"), TokenType::HOTP);
    EXPECT_EQ(parse_token_type("SecurID"), TokenType::SECURID);
    EXPECT_THROW(parse_token_type("motp"), InvalidTokenType);
    EXPECT_STREQ(token_type_name(TokenType::SECURID), "SecurID");
}

// ==================== 레코드 ====================

TEST(TokenRecordTest, reads_backup_fields)
{
    json record = {
        {"type", "TOTP"},        {"algo", "SHA256"},     {"digits", 8},   {"period", 60},
        {"issuerInt", "Inside"}, {"issuerExt", "Outside"}, {"label", "bob"}, {"secret", {49, 50, 51}},
    };
    Token token = Token::from_record(record);
    EXPECT_EQ(token.type, TokenType::TOTP);
    EXPECT_EQ(token.algorithm, "SHA256");
    EXPECT_EQ(token.digits, 8);
    EXPECT_EQ(token.period, 60);
    EXPECT_EQ(token.issuer_int, "Inside");
    EXPECT_EQ(token.issuer_ext, "Outside");
    EXPECT_EQ(token.issuer, "Inside");
    EXPECT_EQ(token.label, "bob");
    EXPECT_EQ(token.secret, Secret::from_hex("313233"));
    EXPECT_FALSE(token.rowid.has_value());
}

TEST(TokenRecordTest, zero_or_missing_values_use_defaults)
{
    OtpDefaults defaults;
    defaults.digits = 7;
    defaults.period = 45;
    defaults.algorithm = "SHA512";

    json record = {{"type", "totp"}, {"digits", 0}, {"period", nullptr}, {"secret", "JBSWY3DPEHPK3PXP"}};
    Token token = Token::from_record(record, defaults);
    EXPECT_EQ(token.digits, 7);
    EXPECT_EQ(token.period, 45);
    EXPECT_EQ(token.algorithm, "SHA512");
    EXPECT_FALSE(token.issuer.has_value());
}

TEST(TokenRecordTest, invalid_records_throw)
{
    EXPECT_THROW(Token::from_record({{"secret", "JBSWY3DPEHPK3PXP"}}), InvalidTokenType);
    EXPECT_THROW(Token::from_record({{"type", "motp"}, {"secret", "JBSWY3DPEHPK3PXP"}}), InvalidTokenType);
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}}), FormatError);
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}, {"secret", "!!!"}}), FormatError);
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}, {"digits", "six"}, {"secret", "JBSWY3DP"}}), FormatError);
    EXPECT_THROW(Token::from_record(json::array()), FormatError);
}

TEST(TokenRecordTest, out_of_range_digits_and_period_throw)
{
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}, {"digits", -1}, {"secret", "JBSWY3DP"}}), FormatError);
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}, {"digits", 11}, {"secret", "JBSWY3DP"}}), FormatError);
    EXPECT_THROW(Token::from_record({{"type", "TOTP"}, {"period", -30}, {"secret", "JBSWY3DP"}}), FormatError);
    EXPECT_THROW(Token::from_record({{"type", "HOTP"}, {"period", 4294967296LL}, {"secret", "JBSWY3DP"}}),
                 FormatError);
    EXPECT_EQ(Token::from_record({{"type", "TOTP"}, {"digits", 10}, {"secret", "JBSWY3DP"}}).digits, 10);
}
