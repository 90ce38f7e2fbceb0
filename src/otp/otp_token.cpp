/**
 * @file otp_token.cpp
 * @brief OTP 토큰 구현 파일
 * @details RFC 4226(HOTP)/RFC 6238(TOTP) 코드 계산과 토큰 레코드 변환을 구현합니다.
 *          HMAC 계산은 OpenSSL을 사용합니다.
 */

#include "otp_token.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "../db_management.hpp"
#include "../utils.hpp"

using namespace std;

// ==================== 타입 / 알고리즘 ====================

const char* token_type_name(TokenType type)
{
    switch (type)
    {
    case TokenType::TOTP:
        return "TOTP";
    case TokenType::HOTP:
        return "HOTP";
    case TokenType::SECURID:
        return "SecurID";
    }
    return "TOTP";
}

TokenType parse_token_type(const string& name)
{
    string upper = to_upper(trim(name));
    if (upper == "TOTP")
        return TokenType::TOTP;
    if (upper == "HOTP")
        return TokenType::HOTP;
    if (upper == "SECURID")
        return TokenType::SECURID;
    throw InvalidTokenType(name);
}

void validate_code_parameters(int64_t digits, int64_t period)
{
    if (digits < 1 || digits > MAX_DIGITS)
    {
        throw FormatError("digits는 1~" + to_string(MAX_DIGITS) + " 범위여야 합니다: " + to_string(digits));
    }
    if (period < 1 || period > numeric_limits<int>::max())
    {
        throw FormatError("period는 1 이상이어야 합니다: " + to_string(period));
    }
}

bool is_supported_algorithm(const string& algorithm)
{
    string upper = to_upper(algorithm);
    return upper == "SHA1" || upper == "SHA256" || upper == "SHA512" || upper == "MD5";
}

namespace {

// 알 수 없는 알고리즘은 SHA1로 계산 (이전 버전에서 저장된 행 호환)
const EVP_MD* digest_for_algorithm(const string& algorithm)
{
    string upper = to_upper(algorithm);
    if (upper == "SHA256")
        return EVP_sha256();
    if (upper == "SHA512")
        return EVP_sha512();
    if (upper == "MD5")
        return EVP_md5();
    if (upper != "SHA1")
    {
        log_warning("지원하지 않는 알고리즘 '" + algorithm + "', SHA1로 계산합니다.");
    }
    return EVP_sha1();
}

// Python 스타일 내림 나눗셈 (음수 시각 처리)
int64_t floor_div(int64_t value, int64_t divisor)
{
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

int64_t positive_mod(int64_t value, int64_t divisor) { return ((value % divisor) + divisor) % divisor; }

// RFC 4226: HMAC + dynamic truncation
string hotp_value(const Secret& secret, int64_t moving_factor, const string& algorithm, int digits)
{
    unsigned char message[8];
    uint64_t value = static_cast<uint64_t>(moving_factor);
    for (int i = 7; i >= 0; --i)
    {
        message[i] = static_cast<unsigned char>(value & 0xFF);
        value >>= 8;
    }

    static const unsigned char empty_key = 0;
    const vector<unsigned char>& key = secret.to_bytes();
    // MD5(16바이트)는 offset + 4가 다이제스트 길이를 넘을 수 있으므로 나머지는 0으로 읽음
    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int digest_len = 0;
    if (HMAC(digest_for_algorithm(algorithm), key.empty() ? &empty_key : key.data(),
             static_cast<int>(key.size()), message, sizeof(message), digest, &digest_len) == nullptr)
    {
        throw runtime_error("HMAC 계산 실패");
    }

    int offset = digest[digest_len - 1] & 0x0F;
    uint32_t code = (static_cast<uint32_t>(digest[offset]) << 24) |
                    (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                    (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                    static_cast<uint32_t>(digest[offset + 3]);
    code &= 0x7FFFFFFF;

    // 31비트 값은 최대 10자리이므로 그 이상은 나머지 연산이 필요 없음
    uint64_t modulus = 1;
    for (int i = 0; i < digits && i < 10; ++i)
    {
        modulus *= 10;
    }

    ostringstream out;
    out << setw(digits) << setfill('0') << (code % modulus);
    return out.str();
}

void check_parameters(const Token& token)
{
    if (token.digits < 1 || token.digits > MAX_DIGITS)
    {
        throw invalid_argument("digits는 1~" + to_string(MAX_DIGITS) + " 범위여야 합니다: " + to_string(token.digits));
    }
    if (token.type == TokenType::TOTP && token.period < 1)
    {
        throw invalid_argument("period는 1 이상이어야 합니다: " + to_string(token.period));
    }
}

string calculate_totp(const Token& token, optional<int64_t> timestamp)
{
    int64_t seconds = timestamp ? *timestamp : unix_now();
    return hotp_value(token.secret, floor_div(seconds, token.period), token.algorithm, token.digits);
}

string calculate_hotp(const Token& token, optional<int64_t> counter)
{
    int64_t value = counter ? *counter : token.counter.value_or(0);
    return hotp_value(token.secret, value, token.algorithm, token.digits);
}

string calculate_securid(const Token& token)
{
    if (!token.securid)
    {
        throw UnsupportedCapability("SecurID 계산 모듈이 없습니다.");
    }
    return token.securid->now(token);
}

// ==================== 레코드 필드 읽기 ====================

const json* find_field(const json& record, const char* key, const char* legacy_key = nullptr)
{
    auto it = record.find(key);
    if (it != record.end() && !it->is_null())
    {
        return &*it;
    }
    if (legacy_key)
    {
        it = record.find(legacy_key);
        if (it != record.end() && !it->is_null())
        {
            return &*it;
        }
    }
    return nullptr;
}

optional<string> string_field(const json& record, const char* key, const char* legacy_key = nullptr)
{
    const json* value = find_field(record, key, legacy_key);
    if (!value)
    {
        return nullopt;
    }
    if (!value->is_string())
    {
        throw FormatError(string("문자열 필드가 아닙니다: ") + key);
    }
    return value->get<string>();
}

optional<int64_t> int_field(const json& record, const char* key)
{
    const json* value = find_field(record, key);
    if (!value)
    {
        return nullopt;
    }
    if (!value->is_number_integer())
    {
        throw FormatError(string("정수 필드가 아닙니다: ") + key);
    }
    return value->get<int64_t>();
}

Secret secret_field(const json& record)
{
    const json* value = find_field(record, "secret");
    if (!value)
    {
        throw FormatError("secret 필드가 없습니다.");
    }
    if (value->is_string())
    {
        return Secret::from_base32(value->get<string>());
    }
    if (value->is_array())
    {
        vector<long long> values;
        values.reserve(value->size());
        for (const auto& item : *value)
        {
            if (!item.is_number_integer())
            {
                throw FormatError("secret 리스트에 정수가 아닌 값이 있습니다.");
            }
            values.push_back(item.get<long long>());
        }
        return Secret::from_int_list(values);
    }
    throw FormatError("secret 필드 형식이 잘못되었습니다.");
}

// SecurID 코드를 계산할 수 없을 때 보여주는 '?' 문자열
string unavailable_code(int digits)
{
    return string(static_cast<size_t>(clamp(digits, 1, MAX_DIGITS)), '?');
}

json optional_to_json(const optional<string>& value) { return value ? json(*value) : json(nullptr); }

}  // namespace

// ==================== 생성 ====================

Token Token::from_record(const json& record, const OtpDefaults& defaults)
{
    if (!record.is_object())
    {
        throw FormatError("토큰 레코드는 JSON 객체여야 합니다.");
    }

    Token token;
    optional<string> type = string_field(record, "type");
    if (!type)
    {
        throw InvalidTokenType("(없음)");
    }
    token.type = parse_token_type(*type);
    token.rowid = int_field(record, "rowid");

    optional<string> algorithm = string_field(record, "algo", "algorithm");
    token.algorithm = (algorithm && !algorithm->empty()) ? *algorithm : defaults.algorithm;
    token.counter = int_field(record, "counter");

    optional<int64_t> digits = int_field(record, "digits");
    optional<int64_t> period = int_field(record, "period");
    int64_t digits_value = (digits && *digits != 0) ? *digits : defaults.digits;
    int64_t period_value = (period && *period != 0) ? *period : defaults.period;
    validate_code_parameters(digits_value, period_value);
    token.digits = static_cast<int>(digits_value);
    token.period = static_cast<int>(period_value);

    // 레거시 레코드의 issuer_int / issuer_ext 값은 서로 달라도 그대로 유지
    token.issuer_int = string_field(record, "issuer_int", "issuerInt");
    token.issuer_ext = string_field(record, "issuer_ext", "issuerExt");
    if (token.issuer_int || token.issuer_ext)
    {
        token.issuer = (token.issuer_int && !token.issuer_int->empty()) ? token.issuer_int : token.issuer_ext;
    }
    else
    {
        token.set_issuer(string_field(record, "issuer"));
    }

    token.label = string_field(record, "label");
    token.exp_date = string_field(record, "exp_date");
    token.pin = string_field(record, "pin");
    token.serial = string_field(record, "serial");
    token.secret = secret_field(record);
    return token;
}

void Token::set_issuer(const optional<string>& value)
{
    issuer = value;
    issuer_int = value;
    issuer_ext = value;
}

// ==================== 코드 계산 ====================

string Token::calculate(optional<int64_t> timestamp, optional<int64_t> counter_override) const
{
    switch (type)
    {
    case TokenType::TOTP:
        check_parameters(*this);
        return calculate_totp(*this, timestamp);
    case TokenType::HOTP:
        check_parameters(*this);
        return calculate_hotp(*this, counter_override);
    case TokenType::SECURID:
        try
        {
            return calculate_securid(*this);
        }
        catch (const exception& e)
        {
            // 목록 출력이 중단되지 않도록 자릿수만큼 '?'를 반환
            log_warning("SecurID 코드를 계산할 수 없습니다 (" + to_string() + "): " + e.what());
            return unavailable_code(digits);
        }
    }
    return unavailable_code(digits);
}

string Token::calculate(chrono::system_clock::time_point when) const
{
    return calculate(to_unix_seconds(when), nullopt);
}

optional<int> Token::time_left(optional<int64_t> for_time) const
{
    int64_t seconds = for_time ? *for_time : unix_now();
    switch (type)
    {
    case TokenType::TOTP:
    {
        if (period < 1)
        {
            throw invalid_argument("period는 1 이상이어야 합니다: " + std::to_string(period));
        }
        int64_t second_of_minute = positive_mod(seconds, 60);
        int result = static_cast<int>(positive_mod(period - second_of_minute, period));
        return result == 0 ? period : result;
    }
    case TokenType::HOTP:
        return nullopt;
    case TokenType::SECURID:
        if (!securid)
        {
            return nullopt;
        }
        try
        {
            return securid->time_left(*this, seconds);
        }
        catch (const exception& e)
        {
            log_warning("SecurID 남은 시간을 계산할 수 없습니다: " + string(e.what()));
            return nullopt;
        }
    }
    return nullopt;
}

string Token::spinner(const string& glyphs, optional<int64_t> for_time) const
{
    if (glyphs.empty() || period < 1)
    {
        return "";
    }
    optional<int> left = time_left(for_time);
    if (!left)
    {
        return "";
    }

    // UTF-8 코드 포인트 단위로 분리
    vector<string> chars;
    for (unsigned char c : glyphs)
    {
        if ((c & 0xC0) != 0x80 || chars.empty())
        {
            chars.emplace_back();
        }
        chars.back().push_back(static_cast<char>(c));
    }

    int64_t count = static_cast<int64_t>(chars.size());
    int64_t index = min<int64_t>(static_cast<int64_t>(*left) * count / period, count - 1);
    return chars[static_cast<size_t>(index)];
}

// ==================== 변환 / 표시 ====================

json Token::to_dict(EncodeType encode_type) const
{
    json data;
    data["type"] = token_type_name(type);
    data["algorithm"] = algorithm;
    data["counter"] = counter ? json(*counter) : json(nullptr);
    data["digits"] = digits;
    data["issuer"] = optional_to_json(issuer);
    data["label"] = optional_to_json(label);
    data["period"] = period;
    switch (encode_type)
    {
    case EncodeType::INT_LIST:
        data["secret"] = secret.to_int_list();
        break;
    case EncodeType::HEX:
        data["secret"] = secret.to_hex();
        break;
    case EncodeType::BASE32:
        data["secret"] = secret.to_base32();
        break;
    }
    if (exp_date)
        data["exp_date"] = *exp_date;
    if (pin)
        data["pin"] = *pin;
    if (serial)
        data["serial"] = *serial;
    return data;
}

string Token::to_json() const { return to_dict().dump(2); }

string Token::details() const
{
    vector<pair<string, string>> fields = {
        {"Type", token_type_name(type)},
        {"Algorithm", algorithm},
        {"Counter", counter ? std::to_string(*counter) : "-"},
        {"Digits", std::to_string(digits)},
        {"Issuer", issuer.value_or("-")},
        {"Label", label.value_or("-")},
        {"Period", std::to_string(period)},
        {"Secret", secret.to_base32()},
    };
    if (exp_date)
        fields.emplace_back("Exp_Date", *exp_date);
    if (pin)
        fields.emplace_back("Pin", *pin);
    if (serial)
        fields.emplace_back("Serial", *serial);

    ostringstream out;
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0)
            out << '\n';
        out << left << setw(10) << (fields[i].first + ":") << ' ' << fields[i].second;
    }
    return out.str();
}

string Token::to_string() const
{
    bool has_issuer = issuer && !issuer->empty();
    bool has_label = label && !label->empty();
    if (has_issuer && has_label)
    {
        return trim(*issuer) + ":" + trim(*label);
    }
    if (has_issuer)
    {
        return trim(*issuer);
    }
    if (has_label)
    {
        return trim(*label);
    }
    if (rowid)
    {
        return "#" + std::to_string(*rowid);
    }
    return "?";
}

bool Token::remove() const
{
    if (!rowid || store == nullptr)
    {
        log_warning("저장소에 연결되지 않은 토큰은 삭제할 수 없습니다: " + to_string());
        return false;
    }
    store->remove(*rowid);
    return true;
}

ostream& operator<<(ostream& os, const Token& token) { return os << token.to_string(); }
