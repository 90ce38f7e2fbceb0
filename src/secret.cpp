/**
 * @file secret.cpp
 * @brief OTP 공유 시크릿 구현 파일
 * @details hex 변환은 libsodium을, Base32 변환은 RFC 4648 알파벳을 직접 사용합니다.
 */

#include "secret.hpp"

#include <sodium.h>

#include <cctype>

using namespace std;

namespace {

const char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

// libsodium 초기화 (여러 번 호출해도 안전)
void ensure_sodium()
{
    static const int sodium_status = sodium_init();
    if (sodium_status < 0)
    {
        throw runtime_error("libsodium 초기화 실패");
    }
}

int base32_value(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= '2' && c <= '7')
        return c - '2' + 26;
    return -1;
}

}  // namespace

Secret::Secret(vector<unsigned char> bytes) : m_bytes(std::move(bytes)) {}

Secret::~Secret() { wipe(); }

Secret& Secret::operator=(const Secret& other)
{
    if (this != &other)
    {
        wipe();
        m_bytes = other.m_bytes;
    }
    return *this;
}

Secret& Secret::operator=(Secret&& other) noexcept
{
    if (this != &other)
    {
        wipe();
        m_bytes = std::move(other.m_bytes);
        other.m_bytes.clear();
    }
    return *this;
}

void Secret::wipe() noexcept
{
    if (!m_bytes.empty())
    {
        sodium_memzero(m_bytes.data(), m_bytes.size());
    }
}

Secret Secret::from_hex(const string& hex)
{
    ensure_sodium();
    vector<unsigned char> bytes(hex.size() / 2 + 1);
    size_t bin_len = 0;
    const char* hex_end = nullptr;

    // 공백은 건너뛰고, 그 외의 문자가 나오면 hex_end가 문자열 끝에 도달하지 못함
    int result = sodium_hex2bin(bytes.data(), bytes.size(), hex.c_str(), hex.size(), " \t\r\n",
                                &bin_len, &hex_end);
    if (result != 0 || hex_end != hex.c_str() + hex.size())
    {
        sodium_memzero(bytes.data(), bytes.size());
        throw FormatError("잘못된 hex 시크릿");
    }
    bytes.resize(bin_len);
    return Secret(std::move(bytes));
}

Secret Secret::from_base32(const string& base32)
{
    string normalized;
    normalized.reserve(base32.size() + 8);
    for (unsigned char c : base32)
    {
        if (isspace(c))
            continue;
        normalized.push_back(static_cast<char>(toupper(c)));
    }
    if (normalized.size() % 8)
    {
        normalized.append(8 - normalized.size() % 8, '=');
    }

    // '='는 끝에만 올 수 있고, 마지막 블록의 패딩 개수는 0, 1, 3, 4, 6 중 하나여야 함
    size_t data_len = normalized.find('=');
    if (data_len == string::npos)
    {
        data_len = normalized.size();
    }
    size_t padding = normalized.size() - data_len;
    bool padding_ok = normalized.find_first_not_of('=', data_len) == string::npos &&
                      padding != 2 && padding != 5 && padding < 7;
    if (!padding_ok)
    {
        if (!normalized.empty())
            sodium_memzero(&normalized[0], normalized.size());
        throw FormatError("잘못된 Base32 패딩");
    }

    vector<unsigned char> bytes;
    bytes.reserve(data_len * 5 / 8);
    unsigned int buffer = 0;
    int bits_left = 0;
    for (size_t i = 0; i < data_len; ++i)
    {
        int value = base32_value(normalized[i]);
        if (value < 0)
        {
            sodium_memzero(&normalized[0], normalized.size());
            if (!bytes.empty())
                sodium_memzero(bytes.data(), bytes.size());
            throw FormatError("잘못된 Base32 문자");
        }
        buffer = ((buffer << 5) | static_cast<unsigned int>(value)) & 0xFFFF;
        bits_left += 5;
        if (bits_left >= 8)
        {
            bytes.push_back(static_cast<unsigned char>((buffer >> (bits_left - 8)) & 0xFF));
            bits_left -= 8;
        }
    }
    sodium_memzero(&normalized[0], normalized.size());
    return Secret(std::move(bytes));
}

Secret Secret::from_int_list(const vector<long long>& values)
{
    vector<unsigned char> bytes;
    bytes.reserve(values.size());
    for (long long value : values)
    {
        bytes.push_back(static_cast<unsigned char>(((value % 256) + 256) % 256));
    }
    return Secret(std::move(bytes));
}

string Secret::to_hex() const
{
    ensure_sodium();
    string hex(m_bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), m_bytes.data(), m_bytes.size());
    hex.resize(m_bytes.size() * 2);
    return hex;
}

string Secret::to_base32() const
{
    string out;
    out.reserve((m_bytes.size() + 4) / 5 * 8);

    unsigned int buffer = 0;
    int bits_left = 0;
    for (unsigned char c : m_bytes)
    {
        buffer = ((buffer << 8) | c) & 0xFFFF;
        bits_left += 8;
        while (bits_left >= 5)
        {
            out.push_back(BASE32_ALPHABET[(buffer >> (bits_left - 5)) & 0x1F]);
            bits_left -= 5;
        }
    }
    if (bits_left > 0)
    {
        out.push_back(BASE32_ALPHABET[(buffer << (5 - bits_left)) & 0x1F]);
    }
    while (out.size() % 8)
    {
        out.push_back('=');
    }
    return out;
}

vector<int> Secret::to_int_list() const { return vector<int>(m_bytes.begin(), m_bytes.end()); }

bool Secret::operator==(const Secret& other) const
{
    if (m_bytes.size() != other.m_bytes.size())
    {
        return false;
    }
    if (m_bytes.empty())
    {
        return true;
    }
    return sodium_memcmp(m_bytes.data(), other.m_bytes.data(), m_bytes.size()) == 0;
}
