/**
 * @file utils.cpp
 * @brief 유틸리티 함수들의 구현
 * @details 로그 출력, 시간 변환, Base64 인코딩, 보안 메모리 정리 등의 유틸리티 기능을 제공합니다.
 */

#include "utils.hpp"

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace std;

namespace {
bool g_verbose = false;
}

void set_verbose_logging(bool enabled) { g_verbose = enabled; }

bool verbose_logging() { return g_verbose; }

void log_info(const string& message)
{
    if (g_verbose)
    {
        cerr << "[INFO] " << message << endl;
    }
}

void log_warning(const string& message) { cerr << "[WARNING] " << message << endl; }

void log_error(const string& message) { cerr << "[ERROR] " << message << endl; }

int64_t unix_now() { return to_unix_seconds(chrono::system_clock::now()); }

int64_t to_unix_seconds(chrono::system_clock::time_point when)
{
    return chrono::floor<chrono::seconds>(when.time_since_epoch()).count();
}

bool parse_local_timestamp(const string& text, int64_t& seconds)
{
    tm local_tm = {};
    istringstream input(text);
    input >> get_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    if (input.fail())
    {
        return false;
    }
    // 남은 문자가 있으면 형식 오류
    char extra;
    if (input >> extra)
    {
        return false;
    }
    local_tm.tm_isdst = -1;
    time_t converted = mktime(&local_tm);
    if (converted == static_cast<time_t>(-1))
    {
        return false;
    }
    seconds = static_cast<int64_t>(converted);
    return true;
}

/**
 * @brief 바이트 배열을 Base64 문자열로 인코딩합니다.
 * @param in 인코딩할 바이트 배열
 * @return Base64로 인코딩된 문자열
 */
string base64_encode(const vector<unsigned char>& in)
{
    string out;
    const string b64_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                             "abcdefghijklmnopqrstuvwxyz"
                             "0123456789+/";

    int val = 0, valb = -6;
    for (unsigned char c : in)
    {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0)
        {
            out.push_back(b64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6)
        out.push_back(b64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4)
        out.push_back('=');
    return out;
}

string to_lower(string text)
{
    transform(text.begin(), text.end(), text.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return text;
}

string to_upper(string text)
{
    transform(text.begin(), text.end(), text.begin(),
              [](unsigned char c) { return static_cast<char>(toupper(c)); });
    return text;
}

string trim(const string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == string::npos)
    {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

/**
 * @brief 민감한 문자열을 안전하게 메모리에서 지웁니다.
 * @param text 지울 문자열 참조
 */
void secure_clear(string& text)
{
    if (!text.empty())
    {
        sodium_memzero(&text[0], text.length());
        text.clear();
    }
}
