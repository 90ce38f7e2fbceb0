/**
 * @file otp_uri.cpp
 * @brief otpauth:// URI 변환 구현 파일
 * @details libcurl의 URL API(curl_url)로 URI를 분해하고, curl_easy_escape/unescape로
 *          퍼센트 인코딩을 처리합니다.
 *
 * 형식: otpauth://{totp|hotp|securid}/{issuer:label}?algorithm=SHA1&digits=6&period=30&secret=BASE32
 */

#include <curl/curl.h>

#include <map>
#include <memory>
#include <sstream>

#include "../utils.hpp"
#include "otp_token.hpp"

using namespace std;

namespace {

struct CurlUrlDeleter
{
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

struct CurlEasyDeleter
{
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlFreeDeleter
{
    void operator()(char* text) const { curl_free(text); }
};

using CurlUrlPtr = unique_ptr<CURLU, CurlUrlDeleter>;
using CurlEasyPtr = unique_ptr<CURL, CurlEasyDeleter>;
using CurlStringPtr = unique_ptr<char, CurlFreeDeleter>;

CurlEasyPtr make_easy_handle()
{
    CurlEasyPtr handle(curl_easy_init());
    if (!handle)
    {
        throw runtime_error("curl_easy_init() 실패");
    }
    return handle;
}

optional<string> url_part(CURLU* url, CURLUPart part, unsigned int flags)
{
    char* raw = nullptr;
    CURLUcode rc = curl_url_get(url, part, &raw, flags);
    if (rc != CURLUE_OK || raw == nullptr)
    {
        return nullopt;
    }
    CurlStringPtr holder(raw);
    return string(raw);
}

string url_escape(CURL* handle, const string& text)
{
    CurlStringPtr escaped(curl_easy_escape(handle, text.c_str(), static_cast<int>(text.size())));
    if (!escaped)
    {
        throw runtime_error("curl_easy_escape() 실패");
    }
    return string(escaped.get());
}

string url_unescape(CURL* handle, string text, bool plus_is_space = true)
{
    // application/x-www-form-urlencoded 규칙: 쿼리의 '+'는 공백
    for (char& c : text)
    {
        if (plus_is_space && c == '+')
            c = ' ';
    }
    int length = 0;
    CurlStringPtr unescaped(curl_easy_unescape(handle, text.c_str(), static_cast<int>(text.size()), &length));
    if (!unescaped)
    {
        throw FormatError("URI 디코딩 실패");
    }
    return string(unescaped.get(), static_cast<size_t>(length));
}

map<string, string> parse_query(CURL* handle, const string& query)
{
    map<string, string> result;
    istringstream input(query);
    string pair;
    while (getline(input, pair, '&'))
    {
        if (pair.empty())
            continue;
        size_t pos = pair.find('=');
        string key = url_unescape(handle, pair.substr(0, pos));
        string value = pos == string::npos ? "" : url_unescape(handle, pair.substr(pos + 1));
        // 같은 키가 여러 번 나오면 마지막 값을 사용
        result[key] = value;
    }
    return result;
}

int64_t query_int(const map<string, string>& query, const string& key, int64_t fallback)
{
    auto it = query.find(key);
    if (it == query.end() || it->second.empty())
    {
        return fallback;
    }
    try
    {
        size_t used = 0;
        long long value = stoll(it->second, &used);
        if (used != it->second.size())
        {
            throw FormatError("URI 파라미터 '" + key + "' 값이 정수가 아닙니다: " + it->second);
        }
        return value;
    }
    catch (const logic_error&)
    {
        throw FormatError("URI 파라미터 '" + key + "' 값이 정수가 아닙니다: " + it->second);
    }
}

}  // namespace

Token Token::from_uri(const string& uri, const OtpDefaults& defaults)
{
    // 인코딩되지 않은 공백은 curl이 거부하므로 미리 인코딩
    string prepared;
    prepared.reserve(uri.size());
    for (char c : trim(uri))
    {
        if (c == ' ')
            prepared += "%20";
        else
            prepared.push_back(c);
    }

    CurlUrlPtr url(curl_url());
    if (!url)
    {
        throw runtime_error("curl_url() 실패");
    }
    CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, prepared.c_str(), CURLU_NON_SUPPORT_SCHEME);
    secure_clear(prepared);
    if (rc != CURLUE_OK)
    {
        throw FormatError(string("URI 해석 실패: ") + curl_url_strerror(rc));
    }

    optional<string> scheme = url_part(url.get(), CURLUPART_SCHEME, 0);
    if (!scheme || to_lower(*scheme) != "otpauth")
    {
        throw FormatError("otpauth URI가 아닙니다.");
    }

    Token token;
    optional<string> host = url_part(url.get(), CURLUPART_HOST, 0);
    token.type = parse_token_type(host.value_or(""));

    CurlEasyPtr easy = make_easy_handle();
    optional<string> raw_query = url_part(url.get(), CURLUPART_QUERY, 0);
    map<string, string> query = raw_query ? parse_query(easy.get(), *raw_query) : map<string, string>();
    if (raw_query)
    {
        secure_clear(*raw_query);
    }

    auto algorithm = query.find("algorithm");
    token.algorithm = (algorithm != query.end() && !algorithm->second.empty()) ? to_upper(algorithm->second)
                                                                              : defaults.algorithm;
    token.counter = query_int(query, "counter", 0);
    int64_t digits = query_int(query, "digits", defaults.digits);
    int64_t period = query_int(query, "period", defaults.period);
    validate_code_parameters(digits, period);
    token.digits = static_cast<int>(digits);
    token.period = static_cast<int>(period);

    // 경로: "/issuer:label" 또는 "/label"
    // 발급자에 포함된 ':'는 %3A로 인코딩되므로 디코딩 전에 나눔
    string path = url_part(url.get(), CURLUPART_PATH, 0).value_or("");
    size_t begin = path.find_first_not_of('/');
    size_t end = path.find_last_not_of('/');
    path = begin == string::npos ? "" : path.substr(begin, end - begin + 1);

    size_t colon = path.find(':');
    if (colon != string::npos)
    {
        token.set_issuer(url_unescape(easy.get(), path.substr(0, colon), false));
        token.label = url_unescape(easy.get(), path.substr(colon + 1), false);
    }
    else
    {
        token.label = url_unescape(easy.get(), path, false);
        auto issuer = query.find("issuer");
        if (issuer != query.end() && !issuer->second.empty())
            token.set_issuer(issuer->second);
        else
            token.set_issuer(nullopt);
    }

    auto secret = query.find("secret");
    if (secret == query.end() || secret->second.empty())
    {
        throw FormatError("URI에 secret 파라미터가 없습니다.");
    }
    token.secret = Secret::from_base32(secret->second);
    secure_clear(secret->second);
    return token;
}

string Token::to_uri() const
{
    CurlEasyPtr easy = make_easy_handle();

    string path;
    for (const optional<string>* part : {&issuer, &label})
    {
        if (!*part || (*part)->empty())
            continue;
        if (!path.empty())
            path += ":";
        path += url_escape(easy.get(), trim(**part));
    }

    string query;
    auto append = [&query](const string& key, const string& value) {
        if (!query.empty())
            query += "&";
        query += key + "=" + value;
    };
    if (!algorithm.empty())
        append("algorithm", url_escape(easy.get(), algorithm));
    if (digits)
        append("digits", std::to_string(digits));
    switch (type)
    {
    case TokenType::HOTP:
        append("counter", std::to_string(counter.value_or(0)));
        break;
    case TokenType::TOTP:
    case TokenType::SECURID:
        if (period)
            append("period", std::to_string(period));
        break;
    }

    string base32 = secret.to_base32();
    base32.erase(base32.find_last_not_of('=') + 1);
    append("secret", base32);
    secure_clear(base32);

    return "otpauth://" + to_lower(token_type_name(type)) + "/" + path + "?" + query;
}
