/**
 * @file otp_token.hpp
 * @brief OTP 토큰 헤더 파일
 * @details 등록된 OTP 토큰 하나를 나타내는 Token 구조체와 코드 계산(TOTP/HOTP),
 *          otpauth:// URI 변환, SecurID 계산 모듈 인터페이스를 선언합니다.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../errors.hpp"
#include "../secret.hpp"

class TokenStore;
struct Token;

using json = nlohmann::json;

constexpr int DEFAULT_PERIOD = 30;
constexpr int DEFAULT_DIGITS = 6;
constexpr const char* DEFAULT_ALGORITHM = "SHA1";
constexpr int MAX_DIGITS = 10;  ///< 31비트 코드가 가질 수 있는 최대 자릿수

/**
 * @brief 토큰 생성 시 값이 없는 항목에 사용하는 기본값
 * @details AppConfig에서 읽어 명시적으로 전달합니다.
 */
struct OtpDefaults
{
    int period = DEFAULT_PERIOD;
    int digits = DEFAULT_DIGITS;
    std::string algorithm = DEFAULT_ALGORITHM;
};

/**
 * @brief 토큰 타입 (코드 계산 알고리즘 선택)
 */
enum class TokenType
{
    TOTP,
    HOTP,
    SECURID
};

/**
 * @brief 토큰 dict/json 변환 시 시크릿 인코딩 방식
 */
enum class EncodeType
{
    BASE32,
    HEX,
    INT_LIST
};

/**
 * @brief 토큰 타입 이름 ("TOTP", "HOTP", "SecurID")
 */
const char* token_type_name(TokenType type);

/**
 * @brief 대소문자 구분 없이 토큰 타입 이름을 해석합니다.
 * @throw InvalidTokenType 알 수 없는 이름인 경우
 */
TokenType parse_token_type(const std::string& name);

/**
 * @brief 자릿수와 시간 간격이 허용 범위인지 확인합니다.
 * @details digits는 1~MAX_DIGITS, period는 1~INT_MAX 범위여야 합니다.
 * @throw FormatError 범위를 벗어난 경우
 */
void validate_code_parameters(int64_t digits, int64_t period);

/**
 * @brief 지원하는 해시 알고리즘인지 확인합니다. (SHA1, SHA256, SHA512, MD5)
 */
bool is_supported_algorithm(const std::string& algorithm);

/**
 * @brief SecurID 코드 계산 모듈 인터페이스
 * @details SecurID 알고리즘은 외부 라이브러리에 의존하므로 구현체를 주입받아 사용합니다.
 *          주입되지 않은 경우는 정상적인 상황으로 처리됩니다.
 */
class SecuridComputer
{
public:
    virtual ~SecuridComputer() = default;

    /**
     * @brief 현재 코드를 계산합니다.
     * @param token SecurID 토큰 (시크릿, exp_date, pin, serial 포함)
     * @return 코드 문자열
     */
    virtual std::string now(const Token& token) = 0;

    /**
     * @brief 다음 코드까지 남은 시간(초)을 반환합니다.
     * @param token SecurID 토큰
     * @param for_time 기준 Unix 시간(초)
     */
    virtual std::optional<int> time_left(const Token& token, int64_t for_time) = 0;
};

/**
 * @brief 등록된 OTP 토큰 하나
 *
 * 저장소에서 읽은 토큰은 rowid와 저장소 포인터(store)를 가지며,
 * 메모리에서 만든 토큰은 insert 전까지 rowid가 없습니다.
 */
struct Token
{
    std::optional<int64_t> rowid;          ///< 저장소 행 번호 (저장 전에는 없음)
    TokenType type = TokenType::TOTP;      ///< 토큰 타입
    std::string algorithm = DEFAULT_ALGORITHM;  ///< HMAC 해시 알고리즘
    std::optional<int64_t> counter;        ///< HOTP 카운터
    int digits = DEFAULT_DIGITS;           ///< 코드 자릿수
    std::optional<std::string> issuer_int; ///< 레거시 내부 발급자
    std::optional<std::string> issuer_ext; ///< 레거시 외부 표시 발급자
    std::optional<std::string> issuer;     ///< 발급자
    std::optional<std::string> label;      ///< 계정 라벨
    int period = DEFAULT_PERIOD;           ///< TOTP 시간 간격(초)
    std::optional<std::string> exp_date;   ///< SecurID 만료일
    std::optional<std::string> pin;        ///< SecurID PIN
    std::optional<std::string> serial;     ///< SecurID 시리얼
    Secret secret;                         ///< 공유 시크릿

    /// 이 토큰을 읽어온 저장소 (없으면 nullptr). 소유하지 않으므로 remove()는 저장소가 살아 있을 때만 호출해야 합니다.
    TokenStore* store = nullptr;
    std::shared_ptr<SecuridComputer> securid;   ///< SecurID 계산 모듈 (선택)

    /**
     * @brief 저장소 레코드(컬럼명 또는 백업 필드명을 키로 하는 JSON 객체)에서 토큰을 생성합니다.
     * @details secret은 Base32 문자열 또는 정수 리스트 모두 허용합니다.
     *          issuer_int/issuerInt, issuer_ext/issuerExt, algo/algorithm 키를 모두 인식합니다.
     * @throw InvalidTokenType 타입이 잘못된 경우
     * @throw FormatError 시크릿이 없거나 잘못된 경우, 필드 타입이 맞지 않는 경우
     */
    static Token from_record(const json& record, const OtpDefaults& defaults = OtpDefaults());

    /**
     * @brief otpauth:// URI에서 토큰을 생성합니다.
     * @throw FormatError URI 형식이나 시크릿이 잘못된 경우
     * @throw InvalidTokenType 호스트가 totp/hotp/securid가 아닌 경우
     */
    static Token from_uri(const std::string& uri, const OtpDefaults& defaults = OtpDefaults());

    /**
     * @brief 발급자를 설정하고 레거시 issuer_int/issuer_ext를 함께 맞춥니다.
     */
    void set_issuer(const std::optional<std::string>& value);

    /**
     * @brief OTP 코드를 계산합니다.
     * @param timestamp TOTP 기준 Unix 시간(초). 없으면 현재 시각
     * @param counter HOTP 카운터. 없으면 저장된 카운터
     * @return digits 자리의 0으로 채운 코드. SecurID 계산 불가 시 digits 개의 '?'
     * @throw std::invalid_argument digits 또는 period가 1보다 작은 경우
     */
    std::string calculate(std::optional<int64_t> timestamp = std::nullopt,
                          std::optional<int64_t> counter = std::nullopt) const;

    /**
     * @brief 주어진 시각의 TOTP 코드를 계산합니다.
     */
    std::string calculate(std::chrono::system_clock::time_point when) const;

    /**
     * @brief 다음 코드까지 남은 시간(초)
     * @details 0은 반환하지 않습니다. 주기 경계에서는 period를 반환합니다.
     * @return TOTP는 1~period, HOTP는 값 없음, SecurID는 계산 모듈이 있을 때만 값
     */
    std::optional<int> time_left(std::optional<int64_t> for_time = std::nullopt) const;

    /**
     * @brief 남은 시간을 스피너 문자 하나로 표시합니다.
     * @param glyphs UTF-8 스피너 문자들
     * @param for_time 기준 Unix 시간(초). 없으면 현재 시각
     * @return 선택된 문자. glyphs가 비었거나 남은 시간이 없으면 빈 문자열
     */
    std::string spinner(const std::string& glyphs, std::optional<int64_t> for_time = std::nullopt) const;

    /**
     * @brief otpauth:// URI로 변환합니다.
     */
    std::string to_uri() const;

    /**
     * @brief 토큰을 JSON 객체로 변환합니다.
     * @param encode_type 시크릿 인코딩 방식
     */
    json to_dict(EncodeType encode_type = EncodeType::INT_LIST) const;

    /**
     * @brief 토큰을 들여쓰기 된 JSON 문자열로 변환합니다.
     */
    std::string to_json() const;

    /**
     * @brief 모든 필드를 "Key:      value" 형식의 여러 줄 문자열로 반환합니다. (시크릿은 Base32)
     */
    std::string details() const;

    /**
     * @brief 표시용 이름: "issuer:label", "#rowid" 또는 "?"
     */
    std::string to_string() const;

    /**
     * @brief 저장소에서 이 토큰을 삭제합니다.
     * @return rowid와 저장소가 모두 있어 삭제를 수행했으면 true
     */
    bool remove() const;
};

std::ostream& operator<<(std::ostream& os, const Token& token);
