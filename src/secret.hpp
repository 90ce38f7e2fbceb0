/**
 * @file secret.hpp
 * @brief OTP 공유 시크릿(대칭키) 헤더 파일
 * @details 시크릿 바이트열을 보관하고 hex, Base32, 정수 리스트 형식으로 변환하는 클래스를 선언합니다.
 */

#pragma once

#include <string>
#include <vector>

#include "errors.hpp"

/**
 * @brief OTP 공유 시크릿
 *
 * 생성 후에는 변경되지 않으며, 소멸 시 libsodium으로 메모리를 0으로 덮어씁니다.
 * 두 시크릿은 바이트열이 같을 때만 같습니다.
 */
class Secret
{
public:
    Secret() = default;
    explicit Secret(std::vector<unsigned char> bytes);
    ~Secret();

    Secret(const Secret&) = default;
    Secret(Secret&&) noexcept = default;
    /** @brief 기존 바이트열을 0으로 덮어쓴 뒤 대입합니다. */
    Secret& operator=(const Secret& other);
    Secret& operator=(Secret&& other) noexcept;

    /**
     * @brief hex 문자열에서 시크릿을 생성합니다.
     * @param hex 16진수 문자열 (바이트 사이의 공백 허용)
     * @return 디코딩된 시크릿
     * @throw FormatError 홀수 길이이거나 16진수가 아닌 문자가 있는 경우
     */
    static Secret from_hex(const std::string& hex);

    /**
     * @brief Base32 문자열에서 시크릿을 생성합니다.
     * @details 공백을 제거하고 대문자로 바꾼 뒤 8의 배수가 되도록 '='를 채워서 디코딩합니다.
     * @param base32 Base32 문자열
     * @return 디코딩된 시크릿
     * @throw FormatError RFC 4648 알파벳이 아닌 문자나 잘못된 패딩이 있는 경우
     */
    static Secret from_base32(const std::string& base32);

    /**
     * @brief 정수 리스트에서 시크릿을 생성합니다.
     * @details 각 값은 256으로 나눈 나머지(0~255)로 변환됩니다. [-128,127] 범위의 부호 있는 바이트도 허용합니다.
     * @param values 바이트 값 리스트
     * @return 생성된 시크릿
     */
    static Secret from_int_list(const std::vector<long long>& values);

    /** @brief 소문자 hex 문자열 */
    std::string to_hex() const;
    /** @brief '=' 패딩을 포함한 대문자 Base32 문자열 */
    std::string to_base32() const;
    /** @brief 0~255 범위의 정수 리스트 */
    std::vector<int> to_int_list() const;
    /** @brief 원본 바이트열 */
    const std::vector<unsigned char>& to_bytes() const { return m_bytes; }

    size_t size() const { return m_bytes.size(); }
    bool empty() const { return m_bytes.empty(); }

    bool operator==(const Secret& other) const;
    bool operator!=(const Secret& other) const { return !(*this == other); }

private:
    void wipe() noexcept;

    std::vector<unsigned char> m_bytes;
};
