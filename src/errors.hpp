/**
 * @file errors.hpp
 * @brief OTP 엔진과 토큰 저장소에서 사용하는 예외 타입
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief 시크릿 인코딩(hex, Base32), URI, 백업 레코드 형식 오류
 */
class FormatError : public std::runtime_error
{
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief TOTP, HOTP, SecurID 이외의 토큰 타입
 */
class InvalidTokenType : public std::runtime_error
{
public:
    explicit InvalidTokenType(const std::string& type)
        : std::runtime_error("알 수 없는 토큰 타입: " + type)
    {
    }
};

/**
 * @brief SecurID 계산 모듈이 주입되지 않은 상태에서 코드 계산을 요청한 경우
 * @details Token::calculate() 내부에서 처리되어 호출자에게 전파되지 않습니다.
 */
class UnsupportedCapability : public std::runtime_error
{
public:
    explicit UnsupportedCapability(const std::string& message) : std::runtime_error(message) {}
};
