/**
 * @file utils.hpp
 * @brief 유틸리티 함수들의 헤더 파일
 * @details 로그 출력, 시간 변환, Base64 인코딩, 보안 메모리 정리 등의 유틸리티 기능을 선언합니다.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// ==================== 로그 관련 함수 ====================
/**
 * @brief [INFO] 로그 출력 여부를 설정합니다.
 * @param enabled true이면 [INFO] 로그를 표준 에러로 출력
 */
void set_verbose_logging(bool enabled);

/**
 * @brief [INFO] 로그 출력 여부를 반환합니다.
 */
bool verbose_logging();

/**
 * @brief [INFO] 태그를 붙여 표준 에러로 출력합니다. (verbose 모드에서만)
 * @param message 출력할 메시지
 */
void log_info(const std::string& message);

/**
 * @brief [WARNING] 태그를 붙여 표준 에러로 출력합니다.
 * @param message 출력할 메시지
 */
void log_warning(const std::string& message);

/**
 * @brief [ERROR] 태그를 붙여 표준 에러로 출력합니다.
 * @param message 출력할 메시지
 */
void log_error(const std::string& message);

// ==================== 시간 관련 함수 ====================
/**
 * @brief 현재 Unix 시간(초)을 반환합니다.
 */
int64_t unix_now();

/**
 * @brief system_clock 시각을 Unix 시간(초)으로 변환합니다.
 * @details 1초 미만은 버립니다. (음수 시각은 내림)
 */
int64_t to_unix_seconds(std::chrono::system_clock::time_point when);

/**
 * @brief "YYYY-MM-DDTHH:MM:SS" 형식의 로컬 시각 문자열을 Unix 시간(초)으로 변환합니다.
 * @param text 변환할 문자열
 * @param seconds 변환 결과
 * @return 형식이 올바르면 true, 아니면 false
 */
bool parse_local_timestamp(const std::string& text, int64_t& seconds);

// ==================== 인코딩 관련 함수 ====================
/**
 * @brief 바이트 배열을 Base64 문자열로 인코딩합니다.
 * @param in 인코딩할 바이트 배열
 * @return Base64로 인코딩된 문자열
 * @details RFC 4648에 따른 표준 Base64 인코딩을 수행합니다.
 *          패딩 문자('=')를 포함하여 4의 배수 길이로 맞춥니다.
 */
std::string base64_encode(const std::vector<unsigned char>& in);

/**
 * @brief 문자열을 소문자로 변환합니다. (ASCII)
 */
std::string to_lower(std::string text);

/**
 * @brief 문자열을 대문자로 변환합니다. (ASCII)
 */
std::string to_upper(std::string text);

/**
 * @brief 앞뒤 공백을 제거합니다.
 */
std::string trim(const std::string& text);

// ==================== 보안 관련 함수 ====================
/**
 * @brief 민감한 문자열(시크릿, URI 등)을 안전하게 메모리에서 지웁니다.
 * @param text 지울 문자열 참조
 * @details 메모리 덤프나 스왑 파일에서 시크릿이 노출되는 것을 방지하기 위해
 *          메모리를 0으로 덮어쓴 후 문자열을 비웁니다.
 */
void secure_clear(std::string& text);
