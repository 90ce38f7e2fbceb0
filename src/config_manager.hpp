/**
 * @file config_manager.hpp
 * @brief 설정 관리 헤더 파일
 * @details 이 파일은 프로그램 설정을 저장하는 구조체와 설정 로드/저장 관련 함수들의 선언을 포함합니다.
 */

#pragma once

#include <filesystem>
#include <string>

#include "otp/otp_token.hpp"

/**
 * @brief 프로그램 설정을 저장하는 구조체
 *
 * .env(환경 변수) 및 config.json에서 로드되는 모든 설정값을 포함합니다.
 */
struct AppConfig
{
    /** @brief 환경 변수 OTPVAULT_DB 또는 기본 경로의 DB 파일 경로 */
    std::filesystem::path db_file;
    /** @brief 환경 변수 OTPVAULT_CONFIG 또는 기본 경로의 설정 파일 경로 */
    std::filesystem::path config_file;

    /** @brief config.json: OTP를 클립보드로 복사 */
    bool copy_to_clipboard = true;
    /** @brief config.json: 목록에 모든 OTP 표시 */
    bool show_codes = false;
    /** @brief config.json: 목록에 남은 시간 표시 */
    bool show_time_left = false;
    /** @brief config.json: 남은 시간 스피너 문자 (빈 문자열이면 사용 안 함) */
    std::string spinner_style;
    /** @brief config.json "defaults": 새 토큰의 기본 알고리즘/자릿수/주기 */
    OtpDefaults otp_defaults;
};

/**
 * @brief 기본 설정 디렉터리 ($XDG_CONFIG_HOME/otpvault 또는 ~/.config/otpvault)
 */
std::filesystem::path default_config_dir();

/**
 * @brief 기본 경로와 환경 변수가 반영된 설정을 만듭니다. (파일은 읽지 않음)
 */
AppConfig default_config();

/**
 * @brief .env 파일을 읽어서 환경 변수로 설정하고 AppConfig에 경로 값을 저장합니다.
 * @param config 결과를 저장할 설정
 * @param env_path .env 파일 경로
 * @return .env 파일을 읽었으면 true, 파일이 없으면 false (오류 아님)
 */
bool load_env_variables(AppConfig& config, const std::filesystem::path& env_path = ".env");

/**
 * @brief config.json 파일을 읽어서 AppConfig에 설정값을 로드합니다.
 * @details 파일이 없으면 기본값을 유지하고 성공으로 처리합니다. 없는 키도 기본값을 유지합니다.
 * @param config 결과를 저장할 설정 (config_file 경로 사용)
 * @return 성공 시 true, 파싱 오류 시 false
 */
bool load_json_config(AppConfig& config);

/**
 * @brief 현재 설정을 config.json 파일에 저장합니다.
 * @param config 저장할 설정 (config_file 경로 사용)
 * @return 성공 시 true, 실패 시 false
 */
bool save_json_config(const AppConfig& config);

/**
 * @brief .env와 config.json 파일을 모두 로드합니다.
 * @param config 결과를 저장할 설정
 * @return 모든 설정이 성공적으로 로드되면 true, 아니면 false
 */
bool load_all_config(AppConfig& config);
