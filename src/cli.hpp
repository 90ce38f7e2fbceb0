/**
 * @file cli.hpp
 * @brief 명령행 인터페이스 헤더 파일
 * @details otpvault 명령(.ls, .all, .uri, .add, .delete, .import, .export, .help)과
 *          토큰 목록 출력, 클립보드 복사 기능을 제공하는 OtpVault 클래스를 선언합니다.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "db_management.hpp"

constexpr const char* OTPVAULT_VERSION = "1.0.0";

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAIL = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief 명령행 인수 오류 (종료 코드 2)
 */
class ArgumentError : public std::runtime_error
{
public:
    explicit ArgumentError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief 명령 실행기
 *
 * 하나의 TokenStore와 설정(AppConfig)을 가지고 각 명령을 수행합니다.
 * 출력 스트림과 입력 스트림을 주입받으므로 테스트에서 문자열 스트림을 사용할 수 있습니다.
 */
class OtpVault
{
public:
    /**
     * @param config 로드된 설정 (db_file 경로 포함)
     * @param counter -c 옵션의 HOTP 카운터 (없으면 저장된 값)
     * @param timestamp -t 옵션의 TOTP 기준 시각 (없으면 현재 시각)
     * @param out 출력 스트림
     * @param in 삭제 확인 입력 스트림
     * @param terminal true이면 출력이 터미널이므로 클립보드 복사를 허용
     */
    OtpVault(AppConfig config, std::optional<int64_t> counter, std::optional<int64_t> timestamp,
             std::ostream& out = std::cout, std::istream& in = std::cin, bool terminal = false);

    /**
     * @brief 목록 한 줄: "rowid: [코드] [스피너] [남은 시간]  이름"
     */
    std::string format_token(const Token& token) const;

    /**
     * @brief 토큰 목록을 출력합니다.
     * @param calculate true이면 코드를 함께 출력하고 첫 번째 코드를 클립보드로 복사
     * @param long_format 긴 형식 (rowid, 타입, 알고리즘, 자릿수, 주기)
     * @param queries 검색어 (비어 있으면 전체)
     */
    void list(bool calculate, bool long_format, const std::vector<std::string>& queries);

    /**
     * @brief 검색어에 해당하는 토큰의 코드를 출력합니다.
     * @return 출력한 코드 수
     */
    int print_codes(const std::vector<std::string>& queries);

    /**
     * @brief 검색어에 해당하는 토큰의 otpauth:// URI를 출력합니다.
     */
    int print_uris(const std::vector<std::string>& queries);

    /**
     * @brief 토큰을 저장소에 추가합니다.
     */
    void add_token(Token& token);

    /**
     * @brief 검색어에 해당하는 토큰을 삭제합니다.
     * @param force true이면 확인하지 않음
     * @return 삭제한 토큰 수
     */
    int delete_tokens(const std::vector<std::string>& queries, bool force);

    int import_json(const std::filesystem::path& backup_path, bool delete_existing);
    int export_json(const std::filesystem::path& backup_path);

    /**
     * @brief OSC 52 이스케이프 시퀀스로 터미널 클립보드에 복사합니다. (tmux 지원)
     */
    void copy_into_clipboard(const std::string& otp);

    const AppConfig& config() const { return m_config; }
    TokenStore& store() { return m_store; }

private:
    std::vector<Token> select(const std::vector<std::string>& queries);
    std::string code_for(const Token& token) const;
    bool confirm(const std::string& question);

    AppConfig m_config;
    TokenStore m_store;
    std::optional<int64_t> m_counter;
    std::optional<int64_t> m_timestamp;
    std::ostream& m_out;
    std::istream& m_in;
    bool m_terminal;
};

/**
 * @brief 명령행 인수를 해석하고 명령을 실행합니다.
 * @param args 프로그램 이름을 제외한 인수
 * @return 종료 코드 (0 성공, 1 실패, 2 인수 오류)
 */
int run_cli(const std::vector<std::string>& args, std::ostream& out = std::cout,
            std::ostream& err = std::cerr, std::istream& in = std::cin);
