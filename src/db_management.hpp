/**
 * @file db_management.hpp
 * @brief 데이터베이스 관리 헤더 파일
 * @details 이 파일은 SQLite 데이터베이스의 token 테이블을 관리하는 TokenStore 클래스와
 *          백업(JSON) 가져오기/내보내기 함수의 선언을 포함합니다.
 */

// SQLite DB token 테이블 관리 모듈

#pragma once
#include <SQLiteCpp/SQLiteCpp.h>  // SQLiteC++ 외부 라이브러리
#include <nlohmann/json.hpp>      // 백업 파일 처리

#include <cstdint>     // int64_t
#include <filesystem>  // 데이터베이스 경로
#include <memory>      // std::shared_ptr
#include <string>      // 문자열 처리 (std::string)
#include <vector>      // 동적 배열 (std::vector)

#include "otp/otp_token.hpp"

/**
 * @brief token 테이블의 컬럼 순서
 * @details SELECT 결과를 레코드(JSON 객체)로 바꿀 때 키로 사용합니다.
 */
extern const std::vector<std::string> TOKEN_COLUMNS;

/**
 * @brief token 테이블을 생성합니다. (이미 있으면 아무 것도 하지 않음)
 * @param db SQLite 데이터베이스 참조
 */
void create_table_token(SQLite::Database& db);

/**
 * @brief 토큰 저장소
 *
 * 하나의 SQLite 파일에 모든 토큰을 저장합니다. 각 작업은 데이터베이스를 열고,
 * 트랜잭션 안에서 작업한 뒤 커밋하고 닫습니다. 호출 사이에 캐시하지 않습니다.
 */
class TokenStore
{
public:
    /**
     * @brief 저장소를 엽니다.
     * @details 상위 디렉터리와 token 테이블이 없으면 생성합니다. 여러 번 열어도 안전합니다.
     * @param path SQLite 데이터베이스 파일 경로
     * @param securid SecurID 계산 모듈 (없으면 nullptr)
     * @throw SQLite::Exception 데이터베이스를 열 수 없는 경우
     */
    explicit TokenStore(std::filesystem::path path, std::shared_ptr<SecuridComputer> securid = nullptr);

    // 읽어온 토큰이 저장소 주소(Token::store)를 가지므로 복사/이동 불가
    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;
    TokenStore(TokenStore&&) = delete;
    TokenStore& operator=(TokenStore&&) = delete;

    /**
     * @brief 저장된 모든 토큰을 저장 순서대로 조회합니다.
     * @return rowid와 저장소 포인터가 설정된 토큰 벡터
     */
    std::vector<Token> list();

    /**
     * @brief 토큰을 추가합니다.
     * @param token 추가할 토큰. 성공하면 rowid와 저장소 포인터가 설정됩니다.
     * @return 새 rowid
     */
    int64_t insert(Token& token);

    /**
     * @brief rowid로 토큰 행 전체를 덮어씁니다.
     * @details 해당 rowid가 없으면 아무 행도 바뀌지 않습니다.
     * @param token 수정할 토큰 (rowid 필수)
     * @return 수정된 행이 있으면 true
     */
    bool update(const Token& token);

    /**
     * @brief rowid로 토큰을 삭제합니다. 없는 rowid는 무시합니다.
     * @param rowid 삭제할 행 번호
     */
    void remove(int64_t rowid);

    /**
     * @brief token 테이블을 삭제하고 다시 생성합니다.
     */
    void truncate();

    /**
     * @brief 라벨 부분 문자열(대소문자 무시) 또는 otpauth:// URI로 토큰을 찾습니다.
     * @param queries 검색어 목록
     * @param defaults URI로 만드는 토큰의 기본값
     * @return URI 토큰(저장되지 않음) 다음에 검색어와 일치하는 저장된 토큰
     */
    std::vector<Token> find(const std::vector<std::string>& queries,
                            const OtpDefaults& defaults = OtpDefaults());

    /**
     * @brief list() 기준 순번(1부터)으로 토큰을 조회합니다.
     * @throw std::out_of_range 해당 순번의 토큰이 없는 경우
     */
    Token get_token(size_t index);

    /**
     * @brief 백업 문서의 토큰을 가져옵니다.
     * @details 하나의 트랜잭션으로 처리하며, 잘못된 레코드가 하나라도 있으면 전체를 취소합니다.
     * @param backup {"tokenOrder": [...], "tokens": [...]} 형식의 JSON
     * @param delete_existing true이면 기존 토큰을 모두 삭제한 뒤 가져옴
     * @return 가져온 토큰 수
     * @throw FormatError, InvalidTokenType 레코드가 잘못된 경우
     */
    int import_backup(const nlohmann::json& backup, bool delete_existing = false);

    /**
     * @brief 백업 파일의 토큰을 가져옵니다.
     * @see import_backup
     */
    int import_backup_file(const std::filesystem::path& backup_path, bool delete_existing = false);

    /**
     * @brief 모든 토큰을 백업 문서로 변환합니다.
     */
    nlohmann::json export_backup();

    /**
     * @brief 모든 토큰을 백업 파일로 저장합니다.
     * @return 내보낸 토큰 수
     */
    int export_backup_file(const std::filesystem::path& backup_path);

    const std::filesystem::path& path() const { return m_path; }

private:
    SQLite::Database open_db() const;
    Token token_from_row(SQLite::Statement& query);

    std::filesystem::path m_path;
    std::shared_ptr<SecuridComputer> m_securid;
};
