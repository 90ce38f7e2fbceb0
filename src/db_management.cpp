/**
 * @file db_management.cpp
 * @brief 데이터베이스 관리 구현 파일
 * @details SQLiteC++로 token 테이블을 관리하고, nlohmann json으로 백업 파일을 읽고 씁니다.
 */

#include "db_management.hpp"

#include <fstream>
#include <iostream>

#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

const vector<string> TOKEN_COLUMNS = {
    "rowid", "type",  "algo",     "counter", "digits", "issuer_int", "issuer_ext",
    "label", "period", "exp_date", "pin",     "serial", "secret",
};

namespace {

const char* SQL_DROP_TOKEN_TABLE = "DROP TABLE IF EXISTS token";

const char* SQL_INSERT_TOKEN =
    "INSERT INTO token (type, algo, counter, digits, issuer_int, issuer_ext, label, period, "
    "exp_date, pin, serial, secret) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

const char* SQL_UPDATE_TOKEN =
    "UPDATE token SET type = ?, algo = ?, counter = ?, digits = ?, issuer_int = ?, issuer_ext = ?, "
    "label = ?, period = ?, exp_date = ?, pin = ?, serial = ?, secret = ? "
    "WHERE rowid = ?";

const char* SQL_SELECT_TOKENS =
    "SELECT rowid, type, algo, counter, digits, issuer_int, issuer_ext, label, period, "
    "exp_date, pin, serial, secret FROM token ORDER BY rowid";

void bind_optional(SQLite::Statement& query, int index, const optional<string>& value)
{
    if (value)
        query.bind(index, *value);
    else
        query.bind(index);
}

// INSERT / UPDATE 공통 컬럼 1~12 바인딩
void bind_token_columns(SQLite::Statement& query, const Token& token)
{
    // 범위를 벗어난 값이 저장되면 목록 전체의 코드 계산이 실패함
    validate_code_parameters(token.digits, token.period);
    query.bind(1, string(token_type_name(token.type)));
    query.bind(2, token.algorithm);
    if (token.counter)
        query.bind(3, static_cast<int64_t>(*token.counter));
    else
        query.bind(3);
    query.bind(4, token.digits);
    bind_optional(query, 5, token.issuer_int);
    bind_optional(query, 6, token.issuer_ext);
    bind_optional(query, 7, token.label);
    query.bind(8, token.period);
    bind_optional(query, 9, token.exp_date);
    bind_optional(query, 10, token.pin);
    bind_optional(query, 11, token.serial);
    query.bind(12, token.secret.to_base32());
}

void insert_token_row(SQLite::Database& db, const Token& token)
{
    // SQL 인젝션 방지를 위해 Prepared Statement 사용 (시크릿이 포함되므로 SQL은 출력하지 않음)
    SQLite::Statement query(db, SQL_INSERT_TOKEN);
    bind_token_columns(query, token);
    query.exec();
}

// 백업 파일 레코드: 레거시 issuerInt / issuerExt 필드와 정수 리스트 시크릿
json backup_record(const Token& token)
{
    json record;
    record["type"] = token_type_name(token.type);
    record["algo"] = token.algorithm;
    record["counter"] = token.counter ? json(*token.counter) : json(nullptr);
    record["digits"] = token.digits;
    optional<string> issuer_int = token.issuer_int ? token.issuer_int : token.issuer;
    optional<string> issuer_ext = token.issuer_ext ? token.issuer_ext : token.issuer;
    record["issuerInt"] = issuer_int ? json(*issuer_int) : json(nullptr);
    record["issuerExt"] = issuer_ext ? json(*issuer_ext) : json(nullptr);
    record["label"] = token.label ? json(*token.label) : json(nullptr);
    record["period"] = token.period;
    record["secret"] = token.secret.to_int_list();
    if (token.exp_date)
        record["exp_date"] = *token.exp_date;
    if (token.pin)
        record["pin"] = *token.pin;
    if (token.serial)
        record["serial"] = *token.serial;
    return record;
}

}  // namespace

///////////////////////////////////////////////
// token 테이블

void create_table_token(SQLite::Database& db)
{
    db.exec(
        "CREATE TABLE IF NOT EXISTS token ("
        "type TEXT, "
        "algo TEXT, "
        "counter INTEGER, "
        "digits INTEGER, "
        "issuer_int TEXT, "
        "issuer_ext TEXT, "
        "label TEXT, "
        "period INTEGER, "
        "exp_date TEXT, "   // SecurID 만료일
        "pin TEXT, "        // SecurID PIN
        "serial TEXT, "     // SecurID 시리얼
        "secret TEXT)");    // Base32
}

TokenStore::TokenStore(filesystem::path path, shared_ptr<SecuridComputer> securid)
    : m_path(std::move(path)), m_securid(std::move(securid))
{
    if (m_path.has_parent_path())
    {
        filesystem::create_directories(m_path.parent_path());
    }
    SQLite::Database db = open_db();
    create_table_token(db);
    log_info("'token' 테이블이 준비되었습니다. (" + m_path.string() + ")");
}

SQLite::Database TokenStore::open_db() const
{
    return SQLite::Database(m_path.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
}

Token TokenStore::token_from_row(SQLite::Statement& query)
{
    json record = json::object();
    for (int i = 0; i < static_cast<int>(TOKEN_COLUMNS.size()); ++i)
    {
        SQLite::Column column = query.getColumn(i);
        const string& name = TOKEN_COLUMNS[static_cast<size_t>(i)];
        if (column.isNull())
            record[name] = nullptr;
        else if (column.isInteger())
            record[name] = column.getInt64();
        else
            record[name] = column.getString();
    }

    Token token = Token::from_record(record);
    token.store = this;
    token.securid = m_securid;
    return token;
}

vector<Token> TokenStore::list()
{
    vector<Token> tokens;
    try
    {
        SQLite::Database db = open_db();
        create_table_token(db);
        SQLite::Statement query(db, SQL_SELECT_TOKENS);
        while (query.executeStep())
        {
            tokens.push_back(token_from_row(query));
        }
    }
    catch (const exception& e)
    {
        log_error(string("토큰 조회 실패: ") + e.what());
        throw;
    }
    return tokens;
}

int64_t TokenStore::insert(Token& token)
{
    try
    {
        SQLite::Database db = open_db();
        create_table_token(db);
        SQLite::Transaction transaction(db);
        insert_token_row(db, token);
        int64_t rowid = db.getLastInsertRowid();
        transaction.commit();

        token.rowid = rowid;
        token.store = this;
        if (!token.securid)
            token.securid = m_securid;
        log_info("토큰 추가: " + token.to_string() + " (rowid: " + to_string(rowid) + ")");
        return rowid;
    }
    catch (const exception& e)
    {
        log_error("토큰 '" + token.to_string() + "' 추가 실패: " + e.what());
        throw;
    }
}

bool TokenStore::update(const Token& token)
{
    if (!token.rowid)
    {
        log_warning("rowid가 없는 토큰은 수정할 수 없습니다: " + token.to_string());
        return false;
    }
    try
    {
        SQLite::Database db = open_db();
        create_table_token(db);
        SQLite::Transaction transaction(db);
        SQLite::Statement query(db, SQL_UPDATE_TOKEN);
        bind_token_columns(query, token);
        query.bind(13, static_cast<int64_t>(*token.rowid));
        int changes = query.exec();
        transaction.commit();

        if (changes == 0)
        {
            log_warning("수정할 토큰이 없습니다. (rowid: " + to_string(*token.rowid) + ")");
            return false;
        }
        log_info("토큰 수정: " + token.to_string() + " (rowid: " + to_string(*token.rowid) + ")");
        return true;
    }
    catch (const exception& e)
    {
        log_error("토큰 '" + token.to_string() + "' 수정 실패: " + e.what());
        throw;
    }
}

void TokenStore::remove(int64_t rowid)
{
    try
    {
        SQLite::Database db = open_db();
        create_table_token(db);
        SQLite::Transaction transaction(db);
        SQLite::Statement query(db, "DELETE FROM token WHERE rowid = ?");
        query.bind(1, rowid);
        int changes = query.exec();
        transaction.commit();
        log_info("토큰 삭제: rowid " + to_string(rowid) + ", 삭제된 행 수: " + to_string(changes));
    }
    catch (const exception& e)
    {
        log_error("토큰 삭제 실패 (rowid: " + to_string(rowid) + "): " + e.what());
        throw;
    }
}

void TokenStore::truncate()
{
    try
    {
        SQLite::Database db = open_db();
        SQLite::Transaction transaction(db);
        db.exec(SQL_DROP_TOKEN_TABLE);
        create_table_token(db);
        transaction.commit();
        log_info("'token' 테이블을 다시 생성했습니다.");
    }
    catch (const exception& e)
    {
        log_error(string("테이블 초기화 실패: ") + e.what());
        throw;
    }
}

vector<Token> TokenStore::find(const vector<string>& queries, const OtpDefaults& defaults)
{
    vector<Token> result;
    vector<string> labels;
    for (const auto& query : queries)
    {
        string trimmed = trim(query);
        if (trimmed.rfind("otpauth://", 0) == 0)
            result.push_back(Token::from_uri(trimmed, defaults));
        else
            labels.push_back(to_lower(trimmed));
    }
    if (labels.empty())
    {
        return result;
    }

    for (auto& token : list())
    {
        string name = to_lower(trim(token.to_string()));
        for (const auto& label : labels)
        {
            if (name.find(label) != string::npos)
            {
                result.push_back(std::move(token));
                break;
            }
        }
    }
    return result;
}

Token TokenStore::get_token(size_t index)
{
    vector<Token> tokens = list();
    if (index == 0 || index > tokens.size())
    {
        throw out_of_range("토큰 번호가 범위를 벗어났습니다: " + to_string(index));
    }
    return tokens[index - 1];
}

///////////////////////////////////////////////
// 백업 가져오기 / 내보내기

int TokenStore::import_backup(const json& backup, bool delete_existing)
{
    if (!backup.is_object() || !backup.contains("tokens") || !backup["tokens"].is_array())
    {
        throw FormatError("백업 파일에 tokens 배열이 없습니다.");
    }

    int count = 0;
    try
    {
        SQLite::Database db = open_db();
        // 실패하면 Transaction 소멸자에서 롤백되어 기존 데이터가 그대로 남음
        SQLite::Transaction transaction(db);
        if (delete_existing)
        {
            db.exec(SQL_DROP_TOKEN_TABLE);
        }
        create_table_token(db);
        for (const auto& record : backup["tokens"])
        {
            Token token = Token::from_record(record);
            insert_token_row(db, token);
            ++count;
        }
        transaction.commit();
    }
    catch (const exception& e)
    {
        log_error(string("백업 가져오기 실패: ") + e.what());
        throw;
    }

    log_info("백업에서 " + to_string(count) + "개의 토큰을 가져왔습니다.");
    return count;
}

int TokenStore::import_backup_file(const filesystem::path& backup_path, bool delete_existing)
{
    ifstream file(backup_path);
    if (!file.is_open())
    {
        throw runtime_error("백업 파일을 열 수 없습니다: " + backup_path.string());
    }

    json backup;
    try
    {
        file >> backup;
    }
    catch (const json::exception& e)
    {
        log_error("백업 파일 파싱 오류: " + string(e.what()));
        throw FormatError("백업 파일 파싱 오류: " + backup_path.string());
    }
    return import_backup(backup, delete_existing);
}

json TokenStore::export_backup()
{
    json tokens = json::array();
    json token_order = json::array();
    for (const auto& token : list())
    {
        tokens.push_back(backup_record(token));
        token_order.push_back(token.to_string());
    }
    return json{{"tokenOrder", token_order}, {"tokens", tokens}};
}

int TokenStore::export_backup_file(const filesystem::path& backup_path)
{
    json backup = export_backup();
    int count = static_cast<int>(backup["tokens"].size());

    ofstream file(backup_path);
    if (!file.is_open())
    {
        throw runtime_error("백업 파일을 만들 수 없습니다: " + backup_path.string());
    }
    file << backup.dump(2) << endl;
    if (!file)
    {
        throw runtime_error("백업 파일 저장 실패: " + backup_path.string());
    }
    log_info("백업으로 " + to_string(count) + "개의 토큰을 내보냈습니다.");
    return count;
}
