#include "config_manager.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

namespace fs = std::filesystem;

fs::path default_config_dir()
{
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config)
    {
        return fs::path(xdg_config) / "otpvault";
    }
    const char* home = getenv("HOME");
    if (home && *home)
    {
        return fs::path(home) / ".config" / "otpvault";
    }
    return fs::path(".otpvault");
}

// 환경 변수에서 경로 읽기
static void apply_environment(AppConfig& config)
{
    const char* db_file = getenv("OTPVAULT_DB");
    const char* config_file = getenv("OTPVAULT_CONFIG");
    if (db_file && *db_file)
    {
        config.db_file = db_file;
    }
    if (config_file && *config_file)
    {
        config.config_file = config_file;
    }
}

AppConfig default_config()
{
    AppConfig config;
    fs::path dir = default_config_dir();
    config.db_file = dir / "otpvault.db";
    config.config_file = dir / "config.json";
    apply_environment(config);
    return config;
}

// .env 파일을 읽어서 환경 변수로 설정하는 함수
bool load_env_variables(AppConfig& config, const fs::path& env_path)
{
    ifstream file(env_path);
    string line;

    if (!file.is_open())
    {
        apply_environment(config);
        return false;
    }

    while (getline(file, line))
    {
        // 주석과 빈 줄 제거
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        size_t pos = line.find('=');
        if (pos != string::npos)
        {
            // 앞뒤 공백 제거
            string key = trim(line.substr(0, pos));
            string value = trim(line.substr(pos + 1));
            if (key.empty())
            {
                continue;
            }

            // 이미 설정된 환경 변수는 덮어쓰지 않음
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    file.close();

    apply_environment(config);
    log_info(".env 파일에서 환경 변수를 로드했습니다.");
    return true;
}

// config.json 파일을 읽어서 설정값 로드
bool load_json_config(AppConfig& config)
{
    ifstream config_file(config.config_file);
    if (!config_file.is_open())
    {
        log_info("config.json 파일이 없어 기본 설정을 사용합니다. (" + config.config_file.string() + ")");
        return true;
    }

    json data;
    // 모든 값을 읽은 뒤에만 반영 (오류 시 config는 그대로)
    AppConfig loaded = config;
    try
    {
        config_file >> data;
        if (!data.is_object())
        {
            log_error("config.json 최상위 값은 객체여야 합니다.");
            return false;
        }

        // 표시 설정
        loaded.copy_to_clipboard = data.value("copy_to_clipboard", loaded.copy_to_clipboard);
        loaded.show_codes = data.value("show_codes", loaded.show_codes);
        loaded.show_time_left = data.value("show_time_left", loaded.show_time_left);
        loaded.spinner_style = data.value("spinner_style", loaded.spinner_style);

        // 새 토큰 기본값
        if (data.contains("defaults"))
        {
            const json& defaults = data["defaults"];
            if (!defaults.is_object())
            {
                log_error("config.json의 defaults 값은 객체여야 합니다.");
                return false;
            }
            loaded.otp_defaults.algorithm = to_upper(defaults.value("algorithm", loaded.otp_defaults.algorithm));
            loaded.otp_defaults.digits = defaults.value("digits", loaded.otp_defaults.digits);
            loaded.otp_defaults.period = defaults.value("period", loaded.otp_defaults.period);
        }
    }
    catch (const json::exception& e)
    {
        log_error(string("config.json 파싱 오류: ") + e.what());
        return false;
    }

    try
    {
        validate_code_parameters(loaded.otp_defaults.digits, loaded.otp_defaults.period);
    }
    catch (const FormatError& e)
    {
        log_error(string("config.json의 defaults 값이 잘못되었습니다: ") + e.what());
        return false;
    }

    config = loaded;
    log_info("config.json 파일을 로드했습니다.");
    return true;
}

bool save_json_config(const AppConfig& config)
{
    json data = json::object();

    // 기존 파일의 다른 키는 유지
    {
        ifstream existing(config.config_file);
        if (existing.is_open())
        {
            try
            {
                existing >> data;
            }
            catch (const json::exception& e)
            {
                log_warning(string("기존 config.json을 읽지 못해 새로 작성합니다: ") + e.what());
                data = json::object();
            }
            if (!data.is_object())
            {
                data = json::object();
            }
        }
    }

    data["copy_to_clipboard"] = config.copy_to_clipboard;
    data["show_codes"] = config.show_codes;
    data["show_time_left"] = config.show_time_left;
    data["spinner_style"] = config.spinner_style;
    data["defaults"] = {
        {"algorithm", config.otp_defaults.algorithm},
        {"digits", config.otp_defaults.digits},
        {"period", config.otp_defaults.period},
    };

    try
    {
        if (config.config_file.has_parent_path())
        {
            fs::create_directories(config.config_file.parent_path());
        }
    }
    catch (const fs::filesystem_error& e)
    {
        log_error(string("설정 디렉터리를 만들 수 없습니다: ") + e.what());
        return false;
    }

    ofstream file(config.config_file);
    if (!file.is_open())
    {
        log_error("config.json 파일을 열 수 없습니다: " + config.config_file.string());
        return false;
    }
    file << data.dump(2) << endl;
    return static_cast<bool>(file);
}

// 모든 설정 로드
bool load_all_config(AppConfig& config)
{
    load_env_variables(config);
    bool json_ok = load_json_config(config);

    if (json_ok)
    {
        log_info("모든 설정이 성공적으로 로드되었습니다.");
    }
    return json_ok;
}
