/**
 * @file cli.cpp
 * @brief 명령행 인터페이스 구현 파일
 * @details 인수 해석, 명령 분기, 목록/코드 출력 형식과 OSC 52 클립보드 복사를 구현합니다.
 */

#include "cli.hpp"

#include <unistd.h>

#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

#include "utils.hpp"

using namespace std;

namespace {

// ==================== 도움말 ====================

struct CommandHelp
{
    const char* name;
    const char* summary;
    const char* usage;
};

const vector<CommandHelp> COMMANDS = {
    {".add", "Add a new token to the database",
     ".add -s SECRET [--type TOTP|HOTP|SecurID] [-a ALGORITHM] [-c COUNTER] [-d DIGITS]\n"
     "       [-i ISSUER] [-l LABEL] [-p PERIOD]\n"
     "  .add -u URI\n\n"
     "  -s, --secret TEXT     Secret key (Base32)\n"
     "  -u, --uri TEXT        otpauth:// URI\n"
     "  --type TEXT           Token type (default: TOTP)\n"
     "  -a, --algorithm TEXT  SHA1, SHA256, SHA512 or MD5\n"
     "  -c, --counter N       HOTP counter value\n"
     "  -d, --digits N        Number of digits in one-time password\n"
     "  -i, --issuer TEXT     Issuer\n"
     "  -l, --label TEXT      Label\n"
     "  -p, --period N        Time-step duration in seconds"},
    {".all", "Display the codes of all tokens", ".all [-l] [TOKENS]...\n\n  -l, --long  Use a long listing format"},
    {".delete", "Delete tokens", ".delete [-f] TOKENS...\n\n  -f, --force  Never prompt"},
    {".export", "Export tokens to a backup file", ".export -b FILE\n\n  -b, --backup-filename FILE  Backup filename"},
    {".help", "Show help and exit", ".help [COMMAND]..."},
    {".import", "Import tokens from a backup file",
     ".import -b FILE [--delete-existing-data]\n\n"
     "  -b, --backup-filename FILE  Backup filename\n"
     "  --delete-existing-data      Delete existing data from the database"},
    {".ls", "Display token list", ".ls [-l] [TOKENS]...\n\n  -l, --long  Use a long listing format"},
    {".otp", "Display the codes of all tokens", ".otp [-l] [TOKENS]...\n\n  -l, --long  Use a long listing format"},
    {".uri", "Display token URIs", ".uri TOKENS..."},
};

void print_help(ostream& out)
{
    out << "Usage: otpvault [OPTIONS] [COMMAND|[TOKENS]...] [ARGS]...\n\n"
        << "  otpvault is a command line two-factor authentication application.\n"
        << "  Without a command, prints the codes of the given tokens (or of all tokens).\n\n"
        << "Options:\n"
        << "  -f, --filename PATH  Database path (env: OTPVAULT_DB)\n"
        << "  -v, --verbose        Verbose output\n"
        << "  -c, --counter N      HOTP counter value\n"
        << "  -t, --time TIME      TOTP timestamp (YYYY-MM-DDTHH:MM:SS, local time)\n"
        << "  --version            Show the version and exit\n"
        << "  -h, --help           Show this message and exit\n\n"
        << "Commands:\n";
    for (const auto& command : COMMANDS)
    {
        out << "  " << left << setw(9) << command.name << command.summary << '\n';
    }
}

void print_command_help(ostream& out, const string& name)
{
    for (const auto& command : COMMANDS)
    {
        if (name == command.name)
        {
            out << "Usage: otpvault " << command.usage << "\n\n  " << command.summary << '\n';
            return;
        }
    }
    throw ArgumentError("no such command '" + name + "'");
}

// ==================== 인수 해석 ====================

struct OptionSpec
{
    const char* short_name;  // 없으면 nullptr
    const char* long_name;
    bool takes_value;
};

struct ParsedArgs
{
    map<string, string> values;  // long_name -> 값 (플래그는 빈 문자열)
    vector<string> positionals;

    bool has(const string& name) const { return values.count(name) != 0; }

    optional<string> get(const string& name) const
    {
        auto it = values.find(name);
        if (it == values.end())
            return nullopt;
        return it->second;
    }
};

ParsedArgs parse_options(const vector<string>& args, size_t pos, const vector<OptionSpec>& specs,
                         const string& command)
{
    ParsedArgs parsed;
    bool options_done = false;
    for (; pos < args.size(); ++pos)
    {
        const string& arg = args[pos];
        if (options_done || arg.size() < 2 || arg[0] != '-')
        {
            parsed.positionals.push_back(arg);
            continue;
        }
        if (arg == "--")
        {
            options_done = true;
            continue;
        }

        // "--name=value" 형식
        string name = arg;
        optional<string> inline_value;
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != string::npos)
        {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const OptionSpec* spec = nullptr;
        for (const auto& candidate : specs)
        {
            if (name == candidate.long_name || (candidate.short_name && name == candidate.short_name))
            {
                spec = &candidate;
                break;
            }
        }
        if (!spec)
        {
            throw ArgumentError("no such option '" + name + "' for " + command);
        }

        if (!spec->takes_value)
        {
            if (inline_value)
                throw ArgumentError("option '" + name + "' does not take a value");
            parsed.values[spec->long_name] = "";
        }
        else if (inline_value)
        {
            parsed.values[spec->long_name] = *inline_value;
        }
        else
        {
            if (pos + 1 >= args.size())
                throw ArgumentError("option '" + name + "' requires an argument");
            parsed.values[spec->long_name] = args[++pos];
        }
    }
    return parsed;
}

int64_t parse_integer(const string& option, const string& text)
{
    try
    {
        size_t used = 0;
        long long value = stoll(text, &used);
        if (used == text.size())
        {
            return value;
        }
    }
    catch (const logic_error&)
    {
        // 아래에서 인수 오류로 처리
    }
    throw ArgumentError("invalid value for '" + option + "': '" + text + "' is not a valid integer");
}

void require_tokens(const ParsedArgs& parsed, const string& command)
{
    if (parsed.positionals.empty())
    {
        throw ArgumentError("missing argument 'TOKENS' for " + command);
    }
}

void reject_positionals(const ParsedArgs& parsed, const string& command)
{
    if (!parsed.positionals.empty())
    {
        throw ArgumentError("unexpected extra argument '" + parsed.positionals.front() + "' for " + command);
    }
}

// .add 명령의 인수로 토큰 생성
Token token_from_add_args(const ParsedArgs& parsed, const OtpDefaults& defaults)
{
    optional<string> uri = parsed.get("--uri");
    optional<string> secret = parsed.get("--secret");
    if (uri && secret)
    {
        throw ArgumentError("options '--uri' and '--secret' are mutually exclusive");
    }
    if (uri)
    {
        Token token = Token::from_uri(*uri, defaults);
        secure_clear(*uri);
        return token;
    }
    if (!secret)
    {
        throw ArgumentError("missing option '-s' / '--secret' (or '-u' / '--uri')");
    }

    Token token;
    try
    {
        token.type = parse_token_type(parsed.get("--type").value_or("TOTP"));
    }
    catch (const InvalidTokenType& e)
    {
        throw ArgumentError(string("invalid value for '--type': ") + e.what());
    }

    token.algorithm = to_upper(parsed.get("--algorithm").value_or(defaults.algorithm));
    if (!is_supported_algorithm(token.algorithm))
    {
        throw ArgumentError("invalid value for '--algorithm': '" + token.algorithm + "'");
    }

    optional<string> counter = parsed.get("--counter");
    optional<string> digits = parsed.get("--digits");
    optional<string> period = parsed.get("--period");
    if (counter)
        token.counter = parse_integer("--counter", *counter);
    else if (token.type == TokenType::HOTP)
        token.counter = 0;
    int64_t digits_value = digits ? parse_integer("--digits", *digits) : defaults.digits;
    int64_t period_value = period ? parse_integer("--period", *period) : defaults.period;
    if (digits_value < 1 || digits_value > MAX_DIGITS)
        throw ArgumentError("invalid value for '--digits': must be between 1 and " + std::to_string(MAX_DIGITS));
    if (period_value < 1 || period_value > numeric_limits<int>::max())
        throw ArgumentError("invalid value for '--period': must be a positive integer");
    token.digits = static_cast<int>(digits_value);
    token.period = static_cast<int>(period_value);

    token.set_issuer(parsed.get("--issuer"));
    token.label = parsed.get("--label");
    token.secret = Secret::from_base32(*secret);
    secure_clear(*secret);
    return token;
}

const vector<OptionSpec> LIST_OPTIONS = {{"-l", "--long", false}};

}  // namespace

// ==================== OtpVault ====================

OtpVault::OtpVault(AppConfig config, optional<int64_t> counter, optional<int64_t> timestamp, ostream& out,
                   istream& in, bool terminal)
    : m_config(std::move(config)),
      m_store(m_config.db_file),
      m_counter(counter),
      m_timestamp(timestamp),
      m_out(out),
      m_in(in),
      m_terminal(terminal)
{
}

vector<Token> OtpVault::select(const vector<string>& queries)
{
    vector<Token> tokens = queries.empty() ? m_store.list() : m_store.find(queries, m_config.otp_defaults);
    if (!queries.empty() && tokens.empty())
    {
        log_warning("일치하는 토큰이 없습니다.");
    }
    return tokens;
}

string OtpVault::code_for(const Token& token) const { return token.calculate(m_timestamp, m_counter); }

string OtpVault::format_token(const Token& token) const
{
    ostringstream line;
    line << setw(2) << (token.rowid ? std::to_string(*token.rowid) : string("-")) << ":";
    if (m_config.show_codes)
    {
        line << ' ' << right << setw(8) << code_for(token);
    }
    if (!m_config.spinner_style.empty())
    {
        string glyph = token.spinner(m_config.spinner_style, m_timestamp);
        line << ' ' << (glyph.empty() ? string(" ") : glyph);
    }
    if (m_config.show_time_left)
    {
        optional<int> left_seconds = token.time_left(m_timestamp);
        line << " [" << right << setw(2) << (left_seconds ? std::to_string(*left_seconds) : string("--")) << "]";
    }
    line << "  " << token.to_string();
    return line.str();
}

void OtpVault::list(bool calculate, bool long_format, const vector<string>& queries)
{
    vector<Token> tokens = select(queries);
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        const Token& token = tokens[i];
        ostringstream long_columns;
        if (long_format)
        {
            long_columns << right << setw(4) << (token.rowid ? std::to_string(*token.rowid) : string("-")) << ' '
                         << left << setw(7) << token_type_name(token.type) << ' ' << setw(6) << token.algorithm
                         << ' ' << right << setw(2) << token.digits << ' ' << setw(3) << token.period << ' '
                         << token.to_string();
        }

        if (!calculate)
        {
            m_out << (long_format ? long_columns.str() : format_token(token)) << '\n';
            continue;
        }

        string otp = code_for(token);
        if (i == 0)
        {
            copy_into_clipboard(otp);
        }
        string counter_suffix;
        if (token.type == TokenType::HOTP && token.counter && *token.counter != 0)
        {
            counter_suffix = " (" + std::to_string(*token.counter) + ")";
        }
        if (long_format)
            m_out << left << setw(8) << otp << ' ' << long_columns.str() << counter_suffix << '\n';
        else
            m_out << otp << ' ' << token.to_string() << counter_suffix << '\n';
    }
    m_out.flush();
}

int OtpVault::print_codes(const vector<string>& queries)
{
    int count = 0;
    for (const auto& token : select(queries))
    {
        if (verbose_logging())
        {
            m_out << token.details() << '\n';
        }
        string otp = code_for(token);
        if (count == 0)
        {
            copy_into_clipboard(otp);
        }
        m_out << otp << '\n';
        ++count;
    }
    m_out.flush();
    return count;
}

int OtpVault::print_uris(const vector<string>& queries)
{
    int count = 0;
    for (const auto& token : select(queries))
    {
        if (verbose_logging())
        {
            m_out << token.details() << '\n';
        }
        m_out << token.to_uri() << '\n';
        ++count;
    }
    m_out.flush();
    return count;
}

void OtpVault::add_token(Token& token)
{
    if (verbose_logging())
    {
        m_out << token.details() << '\n';
    }
    m_store.insert(token);
    m_out << "Token added" << endl;
}

bool OtpVault::confirm(const string& question)
{
    m_out << question << " [y/N]: " << flush;
    string answer;
    if (!getline(m_in, answer))
    {
        m_out << '\n';
        return false;
    }
    answer = to_lower(trim(answer));
    return answer == "y" || answer == "yes";
}

int OtpVault::delete_tokens(const vector<string>& queries, bool force)
{
    int count = 0;
    for (const auto& token : select(queries))
    {
        if (verbose_logging())
        {
            m_out << token.details() << '\n';
        }
        if (force || confirm("Do you want to remove " + token.to_string() + " ?"))
        {
            if (token.remove())
                ++count;
        }
    }
    if (count == 1)
        m_out << "Token deleted" << endl;
    else
        m_out << count << " tokens deleted" << endl;
    return count;
}

int OtpVault::import_json(const filesystem::path& backup_path, bool delete_existing)
{
    int count = m_store.import_backup_file(backup_path, delete_existing);
    m_out << count << " tokens imported" << endl;
    return count;
}

int OtpVault::export_json(const filesystem::path& backup_path)
{
    int count = m_store.export_backup_file(backup_path);
    m_out << count << " tokens exported" << endl;
    return count;
}

void OtpVault::copy_into_clipboard(const string& otp)
{
    if (!m_config.copy_to_clipboard || !m_terminal)
    {
        return;
    }
    string data = "\033]52;c;" + base64_encode(vector<unsigned char>(otp.begin(), otp.end())) + "\a";
    if (getenv("TMUX"))
    {
        // tmux 패스스루
        data = "\033Ptmux;\033" + data + "\033\\";
    }
    m_out << data << flush;
}

// ==================== 진입점 ====================

int run_cli(const vector<string>& args, ostream& out, ostream& err, istream& in)
{
    try
    {
        optional<string> filename;
        optional<int64_t> counter;
        optional<int64_t> timestamp;
        bool verbose = false;

        // 전역 옵션: 첫 번째 명령(.xxx) 또는 토큰 전까지
        size_t pos = 0;
        vector<OptionSpec> global_specs = {
            {"-f", "--filename", true}, {"-v", "--verbose", false}, {"-c", "--counter", true},
            {"-t", "--time", true},     {nullptr, "--version", false}, {"-h", "--help", false},
        };
        vector<string> global_args;
        for (; pos < args.size(); ++pos)
        {
            const string& arg = args[pos];
            if (arg.empty() || arg[0] != '-' || arg == "--")
                break;
            global_args.push_back(arg);
            bool takes_value = false;
            for (const auto& spec : global_specs)
            {
                if (spec.takes_value && (arg == spec.long_name || (spec.short_name && arg == spec.short_name)))
                    takes_value = true;
            }
            if (takes_value && pos + 1 < args.size())
                global_args.push_back(args[++pos]);
        }
        if (pos < args.size() && args[pos] == "--")
            ++pos;

        ParsedArgs globals = parse_options(global_args, 0, global_specs, "otpvault");
        if (globals.has("--help"))
        {
            print_help(out);
            return EXIT_OK;
        }
        if (globals.has("--version"))
        {
            out << "otpvault, version " << OTPVAULT_VERSION << endl;
            return EXIT_OK;
        }
        verbose = globals.has("--verbose");
        filename = globals.get("--filename");
        if (optional<string> value = globals.get("--counter"))
        {
            counter = parse_integer("--counter", *value);
        }
        if (optional<string> value = globals.get("--time"))
        {
            int64_t seconds = 0;
            if (!parse_local_timestamp(*value, seconds))
                throw ArgumentError("invalid value for '--time': '" + *value + "' does not match YYYY-MM-DDTHH:MM:SS");
            timestamp = seconds;
        }

        set_verbose_logging(verbose);

        string command;
        if (pos < args.size() && !args[pos].empty() && args[pos][0] == '.')
        {
            command = args[pos++];
        }

        if (command == ".help")
        {
            ParsedArgs parsed = parse_options(args, pos, {}, command);
            if (parsed.positionals.empty())
                print_help(out);
            for (const auto& name : parsed.positionals)
                print_command_help(out, name);
            return EXIT_OK;
        }
        if (!command.empty())
        {
            bool known = false;
            for (const auto& entry : COMMANDS)
                known = known || command == entry.name;
            if (!known)
                throw ArgumentError("no such command '" + command + "'");
        }

        // 설정 로드 (.env -> 환경 변수 -> config.json -> 명령행)
        AppConfig config = default_config();
        load_env_variables(config);
        if (!load_json_config(config))
        {
            log_warning("설정 파일을 읽지 못해 기본 설정을 사용합니다: " + config.config_file.string());
        }
        if (filename)
        {
            config.db_file = *filename;
        }

        bool terminal = (&out == &cout) && isatty(STDOUT_FILENO);
        OtpVault vault(config, counter, timestamp, out, in, terminal);

        if (command.empty())
        {
            vector<string> tokens(args.begin() + static_cast<ptrdiff_t>(pos), args.end());
            if (tokens.empty())
                vault.list(true, false, {});
            else
                vault.print_codes(tokens);
        }
        else if (command == ".ls" || command == ".all" || command == ".otp")
        {
            ParsedArgs parsed = parse_options(args, pos, LIST_OPTIONS, command);
            vault.list(command != ".ls", parsed.has("--long"), parsed.positionals);
        }
        else if (command == ".uri")
        {
            ParsedArgs parsed = parse_options(args, pos, {}, command);
            require_tokens(parsed, command);
            vault.print_uris(parsed.positionals);
        }
        else if (command == ".add")
        {
            ParsedArgs parsed = parse_options(args, pos,
                                              {{"-u", "--uri", true},
                                               {"-s", "--secret", true},
                                               {nullptr, "--type", true},
                                               {"-a", "--algorithm", true},
                                               {"-c", "--counter", true},
                                               {"-d", "--digits", true},
                                               {"-i", "--issuer", true},
                                               {"-l", "--label", true},
                                               {"-p", "--period", true}},
                                              command);
            reject_positionals(parsed, command);
            Token token = token_from_add_args(parsed, config.otp_defaults);
            vault.add_token(token);
        }
        else if (command == ".delete")
        {
            ParsedArgs parsed = parse_options(args, pos, {{"-f", "--force", false}}, command);
            require_tokens(parsed, command);
            vault.delete_tokens(parsed.positionals, parsed.has("--force"));
        }
        else if (command == ".import" || command == ".export")
        {
            vector<OptionSpec> specs = {{"-b", "--backup-filename", true}};
            if (command == ".import")
                specs.push_back({nullptr, "--delete-existing-data", false});
            ParsedArgs parsed = parse_options(args, pos, specs, command);
            reject_positionals(parsed, command);
            optional<string> backup = parsed.get("--backup-filename");
            if (!backup)
                throw ArgumentError("missing option '-b' / '--backup-filename'");

            if (command == ".import")
            {
                if (!filesystem::is_regular_file(*backup))
                    throw ArgumentError("invalid value for '--backup-filename': file '" + *backup + "' does not exist");
                vault.import_json(*backup, parsed.has("--delete-existing-data"));
            }
            else
            {
                vault.export_json(*backup);
            }
        }
        return EXIT_OK;
    }
    catch (const ArgumentError& e)
    {
        err << "otpvault: " << e.what() << "\nTry 'otpvault --help' for help." << endl;
        return EXIT_USAGE;
    }
    catch (const exception& e)
    {
        err << "otpvault: " << e.what() << endl;
        return EXIT_FAIL;
    }
}
