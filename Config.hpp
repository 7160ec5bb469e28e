// Config.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Command-line options of the adapter executable.
struct AdapterConfig {
    int port = 0;                    // 0: speak the protocol on stdin/stdout
    std::string log_file;            // Empty: log to stderr
    bool verbose = false;
    std::string perl_path = "perl";
    int handshake_timeout_ms = 10000;
    int query_timeout_ms = 5000;
    bool show_help = false;

    // Throws Error::Failure(INVALID_ARGUMENTS) on unknown options or bad values.
    // perl_from_env is the value of PERLDAP_PERL, if set; --perl wins over it.
    static AdapterConfig from_args(const std::vector<std::string>& args, const char* perl_from_env = nullptr);
    static AdapterConfig from_args(int argc, char* argv[], const char* perl_from_env = nullptr);

    static std::string usage();
};

// Arguments of a "launch" request.
struct LaunchConfig {
    std::string program;             // Normalized absolute path
    std::vector<std::string> args;
    std::string cwd;                 // Empty: inherit the adapter's
    std::vector<std::pair<std::string, std::string>> env;
    bool stop_on_entry = false;
    std::string perl_path;           // Empty: use the adapter default
    std::vector<std::string> include_paths;

    // Throws Error::Failure: MISSING_ARGUMENTS without "program",
    // FILE_NOT_FOUND unless it names a regular file, INVALID_ARGUMENTS on
    // wrongly typed fields.
    static LaunchConfig from_json(const nlohmann::json& arguments);
};

constexpr int DEFAULT_ATTACH_TIMEOUT_MS = 10000;
constexpr int MAX_ATTACH_TIMEOUT_MS = 300000;

// Arguments of an "attach" request: wait for a perl started with
// PERLDB_OPTS="RemotePort=host:port" to connect.
struct AttachConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    int timeout_ms = DEFAULT_ATTACH_TIMEOUT_MS; // Capped at MAX_ATTACH_TIMEOUT_MS
    std::optional<int> process_id;              // Lets pause send SIGINT

    static AttachConfig from_json(const nlohmann::json& arguments);
};
