// Config.cpp
#include "Config.hpp"
#include "Error.hpp"
#include "SourceBuffer.hpp"
#include <algorithm>
#include <filesystem>

namespace {
    int parse_int(const std::string& option, const std::string& value, int min, int max) {
        bool ok = false;
        long n = 0;
        try {
            size_t used = 0;
            n = std::stol(value, &used);
            ok = used == value.size() && n >= min && n <= max;
        }
        catch (const std::logic_error&) {
            ok = false; // invalid_argument or out_of_range
        }
        if (ok) {
            return static_cast<int>(n);
        }
        throw Error::Failure(Error::INVALID_ARGUMENTS, option + " expects a number between "
            + std::to_string(min) + " and " + std::to_string(max) + ", got '" + value + "'");
    }

    const nlohmann::json* field(const nlohmann::json& arguments, const char* name) {
        if (!arguments.is_object() || !arguments.contains(name) || arguments[name].is_null()) {
            return nullptr;
        }
        return &arguments[name];
    }

    std::string string_field(const nlohmann::json& value, const char* name) {
        if (!value.is_string()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, std::string("'") + name + "' must be a string");
        }
        return value.get<std::string>();
    }

    std::vector<std::string> string_list(const nlohmann::json& value, const char* name) {
        if (!value.is_array()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, std::string("'") + name + "' must be an array of strings");
        }
        std::vector<std::string> out;
        for (const auto& item : value) {
            out.push_back(string_field(item, name));
        }
        return out;
    }
}

AdapterConfig AdapterConfig::from_args(const std::vector<std::string>& args, const char* perl_from_env) {
    AdapterConfig config;
    if (perl_from_env && *perl_from_env) {
        config.perl_path = perl_from_env;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw Error::Failure(Error::INVALID_ARGUMENTS, arg + " expects a value");
            }
            return args[++i];
        };

        if (arg == "--port") {
            config.port = parse_int(arg, value(), 1, 65535);
        }
        else if (arg == "--log") {
            config.log_file = value();
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--perl") {
            config.perl_path = value();
        }
        else if (arg == "--handshake-timeout") {
            config.handshake_timeout_ms = parse_int(arg, value(), 1, MAX_ATTACH_TIMEOUT_MS);
        }
        else if (arg == "--query-timeout") {
            config.query_timeout_ms = parse_int(arg, value(), 1, MAX_ATTACH_TIMEOUT_MS);
        }
        else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        }
        else if (arg == "--stdio") {
            config.port = 0;
        }
        else {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "unknown option " + arg);
        }
    }
    return config;
}

AdapterConfig AdapterConfig::from_args(int argc, char* argv[], const char* perl_from_env) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return from_args(args, perl_from_env);
}

std::string AdapterConfig::usage() {
    return
        "Usage: perldap [options]\n"
        "  --stdio                   Speak the protocol on stdin/stdout (default)\n"
        "  --port N                  Listen for clients on TCP port N instead\n"
        "  --log FILE                Append the log to FILE instead of stderr\n"
        "  --verbose, -v             Log every protocol message\n"
        "  --perl PATH               Perl interpreter (default: $PERLDAP_PERL or perl)\n"
        "  --handshake-timeout MS    Wait this long for the first debugger prompt\n"
        "  --query-timeout MS        Wait this long for stack, variable and evaluate replies\n"
        "  --help, -h                Show this text\n";
}

LaunchConfig LaunchConfig::from_json(const nlohmann::json& arguments) {
    LaunchConfig config;

    if (const auto* cwd = field(arguments, "cwd")) {
        config.cwd = SourceBuffer::normalize_path(string_field(*cwd, "cwd"));
        std::error_code ec;
        if (!std::filesystem::is_directory(config.cwd, ec)) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "cwd is not a directory: " + config.cwd);
        }
    }

    const auto* program = field(arguments, "program");
    if (!program) {
        throw Error::Failure(Error::MISSING_ARGUMENTS, "launch requires 'program'");
    }
    config.program = SourceBuffer::normalize_path(string_field(*program, "program"), config.cwd);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.program, ec)) {
        throw Error::Failure(Error::FILE_NOT_FOUND, config.program);
    }

    if (const auto* args = field(arguments, "args")) {
        config.args = string_list(*args, "args");
    }
    if (const auto* env = field(arguments, "env")) {
        if (!env->is_object()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'env' must be an object");
        }
        for (const auto& [key, value] : env->items()) {
            config.env.emplace_back(key, string_field(value, "env"));
        }
    }
    if (const auto* stop = field(arguments, "stopOnEntry")) {
        if (!stop->is_boolean()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'stopOnEntry' must be a boolean");
        }
        config.stop_on_entry = stop->get<bool>();
    }
    if (const auto* perl = field(arguments, "perlPath")) {
        config.perl_path = string_field(*perl, "perlPath");
    }
    if (const auto* includes = field(arguments, "includePaths")) {
        config.include_paths = string_list(*includes, "includePaths");
    }
    return config;
}

AttachConfig AttachConfig::from_json(const nlohmann::json& arguments) {
    AttachConfig config;

    const auto* port = field(arguments, "port");
    if (!port) {
        throw Error::Failure(Error::MISSING_ARGUMENTS, "attach requires 'port'");
    }
    if (!port->is_number_integer() || port->get<int64_t>() < 1 || port->get<int64_t>() > 65535) {
        throw Error::Failure(Error::INVALID_ARGUMENTS, "'port' must be between 1 and 65535");
    }
    config.port = static_cast<uint16_t>(port->get<int64_t>());

    if (const auto* host = field(arguments, "host")) {
        config.host = string_field(*host, "host");
        if (config.host.empty()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'host' is empty");
        }
    }
    if (const auto* timeout = field(arguments, "timeout")) {
        if (!timeout->is_number_integer() || timeout->get<int64_t>() < 1) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'timeout' must be a positive number of milliseconds");
        }
        config.timeout_ms = static_cast<int>(std::min<int64_t>(timeout->get<int64_t>(), MAX_ATTACH_TIMEOUT_MS));
    }
    if (const auto* pid = field(arguments, "processId")) {
        if (!pid->is_number_integer() || pid->get<int64_t>() < 1) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'processId' must be a positive integer");
        }
        config.process_id = static_cast<int>(pid->get<int64_t>());
    }
    return config;
}
