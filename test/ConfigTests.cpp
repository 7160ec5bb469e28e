// ConfigTests.cpp
#include <gtest/gtest.h>

#include "Config.hpp"
#include "Error.hpp"
#include "TestSupport.hpp"

#include <filesystem>

using json = nlohmann::json;

namespace {
    Error::Code launch_error(const json& arguments) {
        try {
            LaunchConfig::from_json(arguments);
        }
        catch (const Error::Failure& e) {
            return e.code();
        }
        return Error::OK;
    }
}

TEST(AdapterConfig, Defaults) {
    AdapterConfig config = AdapterConfig::from_args(std::vector<std::string>{});
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.perl_path, "perl");
    EXPECT_EQ(config.handshake_timeout_ms, 10000);
    EXPECT_EQ(config.query_timeout_ms, 5000);
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.show_help);
}

TEST(AdapterConfig, Options) {
    AdapterConfig config = AdapterConfig::from_args(
        { "--port", "4711", "--log", "/tmp/dap.log", "-v", "--perl", "/opt/perl/bin/perl",
          "--handshake-timeout", "2000", "--query-timeout", "750" });
    EXPECT_EQ(config.port, 4711);
    EXPECT_EQ(config.log_file, "/tmp/dap.log");
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.perl_path, "/opt/perl/bin/perl");
    EXPECT_EQ(config.handshake_timeout_ms, 2000);
    EXPECT_EQ(config.query_timeout_ms, 750);
}

TEST(AdapterConfig, EnvironmentPerlLosesToOption) {
    EXPECT_EQ(AdapterConfig::from_args(std::vector<std::string>{}, "/usr/local/bin/perl").perl_path, "/usr/local/bin/perl");
    EXPECT_EQ(AdapterConfig::from_args({ "--perl", "perl5.36" }, "/usr/local/bin/perl").perl_path, "perl5.36");
}

TEST(AdapterConfig, BadOptions) {
    EXPECT_THROW(AdapterConfig::from_args({ "--bogus" }), Error::Failure);
    EXPECT_THROW(AdapterConfig::from_args({ "--port" }), Error::Failure);
    EXPECT_THROW(AdapterConfig::from_args({ "--port", "0" }), Error::Failure);
    EXPECT_THROW(AdapterConfig::from_args({ "--port", "80x" }), Error::Failure);
    EXPECT_THROW(AdapterConfig::from_args({ "--query-timeout", "-5" }), Error::Failure);
    EXPECT_TRUE(AdapterConfig::from_args({ "--help" }).show_help);
    EXPECT_NE(AdapterConfig::usage().find("--port"), std::string::npos);
}

TEST(LaunchConfig, ProgramIsRequiredAndMustExist) {
    EXPECT_EQ(launch_error(json::object()), Error::MISSING_ARGUMENTS);
    EXPECT_EQ(launch_error({ { "program", "/definitely/not/here.pl" } }), Error::FILE_NOT_FOUND);
    EXPECT_EQ(launch_error({ { "program", 5 } }), Error::INVALID_ARGUMENTS);
    EXPECT_EQ(launch_error({ { "program", std::filesystem::temp_directory_path().string() } }), Error::FILE_NOT_FOUND);
}

TEST(LaunchConfig, FullArguments) {
    TempFile script("print 1;\n");
    std::string dir = std::filesystem::path(script.path).parent_path().string();
    json arguments = {
        { "program", std::filesystem::path(script.path).filename().string() },
        { "cwd", dir },
        { "args", json::array({ "--flag", "value" }) },
        { "env", { { "PERL5LIB", "/opt/lib" } } },
        { "stopOnEntry", true },
        { "perlPath", "/usr/bin/perl" },
        { "includePaths", json::array({ "lib" }) }
    };
    LaunchConfig config = LaunchConfig::from_json(arguments);
    EXPECT_EQ(config.program, script.path);
    EXPECT_EQ(config.args, (std::vector<std::string>{ "--flag", "value" }));
    ASSERT_EQ(config.env.size(), 1u);
    EXPECT_EQ(config.env[0].first, "PERL5LIB");
    EXPECT_TRUE(config.stop_on_entry);
    EXPECT_EQ(config.perl_path, "/usr/bin/perl");
    EXPECT_EQ(config.include_paths, std::vector<std::string>{ "lib" });
}

TEST(LaunchConfig, WrongTypes) {
    TempFile script("1;\n");
    EXPECT_EQ(launch_error({ { "program", script.path }, { "args", "not a list" } }), Error::INVALID_ARGUMENTS);
    EXPECT_EQ(launch_error({ { "program", script.path }, { "stopOnEntry", "yes" } }), Error::INVALID_ARGUMENTS);
    EXPECT_EQ(launch_error({ { "program", script.path }, { "env", { { "A", 1 } } } }), Error::INVALID_ARGUMENTS);
    EXPECT_EQ(launch_error({ { "program", script.path }, { "cwd", script.path } }), Error::INVALID_ARGUMENTS);
}

TEST(AttachConfig, DefaultsAndCap) {
    AttachConfig config = AttachConfig::from_json({ { "port", 13603 } });
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 13603);
    EXPECT_EQ(config.timeout_ms, DEFAULT_ATTACH_TIMEOUT_MS);
    EXPECT_FALSE(config.process_id.has_value());

    config = AttachConfig::from_json({ { "port", 1 }, { "timeout", 9999999 }, { "processId", 321 }, { "host", "localhost" } });
    EXPECT_EQ(config.timeout_ms, MAX_ATTACH_TIMEOUT_MS);
    EXPECT_EQ(config.process_id.value_or(0), 321);
    EXPECT_EQ(config.host, "localhost");
}

TEST(AttachConfig, InvalidPort) {
    EXPECT_THROW(AttachConfig::from_json(json::object()), Error::Failure);
    EXPECT_THROW(AttachConfig::from_json({ { "port", 0 } }), Error::Failure);
    EXPECT_THROW(AttachConfig::from_json({ { "port", 70000 } }), Error::Failure);
    EXPECT_THROW(AttachConfig::from_json({ { "port", "13603" } }), Error::Failure);
}
