// PerlDAP.cpp
#include "Config.hpp"
#include "DAPServer.hpp"
#include "Error.hpp"
#include "PerlDebuggerBridge.hpp"
#include "SourceIndexCache.hpp"
#include "TextIO.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    AdapterConfig config;
    try {
        config = AdapterConfig::from_args(argc, argv, std::getenv("PERLDAP_PERL"));
    }
    catch (const Error::Failure& e) {
        std::cerr << e.what() << "\n" << AdapterConfig::usage();
        return 2;
    }
    if (config.show_help) {
        std::cout << AdapterConfig::usage();
        return 0;
    }

    // A debuggee or client that goes away must not kill us on the next write.
    std::signal(SIGPIPE, SIG_IGN);

    TextIO::set_verbose(config.verbose);
    if (!config.log_file.empty() && !TextIO::set_log_file(config.log_file)) {
        Error::print(Error::FILE_IO, "cannot open log file " + config.log_file);
        return 1;
    }

    BridgeSettings settings;
    settings.perl_path = config.perl_path;
    settings.handshake_timeout_ms = config.handshake_timeout_ms;
    settings.query_timeout_ms = config.query_timeout_ms;

    SourceIndexCache cache;
    PerlBridgeFactory factory(settings);
    DAPServer server(cache, factory);

    if (config.port > 0) {
        return server.serve_tcp(config.port);
    }
    return server.serve_stdio();
}
