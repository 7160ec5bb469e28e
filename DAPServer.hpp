// DAPServer.hpp
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class SourceIndex;
class BridgeFactory;

// Runs debug sessions: one on stdin/stdout, or one per accepted TCP client.
// Every session gets its own mailbox and bridge; they share the source index.
class DAPServer {
public:
    DAPServer(SourceIndex& index, BridgeFactory& factory);
    ~DAPServer();

    // Serves a single client on stdin/stdout. Returns when the session ends.
    int serve_stdio();

    // Accepts clients on 127.0.0.1:port until stop(). Returns non-zero if
    // the port could not be opened.
    int serve_tcp(int port);

    void stop();

    // The bound port once serve_tcp is listening (port 0 picks a free one), else 0.
    int listening_port() const { return bound_port; }

    // Client threads not yet joined, and how many of them are still running.
    size_t tracked_sessions();
    size_t active_sessions();

private:
    struct Client {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    SourceIndex& index;
    BridgeFactory& factory;
    std::atomic<bool> server_running{ false };
    std::atomic<int> listen_socket{ -1 };
    std::atomic<int> bound_port{ 0 };

    std::mutex clients_mutex;
    std::vector<Client> clients;

    // Joins the threads of sessions that have ended. Caller holds clients_mutex.
    void reap_finished();
    void client_session(int client_socket, std::shared_ptr<std::atomic<bool>> done);
};
