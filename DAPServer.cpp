// DAPServer.cpp
#include "DAPServer.hpp"
#include "DebugSession.hpp"
#include "SourceIndexCache.hpp"
#include "TextIO.hpp"
#include "Transport.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
    // Feeds every message read from fd into the session mailbox, then
    // reports the end of the stream.
    void pump_messages(int fd, std::shared_ptr<SessionMailbox> mailbox) {
        MessageReader reader(fd);
        while (auto message = reader.next()) {
            if (!mailbox->push(std::move(*message))) {
                return;
            }
        }
        mailbox->push(TransportClosed{});
    }
}

DAPServer::DAPServer(SourceIndex& index, BridgeFactory& factory)
    : index(index), factory(factory) {
}

DAPServer::~DAPServer() {
    stop();
}

int DAPServer::serve_stdio() {
    auto mailbox = std::make_shared<SessionMailbox>();
    FdMessageWriter writer(STDOUT_FILENO);
    DebugSession session(index, factory, writer, mailbox);

    // Blocked in read(stdin) until the client closes it; the process may
    // exit first, so nobody joins this thread.
    std::thread reader(pump_messages, STDIN_FILENO, mailbox);
    reader.detach();

    session.run();
    return 0;
}

int DAPServer::serve_tcp(int port) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd == -1) {
        TextIO::print("? DAP Error: Cannot create socket.\n");
        return 1;
    }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
        TextIO::debug("DAP Info: SO_REUSEADDR: " + std::string(std::strerror(errno)) + "\n");
    }

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    server_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == -1) {
        TextIO::print("? DAP Error: Cannot bind socket to port " + std::to_string(port) + ".\n");
        close(fd);
        return 1;
    }
    if (listen(fd, 4) == -1) {
        TextIO::print("? DAP Error: Cannot listen on socket.\n");
        close(fd);
        return 1;
    }

    sockaddr_in bound_addr{};
    socklen_t bound_length = sizeof(bound_addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_length) == 0) {
        port = ntohs(bound_addr.sin_port);
    }

    listen_socket = fd;
    server_running = true;
    bound_port = port;
    TextIO::print("DAP Server listening on port " + std::to_string(port) + "\n");

    while (server_running) {
        int client_socket = accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_socket == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (server_running) {
                TextIO::print("? DAP Error: Accept failed: " + std::string(std::strerror(errno)) + "\n");
            }
            break;
        }

        TextIO::print("DAP Client connected.\n");
        std::lock_guard<std::mutex> lock(clients_mutex);
        reap_finished();
        auto done = std::make_shared<std::atomic<bool>>(false);
        clients.push_back({ std::thread(&DAPServer::client_session, this, client_socket, done), done });
    }

    bound_port = 0;
    int open_socket = listen_socket.exchange(-1);
    if (open_socket != -1) {
        close(open_socket);
    }
    return 0;
}

void DAPServer::reap_finished() {
    // Running clients are compacted to the front; every slot they move into
    // has already been joined or moved from.
    size_t kept = 0;
    for (size_t i = 0; i < clients.size(); ++i) {
        if (clients[i].done->load()) {
            clients[i].thread.join();
            continue;
        }
        if (kept != i) {
            clients[kept] = std::move(clients[i]);
        }
        kept++;
    }
    clients.erase(clients.begin() + static_cast<std::ptrdiff_t>(kept), clients.end());
}

size_t DAPServer::tracked_sessions() {
    std::lock_guard<std::mutex> lock(clients_mutex);
    return clients.size();
}

size_t DAPServer::active_sessions() {
    std::lock_guard<std::mutex> lock(clients_mutex);
    size_t running = 0;
    for (const auto& client : clients) {
        if (!client.done->load()) {
            running++;
        }
    }
    return running;
}

void DAPServer::stop() {
    server_running = false;
    int open_socket = listen_socket.exchange(-1);
    if (open_socket != -1) {
        // Wakes up the accept() in serve_tcp.
        shutdown(open_socket, SHUT_RDWR);
        close(open_socket);
    }

    std::vector<Client> remaining;
    {
        std::lock_guard<std::mutex> lock(clients_mutex);
        remaining.swap(clients);
    }
    for (auto& client : remaining) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }
}

void DAPServer::client_session(int client_socket, std::shared_ptr<std::atomic<bool>> done) {
    auto mailbox = std::make_shared<SessionMailbox>();
    FdMessageWriter writer(client_socket);
    std::thread reader(pump_messages, client_socket, mailbox);
    {
        DebugSession session(index, factory, writer, mailbox);
        session.run();
    }

    // Ends the reader's recv() if the client is still connected.
    shutdown(client_socket, SHUT_RDWR);
    reader.join();
    close(client_socket);
    TextIO::print("DAP Client disconnected.\n");
    *done = true;
}
