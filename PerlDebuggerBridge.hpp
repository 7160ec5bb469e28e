// PerlDebuggerBridge.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "DebuggeeBridge.hpp"
#include "PerlOutput.hpp"

struct BridgeSettings {
    std::string perl_path = "perl";
    int handshake_timeout_ms = 10000;
    int query_timeout_ms = 5000;
};

// Drives perl5db.pl over a line-oriented channel: the pipes of a
// "perl -d" child, or the socket of a RemotePort session.
//
// Every command written makes the debugger print exactly one prompt when it
// is done. The bridge remembers what kind of command each outstanding prompt
// belongs to and routes the output in between accordingly:
//   HANDSHAKE  the prompt that follows startup
//   RESUME     c/n/s/r; the prompt means the program stopped again
//   QUERY      T/y/V/x; the text before the prompt is the answer
//   CONTROL    b/B; only "not breakable" replies matter
class PerlDebuggerBridge : public DebuggeeBridge {
public:
    // Takes ownership of the descriptors; read_fd may equal write_fd.
    // child_pid is the perl process we spawned (or -1), signal_pid the
    // process that receives SIGINT on pause (or -1 if pausing is impossible).
    PerlDebuggerBridge(int read_fd, int write_fd, int child_pid, int signal_pid,
                       std::string base_dir, BridgeSettings settings, BridgeEventSink sink);
    ~PerlDebuggerBridge() override;

    PerlDebuggerBridge(const PerlDebuggerBridge&) = delete;
    PerlDebuggerBridge& operator=(const PerlDebuggerBridge&) = delete;

    // Spawns "perl -d -- program args..." and waits for the first prompt.
    static std::unique_ptr<PerlDebuggerBridge> launch(const LaunchConfig& config, const BridgeSettings& settings, BridgeEventSink sink);

    // Listens on host:port until perl5db connects with RemotePort, then
    // waits for the first prompt.
    static std::unique_ptr<PerlDebuggerBridge> attach(const AttachConfig& config, const BridgeSettings& settings, BridgeEventSink sink);

    // Throws Error::Failure (HANDSHAKE_TIMEOUT, LAUNCH_FAILED).
    void wait_for_handshake(int timeout_ms);

    void start(bool stop_on_entry) override;
    void set_breakpoint(const std::string& path, uint32_t line, const std::optional<std::string>& condition) override;
    void clear_breakpoint(const std::string& path, uint32_t line) override;
    void set_function_breakpoint(const std::string& name, const std::optional<std::string>& condition) override;
    void clear_all_breakpoints() override;
    void set_exception_filter(bool on) override;
    void resume(ResumeMode mode) override;
    void pause() override;
    std::vector<StackFrame> backtrace() override;
    std::vector<Variable> variables(int frame_level, ScopeKind scope) override;
    std::string evaluate(const std::string& expression) override;
    void terminate() override;
    bool accepts_live_updates() const override { return false; }
    int pid() const override { return child_pid > 0 ? child_pid : signal_pid; }

private:
    enum class CommandKind { HANDSHAKE, RESUME, QUERY, CONTROL };

    struct PendingCommand {
        CommandKind kind = CommandKind::CONTROL;
        std::string reason;                                 // RESUME: stop reason to report
        std::string bp_path;                                // CONTROL: breakpoint being set
        uint32_t bp_line = 0;
        std::string bp_function;
        std::shared_ptr<std::promise<std::string>> reply;   // QUERY
    };

    int read_fd;
    int write_fd;
    int child_pid;
    int signal_pid;
    std::string base_dir;
    BridgeSettings settings;
    BridgeEventSink sink;

    std::mutex mutex;
    std::condition_variable stream_cv;
    std::deque<PendingCommand> pending;
    std::string reply_text;
    std::string startup_output;
    std::string exception_text;
    PerlOutput::Location location;
    bool has_location = false;
    bool program_finished = false;
    bool stream_ended = false;
    bool handshake_settled = false;
    int exit_code = 0;
    std::promise<void> handshake;

    std::atomic<bool> terminating{ false };
    std::atomic<bool> break_on_die{ false };
    std::atomic<bool> pause_requested{ false };

    std::mutex write_mutex;
    std::string partial; // Reader thread only
    std::thread reader;

    void reader_loop();
    void consume(const char* data, size_t size, std::vector<BridgeEvent>& events);
    void handle_line(const std::string& line, std::vector<BridgeEvent>& events);
    void handle_prompt(std::vector<BridgeEvent>& events);
    void on_stream_end();
    int reap_child();

    void send(const std::string& command, PendingCommand info);
    void write_line(const std::string& text);
    std::string query(const std::string& command);
    std::string resolve_path(const std::string& path) const;
    BridgeEvent stopped_event(const std::string& reason);
};

// Production factory: perl -d for launch, RemotePort for attach.
class PerlBridgeFactory : public BridgeFactory {
public:
    explicit PerlBridgeFactory(BridgeSettings settings) : settings(std::move(settings)) {}

    std::unique_ptr<DebuggeeBridge> launch(const LaunchConfig& config, BridgeEventSink sink) override;
    std::unique_ptr<DebuggeeBridge> attach(const AttachConfig& config, BridgeEventSink sink) override;

private:
    BridgeSettings settings;
};
