// PerlDebuggerBridge.cpp
#include "PerlDebuggerBridge.hpp"
#include "Config.hpp"
#include "Error.hpp"
#include "SourceBuffer.hpp"
#include "StringUtils.hpp"
#include "TextIO.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
    // Plain line I/O: no readline, no return-value printing, no tracing.
    const char* const DEBUGGER_OPTIONS = "ReadLine=0 PrintRet=0 frame=0 AutoTrace=0 NonStop=0";

    std::vector<char*> to_argv(std::vector<std::string>& strings) {
        std::vector<char*> out;
        for (auto& s : strings) {
            out.push_back(s.data());
        }
        out.push_back(nullptr);
        return out;
    }

    std::vector<std::string> build_environment(const LaunchConfig& config) {
        auto replaced = [&](const std::string& key) {
            if (key == "PERLDB_OPTS") {
                return true;
            }
            for (const auto& entry : config.env) {
                if (entry.first == key) {
                    return true;
                }
            }
            return false;
        };

        std::vector<std::string> env;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            if (!replaced(entry.substr(0, entry.find('=')))) {
                env.push_back(entry);
            }
        }
        for (const auto& [key, value] : config.env) {
            env.push_back(key + "=" + value);
        }
        env.push_back(std::string("PERLDB_OPTS=") + DEBUGGER_OPTIONS);
        return env;
    }

    std::string errno_text(const std::string& what) {
        return what + ": " + std::strerror(errno);
    }

    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    const char* resume_command(ResumeMode mode) {
        switch (mode) {
        case ResumeMode::CONTINUE:  return "c";
        case ResumeMode::STEP_OVER: return "n";
        case ResumeMode::STEP_IN:   return "s";
        case ResumeMode::STEP_OUT:  return "r";
        }
        return "c";
    }
}

PerlDebuggerBridge::PerlDebuggerBridge(int read_fd, int write_fd, int child_pid, int signal_pid,
                                       std::string base_dir, BridgeSettings settings, BridgeEventSink sink)
    : read_fd(read_fd), write_fd(write_fd), child_pid(child_pid), signal_pid(signal_pid),
      base_dir(std::move(base_dir)), settings(std::move(settings)), sink(std::move(sink)) {
    PendingCommand startup;
    startup.kind = CommandKind::HANDSHAKE;
    pending.push_back(startup);
    reader = std::thread(&PerlDebuggerBridge::reader_loop, this);
}

PerlDebuggerBridge::~PerlDebuggerBridge() {
    terminate();
}

std::unique_ptr<PerlDebuggerBridge> PerlDebuggerBridge::launch(const LaunchConfig& config, const BridgeSettings& settings, BridgeEventSink sink) {
    std::vector<std::string> args;
    args.push_back(config.perl_path.empty() ? settings.perl_path : config.perl_path);
    args.push_back("-d");
    for (const auto& dir : config.include_paths) {
        args.push_back("-I" + SourceBuffer::normalize_path(dir, config.cwd));
    }
    // "--" keeps a program name starting with '-' from being read as a switch.
    args.push_back("--");
    args.push_back(config.program);
    args.insert(args.end(), config.args.begin(), config.args.end());

    std::vector<std::string> env = build_environment(config);
    std::vector<char*> argv = to_argv(args);
    std::vector<char*> envp = to_argv(env);
    std::string exec_error = "? Cannot execute " + args[0] + "\n";

    int to_child[2];
    int from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) != 0) {
        throw Error::Failure(Error::LAUNCH_FAILED, errno_text("pipe"));
    }
    if (::pipe2(from_child, O_CLOEXEC) != 0) {
        std::string reason = errno_text("pipe");
        ::close(to_child[0]);
        ::close(to_child[1]);
        throw Error::Failure(Error::LAUNCH_FAILED, reason);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = errno_text("fork");
        for (int fd : { to_child[0], to_child[1], from_child[0], from_child[1] }) {
            ::close(fd);
        }
        throw Error::Failure(Error::LAUNCH_FAILED, reason);
    }

    if (pid == 0) {
        // Without a controlling terminal perl5db cannot open /dev/tty and
        // falls back to STDIN/STDERR, which are our pipes.
        ::setsid();
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::dup2(from_child[1], STDERR_FILENO);
        if (!config.cwd.empty() && ::chdir(config.cwd.c_str()) != 0) {
            _exit(126);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        ssize_t ignored = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)ignored;
        _exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);
    TextIO::print("DAP Info: Started " + args[0] + " -d " + config.program + " (pid " + std::to_string(pid) + ")\n");

    std::string base = config.cwd.empty() ? SourceBuffer::normalize_path(".") : config.cwd;
    auto bridge = std::make_unique<PerlDebuggerBridge>(from_child[0], to_child[1], pid, pid, base, settings, std::move(sink));
    try {
        bridge->wait_for_handshake(settings.handshake_timeout_ms);
    }
    catch (const Error::Failure&) {
        bridge->terminate();
        throw;
    }
    return bridge;
}

std::unique_ptr<PerlDebuggerBridge> PerlDebuggerBridge::attach(const AttachConfig& config, const BridgeSettings& settings, BridgeEventSink sink) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo* addresses = nullptr;
    std::string endpoint = config.host + ":" + std::to_string(config.port);

    int rc = ::getaddrinfo(config.host.c_str(), std::to_string(config.port).c_str(), &hints, &addresses);
    if (rc != 0) {
        throw Error::Failure(Error::ATTACH_FAILED, endpoint + ": " + ::gai_strerror(rc));
    }

    int listen_fd = -1;
    std::string reason = "no usable address";
    for (addrinfo* ai = addresses; ai; ai = ai->ai_next) {
        listen_fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (listen_fd < 0) {
            reason = errno_text("socket");
            continue;
        }
        int yes = 1;
        if (::setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
            TextIO::debug("DAP Info: " + errno_text("SO_REUSEADDR") + "\n");
        }
        if (::bind(listen_fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(listen_fd, 1) == 0) {
            break;
        }
        reason = errno_text("bind");
        close_fd(listen_fd);
    }
    ::freeaddrinfo(addresses);
    if (listen_fd < 0) {
        throw Error::Failure(Error::ATTACH_FAILED, "cannot listen on " + endpoint + " (" + reason + ")");
    }

    TextIO::print("DAP Info: Waiting up to " + std::to_string(config.timeout_ms) + " ms for perl5db on " + endpoint + "\n");
    pollfd waiting{ listen_fd, POLLIN, 0 };
    int ready;
    do {
        ready = ::poll(&waiting, 1, config.timeout_ms);
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        close_fd(listen_fd);
        throw Error::Failure(Error::ATTACH_FAILED, "no debugger connected to " + endpoint + " within "
            + std::to_string(config.timeout_ms) + " ms");
    }

    int fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    reason = errno_text("accept");
    close_fd(listen_fd);
    if (fd < 0) {
        throw Error::Failure(Error::ATTACH_FAILED, reason);
    }
    TextIO::print("DAP Info: perl5db connected on " + endpoint + "\n");

    auto bridge = std::make_unique<PerlDebuggerBridge>(fd, fd, -1, config.process_id.value_or(-1),
                                                       SourceBuffer::normalize_path("."), settings, std::move(sink));
    try {
        bridge->wait_for_handshake(settings.handshake_timeout_ms);
    }
    catch (const Error::Failure&) {
        bridge->terminate();
        throw;
    }
    return bridge;
}

void PerlDebuggerBridge::wait_for_handshake(int timeout_ms) {
    std::future<void> ready = handshake.get_future();
    if (ready.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        throw Error::Failure(Error::HANDSHAKE_TIMEOUT, "no prompt after " + std::to_string(timeout_ms) + " ms");
    }
    ready.get();
}

// --- Commands ---

void PerlDebuggerBridge::start(bool stop_on_entry) {
    bool finished;
    BridgeEvent entry;
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished = program_finished;
        entry = stopped_event("entry");
    }
    if (finished) {
        // Nothing to run (compile error or empty program); quitting delivers EXITED.
        write_line("q");
        return;
    }
    if (stop_on_entry) {
        sink(std::move(entry));
        return;
    }
    resume(ResumeMode::CONTINUE);
}

void PerlDebuggerBridge::set_breakpoint(const std::string& path, uint32_t line, const std::optional<std::string>& condition) {
    PendingCommand info;
    info.bp_path = path;
    info.bp_line = line;
    std::string command = "b " + path + ":" + std::to_string(line);
    if (condition && !condition->empty()) {
        command += " " + *condition;
    }
    send(command, std::move(info));
}

void PerlDebuggerBridge::clear_breakpoint(const std::string& path, uint32_t line) {
    // "B" only reaches the file being listed; a false condition disarms
    // the breakpoint in any file.
    send("b " + path + ":" + std::to_string(line) + " 0", PendingCommand{});
}

void PerlDebuggerBridge::set_function_breakpoint(const std::string& name, const std::optional<std::string>& condition) {
    PendingCommand info;
    info.bp_function = name;
    std::string command = "b " + name;
    if (condition && !condition->empty()) {
        command += " " + *condition;
    }
    send(command, std::move(info));
}

void PerlDebuggerBridge::clear_all_breakpoints() {
    send("B *", PendingCommand{});
}

void PerlDebuggerBridge::set_exception_filter(bool on) {
    break_on_die = on;
}

void PerlDebuggerBridge::resume(ResumeMode mode) {
    PendingCommand info;
    info.kind = CommandKind::RESUME;
    info.reason = mode == ResumeMode::CONTINUE ? "breakpoint" : "step";
    {
        std::lock_guard<std::mutex> lock(mutex);
        exception_text.clear();
    }
    // A pause that has not been reported yet belongs to the next stop.
    send(resume_command(mode), std::move(info));
}

void PerlDebuggerBridge::pause() {
    if (signal_pid <= 0) {
        throw Error::Failure(Error::NO_DEBUGGEE, "pause needs the debuggee's process id");
    }
    pause_requested = true;
    // perl5db's SIGINT handler stops at the next statement and prompts.
    if (::kill(signal_pid, SIGINT) != 0) {
        pause_requested = false;
        throw Error::Failure(Error::NO_DEBUGGEE, errno_text("kill"));
    }
}

std::vector<StackFrame> PerlDebuggerBridge::backtrace() {
    std::string text = query("T");
    PerlOutput::Location here;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!has_location) {
            throw Error::Failure(Error::NO_DEBUGGEE, "no stop location");
        }
        here = location;
    }
    auto frames = PerlOutput::build_frames(here, PerlOutput::parse_backtrace(text));
    for (auto& frame : frames) {
        frame.path = resolve_path(frame.path);
    }
    return frames;
}

std::vector<Variable> PerlDebuggerBridge::variables(int frame_level, ScopeKind scope) {
    // Lower-case names only: skips %ENV, @INC, %SIG and the _<file entries.
    std::string command = scope == ScopeKind::GLOBALS ? "V main ~^[a-z]" : "y " + std::to_string(frame_level);
    return PerlOutput::parse_variables(query(command));
}

std::string PerlDebuggerBridge::evaluate(const std::string& expression) {
    return PerlOutput::parse_evaluation(query("x " + expression));
}

void PerlDebuggerBridge::terminate() {
    if (terminating.exchange(true)) {
        return;
    }

    bool ended;
    {
        std::lock_guard<std::mutex> lock(mutex);
        ended = stream_ended;
    }
    if (!ended) {
        try {
            write_line("q");
        }
        catch (const Error::Failure& e) {
            TextIO::debug(std::string("DAP Info: ") + e.what() + "\n");
        }
    }

    if (child_pid > 0) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!stream_cv.wait_for(lock, std::chrono::milliseconds(500), [this] { return stream_ended; })) {
            lock.unlock();
            // The child leads its own process group; take its children along.
            ::kill(-child_pid, SIGKILL);
        }
    }
    else if (read_fd >= 0) {
        ::shutdown(read_fd, SHUT_RDWR);
    }

    if (reader.joinable()) {
        reader.join();
    }
    std::lock_guard<std::mutex> lock(write_mutex);
    if (write_fd == read_fd) {
        write_fd = -1;
    }
    close_fd(write_fd);
    close_fd(read_fd);
}

// --- Channel ---

void PerlDebuggerBridge::send(const std::string& command, PendingCommand info) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stream_ended) {
            throw Error::Failure(Error::NO_DEBUGGEE, "debugger has exited");
        }
        pending.push_back(std::move(info));
    }
    TextIO::debug("perl5db << " + command + "\n");
    write_line(command);
}

void PerlDebuggerBridge::write_line(const std::string& text) {
    std::string payload = text + "\n";
    std::lock_guard<std::mutex> lock(write_mutex);
    size_t written = 0;
    while (written < payload.size()) {
        ssize_t n = write_fd < 0 ? -1 : ::write(write_fd, payload.data() + written, payload.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            throw Error::Failure(Error::BRIDGE_WRITE, write_fd < 0 ? "channel closed" : std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

std::string PerlDebuggerBridge::query(const std::string& command) {
    PendingCommand info;
    info.kind = CommandKind::QUERY;
    info.reply = std::make_shared<std::promise<std::string>>();
    std::future<std::string> answer = info.reply->get_future();
    send(command, std::move(info));

    if (answer.wait_for(std::chrono::milliseconds(settings.query_timeout_ms)) != std::future_status::ready) {
        throw Error::Failure(Error::QUERY_TIMEOUT, "'" + command + "' got no reply within "
            + std::to_string(settings.query_timeout_ms) + " ms");
    }
    return answer.get();
}

std::string PerlDebuggerBridge::resolve_path(const std::string& path) const {
    // "(eval 12)[t.pl:3]" and "-e" are not files.
    if (path.empty() || path[0] == '(' || path == "-e") {
        return path;
    }
    return SourceBuffer::normalize_path(path, base_dir);
}

BridgeEvent PerlDebuggerBridge::stopped_event(const std::string& reason) {
    BridgeEvent event;
    event.kind = BridgeEvent::Kind::STOPPED;
    event.reason = reason;
    if (has_location) {
        event.path = resolve_path(location.path);
        event.line = location.line;
        event.function = location.function;
    }
    return event;
}

// --- Reader thread ---

void PerlDebuggerBridge::reader_loop() {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        std::vector<BridgeEvent> events;
        consume(buffer, static_cast<size_t>(n), events);
        if (!terminating) {
            for (auto& event : events) {
                sink(std::move(event));
            }
        }
    }
    on_stream_end();
}

void PerlDebuggerBridge::consume(const char* data, size_t size, std::vector<BridgeEvent>& events) {
    partial.append(data, size);

    size_t newline;
    while ((newline = partial.find('\n')) != std::string::npos) {
        std::string line = partial.substr(0, newline);
        partial.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handle_line(PerlOutput::strip_ansi(line), events);
    }

    // The prompt is printed without a newline.
    if (auto at = PerlOutput::find_trailing_prompt(partial)) {
        std::string before = partial.substr(0, *at);
        partial.clear();
        if (!StringUtils::strip_view(before).empty()) {
            handle_line(PerlOutput::strip_ansi(before), events);
        }
        handle_prompt(events);
    }
}

void PerlDebuggerBridge::handle_line(const std::string& line, std::vector<BridgeEvent>& events) {
    if (PerlOutput::is_prompt(line)) {
        handle_prompt(events);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (PerlOutput::is_termination_notice(line)) {
        program_finished = true;
        TextIO::debug("perl5db >> " + line + "\n");
        return;
    }

    CommandKind kind = pending.empty() ? CommandKind::RESUME : pending.front().kind;
    switch (kind) {
    case CommandKind::HANDSHAKE:
        if (auto here = PerlOutput::parse_location(line)) {
            location = *here;
            has_location = true;
        }
        else {
            startup_output += line + "\n";
        }
        break;

    case CommandKind::RESUME: {
        if (auto here = PerlOutput::parse_location(line)) {
            location = *here;
            has_location = true;
            break;
        }
        if (PerlOutput::is_source_echo(line)) {
            break;
        }
        bool exception = PerlOutput::looks_like_exception(line);
        if (exception && break_on_die) {
            exception_text = line;
        }
        BridgeEvent output;
        output.kind = BridgeEvent::Kind::OUTPUT;
        output.text = line + "\n";
        output.category = exception ? "stderr" : "stdout";
        events.push_back(std::move(output));
        break;
    }

    case CommandKind::QUERY:
        reply_text += line + "\n";
        break;

    case CommandKind::CONTROL: {
        const PendingCommand& front = pending.front();
        BridgeEvent rejected;
        rejected.kind = BridgeEvent::Kind::BREAKPOINT_REJECTED;
        rejected.text = line;
        if (!front.bp_path.empty() && PerlOutput::parse_not_breakable(line)) {
            rejected.path = front.bp_path;
            rejected.line = front.bp_line;
            events.push_back(std::move(rejected));
        }
        else if (!front.bp_function.empty() && PerlOutput::is_missing_subroutine(line)) {
            rejected.function = front.bp_function;
            events.push_back(std::move(rejected));
        }
        else {
            TextIO::debug("perl5db >> " + line + "\n");
        }
        break;
    }
    }
}

void PerlDebuggerBridge::handle_prompt(std::vector<BridgeEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex);
    if (pending.empty()) {
        TextIO::debug("DAP Info: Unexpected debugger prompt\n");
        return;
    }
    PendingCommand done = std::move(pending.front());
    pending.pop_front();
    std::string text = std::move(reply_text);
    reply_text.clear();

    switch (done.kind) {
    case CommandKind::HANDSHAKE:
        if (program_finished && !startup_output.empty()) {
            BridgeEvent output;
            output.kind = BridgeEvent::Kind::OUTPUT;
            output.text = startup_output;
            output.category = "stderr";
            events.push_back(std::move(output));
        }
        if (!handshake_settled) {
            handshake_settled = true;
            handshake.set_value();
        }
        break;

    case CommandKind::RESUME:
        if (program_finished) {
            try {
                write_line("q");
            }
            catch (const Error::Failure& e) {
                TextIO::print(std::string("? DAP Error: ") + e.what() + "\n");
            }
            break;
        }
        {
            std::string reason = done.reason;
            if (pause_requested.exchange(false)) {
                reason = "pause";
            }
            else if (!exception_text.empty()) {
                reason = "exception";
            }
            BridgeEvent stop = stopped_event(reason);
            stop.text = exception_text;
            exception_text.clear();
            events.push_back(std::move(stop));
        }
        break;

    case CommandKind::QUERY:
        done.reply->set_value(text);
        break;

    case CommandKind::CONTROL:
        break;
    }
}

void PerlDebuggerBridge::on_stream_end() {
    int code = reap_child();
    std::vector<std::shared_ptr<std::promise<std::string>>> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stream_ended = true;
        exit_code = code;
        for (auto& command : pending) {
            if (command.reply) {
                orphaned.push_back(command.reply);
            }
        }
        pending.clear();
        if (!handshake_settled) {
            handshake_settled = true;
            std::string detail = startup_output.empty() ? "debugger exited during startup" : startup_output;
            handshake.set_exception(std::make_exception_ptr(Error::Failure(Error::LAUNCH_FAILED, detail)));
        }
    }
    stream_cv.notify_all();

    for (auto& reply : orphaned) {
        reply->set_exception(std::make_exception_ptr(Error::Failure(Error::NO_DEBUGGEE, "debugger exited")));
    }

    TextIO::print("DAP Info: Debugger channel closed, exit code " + std::to_string(code) + "\n");
    if (!terminating) {
        BridgeEvent exited;
        exited.kind = BridgeEvent::Kind::EXITED;
        exited.exit_code = code;
        sink(std::move(exited));
    }
}

int PerlDebuggerBridge::reap_child() {
    if (child_pid <= 0) {
        return 0;
    }
    int status = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(child_pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);
    if (reaped < 0) {
        TextIO::debug("DAP Info: " + errno_text("waitpid") + "\n");
        return 0;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 0;
}

std::unique_ptr<DebuggeeBridge> PerlBridgeFactory::launch(const LaunchConfig& config, BridgeEventSink sink) {
    return PerlDebuggerBridge::launch(config, settings, std::move(sink));
}

std::unique_ptr<DebuggeeBridge> PerlBridgeFactory::attach(const AttachConfig& config, BridgeEventSink sink) {
    return PerlDebuggerBridge::attach(config, settings, std::move(sink));
}
