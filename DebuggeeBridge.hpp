// DebuggeeBridge.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

struct LaunchConfig;
struct AttachConfig;

enum class ResumeMode {
    CONTINUE,
    STEP_OVER,
    STEP_IN,
    STEP_OUT
};

// Something the debuggee did on its own. Delivered from the bridge's reader
// thread into the session mailbox.
struct BridgeEvent {
    enum class Kind {
        STOPPED,             // path/line/function, reason: entry, step, breakpoint, pause, exception
        OUTPUT,              // text, category
        EXITED,              // exit_code
        FAULT,               // text: the bridge itself broke
        BREAKPOINT_REJECTED  // path/line, text: why the debugger refused it
    };

    Kind kind = Kind::OUTPUT;
    std::string path;
    uint32_t line = 0;
    std::string function;
    std::string reason;
    std::string text;
    std::string category = "stdout";
    int exit_code = 0;
};

using BridgeEventSink = std::function<void(BridgeEvent)>;

// Control channel to one debuggee. Only the session loop calls these.
// Calls that talk to the debugger throw Error::Failure (BRIDGE_WRITE,
// QUERY_TIMEOUT, NO_DEBUGGEE).
class DebuggeeBridge {
public:
    virtual ~DebuggeeBridge() = default;

    // Lets the program run after configuration. With stop_on_entry the
    // bridge reports a STOPPED "entry" at the first statement instead.
    virtual void start(bool stop_on_entry) = 0;

    virtual void set_breakpoint(const std::string& path, uint32_t line, const std::optional<std::string>& condition) = 0;
    virtual void clear_breakpoint(const std::string& path, uint32_t line) = 0;
    virtual void set_function_breakpoint(const std::string& name, const std::optional<std::string>& condition) = 0;
    virtual void clear_all_breakpoints() = 0;
    virtual void set_exception_filter(bool break_on_die) = 0;

    virtual void resume(ResumeMode mode) = 0;
    virtual void pause() = 0;

    // Frame 0 is the current stop location.
    virtual std::vector<StackFrame> backtrace() = 0;
    virtual std::vector<Variable> variables(int frame_level, ScopeKind scope) = 0;
    virtual std::string evaluate(const std::string& expression) = 0;

    // Idempotent. The debuggee is gone and the reader stopped when it returns.
    virtual void terminate() = 0;

    // True if breakpoints can be changed while the program runs.
    virtual bool accepts_live_updates() const = 0;

    virtual int pid() const = 0;
};

// Creates bridges for launch and attach requests. Tests substitute a fake.
class BridgeFactory {
public:
    virtual ~BridgeFactory() = default;
    virtual std::unique_ptr<DebuggeeBridge> launch(const LaunchConfig& config, BridgeEventSink sink) = 0;
    virtual std::unique_ptr<DebuggeeBridge> attach(const AttachConfig& config, BridgeEventSink sink) = 0;
};
