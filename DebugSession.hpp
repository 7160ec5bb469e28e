// DebugSession.hpp
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "BlockingQueue.hpp"
#include "BreakpointStore.hpp"
#include "DebuggeeBridge.hpp"
#include "EventDispatcher.hpp"
#include "Error.hpp"
#include "Types.hpp"

class SourceIndex;

enum class SessionState {
    UNINITIALIZED,
    INITIALIZED,
    CONFIGURING,
    RUNNING,
    STOPPED,
    TERMINATED
};

std::string to_string(SessionState state);

// The client hung up.
struct TransportClosed {};

using SessionInput = std::variant<nlohmann::json, BridgeEvent, TransportClosed>;
using SessionMailbox = BlockingQueue<SessionInput>;

// One protocol session. Requests from the transport reader and events from
// the bridge reader arrive through one mailbox; run() handles them one at a
// time, so nothing in here needs a lock.
class DebugSession {
public:
    DebugSession(SourceIndex& index, BridgeFactory& factory, MessageWriter& writer,
                 std::shared_ptr<SessionMailbox> mailbox);
    ~DebugSession();

    DebugSession(const DebugSession&) = delete;
    DebugSession& operator=(const DebugSession&) = delete;

    // Pops and handles inputs until the session is TERMINATED or the mailbox closes.
    void run();

    // Handles a single input and flushes the replies.
    void handle(const SessionInput& input);

    SessionState state() const { return current_state; }
    const BreakpointStore& breakpoints() const { return registry; }
    std::shared_ptr<SessionMailbox> mailbox() const { return inbox; }

private:
    using Handler = void (DebugSession::*)(const nlohmann::json& request);

    // A scope of one frame, or an expanded array, hash or reference whose
    // elements were captured when its parent was listed.
    struct VariablesRef {
        int frame_level = 0;
        ScopeKind kind = ScopeKind::LOCALS;
        bool container = false;
        std::vector<Variable> children;
    };

    SourceIndex& index;
    BridgeFactory& factory;
    EventDispatcher dispatcher;
    std::shared_ptr<SessionMailbox> inbox;
    BreakpointStore registry;
    std::unique_ptr<DebuggeeBridge> bridge;
    SessionState current_state = SessionState::UNINITIALIZED;
    bool stop_on_entry = false;
    bool break_on_die = false;

    // What the debugger currently has installed, and what still has to be
    // sent once it can take commands.
    std::map<std::string, std::set<uint32_t>> installed;
    std::set<std::string> dirty_files;
    bool functions_dirty = false;

    // Valid while STOPPED; cleared before every resume.
    std::optional<std::vector<StackFrame>> frames;
    std::map<int, VariablesRef> references;
    std::map<std::pair<int, ScopeKind>, int> reference_of;
    int next_reference = 1;

    static const std::map<std::string, Handler>& handlers();
    bool is_legal(const std::string& command) const;

    void on_request(const nlohmann::json& request);
    void on_bridge_event(const BridgeEvent& event);
    void on_stopped(const BridgeEvent& event);
    void on_rejected(const BridgeEvent& event);
    void on_transport_closed();

    void fail_request(const nlohmann::json& request, Error::Code code, const std::string& detail);

    // --- Request handlers ---
    void on_initialize(const nlohmann::json& request);
    void on_launch(const nlohmann::json& request);
    void on_attach(const nlohmann::json& request);
    void on_set_breakpoints(const nlohmann::json& request);
    void on_set_function_breakpoints(const nlohmann::json& request);
    void on_set_exception_breakpoints(const nlohmann::json& request);
    void on_breakpoint_locations(const nlohmann::json& request);
    void on_configuration_done(const nlohmann::json& request);
    void on_threads(const nlohmann::json& request);
    void on_continue(const nlohmann::json& request);
    void on_next(const nlohmann::json& request);
    void on_step_in(const nlohmann::json& request);
    void on_step_out(const nlohmann::json& request);
    void on_pause(const nlohmann::json& request);
    void on_stack_trace(const nlohmann::json& request);
    void on_scopes(const nlohmann::json& request);
    void on_variables(const nlohmann::json& request);
    void on_set_variable(const nlohmann::json& request);
    void on_evaluate(const nlohmann::json& request);
    void on_disconnect(const nlohmann::json& request);

    // --- Helpers ---
    BridgeEventSink make_sink();
    void resume(const nlohmann::json& request, ResumeMode mode);
    bool can_forward() const;
    void sync_file(const std::string& path);
    void sync_all();
    void sync_pending();
    const std::vector<StackFrame>& current_frames();
    void clear_snapshot();
    nlohmann::json variable_to_json(Variable variable, const VariablesRef& owner);
    std::string render_log_message(const std::string& text);
    void output(const std::string& category, const std::string& text);
    void enter_terminated();
};

// Protocol shape of a breakpoint record.
nlohmann::json breakpoint_to_json(const Breakpoint& bp);
