// DebugSession.cpp
#include "DebugSession.hpp"
#include "BreakpointValidator.hpp"
#include "Config.hpp"
#include "ExpressionGuard.hpp"
#include "SourceBuffer.hpp"
#include "SourceIndexCache.hpp"
#include "TextIO.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>

using json = nlohmann::json;

namespace {
    const int THREAD_ID = 1;

    json arguments_of(const json& request) {
        auto it = request.find("arguments");
        if (it == request.end() || it->is_null()) {
            return json::object();
        }
        if (!it->is_object()) {
            throw Error::Failure(Error::INVALID_ARGUMENTS, "'arguments' must be an object");
        }
        return *it;
    }

    std::optional<std::string> optional_string(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            return std::nullopt;
        }
        std::string value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    std::string source_path(const json& arguments) {
        auto source = arguments.find("source");
        if (source == arguments.end() || !source->is_object()) {
            throw Error::Failure(Error::MISSING_ARGUMENTS, "'source' is required");
        }
        auto path = source->find("path");
        if (path == source->end() || !path->is_string() || path->get<std::string>().empty()) {
            throw Error::Failure(Error::MISSING_ARGUMENTS, "'source.path' is required");
        }
        return SourceBuffer::normalize_path(path->get<std::string>());
    }

    json source_to_json(const std::string& path) {
        json source;
        if (!path.empty() && path[0] == '/') {
            source["name"] = std::filesystem::path(path).filename().string();
            source["path"] = path;
        }
        else {
            // "(eval 7)[t.pl:3]" has no file behind it.
            source["name"] = path;
            source["presentationHint"] = "deemphasize";
        }
        return source;
    }
}

std::string to_string(SessionState state) {
    switch (state) {
    case SessionState::UNINITIALIZED: return "UNINITIALIZED";
    case SessionState::INITIALIZED:   return "INITIALIZED";
    case SessionState::CONFIGURING:   return "CONFIGURING";
    case SessionState::RUNNING:       return "RUNNING";
    case SessionState::STOPPED:       return "STOPPED";
    case SessionState::TERMINATED:    return "TERMINATED";
    }
    return "UNKNOWN";
}

json breakpoint_to_json(const Breakpoint& bp) {
    json out;
    out["id"] = bp.id;
    out["verified"] = bp.verified;
    out["line"] = bp.verified_line ? static_cast<int64_t>(*bp.verified_line) : bp.requested_line;
    if (!bp.message.empty()) {
        out["message"] = bp.message;
    }
    out["source"] = source_to_json(bp.source);
    return out;
}

DebugSession::DebugSession(SourceIndex& index, BridgeFactory& factory, MessageWriter& writer,
                           std::shared_ptr<SessionMailbox> mailbox)
    : index(index), factory(factory), dispatcher(writer), inbox(std::move(mailbox)), registry(index) {
}

DebugSession::~DebugSession() {
    if (bridge) {
        bridge->terminate();
    }
}

void DebugSession::run() {
    TextIO::print("DAP Info: Session started.\n");
    while (current_state != SessionState::TERMINATED) {
        std::optional<SessionInput> input = inbox->pop();
        if (!input) {
            handle(TransportClosed{});
            break;
        }
        handle(*input);
    }
    inbox->close();
    TextIO::print("DAP Info: Session ended.\n");
}

void DebugSession::handle(const SessionInput& input) {
    if (const auto* request = std::get_if<json>(&input)) {
        on_request(*request);
    }
    else if (const auto* event = std::get_if<BridgeEvent>(&input)) {
        on_bridge_event(*event);
    }
    else {
        on_transport_closed();
    }

    if (!dispatcher.flush() && current_state != SessionState::TERMINATED) {
        TextIO::print("? DAP Error: Lost the client connection.\n");
        enter_terminated();
    }
}

// --- Request dispatch ---

const std::map<std::string, DebugSession::Handler>& DebugSession::handlers() {
    static const std::map<std::string, Handler> table = {
        { "initialize",              &DebugSession::on_initialize },
        { "launch",                  &DebugSession::on_launch },
        { "attach",                  &DebugSession::on_attach },
        { "setBreakpoints",          &DebugSession::on_set_breakpoints },
        { "setFunctionBreakpoints",  &DebugSession::on_set_function_breakpoints },
        { "setExceptionBreakpoints", &DebugSession::on_set_exception_breakpoints },
        { "breakpointLocations",     &DebugSession::on_breakpoint_locations },
        { "configurationDone",       &DebugSession::on_configuration_done },
        { "threads",                 &DebugSession::on_threads },
        { "continue",                &DebugSession::on_continue },
        { "next",                    &DebugSession::on_next },
        { "stepIn",                  &DebugSession::on_step_in },
        { "stepOut",                 &DebugSession::on_step_out },
        { "pause",                   &DebugSession::on_pause },
        { "stackTrace",              &DebugSession::on_stack_trace },
        { "scopes",                  &DebugSession::on_scopes },
        { "variables",               &DebugSession::on_variables },
        { "setVariable",             &DebugSession::on_set_variable },
        { "evaluate",                &DebugSession::on_evaluate },
        { "disconnect",              &DebugSession::on_disconnect },
        { "terminate",               &DebugSession::on_disconnect }
    };
    return table;
}

bool DebugSession::is_legal(const std::string& command) const {
    if (command == "disconnect" || command == "terminate") {
        return true;
    }
    if (current_state == SessionState::TERMINATED) {
        return false;
    }
    if (command == "initialize") {
        return current_state == SessionState::UNINITIALIZED;
    }
    if (command == "launch" || command == "attach") {
        return current_state == SessionState::INITIALIZED;
    }
    if (command == "configurationDone") {
        return current_state == SessionState::CONFIGURING;
    }
    if (command == "pause") {
        return current_state == SessionState::RUNNING || current_state == SessionState::STOPPED;
    }
    if (command == "continue" || command == "next" || command == "stepIn" || command == "stepOut" ||
        command == "stackTrace" || command == "scopes" || command == "variables" || command == "setVariable" ||
        command == "evaluate") {
        return current_state == SessionState::STOPPED;
    }
    // Breakpoint configuration and threads.
    return true;
}

void DebugSession::on_request(const json& request) {
    if (!request.is_object()) {
        fail_request(request, Error::MALFORMED_MESSAGE, "message is not an object");
        return;
    }
    auto type = request.find("type");
    if (type == request.end() || !type->is_string()) {
        fail_request(request, Error::MALFORMED_MESSAGE, "missing 'type'");
        return;
    }
    if (*type != "request") {
        TextIO::debug("DAP Info: Ignoring client " + type->get<std::string>() + ".\n");
        return;
    }
    auto command = request.find("command");
    auto seq = request.find("seq");
    if (command == request.end() || !command->is_string() || seq == request.end() || !seq->is_number_integer()) {
        fail_request(request, Error::MALFORMED_MESSAGE, "a request needs 'seq' and 'command'");
        return;
    }

    const std::string name = command->get<std::string>();
    TextIO::debug("DAP Request: " + name + "\n");

    auto handler = handlers().find(name);
    if (handler == handlers().end()) {
        fail_request(request, Error::UNKNOWN_COMMAND, name);
        return;
    }
    if (!is_legal(name)) {
        if (current_state == SessionState::TERMINATED) {
            fail_request(request, Error::SESSION_TERMINATED, name);
        }
        else {
            fail_request(request, Error::INVALID_STATE, "'" + name + "' while " + to_string(current_state));
        }
        return;
    }

    try {
        (this->*(handler->second))(request);
    }
    catch (const Error::Failure& e) {
        fail_request(request, e.code(), e.detail());
        if (e.code() == Error::QUERY_TIMEOUT) {
            output("console", "Warning: the perl debugger is not responding (" + e.detail() + ")\n");
        }
    }
    catch (const json::exception& e) {
        fail_request(request, Error::INVALID_ARGUMENTS, e.what());
    }
}

void DebugSession::fail_request(const json& request, Error::Code code, const std::string& detail) {
    Error::print(code, detail);
    std::string message = Error::getMessage(code);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    dispatcher.post_response(request, false, nullptr, message);
}

// --- Lifecycle ---

void DebugSession::on_initialize(const json& request) {
    json exception_filter;
    exception_filter["filter"] = "die";
    exception_filter["label"] = "Uncaught die";
    exception_filter["default"] = false;

    json capabilities;
    capabilities["supportsConfigurationDoneRequest"] = true;
    capabilities["supportsFunctionBreakpoints"] = true;
    capabilities["supportsConditionalBreakpoints"] = true;
    capabilities["supportsHitConditionalBreakpoints"] = true;
    capabilities["supportsLogPoints"] = true;
    capabilities["supportsEvaluateForHovers"] = true;
    capabilities["supportsSetVariable"] = true;
    capabilities["supportsBreakpointLocationsRequest"] = true;
    capabilities["supportsTerminateRequest"] = true;
    capabilities["supportsStepInTargetsRequest"] = false;
    capabilities["supportsRestartRequest"] = false;
    capabilities["exceptionBreakpointFilters"] = json::array({ exception_filter });

    current_state = SessionState::INITIALIZED;
    dispatcher.post_response(request, true, capabilities);
    dispatcher.post_event("initialized");
}

BridgeEventSink DebugSession::make_sink() {
    std::shared_ptr<SessionMailbox> target = inbox;
    return [target](BridgeEvent event) {
        if (!target->push(std::move(event))) {
            TextIO::debug("DAP Info: Dropped a debugger event after the session closed.\n");
        }
    };
}

void DebugSession::on_launch(const json& request) {
    LaunchConfig config = LaunchConfig::from_json(arguments_of(request));
    TextIO::print("DAP Info: Launching " + config.program + "\n");
    bridge = factory.launch(config, make_sink());
    bridge->set_exception_filter(break_on_die);
    stop_on_entry = config.stop_on_entry;
    current_state = SessionState::CONFIGURING;
    dispatcher.post_response(request, true);
}

void DebugSession::on_attach(const json& request) {
    AttachConfig config = AttachConfig::from_json(arguments_of(request));
    bridge = factory.attach(config, make_sink());
    bridge->set_exception_filter(break_on_die);
    stop_on_entry = arguments_of(request).value("stopOnEntry", false);
    current_state = SessionState::CONFIGURING;
    dispatcher.post_response(request, true);
}

void DebugSession::on_configuration_done(const json& request) {
    sync_all();
    bridge->start(stop_on_entry);
    current_state = SessionState::RUNNING;
    dispatcher.post_response(request, true);
}

void DebugSession::on_disconnect(const json& request) {
    if (current_state != SessionState::TERMINATED) {
        if (bridge) {
            bridge->terminate();
        }
        dispatcher.post_event("terminated");
    }
    dispatcher.post_response(request, true);
    enter_terminated();
}

void DebugSession::on_transport_closed() {
    TextIO::print("DAP Info: Client disconnected.\n");
    enter_terminated();
}

void DebugSession::enter_terminated() {
    if (bridge) {
        bridge->terminate();
    }
    clear_snapshot();
    current_state = SessionState::TERMINATED;
}

// --- Breakpoints ---

void DebugSession::on_set_breakpoints(const json& request) {
    json arguments = arguments_of(request);
    std::string path = source_path(arguments);

    std::vector<SourceBreakpoint> requested;
    if (arguments.contains("breakpoints")) {
        for (const auto& entry : arguments.at("breakpoints")) {
            SourceBreakpoint bp;
            bp.line = entry.at("line").get<int64_t>();
            bp.condition = optional_string(entry, "condition");
            bp.hit_condition = optional_string(entry, "hitCondition");
            bp.log_message = optional_string(entry, "logMessage");
            requested.push_back(std::move(bp));
        }
    }
    else if (arguments.contains("lines")) {
        for (const auto& line : arguments.at("lines")) {
            SourceBreakpoint bp;
            bp.line = line.get<int64_t>();
            requested.push_back(std::move(bp));
        }
    }

    // A file that cannot be read leaves the registry as it was.
    SourceBuffer buffer = SourceBuffer::load_from_file(path);
    json list = json::array();
    for (const auto& bp : registry.set_breakpoints(buffer, requested)) {
        list.push_back(breakpoint_to_json(bp));
    }
    try {
        sync_file(buffer.path());
    }
    catch (const Error::Failure& e) {
        Error::print(e.code(), e.detail());
        output("console", std::string("Could not install breakpoints: ") + e.what() + "\n");
    }

    json body;
    body["breakpoints"] = list;
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_set_function_breakpoints(const json& request) {
    json arguments = arguments_of(request);
    std::vector<FunctionBreakpoint> requested;
    if (arguments.contains("breakpoints")) {
        for (const auto& entry : arguments.at("breakpoints")) {
            FunctionBreakpoint fb;
            fb.name = entry.at("name").get<std::string>();
            fb.condition = optional_string(entry, "condition");
            requested.push_back(std::move(fb));
        }
    }

    json list = json::array();
    for (const auto& fb : registry.set_function_breakpoints(requested)) {
        json out;
        out["id"] = fb.id;
        out["verified"] = fb.verified;
        if (!fb.message.empty()) {
            out["message"] = fb.message;
        }
        list.push_back(out);
    }

    // perl5db cannot delete a single sub breakpoint, so everything is reinstalled.
    functions_dirty = true;
    if (can_forward()) {
        sync_pending();
    }

    json body;
    body["breakpoints"] = list;
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_set_exception_breakpoints(const json& request) {
    json arguments = arguments_of(request);
    json list = json::array();
    break_on_die = false;
    if (arguments.contains("filters")) {
        for (const auto& filter : arguments.at("filters")) {
            bool known = filter.get<std::string>() == "die";
            break_on_die = break_on_die || known;
            json out;
            out["verified"] = known;
            if (!known) {
                out["message"] = "Unknown exception filter: " + filter.get<std::string>();
            }
            list.push_back(out);
        }
    }
    if (bridge) {
        bridge->set_exception_filter(break_on_die);
    }

    json body;
    body["breakpoints"] = list;
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_breakpoint_locations(const json& request) {
    json arguments = arguments_of(request);
    std::string path = source_path(arguments);
    int64_t first = arguments.at("line").get<int64_t>();
    int64_t last = arguments.value("endLine", first);

    SourceBuffer buffer = SourceBuffer::load_from_file(path);
    ClassificationPtr classification = index.get_or_build(buffer);

    json list = json::array();
    for (uint32_t line : BreakpointValidator::executable_lines(*classification, first, last)) {
        json location;
        location["line"] = line;
        list.push_back(location);
    }
    json body;
    body["breakpoints"] = list;
    dispatcher.post_response(request, true, body);
}

bool DebugSession::can_forward() const {
    if (!bridge) {
        return false;
    }
    return current_state == SessionState::CONFIGURING || current_state == SessionState::STOPPED
        || bridge->accepts_live_updates();
}

void DebugSession::sync_file(const std::string& path) {
    if (!can_forward()) {
        dirty_files.insert(path);
        return;
    }

    std::set<uint32_t>& lines = installed[path];
    for (uint32_t line : lines) {
        bridge->clear_breakpoint(path, line);
    }
    lines.clear();

    for (const auto& bp : registry.get_breakpoints(path)) {
        if (!bp.verified || !bp.verified_line || lines.count(*bp.verified_line)) {
            continue;
        }
        bridge->set_breakpoint(path, *bp.verified_line, bp.condition);
        lines.insert(*bp.verified_line);
    }
    if (lines.empty()) {
        installed.erase(path);
    }
    dirty_files.erase(path);
}

void DebugSession::sync_all() {
    if (!bridge) {
        return;
    }
    bridge->clear_all_breakpoints();
    installed.clear();
    for (const auto& path : registry.files()) {
        sync_file(path);
    }
    for (const auto& fb : registry.function_breakpoints()) {
        if (fb.verified) {
            bridge->set_function_breakpoint(fb.name, fb.condition);
        }
    }
    bridge->set_exception_filter(break_on_die);
    dirty_files.clear();
    functions_dirty = false;
}

void DebugSession::sync_pending() {
    try {
        if (functions_dirty) {
            sync_all();
            return;
        }
        std::set<std::string> queued = dirty_files;
        for (const auto& path : queued) {
            sync_file(path);
        }
    }
    catch (const Error::Failure& e) {
        Error::print(e.code(), e.detail());
        output("console", std::string("Could not install breakpoints: ") + e.what() + "\n");
    }
}

// --- Execution control ---

void DebugSession::on_threads(const json& request) {
    json threads = json::array();
    if (bridge) {
        json main_thread;
        main_thread["id"] = THREAD_ID;
        main_thread["name"] = "main";
        threads.push_back(main_thread);
    }
    json body;
    body["threads"] = threads;
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_continue(const json& request) {
    resume(request, ResumeMode::CONTINUE);
}

void DebugSession::on_next(const json& request) {
    resume(request, ResumeMode::STEP_OVER);
}

void DebugSession::on_step_in(const json& request) {
    resume(request, ResumeMode::STEP_IN);
}

void DebugSession::on_step_out(const json& request) {
    resume(request, ResumeMode::STEP_OUT);
}

void DebugSession::resume(const json& request, ResumeMode mode) {
    clear_snapshot();
    bridge->resume(mode);
    current_state = SessionState::RUNNING;

    json body = nullptr;
    if (mode == ResumeMode::CONTINUE) {
        body = json::object();
        body["allThreadsContinued"] = true;
    }
    dispatcher.post_response(request, true, body);

    json continued;
    continued["threadId"] = THREAD_ID;
    continued["allThreadsContinued"] = true;
    dispatcher.post_event("continued", continued);
}

void DebugSession::on_pause(const json& request) {
    if (current_state == SessionState::RUNNING) {
        bridge->pause();
    }
    dispatcher.post_response(request, true);
}

// --- Inspection ---

const std::vector<StackFrame>& DebugSession::current_frames() {
    if (!frames) {
        frames = bridge->backtrace();
    }
    return *frames;
}

void DebugSession::clear_snapshot() {
    frames.reset();
    references.clear();
    reference_of.clear();
}

void DebugSession::on_stack_trace(const json& request) {
    json arguments = arguments_of(request);
    const auto& all = current_frames();
    size_t start = static_cast<size_t>(std::max<int64_t>(arguments.value("startFrame", int64_t(0)), 0));
    int64_t levels = arguments.value("levels", int64_t(0));
    size_t end = levels > 0 ? std::min(all.size(), start + static_cast<size_t>(levels)) : all.size();

    json list = json::array();
    for (size_t i = start; i < end; ++i) {
        const StackFrame& frame = all[i];
        json out;
        out["id"] = frame.id;
        out["name"] = frame.name;
        out["line"] = frame.line;
        out["column"] = frame.column;
        out["source"] = source_to_json(frame.path);
        list.push_back(out);
    }
    json body;
    body["stackFrames"] = list;
    body["totalFrames"] = all.size();
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_scopes(const json& request) {
    int frame_id = arguments_of(request).at("frameId").get<int>();
    const auto& all = current_frames();
    if (frame_id < 1 || static_cast<size_t>(frame_id) > all.size()) {
        throw Error::Failure(Error::INVALID_REFERENCE, "frame " + std::to_string(frame_id));
    }
    int level = frame_id - 1;

    auto reference_for = [&](ScopeKind kind) {
        auto key = std::make_pair(level, kind);
        auto found = reference_of.find(key);
        if (found != reference_of.end()) {
            return found->second;
        }
        int reference = next_reference++;
        references[reference] = VariablesRef{ level, kind, false, {} };
        reference_of[key] = reference;
        return reference;
    };

    json locals;
    locals["name"] = "Locals";
    locals["presentationHint"] = "locals";
    locals["variablesReference"] = reference_for(ScopeKind::LOCALS);
    locals["expensive"] = false;

    json globals;
    globals["name"] = "Globals";
    globals["variablesReference"] = reference_for(ScopeKind::GLOBALS);
    globals["expensive"] = true;

    json body;
    body["scopes"] = json::array({ locals, globals });
    dispatcher.post_response(request, true, body);
}

// Elements of a container get a reference of their own, valid until the next resume.
json DebugSession::variable_to_json(Variable variable, const VariablesRef& owner) {
    if (!variable.children.empty()) {
        variable.variables_reference = next_reference++;
        references[variable.variables_reference] =
            VariablesRef{ owner.frame_level, owner.kind, true, std::move(variable.children) };
    }

    json out;
    out["name"] = variable.name;
    out["value"] = variable.value;
    out["type"] = variable.type;
    out["variablesReference"] = variable.variables_reference;
    if (variable.variables_reference != 0) {
        size_t count = references.at(variable.variables_reference).children.size();
        if (variable.type == "array" || variable.value.find("ARRAY(0x") != std::string::npos) {
            out["indexedVariables"] = count;
        }
        else {
            out["namedVariables"] = count;
        }
    }
    return out;
}

void DebugSession::on_variables(const json& request) {
    int reference = arguments_of(request).at("variablesReference").get<int>();
    auto found = references.find(reference);
    if (found == references.end()) {
        throw Error::Failure(Error::INVALID_REFERENCE, "variablesReference " + std::to_string(reference));
    }

    // Copied: expanding may add entries to the reference table.
    const VariablesRef owner = found->second;
    std::vector<Variable> variables = owner.container ? owner.children
                                                      : bridge->variables(owner.frame_level, owner.kind);

    json list = json::array();
    for (auto& variable : variables) {
        list.push_back(variable_to_json(std::move(variable), owner));
    }
    json body;
    body["variables"] = list;
    dispatcher.post_response(request, true, body);
}

// Assigns to a variable listed in a scope of the innermost frame, where perl5db
// evaluates expressions, and answers with the value read back.
void DebugSession::on_set_variable(const json& request) {
    json arguments = arguments_of(request);
    int reference = arguments.at("variablesReference").get<int>();
    auto found = references.find(reference);
    if (found == references.end()) {
        throw Error::Failure(Error::INVALID_REFERENCE, "variablesReference " + std::to_string(reference));
    }
    auto name_field = arguments.find("name");
    auto value_field = arguments.find("value");
    if (name_field == arguments.end() || !name_field->is_string() ||
        value_field == arguments.end() || !value_field->is_string()) {
        throw Error::Failure(Error::MISSING_ARGUMENTS, "'name' and 'value' are required");
    }
    std::string name = name_field->get<std::string>();
    std::string value = value_field->get<std::string>();
    StringUtils::strip(name);
    StringUtils::strip(value);

    if (found->second.container) {
        throw Error::Failure(Error::INVALID_ARGUMENTS, "elements of " + name + " cannot be assigned");
    }
    if (found->second.frame_level != 0) {
        throw Error::Failure(Error::INVALID_ARGUMENTS, "only variables of the current frame can be assigned");
    }
    if (!ExpressionGuard::is_variable_name(name)) {
        throw Error::Failure(Error::INVALID_ARGUMENTS, "'" + name + "' is not a perl variable");
    }
    ExpressionGuard::require_single_line(value);

    bridge->evaluate(name + " = " + value);
    // Listed containers are stale once anything was assigned.
    for (auto it = references.begin(); it != references.end();) {
        it = it->second.container ? references.erase(it) : std::next(it);
    }

    json body;
    body["value"] = bridge->evaluate(name);
    body["variablesReference"] = 0;
    dispatcher.post_response(request, true, body);
}

void DebugSession::on_evaluate(const json& request) {
    json arguments = arguments_of(request);
    auto expression = arguments.find("expression");
    if (expression == arguments.end() || !expression->is_string()) {
        throw Error::Failure(Error::MISSING_ARGUMENTS, "'expression' is required");
    }
    const std::string text = expression->get<std::string>();
    ExpressionGuard::require_single_line(text);
    if (!arguments.value("allowSideEffects", false)) {
        ExpressionGuard::require_side_effect_free(text);
    }

    json body;
    body["result"] = bridge->evaluate(text);
    body["variablesReference"] = 0;
    dispatcher.post_response(request, true, body);
}

// --- Debugger events ---

void DebugSession::on_bridge_event(const BridgeEvent& event) {
    if (current_state == SessionState::TERMINATED) {
        return;
    }

    switch (event.kind) {
    case BridgeEvent::Kind::OUTPUT:
        output(event.category, event.text);
        break;

    case BridgeEvent::Kind::STOPPED:
        on_stopped(event);
        break;

    case BridgeEvent::Kind::BREAKPOINT_REJECTED:
        on_rejected(event);
        break;

    case BridgeEvent::Kind::FAULT:
        output("stderr", "Debugger failure: " + event.text + "\n");
        [[fallthrough]];
    case BridgeEvent::Kind::EXITED: {
        json exited;
        exited["exitCode"] = event.exit_code;
        dispatcher.post_event("exited", exited);
        dispatcher.post_event("terminated");
        enter_terminated();
        break;
    }
    }
}

void DebugSession::on_stopped(const BridgeEvent& event) {
    if (current_state != SessionState::RUNNING) {
        TextIO::debug("DAP Info: Ignoring stop while " + to_string(current_state) + "\n");
        return;
    }
    clear_snapshot();

    std::vector<int64_t> hit_ids;
    if (event.reason == "breakpoint") {
        BreakpointStore::HitOutcome outcome = registry.register_hit(event.path, event.line);
        for (const auto& message : outcome.log_messages) {
            output("console", render_log_message(message) + "\n");
        }
        if (outcome.matched && !outcome.should_stop) {
            // The debuggee is at its prompt: install queued changes before it runs on.
            current_state = SessionState::STOPPED;
            sync_pending();
            current_state = SessionState::RUNNING;
            try {
                bridge->resume(ResumeMode::CONTINUE);
                return;
            }
            catch (const Error::Failure& e) {
                Error::print(e.code(), e.detail());
            }
        }
        hit_ids = outcome.hit_ids;
    }

    current_state = SessionState::STOPPED;
    sync_pending();

    json body;
    body["reason"] = event.reason;
    body["threadId"] = THREAD_ID;
    body["allThreadsStopped"] = true;
    if (!hit_ids.empty()) {
        body["hitBreakpointIds"] = hit_ids;
    }
    if (!event.text.empty()) {
        body["text"] = event.text;
        body["description"] = "Uncaught die";
    }
    dispatcher.post_event("stopped", body);
}

void DebugSession::on_rejected(const BridgeEvent& event) {
    if (!event.function.empty()) {
        output("console", "Function breakpoint " + event.function + " not set: " + event.text + "\n");
        return;
    }

    auto lines = installed.find(event.path);
    if (lines != installed.end()) {
        lines->second.erase(event.line);
    }
    Breakpoint changed;
    while (registry.reject(event.path, event.line, event.text, changed)) {
        json body;
        body["reason"] = "changed";
        body["breakpoint"] = breakpoint_to_json(changed);
        dispatcher.post_event("breakpoint", body);
    }
}

// Replaces {expr} with its value in the stopped program.
std::string DebugSession::render_log_message(const std::string& text) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        size_t close = open == std::string::npos ? std::string::npos : text.find('}', open + 1);
        if (close == std::string::npos) {
            out += text.substr(pos);
            break;
        }
        out += text.substr(pos, open - pos);
        std::string expression = text.substr(open + 1, close - open - 1);
        try {
            ExpressionGuard::require_single_line(expression);
            ExpressionGuard::require_side_effect_free(expression);
            out += bridge->evaluate(expression);
        }
        catch (const Error::Failure& e) {
            TextIO::debug(std::string("DAP Info: Log message kept {") + expression + "}: " + e.what() + "\n");
            out += "{" + expression + "}";
        }
        pos = close + 1;
    }
    return out;
}

void DebugSession::output(const std::string& category, const std::string& text) {
    json body;
    body["category"] = category;
    body["output"] = text;
    dispatcher.post_event("output", body);
}
