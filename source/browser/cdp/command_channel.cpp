#include "browser/cdp/command_channel.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

namespace cdp {

using browser_driver::CommandResult;
using browser_driver::ErrorKind;

namespace {

CommandResult failure(ErrorKind kind, const std::string &detail) {
    CommandResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_detail = detail;
    return result;
}

std::string describe_target(const std::string &session_id) {
    return session_id.empty() ? std::string("browser") : "session " + session_id;
}

} // namespace

CommandChannel::CommandChannel(FrameWriter writer) : writer_(std::move(writer)) {}

CommandResult CommandChannel::send(const std::string &session_id, const std::string &method,
                                   const json &params) {
    int message_id = 0;
    std::shared_ptr<PendingCommand> pending;
    std::string serialized_command;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (channel_down_) {
            return failure(channel_down_kind_, method + ": " + channel_down_detail_);
        }
        if (!session_id.empty() && closed_sessions_.count(session_id) != 0) {
            return failure(ErrorKind::NotAttached, method + ": " + describe_target(session_id) + " is closed.");
        }

        message_id = ++next_message_ids_[session_id];
        pending = std::make_shared<PendingCommand>();
        pending->method = method;
        pending_commands_[PendingKey(session_id, message_id)] = pending;

        // Serializing can throw on invalid UTF-8; keep that inside the table update.
        try {
            serialized_command = cdp_message::build_command(message_id, method, params, session_id).dump();
        } catch (const json::type_error &type_error) {
            pending_commands_.erase(PendingKey(session_id, message_id));
            return failure(ErrorKind::Protocol, method + ": cannot serialize params: " + type_error.what());
        }
    }

    debug_log::log("-> " + describe_target(session_id) + " #" + std::to_string(message_id) + " " + method);

    if (!writer_(serialized_command)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_commands_.erase(PendingKey(session_id, message_id));
        return failure(ErrorKind::Transport, method + ": failed to send command frame.");
    }

    std::unique_lock<std::mutex> lock(pending_mutex_);
    pending_condition_.wait(lock, [&pending] { return pending->complete; });
    pending_commands_.erase(PendingKey(session_id, message_id));
    return pending->result;
}

bool CommandChannel::resolve(const json &response) {
    int message_id = cdp_message::get_id(response);
    std::string session_id = cdp_message::get_session_id(response);

    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto pending_iterator = pending_commands_.find(PendingKey(session_id, message_id));
    if (pending_iterator == pending_commands_.end() || pending_iterator->second->complete) {
        debug_log::log("<- unmatched response #" + std::to_string(message_id) + " for " +
                       describe_target(session_id));
        return false;
    }

    PendingCommand &pending = *pending_iterator->second;
    if (cdp_message::has_error(response)) {
        pending.result.success = false;
        pending.result.error_kind = ErrorKind::Protocol;
        pending.result.error_payload = response["error"];
        pending.result.error_detail = pending.method + " failed: " + cdp_message::describe_error(response["error"]);
    } else {
        pending.result.success = true;
        if (response.contains("result") && response["result"].is_object()) {
            pending.result.result = response["result"];
        }
    }
    pending.complete = true;
    pending_condition_.notify_all();
    return true;
}

void CommandChannel::close_session(const std::string &session_id) {
    if (session_id.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (closed_sessions_.insert(session_id).second) {
        closed_session_order_.push_back(session_id);
        if (closed_session_order_.size() > kClosedSessionMemory) {
            closed_sessions_.erase(closed_session_order_.front());
            closed_session_order_.pop_front();
        }
    }
    next_message_ids_.erase(session_id);
    for (auto &entry : pending_commands_) {
        if (entry.first.first != session_id || entry.second->complete) {
            continue;
        }
        entry.second->result = failure(ErrorKind::NotAttached,
                                       entry.second->method + ": session closed while waiting for response.");
        entry.second->complete = true;
    }
    pending_condition_.notify_all();
}

void CommandChannel::fail_all(ErrorKind kind, const std::string &detail) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    channel_down_ = true;
    channel_down_kind_ = kind;
    channel_down_detail_ = detail;
    for (auto &entry : pending_commands_) {
        if (entry.second->complete) {
            continue;
        }
        entry.second->result = failure(kind, entry.second->method + ": " + detail);
        entry.second->complete = true;
    }
    pending_condition_.notify_all();
}

std::size_t CommandChannel::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_commands_.size();
}

std::size_t CommandChannel::pending_count(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    std::size_t count = 0;
    for (const auto &entry : pending_commands_) {
        if (entry.first.first == session_id) {
            ++count;
        }
    }
    return count;
}

std::size_t CommandChannel::closed_session_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return closed_sessions_.size();
}

} // namespace cdp
