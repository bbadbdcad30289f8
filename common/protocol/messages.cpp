/*
 * Wire Protocol Implementation
 */

#include "messages.h"
#include "../errors.h"
#include <type_traits>
#include <unordered_map>

namespace protocol {

using namespace json_utils;

namespace {

/*
 * Field encoders, one overload per message type
 */

void write_fields(const Register& m, json& j) {
    j["connectionId"] = m.connection_id;
    j["password"] = m.password;
    j["isHost"] = m.is_host;
    if (!m.public_key.empty()) j["publicKey"] = m.public_key;
}

void write_fields(const Registered& m, json& j) {
    j["connectionId"] = m.connection_id;
    if (!m.client_id.empty()) j["clientId"] = m.client_id;
}

void write_fields(const Connect& m, json& j) {
    j["targetConnectionId"] = m.target_connection_id;
    j["password"] = m.password;
}

void write_fields(const ConnectSuccess& m, json& j) {
    j["sessionId"] = m.session_id;
    j["targetConnectionId"] = m.target_connection_id;
    if (!m.target_public_key.empty()) j["targetPublicKey"] = m.target_public_key;
}

void write_fields(const ConnectError& m, json& j) {
    j["error"] = m.error;
}

void write_fields(const IncomingConnection& m, json& j) {
    j["sessionId"] = m.session_id;
    j["fromConnectionId"] = m.from_connection_id;
    if (!m.from_public_key.empty()) j["fromPublicKey"] = m.from_public_key;
}

void write_fields(const Disconnect&, json&) {}

void write_fields(const Disconnected& m, json& j) {
    j["reason"] = m.reason;
}

void write_fields(const Ping&, json&) {}
void write_fields(const Pong&, json&) {}

json description_to_json(const SessionDescription& d) {
    return json{{"type", d.type}, {"sdp", d.sdp}};
}

void write_fields(const Offer& m, json& j) {
    j["offer"] = description_to_json(m.offer);
}

void write_fields(const Answer& m, json& j) {
    j["answer"] = description_to_json(m.answer);
}

void write_fields(const IceCandidate& m, json& j) {
    j["candidate"] = json{{"candidate", m.candidate}, {"sdpMid", m.sdp_mid}};
}

void write_fields(const KeyExchange& m, json& j) {
    j["publicKey"] = m.public_key;
    if (!m.session_id.empty()) j["sessionId"] = m.session_id;
}

void write_fields(const Relay& m, json& j) { j["data"] = m.data; }
void write_fields(const Relayed& m, json& j) { j["data"] = m.data; }
void write_fields(const ScreenFrame& m, json& j) { j["frame"] = m.frame; }
void write_fields(const MouseEvent& m, json& j) { j["event"] = m.event; }
void write_fields(const KeyboardEvent& m, json& j) { j["event"] = m.event; }

void write_fields(const ClipboardSync& m, json& j) {
    j["content"] = json{
        {"type", m.content.type},
        {"data", m.content.data},
        {"timestamp", m.content.timestamp}
    };
}

void write_fields(const FileStart& m, json& j) {
    j["fileId"] = m.file_id;
    j["fileName"] = m.file_name;
    j["fileSize"] = m.file_size;
    j["totalChunks"] = m.total_chunks;
    j["checksum"] = m.checksum;
}

void write_fields(const FileReady& m, json& j) { j["fileId"] = m.file_id; }

void write_fields(const FileChunk& m, json& j) {
    j["fileId"] = m.file_id;
    j["chunkIndex"] = m.chunk_index;
    j["totalChunks"] = m.total_chunks;
    j["data"] = m.data;
    j["checksum"] = m.checksum;
}

void write_fields(const FileChunkAck& m, json& j) {
    j["fileId"] = m.file_id;
    j["chunkIndex"] = m.chunk_index;
}

void write_fields(const FileChunkRetry& m, json& j) {
    j["fileId"] = m.file_id;
    j["chunkIndex"] = m.chunk_index;
}

void write_fields(const FileComplete& m, json& j) { j["fileId"] = m.file_id; }
void write_fields(const FileCancel& m, json& j) { j["fileId"] = m.file_id; }

/*
 * Field decoders. Missing or mistyped required fields throw
 * errors::ProtocolError from the require_* helpers.
 */

SessionDescription read_description(const json& j, const std::string& key) {
    const json& d = require_value(j, key);
    SessionDescription desc;
    desc.type = require_string(d, "type");
    desc.sdp = require_string(d, "sdp");
    return desc;
}

json read_object(const json& j, const std::string& key) {
    const json& v = require_value(j, key);
    if (!v.is_object()) {
        throw errors::ProtocolError("field '" + key + "' must be an object");
    }
    return v;
}

Message read_register(const json& j) {
    Register m;
    m.connection_id = require_string(j, "connectionId");
    m.password = get_string(j, "password");
    m.is_host = get_bool(j, "isHost");
    m.public_key = get_string(j, "publicKey");
    return m;
}

Message read_registered(const json& j) {
    Registered m;
    m.connection_id = require_string(j, "connectionId");
    m.client_id = get_string(j, "clientId");
    return m;
}

Message read_connect(const json& j) {
    Connect m;
    m.target_connection_id = require_string(j, "targetConnectionId");
    m.password = require_string(j, "password");
    return m;
}

Message read_connect_success(const json& j) {
    ConnectSuccess m;
    m.session_id = require_string(j, "sessionId");
    m.target_connection_id = require_string(j, "targetConnectionId");
    m.target_public_key = get_string(j, "targetPublicKey");
    return m;
}

Message read_connect_error(const json& j) {
    ConnectError m;
    m.error = require_string(j, "error");
    return m;
}

Message read_incoming_connection(const json& j) {
    IncomingConnection m;
    m.session_id = require_string(j, "sessionId");
    m.from_connection_id = require_string(j, "fromConnectionId");
    m.from_public_key = get_string(j, "fromPublicKey");
    return m;
}

Message read_disconnect(const json&) { return Disconnect{}; }

Message read_disconnected(const json& j) {
    Disconnected m;
    m.reason = get_string(j, "reason");
    return m;
}

Message read_ping(const json&) { return Ping{}; }
Message read_pong(const json&) { return Pong{}; }

Message read_offer(const json& j) {
    Offer m;
    m.offer = read_description(j, "offer");
    return m;
}

Message read_answer(const json& j) {
    Answer m;
    m.answer = read_description(j, "answer");
    return m;
}

Message read_ice_candidate(const json& j) {
    const json& c = require_value(j, "candidate");
    IceCandidate m;
    m.candidate = require_string(c, "candidate");
    m.sdp_mid = get_string(c, "sdpMid");
    return m;
}

Message read_key_exchange(const json& j) {
    KeyExchange m;
    m.public_key = require_string(j, "publicKey");
    m.session_id = get_string(j, "sessionId");
    return m;
}

Message read_relay(const json& j) {
    Relay m;
    m.data = require_value(j, "data");
    return m;
}

Message read_relayed(const json& j) {
    Relayed m;
    m.data = require_value(j, "data");
    return m;
}

Message read_screen_frame(const json& j) {
    ScreenFrame m;
    m.frame = require_string(j, "frame");
    return m;
}

Message read_mouse_event(const json& j) {
    MouseEvent m;
    m.event = read_object(j, "event");
    return m;
}

Message read_keyboard_event(const json& j) {
    KeyboardEvent m;
    m.event = read_object(j, "event");
    return m;
}

Message read_clipboard_sync(const json& j) {
    const json& c = require_value(j, "content");
    ClipboardSync m;
    m.content.type = get_string(c, "type", "text");
    m.content.data = require_string(c, "data");
    m.content.timestamp = get_int64(c, "timestamp");
    return m;
}

Message read_file_start(const json& j) {
    FileStart m;
    m.file_id = require_string(j, "fileId");
    m.file_name = require_string(j, "fileName");
    m.file_size = require_int64(j, "fileSize");
    m.total_chunks = require_int64(j, "totalChunks");
    m.checksum = require_string(j, "checksum");
    return m;
}

Message read_file_ready(const json& j) {
    FileReady m;
    m.file_id = require_string(j, "fileId");
    return m;
}

Message read_file_chunk(const json& j) {
    FileChunk m;
    m.file_id = require_string(j, "fileId");
    m.chunk_index = require_int64(j, "chunkIndex");
    m.total_chunks = require_int64(j, "totalChunks");
    m.data = require_string(j, "data");
    m.checksum = require_string(j, "checksum");
    return m;
}

Message read_file_chunk_ack(const json& j) {
    FileChunkAck m;
    m.file_id = require_string(j, "fileId");
    m.chunk_index = require_int64(j, "chunkIndex");
    return m;
}

Message read_file_chunk_retry(const json& j) {
    FileChunkRetry m;
    m.file_id = require_string(j, "fileId");
    m.chunk_index = require_int64(j, "chunkIndex");
    return m;
}

Message read_file_complete(const json& j) {
    FileComplete m;
    m.file_id = require_string(j, "fileId");
    return m;
}

Message read_file_cancel(const json& j) {
    FileCancel m;
    m.file_id = require_string(j, "fileId");
    return m;
}

using Reader = Message (*)(const json&);

const std::unordered_map<std::string, Reader>& readers() {
    static const std::unordered_map<std::string, Reader> table = {
        {Register::TYPE,           read_register},
        {Registered::TYPE,         read_registered},
        {Connect::TYPE,            read_connect},
        {ConnectSuccess::TYPE,     read_connect_success},
        {ConnectError::TYPE,       read_connect_error},
        {IncomingConnection::TYPE, read_incoming_connection},
        {Disconnect::TYPE,         read_disconnect},
        {Disconnected::TYPE,       read_disconnected},
        {Ping::TYPE,               read_ping},
        {Pong::TYPE,               read_pong},
        {Offer::TYPE,              read_offer},
        {Answer::TYPE,             read_answer},
        {IceCandidate::TYPE,       read_ice_candidate},
        {KeyExchange::TYPE,        read_key_exchange},
        {Relay::TYPE,              read_relay},
        {Relayed::TYPE,            read_relayed},
        {ScreenFrame::TYPE,        read_screen_frame},
        {MouseEvent::TYPE,         read_mouse_event},
        {KeyboardEvent::TYPE,      read_keyboard_event},
        {ClipboardSync::TYPE,      read_clipboard_sync},
        {FileStart::TYPE,          read_file_start},
        {FileReady::TYPE,          read_file_ready},
        {FileChunk::TYPE,          read_file_chunk},
        {FileChunkAck::TYPE,       read_file_chunk_ack},
        {FileChunkRetry::TYPE,     read_file_chunk_retry},
        {FileComplete::TYPE,       read_file_complete},
        {FileCancel::TYPE,         read_file_cancel},
    };
    return table;
}

} // namespace

bool decode(const std::string& text, Message& out, std::string& error) {
    try {
        json j = parse(text);
        if (!j.is_object()) {
            error = "message is not an object";
            return false;
        }

        std::string type = get_string(j, "type");
        if (type.empty()) {
            error = "missing message type";
            return false;
        }

        auto it = readers().find(type);
        if (it == readers().end()) {
            error = "unknown message type '" + type + "'";
            return false;
        }

        out = it->second(j);
        return true;
    } catch (const errors::ProtocolError& e) {
        error = e.what();
        return false;
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

std::string encode(const Message& msg) {
    json j = json::object();
    j["type"] = type_name(msg);
    std::visit([&j](const auto& m) { write_fields(m, j); }, msg);
    return to_string(j);
}

const char* type_name(const Message& msg) {
    return std::visit([](const auto& m) -> const char* {
        return std::decay_t<decltype(m)>::TYPE;
    }, msg);
}

bool is_forwarded(const Message& msg) {
    return std::visit(overloaded{
        [](const Offer&) { return true; },
        [](const Answer&) { return true; },
        [](const IceCandidate&) { return true; },
        [](const KeyExchange&) { return true; },
        [](const ScreenFrame&) { return true; },
        [](const MouseEvent&) { return true; },
        [](const KeyboardEvent&) { return true; },
        [](const ClipboardSync&) { return true; },
        [](const FileStart&) { return true; },
        [](const FileReady&) { return true; },
        [](const FileChunk&) { return true; },
        [](const FileChunkAck&) { return true; },
        [](const FileChunkRetry&) { return true; },
        [](const FileComplete&) { return true; },
        [](const FileCancel&) { return true; },
        [](const auto&) { return false; },
    }, msg);
}

} // namespace protocol
