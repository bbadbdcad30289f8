/*
 * Wire Protocol
 *
 * JSON text messages exchanged between peers and the relay server,
 * and between peers over the P2P data channel. Every message is an
 * object with a "type" field; the payload fields depend on the type.
 *
 * Inbound text is decoded once at the boundary into the closed
 * Message variant. Handlers dispatch on it with std::visit.
 */

#ifndef MESSAGES_H
#define MESSAGES_H

#include "../utils/json_utils.h"
#include <cstdint>
#include <string>
#include <variant>

namespace protocol {

using json = json_utils::json;

/*
 * Session setup
 */

struct Register {
    static constexpr const char* TYPE = "register";
    std::string connection_id;
    std::string password;     // Empty for viewers
    bool is_host = false;
    std::string public_key;   // Optional
};

struct Registered {
    static constexpr const char* TYPE = "registered";
    std::string connection_id;
    std::string client_id;    // Optional
};

struct Connect {
    static constexpr const char* TYPE = "connect";
    std::string target_connection_id;
    std::string password;
};

struct ConnectSuccess {
    static constexpr const char* TYPE = "connect-success";
    std::string session_id;
    std::string target_connection_id;
    std::string target_public_key;  // Optional
};

struct ConnectError {
    static constexpr const char* TYPE = "connect-error";
    std::string error;
};

struct IncomingConnection {
    static constexpr const char* TYPE = "incoming-connection";
    std::string session_id;
    std::string from_connection_id;
    std::string from_public_key;    // Optional
};

struct Disconnect {
    static constexpr const char* TYPE = "disconnect";
};

struct Disconnected {
    static constexpr const char* TYPE = "disconnected";
    std::string reason;
};

struct Ping {
    static constexpr const char* TYPE = "ping";
};

struct Pong {
    static constexpr const char* TYPE = "pong";
};

/*
 * WebRTC signaling
 */

struct SessionDescription {
    std::string type;   // "offer" or "answer"
    std::string sdp;
};

struct Offer {
    static constexpr const char* TYPE = "offer";
    SessionDescription offer;
};

struct Answer {
    static constexpr const char* TYPE = "answer";
    SessionDescription answer;
};

struct IceCandidate {
    static constexpr const char* TYPE = "ice-candidate";
    std::string candidate;
    std::string sdp_mid;
};

struct KeyExchange {
    static constexpr const char* TYPE = "key-exchange";
    std::string public_key;
    std::string session_id;   // Optional
};

/*
 * Payloads
 */

struct Relay {
    static constexpr const char* TYPE = "relay";
    json data;
};

struct Relayed {
    static constexpr const char* TYPE = "relayed";
    json data;
};

// Encoded frame, base64 (relay path only; P2P sends frames as binary)
struct ScreenFrame {
    static constexpr const char* TYPE = "screen-frame";
    std::string frame;
};

/*
 * Input events are carried as opaque JSON objects:
 *   mouse:    {type: move|down|up|scroll, x, y (0..1), button, deltaY}
 *   keyboard: {type: down|up, key, ctrlKey, altKey, shiftKey, metaKey}
 */
struct MouseEvent {
    static constexpr const char* TYPE = "mouse-event";
    json event;
};

struct KeyboardEvent {
    static constexpr const char* TYPE = "keyboard-event";
    json event;
};

struct ClipboardContent {
    std::string type = "text";
    std::string data;
    int64_t timestamp = 0;    // ms since epoch
};

struct ClipboardSync {
    static constexpr const char* TYPE = "clipboard-sync";
    ClipboardContent content;
};

/*
 * File transfer
 */

struct FileStart {
    static constexpr const char* TYPE = "file-start";
    std::string file_id;
    std::string file_name;
    int64_t file_size = 0;
    int64_t total_chunks = 0;
    std::string checksum;     // SHA-256 hex of the whole file
};

struct FileReady {
    static constexpr const char* TYPE = "file-ready";
    std::string file_id;
};

struct FileChunk {
    static constexpr const char* TYPE = "file-chunk";
    std::string file_id;
    int64_t chunk_index = 0;
    int64_t total_chunks = 0;
    std::string data;         // base64
    std::string checksum;     // MD5 hex of the decoded chunk
};

struct FileChunkAck {
    static constexpr const char* TYPE = "file-chunk-ack";
    std::string file_id;
    int64_t chunk_index = 0;
};

struct FileChunkRetry {
    static constexpr const char* TYPE = "file-chunk-retry";
    std::string file_id;
    int64_t chunk_index = 0;
};

struct FileComplete {
    static constexpr const char* TYPE = "file-complete";
    std::string file_id;
};

struct FileCancel {
    static constexpr const char* TYPE = "file-cancel";
    std::string file_id;
};

// Reasons carried by disconnected{reason}
constexpr const char* REASON_PARTNER_DISCONNECTED = "Partner disconnected";
constexpr const char* REASON_REGISTERED_ELSEWHERE = "Connection ID registered elsewhere";

using Message = std::variant<
    Register, Registered, Connect, ConnectSuccess, ConnectError,
    IncomingConnection, Disconnect, Disconnected, Ping, Pong,
    Offer, Answer, IceCandidate, KeyExchange,
    Relay, Relayed, ScreenFrame, MouseEvent, KeyboardEvent, ClipboardSync,
    FileStart, FileReady, FileChunk, FileChunkAck, FileChunkRetry,
    FileComplete, FileCancel>;

/**
 * Decode a JSON text message
 * @param text Raw message text
 * @param out Decoded message (untouched on failure)
 * @param error Reason for failure: invalid JSON, unknown type or bad field
 * @return true on success
 */
bool decode(const std::string& text, Message& out, std::string& error);

// Encode to compact JSON text
std::string encode(const Message& msg);

// Wire "type" string of a message
const char* type_name(const Message& msg);

/**
 * Message types the relay server forwards verbatim to the linked partner
 */
bool is_forwarded(const Message& msg);

// Helper for std::visit with a set of lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace protocol

#endif // MESSAGES_H
