/*
 * Debug Flags
 *
 * Verbose log categories. Set once at startup from the command line
 * or LUNARVIEW_DEBUG_* environment variables, read everywhere else.
 */

#ifndef DEBUG_FLAGS_H
#define DEBUG_FLAGS_H

extern bool g_debug_connection;   // WebSocket, WebRTC, ICE, signaling
extern bool g_debug_relay;        // Per-message relay forwarding
extern bool g_debug_stream;       // Frame timing, quality changes
extern bool g_debug_transfer;     // Per-chunk file transfer logs

#endif // DEBUG_FLAGS_H
