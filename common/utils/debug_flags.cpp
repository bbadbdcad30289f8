/*
 * Debug Flags
 */

#include "debug_flags.h"

bool g_debug_connection = false;
bool g_debug_relay = false;
bool g_debug_stream = false;
bool g_debug_transfer = false;
