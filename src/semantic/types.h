#pragma once
#include <QtGlobal>

enum class Role : quint8 {
    User, Assistant
};

enum class BackendRole : quint8 {
    System, User, Assistant, Tool
};

enum class StopReason : quint8 {
    EndTurn, MaxTokens, StopSequence, ToolUse
};

enum class ToolChoiceMode : quint8 {
    Auto, Any, Tool, None
};

enum class ErrorKind : quint8 {
    Validation,   // 400, request never reaches the backend
    Client,       // backend 4xx
    Upstream,     // backend 5xx, network failure, timeout
    Decode,       // backend payload does not match the expected shape
    Cancelled     // caller-initiated, terminates cleanly
};

enum class CancelReason : quint8 {
    None, Requested, ClientDisconnected, Timeout
};
