#pragma once
#include <QtGlobal>

enum class ApiType : quint8 {
    Ollama, OpenAI
};

// Request/response shape spoken on the local leg for a given endpoint.
enum class Dialect : quint8 {
    Ollama, OpenAI
};

enum class ErrorKind : quint8 {
    UnknownProvider,      // 404
    UnknownModel,         // 404
    RouteNotFound,        // 404
    MalformedRequest,     // 400
    PayloadTooLarge,      // 413
    HeaderTooLarge,       // 431
    NotSupported,         // 501
    UpstreamUnreachable,  // 502
    UpstreamTimeout,      // 504
    ConfigurationInvalid, // startup only
    Internal              // 500
};

enum class UnknownModelPolicy : quint8 {
    Reject, PassThrough
};

enum class BodyMode : quint8 {
    Buffered,
    StreamEvents,   // text/event-stream, one unit per event block
    StreamLines,    // application/x-ndjson, one unit per line
    StreamRaw       // unframed body, one unit per read
};
