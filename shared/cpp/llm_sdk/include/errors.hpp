#pragma once
#include <stdexcept>
#include <string>

// Invalid chunking/index/agent parameters. Fatal, never retried.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Declared document type has no loader.
struct UnsupportedFormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Transport, auth, rate-limit or decoding failure talking to the model host.
struct GatewayError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct EmbeddingError : GatewayError {
    using GatewayError::GatewayError;
};

// Operation invoked before its prerequisite state (e.g. ask before ingest).
struct NotReadyError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Reasoning loop could not reach the model. Reported, not thrown to hosts.
struct AgentError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
