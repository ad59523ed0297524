#pragma once

#include <string>

// Closed result sets returned by the node pool. Nothing is thrown across the
// pool boundary; every failure is one of these.

enum class AddResult {
    Ok,
    NodeAlreadyExists,
};

enum class RemoveResult {
    Ok,
    NodeNotFound,
};

enum class ConnectResult {
    Ok,
    NodeNotFound,
    NotAuthenticated,
};

enum class DisconnectResult {
    Ok,
    NodeNotFound,
};

enum class DeployResult {
    Ok,
    InvalidArgument,
    NodeNotFound,
    NodeNotConnected,
    DeployCopyFailed,
    DeployExtractionFailed,
    DeployTestFailed,
};

enum class RunResult {
    Ok,
    NodeNotFound,
    NodeNotConnected,
    RunFailed,
};

std::string to_string(AddResult r);
std::string to_string(RemoveResult r);
std::string to_string(ConnectResult r);
std::string to_string(DisconnectResult r);
std::string to_string(DeployResult r);
std::string to_string(RunResult r);
