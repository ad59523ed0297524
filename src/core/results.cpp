#include "results.hpp"

std::string to_string(AddResult r) {
    switch (r) {
        case AddResult::Ok:                return "Ok";
        case AddResult::NodeAlreadyExists: return "NodeAlreadyExists";
    }
    return "Unknown";
}

std::string to_string(RemoveResult r) {
    switch (r) {
        case RemoveResult::Ok:           return "Ok";
        case RemoveResult::NodeNotFound: return "NodeNotFound";
    }
    return "Unknown";
}

std::string to_string(ConnectResult r) {
    switch (r) {
        case ConnectResult::Ok:               return "Ok";
        case ConnectResult::NodeNotFound:     return "NodeNotFound";
        case ConnectResult::NotAuthenticated: return "NotAuthenticated";
    }
    return "Unknown";
}

std::string to_string(DisconnectResult r) {
    switch (r) {
        case DisconnectResult::Ok:           return "Ok";
        case DisconnectResult::NodeNotFound: return "NodeNotFound";
    }
    return "Unknown";
}

std::string to_string(DeployResult r) {
    switch (r) {
        case DeployResult::Ok:                     return "Ok";
        case DeployResult::InvalidArgument:        return "InvalidArgument";
        case DeployResult::NodeNotFound:           return "NodeNotFound";
        case DeployResult::NodeNotConnected:       return "NodeNotConnected";
        case DeployResult::DeployCopyFailed:       return "DeployCopyFailed";
        case DeployResult::DeployExtractionFailed: return "DeployExtractionFailed";
        case DeployResult::DeployTestFailed:       return "DeployTestFailed";
    }
    return "Unknown";
}

std::string to_string(RunResult r) {
    switch (r) {
        case RunResult::Ok:               return "Ok";
        case RunResult::NodeNotFound:     return "NodeNotFound";
        case RunResult::NodeNotConnected: return "NodeNotConnected";
        case RunResult::RunFailed:        return "RunFailed";
    }
    return "Unknown";
}
