#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// What is being deployed/run on a node. Delta is the orchestrator itself
// and is never a valid deploy target.
enum class DeploySubject {
    Delta,
    Visao,
};

// Well-known node parameter keys
enum class NodeParameter {
    Username,
    Password,
    Distr,       // local path of the distribution archive
    BindAddr,
    BindPort,
};

using ParamMap = std::map<std::string, std::string>;

// Static registry entry. Sessions are tracked by the pool, not here.
struct Node {
    std::string address;   // "host" or "host:port"
    ParamMap params;
};

std::string to_string(DeploySubject subject);
std::optional<DeploySubject> parse_subject(const std::string& name);

// All subjects that can be deployed (everything except Delta)
std::vector<DeploySubject> deployable_subjects();

std::string to_string(NodeParameter param);
std::optional<NodeParameter> parse_parameter(const std::string& key);
