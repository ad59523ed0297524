#include "types.hpp"

std::string to_string(DeploySubject subject) {
    switch (subject) {
        case DeploySubject::Delta: return "delta";
        case DeploySubject::Visao: return "visao";
    }
    return "unknown";
}

std::optional<DeploySubject> parse_subject(const std::string& name) {
    if (name == "delta") return DeploySubject::Delta;
    if (name == "visao") return DeploySubject::Visao;
    return std::nullopt;
}

std::vector<DeploySubject> deployable_subjects() {
    return {DeploySubject::Visao};
}

std::string to_string(NodeParameter param) {
    switch (param) {
        case NodeParameter::Username: return "username";
        case NodeParameter::Password: return "password";
        case NodeParameter::Distr:    return "distr";
        case NodeParameter::BindAddr: return "bind_addr";
        case NodeParameter::BindPort: return "bind_port";
    }
    return "";
}

std::optional<NodeParameter> parse_parameter(const std::string& key) {
    for (auto p : {NodeParameter::Username, NodeParameter::Password, NodeParameter::Distr,
                   NodeParameter::BindAddr, NodeParameter::BindPort}) {
        if (to_string(p) == key) return p;
    }
    return std::nullopt;
}
