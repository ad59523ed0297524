#include "node_registry.hpp"

AddResult NodeRegistry::add(const std::string& name, const std::string& address,
                            const ParamMap& params) {
    if (nodes_.count(name)) {
        return AddResult::NodeAlreadyExists;
    }
    nodes_[name] = Node{address, params};
    return AddResult::Ok;
}

RemoveResult NodeRegistry::remove(const std::string& name) {
    if (nodes_.erase(name) == 0) {
        return RemoveResult::NodeNotFound;
    }
    return RemoveResult::Ok;
}

bool NodeRegistry::contains(const std::string& name) const {
    return nodes_.count(name) != 0;
}

std::optional<Node> NodeRegistry::find(const std::string& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> NodeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto& kv : nodes_) out.push_back(kv.first);
    return out;
}

void NodeRegistry::set_default(const std::string& key, const std::string& value) {
    defaults_[key] = value;
}

std::string NodeRegistry::get_param(const std::string& name, const std::string& key) const {
    auto it = nodes_.find(name);
    if (it != nodes_.end()) {
        auto p = it->second.params.find(key);
        if (p != it->second.params.end()) return p->second;
    }

    auto d = defaults_.find(key);
    if (d != defaults_.end()) return d->second;

    return "";
}

std::string NodeRegistry::get_param(const std::string& name, NodeParameter param) const {
    return get_param(name, to_string(param));
}
