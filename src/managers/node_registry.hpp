#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/results.hpp>
#include <core/types.hpp>

// Static node entries plus pool-wide parameter defaults. Not synchronized:
// NodePool guards it together with its session map.
class NodeRegistry {
public:
    AddResult add(const std::string& name, const std::string& address, const ParamMap& params);
    RemoveResult remove(const std::string& name);

    bool contains(const std::string& name) const;
    std::optional<Node> find(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return nodes_.size(); }

    void set_default(const std::string& key, const std::string& value);
    const ParamMap& defaults() const { return defaults_; }

    // node override -> pool default -> "". Unknown nodes see only the defaults.
    std::string get_param(const std::string& name, const std::string& key) const;
    std::string get_param(const std::string& name, NodeParameter param) const;

private:
    std::map<std::string, Node> nodes_;
    ParamMap defaults_;
};
