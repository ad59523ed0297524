#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/results.hpp>
#include <core/status.hpp>
#include <ssh/remote_session.hpp>
#include "instance.hpp"
#include "node_registry.hpp"

// Registry of nodes, their live sessions, and the deploy/run/alive protocols.
//
// One pool-wide mutex serializes structural changes (add/remove/connect/
// disconnect) and makes reads safe. Remote I/O runs outside the lock, so
// different nodes proceed in parallel. The pool assumes at most one in-flight
// operation per node name; callers must serialize per node.
class NodePool {
public:
    explicit NodePool(RemoteTransport& transport);
    ~NodePool();

    NodePool(const NodePool&) = delete;
    NodePool& operator=(const NodePool&) = delete;

    // Seed pool defaults, startup pause and nodes from config.
    // Returns the names of nodes that were already registered.
    std::vector<std::string> apply(const Config& config);

    // ── Registry ──────────────────────────────────────────────
    AddResult add(const std::string& name, const std::string& address,
                  const ParamMap& params = {});
    RemoveResult remove(const std::string& name);
    std::vector<std::string> node_names() const;

    std::string get_param(const std::string& name, NodeParameter param) const;
    std::string get_param(const std::string& name, const std::string& key) const;
    void set_default_param(const std::string& key, const std::string& value);

    // ── Sessions ──────────────────────────────────────────────
    ConnectResult connect(const std::string& name);
    DisconnectResult disconnect(const std::string& name);
    ConnStatus is_connected(const std::string& name) const;

    // ── Pipelines ─────────────────────────────────────────────
    DeployResult deploy(const std::string& name, DeploySubject subject);
    RunResult run(const std::string& name, DeploySubject subject);

    SubjectAliveStatus is_alive(const std::string& name,
                                DeploySubject subject = DeploySubject::Visao) const;
    ConnAliveStatus is_alive_all(const std::string& name) const;

    void set_startup_pause(int secs);
    int startup_pause() const;

private:
    RemoteTransport& transport_;
    NodeRegistry registry_;
    std::map<std::string, std::unique_ptr<Instance>> instances_;
    int startup_pause_secs_;
    mutable std::mutex mutex_;

    // Caller holds mutex_
    Instance* find_instance(const std::string& name) const;

    // Write back a subject status if the instance it was read from is still live
    void store_status(const std::string& name, const Instance* expected,
                      DeploySubject subject, const SubjectStatus& status);
};
