#include "node_pool.hpp"
#include "deploy_pipeline.hpp"
#include "liveness_prober.hpp"
#include "run_controller.hpp"
#include "subject_layout.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

NodePool::NodePool(RemoteTransport& transport)
    : transport_(transport), startup_pause_secs_(DEFAULT_STARTUP_PAUSE_SECS) {}

NodePool::~NodePool() {
    std::map<std::string, std::unique_ptr<Instance>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(instances_);
    }
}

std::vector<std::string> NodePool::apply(const Config& config) {
    std::vector<std::string> duplicates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : config.defaults()) {
            registry_.set_default(kv.first, kv.second);
        }
        startup_pause_secs_ = config.startup_pause();
    }
    for (const auto& nc : config.nodes()) {
        if (add(nc.name, nc.address, nc.params) != AddResult::Ok) {
            duplicates.push_back(nc.name);
        }
    }
    return duplicates;
}

// ── Registry ──────────────────────────────────────────────────

AddResult NodePool::add(const std::string& name, const std::string& address,
                        const ParamMap& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = registry_.add(name, address, params);
    if (result == AddResult::NodeAlreadyExists) {
        delta_log("Node already exists: " + name);
        return result;
    }
    delta_log(fmt::format("Added node {} ({})", name, address));
    return result;
}

RemoveResult NodePool::remove(const std::string& name) {
    std::unique_ptr<Instance> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (registry_.remove(name) == RemoveResult::NodeNotFound) {
            delta_log("Node doesn't exist: " + name);
            return RemoveResult::NodeNotFound;
        }
        auto it = instances_.find(name);
        if (it != instances_.end()) {
            dropped = std::move(it->second);
            instances_.erase(it);
        }
    }
    delta_log("Removed node: " + name);
    return RemoveResult::Ok;
}

std::vector<std::string> NodePool::node_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.names();
}

std::string NodePool::get_param(const std::string& name, NodeParameter param) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.get_param(name, param);
}

std::string NodePool::get_param(const std::string& name, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.get_param(name, key);
}

void NodePool::set_default_param(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.set_default(key, value);
}

// ── Sessions ──────────────────────────────────────────────────

ConnectResult NodePool::connect(const std::string& name) {
    std::unique_ptr<Instance> prior;
    Node node;
    std::string user;
    std::string password;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = registry_.find(name);
        if (!found) {
            delta_log("Node doesn't exist: " + name);
            return ConnectResult::NodeNotFound;
        }
        node = *found;
        user = registry_.get_param(name, NodeParameter::Username);
        password = registry_.get_param(name, NodeParameter::Password);

        auto it = instances_.find(name);
        if (it != instances_.end()) {
            prior = std::move(it->second);
            instances_.erase(it);
        }
    }
    // Replace semantics: the old session is gone before the new one exists
    prior.reset();

    auto opened = transport_.open(node.address);
    if (opened.is_err() || !opened.value) {
        delta_log(fmt::format("Failed to reach {} ({}): {}", name, node.address, opened.error));
        return ConnectResult::NotAuthenticated;
    }
    std::unique_ptr<RemoteSession> session = std::move(opened.value);

    auto auth = session->authenticate(user, password);
    if (auth.failed()) {
        delta_log(fmt::format("Credentials not accepted: {} (error '{}')", name, auth.stderr_data));
        session->close();
        return ConnectResult::NotAuthenticated;
    }

    auto plat = session->run("uname -a");
    delta_log_ssh(fmt::format("[{}] platform", name), "uname -a", plat);
    auto inst = std::make_unique<Instance>(std::move(session), trimmed(plat.stdout_data));

    std::unique_ptr<Instance> replaced;
    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.contains(name)) {
            // Removed while we were connecting; never leave an orphan behind
            replaced = std::move(inst);
            orphaned = true;
        } else {
            auto& slot = instances_[name];
            replaced = std::move(slot);
            slot = std::move(inst);
        }
    }

    if (orphaned) {
        delta_log("Node removed during connect: " + name);
        return ConnectResult::NodeNotFound;
    }

    delta_log("Connected node: " + name);
    return ConnectResult::Ok;
}

DisconnectResult NodePool::disconnect(const std::string& name) {
    std::unique_ptr<Instance> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.contains(name)) {
            delta_log("Node doesn't exist: " + name);
            return DisconnectResult::NodeNotFound;
        }
        auto it = instances_.find(name);
        if (it != instances_.end()) {
            dropped = std::move(it->second);
            instances_.erase(it);
        }
    }
    delta_log("Disconnected node: " + name);
    return DisconnectResult::Ok;
}

ConnStatus NodePool::is_connected(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* inst = find_instance(name);
    if (!inst) return ConnStatus{};
    return inst->conn_status;
}

Instance* NodePool::find_instance(const std::string& name) const {
    auto it = instances_.find(name);
    if (it == instances_.end()) return nullptr;
    return it->second.get();
}

void NodePool::store_status(const std::string& name, const Instance* expected,
                            DeploySubject subject, const SubjectStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* inst = find_instance(name);
    if (!inst || inst != expected) {
        delta_log(fmt::format("[{}] session replaced before status write-back", name));
        return;
    }
    inst->conn_status.set_subject(subject, status);
}

// ── Pipelines ─────────────────────────────────────────────────

DeployResult NodePool::deploy(const std::string& name, DeploySubject subject) {
    if (subject == DeploySubject::Delta) {
        delta_log(fmt::format("Refusing to deploy {} to {}", to_string(subject), name));
        return DeployResult::InvalidArgument;
    }

    Instance* inst = nullptr;
    SubjectStatus status;
    std::string archive;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.contains(name)) {
            delta_log("Node doesn't exist: " + name);
            return DeployResult::NodeNotFound;
        }
        inst = find_instance(name);
        if (!inst || !inst->session->is_active()) {
            delta_log("Node not connected: " + name);
            return DeployResult::NodeNotConnected;
        }
        status = inst->conn_status.get_subject(subject);
        archive = registry_.get_param(name, NodeParameter::Distr);
    }

    auto layout = subject_layout(subject);
    DeployPipeline pipeline(*inst->session, *layout, name);
    auto result = pipeline.execute(archive, status);

    store_status(name, inst, subject, status);
    delta_log(fmt::format("[{}] deploy {}: {}", name, to_string(subject), to_string(result)));
    return result;
}

RunResult NodePool::run(const std::string& name, DeploySubject subject) {
    Instance* inst = nullptr;
    SubjectStatus status;
    std::string bind_addr;
    std::string bind_port;
    int pause = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.contains(name)) {
            delta_log("Node doesn't exist: " + name);
            return RunResult::NodeNotFound;
        }
        inst = find_instance(name);
        if (!inst || !inst->session->is_active()) {
            delta_log("Node not connected: " + name);
            return RunResult::NodeNotConnected;
        }
        status = inst->conn_status.get_subject(subject);
        bind_addr = registry_.get_param(name, NodeParameter::BindAddr);
        bind_port = registry_.get_param(name, NodeParameter::BindPort);
        pause = startup_pause_secs_;
    }

    auto layout = subject_layout(subject);
    if (!layout) {
        delta_log(fmt::format("[{}] {} has nothing to run", name, to_string(subject)));
        return RunResult::RunFailed;
    }

    status.running = false;

    RunController controller(*inst->session, *layout, name, pause);
    controller.stop_previous();

    auto endpoint = sanitize_bind_endpoint(bind_addr, bind_port);
    auto result = controller.start(endpoint, status);

    store_status(name, inst, subject, status);
    delta_log(fmt::format("[{}] run {}: {}", name, to_string(subject), to_string(result)));
    return result;
}

SubjectAliveStatus NodePool::is_alive(const std::string& name, DeploySubject subject) const {
    auto layout = subject_layout(subject);
    if (!layout) return SubjectAliveStatus{};

    Instance* inst = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inst = find_instance(name);
    }
    if (!inst || !inst->session->is_active()) return SubjectAliveStatus{};

    LivenessProber prober(*inst->session, *layout, name);
    return prober.probe();
}

ConnAliveStatus NodePool::is_alive_all(const std::string& name) const {
    ConnAliveStatus status;
    for (auto subject : deployable_subjects()) {
        status.subjects[subject] = is_alive(name, subject);
    }
    return status;
}

void NodePool::set_startup_pause(int secs) {
    std::lock_guard<std::mutex> lock(mutex_);
    startup_pause_secs_ = secs < 0 ? 0 : secs;
}

int NodePool::startup_pause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startup_pause_secs_;
}
