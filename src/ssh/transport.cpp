#include "transport.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

SshTransport::SshTransport(int connect_timeout_secs, int command_timeout_secs)
    : connect_timeout_secs_(connect_timeout_secs), command_timeout_secs_(command_timeout_secs) {}

Result<std::unique_ptr<RemoteSession>> SshTransport::open(const std::string& address) {
    using R = Result<std::unique_ptr<RemoteSession>>;

    auto hp = parse_address(address, SSH_DEFAULT_PORT);
    if (!hp) {
        return R::Err("Invalid node address: '" + address + "'");
    }

    SessionTarget target;
    target.host = hp->host;
    target.port = hp->port;
    target.timeout = connect_timeout_secs_;
    target.command_timeout = command_timeout_secs_;

    auto session = std::make_unique<SessionManager>(target);
    auto result = session->establish();
    if (result.failed()) {
        return R::Err(result.stderr_data);
    }
    return R::Ok(std::move(session));
}
