#pragma once

#include "control_protocol.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <util/error.hpp>
#include <util/unique_fd.hpp>

namespace scape::loop {
class Inbox;
}

namespace scape::ipc {

/// @brief Produces the reply for one request. Runs on the loop thread.
using RequestHandler = std::function<ControlResponse(const ControlRequest&)>;

/// @brief Remote-control socket.
///
/// A worker thread accepts connections and reads one request per connection; decoded requests
/// are posted to the loop through @p inbox, and the handler's reply is written back from the
/// loop thread.
class ControlServer {
public:
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;
    ControlServer(ControlServer&&) = delete;
    ControlServer& operator=(ControlServer&&) = delete;

    [[nodiscard]] static auto create(std::filesystem::path socket_path, loop::Inbox& inbox,
                                     RequestHandler handler) -> ResultPtr<ControlServer>;

    /// @brief Stops the worker and removes the socket file.
    void shutdown();
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

private:
    ControlServer(std::filesystem::path socket_path, loop::Inbox& inbox, RequestHandler handler);

    void serve(const std::stop_token& stop);
    void handle_client(util::UniqueFd client);

    std::filesystem::path m_path;
    loop::Inbox& m_inbox;
    std::shared_ptr<RequestHandler> m_handler;
    util::UniqueFd m_listen_fd;
    util::UniqueFd m_stop_fd;
    std::jthread m_worker;
};

/// @brief Client side: sends @p request and waits for the reply.
[[nodiscard]] auto send_request(const std::filesystem::path& socket_path,
                                const ControlRequest& request, int timeout_ms = 2000)
    -> Result<ControlResponse>;

} // namespace scape::ipc
