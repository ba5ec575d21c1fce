#include "control_server.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <loop/event_loop.hpp>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <util/logging.hpp>

namespace scape::ipc {

namespace {

constexpr int ACCEPT_POLL_MS = 500;
constexpr int REQUEST_TIMEOUT_MS = 1000;
constexpr int REPLY_TIMEOUT_MS = 1000;
constexpr int LISTEN_BACKLOG = 8;

auto make_address(const std::filesystem::path& path) -> Result<sockaddr_un> {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string native = path.string();
    if (native.size() >= sizeof(addr.sun_path)) {
        return make_error<sockaddr_un>(ErrorCode::ipc_failed,
                                       "Control socket path too long: " + native);
    }
    std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);
    return addr;
}

void reply(int fd, const ControlResponse& response) {
    auto bytes = encode_response(response);
    if (!bytes) {
        SCAPE_LOG_WARN("Failed to encode control reply: {}", bytes.error().message);
        return;
    }
    auto sent = send_all(fd, *bytes, REPLY_TIMEOUT_MS);
    if (!sent) {
        SCAPE_LOG_DEBUG("Control reply not delivered: {}", sent.error().message);
    }
}

auto error_response(std::string message) -> ControlResponse {
    ControlResponse response;
    response.ok = false;
    response.message = std::move(message);
    return response;
}

} // namespace

ControlServer::ControlServer(std::filesystem::path socket_path, loop::Inbox& inbox,
                             RequestHandler handler)
    : m_path(std::move(socket_path)), m_inbox(inbox),
      m_handler(std::make_shared<RequestHandler>(std::move(handler))) {}

ControlServer::~ControlServer() {
    shutdown();
}

auto ControlServer::create(std::filesystem::path socket_path, loop::Inbox& inbox,
                           RequestHandler handler) -> ResultPtr<ControlServer> {
    auto server = std::unique_ptr<ControlServer>(
        new ControlServer(std::move(socket_path), inbox, std::move(handler)));

    auto addr = make_address(server->m_path);
    if (!addr) {
        return make_result_ptr_error<ControlServer>(addr.error().code, addr.error().message);
    }

    server->m_listen_fd =
        util::UniqueFd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!server->m_listen_fd) {
        return make_result_ptr_error<ControlServer>(
            ErrorCode::ipc_failed, std::string("Failed to create socket: ") + strerror(errno));
    }

    // A socket file left by a crashed instance blocks bind
    std::error_code ec;
    std::filesystem::remove(server->m_path, ec);

    if (bind(server->m_listen_fd.get(), reinterpret_cast<const sockaddr*>(&*addr),
             sizeof(sockaddr_un)) < 0) {
        std::string error_msg;
        if (errno == EADDRINUSE) {
            error_msg = "Control socket already in use (another instance running?)";
        } else {
            error_msg = std::string("Failed to bind control socket: ") + strerror(errno);
        }
        return make_result_ptr_error<ControlServer>(ErrorCode::ipc_failed, error_msg);
    }

    if (listen(server->m_listen_fd.get(), LISTEN_BACKLOG) < 0) {
        return make_result_ptr_error<ControlServer>(
            ErrorCode::ipc_failed, std::string("Failed to listen: ") + strerror(errno));
    }

    server->m_stop_fd = util::UniqueFd(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!server->m_stop_fd) {
        return make_result_ptr_error<ControlServer>(
            ErrorCode::ipc_failed, std::string("Failed to create eventfd: ") + strerror(errno));
    }

    auto* raw = server.get();
    server->m_worker = std::jthread([raw](const std::stop_token& stop) { raw->serve(stop); });

    SCAPE_LOG_INFO("Control socket listening on {}", server->m_path.string());
    return make_result_ptr(std::move(server));
}

void ControlServer::shutdown() {
    if (m_worker.joinable()) {
        m_worker.request_stop();
        uint64_t one = 1;
        if (write(m_stop_fd.get(), &one, sizeof(one)) < 0) {
            SCAPE_LOG_DEBUG("Control worker wake failed: {}", strerror(errno));
        }
        m_worker.join();
    }
    if (m_listen_fd) {
        m_listen_fd.reset();
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
}

void ControlServer::serve(const std::stop_token& stop) {
    while (!stop.stop_requested()) {
        std::array<pollfd, 2> fds{{
            {m_listen_fd.get(), POLLIN, 0},
            {m_stop_fd.get(), POLLIN, 0},
        }};
        int ready = poll(fds.data(), fds.size(), ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            SCAPE_LOG_ERROR("Control socket poll failed: {}", strerror(errno));
            return;
        }
        if ((fds[1].revents & POLLIN) != 0) {
            return;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        int client = accept4(m_listen_fd.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
        if (client < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                SCAPE_LOG_ERROR("Accept failed: {}", strerror(errno));
            }
            continue;
        }
        handle_client(util::UniqueFd(client));
    }
}

void ControlServer::handle_client(util::UniqueFd client) {
    auto payload = receive_frame(client.get(), REQUEST_TIMEOUT_MS);
    if (!payload) {
        SCAPE_LOG_DEBUG("Dropping control client: {}", payload.error().message);
        return;
    }
    auto request = decode_request(*payload);
    if (!request) {
        reply(client.get(), error_response(request.error().message));
        return;
    }

    SCAPE_LOG_DEBUG("Control request: {} '{}'", to_string(request->command), request->argument);

    // The connection travels with the message; the loop thread writes the reply
    auto connection = std::make_shared<util::UniqueFd>(std::move(client));
    auto handler = m_handler;
    bool posted = m_inbox.post([connection, handler, req = *request]() {
        reply(connection->get(), (*handler)(req));
    });
    if (!posted) {
        reply(connection->get(), error_response("Compositor busy, try again"));
    }
}

auto send_request(const std::filesystem::path& socket_path, const ControlRequest& request,
                  int timeout_ms) -> Result<ControlResponse> {
    auto addr = SCAPE_TRY(make_address(socket_path));

    util::UniqueFd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) {
        return make_error<ControlResponse>(
            ErrorCode::ipc_failed, std::string("Failed to create socket: ") + strerror(errno));
    }
    if (connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return make_error<ControlResponse>(ErrorCode::ipc_failed,
                                           "Cannot connect to " + socket_path.string() + ": " +
                                               strerror(errno));
    }

    auto bytes = SCAPE_TRY(encode_request(request));
    SCAPE_TRY(send_all(fd.get(), bytes, timeout_ms));
    auto payload = SCAPE_TRY(receive_frame(fd.get(), timeout_ms));
    return decode_response(payload);
}

} // namespace scape::ipc
