#include "ipc/control_server.hpp"

#include "support/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <fstream>
#include <future>
#include <loop/event_loop.hpp>
#include <sys/socket.h>
#include <sys/un.h>

extern "C" {
#include <wayland-server-core.h>
}

using namespace scape;
using namespace scape::ipc;
using namespace std::chrono_literals;

namespace {

struct WlLoopDeleter {
    void operator()(wl_event_loop* loop) const { wl_event_loop_destroy(loop); }
};

struct ServerFixture {
    test::TempDir dir{"scape_control"};
    std::unique_ptr<wl_event_loop, WlLoopDeleter> wl_loop{wl_event_loop_create()};
    std::unique_ptr<loop::EventLoop> loop;
    std::unique_ptr<ControlServer> server;
    std::vector<ControlRequest> handled;

    ServerFixture() {
        auto created = loop::EventLoop::create(wl_loop.get());
        REQUIRE(created);
        loop = std::move(*created);
        auto& inbox = loop->create_inbox();
        auto started = ControlServer::create(dir.path() / "scape-test.sock", inbox,
                                             [this](const ControlRequest& request) {
                                                 handled.push_back(request);
                                                 ControlResponse response;
                                                 response.message = "handled " +
                                                                    request.argument;
                                                 return response;
                                             });
        REQUIRE(started);
        server = std::move(*started);
    }

    ~ServerFixture() {
        server.reset();
        loop.reset();
    }

    ServerFixture(const ServerFixture&) = delete;
    ServerFixture& operator=(const ServerFixture&) = delete;

    /// Pumps the loop while a client blocks on the socket.
    template <typename T>
    auto pump(std::future<T>& pending) -> T {
        for (int i = 0; i < 100 && pending.wait_for(0ms) != std::future_status::ready; ++i) {
            REQUIRE(loop->dispatch(20ms));
        }
        REQUIRE(pending.wait_for(0ms) == std::future_status::ready);
        return pending.get();
    }
};

} // namespace

TEST_CASE("ControlServer answers requests from the loop thread", "[control_server]") {
    ServerFixture fx;
    REQUIRE(std::filesystem::exists(fx.server->path()));

    auto pending = std::async(std::launch::async, [&] {
        return send_request(fx.server->path(),
                            {.command = ControlCommand::focus_window, .argument = "foot"});
    });
    auto response = fx.pump(pending);
    REQUIRE(response);
    REQUIRE(response->ok);
    REQUIRE(response->message == "handled foot");
    REQUIRE(fx.handled.size() == 1);
    REQUIRE(fx.handled[0].command == ControlCommand::focus_window);

    SECTION("Connections are served one after another") {
        auto second = std::async(std::launch::async, [&] {
            return send_request(fx.server->path(), {.command = ControlCommand::list_windows});
        });
        REQUIRE(fx.pump(second));
        REQUIRE(fx.handled.size() == 2);
    }
}

TEST_CASE("ControlServer rejects malformed requests without the loop", "[control_server]") {
    ServerFixture fx;

    util::UniqueFd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    REQUIRE(fd);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, fx.server->path().c_str(), sizeof(addr.sun_path) - 1);
    REQUIRE(connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0);

    // Header followed by a payload holding an unknown command id
    FrameHeader header{};
    header.payload_size = 8;
    std::vector<char> bytes(sizeof(header) + 8, 0);
    std::memcpy(bytes.data(), &header, sizeof(header));
    uint32_t bogus = 77;
    std::memcpy(bytes.data() + sizeof(header), &bogus, sizeof(bogus));
    REQUIRE(send_all(fd.get(), bytes, 500));

    auto payload = receive_frame(fd.get(), 2000);
    REQUIRE(payload);
    auto response = decode_response(*payload);
    REQUIRE(response);
    REQUIRE_FALSE(response->ok);
    REQUIRE(response->message.find("Unknown control command") != std::string::npos);
    REQUIRE(fx.handled.empty());
}

TEST_CASE("ControlServer shutdown removes the socket", "[control_server]") {
    ServerFixture fx;
    auto path = fx.server->path();
    fx.server->shutdown();
    REQUIRE_FALSE(std::filesystem::exists(path));

    auto refused = send_request(path, {.command = ControlCommand::quit}, 200);
    REQUIRE_FALSE(refused);
    REQUIRE(refused.error().code == ErrorCode::ipc_failed);
}

TEST_CASE("ControlServer replaces a stale socket file", "[control_server]") {
    test::TempDir dir("scape_control_stale");
    auto path = dir.path() / "scape-stale.sock";
    { std::ofstream(path) << "left over"; }

    std::unique_ptr<wl_event_loop, WlLoopDeleter> wl_loop{wl_event_loop_create()};
    auto loop = loop::EventLoop::create(wl_loop.get());
    REQUIRE(loop);
    auto server = ControlServer::create(path, (*loop)->create_inbox(),
                                        [](const ControlRequest&) { return ControlResponse{}; });
    REQUIRE(server);
    (*server)->shutdown();
}

TEST_CASE("send_request rejects overlong socket paths", "[control_server]") {
    std::string long_name(200, 'x');
    auto result = send_request(std::filesystem::path("/tmp") / long_name, {});
    REQUIRE_FALSE(result);
    REQUIRE(result.error().message.find("too long") != std::string::npos);
}
