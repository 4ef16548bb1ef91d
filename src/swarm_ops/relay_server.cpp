#include "swarm_ops/relay_server.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr std::size_t k_max_frame_bytes{1U << 20U};
constexpr std::size_t k_max_request_body_bytes{1U << 20U};
constexpr std::chrono::seconds k_http_idle_timeout{30};

enum class ChannelRole {
    Observer,
    Simulator
};

std::string_view strip_query(std::string_view target) {
    const auto query_pos = target.find('?');
    return query_pos == std::string_view::npos ? target : target.substr(0, query_pos);
}

/** @brief Raw value of @p name in the query string of @p target, if present. */
std::optional<std::string> query_parameter(std::string_view target, std::string_view name) {
    const auto query_pos = target.find('?');
    if (query_pos == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view query = target.substr(query_pos + 1);
    while (!query.empty()) {
        const auto separator_pos = query.find('&');
        const std::string_view pair = query.substr(0, separator_pos);
        const auto equals_pos = pair.find('=');
        if (pair.substr(0, equals_pos) == name) {
            return equals_pos == std::string_view::npos ? std::string{} : std::string{pair.substr(equals_pos + 1)};
        }
        if (separator_pos == std::string_view::npos) {
            break;
        }
        query.remove_prefix(separator_pos + 1);
    }
    return std::nullopt;
}

std::string describe_peer(const tcp::socket& socket) {
    beast::error_code ec;
    const tcp::endpoint endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

/**
 * @brief One WebSocket peer on either relay channel.
 *
 * Reads and writes run on the session's strand; `send` may be called from any
 * thread and only posts onto that strand.
 */
class WebSocketSession final : public Connection, public std::enable_shared_from_this<WebSocketSession> {
  public:
    WebSocketSession(
        tcp::socket&& socket,
        StateHub& hub,
        ChannelRole role,
        std::string label,
        std::optional<std::string> vehicle_id
    )
        : ws_(std::move(socket)),
          hub_(hub),
          role_(role),
          str_label_(std::move(label)),
          optional_vehicle_id_(std::move(vehicle_id)),
          logger_(get_logger()) {}

    [[nodiscard]] const std::string& label() const noexcept override {
        return str_label_;
    }

    [[nodiscard]] bool is_open() const noexcept override {
        return flag_open_.load();
    }

    void send(const std::string& message) override {
        if (!flag_open_.load()) {
            throw TransportError(fmt::format("{} is closed", str_label_));
        }
        net::post(ws_.get_executor(), [self = shared_from_this(), message]() {
            self->enqueue(message);
        });
    }

    void run(http::request<http::string_body> request) {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.read_message_max(k_max_frame_bytes);
        ws_.text(true);
        ws_.async_accept(request, beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this()));
    }

  private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            logger_->warn("WebSocket handshake with {} failed: {}", str_label_, ec.message());
            return;
        }
        flag_open_.store(true);
        if (role_ == ChannelRole::Simulator) {
            hub_.register_simulator(shared_from_this(), optional_vehicle_id_);
        } else {
            hub_.register_observer(shared_from_this());
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            if (ec != websocket::error::closed) {
                logger_->debug("{} read ended: {}", str_label_, ec.message());
            }
            close();
            return;
        }

        const std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (role_ == ChannelRole::Simulator) {
            hub_.ingest(shared_from_this(), message);
        } else {
            hub_.forward(shared_from_this(), message);
        }
        do_read();
    }

    void enqueue(std::string message) {
        if (!flag_open_.load()) {
            return;
        }
        list_outbound_.push_back(std::move(message));
        if (list_outbound_.size() > 1) {
            return;
        }
        do_write();
    }

    void do_write() {
        ws_.async_write(
            net::buffer(list_outbound_.front()),
            beast::bind_front_handler(&WebSocketSession::on_write, shared_from_this())
        );
    }

    void on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            logger_->debug("{} write failed: {}", str_label_, ec.message());
            list_outbound_.clear();
            close();
            return;
        }
        list_outbound_.pop_front();
        if (!list_outbound_.empty()) {
            do_write();
        }
    }

    void close() {
        if (!flag_open_.exchange(false)) {
            return;
        }
        if (role_ == ChannelRole::Simulator) {
            hub_.unregister_simulator(shared_from_this());
        } else {
            hub_.unregister_observer(shared_from_this());
        }
        logger_->info("{} disconnected", str_label_);
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    StateHub& hub_;
    ChannelRole role_;
    std::string str_label_;
    std::optional<std::string> optional_vehicle_id_;
    std::atomic<bool> flag_open_{false};
    std::deque<std::string> list_outbound_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Plain HTTP connection that either serves REST or hands off to a WebSocket session. */
class HttpSession final : public std::enable_shared_from_this<HttpSession> {
  public:
    HttpSession(tcp::socket&& socket, const HubConfig& config, StateHub& hub, const RestApi& rest_api)
        : stream_(std::move(socket)),
          config_(config),
          hub_(hub),
          rest_api_(rest_api),
          logger_(get_logger()) {}

    void run() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

  private:
    void do_read() {
        optional_parser_.emplace();
        optional_parser_->body_limit(k_max_request_body_bytes);
        stream_.expires_after(k_http_idle_timeout);
        http::async_read(
            stream_,
            buffer_,
            *optional_parser_,
            beast::bind_front_handler(&HttpSession::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec == http::error::end_of_stream) {
            shutdown();
            return;
        }
        if (ec) {
            logger_->debug("HTTP read failed: {}", ec.message());
            return;
        }

        const HttpRequest& request = optional_parser_->get();
        if (websocket::is_upgrade(request)) {
            upgrade();
            return;
        }
        respond(rest_api_.handle(request));
    }

    void upgrade() {
        const HttpRequest& request = optional_parser_->get();
        const std::string_view path = strip_query(std::string_view{request.target().data(), request.target().size()});

        std::optional<ChannelRole> role;
        if (path == config_.simulator_path) {
            role = ChannelRole::Simulator;
        } else if (path == config_.observer_path) {
            role = ChannelRole::Observer;
        }
        if (!role) {
            logger_->warn("Rejected WebSocket upgrade on unknown path {}", std::string{path});
            respond(make_json_response(request, http::status::not_found, nlohmann::json{{"error", "not found"}}));
            return;
        }

        const std::string_view target{request.target().data(), request.target().size()};
        std::optional<std::string> vehicle_id;
        if (*role == ChannelRole::Simulator) {
            vehicle_id = query_parameter(target, "id");
        }

        const std::string peer = describe_peer(stream_.socket());
        const std::string label = vehicle_id
            ? fmt::format("simulator[{}]@{}", *vehicle_id, peer)
            : fmt::format("{}@{}", *role == ChannelRole::Simulator ? "simulator" : "observer", peer);
        logger_->info("{} connected", label);

        stream_.expires_never();
        std::make_shared<WebSocketSession>(stream_.release_socket(), hub_, *role, label, std::move(vehicle_id))
            ->run(optional_parser_->release());
    }

    void respond(HttpResponse response) {
        response_ = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(
            stream_,
            *response_,
            beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), response_->keep_alive())
        );
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            logger_->debug("HTTP write failed: {}", ec.message());
            return;
        }
        if (!keep_alive) {
            shutdown();
            return;
        }
        response_.reset();
        do_read();
    }

    void shutdown() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    const HubConfig& config_;
    StateHub& hub_;
    const RestApi& rest_api_;
    std::optional<http::request_parser<http::string_body>> optional_parser_;
    std::shared_ptr<HttpResponse> response_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

/** @brief Accept loop feeding new sockets into HTTP sessions. */
class RelayListener final : public std::enable_shared_from_this<RelayListener> {
  public:
    RelayListener(net::io_context& io_context, const HubConfig& config, StateHub& hub, const RestApi& rest_api)
        : io_context_(io_context),
          acceptor_(net::make_strand(io_context)),
          config_(config),
          hub_(hub),
          rest_api_(rest_api),
          logger_(get_logger()) {}

    void open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw TransportError(fmt::format(
                "Cannot listen on {}:{}: {}",
                endpoint.address().to_string(),
                endpoint.port(),
                ec.message()
            ));
        }
    }

    void run() {
        do_accept();
    }

    [[nodiscard]] std::uint16_t local_port() const {
        beast::error_code ec;
        const tcp::endpoint endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

  private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(io_context_),
            beast::bind_front_handler(&RelayListener::on_accept, shared_from_this())
        );
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            logger_->warn("Accept failed: {}", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), config_, hub_, rest_api_)->run();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    }

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const HubConfig& config_;
    StateHub& hub_;
    const RestApi& rest_api_;
    std::shared_ptr<spdlog::logger> logger_;
};

RelayServer::RelayServer(net::io_context& io_context, HubConfig config, StateHub& hub, const RestApi& rest_api)
    : io_context_(io_context),
      config_(std::move(config)),
      hub_(hub),
      rest_api_(rest_api),
      logger_(get_logger()) {}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::start() {
    if (listener_) {
        return;
    }
    beast::error_code ec;
    const net::ip::address address = net::ip::make_address(config_.bind_address, ec);
    if (ec) {
        throw TransportError(fmt::format("Invalid bind address {}: {}", config_.bind_address, ec.message()));
    }

    auto listener = std::make_shared<RelayListener>(io_context_, config_, hub_, rest_api_);
    listener->open(tcp::endpoint{address, config_.port});
    listener->run();
    bound_port_ = listener->local_port();
    listener_ = std::move(listener);

    logger_->info(
        "Relay listening on {}:{} (observers {}, simulator {})",
        config_.bind_address,
        bound_port_,
        config_.observer_path,
        config_.simulator_path
    );
}

std::uint16_t RelayServer::bound_port() const noexcept {
    return bound_port_;
}

void RelayServer::stop() {
    if (!listener_) {
        return;
    }
    listener_->stop();
    listener_.reset();
    logger_->info("Relay stopped accepting connections");
}

}  // namespace swarm_ops
