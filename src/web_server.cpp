#include "sharecost/web_server.hpp"
#include "sharecost/operation_policy.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace sharecost
{
    namespace
    {
        constexpr std::string_view kApiPrefix = "/api";

        struct Route
        {
            Operation op;
            std::string id; // member or transaction id from the path
        };

        // A path that exists but was called with the wrong verb
        struct WrongMethod
        {
        };

        using RouteMatch = std::variant<std::monostate, Route, WrongMethod>;

        std::vector<std::string_view> split_path(std::string_view path)
        {
            std::vector<std::string_view> parts;
            while (!path.empty())
            {
                auto slash = path.find('/');
                auto part = path.substr(0, slash);
                if (!part.empty())
                    parts.push_back(part);
                if (slash == std::string_view::npos)
                    break;
                path.remove_prefix(slash + 1);
            }
            return parts;
        }

        RouteMatch pick(std::string_view method,
                        std::initializer_list<std::pair<std::string_view, Operation>> verbs,
                        std::string_view id = {})
        {
            for (const auto &[verb, op] : verbs)
            {
                if (verb == method)
                    return Route{op, std::string(id)};
            }
            return WrongMethod{};
        }

        /** Resolve the path below /api; health is handled before this */
        RouteMatch match_route(std::string_view method, const std::vector<std::string_view> &p)
        {
            if (p.size() == 1 && p[0] == "groups")
                return pick(method, {{"POST", Operation::CreateGroup}});
            if (p.size() == 2 && p[0] == "tokens" && p[1] == "merge")
                return pick(method, {{"POST", Operation::MergeTokens}});
            if (p.size() < 2 || p[0] != "groups" || p[1] != "current")
                return std::monostate{};

            if (p.size() == 2)
                return pick(method, {{"GET", Operation::GetGroup}, {"DELETE", Operation::DeleteGroup}});

            auto section = p[2];
            if (p.size() == 3)
            {
                if (section == "members")
                    return pick(method, {{"POST", Operation::AddMember}});
                if (section == "expenses")
                    return pick(method, {{"GET", Operation::ListTransactions}, {"POST", Operation::AddTransaction}});
                if (section == "balances")
                    return pick(method, {{"GET", Operation::GetBalances}});
                if (section == "settlements")
                    return pick(method, {{"GET", Operation::GetSettlements}});
                if (section == "share")
                    return pick(method, {{"POST", Operation::CreateShareLink}});
                return std::monostate{};
            }
            if (p.size() == 4 && section == "members")
                return pick(method, {{"DELETE", Operation::RemoveMember}}, p[3]);
            if (p.size() == 4 && section == "expenses")
                return pick(method, {{"PUT", Operation::UpdateTransaction}, {"DELETE", Operation::DeleteTransaction}}, p[3]);
            if (p.size() == 5 && section == "members" && p[4] == "payment")
                return pick(method, {{"PUT", Operation::UpdateMemberPayment}}, p[3]);
            return std::monostate{};
        }

        ApiResponse json_response(unsigned status, nlohmann::json body)
        {
            return ApiResponse{status, std::move(body)};
        }

        ApiResponse error_response(const SharecostError &error)
        {
            return json_response(http_status_for(error),
                                 {{"error", error.what()}, {"code", std::string(error_code_name(error.code))}});
        }

        ApiResponse no_content()
        {
            return ApiResponse{204, std::nullopt};
        }

        Result<nlohmann::json> parse_body(const std::string &body, bool allow_empty)
        {
            if (body.empty() && allow_empty)
                return nlohmann::json::object();
            auto j = nlohmann::json::parse(body, nullptr, false);
            if (j.is_discarded())
                return std::unexpected(SharecostError::parsing("request body is not valid JSON"));
            return j;
        }

        Result<CapabilitySet> requested_capabilities(const nlohmann::json &body)
        {
            if (!body.is_object())
                return std::unexpected(SharecostError::validation("share body must be a JSON object"));
            auto it = body.find("permissions");
            if (it == body.end() || it->is_null())
                return CapabilitySet{};
            auto caps = CapabilitySet::from_json(*it);
            if (!caps)
                return std::unexpected(SharecostError::validation(caps.error().what()));
            return caps;
        }

        template <typename T>
        ApiResponse respond(const Result<T> &r)
        {
            if (!r)
                return error_response(r.error());
            if constexpr (std::is_same_v<T, void>)
            {
                return no_content();
            }
            else if constexpr (requires { r->to_json(); })
            {
                return json_response(200, r->to_json());
            }
            else
            {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &item : *r)
                    arr.push_back(item.to_json());
                return json_response(200, std::move(arr));
            }
        }
    } // namespace

    unsigned http_status_for(const SharecostError &error)
    {
        switch (error.code)
        {
        case ErrorCode::AuthMissing:
        case ErrorCode::AuthInvalid:
        case ErrorCode::TokenMalformed:
        case ErrorCode::TokenSignatureMismatch:
        case ErrorCode::TokenExpired:
            return 401;
        case ErrorCode::AuthForbidden:
            return 403;
        case ErrorCode::ValidationError:
        case ErrorCode::ParsingError:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::ConfigError:
        case ErrorCode::CryptoError:
        case ErrorCode::StorageError:
        case ErrorCode::InternalError:
            return 500;
        }
        return 500;
    }

    std::string render_json(const nlohmann::json &body)
    {
        return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    ApiRouter::ApiRouter(GroupService &service, const CapabilityAuthority &authority)
        : service_(service), authority_(authority)
    {
    }

    ApiResponse ApiRouter::handle(const ApiRequest &request) const
    {
        std::string_view path = request.target;
        path = path.substr(0, path.find('?'));
        if (!path.starts_with(kApiPrefix))
            return json_response(404, {{"error", "not found"}});
        auto parts = split_path(path.substr(kApiPrefix.size()));

        if (parts.size() == 1 && parts[0] == "health")
        {
            if (request.method != "GET")
                return json_response(405, {{"error", "method not allowed"}});
            return json_response(200, {{"status", "ok"}});
        }

        auto match = match_route(request.method, parts);
        if (std::holds_alternative<std::monostate>(match))
            return json_response(404, {{"error", "not found"}});
        if (std::holds_alternative<WrongMethod>(match))
            return json_response(405, {{"error", "method not allowed"}});
        const auto &route = std::get<Route>(match);

        if (!access_for(route.op).requires_token)
        {
            auto body = parse_body(request.body, false);
            if (!body)
                return error_response(body.error());
            auto req = CreateGroupRequest::from_json(*body);
            if (!req)
                return error_response(req.error());
            return respond(service_.create_group(*req));
        }

        std::optional<std::string_view> header;
        if (request.authorization)
            header = *request.authorization;
        auto principal = authority_.authenticate(header);
        if (!principal)
            return error_response(principal.error());

        std::string id;
        if (!route.id.empty())
        {
            auto parsed = parse_uuid(route.id, "path");
            if (!parsed)
                return error_response(parsed.error());
            id = *parsed;
        }

        switch (route.op)
        {
        case Operation::GetGroup:
        {
            auto group = service_.get_group(*principal);
            if (!group)
                return error_response(group.error());
            auto j = group->to_json();
            j["permissions"] = principal->capabilities.to_resolved_json();
            return json_response(200, std::move(j));
        }
        case Operation::DeleteGroup:
            return respond(service_.delete_group(*principal));
        case Operation::AddMember:
        {
            auto body = parse_body(request.body, false);
            if (!body)
                return error_response(body.error());
            auto name = body->is_object() ? body->find("name") : body->end();
            if (!body->is_object() || name == body->end() || !name->is_string())
                return error_response(SharecostError::validation("missing field 'name'"));
            return respond(service_.add_member(*principal, name->get<std::string>()));
        }
        case Operation::RemoveMember:
            return respond(service_.remove_member(*principal, id));
        case Operation::UpdateMemberPayment:
        {
            auto body = parse_body(request.body, false);
            if (!body)
                return error_response(body.error());
            auto payment = PaymentDetails::from_json(*body);
            if (!payment)
                return error_response(payment.error());
            return respond(service_.update_member_payment(*principal, id, *payment));
        }
        case Operation::ListTransactions:
            return respond(service_.list_transactions(*principal));
        case Operation::AddTransaction:
        case Operation::UpdateTransaction:
        {
            auto body = parse_body(request.body, false);
            if (!body)
                return error_response(body.error());
            auto draft = TransactionDraft::from_json(*body);
            if (!draft)
                return error_response(draft.error());
            if (route.op == Operation::AddTransaction)
                return respond(service_.add_transaction(*principal, *draft));
            return respond(service_.update_transaction(*principal, id, *draft));
        }
        case Operation::DeleteTransaction:
            return respond(service_.delete_transaction(*principal, id));
        case Operation::GetBalances:
            return respond(service_.get_balances(*principal));
        case Operation::GetSettlements:
            return respond(service_.get_settlements(*principal));
        case Operation::CreateShareLink:
        {
            auto body = parse_body(request.body, true);
            if (!body)
                return error_response(body.error());
            auto requested = requested_capabilities(*body);
            if (!requested)
                return error_response(requested.error());
            return respond(service_.create_share_link(*principal, *requested));
        }
        case Operation::MergeTokens:
        {
            auto body = parse_body(request.body, false);
            if (!body)
                return error_response(body.error());
            auto token = body->is_object() ? body->find("token") : body->end();
            if (!body->is_object() || token == body->end() || !token->is_string())
                return error_response(SharecostError::validation("missing field 'token'"));
            return respond(service_.merge_tokens(*principal, token->get<std::string>()));
        }
        case Operation::CreateGroup:
            break;
        }
        return error_response(SharecostError::internal("unrouted operation"));
    }

    class WebServer::Impl
    {
    public:
        Impl(const ServerConfig &cfg, const ApiRouter &router)
            : cfg_(cfg),
              router_(router),
              ioc_(static_cast<int>(cfg.threads)),
              acceptor_(ioc_)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            beast::error_code ec;
            auto address = net::ip::make_address(cfg_.bind_address, ec);
            if (ec)
                throw SharecostError::config("invalid bind address: " + cfg_.bind_address);
            tcp::endpoint endpoint{address, cfg_.port};

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("listening on {}:{} with {} threads", cfg_.bind_address, cfg_.port, cfg_.threads);
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
            spdlog::info("server stopped");
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (ec == net::error::operation_aborted)
                return;
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), router_)->run();
            }
            else
            {
                spdlog::warn("accept failed: {}", ec.message());
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, const ApiRouter &router)
                : stream_(std::move(socket)),
                  router_(router)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                parser_.emplace();
                parser_->body_limit(1024 * 1024);
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    spdlog::debug("read failed: {}", ec.message());
                    return;
                }

                auto req = parser_->release();
                res_ = dispatch(req);
                do_write();
            }

            http::response<http::string_body> dispatch(const http::request<http::string_body> &req)
            {
                ApiRequest api;
                api.method = std::string(req.method_string());
                api.target = std::string(req.target());
                if (auto auth = req.find(http::field::authorization); auth != req.end())
                    api.authorization = std::string(auth->value());
                api.body = req.body();

                try
                {
                    auto res = router_.handle(api);
                    spdlog::debug("{} {} -> {}", api.method, api.target, res.status);
                    return to_http(req, res);
                }
                catch (const std::exception &e)
                {
                    spdlog::error("{} {} failed: {}", api.method, api.target, e.what());
                    return to_http(req, ApiResponse{500, nlohmann::json{{"error", "internal error"}}});
                }
            }

            static http::response<http::string_body> to_http(const http::request<http::string_body> &req,
                                                             const ApiResponse &api)
            {
                http::response<http::string_body> res{static_cast<http::status>(api.status), req.version()};
                res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
                if (api.body)
                {
                    res.set(http::field::content_type, "application/json");
                    res.body() = render_json(*api.body);
                }
                res.keep_alive(req.keep_alive());
                res.prepare_payload();
                return res;
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                if (!res_.keep_alive())
                    return do_close();
                do_read();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            std::optional<http::request_parser<http::string_body>> parser_;
            http::response<http::string_body> res_;
            const ApiRouter &router_;
        };

        ServerConfig cfg_;
        const ApiRouter &router_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
    };

    WebServer::WebServer(const ServerConfig &cfg, const ApiRouter &router)
        : impl_(std::make_unique<Impl>(cfg, router)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace sharecost
