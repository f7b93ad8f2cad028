#pragma once

#include "sharecost/authority.hpp"
#include "sharecost/config.hpp"
#include "sharecost/group_service.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace sharecost
{
    /** Transport-neutral view of one HTTP request */
    struct ApiRequest
    {
        std::string method; // upper case, e.g. "GET"
        std::string target; // path with optional query string
        std::optional<std::string> authorization;
        std::string body;
    };

    struct ApiResponse
    {
        unsigned status{200};
        std::optional<nlohmann::json> body; // empty for 204
    };

    /** HTTP status for an error that reached the API boundary */
    unsigned http_status_for(const SharecostError &error);

    /** Serialize a response body; invalid UTF-8 is replaced, never thrown */
    std::string render_json(const nlohmann::json &body);

    /**
     * Maps /api requests onto GroupService operations.
     * Authentication happens here, once per request, for every operation whose
     * access entry requires a token.
     */
    class ApiRouter
    {
    public:
        ApiRouter(GroupService &service, const CapabilityAuthority &authority);

        ApiResponse handle(const ApiRequest &request) const;

    private:
        GroupService &service_;
        const CapabilityAuthority &authority_;
    };

    /**
     * HTTP server using Boost.Beast. One io_context shared by a fixed pool of
     * threads; each connection is a strand-bound session.
     */
    class WebServer
    {
    public:
        WebServer(const ServerConfig &cfg, const ApiRouter &router);
        ~WebServer();

        /** Bind, listen and block until stopped. Throws on bind failure. */
        void run();

        /** Request a stop; in-flight handlers finish first. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
