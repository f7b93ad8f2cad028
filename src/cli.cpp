#include "sharecost/cli.hpp"
#include "sharecost/authority.hpp"
#include "sharecost/config.hpp"
#include "sharecost/group_service.hpp"
#include "sharecost/group_store.hpp"
#include "sharecost/ledger.hpp"
#include "sharecost/logging.hpp"
#include "sharecost/token_codec.hpp"
#include "sharecost/web_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sharecost::cli
{
    namespace
    {
        constexpr const char *kDefaultConfigPath = "sharecost.toml";

        // An explicit --config must exist; the default path is optional
        Result<AppConfig> load_config(const std::string &path, bool explicit_path)
        {
            if (!explicit_path && !std::filesystem::exists(path))
                return ConfigLoader::from_env();
            return ConfigLoader::load(path);
        }

        Result<nlohmann::json> read_json_file(const std::string &path)
        {
            std::ifstream f(path);
            if (!f.is_open())
                return std::unexpected(SharecostError::validation("Unable to open file: " + path));
            std::stringstream buf;
            buf << f.rdbuf();
            auto j = nlohmann::json::parse(buf.str(), nullptr, false);
            if (j.is_discarded())
                return std::unexpected(SharecostError::parsing(path + " is not valid JSON"));
            return j;
        }

        int fail(const SharecostError &e)
        {
            std::cerr << error_code_name(e.code) << ": " << e.what() << std::endl;
            return 1;
        }
    } // namespace

    int run(int argc, char *argv[])
    {
        CLI::App app{"sharecost: shared-expense groups behind capability tokens"};
        app.require_subcommand(0, 1);

        std::string config_path = kDefaultConfigPath;
        auto config_opt = app.add_option("--config", config_path, "Path to config TOML");

        auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON (secrets redacted)");

        std::string serve_bind;
        std::uint16_t serve_port{0};
        std::size_t serve_threads{0};
        auto serve_cmd = app.add_subcommand("serve", "Run the HTTP API");
        auto bind_opt = serve_cmd->add_option("--bind", serve_bind, "Address to bind");
        auto port_opt = serve_cmd->add_option("--port", serve_port, "Port to bind")->check(CLI::Range(1, 65535));
        auto threads_opt = serve_cmd->add_option("--threads", serve_threads, "Number of worker threads")
                               ->check(CLI::PositiveNumber);

        std::string issue_group;
        std::vector<std::string> issue_deny;
        bool issue_legacy{false};
        auto issue_cmd = app.add_subcommand("token-issue", "Issue a group token");
        issue_cmd->add_option("--group", issue_group, "Group id (UUID)")->required();
        issue_cmd->add_option("--deny", issue_deny, "Capability to withhold (repeatable)");
        issue_cmd->add_flag("--legacy", issue_legacy, "Omit the capability set entirely");

        std::string inspect_token;
        auto inspect_cmd = app.add_subcommand("token-inspect", "Verify a token and print its claims");
        inspect_cmd->add_option("token", inspect_token, "Token to verify")->required();

        std::string snapshot_path;
        auto balances_cmd = app.add_subcommand("balances", "Compute balances from a group snapshot");
        balances_cmd->add_option("--file", snapshot_path,
                                 "JSON file with \"group\" and \"transactions\"")
            ->required();

        CLI11_PARSE(app, argc, argv);

        auto cfg = load_config(config_path, config_opt->count() > 0);
        if (!cfg)
            return fail(cfg.error());
        auto logging = configure_logging(cfg->logging);
        if (!logging)
            return fail(logging.error());

        if (*cfg_cmd)
        {
            std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
            return 0;
        }

        if (*balances_cmd)
        {
            auto snapshot = read_json_file(snapshot_path);
            if (!snapshot)
                return fail(snapshot.error());
            if (!snapshot->is_object() || !snapshot->contains("group"))
                return fail(SharecostError::validation("snapshot needs a \"group\" object"));
            auto group = Group::from_json((*snapshot)["group"]);
            if (!group)
                return fail(group.error());

            std::vector<Transaction> transactions;
            for (const auto &entry : snapshot->value("transactions", nlohmann::json::array()))
            {
                auto tx = Transaction::from_json(entry);
                if (!tx)
                    return fail(tx.error());
                transactions.push_back(std::move(*tx));
            }

            auto balances = compute_balances(group->members, transactions, group->currency);
            nlohmann::json out{{"balances", nlohmann::json::array()}, {"settlements", nlohmann::json::array()}};
            for (const auto &b : balances)
                out["balances"].push_back(b.to_json());
            for (const auto &s : suggest_settlements(balances))
                out["settlements"].push_back(s.to_json());
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        auto token_cfg = ConfigLoader::token_config(*cfg);
        if (!token_cfg)
            return fail(token_cfg.error());
        TokenCodec codec(*token_cfg);
        CapabilityAuthority authority(codec);

        if (*issue_cmd)
        {
            std::optional<CapabilitySet> caps;
            if (!issue_legacy)
            {
                std::optional<bool> flags[5] = {true, true, true, true, true};
                for (const auto &name : issue_deny)
                {
                    auto cap = capability_from_string(name);
                    if (!cap)
                        return fail(SharecostError::validation("unknown capability: " + name));
                    flags[static_cast<std::size_t>(*cap)] = false;
                }
                caps = CapabilitySet(flags[0], flags[1], flags[2], flags[3], flags[4]);
            }
            else if (!issue_deny.empty())
            {
                return fail(SharecostError::validation("--deny cannot be combined with --legacy"));
            }

            auto group_id = parse_uuid(issue_group, "group");
            if (!group_id)
                return fail(group_id.error());
            auto token = authority.issue_token(*group_id, caps);
            if (!token)
                return fail(token.error());
            std::cout << *token << std::endl;
            return 0;
        }

        if (*inspect_cmd)
        {
            auto claims = codec.verify(inspect_token);
            if (!claims)
                return fail(claims.error());
            nlohmann::json out{{"group_id", claims->group_id},
                               {"expires_at", claims->expires_at},
                               {"legacy", !claims->capabilities.has_value()},
                               {"permissions", CapabilityAuthority::resolve_capabilities(*claims).to_resolved_json()}};
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (*serve_cmd)
        {
            if (bind_opt->count() > 0)
                cfg->server.bind_address = serve_bind;
            if (port_opt->count() > 0)
                cfg->server.port = serve_port;
            if (threads_opt->count() > 0)
                cfg->server.threads = serve_threads;

            auto store = open_group_store(cfg->storage);
            if (!store)
                return fail(store.error());

            spdlog::info("sharecost starting: storage={}, key={}",
                         storage_backend_name(cfg->storage.backend), codec.key_fingerprint());
            GroupService service(*store, authority);
            ApiRouter router(service, authority);
            WebServer server(cfg->server, router);
            try
            {
                server.run();
            }
            catch (const std::exception &e)
            {
                spdlog::critical("server failed: {}", e.what());
                return 1;
            }
            return 0;
        }

        std::cout << app.help() << std::endl;
        return 0;
    }

} // namespace sharecost::cli
