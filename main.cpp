#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "src/config/settings.hpp"
#include "src/grounding/schema_context.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/service/query_service.hpp"
#include "src/sparql/endpoint/endpoint_registry.hpp"
#include "src/utils/string_utils.hpp"
#include "src/utils/thread_pool.hpp"

namespace {
    const char* const USAGE =
        "usage:\n"
        "  sparql_guard query <endpoint> [--entities Q1,Q2] [--properties P31] [--timeout-ms N] [--limit-cap N] [FILE...]\n"
        "  sparql_guard search-entity <text> [--k N]\n"
        "  sparql_guard search-property <text> [--k N]\n"
        "  sparql_guard schema [--entities Q1,Q2] [--properties P31] [--budget N]\n"
        "  sparql_guard classify <message>\n"
        "  sparql_guard ping <endpoint>\n"
        "Queries are read from stdin when no FILE is given.\n";

    struct CliArgs {
        std::string command_;
        std::vector<std::string> positional_;
        std::vector<std::string> entity_ids_;
        std::vector<std::string> property_ids_;
        long timeout_ms_ = service::DEFAULT_TIMEOUT_MS;
        long limit_cap_ = sparql::lint::DEFAULT_LIMIT_CAP;
        int k_ = service::DEFAULT_K;
        int budget_tokens_ = grounding::DEFAULT_BUDGET_TOKENS;
    };

    long parse_number(const std::string& flag, const std::string& raw) {
        try {
            size_t consumed = 0;
            long value = std::stol(raw, &consumed);
            if (consumed != raw.size()) {
                throw std::invalid_argument(raw);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::invalid_argument(flag + " expects a number, got '" + raw + "'");
        }
    }

    CliArgs parse_args(int argc, char** argv) {
        if (argc < 2) {
            throw std::invalid_argument("missing command");
        }

        CliArgs args{.command_ = argv[1]};
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) {
                args.positional_.push_back(arg);
                continue;
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }

            const std::string value = argv[++i];
            if (arg == "--entities") {
                args.entity_ids_ = string_utils::split_comma_delimited_string(value);
            } else if (arg == "--properties") {
                args.property_ids_ = string_utils::split_comma_delimited_string(value);
            } else if (arg == "--timeout-ms") {
                args.timeout_ms_ = parse_number(arg, value);
            } else if (arg == "--limit-cap") {
                args.limit_cap_ = parse_number(arg, value);
            } else if (arg == "--k") {
                args.k_ = int(parse_number(arg, value));
            } else if (arg == "--budget") {
                args.budget_tokens_ = int(parse_number(arg, value));
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
        return args;
    }

    std::string read_all(std::istream& in) { return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()}; }

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot read " + path);
        }
        return read_all(in);
    }

    const std::string& required_positional(const CliArgs& args, const char* what) {
        if (args.positional_.empty()) {
            throw std::invalid_argument(std::string("missing ") + what);
        }
        return args.positional_.front();
    }

    // One query per file, run concurrently. Output order follows input order.
    nlohmann::json run_queries(service::QueryService& service, const CliArgs& args) {
        const std::string& endpoint = required_positional(args, "endpoint class");

        std::vector<std::string> texts;
        if (args.positional_.size() == 1) {
            texts.push_back(read_all(std::cin));
        } else {
            for (size_t i = 1; i < args.positional_.size(); ++i) {
                texts.push_back(read_file(args.positional_[i]));
            }
        }

        std::vector<nlohmann::json> results(texts.size());
        {
            concurrency::ThreadPool pool(std::min<size_t>(texts.size(), std::max(1U, std::thread::hardware_concurrency())));
            for (size_t i = 0; i < texts.size(); ++i) {
                pool.enqueue([&service, &args, &texts, &results, &endpoint, i]() {
                    auto result = service.execute_query(service::QueryRequest{
                        .endpoint_class_ = endpoint,
                        .query_ = texts[i],
                        .timeout_ms_ = args.timeout_ms_,
                        .limit_cap_ = args.limit_cap_,
                        .entity_ids_ = args.entity_ids_,
                        .property_ids_ = args.property_ids_,
                    });
                    results[i] = sparql::model::to_json(result);
                });
            }
            pool.wait_all();
        }

        if (results.size() == 1) {
            return results.front();
        }
        return nlohmann::json(results);
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        const config::Settings settings = config::load_settings();

        auto logger = spdlog::stderr_color_mt("sparql_guard");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlog::set_level(spdlog::level::from_str(settings.log_level_));

        CliArgs args;
        try {
            args = parse_args(argc, argv);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n" << USAGE;
            return 1;
        }

        http::client::CurlGlobal curl_global;

        const http::client::CurlOptions curl_options{
            .user_agent_ = settings.user_agent_,
            .prefer_http2_ = config::http2_enabled(settings, http::client::CurlGlobal::supports_http2()),
        };

        service::ServicePolicies policies;
        policies.caches_.set_enabled(settings.cache_enabled_);

        auto service = service::QueryServiceBuilder()
                           .with_http_client_factory([curl_options]() { return std::make_unique<http::client::CurlEasy>(curl_options); })
                           .with_endpoint(sparql::endpoint::EndpointClass{
                               .name_ = sparql::endpoint::WIKIDATA, .sparql_url_ = settings.wikidata_sparql_url_, .requires_grounding_ = true})
                           .with_endpoint(sparql::endpoint::EndpointClass{
                               .name_ = sparql::endpoint::RHEA, .sparql_url_ = settings.rhea_sparql_url_, .requires_grounding_ = false})
                           .with_grounding_api(settings.wikidata_api_url_)
                           .with_policies(policies)
                           .validate()
                           .build();

        //
        // Dispatch
        //

        nlohmann::json out;
        if (args.command_ == "query") {
            out = run_queries(*service, args);
        } else if (args.command_ == "search-entity") {
            out = grounding::to_json(service->lookup_entities(required_positional(args, "search text"), args.k_));
        } else if (args.command_ == "search-property") {
            out = grounding::to_json(service->lookup_properties(required_positional(args, "search text"), args.k_));
        } else if (args.command_ == "schema") {
            out = grounding::to_json(service->schema_context(args.entity_ids_, args.property_ids_, args.budget_tokens_));
        } else if (args.command_ == "classify") {
            out = service::to_json(service->normalize_error(string_utils::join(args.positional_, " ")));
        } else if (args.command_ == "ping") {
            auto ping = service::to_json(service->ping(required_positional(args, "endpoint class")));
            ping["http2_enabled"] = curl_options.prefer_http2_;
            out = ping;
        } else {
            std::cerr << "unknown command " << args.command_ << "\n" << USAGE;
            return 1;
        }

        std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
