#include "batch.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "pagination.hpp"
#include "pipeline.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct Config {
    std::string configFile;
    std::string apiUrl;
    std::string uaaUrl;
    std::string tokenUrl;
    std::string clientId;
    std::string clientSecret;
    std::string username;
    std::string password;
    std::string accessToken;
    std::string path        = "/v3/apps";
    int         pageSize    = 50;
    int         maxPages    = 0;
    int         rateLimit   = -1;
    int         concurrency = -1;
    int         timeoutMs   = -1;
    bool        noCache     = false;
    bool        verbose     = false;
    std::vector<std::string> gets;   // resource:guid
};

static void printUsage() {
    std::cout
        << "Usage: capi_pipeline [options]\n\n"
        << "Lists a collection, or with --get runs a batch of lookups.\n\n"
        << "Options:\n"
        << "  --config FILE         JSON pipeline configuration\n"
        << "  --api URL             API endpoint (overrides config)\n"
        << "  --uaa URL             UAA endpoint; token URL is <uaa>/oauth/token\n"
        << "  --token-url URL       Explicit token endpoint\n"
        << "  --client-id ID        OAuth2 client id\n"
        << "  --client-secret S     OAuth2 client secret\n"
        << "  --username U          Password grant user\n"
        << "  --password P          Password grant password\n"
        << "  --access-token T      Static bearer token\n"
        << "  --path P              Collection to list      (default: /v3/apps)\n"
        << "  --page-size N         Items per page          (default: 50)\n"
        << "  --max-pages N         Stop after N pages      (default: all)\n"
        << "  --get RES:GUID        Fetch one resource; repeatable\n"
        << "  --concurrency N       Batch workers           (default: 5)\n"
        << "  --rate-limit N        Requests per second     (default: unlimited)\n"
        << "  --timeout-ms N        HTTP timeout in ms      (default: 30000)\n"
        << "  --no-cache            Disable response caching\n"
        << "  --verbose             Enable verbose diagnostics\n"
        << "  --help, -h            Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--config" && hasValue) {
            cfg.configFile = argv[++i];
        } else if (arg == "--api" && hasValue) {
            cfg.apiUrl = argv[++i];
        } else if (arg == "--uaa" && hasValue) {
            cfg.uaaUrl = argv[++i];
        } else if (arg == "--token-url" && hasValue) {
            cfg.tokenUrl = argv[++i];
        } else if (arg == "--client-id" && hasValue) {
            cfg.clientId = argv[++i];
        } else if (arg == "--client-secret" && hasValue) {
            cfg.clientSecret = argv[++i];
        } else if (arg == "--username" && hasValue) {
            cfg.username = argv[++i];
        } else if (arg == "--password" && hasValue) {
            cfg.password = argv[++i];
        } else if (arg == "--access-token" && hasValue) {
            cfg.accessToken = argv[++i];
        } else if (arg == "--path" && hasValue) {
            cfg.path = argv[++i];
        } else if (arg == "--page-size" && hasValue) {
            cfg.pageSize = std::stoi(argv[++i]);
        } else if (arg == "--max-pages" && hasValue) {
            cfg.maxPages = std::stoi(argv[++i]);
        } else if (arg == "--get" && hasValue) {
            cfg.gets.emplace_back(argv[++i]);
        } else if (arg == "--concurrency" && hasValue) {
            cfg.concurrency = std::stoi(argv[++i]);
        } else if (arg == "--rate-limit" && hasValue) {
            cfg.rateLimit = std::stoi(argv[++i]);
        } else if (arg == "--timeout-ms" && hasValue) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--no-cache") {
            cfg.noCache = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

/// Command-line flags win over the configuration file.
static capi_pipeline::PipelineConfig buildPipelineConfig(const Config& cfg) {
    using namespace capi_pipeline;

    PipelineConfig pc = cfg.configFile.empty() ? PipelineConfig() : loadConfigFile(cfg.configFile);

    auto overlay = [](std::string& field, const std::string& value) {
        if (!value.empty()) field = value;
    };
    overlay(pc.apiUrl, cfg.apiUrl);
    overlay(pc.uaaUrl, cfg.uaaUrl);
    overlay(pc.credentials.tokenUrl, cfg.tokenUrl);
    overlay(pc.credentials.clientId, cfg.clientId);
    overlay(pc.credentials.clientSecret, cfg.clientSecret);
    overlay(pc.credentials.username, cfg.username);
    overlay(pc.credentials.password, cfg.password);
    overlay(pc.credentials.accessToken, cfg.accessToken);

    if (cfg.rateLimit >= 0)   pc.rateLimit        = cfg.rateLimit;
    if (cfg.concurrency > 0)  pc.batchConcurrency = cfg.concurrency;
    if (cfg.timeoutMs > 0)    pc.timeout          = std::chrono::milliseconds(cfg.timeoutMs);
    if (cfg.noCache)          pc.enableCache      = false;
    if (cfg.verbose) {
        pc.verbose  = true;
        pc.logLevel = LogLevel::Debug;
    }

    if (pc.apiUrl.empty()) {
        throw ConfigError("no API endpoint: pass --api or set api_url in the config file");
    }
    return pc;
}

static std::vector<capi_pipeline::BatchOperation> buildGets(const std::vector<std::string>& specs) {
    capi_pipeline::BatchBuilder builder;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        const auto colon = specs[i].find(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("--get expects RESOURCE:GUID, got " + specs[i]);
        }
        builder.get("get-" + std::to_string(i + 1), specs[i].substr(0, colon),
                    specs[i].substr(colon + 1));
    }
    return builder.build();
}

static std::string field(const nlohmann::json& item, const char* key) {
    if (!item.is_object() || !item.contains(key) || !item[key].is_string()) return "";
    return item[key].get<std::string>();
}

static void printSummary(capi_pipeline::Pipeline& pipeline) {
    std::cout << "\n=== Summary Report ===\n";

    if (auto metrics = pipeline.metrics()) {
        for (const auto& [endpoint, m] : metrics->snapshot()) {
            std::cout << std::left << std::setw(40) << endpoint
                      << " requests=" << m.totalRequests
                      << " errors=" << m.totalErrors
                      << " avg_ms=" << std::fixed << std::setprecision(2)
                      << std::chrono::duration<double, std::milli>(m.averageLatency).count()
                      << "\n";
        }
    }
    if (auto cache = pipeline.cache()) {
        const auto stats = cache->getStats();
        std::cout << "Cache hits/misses:   " << stats.hits << "/" << stats.misses
                  << " (hit rate " << std::fixed << std::setprecision(2)
                  << stats.hitRate() * 100.0 << "%)\n";
    }
    if (auto breaker = pipeline.circuitBreaker()) {
        std::cout << "Circuit breaker:     " << capi_pipeline::circuitStateName(breaker->state())
                  << "\n";
    }
    std::cout << "======================\n";
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);
        const auto pc = buildPipelineConfig(cfg);

        std::cout
            << "=== capi_pipeline ===\n"
            << "API:        " << pc.apiUrl << "\n"
            << "Token URL:  " << (pc.tokenUrl().empty() ? "-" : pc.tokenUrl()) << "\n"
            << "Mode:       " << (cfg.gets.empty() ? "list " + cfg.path : "batch get") << "\n"
            << "Cache:      " << (pc.enableCache ? "on" : "off") << "\n"
            << "Verbose:    " << (pc.verbose ? "yes" : "no") << "\n"
            << "=====================\n\n";

        capi_pipeline::Pipeline pipeline(pc);
        capi_pipeline::CancelToken cancel;

        if (cfg.gets.empty()) {
            capi_pipeline::PaginationOptions options;
            options.pageSize = cfg.pageSize;
            options.maxPages = cfg.maxPages;

            int index = 0;
            capi_pipeline::streamPages(
                cancel, pipeline.pages(), cfg.path, {}, options,
                [&index](const capi_pipeline::ListPage& page) {
                    for (const auto& item : page.resources) {
                        std::cout << std::setw(4) << ++index << "  "
                                  << std::left << std::setw(38) << field(item, "guid")
                                  << field(item, "name") << "\n";
                    }
                    return true;
                });
        } else {
            const auto results = pipeline.batch().execute(cancel, buildGets(cfg.gets));
            for (const auto& r : results) {
                std::cout << std::left << std::setw(10) << r.id
                          << (r.success ? "ok     " : "FAILED ")
                          << std::setw(10)
                          << std::chrono::duration_cast<std::chrono::milliseconds>(r.duration).count()
                          << (r.success ? field(r.data, "name") : capi_pipeline::describeError(r.error))
                          << "\n";
            }
        }

        printSummary(pipeline);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
