#include "config/config_loader.hpp"
#include "core/service.hpp"
#include "core/utils.hpp"

#include <csignal>
#include <format>
#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

using namespace redactguard;

namespace {

std::stop_source g_stop;

void signal_handler(int /*signal*/) {
    g_stop.request_stop();
}

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;
constexpr int kExitDenied = 3;

void print_usage() {
    std::cerr <<
        "usage: redactguard [-c config.toml] <command> [options]\n"
        "\n"
        "commands:\n"
        "  scrub    --actor A --tier Cn [--session S] [--explain]   stdin -> redacted stdout\n"
        "  descrub  --op ID --actor A --justification TEXT\n"
        "           [--role R] [--clearance Cn] [--session S] [--id IDENT]...\n"
        "  verify                                                  check the audit ledger chain\n"
        "  metrics  [--limit N]                                    receipt label/action counts, latency\n";
}

/// --key value pairs; repeated --id collects into `ids`
struct Args {
    std::string command;
    std::string config_file = "config/redactguard.toml";
    std::map<std::string, std::string> options;
    std::vector<std::string> ids;
    bool explain = false;

    [[nodiscard]] std::string get(const std::string& key) const {
        const auto it = options.find(key);
        return it != options.end() ? it->second : std::string();
    }
};

bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (++i >= argc) return false;
            args.config_file = argv[i];
        } else if (arg == "--explain") {
            args.explain = true;
        } else if (arg.starts_with("--")) {
            if (++i >= argc) return false;
            if (arg == "--id") {
                args.ids.emplace_back(argv[i]);
            } else {
                args.options[arg.substr(2)] = argv[i];
            }
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            return false;
        }
    }
    return !args.command.empty();
}

int run_scrub(const Service& service, const Args& args) {
    const auto tier = parse_tier(args.get("tier"));
    if (!tier) {
        std::cerr << "scrub: --tier must be C1..C4\n";
        return kExitUsage;
    }

    ScrubRequest request;
    request.content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    request.actor = args.get("actor");
    request.session_id = args.get("session");
    request.requested_tier = *tier;

    auto result = service.scrub(request, g_stop.get_token());
    if (result.is_error()) {
        std::cerr << std::format("scrub failed [{}]: {}\n",
            error_category_to_string(result.error_category()), result.error_message());
        return kExitFailed;
    }

    const auto& r = result.value();
    std::cout << r.content;
    std::cout.flush();
    std::cerr << std::format("operation_id={} entities={} degraded={}\n",
        r.operation_id, r.entities.size(), utils::booltostr(r.degraded));
    if (args.explain) {
        for (const auto& o : r.entities) {
            std::cerr << to_explainability_json(o.entity) << '\n';
        }
    }
    return kExitOk;
}

int run_descrub(const Service& service, const Args& args) {
    DeScrubRequest request;
    request.operation_id = args.get("op");
    request.actor = args.get("actor");
    request.session_id = args.get("session");
    request.role = args.get("role");
    request.justification = args.get("justification");

    const std::string clearance = args.get("clearance");
    if (!clearance.empty()) {
        request.clearance = parse_tier(clearance);
        if (!request.clearance) {
            std::cerr << "descrub: --clearance must be C1..C4\n";
            return kExitUsage;
        }
    }
    if (!args.ids.empty()) {
        request.identifiers = std::set<std::string>(args.ids.begin(), args.ids.end());
    }

    auto result = service.descrub(request);
    if (result.is_error()) {
        std::cerr << std::format("descrub failed [{}]: {}\n",
            error_category_to_string(result.error_category()), result.error_message());
        return kExitFailed;
    }

    const auto& r = result.value();
    switch (r.outcome) {
        case DeScrubOutcome::GRANTED:
            if (r.content) {
                std::cout << *r.content;
            } else if (r.cells) {
                for (const auto& c : *r.cells) {
                    std::cout << std::format("{}!{}\t{}\n", c.sheet, c.cell, c.text);
                }
            }
            std::cout.flush();
            return kExitOk;
        case DeScrubOutcome::DENIED:
            std::cerr << std::format("denied: {}\n", r.reason);
            return kExitDenied;
        case DeScrubOutcome::ERROR:
            std::cerr << std::format("reversal error: {}\n", r.reason);
            return kExitFailed;
    }
    return kExitFailed;
}

int run_verify(const Service& service) {
    const auto report = service.verify_ledger();
    if (report.ok) {
        std::cout << std::format("ledger ok: {} entries\n", report.entries_checked);
        return kExitOk;
    }
    std::cout << std::format("ledger broken at entry {}: {}\n",
        report.broken_at.value_or(0), report.reason);
    return kExitFailed;
}

int run_metrics(const Service& service, const Args& args) {
    size_t limit = 2000;
    const std::string raw = args.get("limit");
    if (!raw.empty()) {
        try {
            limit = static_cast<size_t>(std::stoul(raw));
        } catch (const std::exception&) {
            std::cerr << std::format("invalid --limit '{}'\n", raw);
            return kExitUsage;
        }
    }
    std::cout << service.receipt_metrics(limit).to_json() << '\n';
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return kExitUsage;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto config_result = ConfigLoader::load_from_file(args.config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitUsage;
        }

        auto built = Service::build(config_result.config);
        if (!built.success) {
            utils::log::error(std::format("Startup failed: {}", built.error_message));
            return kExitUsage;
        }
        auto& service = *built.service;

        int rc = kExitUsage;
        if (args.command == "scrub") {
            rc = run_scrub(service, args);
        } else if (args.command == "descrub") {
            rc = run_descrub(service, args);
        } else if (args.command == "verify") {
            rc = run_verify(service);
        } else if (args.command == "metrics") {
            rc = run_metrics(service, args);
        } else {
            print_usage();
        }

        service.shutdown();
        return rc;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailed;
    }
}
