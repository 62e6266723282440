// rotator: banner rotation server
//
// Usage: rotator <FILE> [options]
//
// Loads the ';'-separated banner file, freezes the inventory and serves
//   GET /?category=a&category=b   banner markup (204 when none left)
//   GET /stats                    inventory stats (JSON)
//
// Options:
//   -p, --port N       Listening HTTP port (default 8080)
//   -b, --bind ADDR    Bind address (default 0.0.0.0)
//   -w, --workers N    Serving threads (default: hardware concurrency)
//   --seed N           Seed worker engines with N + worker index
//   -v, --verbose      Debug logging
//   --version          Print version JSON and exit

#include <rotator/args.hpp>
#include <rotator/config_loader.hpp>
#include <rotator/handler.hpp>
#include <rotator/http_server.hpp>
#include <rotator/inventory.hpp>
#include <rotator/log.hpp>
#include <rotator/stats.hpp>
#include <rotator/version.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace rotator;

static std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    (void)sig;
    g_running.store(false);
}

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    std::cerr << "rotator " << ROTATOR_VERSION << " - banner rotation server\n\n"
              << "Usage: " << prog_name(prog) << " <FILE> [options]\n\n"
              << "FILE is ';'-separated: url;impressions;category[;category...]\n\n"
              << "Options:\n"
              << "  -p, --port N       Listening HTTP port (default 8080)\n"
              << "  -b, --bind ADDR    Bind address (default 0.0.0.0)\n"
              << "  -w, --workers N    Serving threads (default: CPU count)\n"
              << "  --seed N           Deterministic selection (worker i uses N + i)\n"
              << "  -v, --verbose      Debug logging\n"
              << "  --version          Print version and exit\n"
              << "  -h, --help         Show this help\n";
}

struct Options {
    std::string file;
    std::string bind = "0.0.0.0";
    uint16_t port = 8080;
    unsigned workers = 0;
    bool seeded = false;
    uint64_t seed = 0;
};

void run_worker(unsigned id, HttpServer& server, Handler& handler) {
    size_t total_requests = 0;

    while (g_running) {
        auto requests = server.poll(100);
        for (const auto& req : requests) {
            total_requests++;
            log_debug("worker", "#%u request %zu fd=%d %s %s", id, total_requests,
                      req.client_fd, req.method.c_str(), req.target.c_str());
            server.respond(req.client_fd, handler.handle(req));
        }
    }

    log_debug("worker", "#%u stopped on %s:%u (pending_writes=%zu)", id,
              server.bind_address().c_str(), static_cast<unsigned>(server.port()),
              server.pending_writes());
    log_debug("worker", "#%u totals (requests=%zu served=%zu empty=%zu)",
              id, total_requests, handler.served(), handler.empty());
}

int main(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        unsigned long long n = 0;
        if ((strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--port") == 0) && i + 1 < argc) {
            if (!parse_unsigned(argv[++i], 65535, n)) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            opts.port = static_cast<uint16_t>(n);
        } else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--bind") == 0) && i + 1 < argc) {
            opts.bind = argv[++i];
        } else if ((strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--workers") == 0) && i + 1 < argc) {
            if (!parse_unsigned(argv[++i], 1024, n) || n == 0) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
            opts.workers = static_cast<unsigned>(n);
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            if (!parse_unsigned(argv[++i], UINT64_MAX, n)) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                return 1;
            }
            opts.seed = n;
            opts.seeded = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << json{{"name", "rotator"}, {"version", version::string()}}.dump() << "\n";
            return 0;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && opts.file.empty()) {
            opts.file = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.file.empty()) {
        std::cerr << "Error: banner FILE is required\n";
        print_usage(argv[0]);
        return 1;
    }

    if (opts.workers == 0) {
        opts.workers = std::max(1u, std::thread::hardware_concurrency());
    }

    // Build phase: single thread, no readers yet
    auto inventory = std::make_shared<Inventory>();
    LoadReport report;
    auto load_start = std::chrono::steady_clock::now();
    if (!ConfigLoader(*inventory).load_file(opts.file, report)) {
        return 1;
    }
    auto load_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - load_start).count();

    for (const auto& err : report.errors) {
        log_info("loader", "line %zu: %s", err.line, err.message.c_str());
    }
    if (report.rejected + report.malformed > report.errors.size()) {
        log_info("loader", "... %zu more errors not shown",
                 report.rejected + report.malformed - report.errors.size());
    }

    inventory->freeze();
    InventoryPtr shared = inventory;
    inventory.reset();

    log_info("rotator", "loaded %zu banners in %lldms: %s", shared->size(),
             static_cast<long long>(load_ms), stats_string(*shared).c_str());
    if (verbose()) {
        for (BannerPos pos = 0; pos < shared->size() && pos < 10; ++pos) {
            log_debug("rotator", "banner %s", banner_json(*shared, pos).dump().c_str());
        }
    }

    // Serve phase: one server + handler per worker, shared frozen store
    std::vector<std::unique_ptr<HttpServer>> servers;
    std::vector<std::unique_ptr<Handler>> handlers;
    for (unsigned w = 0; w < opts.workers; ++w) {
        auto server = std::make_unique<HttpServer>(opts.bind, opts.port);
        if (!server->start()) {
            log_info("rotator", "failed to listen on %s:%u", opts.bind.c_str(),
                     static_cast<unsigned>(opts.port));
            return 1;
        }
        // Port 0 resolves on the first bind; the rest join it
        opts.port = server->port();

        Rng rng = opts.seeded ? Rng(opts.seed + w) : Rng(std::random_device{}());
        handlers.push_back(std::make_unique<Handler>(shared, std::move(rng)));
        servers.push_back(std::move(server));
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    log_info("rotator", "serving on %s:%u (workers=%u, pid=%d)", opts.bind.c_str(),
             static_cast<unsigned>(opts.port), opts.workers, static_cast<int>(getpid()));

    std::vector<std::thread> threads;
    threads.reserve(opts.workers);
    for (unsigned w = 0; w < opts.workers; ++w) {
        threads.emplace_back(run_worker, w, std::ref(*servers[w]), std::ref(*handlers[w]));
    }
    for (auto& t : threads) {
        t.join();
    }

    size_t served = 0, empty = 0;
    for (const auto& h : handlers) {
        served += h->served();
        empty += h->empty();
    }
    servers.clear();

    log_info("rotator", "stopped (served=%zu empty=%zu)", served, empty);
    return 0;
}
