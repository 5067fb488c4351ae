#include <iostream>
#include <string>
#include <vector>
#include <print>
#include <format>
#include <chrono>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <optional>

// Third-party
#include <nlohmann/json.hpp>

// Internal Modules
#include "../common/config.hpp"
#include "../common/file_source.hpp"
#include "reassembly.hpp"
#include "transfer_manager.hpp"
#include "zmq_link.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

// --- Helpers ---

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted = true; }

struct Options {
    std::string command;
    std::string file;
    std::string endpoint;
    std::string config_path = "ferry.json";
    std::string out_dir = "downloads";
    std::optional<std::string> key;
    std::optional<std::string> route;
    std::optional<int64_t> chunk_size;
    int64_t linger_ms = 3000;
    int64_t idle_timeout_ms = 30'000;
    bool keep_going = false;
    bool verbose = false;
};

static void print_usage() {
    std::println("Usage:");
    std::println("  ferryd send <file> --connect <endpoint> [--key P] [--chunk-size N] [--route R]");
    std::println("                     [--config F] [--linger-ms N] [--verbose]");
    std::println("  ferryd receive --bind <endpoint> [--key P] [--out DIR] [--config F]");
    std::println("                     [--idle-timeout-ms N] [--keep-going] [--verbose]");
}

static std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opt;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) return std::nullopt;

    opt.command = args[0];
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& a = args[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        try {
            if (a == "--connect" || a == "--bind") {
                auto v = next(); if (!v) return std::nullopt;
                opt.endpoint = *v;
            } else if (a == "--key") {
                auto v = next(); if (!v) return std::nullopt;
                opt.key = *v;
            } else if (a == "--route") {
                auto v = next(); if (!v) return std::nullopt;
                opt.route = *v;
            } else if (a == "--config") {
                auto v = next(); if (!v) return std::nullopt;
                opt.config_path = *v;
            } else if (a == "--out") {
                auto v = next(); if (!v) return std::nullopt;
                opt.out_dir = *v;
            } else if (a == "--chunk-size") {
                auto v = next(); if (!v) return std::nullopt;
                opt.chunk_size = std::stoll(*v);
            } else if (a == "--linger-ms") {
                auto v = next(); if (!v) return std::nullopt;
                opt.linger_ms = std::stoll(*v);
            } else if (a == "--idle-timeout-ms") {
                auto v = next(); if (!v) return std::nullopt;
                opt.idle_timeout_ms = std::stoll(*v);
            } else if (a == "--keep-going") {
                opt.keep_going = true;
            } else if (a == "--verbose") {
                opt.verbose = true;
            } else if (opt.command == "send" && opt.file.empty() && !a.starts_with("--")) {
                opt.file = a;
            } else {
                std::println(stderr, "[Main] Unknown argument: {}", a);
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::println(stderr, "[Main] Invalid number for {}", a);
            return std::nullopt;
        }
    }

    if (opt.endpoint.empty()) return std::nullopt;
    if (opt.command == "send" && opt.file.empty()) return std::nullopt;
    if (opt.command != "send" && opt.command != "receive") return std::nullopt;
    return opt;
}

static void print_status(const std::string& payload) {
    auto j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) return;

    std::string line = std::format("[Status] {} {} {}", j.value("direction", ""), j.value("op", ""),
                                   j.value("transferId", ""));
    if (j.contains("seq")) line += std::format(" seq={}/{}", j["seq"].get<uint32_t>(), j.value("totalChunks", 0u));
    if (j.contains("progress")) line += std::format(" {:.0f}%", j["progress"].get<double>() * 100.0);
    if (j.contains("reason")) line += std::format(" ({})", j["reason"].get<std::string>());
    std::println("{}", line);
}

// --- Send ---

static int run_send(const Options& opt, ferry::TransferConfig cfg) {
    auto file = ferry::DiskFile::open(opt.file);
    if (!file) {
        std::println(stderr, "[Main] {}: {}", ferry::describe(file.error()), opt.file);
        return 1;
    }

    ferry::ZmqLink link(opt.endpoint, ferry::ZmqLink::Mode::Connect);
    if (!link.open()) return 1;

    ferry::TransferManager manager(link, cfg);
    link.on_message = [&](const ferry::InboundMessage& m) { manager.on_incoming(m); };
    if (opt.verbose) link.on_status = print_status;

    auto id = manager.send_file(std::move(*file), opt.key, opt.route);
    if (!id) return 1;

    link.poll(ferry::HEADER_PAUSE);

    // One chunk per iteration; requests and cancels are served in between
    while (true) {
        if (g_interrupted) {
            manager.cancel_send("sender-cancel");
            break;
        }
        bool more = manager.pump();
        link.poll(ferry::CHUNK_PAUSE);
        if (!more) break;
    }

    const auto& last = manager.sender().last();
    if (!last || !last->completed) {
        if (last && last->error) std::println(stderr, "[Main] {}", ferry::describe(*last->error));
        std::println(stderr, "[Main] Transfer {} did not complete.", *id);
        return 1;
    }

    // Stay around for resend requests
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opt.linger_ms);
    while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
        link.poll(50ms);
    }
    manager.sender().release();

    std::println("[Main] Done: {} ({} bytes).", last->name, last->size);
    return 0;
}

// --- Receive ---

static bool prompt_passphrase(ferry::TransferManager& manager, const ferry::IncomingTransfer& t) {
    std::print("[Main] '{}' is encrypted ({}). Passphrase: ", t.name,
               ferry::describe(t.error.value_or(ferry::TransferError::PassphraseRequired)));
    std::cout.flush();

    std::string pass;
    if (!std::getline(std::cin, pass)) return false;
    manager.set_passphrase(pass);
    return true;
}

static int run_receive(const Options& opt, ferry::TransferConfig cfg) {
    ferry::ZmqLink link(opt.endpoint, ferry::ZmqLink::Mode::Bind);
    if (!link.open()) return 1;

    ferry::TransferManager manager(link, cfg);
    if (opt.key) manager.set_passphrase(*opt.key);

    size_t saved = 0;
    link.on_message = [&](const ferry::InboundMessage& m) { manager.on_incoming(m); };
    if (opt.verbose) link.on_status = print_status;
    link.on_file = [&](const std::string& payload) {
        auto j = json::parse(payload, nullptr, false);
        if (j.is_discarded()) return;
        auto path = manager.receiver().save(j.value("transferId", ""), opt.out_dir);
        if (path) {
            std::println("[Main] Saved {} ({} bytes)", path->string(), j.value("size", 0ull));
            saved++;
        }
    };

    auto last_activity = std::chrono::steady_clock::now();
    while (!g_interrupted) {
        if (link.poll(100ms) > 0) last_activity = std::chrono::steady_clock::now();

        const auto* t = manager.receiver().find(manager.receiver().active_id());
        if (t && !t->ready && t->completed &&
            (t->error == ferry::TransferError::PassphraseMismatch ||
             t->error == ferry::TransferError::PassphraseRequired)) {
            if (!prompt_passphrase(manager, *t)) return 1;
            continue;
        }

        if (t && t->ready && !t->delivered) {
            std::print("[Main] '{}' ({} bytes) is ready. Save it? [y/N] ", t->name, t->result.size());
            std::cout.flush();
            std::string answer;
            if (std::getline(std::cin, answer) && (answer == "y" || answer == "Y")) {
                manager.receiver().accept(t->transfer_id);
            } else {
                std::println("[Main] Discarded '{}'.", t->name);
                manager.receiver().clear();
                continue;
            }
        }

        if (saved > 0 && !opt.keep_going) return 0;

        if (t && !t->ready && !t->cancelled && opt.idle_timeout_ms > 0 &&
            std::chrono::steady_clock::now() - last_activity > std::chrono::milliseconds(opt.idle_timeout_ms)) {
            auto missing = ferry::missing_chunks(*t);
            std::println(stderr, "[Main] Gave up on '{}': {} chunk(s) still missing after {} request(s).",
                         t->name, missing.size(), t->missing_tries);
            return 1;
        }
    }
    return saved > 0 ? 0 : 1;
}

// --- Main ---

int main(int argc, char* argv[]) {
    auto opt = parse_args(argc, argv);
    if (!opt) {
        print_usage();
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto cfg = ferry::load_config(opt->config_path);
    if (!cfg) {
        std::println(stderr, "[Main] Could not read config {}", opt->config_path);
        return 1;
    }
    if (opt->chunk_size) cfg->chunk_size = ferry::clamp_chunk_size(*opt->chunk_size);

    return opt->command == "send" ? run_send(*opt, *cfg) : run_receive(*opt, *cfg);
}
