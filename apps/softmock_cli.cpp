#ifdef _WIN32
#define NOMINMAX
#endif
#include "softmock/core/proxy/ProxyServer.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iterator>
#include <vector>

using namespace softmock::core::proxy;
using namespace softmock::core::util;
namespace flow = softmock::core::flow;

namespace {
void print_help() {
    std::cout << "Usage: softmock_cli [--listen ADDR] [--port N|-p N] [--log-level L] [--journal path]" << std::endl;
    std::cout << "                    [--no-mitm] [--ca-cert path] [--ca-key path] [--no-generate-ca] [--regenerate-ca]" << std::endl;
    std::cout << "                    [--intercept-allow g1,g2] [--intercept-deny g1,g2] [--record-allow g1,g2] [--record-deny g1,g2]" << std::endl;
    std::cout << "                    [--max-body-bytes N] [--ignore-param name] [--hash-body] [--verify-upstream] [--upstream-ca path]" << std::endl;
    std::cout << "                    [--export-ca file] [--export-ca-der file]" << std::endl;
    std::cout << "Console commands: list | show ID | status ID CODE | body ID TEXT | body-file ID PATH | header ID NAME VALUE" << std::endl;
    std::cout << "                  enable ID | disable ID | revert ID | replay ID | forget ID | clear [GLOB] | quit" << std::endl;
    std::cout << "  ID may be any unique prefix of a flow id." << std::endl;
}

std::vector<std::string> split_list(const std::string& v) {
    std::vector<std::string> out;
    std::stringstream ss(v); std::string item;
    while (std::getline(ss, item, ',')) if (!item.empty()) out.push_back(item);
    return out;
}

bool write_file(const std::string& path, const std::string& data) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(f);
}

std::string resolve_id(flow::FlowStore& store, const std::string& prefix) {
    std::string match;
    for (auto& s : store.list_flows()) {
        if (s.id.rfind(prefix, 0) != 0) continue;
        if (!match.empty()) throw InvalidOverrideError("ambiguous flow id prefix " + prefix);
        match = s.id;
    }
    if (match.empty()) throw UnknownFlowError(prefix);
    return match;
}

void print_flow(const flow::Flow& f) {
    std::cout << f.identity.id << "\n  " << f.identity.canonical << "\n";
    std::cout << fmt::format("  hits {} tls {} override {}\n", f.hits, f.tlsIntercepted ? "yes" : "no",
                             f.responseOverride ? (f.overrideEnabled ? "active" : "disabled") : "none");
    if (f.response) std::cout << fmt::format("  live: {} {} ({} bytes)\n", f.response->status, f.response->reason, f.response->body.size());
    if (f.responseOverride || f.response) {
        auto served = flow::materialize_response(f);
        std::cout << fmt::format("  served: {} {}\n", served.status, served.reason);
        for (auto& h : served.headers) std::cout << "    " << h.name << ": " << h.value << "\n";
        std::cout << "  " << served.body.substr(0, 512) << (served.body.size() > 512 ? "..." : "") << "\n";
    }
}

// Reads operator commands until EOF or "quit".
void run_console(ProxyServer& server) {
    auto& store = server.store();
    auto& overrides = server.overrides();
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string cmd, idArg;
        in >> cmd;
        if (cmd.empty()) continue;
        if (cmd == "quit" || cmd == "exit") break;
        try {
            if (cmd == "help") { print_help(); continue; }
            if (cmd == "list") {
                for (auto& s : store.list_flows())
                    std::cout << fmt::format("{} {:>4} {:<7} {}{}\n", s.id.substr(0, 12), s.status ? std::to_string(*s.status) : "-",
                                             s.method, s.url, s.overridden ? "  [override]" : "");
                continue;
            }
            if (cmd == "clear") {
                std::string glob; in >> glob;
                std::cout << "removed " << store.clear(glob) << " flows" << std::endl;
                continue;
            }
            in >> idArg;
            if (idArg.empty()) { std::cout << "missing flow id" << std::endl; continue; }
            std::string id = resolve_id(store, idArg);
            std::string rest;
            std::getline(in >> std::ws, rest);
            flow::ResponseOverride edit;
            if (cmd == "show") { print_flow(store.get_flow(id)); continue; }
            if (cmd == "status") { edit.status = std::stoi(rest); print_flow(overrides.set_override(id, edit)); continue; }
            if (cmd == "body") { edit.body = rest; print_flow(overrides.set_override(id, edit)); continue; }
            if (cmd == "body-file") {
                std::ifstream f(rest, std::ios::binary);
                if (!f) { std::cout << "cannot read " << rest << std::endl; continue; }
                edit.body = std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
                print_flow(overrides.set_override(id, edit));
                continue;
            }
            if (cmd == "header") {
                auto space = rest.find(' ');
                if (space == std::string::npos) { std::cout << "usage: header ID NAME VALUE" << std::endl; continue; }
                auto current = flow::materialize_response(store.get_flow(id)).headers;
                softmock::core::http::set_header(current, rest.substr(0, space), rest.substr(space + 1));
                edit.headers = current;
                print_flow(overrides.set_override(id, edit));
                continue;
            }
            if (cmd == "enable" || cmd == "disable") { print_flow(overrides.set_override_enabled(id, cmd == "enable")); continue; }
            if (cmd == "revert") { print_flow(overrides.clear_override(id)); continue; }
            if (cmd == "replay") { print_flow(server.interceptor().replay(id)); continue; }
            if (cmd == "forget") { store.forget(id); std::cout << "forgot " << id << std::endl; continue; }
            std::cout << "unknown command " << cmd << " (try help)" << std::endl;
        } catch (const ProxyError& e) {
            std::cout << to_string(e.kind()) << ": " << e.what() << std::endl;
        } catch (const std::invalid_argument&) {
            std::cout << "expected a number" << std::endl;
        } catch (const std::out_of_range&) {
            std::cout << "number out of range" << std::endl;
        }
    }
}
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg;
    Logger::Level level = Logger::Level::info;
    bool regenerateCa = false;
    std::string exportCaFile, exportCaDerFile;
    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            bool hasValue = i + 1 < args.size();
            if (a == "--help" || a == "-h") { print_help(); return 0; }
            if ((a == "--port" || a == "-p") && hasValue) { cfg.listenPort = static_cast<uint16_t>(std::stoi(args[++i])); continue; }
            if (a == "--listen" && hasValue) { cfg.listenAddress = args[++i]; continue; }
            if (a == "--log-level" && hasValue) {
                auto parsed = Logger::parse_level(args[++i]);
                if (!parsed) { std::cerr << "unknown log level " << args[i] << std::endl; return 2; }
                level = *parsed;
                continue;
            }
            if (a == "--journal" && hasValue) { cfg.journalPath = args[++i]; continue; }
            if (a == "--no-mitm") { cfg.enableTlsMitm = false; continue; }
            if (a == "--ca-cert" && hasValue) { cfg.caCertPath = args[++i]; continue; }
            if (a == "--ca-key" && hasValue) { cfg.caKeyPath = args[++i]; continue; }
            if (a == "--no-generate-ca") { cfg.generateCaIfMissing = false; continue; }
            if (a == "--regenerate-ca") { regenerateCa = true; continue; }
            if (a == "--intercept-allow" && hasValue) { cfg.interceptAllow = split_list(args[++i]); continue; }
            if (a == "--intercept-deny" && hasValue) { cfg.interceptDeny = split_list(args[++i]); continue; }
            if (a == "--record-allow" && hasValue) { cfg.recordAllow = split_list(args[++i]); continue; }
            if (a == "--record-deny" && hasValue) { cfg.recordDeny = split_list(args[++i]); continue; }
            if (a == "--max-body-bytes" && hasValue) { cfg.maxBodyBytes = static_cast<std::size_t>(std::stoull(args[++i])); continue; }
            if (a == "--ignore-param" && hasValue) { cfg.identity.ignoredQueryParams.push_back(args[++i]); continue; }
            if (a == "--hash-body") { cfg.identity.includeBodyHash = true; continue; }
            if (a == "--verify-upstream") { cfg.verifyUpstream = true; continue; }
            if (a == "--upstream-ca" && hasValue) { cfg.upstreamCaFile = args[++i]; continue; }
            if (a == "--export-ca" && hasValue) { exportCaFile = args[++i]; continue; }
            if (a == "--export-ca-der" && hasValue) { exportCaDerFile = args[++i]; continue; }
            std::cerr << "unknown or incomplete option " << a << std::endl;
            print_help();
            return 2;
        }
    } catch (const std::exception&) {
        std::cerr << "invalid numeric option value" << std::endl;
        return 2;
    }
    Logger::instance().set_level(level);
    Logger::instance().log(Logger::Level::info, "starting");

    ProxyServer server(cfg);
    auto ca = server.certificate_authority();
    if (regenerateCa) {
        if (!ca) { std::cerr << "--regenerate-ca: no certificate authority available" << std::endl; return 1; }
        ca->regenerate_root();
    }
    if (!exportCaFile.empty() || !exportCaDerFile.empty()) {
        if (!ca) { std::cerr << "--export-ca: no certificate authority available" << std::endl; return 1; }
        if (!exportCaFile.empty()) {
            if (!write_file(exportCaFile, ca->export_ca_pem())) { std::cerr << "cannot write " << exportCaFile << std::endl; return 1; }
            std::cout << "Exported CA PEM to " << exportCaFile << std::endl;
        }
        if (!exportCaDerFile.empty()) {
            if (!write_file(exportCaDerFile, ca->export_ca_der())) { std::cerr << "cannot write " << exportCaDerFile << std::endl; return 1; }
            std::cout << "Exported CA DER to " << exportCaDerFile << std::endl;
        }
    }
    if (!server.start()) return 1;
    if (ca) std::cout << "Root CA fingerprint (SHA-256): " << ca->ca_fingerprint_sha256() << std::endl;
    run_console(server);
    server.stop();
    Logger::instance().log(Logger::Level::info, "stopped");
    return 0;
}
