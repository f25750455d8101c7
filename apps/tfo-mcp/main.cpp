//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: main.cpp
// Purpose: tfo-mcp command line: serve, validate, info, init-config, version
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "tfomcp/Builtins.h"
#include "tfomcp/Config.h"
#include "tfomcp/Server.h"
#include "tfomcp/StdioTransport.hpp"
#include "tfomcp/Telemetry.h"
#include "tfomcp/version.h"

using namespace tfomcp;

namespace {

std::atomic<int> gSignal{0};

void onSignal(int sig) {
    gSignal.store(sig);
}

struct CliArgs {
    std::string command;
    std::optional<std::string> configPath;
    bool debug = false;
    bool help = false;
    std::vector<std::string> unknown;
};

//==========================================================================================================
// Parses "<command> [--config PATH|--config=PATH|-c PATH] [--debug] [--help]".
//==========================================================================================================
CliArgs parseArgs(int argc, char** argv) {
    CliArgs out;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) continue;
        std::string a = argv[i];
        std::string value;
        bool hasInlineValue = false;
        const std::size_t eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = a.substr(eq + 1);
            a = a.substr(0, eq);
            hasInlineValue = true;
        }
        if (a == "--config" || a == "-c") {
            if (hasInlineValue) {
                out.configPath = value;
            } else if (i + 1 < argc) {
                out.configPath = std::string(argv[++i]);
            } else {
                out.unknown.push_back(a);
            }
        } else if (a == "--debug") {
            out.debug = true;
        } else if (a == "--no-debug") {
            out.debug = false;
        } else if (a == "--help" || a == "-h") {
            out.help = true;
        } else if (a == "--version") {
            out.command = "version";
        } else if (a.rfind("-", 0) == 0) {
            out.unknown.push_back(a);
        } else if (out.command.empty()) {
            out.command = a;
        } else {
            out.unknown.push_back(a);
        }
    }
    return out;
}

void printUsage(std::ostream& os) {
    os << "TelemetryFlow MCP Server v" << getVersionString() << "\n\n"
       << "Usage: tfo-mcp <command> [options]\n\n"
       << "Commands:\n"
       << "  serve         Start the MCP server on stdin/stdout\n"
       << "  validate      Validate the configuration file\n"
       << "  info          Show built-in tools, resources and prompts\n"
       << "  init-config   Write a default tfo-mcp.json in the current directory\n"
       << "  version       Show version information\n\n"
       << "Options:\n"
       << "  -c, --config PATH   Configuration file\n"
       << "  --debug             Enable debug logging (serve)\n"
       << "  -h, --help          Show this help\n";
}

int runServe(const CliArgs& args) {
    Config config;
    try {
        config = Config::Load(args.configPath);
        if (args.debug) {
            config.server.debug = true;
            config.logging.level = "debug";
        }
        config.Validate();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    Logger::configure(config.logging.level, config.logging.output);

    auto telemetry = MakeTelemetrySink(config.telemetry.enabled, config.telemetry.serviceName,
                                       config.telemetry.environment);
    if (config.telemetry.enabled) {
        LOG_INFO("Telemetry enabled: service={}", config.telemetry.serviceName);
    }
    LOG_INFO("Starting TelemetryFlow MCP Server v{} name={} transport={} debug={}", getVersionString(),
             config.server.name, config.server.transport, config.server.debug);
    if (config.claude.apiKey.empty()) {
        LOG_WARN("Claude API key not configured, claude_conversation tool disabled");
    } else {
        LOG_WARN("No upstream chat client is linked into this build; claude_conversation tool disabled");
    }

    Server server(config, telemetry);

    auto transport = std::make_unique<StdioTransport>();
    transport->SetMaxMessageSize(static_cast<std::size_t>(config.mcp.maxMessageSize));

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGPIPE, SIG_IGN);

    std::jthread signalWatcher([&server](std::stop_token st) {
        while (!st.stop_requested()) {
            if (int sig = gSignal.load(); sig != 0) {
                LOG_INFO("Received signal {}; shutting down", sig);
                server.RequestShutdown();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    try {
        server.Start(std::move(transport)).get();
        server.WaitForShutdown();
        server.Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server error: {}", e.what());
        signalWatcher.request_stop();
        return 1;
    }
    signalWatcher.request_stop();
    return 0;
}

int runValidate(const CliArgs& args) {
    try {
        Config cfg = Config::Load(args.configPath);
        cfg.Validate();
        auto onOff = [](bool v) { return v ? "enabled" : "disabled"; };
        std::cout << "Configuration is valid!\n"
                  << "  Source: " << (cfg.sourcePath.empty() ? std::string("(defaults)") : cfg.sourcePath) << "\n"
                  << "  Server: " << cfg.server.name << " v" << cfg.server.version << "\n"
                  << "  Transport: " << cfg.server.transport << "\n"
                  << "  MCP Protocol: " << cfg.mcp.protocolVersion << "\n"
                  << "  Tools: " << onOff(cfg.mcp.enableTools) << "\n"
                  << "  Resources: " << onOff(cfg.mcp.enableResources) << "\n"
                  << "  Prompts: " << onOff(cfg.mcp.enablePrompts) << "\n"
                  << "  Claude API: " << (cfg.claude.apiKey.empty() ? "not configured" : "configured") << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
}

int runInfo() {
    Config defaults;
    std::cout << "TelemetryFlow MCP Server v" << getVersionString() << "\n\nBuilt-in Tools:\n";
    for (const auto& tool : CreateBuiltinTools(defaults)) {
        std::cout << "  - " << tool.Name() << ": " << tool.Description() << "\n";
    }
    std::cout << "  - claude_conversation: Have a conversation with Claude AI (requires a chat client)\n";
    std::cout << "\nBuilt-in Prompts:\n";
    for (const auto& prompt : CreateBuiltinPrompts()) {
        std::cout << "  - " << prompt.Name() << ": " << prompt.Description() << "\n";
    }
    std::cout << "\nBuilt-in Resources:\n"
              << "  - config://server: Server configuration\n"
              << "  - status://health: Health status\n"
              << "  - file:///{path}: File access (template)" << std::endl;
    return 0;
}

int runInitConfig() {
    const std::filesystem::path path("tfo-mcp.json");
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::cerr << "Configuration file already exists: " << path.string() << std::endl;
        return 1;
    }
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Cannot create configuration file: " << path.string() << std::endl;
        return 1;
    }
    out << Config::DefaultFileContents();
    if (!out) {
        std::cerr << "Failed writing configuration file: " << path.string() << std::endl;
        return 1;
    }
    std::cout << "Created configuration file: " << path.string() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setUseStderr(true);
    const CliArgs args = parseArgs(argc, argv);

    if (args.help || args.command.empty()) {
        printUsage(std::cout);
        return args.help ? 0 : 1;
    }
    for (const auto& u : args.unknown) {
        std::cerr << "Ignoring unknown argument: " << u << std::endl;
    }

    if (args.command == "serve") {
        return runServe(args);
    } else if (args.command == "validate") {
        return runValidate(args);
    } else if (args.command == "info") {
        return runInfo();
    } else if (args.command == "init-config") {
        return runInitConfig();
    } else if (args.command == "version") {
        std::cout << getVersionBanner() << std::endl;
        return 0;
    }
    std::cerr << "Unknown command: " << args.command << "\n\n";
    printUsage(std::cerr);
    return 1;
}
