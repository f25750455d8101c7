//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: BuiltinTools.cpp
// Purpose: Built-in tool definitions and handlers
//==========================================================================================================

#include <fcntl.h>
#include <fnmatch.h>
#include <poll.h>
#include <signal.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "tfomcp/Builtins.h"

namespace fs = std::filesystem;

namespace tfomcp {

namespace {

ToolInputSchema schemaFrom(const char* json) {
    return ToolInputSchema::FromJSON(parseJSONValue(json));
}

ToolOptions toolOptions(const std::string& category, std::vector<std::string> tags, double timeoutSeconds) {
    ToolOptions o;
    o.category = category;
    o.tags = std::move(tags);
    o.timeoutSeconds = timeoutSeconds;
    return o;
}

// Expands a leading "~" and makes the path absolute.
fs::path resolvePath(const std::string& raw) {
    std::string expanded = raw;
    if (!expanded.empty() && expanded[0] == '~') {
        expanded = GetEnvOrDefault("HOME", "") + expanded.substr(1);
    }
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(expanded), ec);
    if (ec) {
        p = fs::path(expanded);
    }
    return p.lexically_normal();
}

JSONValue entry(const char* key, const std::string& value, bool isDirectory) {
    JSONValue::Object o;
    o[key] = MakeString(value);
    o["type"] = MakeString(isDirectory ? "directory" : "file");
    return JSONValue{o};
}

/////////////////////////////////////////// File tools ///////////////////////////////////////////

ToolResult echoHandler(const JSONValue& args, std::stop_token) {
    return ToolResult::Text("Echo: " + GetStringMember(args, "message").value_or(""));
}

ToolResult readFileHandler(const JSONValue& args, std::stop_token) {
    const std::string path = GetStringMember(args, "path").value_or("");
    if (path.empty()) {
        return ToolResult::Error("Path is required");
    }
    const fs::path filePath = resolvePath(path);
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        return ToolResult::Error("File not found: " + path);
    }
    if (!fs::is_regular_file(filePath, ec)) {
        return ToolResult::Error("Not a file: " + path);
    }
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        if (errno == EACCES) {
            return ToolResult::Error("Permission denied: " + path);
        }
        return ToolResult::Error(std::string("Error reading file: ") + std::strerror(errno));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ToolResult::Text(ss.str());
}

ToolResult writeFileHandler(const JSONValue& args, std::stop_token) {
    const std::string path = GetStringMember(args, "path").value_or("");
    const std::string content = GetStringMember(args, "content").value_or("");
    const bool createDirs = GetBoolMember(args, "create_dirs").value_or(false);
    if (path.empty()) {
        return ToolResult::Error("Path is required");
    }
    const fs::path filePath = resolvePath(path);
    const fs::path parent = filePath.parent_path();
    std::error_code ec;
    if (createDirs) {
        fs::create_directories(parent, ec);
        if (ec) {
            return ToolResult::Error("Error writing file: " + ec.message());
        }
    } else if (!fs::exists(parent, ec)) {
        return ToolResult::Error("Directory does not exist: " + parent.string());
    }
    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (errno == EACCES) {
            return ToolResult::Error("Permission denied: " + path);
        }
        return ToolResult::Error(std::string("Error writing file: ") + std::strerror(errno));
    }
    out << content;
    out.close();
    if (!out) {
        return ToolResult::Error("Error writing file: write failed");
    }
    return ToolResult::Text("Successfully wrote " + std::to_string(content.size()) + " bytes to " + path);
}

ToolResult listDirectoryHandler(const JSONValue& args, std::stop_token stopToken) {
    const std::string path = GetStringMember(args, "path").value_or(".");
    const bool recursive = GetBoolMember(args, "recursive").value_or(false);
    const fs::path dirPath = resolvePath(path);
    std::error_code ec;
    if (!fs::exists(dirPath, ec)) {
        return ToolResult::Error("Directory not found: " + path);
    }
    if (!fs::is_directory(dirPath, ec)) {
        return ToolResult::Error("Not a directory: " + path);
    }

    std::vector<std::pair<std::string, bool>> found;
    try {
        if (recursive) {
            for (const auto& e : fs::recursive_directory_iterator(dirPath)) {
                if (stopToken.stop_requested()) break;
                found.emplace_back(fs::relative(e.path(), dirPath).string(), e.is_directory());
            }
        } else {
            for (const auto& e : fs::directory_iterator(dirPath)) {
                found.emplace_back(e.path().filename().string(), e.is_directory());
            }
        }
    } catch (const fs::filesystem_error& e) {
        if (e.code() == std::errc::permission_denied) {
            return ToolResult::Error("Permission denied: " + path);
        }
        return ToolResult::Error(std::string("Error listing directory: ") + e.what());
    }
    std::sort(found.begin(), found.end());

    JSONValue::Array entries;
    for (const auto& [name, isDir] : found) {
        entries.push_back(std::make_shared<JSONValue>(entry(recursive ? "path" : "name", name, isDir)));
    }
    return ToolResult::Json(JSONValue{entries});
}

//==========================================================================================================
// search_files
// Notes:
//   A pattern without '/' matches entry names at any depth ("*.txt"). A pattern with '/' matches the whole
//   relative path, where '*' also crosses directory separators ("**/*.txt", "src/*.cpp").
//==========================================================================================================
ToolResult searchFilesHandler(const JSONValue& args, std::stop_token stopToken) {
    const std::string path = GetStringMember(args, "path").value_or(".");
    const std::string pattern = GetStringMember(args, "pattern").value_or("*");
    const fs::path dirPath = resolvePath(path);
    std::error_code ec;
    if (!fs::exists(dirPath, ec)) {
        return ToolResult::Error("Directory not found: " + path);
    }
    const bool matchWholePath = pattern.find('/') != std::string::npos;

    std::vector<std::string> matches;
    try {
        for (const auto& e : fs::recursive_directory_iterator(dirPath, fs::directory_options::skip_permission_denied)) {
            if (stopToken.stop_requested()) break;
            const std::string rel = fs::relative(e.path(), dirPath).string();
            const std::string subject = matchWholePath ? rel : e.path().filename().string();
            if (::fnmatch(pattern.c_str(), subject.c_str(), 0) == 0) {
                matches.push_back(rel);
            }
        }
    } catch (const fs::filesystem_error& e) {
        return ToolResult::Error(std::string("Error searching files: ") + e.what());
    }
    std::sort(matches.begin(), matches.end());

    JSONValue::Array items;
    for (const auto& m : matches) {
        items.push_back(MakeString(m));
    }
    JSONValue::Object o;
    o["matches"] = MakeArray(std::move(items));
    o["count"] = MakeInt(static_cast<int64_t>(matches.size()));
    return ToolResult::Json(JSONValue{o});
}

/////////////////////////////////////////// System tools ///////////////////////////////////////////

// Drains both pipes until EOF, the deadline, or a stop request. Returns false on timeout/stop.
bool collectOutput(int outFd, int errFd, std::chrono::steady_clock::time_point deadline, std::stop_token stopToken,
                   std::string& out, std::string& err) {
    struct pollfd pfds[2];
    pfds[0].fd = outFd;
    pfds[0].events = POLLIN;
    pfds[1].fd = errFd;
    pfds[1].events = POLLIN;
    int open = 2;
    char buf[4096];
    while (open > 0) {
        if (stopToken.stop_requested() || std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        int rc = ::poll(pfds, 2, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return true;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || (pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            ssize_t n;
            do { n = ::read(pfds[i].fd, buf, sizeof(buf)); } while (n < 0 && errno == EINTR);
            if (n > 0) {
                (i == 0 ? out : err).append(buf, static_cast<std::size_t>(n));
            } else {
                pfds[i].fd = -1;
                --open;
            }
        }
    }
    return true;
}

ToolResult executeCommandHandler(const JSONValue& args, std::stop_token stopToken) {
    const std::string command = GetStringMember(args, "command").value_or("");
    const auto workingDir = GetStringMember(args, "working_dir");
    const double timeout = GetNumberMember(args, "timeout").value_or(30.0);
    if (command.empty()) {
        return ToolResult::Error("Command is required");
    }
    std::string cwd;
    if (workingDir.has_value() && !workingDir->empty()) {
        std::error_code ec;
        const fs::path dir = resolvePath(workingDir.value());
        if (!fs::is_directory(dir, ec)) {
            return ToolResult::Error("Error executing command: working directory not found: " + workingDir.value());
        }
        cwd = dir.string();
    }

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) == -1) {
        return ToolResult::Error(std::string("Error executing command: ") + std::strerror(errno));
    }
    if (::pipe2(errPipe, O_CLOEXEC) == -1) {
        const int saved = errno;
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return ToolResult::Error(std::string("Error executing command: ") + std::strerror(saved));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        const int saved = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
        return ToolResult::Error(std::string("Error executing command: ") + std::strerror(saved));
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    std::string out;
    std::string err;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                                              std::chrono::duration<double>(timeout));
    const bool completed = collectOutput(outPipe[0], errPipe[0], deadline, stopToken, out, err);
    ::close(outPipe[0]);
    ::close(errPipe[0]);

    int status = 0;
    if (!completed) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        const std::string shown = std::floor(timeout) == timeout ? std::to_string(static_cast<int64_t>(timeout))
                                                                 : FormatSeconds(timeout);
        return ToolResult::Error("Command timed out after " + shown + "s");
    }
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    const int64_t exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);

    JSONValue::Object o;
    o["exit_code"] = MakeInt(exitCode);
    o["stdout"] = MakeString(out);
    o["stderr"] = MakeString(err);
    ToolResult result = ToolResult::Json(JSONValue{o});
    result.isError = exitCode != 0;
    return result;
}

ToolResult systemInfoHandler(const JSONValue&, std::stop_token) {
    struct utsname uts {};
    if (::uname(&uts) != 0) {
        return ToolResult::Error(std::string("Error getting system info: ") + std::strerror(errno));
    }
    std::error_code ec;
    const std::string cwd = fs::current_path(ec).string();
    JSONValue::Object o;
    o["platform"] = MakeString(uts.sysname);
    o["platform_release"] = MakeString(uts.release);
    o["platform_version"] = MakeString(uts.version);
    o["architecture"] = MakeString(uts.machine);
    o["hostname"] = MakeString(uts.nodename);
    o["cwd"] = MakeString(cwd);
    o["user"] = MakeString(GetEnvOptional("USER").value_or(GetEnvOrDefault("USERNAME", "unknown")));
    return ToolResult::Json(JSONValue{o});
}

/////////////////////////////////////////// Chat tool ///////////////////////////////////////////

ToolFunction claudeConversationHandler(std::shared_ptr<IChatService> chat, const ClaudeConfig& claude) {
    const std::string defaultModel = claude.defaultModel;
    return [chat, defaultModel](const JSONValue& args, std::stop_token) -> ToolResult {
        const std::string message = GetStringMember(args, "message").value_or("");
        if (message.empty()) {
            return ToolResult::Error("Message is required");
        }
        ChatRequest req;
        req.messages.push_back(Message::User(message));
        const std::string requested = GetStringMember(args, "model").value_or(defaultModel);
        req.model = Model::IsKnown(requested) ? requested : std::string(Model::Default);
        const std::string systemPrompt = GetStringMember(args, "system_prompt").value_or("");
        if (!systemPrompt.empty()) {
            req.systemPrompt = systemPrompt;
        }
        req.maxTokens = GetIntMember(args, "max_tokens").value_or(4096);
        try {
            Message response = chat->CreateMessage(req);
            return ToolResult::Text(response.Text());
        } catch (const std::exception& e) {
            LOG_WARN("claude_conversation failed: {}", e.what());
            return ToolResult::Error(std::string("Error calling Claude API: ") + e.what());
        }
    };
}

} // namespace

std::vector<Tool> CreateBuiltinTools(const Config& config, std::shared_ptr<IChatService> chatService) {
    const double t = config.mcp.toolTimeout;
    std::vector<Tool> tools;

    tools.push_back(Tool::Create("echo", "Echo back a message - useful for testing", schemaFrom(R"json({
        "type": "object",
        "properties": {"message": {"type": "string", "description": "The message to echo back"}},
        "required": ["message"]})json"),
        MakeToolHandler(echoHandler), toolOptions("utility", {"test", "debug"}, t)));

    tools.push_back(Tool::Create("read_file", "Read the contents of a file", schemaFrom(R"json({
        "type": "object",
        "properties": {
            "path": {"type": "string", "description": "Path to the file to read"},
            "encoding": {"type": "string", "description": "File encoding (default: utf-8)", "default": "utf-8"}},
        "required": ["path"]})json"),
        MakeToolHandler(readFileHandler), toolOptions("file", {"file", "read"}, t)));

    tools.push_back(Tool::Create("write_file", "Write content to a file", schemaFrom(R"json({
        "type": "object",
        "properties": {
            "path": {"type": "string", "description": "Path to the file to write"},
            "content": {"type": "string", "description": "Content to write to the file"},
            "create_dirs": {"type": "boolean", "description": "Create parent directories if they don't exist",
                            "default": false}},
        "required": ["path", "content"]})json"),
        MakeToolHandler(writeFileHandler), toolOptions("file", {"file", "write"}, t)));

    tools.push_back(Tool::Create("list_directory", "List files and directories in a path", schemaFrom(R"json({
        "type": "object",
        "properties": {
            "path": {"type": "string", "description": "Path to the directory to list", "default": "."},
            "recursive": {"type": "boolean", "description": "Recursively list subdirectories", "default": false}},
        "required": ["path"]})json"),
        MakeToolHandler(listDirectoryHandler), toolOptions("file", {"file", "directory", "list"}, t)));

    tools.push_back(Tool::Create("search_files", "Search for files matching a pattern", schemaFrom(R"json({
        "type": "object",
        "properties": {
            "path": {"type": "string", "description": "Base path to search in", "default": "."},
            "pattern": {"type": "string", "description": "Glob pattern to match (e.g., '*.py', '**/*.txt')"}},
        "required": ["path", "pattern"]})json"),
        MakeToolHandler(searchFilesHandler), toolOptions("file", {"file", "search", "glob"}, t)));

    tools.push_back(Tool::Create("execute_command", "Execute a shell command", schemaFrom(R"json({
        "type": "object",
        "properties": {
            "command": {"type": "string", "description": "The shell command to execute"},
            "working_dir": {"type": "string", "description": "Working directory for the command"},
            "timeout": {"type": "integer", "description": "Timeout in seconds (default: 30)", "default": 30}},
        "required": ["command"]})json"),
        MakeToolHandler(executeCommandHandler), toolOptions("system", {"shell", "command", "execute"}, t)));

    tools.push_back(Tool::Create("system_info", "Get system information",
        schemaFrom(R"json({"type": "object", "properties": {}, "required": []})json"),
        MakeToolHandler(systemInfoHandler), toolOptions("system", {"system", "info"}, t)));

    if (chatService) {
        tools.push_back(Tool::Create("claude_conversation", "Have a conversation with Claude AI", schemaFrom(R"json({
            "type": "object",
            "properties": {
                "message": {"type": "string", "description": "The message to send to Claude"},
                "system_prompt": {"type": "string", "description": "Optional system prompt"},
                "model": {"type": "string", "description": "Claude model to use",
                          "default": "claude-sonnet-4-20250514"},
                "max_tokens": {"type": "integer", "description": "Maximum tokens in response", "default": 4096}},
            "required": ["message"]})json"),
            MakeToolHandler(claudeConversationHandler(chatService, config.claude)),
            toolOptions("ai", {"ai", "claude", "conversation"}, 120.0)));
    }
    return tools;
}

void RegisterBuiltins(const std::shared_ptr<Session>& session, ToolInvoker& invoker, const Config& config,
                      const std::shared_ptr<IChatService>& chatService) {
    if (config.mcp.enableTools) {
        for (const auto& tool : CreateBuiltinTools(config, chatService)) {
            invoker.RegisterTool(*session, tool);
        }
    }
    if (config.mcp.enableResources) {
        for (const auto& resource : CreateBuiltinResources(session, config)) {
            session->RegisterResource(resource);
        }
    }
    if (config.mcp.enablePrompts) {
        for (const auto& prompt : CreateBuiltinPrompts()) {
            session->RegisterPrompt(prompt);
        }
    }
    LOG_DEBUG("Built-ins registered for session {}", session->Id().Value());
}

} // namespace tfomcp
