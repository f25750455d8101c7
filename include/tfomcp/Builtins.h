//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Builtins.h
// Purpose: Built-in tools, resources and prompts registered on every new session
//==========================================================================================================

#pragma once

#include <memory>
#include <vector>

#include "tfomcp/ChatService.h"
#include "tfomcp/Config.h"
#include "tfomcp/Prompt.h"
#include "tfomcp/Resource.h"
#include "tfomcp/Session.h"
#include "tfomcp/Tool.h"
#include "tfomcp/ToolInvoker.h"

namespace tfomcp {

//==========================================================================================================
// CreateBuiltinTools
// Purpose: echo, read_file, write_file, list_directory, search_files, execute_command, system_info and,
//          when chatService is set, claude_conversation.
// Args:
//   config: mcp.tool_timeout becomes the timeout of the local tools.
//   chatService: Upstream chat client; may be nullptr.
//==========================================================================================================
std::vector<Tool> CreateBuiltinTools(const Config& config, std::shared_ptr<IChatService> chatService = nullptr);

//==========================================================================================================
// CreateBuiltinResources
// Purpose: config://server, status://health and the file:///{path} template.
// Notes:
//   The health reader observes the session through a weak reference.
//==========================================================================================================
std::vector<Resource> CreateBuiltinResources(const std::weak_ptr<Session>& session, const Config& config);

// code_review, explain_code, debug_help
std::vector<Prompt> CreateBuiltinPrompts();

//==========================================================================================================
// RegisterBuiltins
// Purpose: Registers each built-in family whose mcp.enable_* flag is set.
//==========================================================================================================
void RegisterBuiltins(const std::shared_ptr<Session>& session, ToolInvoker& invoker, const Config& config,
                      const std::shared_ptr<IChatService>& chatService);

} // namespace tfomcp
