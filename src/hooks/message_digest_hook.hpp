#pragma once

#include "hook_types.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Always-on request pre-hook. When the body is a chat payload with a
// "messages" array it logs a "role: content" digest of the conversation. The
// body and headers are always passed through untouched.
HookResult apply_message_digest(const std::string& p_body, const HeaderMap& p_headers);

// Builds the digest for an array of message objects. Transcripts longer than
// 2000 characters keep their first and last 1000 characters.
std::string digest_messages(const nlohmann::json& p_messages);
