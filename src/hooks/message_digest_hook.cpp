#include "message_digest_hook.hpp"
#include "../utils/logger.h"

namespace {

constexpr std::size_t kDigestLimit = 2000;
constexpr std::size_t kDigestKeep = 1000;

} // namespace

std::string digest_messages(const nlohmann::json& p_messages) {
    std::string digest;
    for (const auto& message : p_messages) {
        if (!message.is_object()) {
            continue;
        }
        auto role = message.find("role");
        auto content = message.find("content");
        if (role == message.end() || content == message.end() || !role->is_string() || !content->is_string()) {
            continue;
        }
        digest += role->get_ref<const std::string&>();
        digest += ": ";
        digest += content->get_ref<const std::string&>();
        digest += "\n";
    }

    if (digest.size() > kDigestLimit) {
        digest = digest.substr(0, kDigestKeep) + "\n......\n" + digest.substr(digest.size() - kDigestKeep);
    }
    return digest;
}

HookResult apply_message_digest(const std::string& p_body, const HeaderMap& p_headers) {
    HookResult result{p_body, p_headers};

    nlohmann::json payload = nlohmann::json::parse(p_body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return result;
    }
    auto messages = payload.find("messages");
    if (messages == payload.end() || !messages->is_array()) {
        return result;
    }
    for (const auto& message : *messages) {
        if (!message.is_object()) {
            return result;
        }
    }

    LOG_DEBUG("Message digest hook: " << messages->size() << " messages");
    LOG_INFO("Messages in session: " << digest_messages(*messages));
    return result;
}
