#include "proxy/url_service.hpp"
#include <cstdint>

namespace agentpool::proxy {

UrlService::UrlService(const core::AgentPoolConfig& config)
    : external_hostname_(config.external_hostname)
    , external_port_(config.external_port)
    , base_path_(config.proxy_base_path) {
    if (external_hostname_ && external_hostname_->empty()) {
        external_hostname_.reset();
    }
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }
}

std::string UrlService::external_base_url(int agent_port) const {
    if (!external_hostname_) {
        return "http://127.0.0.1:" + std::to_string(agent_port);
    }

    std::string url = "http://" + *external_hostname_;
    if (external_port_ != 80) {
        url += ":" + std::to_string(external_port_);
    }
    return url + base_path_ + "/" + std::to_string(agent_port);
}

std::string UrlService::web_view_url(int agent_port, const std::string& worktree_path,
                                     const std::string& session_id) const {
    return external_base_url(agent_port) + "/" + base64url(worktree_path) +
           "/session/" + session_id;
}

std::string UrlService::base64url(const std::string& input) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i + 2 < input.size()) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8) |
                     static_cast<uint8_t>(input[i + 2]);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
        i += 3;
    }

    size_t rest = input.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
    }
    // No padding
    return out;
}

} // namespace agentpool::proxy
