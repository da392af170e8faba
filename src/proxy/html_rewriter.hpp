#pragma once
#include <regex>
#include <string>

namespace agentpool::proxy {

// Prefixes root-relative references in HTML (src/href/action attributes and
// CSS url()) with the route's external base path. Protocol-relative "//"
// references are left alone.
class HtmlRewriter {
public:
    HtmlRewriter();

    std::string rewrite(const std::string& html, const std::string& base_path) const;

    static bool is_html(const std::string& content_type);

private:
    std::regex src_href_;
    std::regex css_url_;
    std::regex action_;
};

} // namespace agentpool::proxy
