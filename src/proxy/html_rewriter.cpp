#include "proxy/html_rewriter.hpp"
#include <algorithm>
#include <cctype>

namespace agentpool::proxy {

namespace {

// Replaces each match whose path group is root-relative (single leading
// slash); build(match) returns the replacement text.
template <typename Build>
std::string replace_root_relative(const std::string& input, const std::regex& pattern,
                                  size_t path_group, Build build) {
    std::string output;
    output.reserve(input.size());

    auto begin = std::sregex_iterator(input.begin(), input.end(), pattern);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        std::string path = match[path_group].str();
        if (path.size() > 1 && path[1] == '/') {
            continue;
        }
        output.append(input, last, match.position(0) - last);
        output += build(match);
        last = match.position(0) + match.length(0);
    }
    output.append(input, last, std::string::npos);
    return output;
}

} // namespace

HtmlRewriter::HtmlRewriter()
    : src_href_(R"re((src|href)="(/[^"]*))re")
    , css_url_(R"re(url\((['"]?)(/[^)"']*))re")
    , action_(R"re(action="(/[^"]*))re") {}

std::string HtmlRewriter::rewrite(const std::string& html, const std::string& base_path) const {
    std::string result = replace_root_relative(html, src_href_, 2,
        [&base_path](const std::smatch& m) {
            return m[1].str() + "=\"" + base_path + m[2].str();
        });

    result = replace_root_relative(result, css_url_, 2,
        [&base_path](const std::smatch& m) {
            return "url(" + m[1].str() + base_path + m[2].str();
        });

    result = replace_root_relative(result, action_, 1,
        [&base_path](const std::smatch& m) {
            return "action=\"" + base_path + m[1].str();
        });

    return result;
}

bool HtmlRewriter::is_html(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    media.erase(std::remove_if(media.begin(), media.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                media.end());
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return media == "text/html";
}

} // namespace agentpool::proxy
