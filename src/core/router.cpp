#include "streamgate/core/router.hpp"

namespace streamgate {

namespace detail {

std::pair<std::string, std::vector<std::string>> convert_pattern(std::string_view pattern) {
    // url-matcher has no [^/] negation; a segment is a run of URL-safe characters
    static constexpr std::string_view segment_class = "A-Za-z0-9_.%\\-";

    std::vector<std::string> param_names;
    std::string regex;
    regex.reserve(pattern.size() * 2);

    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];

        if (c == '{') {
            size_t end = pattern.find('}', i);
            if (end == std::string_view::npos) {
                regex += "\\{";
                continue;
            }
            param_names.emplace_back(pattern.substr(i + 1, end - i - 1));
            regex += "([";
            regex += segment_class;
            regex += "]+)";
            i = end;
        } else if (c == '*') {
            regex += "([";
            regex += segment_class;
            regex += "]*)";
        } else if (c == '/' || c == '.' || c == '+' || c == '?' || c == '(' || c == ')' ||
                   c == '[' || c == ']' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return {std::move(regex), std::move(param_names)};
}

} // namespace detail

void Router::add(HttpMethod method, std::string pattern, Handler handler) {
    if (method == HttpMethod::UNKNOWN) {
        return;
    }
    tables_[static_cast<size_t>(method)].add(std::move(pattern), std::move(handler));
}

Router::MatchResult Router::match(HttpMethod method, std::string_view path) {
    if (method == HttpMethod::UNKNOWN) {
        return {};
    }
    return tables_[static_cast<size_t>(method)].match(path);
}

Router::StreamMatchResult Router::match_stream(HttpMethod method, std::string_view path) {
    if ((method != HttpMethod::GET && method != HttpMethod::HEAD) || stream_table_.empty()) {
        return {};
    }
    return stream_table_.match(path);
}

} // namespace streamgate
