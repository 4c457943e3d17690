#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <matcher/core.hpp>

#include "streamgate/core/request.hpp"
#include "streamgate/core/response.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/stream/response_writer.hpp"

namespace streamgate {

// ============================================================================
// Handler Types
// ============================================================================

using Handler = std::function<Task<Response>(Request&)>;

// Writes its own status line and body through the writer
using StreamHandler = std::function<Task<void>(Request&, stream::ResponseWriter&)>;

namespace detail {

// "/api/stream/{id}" -> url-matcher regex with one capture group per {param}
std::pair<std::string, std::vector<std::string>> convert_pattern(std::string_view pattern);

} // namespace detail

// ============================================================================
// RouteTable - One DFA matcher over a set of patterns
// ============================================================================

template<typename H>
class RouteTable {
    struct Entry {
        std::string pattern;
        H handler;
        std::vector<std::string> param_names;
    };

    std::vector<Entry> routes_;
    matcher::RegexMatcher<size_t> matcher_;

public:
    struct MatchResult {
        const H* handler = nullptr;
        std::vector<std::string> params;

        explicit operator bool() const noexcept { return handler != nullptr; }
    };

    void add(std::string pattern, H handler) {
        auto [regex, param_names] = detail::convert_pattern(pattern);
        size_t route_id = routes_.size();
        routes_.push_back(Entry{std::move(pattern), std::move(handler), std::move(param_names)});
        matcher_.add_regex(regex, route_id);
    }

    MatchResult match(std::string_view path) {
        MatchResult result;

        auto matches = matcher_.match_with_groups(std::string(path));
        if (matches.empty()) {
            return result;
        }

        // Last match is the most specific
        const auto& match = matches.back();
        if (match.regex_id >= routes_.size()) {
            return result;
        }
        result.handler = &routes_[match.regex_id].handler;

        size_t group_count = 0;
        for (const auto& [group_id, positions] : match.groups) {
            group_count = std::max<size_t>(group_count, group_id + 1);
        }
        result.params.resize(group_count);
        for (const auto& [group_id, positions] : match.groups) {
            if (positions.first <= positions.second && positions.second <= path.size()) {
                result.params[group_id] = std::string(
                    path.substr(positions.first, positions.second - positions.first));
            }
        }
        return result;
    }

    bool empty() const noexcept { return routes_.empty(); }
    size_t size() const noexcept { return routes_.size(); }
};

// ============================================================================
// Router - Per-method handler tables plus the stream table
// ============================================================================

class Router {
    static constexpr size_t method_count = static_cast<size_t>(HttpMethod::UNKNOWN);

    std::array<RouteTable<Handler>, method_count> tables_;
    RouteTable<StreamHandler> stream_table_;

public:
    using MatchResult = RouteTable<Handler>::MatchResult;
    using StreamMatchResult = RouteTable<StreamHandler>::MatchResult;

    void add(HttpMethod method, std::string pattern, Handler handler);

    void get(std::string pattern, Handler handler) {
        add(HttpMethod::GET, std::move(pattern), std::move(handler));
    }

    void post(std::string pattern, Handler handler) {
        add(HttpMethod::POST, std::move(pattern), std::move(handler));
    }

    MatchResult match(HttpMethod method, std::string_view path);

    // Stream routes answer GET and HEAD
    void add_stream(std::string pattern, StreamHandler handler) {
        stream_table_.add(std::move(pattern), std::move(handler));
    }

    StreamMatchResult match_stream(HttpMethod method, std::string_view path);

    // Route with positional parameters converted to Args...
    template<typename... Args, typename F>
        requires std::invocable<F, Args..., Request&>
    void route(HttpMethod method, std::string pattern, F&& handler) {
        add(method, std::move(pattern), make_handler<Args...>(std::forward<F>(handler)));
    }

    template<typename... Args, typename F>
        requires std::invocable<F, Args..., Request&>
    void get(std::string pattern, F&& handler) {
        route<Args...>(HttpMethod::GET, std::move(pattern), std::forward<F>(handler));
    }

private:
    template<typename... Args, typename F>
    static Handler make_handler(F&& f) {
        return [func = std::forward<F>(f)](Request& req) mutable -> Task<Response> {
            return invoke_with_params<Args...>(func, req, std::index_sequence_for<Args...>{});
        };
    }

    template<typename... Args, typename F, size_t... Is>
    static Task<Response> invoke_with_params(F& func, Request& req, std::index_sequence<Is...>) {
        if constexpr (sizeof...(Args) == 0) {
            co_return co_await func(req);
        } else {
            auto params = std::make_tuple(req.param<Args>(Is)...);
            if (!(std::get<Is>(params).has_value() && ...)) {
                co_return Response::error(400, "Invalid route parameters");
            }
            co_return co_await func(*std::get<Is>(params)..., req);
        }
    }
};

} // namespace streamgate
