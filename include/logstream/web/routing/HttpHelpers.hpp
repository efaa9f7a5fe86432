#pragma once

#include <logstream/core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace LS {
class SessionRegistry;
}

namespace LS::Web {

struct LogStreamOptions;

struct HttpRequestContext {
    SessionRegistry&        registry;
    LogStreamOptions const& options;
};

void write_json_response(httplib::Response&    res,
                         nlohmann::json const& payload,
                         int                   status,
                         bool                  no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_conflict(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);

// Maps an Error to the matching status and JSON body.
void respond_error(httplib::Response& res, Error const& error);

[[nodiscard]] auto status_for_error(Error const& error) -> int;

// Integer query parameter. Absent yields the fallback; present but malformed or
// outside [min_value, max_value] yields nullopt.
auto read_int_param(httplib::Request const& req,
                    std::string const&      name,
                    std::int64_t            fallback,
                    std::int64_t            min_value,
                    std::int64_t            max_value) -> std::optional<std::int64_t>;

} // namespace LS::Web
