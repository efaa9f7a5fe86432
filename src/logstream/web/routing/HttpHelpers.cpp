#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <logstream/web/routing/HttpHelpers.hpp>

#include <charconv>

namespace LS::Web {

void write_json_response(httplib::Response&    res,
                         nlohmann::json const& payload,
                         int                   status,
                         bool                  no_store) {
    res.status = status;
    res.set_content(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "bad_request"},
                                       {"message", message}},
                        400,
                        true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "not_found"},
                                       {"message", message}},
                        404,
                        true);
}

void respond_conflict(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "conflict"},
                                       {"message", message}},
                        409,
                        true);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "internal"},
                                       {"message", message}},
                        500);
}

auto status_for_error(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::NotFound:
        return 404;
    case Error::Code::DuplicateSession:
        return 409;
    case Error::Code::MalformedInput:
        return 400;
    case Error::Code::Timeout:
        return 504;
    case Error::Code::ResourceFault:
    case Error::Code::SamplingFault:
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
        break;
    }
    return 500;
}

void respond_error(httplib::Response& res, Error const& error) {
    auto const message = error.message.value_or(std::string{errorCodeToString(error.code)});
    switch (status_for_error(error)) {
    case 400:
        respond_bad_request(res, message);
        return;
    case 404:
        respond_not_found(res, message);
        return;
    case 409:
        respond_conflict(res, message);
        return;
    default:
        break;
    }
    respond_server_error(res, message);
}

auto read_int_param(httplib::Request const& req,
                    std::string const&      name,
                    std::int64_t            fallback,
                    std::int64_t            min_value,
                    std::int64_t            max_value) -> std::optional<std::int64_t> {
    if (!req.has_param(name)) {
        return fallback;
    }
    auto const   text  = req.get_param_value(name);
    std::int64_t value = 0;
    auto const*  begin = text.data();
    auto const*  end   = text.data() + text.size();
    auto const   parsed = std::from_chars(begin, end, value);
    if (text.empty() || parsed.ec != std::errc{} || parsed.ptr != end) {
        return std::nullopt;
    }
    if (value < min_value || value > max_value) {
        return std::nullopt;
    }
    return value;
}

} // namespace LS::Web
