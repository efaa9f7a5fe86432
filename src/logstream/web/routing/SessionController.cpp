#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <logstream/web/routing/SessionController.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/session/LogLevel.hpp>
#include <logstream/session/SessionRegistry.hpp>
#include <logstream/util/TimeUtils.hpp>
#include <logstream/web/LogStreamOptions.hpp>
#include <logstream/web/routing/HttpHelpers.hpp>

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace LS::Web {

namespace {

using json = nlohmann::json;

constexpr char const* kSessionPattern = R"(/api/sessions/([A-Za-z0-9_\-]+))";

auto session_path(char const* suffix) -> std::string {
    return std::string{kSessionPattern} + suffix;
}

auto matched_session(httplib::Request const& req, httplib::Response& res) -> std::optional<std::string> {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid route");
        return std::nullopt;
    }
    return req.matches[1].str();
}

auto snapshot_to_json(SessionSnapshot const& snapshot) -> json {
    return json{{"session_id", snapshot.id},
                {"created_at", format_timestamp(snapshot.metadata.created_at)},
                {"last_activity", format_timestamp(snapshot.metadata.last_activity)},
                {"monitoring", snapshot.metadata.monitoring}};
}

} // namespace

auto SessionController::Create(HttpRequestContext& ctx) -> std::unique_ptr<SessionController> {
    return std::unique_ptr<SessionController>(new SessionController(ctx));
}

SessionController::SessionController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

void SessionController::register_routes(httplib::Server& server) {
    server.Post("/api/sessions", [this](httplib::Request const& req, httplib::Response& res) {
        handle_create(req, res);
    });
    server.Get("/api/sessions", [this](httplib::Request const& req, httplib::Response& res) {
        handle_list(req, res);
    });
    server.Delete(kSessionPattern, [this](httplib::Request const& req, httplib::Response& res) {
        handle_delete(req, res);
    });
    server.Post(session_path("/start-monitoring"), [this](httplib::Request const& req, httplib::Response& res) {
        handle_start_monitoring(req, res);
    });
    server.Post(session_path("/stop-monitoring"), [this](httplib::Request const& req, httplib::Response& res) {
        handle_stop_monitoring(req, res);
    });
    server.Post(session_path("/logs"), [this](httplib::Request const& req, httplib::Response& res) {
        handle_add_log(req, res);
    });
    server.Post("/api/clear-logs", [this](httplib::Request const& req, httplib::Response& res) {
        handle_clear_logs(req, res);
    });
}

void SessionController::handle_create(httplib::Request const&, httplib::Response& res) {
    auto created = ctx_.registry.create_session();
    if (!created) {
        ls_log("Failed to create session: " + describeError(created.error()), "SessionController", "ERROR");
        respond_error(res, created.error());
        return;
    }
    write_json_response(res, json{{"session_id", *created}}, 200, true);
}

void SessionController::handle_list(httplib::Request const&, httplib::Response& res) {
    auto sessions = json::array();
    for (auto const& snapshot : ctx_.registry.snapshot_sessions()) {
        sessions.push_back(snapshot_to_json(snapshot));
    }
    write_json_response(res, json{{"sessions", std::move(sessions)}}, 200, true);
}

void SessionController::handle_delete(httplib::Request const& req, httplib::Response& res) {
    auto session_id = matched_session(req, res);
    if (!session_id) {
        return;
    }
    if (!ctx_.registry.unregister_session(*session_id)) {
        respond_not_found(res, "Session not found");
        return;
    }
    write_json_response(res, json{{"message", "Session " + *session_id + " deleted"}}, 200, true);
}

void SessionController::handle_start_monitoring(httplib::Request const& req, httplib::Response& res) {
    auto session_id = matched_session(req, res);
    if (!session_id) {
        return;
    }
    auto interval = read_int_param(req,
                                   "interval",
                                   ctx_.options.default_monitor_interval_seconds,
                                   kMinMonitorIntervalSeconds,
                                   kMaxMonitorIntervalSeconds);
    if (!interval) {
        respond_bad_request(res,
                            "interval must be an integer between " + std::to_string(kMinMonitorIntervalSeconds)
                                + " and " + std::to_string(kMaxMonitorIntervalSeconds));
        return;
    }
    auto started = ctx_.registry.start_monitoring(*session_id, std::chrono::seconds{*interval});
    if (!started) {
        if (started.error().code == Error::Code::NotFound) {
            respond_not_found(res, "Session not found");
        } else {
            respond_error(res, started.error());
        }
        return;
    }
    write_json_response(res,
                        json{{"message", "Started monitoring for session " + *session_id},
                             {"interval", *interval}},
                        200,
                        true);
}

void SessionController::handle_stop_monitoring(httplib::Request const& req, httplib::Response& res) {
    auto session_id = matched_session(req, res);
    if (!session_id) {
        return;
    }
    if (!ctx_.registry.contains(*session_id)) {
        respond_not_found(res, "Session not found");
        return;
    }
    if (ctx_.registry.stop_monitor(*session_id)) {
        write_json_response(res, json{{"message", "Stopped monitoring for session " + *session_id}}, 200, true);
        return;
    }
    write_json_response(res, json{{"message", "Monitoring was not active for session " + *session_id}}, 200, true);
}

void SessionController::handle_add_log(httplib::Request const& req, httplib::Response& res) {
    auto session_id = matched_session(req, res);
    if (!session_id) {
        return;
    }
    if (!req.has_param("message")) {
        respond_bad_request(res, "message is required");
        return;
    }
    auto const message = req.get_param_value("message");
    auto const level   = parse_log_level(req.has_param("level") ? req.get_param_value("level") : std::string{"INFO"});
    auto       appended = ctx_.registry.append_log(*session_id, level, message);
    if (!appended) {
        if (appended.error().code == Error::Code::NotFound) {
            respond_not_found(res, "Session not found");
        } else {
            respond_error(res, appended.error());
        }
        return;
    }
    write_json_response(res,
                        json{{"message", "Log added to session " + *session_id},
                             {"level", std::string{to_string(level)}}},
                        200,
                        true);
}

void SessionController::handle_clear_logs(httplib::Request const&, httplib::Response& res) {
    auto report = ctx_.registry.shutdown_all();
    write_json_response(res,
                        json{{"message", "All logs cleared"},
                             {"monitors_stopped", report.monitors_stopped},
                             {"sessions_cleared", report.sessions_cleared},
                             {"logs_deleted", report.logs_deleted}},
                        200,
                        true);
}

} // namespace LS::Web
