#pragma once

#include "models/attendance_record.h"
#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>
#include <vector>

using namespace drogon;

class AttendanceService;

/**
 * @brief Attendance ledger handler
 *
 * Endpoints:
 * - POST /v1/attendance/mark - Automatic check-in (once per identity per day)
 * - POST /v1/attendance/manual - Manual entry, never deduplicated
 * - GET /v1/attendance/today - Today's records
 * - GET /v1/attendance/history/{label}?days=N - One identity's records
 * - GET /v1/attendance/report?start=&end= - Records in a date range
 * - GET /v1/attendance/statistics?start=&end= - Aggregates over a range
 * - GET /v1/attendance/export?start=&end= - Range as CSV
 * - GET /v1/attendance/session - Session counters
 * - POST /v1/attendance/backup - Copy gallery and ledger under the backup root
 *
 * start and end default to today when omitted.
 */
class AttendanceHandler : public drogon::HttpController<AttendanceHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(AttendanceHandler::markAttendance, "/v1/attendance/mark", Post);
        ADD_METHOD_TO(AttendanceHandler::manualAttendance, "/v1/attendance/manual", Post);
        ADD_METHOD_TO(AttendanceHandler::getToday, "/v1/attendance/today", Get);
        ADD_METHOD_TO(AttendanceHandler::getHistory, "/v1/attendance/history/{label}", Get);
        ADD_METHOD_TO(AttendanceHandler::getReport, "/v1/attendance/report", Get);
        ADD_METHOD_TO(AttendanceHandler::getStatistics, "/v1/attendance/statistics", Get);
        ADD_METHOD_TO(AttendanceHandler::exportCsv, "/v1/attendance/export", Get);
        ADD_METHOD_TO(AttendanceHandler::getSession, "/v1/attendance/session", Get);
        ADD_METHOD_TO(AttendanceHandler::backup, "/v1/attendance/backup", Post);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/mark", Options);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/manual", Options);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/backup", Options);
    METHOD_LIST_END

    /**
     * @brief Handle POST /v1/attendance/mark
     * Body: {"label": "Alice", "timestamp": "2024-01-01T09:00:00"}
     * A repeated mark on the same day answers 200 with status
     * "already_marked" and the first check-in time.
     */
    void markAttendance(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/attendance/manual
     * Body: {"label", "date": "YYYY-MM-DD", "time": "HH:MM[:SS]", "status"}
     */
    void manualAttendance(const HttpRequestPtr &req,
                          std::function<void(const HttpResponsePtr &)> &&callback);

    void getToday(const HttpRequestPtr &req,
                  std::function<void(const HttpResponsePtr &)> &&callback);

    void getHistory(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

    void getReport(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    void getStatistics(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/attendance/export
     * Responds with text/csv
     */
    void exportCsv(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    void getSession(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/attendance/backup
     * Body (optional): {"name": "nightly"}, created under the backup root
     */
    void backup(const HttpRequestPtr &req,
                std::function<void(const HttpResponsePtr &)> &&callback);

    void handleOptions(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set attendance service (dependency injection)
     */
    static void setAttendanceService(AttendanceService *service);

private:
    static AttendanceService *service_;

    static Json::Value recordsToJson(const std::vector<AttendanceRecord> &records);

    /**
     * @brief Read start/end query parameters
     * @return false with error set when either is malformed
     */
    static bool parseRange(const HttpRequestPtr &req, CalendarDate &start,
                           CalendarDate &end, std::string &error);
};
