#include "core/cors_helper.h"
#include <atomic>
#include <drogon/HttpResponse.h>

namespace CorsHelper {
    namespace {
        std::atomic<bool> g_cors_enabled{true};
    }

    void setEnabled(bool enabled) {
        g_cors_enabled = enabled;
    }

    bool isEnabled() {
        return g_cors_enabled.load();
    }

    void addAllowAllHeaders(const drogon::HttpResponsePtr& resp) {
        if (!g_cors_enabled.load()) {
            return;
        }
        resp->addHeader("Access-Control-Allow-Origin", "*");
        resp->addHeader("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        resp->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
        resp->addHeader("Access-Control-Max-Age", "3600");
    }

    drogon::HttpResponsePtr createOptionsResponse() {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k200OK);
        addAllowAllHeaders(resp);
        return resp;
    }
}
