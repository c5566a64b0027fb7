#pragma once

#include <drogon/HttpResponse.h>

/**
 * @brief CORS Helper
 *
 * Adds "allow all" CORS headers to responses. Controlled by
 * system.web_server.cors.enabled; when disabled the helpers leave responses
 * untouched.
 */
namespace CorsHelper {
    /**
     * @brief Enable or disable CORS headers process-wide
     */
    void setEnabled(bool enabled);

    bool isEnabled();

    /**
     * @brief Add CORS headers with "allow all" to response
     *
     * @param resp HTTP response to add headers to
     */
    void addAllowAllHeaders(const drogon::HttpResponsePtr& resp);

    /**
     * @brief Create OPTIONS preflight response with "allow all"
     *
     * @return HTTP response with CORS headers for OPTIONS preflight
     */
    drogon::HttpResponsePtr createOptionsResponse();
}
