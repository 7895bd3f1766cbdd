#pragma once
#ifndef API_H
#define API_H

#include "file_cache.h"
#include <httplib.h>
#include <memory>
#include <optional>
#include <string>

/**
 * REST API wrapper around FileCache
 *
 *   POST   /cache        store body under a generated key
 *   PUT    /cache/<key>  store body under <key>
 *   GET    /cache/<key>  fetch raw bytes
 *   DELETE /cache/<key>  remove one entry
 *   DELETE /cache        clear
 *   GET    /metrics      Prometheus text format
 *   GET    /healthz      liveness
 */
class CacheAPI {
public:
    /**
     * Constructor
     * @param cache Shared pointer to FileCache instance
     */
    explicit CacheAPI(std::shared_ptr<FileCache> cache);

    /**
     * Start the HTTP server. Blocks until stop() is called.
     * @param host Host to bind (default: "0.0.0.0")
     * @param port Port to bind
     * @throws std::runtime_error if the port cannot be bound
     */
    void start(const std::string& host, int port);

    /**
     * Stop a running server; start() returns afterwards.
     */
    void stop();

private:
    /**
     * Log an incoming request with method, path, and status code
     */
    void logRequest(const std::string& method, const std::string& path, int status);

    /// Shared body of POST /cache and PUT /cache/<key>
    void store(const std::optional<std::string>& key, const std::string& body, httplib::Response& res);

    std::shared_ptr<FileCache> cache_;
    httplib::Server server_;
};

#endif // API_H
