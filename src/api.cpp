#include "api.h"
#include "log_utils.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

CacheAPI::CacheAPI(std::shared_ptr<FileCache> cache)
    : cache_(std::move(cache)) {}

void CacheAPI::logRequest(const std::string& method, const std::string& path, int status) {
    log_line("CacheAPI", method + " " + path + " -> " + std::to_string(status));
}

static void set_error(httplib::Response& res, int status, const std::string& message) {
    json j = {{"error", message}};
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

static std::string make_prometheus_metrics(const FileCache &cache) {
    std::ostringstream ss;
    ss << "# HELP cache_hits_total Total number of cache hits\n";
    ss << "# TYPE cache_hits_total counter\n";
    ss << "cache_hits_total " << cache.hits() << "\n\n";

    ss << "# HELP cache_misses_total Total number of cache misses\n";
    ss << "# TYPE cache_misses_total counter\n";
    ss << "cache_misses_total " << cache.misses() << "\n\n";

    ss << "# HELP cache_evictions_total Entries evicted to make room\n";
    ss << "# TYPE cache_evictions_total counter\n";
    ss << "cache_evictions_total " << cache.evictions() << "\n\n";

    ss << "# HELP cache_size Number of items currently stored in cache\n";
    ss << "# TYPE cache_size gauge\n";
    ss << "cache_size " << cache.len() << "\n\n";

    ss << "# HELP cache_used Capacity units charged by stored items\n";
    ss << "# TYPE cache_used gauge\n";
    ss << "cache_used{mode=\"" << to_string(cache.capacity_mode()) << "\"} " << cache.used() << "\n\n";

    ss << "# HELP cache_capacity Configured cache capacity\n";
    ss << "# TYPE cache_capacity gauge\n";
    ss << "cache_capacity{mode=\"" << to_string(cache.capacity_mode()) << "\"} " << cache.capacity() << "\n";

    return ss.str();
}

void CacheAPI::store(const std::optional<std::string>& key, const std::string& body, httplib::Response& res) {
    try {
        std::string used = cache_->put(key, body);
        json j = {{"key", used}};
        res.set_content(j.dump(), "application/json");
        res.status = 201;
    } catch (const KeyCollision& e) {
        set_error(res, 409, e.what());
    } catch (const InvalidKey& e) {
        set_error(res, 400, e.what());
    } catch (const CapacityExceeded& e) {
        set_error(res, 413, e.what());
    } catch (const StorageFailure& e) {
        set_error(res, 500, e.what());
    }
}

void CacheAPI::start(const std::string& host, int port) {
    // POST /cache
    server_.Post("/cache", [this](const httplib::Request& req, httplib::Response& res) {
        store(std::nullopt, req.body, res);
        logRequest("POST", req.path, res.status);
    });

    // PUT /cache/<key>
    server_.Put(R"(/cache/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        store(std::string(req.matches[1]), req.body, res);
        logRequest("PUT", req.path, res.status);
    });

    // GET /cache/<key>
    server_.Get(R"(/cache/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            std::string value = cache_->get(key);
            res.set_content(value, "application/octet-stream");
            res.status = 200;
        } catch (const KeyNotFound&) {
            set_error(res, 404, "not found");
        } catch (const StorageFailure& e) {
            set_error(res, 500, e.what());
        }
        logRequest("GET", req.path, res.status);
    });

    // DELETE /cache/<key>
    server_.Delete(R"(/cache/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            cache_->remove(key);
            res.set_content(R"({"status": "deleted"})", "application/json");
            res.status = 200;
        } catch (const KeyNotFound&) {
            set_error(res, 404, "not found");
        } catch (const StorageFailure& e) {
            set_error(res, 500, e.what());
        }
        logRequest("DELETE", req.path, res.status);
    });

    // DELETE /cache
    server_.Delete("/cache", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            cache_->clear();
            res.set_content(R"({"status": "cleared"})", "application/json");
            res.status = 200;
        } catch (const PartialFailure& e) {
            json j = {{"error", e.what()}, {"survivors", e.survivors()}};
            res.set_content(j.dump(), "application/json");
            res.status = 500;
        }
        logRequest("DELETE", req.path, res.status);
    });

    // GET /metrics
    server_.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = make_prometheus_metrics(*cache_);
        res.set_content(body, "text/plain; version=0.0.4; charset=utf-8");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    server_.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    log_line("CacheAPI", "Starting REST API on " + host + ":" + std::to_string(port));

    if (!server_.bind_to_port(host.c_str(), port)) {
        throw std::runtime_error("Failed to bind server to port");
    }

    server_.listen_after_bind();
}

void CacheAPI::stop() {
    server_.stop();
}
