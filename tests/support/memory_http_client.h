/**
 * @file memory_http_client.h
 * @brief http_client_interface answering from an in-memory URL map
 */

#ifndef KCENON_OBJECT_TRANSFER_TEST_MEMORY_HTTP_CLIENT_H
#define KCENON_OBJECT_TRANSFER_TEST_MEMORY_HTTP_CLIENT_H

#include <kcenon/object_transfer/cloud/http_client.h>

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

/**
 * @brief Serves bodies by URL and records every request
 *
 * GET and HEAD on an unknown URL answer 404. PUT stores the body. Statuses
 * queued with push_status() are returned (without touching the map) by the
 * next requests in order.
 */
class memory_http_client : public http_client_interface {
public:
    struct request_record {
        std::string method;
        std::string url;
        http_headers headers;
        std::size_t body_size = 0;
    };

    void set_object(const std::string& url, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[url] = std::vector<uint8_t>(content.begin(), content.end());
    }

    [[nodiscard]] auto object(const std::string& url) const -> std::optional<std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(url);
        if (it == objects_.end()) {
            return std::nullopt;
        }
        return std::string(it->second.begin(), it->second.end());
    }

    void push_status(int status_code) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(status_code);
    }

    /// Fail the next N requests as if the connection dropped
    void fail_connections(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_failures_ = count;
    }

    [[nodiscard]] auto requests() const -> std::vector<request_record> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& /*query*/,
                           const http_headers& headers) -> result<http_response> override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({"GET", url, headers, 0});
        if (auto early = take_queued()) {
            return *early;
        }
        auto it = objects_.find(url);
        if (it == objects_.end()) {
            return status_only(404);
        }
        http_response response;
        response.status_code = 200;
        response.body = it->second;
        response.headers["Content-Length"] = std::to_string(it->second.size());
        return response;
    }

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const http_headers& headers) -> result<http_response> override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({"PUT", url, headers, body.size()});
        if (auto early = take_queued()) {
            return *early;
        }
        objects_[url] = body;
        http_response response;
        response.status_code = 200;
        response.headers["ETag"] = "\"memory\"";
        return response;
    }

    [[nodiscard]] auto head(const std::string& url,
                            const http_headers& headers) -> result<http_response> override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({"HEAD", url, headers, 0});
        if (auto early = take_queued()) {
            return *early;
        }
        auto it = objects_.find(url);
        if (it == objects_.end()) {
            return status_only(404);
        }
        auto response = status_only(200);
        response.headers["Content-Length"] = std::to_string(it->second.size());
        return response;
    }

private:
    static auto status_only(int status_code) -> http_response {
        http_response response;
        response.status_code = status_code;
        return response;
    }

    auto take_queued() -> std::optional<result<http_response>> {
        if (connection_failures_ > 0) {
            --connection_failures_;
            return result<http_response>{
                unexpected{error{error_code::connection_failed, "connection reset by peer"}}};
        }
        if (queued_.empty()) {
            return std::nullopt;
        }
        auto status = queued_.front();
        queued_.pop_front();
        return result<http_response>{status_only(status)};
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> objects_;
    std::deque<int> queued_;
    int connection_failures_ = 0;
    std::vector<request_record> requests_;
};

}  // namespace kcenon::object_transfer::test

#endif  // KCENON_OBJECT_TRANSFER_TEST_MEMORY_HTTP_CLIENT_H
