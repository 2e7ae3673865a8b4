#ifndef VERTOPAL_TEST_SCRIPTED_BACKEND_HPP
#define VERTOPAL_TEST_SCRIPTED_BACKEND_HPP

#include <vertopal/http/client/http_backend.hpp>
#include <vertopal/http/common/http_request.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vertopal::test {

// canned answer returned by scripted_backend
struct scripted_reply {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::string error;              // network error reported after body bytes were delivered
    size_t piece_size = 0;          // deliver the body in pieces of this size, 0 = at once

    static scripted_reply json(const nlohmann::json& document, int status = 200) {
        return scripted_reply{status, "application/json", document.dump(), {}, 0};
    }

    static scripted_reply binary(std::string body, size_t piece_size = 0) {
        return scripted_reply{200, "application/octet-stream", std::move(body), {}, piece_size};
    }

    static scripted_reply network_error(std::string error) {
        return scripted_reply{0, {}, {}, std::move(error), 0};
    }
};

// request seen by scripted_backend
struct recorded_request {
    http::method method;
    std::string url;
    std::string resource;
    std::string body;
    std::string content_type;
    std::string authorization;
    std::string user_agent;
    std::chrono::milliseconds timeout;
};

/**
 * http_backend returning scripted replies. Replies queued for a resource
 * ("/v1/upload/file") are used first, then the shared queue. An exhausted
 * script answers with a network error.
 */
class scripted_backend : public http::http_backend {
public:
    void push(scripted_reply reply) { replies_.push_back(std::move(reply)); }
    void push(const std::string& resource, scripted_reply reply) { routes_[resource].push_back(std::move(reply)); }

    const std::vector<recorded_request>& requests() const { return requests_; }

    size_t count(const std::string& resource) const {
        size_t total = 0;
        for (const auto& request : requests_) {
            if (request.resource == resource) ++total;
        }
        return total;
    }

    http::stream_result send_streaming(std::shared_ptr<http::http_request> request,
                                       http::stream_callback callback,
                                       std::chrono::milliseconds timeout) override {
        requests_.push_back(recorded_request{
            request->get_method(),
            request->get_url(),
            request->get_resource(),
            request->get_body(),
            request->get_header("Content-Type"),
            request->get_header("Authorization"),
            request->get_header("User-Agent"),
            timeout
        });

        scripted_reply reply = next(request->get_resource());

        http::stream_result result;
        result.status_code = reply.status;
        result.content_type = reply.content_type;
        if (!reply.content_type.empty()) {
            result.headers["Content-Type"] = reply.content_type;
        }

        std::string_view remaining(reply.body);
        size_t piece = reply.piece_size ? reply.piece_size : remaining.size();
        while (!remaining.empty()) {
            auto data = remaining.substr(0, piece);
            remaining.remove_prefix(data.size());
            result.bytes_transferred += data.size();
            http::stream_info info{data, result.bytes_transferred, reply.body.size(),
                                   reply.status, result.content_type};
            if (!callback(info)) {
                result.aborted = true;
                result.error = "aborted by stream callback";
                return result;
            }
        }

        if (!reply.error.empty()) {
            result.error = reply.error;
        }
        return result;
    }

private:
    scripted_reply next(const std::string& resource) {
        auto route = routes_.find(resource);
        if (route != routes_.end() && !route->second.empty()) {
            auto reply = std::move(route->second.front());
            route->second.pop_front();
            return reply;
        }
        if (!replies_.empty()) {
            auto reply = std::move(replies_.front());
            replies_.pop_front();
            return reply;
        }
        return scripted_reply::network_error("no scripted reply for " + resource);
    }

    std::deque<scripted_reply> replies_;
    std::map<std::string, std::deque<scripted_reply>> routes_;
    std::vector<recorded_request> requests_;
};

// value of a text part in a multipart body
inline std::string form_field(const std::string& body, const std::string& name) {
    auto marker = "name=\"" + name + "\"\r\n\r\n";
    auto start = body.find(marker);
    if (start == std::string::npos) return {};
    start += marker.size();
    auto end = body.find("\r\n--", start);
    return body.substr(start, end - start);
}

// content of a file part in a multipart body
inline std::string form_file(const std::string& body, const std::string& name) {
    auto marker = "name=\"" + name + "\"; filename=";
    auto start = body.find(marker);
    if (start == std::string::npos) return {};
    start = body.find("\r\n\r\n", start);
    if (start == std::string::npos) return {};
    start += 4;
    auto end = body.find("\r\n--", start);
    return body.substr(start, end - start);
}

}

#endif
