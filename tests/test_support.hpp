#pragma once

#include <forge/http_transport.hpp>
#include <core/poll_clock.hpp>
#include <core/json_util.hpp>
#include <json/json.h>
#include <chrono>
#include <deque>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// JSON fixture text to a value. Malformed fixtures fail loudly.
inline Json::Value json_of(const std::string& text) {
    Json::Value out;
    if (!parse_json(text, out)) throw std::runtime_error("bad JSON fixture: " + text);
    return out;
}

// Scripted HTTP: routes are matched in registration order by method and a
// URL substring. Each route replays its responses in order and then keeps
// repeating the last one. Anything unmatched gets a 404.
class FakeHttp : public HttpTransport {
public:
    void on(const std::string& method, const std::string& url_part,
            std::vector<HttpResponse> responses) {
        routes_.push_back({method, url_part,
                           std::deque<HttpResponse>(responses.begin(), responses.end()), nullptr});
    }

    void on_json(const std::string& method, const std::string& url_part,
                 const Json::Value& body, long status = 200) {
        on(method, url_part, {HttpResponse{status, write_json(body), ""}});
    }

    void on_json(const std::string& method, const std::string& url_part,
                 const std::string& body_text, long status = 200) {
        on_json(method, url_part, json_of(body_text), status);
    }

    void on_json(const std::string& method, const std::string& url_part,
                 const char* body_text, long status = 200) {
        on_json(method, url_part, json_of(body_text), status);
    }

    // Computed response, for bodies that depend on earlier requests.
    void on_call(const std::string& method, const std::string& url_part,
                 std::function<HttpResponse(const HttpRequest&)> handler) {
        routes_.push_back({method, url_part, {}, std::move(handler)});
    }

    // Body of the most recent request matching method and URL part, parsed.
    Json::Value last_body(const std::string& method, const std::string& url_part) const {
        for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
            if (it->method == method && it->url.find(url_part) != std::string::npos) {
                return json_of(it->body);
            }
        }
        return Json::Value();
    }

    HttpResponse perform(const HttpRequest& request) override {
        requests.push_back(request);
        for (auto& route : routes_) {
            if (route.method != request.method) continue;
            if (request.url.find(route.url_part) == std::string::npos) continue;
            if (route.handler) return route.handler(request);
            HttpResponse resp = route.responses.front();
            if (route.responses.size() > 1) route.responses.pop_front();
            return resp;
        }
        return HttpResponse{404, "{\"message\":\"not found\"}", ""};
    }

    int count(const std::string& method, const std::string& url_part) const {
        int n = 0;
        for (const auto& r : requests) {
            if (r.method == method && r.url.find(url_part) != std::string::npos) n++;
        }
        return n;
    }

    std::vector<HttpRequest> requests;

private:
    struct Route {
        std::string method;
        std::string url_part;
        std::deque<HttpResponse> responses;
        std::function<HttpResponse(const HttpRequest&)> handler;
    };
    std::vector<Route> routes_;
};

// Virtual time. sleep() advances the clock instead of blocking.
class FakeClock {
public:
    PollClock clock() {
        return {
            [this] { return now_; },
            [this](std::chrono::milliseconds d) {
                now_ += d;
                slept += d;
                sleeps++;
            },
        };
    }

    void advance(std::chrono::milliseconds d) { now_ += d; }
    std::chrono::steady_clock::time_point now() const { return now_; }

    std::chrono::milliseconds slept{0};
    int sleeps = 0;

private:
    std::chrono::steady_clock::time_point now_{};
};
