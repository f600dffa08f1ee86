#include "LocalHttpServer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <sstream>
#include <stdexcept>
#include <uwebsockets/App.h>

namespace scrape_core::testing {

struct LocalHttpServer::PendingReply {
    LocalHttpServer* server = nullptr;
    uWS::HttpResponse<false>* res = nullptr;
    HttpRequest request;
    HttpResponse response;
    us_timer_t* timer = nullptr;
    bool dispatched = false;
    bool finished = false;
};

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string percentDecode(const std::string& value) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '+') {
            out += ' ';
        } else if (value[i] == '%' && i + 2 < value.size()) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += value[i];
        }
    }
    return out;
}

std::string statusLine(int status) {
    switch (status) {
        case 200: return "200 OK";
        case 302: return "302 Found";
        case 303: return "303 See Other";
        case 400: return "400 Bad Request";
        case 404: return "404 Not Found";
        case 408: return "408 Request Timeout";
        case 500: return "500 Internal Server Error";
        case 503: return "503 Service Unavailable";
        default: return std::to_string(status) + " Status";
    }
}

bool hasBody(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? "" : it->second;
}

std::map<std::string, std::string> HttpRequest::formFields() const {
    std::map<std::string, std::string> fields;
    std::stringstream stream(body);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            fields[percentDecode(pair)] = "";
        } else {
            fields[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
        }
    }
    return fields;
}

LocalHttpServer::LocalHttpServer() {
    std::promise<int> listening;
    auto port = listening.get_future();

    loopThread_ = std::thread([this, &listening]() {
        loop_ = uWS::Loop::get();

        uWS::App()
            .any("/*", [this](auto* res, auto* req) {
                onRequest(res, req);
            })
            .listen("127.0.0.1", 0, [this, &listening](auto* token) {
                listenSocket_ = token;
                if (token) {
                    listening.set_value(us_socket_local_port(0, reinterpret_cast<us_socket_t*>(token)));
                } else {
                    LOG_ERROR("Test server failed to listen on 127.0.0.1");
                    listening.set_value(-1);
                }
            })
            .run();
    });

    port_ = port.get();
    if (port_ <= 0) {
        loopThread_.join();
        throw std::runtime_error("Failed to start test server on 127.0.0.1");
    }
    running_ = true;
    LOG_DEBUG("Test server listening on port " + std::to_string(port_));
}

LocalHttpServer::~LocalHttpServer() {
    stop();
}

void LocalHttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[{method, path}] = std::move(handler);
}

std::string LocalHttpServer::baseUrl() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

std::vector<HttpRequest> LocalHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t LocalHttpServer::requestCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(log_.begin(), log_.end(),
                                             [&](const HttpRequest& r) { return r.path == path; }));
}

size_t LocalHttpServer::peakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peakInFlight_;
}

void LocalHttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // The loop runs until its last socket and timer are gone
    loop_->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }
        auto delayed = std::move(delayed_);
        delayed_.clear();
        for (auto& [raw, reply] : delayed) {
            us_timer_close(reply->timer);
            reply->timer = nullptr;
            write(reply);
        }
    });
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
}

void LocalHttpServer::onRequest(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto reply = std::make_shared<PendingReply>();
    reply->server = this;
    reply->res = res;

    HttpRequest& request = reply->request;
    request.method = toUpper(std::string(req->getMethod()));
    request.path = std::string(req->getUrl());
    request.query = std::string(req->getQuery());
    for (auto [name, value] : *req) {
        request.headers[toLower(std::string(name))] = std::string(value);
    }

    res->onAborted([this, reply]() {
        onAborted(reply);
    });

    if (hasBody(request.method)) {
        res->onData([this, reply](std::string_view chunk, bool last) {
            reply->request.body.append(chunk.data(), chunk.size());
            if (last) {
                dispatch(reply);
            }
        });
        return;
    }
    dispatch(reply);
}

void LocalHttpServer::dispatch(const std::shared_ptr<PendingReply>& reply) {
    const HttpRequest& request = reply->request;
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(request);
        inFlight_++;
        peakInFlight_ = std::max(peakInFlight_, inFlight_);
        auto it = routes_.find({request.method, request.path});
        if (it == routes_.end() && request.method == "HEAD") {
            it = routes_.find({"GET", request.path});
        }
        if (it != routes_.end()) {
            handler = it->second;
        }
    }
    reply->dispatched = true;

    if (handler) {
        try {
            reply->response = handler(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Test route " + request.method + " " + request.path + " threw: " + e.what());
            reply->response = HttpResponse{};
            reply->response.status = 500;
            reply->response.body = e.what();
        }
    } else {
        reply->response.status = 404;
        reply->response.body = "<html><body>Not Found</body></html>";
    }

    const auto delay = reply->response.delay;
    if (delay.count() <= 0) {
        write(reply);
        return;
    }

    us_timer_t* timer = us_create_timer(reinterpret_cast<us_loop_t*>(uWS::Loop::get()), 0, sizeof(PendingReply*));
    *static_cast<PendingReply**>(us_timer_ext(timer)) = reply.get();
    reply->timer = timer;
    delayed_[reply.get()] = reply;
    us_timer_set(timer, &LocalHttpServer::onTimer, static_cast<int>(delay.count()), 0);
}

void LocalHttpServer::onTimer(us_timer_t* timer) {
    PendingReply* raw = *static_cast<PendingReply**>(us_timer_ext(timer));
    LocalHttpServer* server = raw->server;
    auto it = server->delayed_.find(raw);
    us_timer_close(timer);
    if (it == server->delayed_.end()) {
        return;
    }
    std::shared_ptr<PendingReply> reply = it->second;
    server->delayed_.erase(it);
    reply->timer = nullptr;
    server->write(reply);
}

void LocalHttpServer::write(const std::shared_ptr<PendingReply>& reply) {
    if (reply->finished) {
        return;
    }
    reply->finished = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_--;
    }

    const HttpResponse& response = reply->response;
    const bool head = reply->request.method == "HEAD";
    const std::string status = statusLine(response.status);
    reply->res->cork([&]() {
        reply->res->writeStatus(status);
        reply->res->writeHeader("Content-Type", response.contentType);
        for (const auto& [name, value] : response.headers) {
            reply->res->writeHeader(name, value);
        }
        reply->res->end(head ? std::string_view() : std::string_view(response.body), true);
    });
}

void LocalHttpServer::onAborted(const std::shared_ptr<PendingReply>& reply) {
    if (reply->finished) {
        return;
    }
    reply->finished = true;
    if (reply->timer) {
        delayed_.erase(reply.get());
        us_timer_close(reply->timer);
        reply->timer = nullptr;
    }
    if (reply->dispatched) {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_--;
    }
    LOG_DEBUG("Test client went away: " + reply->request.method + " " + reply->request.path);
}

void emulateBrowserless(LocalHttpServer& server, std::function<RenderedPage(const nlohmann::json& context)> render) {
    Handler health = [](const HttpRequest&) {
        HttpResponse response;
        response.contentType = "application/json";
        response.body = "{\"ok\":true}";
        return response;
    };
    server.route("GET", "/health", health);
    server.route("HEAD", "/health", health);

    server.route("POST", "/function", [render](const HttpRequest& request) {
        HttpResponse response;
        response.contentType = "application/json";
        nlohmann::json payload = nlohmann::json::parse(request.body, nullptr, false);
        if (payload.is_discarded() || !payload.contains("code") || !payload.contains("context")) {
            response.status = 400;
            response.body = "{\"error\":\"bad payload\"}";
            return response;
        }
        RenderedPage page = render(payload["context"]);
        response.body = nlohmann::json{
            {"html", page.html},
            {"url", page.url},
            {"status", page.status},
            {"cookies", page.cookies}
        }.dump();
        return response;
    });
}

} // namespace scrape_core::testing
