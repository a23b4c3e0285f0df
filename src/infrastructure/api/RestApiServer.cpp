#include "infrastructure/api/RestApiServer.hpp"

#include "infrastructure/storage/JsonRegistryStorage.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace hostwake::infra {

namespace {

constexpr size_t kMaxBodySize = 64 * 1024;

// Thrown by handlers for malformed request bodies; answered with 400.
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::optional<int64_t> parseId(const std::map<std::string, std::string>& pathParams) {
    auto it = pathParams.find("id");
    if (it == pathParams.end()) {
        return std::nullopt;
    }

    int64_t id = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return id;
}

// A JSON null counts as an empty string; other non-string values are rejected.
std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (j[key].is_null()) {
        return std::string();
    }
    return j[key].get<std::string>();
}

nlohmann::json resultToJson(const ControllerResult& result) {
    auto j = JsonRegistryStorage::hostToJson(*result.host);
    if (!result.message.empty()) {
        j["message"] = result.message;
    }
    return j;
}

void setFailure(ApiResponse& res, const ControllerResult& result) {
    switch (result.status) {
    case RequestStatus::NotFound:
        res.setError(404, "Not found");
        break;
    case RequestStatus::InvalidInput:
        res.setError(400, result.message);
        break;
    case RequestStatus::Failed:
        res.setError(500, result.message);
        break;
    case RequestStatus::Ok:
        break;
    }
}

nlohmann::json parseJsonObject(const std::string& body) {
    auto json = nlohmann::json::parse(body.empty() ? "{}" : body);
    if (!json.is_object()) {
        throw BadRequest("request body must be a JSON object");
    }
    return json;
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setError(int code, const std::string& message) {
    statusCode = code;
    switch (code) {
    case 400:
        statusText = "Bad Request";
        break;
    case 404:
        statusText = "Not Found";
        break;
    case 405:
        statusText = "Method Not Allowed";
        break;
    case 413:
        statusText = "Payload Too Large";
        break;
    case 500:
        statusText = "Internal Server Error";
        break;
    default:
        statusText = "Error";
    }
    nlohmann::json error;
    error["error"] = message;
    error["status"] = code;
    setJson(error);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

RestApiServer::RestApiServer(AsioContext& asioContext, std::shared_ptr<HostController> controller,
                             uint16_t port, std::string bindAddress,
                             std::filesystem::path staticDir)
    : asioContext_(asioContext), controller_(std::move(controller)), port_(port),
      bindAddress_(std::move(bindAddress)), staticDir_(std::move(staticDir)) {
    registerRoutes();
}

RestApiServer::~RestApiServer() {
    stop();
}

void RestApiServer::registerRoutes() {
    routes_.push_back(
        {HttpMethod::GET, "/", [this](auto& req, auto& res) { handleDashboard(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/api/health", [this](auto& req, auto& res) { handleHealth(req, res); }});

    routes_.push_back({HttpMethod::GET, "/api/machines",
                       [this](auto& req, auto& res) { handleGetMachines(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/add",
                       [this](auto& req, auto& res) { handleAddMachine(req, res); }});
    routes_.push_back({HttpMethod::PUT, "/api/update/:id",
                       [this](auto& req, auto& res) { handleUpdateMachine(req, res); }});
    routes_.push_back({HttpMethod::DELETE, "/api/delete/:id",
                       [this](auto& req, auto& res) { handleDeleteMachine(req, res); }});
    routes_.push_back(
        {HttpMethod::POST, "/api/wake", [this](auto& req, auto& res) { handleWake(req, res); }});
}

void RestApiServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bindAddress_), port_);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext());
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        port_ = acceptor_->local_endpoint().port();

        running_ = true;
        startAccept();
        spdlog::info("HTTP server listening on {}:{}", bindAddress_, port_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start HTTP server: {}", e.what());
        acceptor_.reset();
        throw;
    }
}

void RestApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    spdlog::info("HTTP server stopped");
}

void RestApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void RestApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(kMaxBodySize);
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t /*bytesTransferred*/) {
            if (ec) {
                return;
            }

            std::string headerData((std::istreambuf_iterator<char>(&*buffer)),
                                   std::istreambuf_iterator<char>());

            auto headerEnd = headerData.find("\r\n\r\n");
            size_t contentLength = 0;
            auto parsed = parseRequest(headerData.substr(0, headerEnd + 4));
            auto lengthIt = parsed.headers.find("content-length");
            if (lengthIt != parsed.headers.end()) {
                const auto& text = lengthIt->second;
                auto [ptr, parseEc] =
                    std::from_chars(text.data(), text.data() + text.size(), contentLength);
                if (parseEc != std::errc() || contentLength > kMaxBodySize) {
                    ApiResponse response;
                    response.setError(parseEc != std::errc() ? 400 : 413,
                                      "Invalid Content-Length");
                    sendResponse(socket, response);
                    return;
                }
            }

            size_t bodyInBuffer = headerData.size() - headerEnd - 4;
            size_t remaining = contentLength > bodyInBuffer ? contentLength - bodyInBuffer : 0;

            if (remaining > 0) {
                auto bodyBuffer = std::make_shared<std::vector<char>>(remaining);
                asio::async_read(
                    *socket, asio::buffer(*bodyBuffer),
                    [this, self, socket, headerData, bodyBuffer](const asio::error_code& ec2,
                                                                 std::size_t /*bytes*/) {
                        if (!ec2) {
                            processRequest(socket, headerData + std::string(bodyBuffer->begin(),
                                                                            bodyBuffer->end()));
                        }
                    });
                return;
            }

            processRequest(socket, headerData);
        });
}

void RestApiServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket,
                                   const std::string& rawRequest) {
    sendResponse(socket, dispatch(parseRequest(rawRequest)));
}

ApiResponse RestApiServer::dispatch(ApiRequest request) {
    ApiResponse response;
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, PUT, DELETE, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";

    // CORS preflight
    if (request.method == HttpMethod::OPTIONS) {
        response.statusCode = 204;
        response.statusText = "No Content";
        return response;
    }

    spdlog::debug("HTTP request: {} {}", static_cast<int>(request.method), request.path);

    bool pathKnown = false;
    for (auto& route : routes_) {
        if (!matchRoute(route.pattern, request.path, request.pathParams)) {
            continue;
        }
        pathKnown = true;
        if (route.method != request.method) {
            continue;
        }

        try {
            route.handler(request, response);
        } catch (const nlohmann::json::exception& e) {
            response.setError(400, std::string("Invalid JSON: ") + e.what());
        } catch (const BadRequest& e) {
            response.setError(400, e.what());
        } catch (const std::exception& e) {
            spdlog::error("HTTP handler error on {}: {}", request.path, e.what());
            response.setError(500, "Internal server error");
        }
        return response;
    }

    if (pathKnown) {
        response.setError(405, "Method not allowed");
    } else {
        response.setError(404, "Endpoint not found");
    }
    return response;
}

void RestApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                                 const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

ApiRequest RestApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    // Request line
    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);

        // No endpoint takes query parameters.
        request.path = path.substr(0, path.find('?'));
    }

    // Headers
    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::string value = trim(line.substr(colonPos + 1));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[key] = value;
        }
    }

    auto bodyStart = rawRequest.find("\r\n\r\n");
    if (bodyStart != std::string::npos) {
        request.body = rawRequest.substr(bodyStart + 4);
    }

    return request;
}

HttpMethod RestApiServer::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

bool RestApiServer::matchRoute(const std::string& pattern, const std::string& path,
                               std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            return false;
        }
    }

    return true;
}

void RestApiServer::handleDashboard(const ApiRequest& /*req*/, ApiResponse& res) {
    auto pagePath = staticDir_ / "dashboard.html";
    std::ifstream file(pagePath, std::ios::binary);
    if (!file) {
        res.setError(404, "Dashboard page not found");
        return;
    }

    std::ostringstream content;
    content << file.rdbuf();
    res.body = content.str();
    res.headers["Content-Type"] = "text/html; charset=utf-8";
}

void RestApiServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json health;
    health["status"] = "healthy";
    health["timestamp"] =
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();
    health["hosts"] = controller_->listHosts().size();
    res.setJson(health);
}

void RestApiServer::handleGetMachines(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& host : controller_->listHosts()) {
        result.push_back(JsonRegistryStorage::hostToJson(host));
    }
    res.setJson(result);
}

void RestApiServer::handleAddMachine(const ApiRequest& req, ApiResponse& res) {
    auto json = parseJsonObject(req.body);

    core::HostFields fields;
    fields.ipAddress = stringField(json, "ip").value_or("");
    fields.macAddress = stringField(json, "mac").value_or("");
    fields.name = stringField(json, "name").value_or("");
    fields.owner = stringField(json, "user").value_or("");

    auto result = controller_->addHost(std::move(fields));
    if (!result.ok()) {
        setFailure(res, result);
        return;
    }

    res.setJson(resultToJson(result));
}

void RestApiServer::handleUpdateMachine(const ApiRequest& req, ApiResponse& res) {
    auto id = parseId(req.pathParams);
    if (!id) {
        res.setError(400, "Invalid host ID");
        return;
    }

    auto json = parseJsonObject(req.body);

    core::HostUpdate update;
    update.ipAddress = stringField(json, "ip");
    update.macAddress = stringField(json, "mac");
    update.name = stringField(json, "name");
    update.owner = stringField(json, "user");

    auto result = controller_->updateHost(*id, std::move(update));
    if (!result.ok()) {
        setFailure(res, result);
        return;
    }

    res.setJson(resultToJson(result));
}

void RestApiServer::handleDeleteMachine(const ApiRequest& req, ApiResponse& res) {
    auto id = parseId(req.pathParams);
    if (!id) {
        res.setError(400, "Invalid host ID");
        return;
    }

    auto result = controller_->deleteHost(*id);
    if (!result.ok()) {
        setFailure(res, result);
        return;
    }

    nlohmann::json response;
    response["success"] = true;
    res.setJson(response);
}

void RestApiServer::handleWake(const ApiRequest& req, ApiResponse& res) {
    auto json = parseJsonObject(req.body);
    auto mac = stringField(json, "mac").value_or("");

    auto result = controller_->wake(mac);
    if (!result.ok()) {
        setFailure(res, result);
        return;
    }

    nlohmann::json response;
    response["message"] = result.message;
    res.setJson(response);
}

} // namespace hostwake::infra
