#pragma once

#include "infrastructure/api/HostController.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hostwake::infra {

/**
 * @brief HTTP method enumeration.
 */
enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};         ///< HTTP method of the request.
    std::string path;                               ///< Request path.
    std::string body;                               ///< Request body content.
    std::map<std::string, std::string> headers;     ///< HTTP headers (lowercase keys).
    std::map<std::string, std::string> pathParams;  ///< Path parameters from route matching.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};                            ///< HTTP status code.
    std::string statusText{"OK"};                   ///< HTTP status text.
    std::string body;                               ///< Response body content.
    std::map<std::string, std::string> headers;     ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     * @param json JSON value to serialize as body.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets an error response with body {"error": message, "status": code}.
     * @param code HTTP status code for the error.
     * @param message Error message.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Converts the response to an HTTP response string.
     * @return Complete HTTP response string.
     */
    std::string toString() const;
};

/**
 * @brief Handler function type for route endpoints.
 */
using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition for API endpoints.
 */
struct Route {
    HttpMethod method;         ///< HTTP method this route handles.
    std::string pattern;       ///< URL pattern (may include :name path parameters).
    RouteHandler handler;      ///< Handler function for this route.
};

/**
 * @brief HTTP front end of the host registry.
 *
 * Serves the JSON API used by the dashboard page (list, add, update, delete,
 * wake) and the page itself. Every response allows any origin.
 *
 * @note This class is non-copyable and must be owned by a std::shared_ptr.
 */
class RestApiServer : public std::enable_shared_from_this<RestApiServer> {
public:
    /**
     * @brief Constructs a RestApiServer.
     * @param asioContext Reference to the AsioContext for async I/O.
     * @param controller Host operations backing the endpoints.
     * @param port TCP port to listen on (0 picks a free port).
     * @param bindAddress Address to listen on.
     * @param staticDir Directory containing dashboard.html.
     */
    RestApiServer(AsioContext& asioContext, std::shared_ptr<HostController> controller,
                  uint16_t port = 5000, std::string bindAddress = "0.0.0.0",
                  std::filesystem::path staticDir = "templates");

    /**
     * @brief Destructor. Stops the server if running.
     */
    ~RestApiServer();

    RestApiServer(const RestApiServer&) = delete;
    RestApiServer& operator=(const RestApiServer&) = delete;

    /**
     * @brief Binds the listening socket and begins accepting connections.
     * @throws std::system_error if the address cannot be bound.
     */
    void start();

    /**
     * @brief Stops accepting connections.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the port the server is listening on.
     *
     * After start() this is the bound port, also when 0 was requested.
     */
    uint16_t port() const { return port_; }

    /**
     * @brief Routes a parsed request to its handler.
     *
     * Used by the connection code; exposed so handlers can be exercised
     * without a socket.
     */
    ApiResponse dispatch(ApiRequest request);

    static ApiRequest parseRequest(const std::string& rawRequest);

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    static HttpMethod parseMethod(const std::string& method);
    static bool matchRoute(const std::string& pattern, const std::string& path,
                           std::map<std::string, std::string>& pathParams);

    void registerRoutes();

    void handleDashboard(const ApiRequest& req, ApiResponse& res);
    void handleHealth(const ApiRequest& req, ApiResponse& res);
    void handleGetMachines(const ApiRequest& req, ApiResponse& res);
    void handleAddMachine(const ApiRequest& req, ApiResponse& res);
    void handleUpdateMachine(const ApiRequest& req, ApiResponse& res);
    void handleDeleteMachine(const ApiRequest& req, ApiResponse& res);
    void handleWake(const ApiRequest& req, ApiResponse& res);

    AsioContext& asioContext_;
    std::shared_ptr<HostController> controller_;
    uint16_t port_;
    std::string bindAddress_;
    std::filesystem::path staticDir_;
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace hostwake::infra
