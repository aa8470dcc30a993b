#pragma once
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

// Reports through std::cout/std::cerr only, it may itself be a FlowLogger remote sink
class WebSocketClient
{

public:
    using Client = websocketpp::client<websocketpp::config::asio_client>;
    using ConnectionHdl = websocketpp::connection_hdl;

    WebSocketClient();
    ~WebSocketClient();
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void start(const std::string &uri);    // Starts connection in a separate thread
    void stop();                           // Closes connection and stops the loop
    bool send(const std::string &message); // Sends a message if connected
    bool isConnected() const;

private:
    void runLoop();  // Handles connection, reconnection, and event loop

    // WebSocket event handlers
    void onOpen(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onFail(ConnectionHdl hdl);

    Client _client;
    ConnectionHdl _connectionHandle;
    std::thread _ws_thread;
    std::atomic<bool> _running;
    std::atomic<bool> _is_connected;
    std::string _uri;
    std::mutex _mutex;
};
