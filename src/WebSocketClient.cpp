#include "WebSocketClient.hpp"
#include <iostream>
#include "Config.hpp"

WebSocketClient::WebSocketClient(): _running(false), _is_connected(false)
{
    // Set event handlers
    _client.clear_access_channels(websocketpp::log::alevel::all);
    _client.clear_error_channels(websocketpp::log::elevel::all);

    _client.init_asio();
    _client.set_open_handler(std::bind(&WebSocketClient::onOpen, this, std::placeholders::_1));
    _client.set_close_handler(std::bind(&WebSocketClient::onClose, this, std::placeholders::_1));
    _client.set_fail_handler(std::bind(&WebSocketClient::onFail, this, std::placeholders::_1));
}

WebSocketClient::~WebSocketClient()
{
    stop();
}

void WebSocketClient::start(const std::string &uri)
{
    if (_running) return;  // Prevent multiple threads from starting
    _running = true;
    _uri = uri;

    _ws_thread = std::thread(&WebSocketClient::runLoop, this);  // Start main loop in separate thread
}

void WebSocketClient::stop()
{
    _running = false;

    if (_is_connected)
    {
        websocketpp::lib::error_code ec;
        {
            std::lock_guard lock(_mutex);
            _client.close(_connectionHandle, websocketpp::close::status::going_away, "Client Disconnected", ec);
        }
        if (ec) {
            std::cerr << "[WebSocketClient] Close error: " << ec.message() << std::endl;
        }
    }
    _client.stop(); // Unblocks run() while a connection attempt is pending

    if (_ws_thread.joinable())
    {
        _ws_thread.join();
    }
}

bool WebSocketClient::send(const std::string &message)
{
    if (!_is_connected) {
        return false;
    }

    websocketpp::lib::error_code error_code;
    {
        std::lock_guard lock(_mutex); // Lock to prevent multiple threads send in the same time
        _client.send(_connectionHandle, message, websocketpp::frame::opcode::text, error_code);
    }

    if (error_code) {
        std::cerr << "[WebSocketClient] Send error: " << error_code.message() << std::endl;
        return false;
    }
    return true;
}

bool WebSocketClient::isConnected() const
{
    return _is_connected;
}

void WebSocketClient::runLoop()
{
    const std::chrono::seconds retry_delay(Config::WEBSOCKET_RECONNECT_DELAY);
    while (_running)
    {
        try {
            websocketpp::lib::error_code ec;
            const Client::connection_ptr conn = _client.get_connection(_uri, ec);

            if (ec) {
                std::cerr << "[WebSocketClient] Connection error: " << ec.message() << std::endl;
                std::this_thread::sleep_for(retry_delay);
                continue;
            }

            {
                std::lock_guard lock(_mutex);
                _connectionHandle = conn->get_handle();
            }
            _client.connect(conn);

            _client.run();  // Blocks here until the connection is closed or failed
        } catch (const std::exception &e) {
            std::cerr << "[WebSocketClient] Exception: " << e.what() << std::endl;
        }

        _is_connected = false;
        if (_running)
        {
            std::this_thread::sleep_for(retry_delay);  // Wait before retrying
            _client.reset();
        }
    }
}

void WebSocketClient::onOpen(ConnectionHdl hdl)
{
    _is_connected = true;
    std::cout << "[WebSocketClient] Connected to " << _uri << std::endl;
}

void WebSocketClient::onClose(ConnectionHdl hdl)
{
    _is_connected = false;
    std::cout << "[WebSocketClient] Connection closed." << std::endl;
}

void WebSocketClient::onFail(ConnectionHdl hdl)
{
    _is_connected = false;
    std::cerr << "[WebSocketClient] Connection failed. Retrying..." << std::endl;
}
