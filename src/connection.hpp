#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "blob_index.hpp"
#include "log.hpp"

// Provider side of one accepted socket. Every request line gets one reply
// line, written back in request order; a line that is not JSON ends the
// session.
class ProviderConnection : public std::enable_shared_from_this<ProviderConnection> {
public:
    static void serve(asio::ip::tcp::socket socket,
                      std::shared_ptr<BlobIndex> index,
                      std::shared_ptr<Logger> logger);

    // Reply for one request, or null for a message type the provider does
    // not handle.
    static nlohmann::json answer(const nlohmann::json& request, const BlobIndex& index);

    ~ProviderConnection();

private:
    ProviderConnection(asio::ip::tcp::socket socket,
                       std::shared_ptr<BlobIndex> index,
                       std::shared_ptr<Logger> logger);

    void read_next();
    void on_line(const std::string& line);
    void queue_reply(const nlohmann::json& reply);
    void write_next();
    void shutdown();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<BlobIndex> index_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf inbound_;
    std::deque<std::string> outbound_;
    std::string peer_;
    bool closed_ = false;
};
