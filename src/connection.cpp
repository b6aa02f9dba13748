#include "connection.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <istream>
#include <vector>

namespace {

json answer_info(const json& request, const BlobIndex& index){
    const auto hash = request.value("hash", std::string());
    BlobEntry entry;
    if(hash.empty() || !index.find(hash, entry)){
        return make_error_response("blob_info_response", "", hash, "Unknown blob hash");
    }
    return make_blob_info_response(entry);
}

json answer_chunk(const json& request, const BlobIndex& index){
    const auto request_id = request.value("request_id", std::string());
    const auto hash = request.value("hash", std::string());
    const auto offset = request.value("offset", uint64_t{0});
    auto length = request.value("length", kMaxChunkSize);
    if(length == 0 || length > kMaxChunkSize) length = kMaxChunkSize;

    std::vector<char> data;
    std::string error;
    if(!index.read_range(hash, offset, length, data, error)){
        return make_error_response("blob_chunk_response", request_id, hash, error);
    }
    return make_chunk_response(request_id, hash, offset, data);
}

} // namespace

void ProviderConnection::serve(asio::ip::tcp::socket socket,
                               std::shared_ptr<BlobIndex> index,
                               std::shared_ptr<Logger> logger)
{
    std::shared_ptr<ProviderConnection> conn(
        new ProviderConnection(std::move(socket), std::move(index), std::move(logger)));
    log_debug(conn->logger_.get(), "provider connection from {}", conn->peer_);
    conn->read_next();
}

json ProviderConnection::answer(const json& request, const BlobIndex& index){
    const auto type = request.value("type", std::string());
    if(type == "blob_info_request") return answer_info(request, index);
    if(type == "blob_chunk_request") return answer_chunk(request, index);
    return nullptr;
}

ProviderConnection::ProviderConnection(asio::ip::tcp::socket socket,
                                       std::shared_ptr<BlobIndex> index,
                                       std::shared_ptr<Logger> logger)
: socket_(std::move(socket)), index_(std::move(index)), logger_(std::move(logger))
{
    std::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown peer")
               : remote.address().to_string() + ":" + std::to_string(remote.port());
}

ProviderConnection::~ProviderConnection(){
    shutdown();
}

void ProviderConnection::read_next(){
    asio::async_read_until(socket_, inbound_, '\n',
        [this, self = shared_from_this()](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_info(logger_.get(), "read from {} failed: {}", peer_, ec.message());
                }
                shutdown();
                return;
            }
            std::string line;
            std::istream in(&inbound_);
            std::getline(in, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()) on_line(line);
            if(!closed_) read_next();
        });
}

void ProviderConnection::on_line(const std::string& line){
    json request = json::parse(line, nullptr, false);
    if(request.is_discarded() || !request.is_object()){
        log_warn(logger_.get(), "dropping {}: request is not a JSON object", peer_);
        shutdown();
        return;
    }
    json reply;
    try{
        reply = answer(request, *index_);
    } catch(const json::exception& e){
        log_warn(logger_.get(), "dropping {}: malformed request ({})", peer_, e.what());
        shutdown();
        return;
    }
    if(reply.is_null()){
        log_info(logger_.get(), "ignoring '{}' from {}", request.value("type", std::string()), peer_);
        return;
    }
    if(reply.contains("error")){
        log_debug(logger_.get(), "{} -> {}: {}", peer_, reply.value("type", std::string()),
                  reply.value("error", std::string()));
    }
    queue_reply(reply);
}

void ProviderConnection::queue_reply(const json& reply){
    if(closed_) return;
    outbound_.push_back(reply.dump() + "\n");
    if(outbound_.size() == 1) write_next();
}

void ProviderConnection::write_next(){
    asio::async_write(socket_, asio::buffer(outbound_.front()),
        [this, self = shared_from_this()](std::error_code ec, std::size_t){
            if(ec){
                log_info(logger_.get(), "write to {} failed: {}", peer_, ec.message());
                shutdown();
                return;
            }
            outbound_.pop_front();
            if(!outbound_.empty()) write_next();
        });
}

void ProviderConnection::shutdown(){
    if(closed_) return;
    closed_ = true;
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}
