// transport.cpp - LoopbackTransport

#include <sync_tree/transport.h>

#include <stdexcept>

namespace sync_tree {

void LoopbackTransport::send(const Message& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw std::runtime_error("LoopbackTransport::send: transport is closed");
    }
    Message copy = message;
    copy.callback = nullptr;
    sent_.push_back(std::move(copy));
}

void LoopbackTransport::connect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        connected_ = true;
    }
}

void LoopbackTransport::disconnect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

void LoopbackTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    connected_ = false;
    handler_ = nullptr;
}

void LoopbackTransport::on_received(ReceiveHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

bool LoopbackTransport::deliver(const Message& message)
{
    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !handler_) {
            return false;
        }
        handler = handler_;
    }
    handler(message);
    return true;
}

std::vector<Message> LoopbackTransport::sent() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {sent_.begin(), sent_.end()};
}

std::vector<Message> LoopbackTransport::take_sent()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result(sent_.begin(), sent_.end());
    sent_.clear();
    return result;
}

bool LoopbackTransport::is_connected() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool LoopbackTransport::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace sync_tree
