#include "control_listener.h"
#include "../logger.h"
#include <stdexcept>

namespace facewatch {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

void ControlDispatcher::on(const std::string& name, ControlHandler handler) {
    handlers_[name] = std::move(handler);
}

ControlReply ControlDispatcher::dispatch(const ControlCommand& command) const {
    auto it = handlers_.find(command.name);
    if (it == handlers_.end()) {
        return ControlReply::failure("unknown command '" + command.name + "'");
    }

    try {
        return it->second(command);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Control command '" + command.name + "' failed: " + e.what());
        return ControlReply::failure(e.what());
    }
}

ControlListener::~ControlListener() {
    close();
}

bool ControlListener::open(const std::string& host, int port) {
    close();

    const std::string address = "tcp://" + host + ":" + (port == 0 ? std::string("*") : std::to_string(port));
    try {
        socket_ = zmq::socket_t(context_, zmq::socket_type::rep);
        socket_.set(zmq::sockopt::linger, 0);
        socket_.bind(address);

        // Resolves the wildcard port
        endpoint_ = socket_.get(zmq::sockopt::last_endpoint);
        port_ = std::stoi(endpoint_.substr(endpoint_.rfind(':') + 1));
    } catch (const std::exception& e) {
        Logger::getInstance().error("Cannot bind control channel to " + address + ": " + e.what());
        close();
        return false;
    }

    Logger::getInstance().info("Control channel listening on " + endpoint_);
    return true;
}

void ControlListener::close() {
    if (socket_) {
        socket_.close();
    }
    endpoint_.clear();
    port_ = 0;
}

ControlCommand ControlListener::parseRequest(const std::string& text) {
    ControlCommand command;
    std::string line = trim(text);
    size_t space = line.find_first_of(" \t");
    if (space == std::string::npos) {
        command.name = line;
    } else {
        command.name = line.substr(0, space);
        command.argument = trim(line.substr(space + 1));
    }
    return command;
}

std::string ControlListener::formatReply(const ControlReply& reply) {
    std::string text = reply.ok ? "ok" : "error";
    if (!reply.payload.empty()) {
        text += " " + reply.payload;
    }
    return text;
}

bool ControlListener::serveOne(const ControlDispatcher& dispatcher) {
    if (!socket_) {
        return false;
    }

    try {
        zmq::message_t request;
        if (!socket_.recv(request, zmq::recv_flags::dontwait)) {
            return false;
        }

        // Only the first frame of a multipart request is read
        bool more = request.more();
        while (more) {
            zmq::message_t part;
            if (!socket_.recv(part, zmq::recv_flags::none)) break;
            more = part.more();
        }

        ControlReply reply;
        ControlCommand command = parseRequest(request.to_string());
        if (command.name.empty()) {
            reply = ControlReply::failure("empty request");
        } else {
            Logger::getInstance().debug("Control command: " + command.name +
                                        (command.argument.empty() ? "" : " " + command.argument));
            reply = dispatcher.dispatch(command);
        }

        const std::string text = formatReply(reply);
        if (!socket_.send(zmq::buffer(text), zmq::send_flags::none)) {
            Logger::getInstance().debug("Control reply not delivered");
        }
        return true;
    } catch (const zmq::error_t& e) {
        Logger::getInstance().warning("Control channel error: " + std::string(e.what()));
        return false;
    }
}

} // namespace facewatch
