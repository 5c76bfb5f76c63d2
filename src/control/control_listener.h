#ifndef FACEWATCH_CONTROL_LISTENER_H
#define FACEWATCH_CONTROL_LISTENER_H

#include <functional>
#include <map>
#include <string>
#include <zmq.hpp>

namespace facewatch {

// "<name> [argument]"
struct ControlCommand {
    std::string name;
    std::string argument;
};

struct ControlReply {
    bool ok = true;
    std::string payload;   // reply data, or error message

    static ControlReply success(const std::string& payload = "") { return {true, payload}; }
    static ControlReply failure(const std::string& message) { return {false, message}; }
};

using ControlHandler = std::function<ControlReply(const ControlCommand&)>;

// Routes commands to registered handlers
class ControlDispatcher {
public:
    void on(const std::string& name, ControlHandler handler);

    // Unknown commands and handler exceptions become error replies
    ControlReply dispatch(const ControlCommand& command) const;

private:
    std::map<std::string, ControlHandler> handlers_;
};

// Local command channel on a ZeroMQ REP socket. Each request is one message
// "<command> [argument]" and gets exactly one reply message, "ok[ <payload>]"
// or "error <message>". Polled from the frame loop, never blocks.
class ControlListener {
public:
    static constexpr int DEFAULT_PORT = 43210;

    ControlListener() = default;
    ~ControlListener();

    ControlListener(const ControlListener&) = delete;
    ControlListener& operator=(const ControlListener&) = delete;

    // Bind tcp://host:port; port 0 picks a free port (see port())
    bool open(const std::string& host = "127.0.0.1", int port = DEFAULT_PORT);
    void close();
    bool isOpen() const { return static_cast<bool>(socket_); }
    int port() const { return port_; }
    const std::string& endpoint() const { return endpoint_; }

    // Answer at most one pending request. Returns true if a request was answered.
    bool serveOne(const ControlDispatcher& dispatcher);

    static ControlCommand parseRequest(const std::string& text);
    static std::string formatReply(const ControlReply& reply);

private:
    zmq::context_t context_;
    zmq::socket_t socket_;
    std::string endpoint_;
    int port_ = 0;
};

} // namespace facewatch

#endif // FACEWATCH_CONTROL_LISTENER_H
