#ifndef FSMCPS_MCP_SSE_HPP
#define FSMCPS_MCP_SSE_HPP

// MCP over HTTP + Server-Sent Events, served with libwebsockets.
//
//   GET  /sse                        event stream; first event "endpoint" names the POST URL,
//                                    then one "message" event per JSON-RPC response
//   POST /messages/?session_id=<id>  one JSON-RPC message; answered 202, reply goes to the stream
//   GET  /health                     {"server": ..., "status": "ok"}
//
// One stream at a time; a second GET /sse while one is open gets 409.

#include <csignal>
#include <cstddef>
#include <deque>
#include <string>

namespace mcp_sse {

enum class Route {
    Stream,
    Messages,
    Health,
    MethodNotAllowed,
    NotFound,
};

// Bytes waiting for the next writable callback, oldest first. Each entry is
// handed out once. Holds at most max_entries entries.
class OutgoingQueue {
public:
    explicit OutgoingQueue(size_t max_entries = 1) : max_entries_(max_entries) {}

    // Returns false and queues nothing when the queue is full.
    bool push(std::string data);

    // Moves the oldest entry into data. Returns false when empty.
    bool pop(std::string &data);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    std::deque<std::string> entries_;
    size_t max_entries_;
};

// Events an open stream may have queued before it is treated as stalled and dropped.
constexpr size_t kMaxQueuedEvents = 256;

// Map an HTTP method and URI path (without query) to a route.
Route classify_route(const std::string &method, const std::string &path);

// "event: <name>\r\ndata: <data>\r\n\r\n". Multi-line data becomes several data: lines.
std::string format_event(const std::string &event_name, const std::string &data);

// ": <comment>\r\n\r\n", used as keep-alive.
std::string format_comment(const std::string &comment);

// 32 lowercase hex characters.
std::string generate_session_id();

// "/messages/?session_id=<id>"
std::string build_endpoint_path(const std::string &session_id);

// Value of name in a "a=1&b=2" query string, or empty string when absent.
std::string extract_query_parameter(const std::string &query, const std::string &name);

// Body of GET /health.
std::string build_health_body();

// Serve until shutdown_requested is set. Returns a process exit code.
int run_server(const std::string &host, int port, const volatile std::sig_atomic_t &shutdown_requested);

} // namespace mcp_sse

#endif // FSMCPS_MCP_SSE_HPP
