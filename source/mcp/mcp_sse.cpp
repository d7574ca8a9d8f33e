#include "mcp/mcp_sse.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <map>
#include <random>
#include <utility>
#include <vector>

namespace mcp_sse {

using json = nlohmann::json;

static const char MESSAGES_PATH[] = "/messages/";
static constexpr size_t kMaxMessageBytes = 16 * 1024 * 1024;
static constexpr int kKeepAliveSeconds = 15;

// What one HTTP connection is currently doing.
enum class ExchangeKind {
    Fixed,   // a complete response is queued in response
    Stream,  // the open event stream
    Message, // a POST whose body is still arriving
};

struct HttpExchange {
    ExchangeKind kind = ExchangeKind::Fixed;
    std::string session_id;
    std::string request_body;
    bool body_too_large = false;
    OutgoingQueue response; // one fixed response body, sent once
};

// Module-level server state (not a class instance; global singleton).
struct ServerState {
    struct lws_context *context = nullptr;
    std::map<struct lws *, HttpExchange> exchanges;

    // The open event stream, if any, and the events waiting to be written to it.
    struct lws *stream_connection = nullptr;
    std::string session_id;
    OutgoingQueue outbox{kMaxQueuedEvents};
    std::chrono::steady_clock::time_point last_keepalive;
};

static ServerState global_state;

// --- Helpers (also used by tests) ---

bool OutgoingQueue::push(std::string data) {
    if (entries_.size() >= max_entries_) {
        return false;
    }
    entries_.push_back(std::move(data));
    return true;
}

bool OutgoingQueue::pop(std::string &data) {
    if (entries_.empty()) {
        return false;
    }
    data = std::move(entries_.front());
    entries_.pop_front();
    return true;
}

Route classify_route(const std::string &method, const std::string &path) {
    if (path == "/sse" || path == "/sse/") {
        return method == "GET" ? Route::Stream : Route::MethodNotAllowed;
    }
    if (path == "/messages/" || path == "/messages") {
        return method == "POST" ? Route::Messages : Route::MethodNotAllowed;
    }
    if (path == "/health") {
        return method == "GET" ? Route::Health : Route::MethodNotAllowed;
    }
    return Route::NotFound;
}

std::string format_event(const std::string &event_name, const std::string &data) {
    std::string event = "event: " + event_name + "\r\n";
    size_t line_start = 0;
    while (true) {
        size_t line_end = data.find('\n', line_start);
        std::string line = data.substr(line_start, line_end == std::string::npos ? std::string::npos
                                                                                 : line_end - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        event += "data: " + line + "\r\n";
        if (line_end == std::string::npos) {
            break;
        }
        line_start = line_end + 1;
    }
    event += "\r\n";
    return event;
}

std::string format_comment(const std::string &comment) {
    return ": " + comment + "\r\n\r\n";
}

std::string generate_session_id() {
    static std::mt19937_64 engine{std::random_device{}()};
    static const char hex_digits[] = "0123456789abcdef";

    std::string session_id;
    session_id.reserve(32);
    for (int half = 0; half < 2; ++half) {
        std::uint64_t bits = engine();
        for (int nibble = 0; nibble < 16; ++nibble) {
            session_id += hex_digits[bits & 0xFu];
            bits >>= 4;
        }
    }
    return session_id;
}

std::string build_endpoint_path(const std::string &session_id) {
    return std::string(MESSAGES_PATH) + "?session_id=" + session_id;
}

std::string extract_query_parameter(const std::string &query, const std::string &name) {
    size_t position = 0;
    while (position <= query.size()) {
        size_t separator = query.find('&', position);
        std::string pair = query.substr(position, separator == std::string::npos ? std::string::npos
                                                                                 : separator - position);
        size_t equals = pair.find('=');
        if (equals != std::string::npos && pair.compare(0, equals, name) == 0 && equals == name.size()) {
            return pair.substr(equals + 1);
        }
        if (separator == std::string::npos) {
            break;
        }
        position = separator + 1;
    }
    return "";
}

std::string build_health_body() {
    json body;
    body["status"] = "ok";
    body["server"] = mcp_dispatch::SERVER_NAME;
    return body.dump();
}

// --- libwebsockets plumbing ---

static std::string request_method(struct lws *connection) {
    if (lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0) {
        return "GET";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0) {
        return "POST";
    }
    return "OTHER";
}

// lws splits the query into "name=value" fragments; join them back with '&'.
static std::string request_query(struct lws *connection) {
    std::string query;
    char fragment[512];
    for (int index = 0;; ++index) {
        int length = lws_hdr_copy_fragment(connection, fragment, sizeof(fragment), WSI_TOKEN_HTTP_URI_ARGS, index);
        if (length < 0) {
            break;
        }
        if (!query.empty()) {
            query += "&";
        }
        query.append(fragment, static_cast<size_t>(length));
    }
    return query;
}

static bool request_has_body(struct lws *connection) {
    if (lws_hdr_total_length(connection, WSI_TOKEN_HTTP_TRANSFER_ENCODING) > 0) {
        return true;
    }
    char content_length[32];
    if (lws_hdr_copy(connection, content_length, sizeof(content_length), WSI_TOKEN_HTTP_CONTENT_LENGTH) <= 0) {
        return false;
    }
    return std::strcmp(content_length, "0") != 0;
}

// Write headers now and queue body for the next writable callback.
static int respond(struct lws *connection, HttpExchange &exchange, unsigned int status,
                   const char *content_type, const std::string &body) {
    unsigned char header_buffer[LWS_PRE + 1024];
    unsigned char *start = header_buffer + LWS_PRE;
    unsigned char *position = start;
    unsigned char *end = header_buffer + sizeof(header_buffer) - 1;

    if (lws_add_http_common_headers(connection, status, content_type, body.size(), &position, end)) {
        return 1;
    }
    if (lws_finalize_write_http_header(connection, start, &position, end)) {
        return 1;
    }

    exchange.kind = ExchangeKind::Fixed;
    exchange.response.clear();
    exchange.response.push(body);
    lws_callback_on_writable(connection);
    return 0;
}

static void drop_stream(const char *reason) {
    struct lws *connection = global_state.stream_connection;
    if (connection == nullptr) {
        return;
    }
    debug_log::info("Dropping SSE session " + global_state.session_id + ": " + reason);
    global_state.stream_connection = nullptr;
    global_state.session_id.clear();
    global_state.outbox.clear();
    lws_set_timeout(connection, PENDING_TIMEOUT_USER_OK, LWS_TO_KILL_ASYNC);
}

static void push_event(const std::string &event) {
    if (global_state.stream_connection == nullptr) {
        return;
    }
    if (!global_state.outbox.push(event)) {
        drop_stream("client is not reading events");
        return;
    }
    lws_callback_on_writable(global_state.stream_connection);
}

static int open_stream(struct lws *connection, HttpExchange &exchange) {
    unsigned char header_buffer[LWS_PRE + 1024];
    unsigned char *start = header_buffer + LWS_PRE;
    unsigned char *position = start;
    unsigned char *end = header_buffer + sizeof(header_buffer) - 1;

    // No content length: lws answers with "connection: close" and the body runs until either side drops.
    if (lws_add_http_common_headers(connection, HTTP_STATUS_OK, "text/event-stream",
                                    LWS_ILLEGAL_HTTP_CONTENT_LEN, &position, end)) {
        return 1;
    }
    static const char cache_control[] = "no-store";
    if (lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_CACHE_CONTROL,
                                     reinterpret_cast<const unsigned char *>(cache_control),
                                     static_cast<int>(sizeof(cache_control) - 1), &position, end)) {
        return 1;
    }
    if (lws_finalize_write_http_header(connection, start, &position, end)) {
        return 1;
    }

    // The stream stays up until the client drops it.
    lws_set_timeout(connection, NO_PENDING_TIMEOUT, 0);

    exchange.kind = ExchangeKind::Stream;
    exchange.session_id = generate_session_id();

    global_state.stream_connection = connection;
    global_state.session_id = exchange.session_id;
    global_state.outbox.clear();
    global_state.last_keepalive = std::chrono::steady_clock::now();

    debug_log::info("SSE session opened: " + exchange.session_id);
    push_event(format_event("endpoint", build_endpoint_path(exchange.session_id)));
    return 0;
}

static int begin_request(struct lws *connection, const std::string &path) {
    std::string method = request_method(connection);
    debug_log::log("HTTP " + method + " " + path);

    global_state.exchanges[connection] = HttpExchange{};
    HttpExchange &exchange = global_state.exchanges[connection];

    switch (classify_route(method, path)) {
    case Route::Stream:
        if (global_state.stream_connection != nullptr) {
            return respond(connection, exchange, HTTP_STATUS_CONFLICT, "text/plain",
                           "An SSE session is already open");
        }
        return open_stream(connection, exchange);

    case Route::Messages:
        exchange.kind = ExchangeKind::Message;
        exchange.session_id = extract_query_parameter(request_query(connection), "session_id");
        if (!request_has_body(connection)) {
            // No body callbacks will follow; answer now.
            return respond(connection, exchange, HTTP_STATUS_BAD_REQUEST, "text/plain",
                           "Could not parse message");
        }
        return 0;

    case Route::Health:
        return respond(connection, exchange, HTTP_STATUS_OK, "application/json", build_health_body());

    case Route::MethodNotAllowed:
        return respond(connection, exchange, HTTP_STATUS_METHOD_NOT_ALLOWED, "text/plain",
                       "Method Not Allowed");

    case Route::NotFound:
        break;
    }
    return respond(connection, exchange, HTTP_STATUS_NOT_FOUND, "text/plain", "Not Found");
}

static void append_body(struct lws *connection, const char *data, size_t length) {
    auto exchange_iterator = global_state.exchanges.find(connection);
    if (exchange_iterator == global_state.exchanges.end()) {
        return;
    }
    HttpExchange &exchange = exchange_iterator->second;
    if (exchange.body_too_large || exchange.request_body.size() + length > kMaxMessageBytes) {
        exchange.body_too_large = true;
        exchange.request_body.clear();
        return;
    }
    exchange.request_body.append(data, length);
}

static int complete_message(struct lws *connection) {
    auto exchange_iterator = global_state.exchanges.find(connection);
    if (exchange_iterator == global_state.exchanges.end()) {
        return -1;
    }
    HttpExchange &exchange = exchange_iterator->second;

    if (exchange.body_too_large) {
        return respond(connection, exchange, HTTP_STATUS_REQ_ENTITY_TOO_LARGE, "text/plain",
                       "Message too large");
    }
    if (exchange.session_id.empty()) {
        return respond(connection, exchange, HTTP_STATUS_BAD_REQUEST, "text/plain", "session_id is required");
    }
    if (global_state.stream_connection == nullptr || exchange.session_id != global_state.session_id) {
        return respond(connection, exchange, HTTP_STATUS_NOT_FOUND, "text/plain", "Could not find session");
    }

    json message;
    try {
        message = json::parse(exchange.request_body);
    } catch (const json::parse_error &error) {
        debug_log::info("Failed to parse POSTed JSON: " + std::string(error.what()));
        push_event(format_event("message", json_rpc::serialize(json_rpc::build_parse_error(error.what()))));
        return respond(connection, exchange, HTTP_STATUS_BAD_REQUEST, "text/plain", "Could not parse message");
    }

    json response = mcp_dispatch::dispatch_message(message);
    if (!response.is_null()) {
        push_event(format_event("message", json_rpc::serialize(response)));
    }
    return respond(connection, exchange, HTTP_STATUS_ACCEPTED, "text/plain", "Accepted");
}

// libwebsockets requires LWS_PRE bytes of padding before the data.
static int write_padded(struct lws *connection, const std::string &data, enum lws_write_protocol protocol) {
    std::vector<unsigned char> send_buffer(LWS_PRE + data.size());
    std::memcpy(send_buffer.data() + LWS_PRE, data.data(), data.size());
    int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, data.size(), protocol);
    return (bytes_written < static_cast<int>(data.size())) ? -1 : 0;
}

static int write_pending(struct lws *connection) {
    auto exchange_iterator = global_state.exchanges.find(connection);
    if (exchange_iterator == global_state.exchanges.end()) {
        return 0;
    }
    HttpExchange &exchange = exchange_iterator->second;

    if (exchange.kind == ExchangeKind::Stream) {
        // A dropped stream is waiting to be closed; nothing more goes out on it.
        if (connection != global_state.stream_connection) {
            return 0;
        }
        std::string event;
        if (!global_state.outbox.pop(event)) {
            return 0;
        }
        if (write_padded(connection, event, LWS_WRITE_HTTP) != 0) {
            debug_log::info("Failed to write to SSE stream; closing it.");
            return -1;
        }
        if (!global_state.outbox.empty()) {
            lws_callback_on_writable(connection);
        }
        return 0;
    }

    if (exchange.kind == ExchangeKind::Fixed) {
        std::string body;
        if (!exchange.response.pop(body)) {
            return 0;
        }
        // The next request on a kept-alive connection starts a new exchange.
        global_state.exchanges.erase(exchange_iterator);
        if (write_padded(connection, body, LWS_WRITE_HTTP_FINAL) != 0) {
            return -1;
        }
        if (lws_http_transaction_completed(connection)) {
            return -1;
        }
    }
    return 0;
}

static void close_exchange(struct lws *connection) {
    if (connection == global_state.stream_connection) {
        debug_log::info("SSE session closed: " + global_state.session_id);
        global_state.stream_connection = nullptr;
        global_state.session_id.clear();
        global_state.outbox.clear();
    }
    global_state.exchanges.erase(connection);
}

static void send_keepalive_if_due() {
    if (global_state.stream_connection == nullptr) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (now - global_state.last_keepalive < std::chrono::seconds(kKeepAliveSeconds)) {
        return;
    }
    global_state.last_keepalive = now;
    push_event(format_comment("ping"));
}

// --- HTTP callback ---

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        std::string path = incoming_data ? static_cast<const char *>(incoming_data) : "";
        return begin_request(connection, path);
    }

    case LWS_CALLBACK_HTTP_BODY:
        append_body(connection, static_cast<const char *>(incoming_data), incoming_length);
        return 0;

    case LWS_CALLBACK_HTTP_BODY_COMPLETION:
        return complete_message(connection);

    case LWS_CALLBACK_HTTP_WRITEABLE:
        return write_pending(connection);

    case LWS_CALLBACK_CLOSED_HTTP:
        close_exchange(connection);
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

// HTTP protocol definition for libwebsockets. Requests with no matching mount land here.
static const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        0,    // per-session data size; state lives in global_state
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

int run_server(const std::string &host, int port, const volatile std::sig_atomic_t &shutdown_requested) {
    int log_levels = LLL_ERR | LLL_WARN;
    if (debug_log::is_debug_enabled()) {
        log_levels |= LLL_NOTICE;
    }
    lws_set_log_level(log_levels, nullptr);

    struct lws_context_creation_info context_info;
    std::memset(&context_info, 0, sizeof(context_info));
    context_info.port = port;
    // nullptr binds every interface.
    context_info.iface = (host.empty() || host == "0.0.0.0") ? nullptr : host.c_str();
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    global_state.context = lws_create_context(&context_info);
    if (global_state.context == nullptr) {
        debug_log::info("Failed to create libwebsockets context on " + host + ":" + std::to_string(port) + ".");
        return 1;
    }

    std::string base_url = "http://" + (host == "0.0.0.0" ? std::string("localhost") : host) + ":" +
                           std::to_string(port);
    debug_log::info("Starting MCP File Server (SSE mode)");
    debug_log::info("SSE endpoint: " + base_url + "/sse");
    debug_log::info("Messages endpoint: " + base_url + MESSAGES_PATH);
    debug_log::info("Health check: " + base_url + "/health");

    while (!shutdown_requested) {
        if (lws_service(global_state.context, 100) < 0) {
            debug_log::info("libwebsockets service loop failed; stopping.");
            break;
        }
        send_keepalive_if_due();
    }

    lws_context_destroy(global_state.context);
    global_state.context = nullptr;
    global_state.stream_connection = nullptr;
    global_state.session_id.clear();
    global_state.outbox.clear();
    global_state.exchanges.clear();
    return 0;
}

} // namespace mcp_sse
