#include "ssemcp/server/sse_server.hpp"

#include "ssemcp/mcp/jsonrpc.hpp"
#include "ssemcp/util/json.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace ssemcp::server
{

namespace
{
// Worker threads beyond the stream cap, so POSTs are served while every stream is open.
constexpr size_t POST_WORKERS = 8;

void set_json(httplib::Response& res, int status, const ssemcp::Json& body)
{
    res.status = status;
    res.set_content(ssemcp::util::json::dump(body), "application/json");
}
} // namespace

SseServer::SseServer(const mcp::ProtocolHandler& handler, ssemcp::Settings settings,
                     std::string sse_path, std::string health_path)
    : handler_(handler), settings_(std::move(settings)), sse_path_(std::move(sse_path)),
      health_path_(std::move(health_path)), port_(settings_.port),
      default_session_(std::make_shared<mcp::Session>())
{
}

SseServer::~SseServer()
{
    stop();
}

std::string SseServer::format_event(const std::string& name, const ssemcp::Json& data)
{
    return "event: " + name + "\ndata: " + ssemcp::util::json::dump(data) + "\n\n";
}

std::string SseServer::generate_session_id()
{
    // 128 random bits as 32 hex chars
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

size_t SseServer::connection_count() const
{
    std::lock_guard<std::mutex> lock(conns_mutex_);
    return connections_.size();
}

std::shared_ptr<mcp::Session> SseServer::find_session(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(conns_mutex_);
    auto it = connections_.find(session_id);
    if (it == connections_.end())
        return nullptr;
    return it->second->session;
}

void SseServer::apply_cors(httplib::Response& res) const
{
    if (settings_.cors_origin.empty())
        return;
    res.set_header("Access-Control-Allow-Origin", settings_.cors_origin);
    res.set_header("Access-Control-Allow-Methods", settings_.cors_methods);
    res.set_header("Access-Control-Allow-Headers", settings_.cors_headers);
}

void SseServer::release_connection(const std::string& session_id)
{
    size_t erased = 0;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        erased = connections_.erase(session_id);
    }
    if (erased)
        spdlog::info("stream {} closed", session_id);
}

void SseServer::stream_events(httplib::DataSink& sink, const std::shared_ptr<Connection>& conn)
{
    const auto& session_id = conn->session->id();

    std::string connected = format_event(
        "connected", ssemcp::Json{{"type", "connected"}, {"sessionId", session_id}});
    if (!sink.write(connected.data(), connected.size()))
        return;

    const std::string ping = format_event("ping", ssemcp::Json{{"type", "ping"}});
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(conn->m);
            bool cancelled = conn->cv.wait_for(lock, settings_.heartbeat_interval,
                                               [&] { return !running_ || !conn->alive; });
            if (cancelled)
                break;
        }
        if (!sink.write(ping.data(), ping.size()))
        {
            spdlog::debug("stream {}: ping write failed", session_id);
            break;
        }
    }
}

void SseServer::handle_post(const httplib::Request& req, httplib::Response& res)
{
    apply_cors(res);

    std::string session_id;
    if (req.has_param("session_id"))
        session_id = req.get_param_value("session_id");
    else if (req.has_header("Mcp-Session-Id"))
        session_id = req.get_header_value("Mcp-Session-Id");

    std::shared_ptr<mcp::Session> session = default_session_;
    if (!session_id.empty())
    {
        session = find_session(session_id);
        if (!session)
        {
            set_json(res, 404, ssemcp::Json{{"error", "Invalid or expired session_id"}});
            return;
        }
    }

    ssemcp::Json message;
    try
    {
        message = ssemcp::util::json::parse(req.body);
    }
    catch (const ssemcp::Json::parse_error& e)
    {
        spdlog::warn("rejecting malformed message: {}", e.what());
        set_json(res, 400,
                 mcp::jsonrpc::error(ssemcp::Json(), mcp::jsonrpc::PARSE_ERROR,
                                     std::string("Parse error: ") + e.what()));
        return;
    }

    spdlog::debug("received: {}", ssemcp::util::json::dump(message));

    auto response = handler_.handle(message, *session);
    if (!response)
    {
        res.status = 204;
        return;
    }

    spdlog::debug("responding: {}", ssemcp::util::json::dump(*response));
    set_json(res, 200, *response);
}

void SseServer::setup_routes()
{
    svr_->Get(sse_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  // The slot is taken under the same lock as the limit check.
                  auto conn = std::make_shared<Connection>();
                  conn->session = std::make_shared<mcp::Session>(generate_session_id());
                  const std::string session_id = conn->session->id();
                  {
                      std::lock_guard<std::mutex> lock(conns_mutex_);
                      if (connections_.size() >= settings_.max_connections)
                      {
                          spdlog::warn("refusing stream: {} connections open",
                                       connections_.size());
                          set_json(res, 503,
                                   ssemcp::Json{{"error", "Maximum connections reached"}});
                          return;
                      }
                      connections_[session_id] = conn;
                  }
                  spdlog::info("stream {} opened", session_id);

                  res.status = 200;
                  res.set_header("Cache-Control", "no-cache");
                  res.set_header("Connection", "keep-alive");
                  res.set_header("X-Accel-Buffering", "no");
                  apply_cors(res);

                  res.set_chunked_content_provider(
                      "text/event-stream",
                      [this, conn](size_t /*offset*/, httplib::DataSink& sink)
                      {
                          stream_events(sink, conn);
                          release_connection(conn->session->id());
                          return false; // end of stream
                      },
                      // Also runs when the client goes away before the stream starts
                      [this, session_id](bool) { release_connection(session_id); });
              });

    svr_->Post(sse_path_, [this](const httplib::Request& req, httplib::Response& res)
               { handle_post(req, res); });

    svr_->Get(health_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  apply_cors(res);
                  set_json(res, 200,
                           ssemcp::Json{{"status", "healthy"},
                                        {"server", handler_.info().name},
                                        {"version", handler_.info().version}});
              });

    auto preflight = [this](const httplib::Request&, httplib::Response& res)
    {
        apply_cors(res);
        res.status = 204;
    };
    svr_->Options(sse_path_, preflight);
    svr_->Options(health_path_, preflight);
}

bool SseServer::bind()
{
    svr_ = std::make_unique<httplib::Server>();

    // Each open stream pins one worker for its lifetime.
    const size_t workers = settings_.max_connections + POST_WORKERS;
    svr_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    setup_routes();

    if (port_ == 0)
    {
        int bound = svr_->bind_to_any_port(settings_.host);
        if (bound < 0)
        {
            spdlog::error("cannot bind {}:<any>", settings_.host);
            return false;
        }
        port_ = bound;
        return true;
    }
    if (!svr_->bind_to_port(settings_.host, port_))
    {
        spdlog::error("cannot bind {}:{}", settings_.host, port_);
        return false;
    }
    return true;
}

bool SseServer::start()
{
    if (running_)
        return false;
    if (!bind())
        return false;

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    spdlog::info("{} listening on http://{}:{}{}", handler_.info().name, settings_.host, port_,
                 sse_path_);
    return true;
}

bool SseServer::run()
{
    if (running_)
        return false;
    if (!bind())
        return false;

    running_ = true;
    spdlog::info("{} listening on http://{}:{}{}", handler_.info().name, settings_.host, port_,
                 sse_path_);
    bool ok = svr_->listen_after_bind();
    running_ = false;
    return ok;
}

void SseServer::stop()
{
    running_ = false;
    // Wake every heartbeat loop so its stream ends promptly
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto& [session_id, conn] : connections_)
        {
            std::lock_guard<std::mutex> cl(conn->m);
            conn->alive = false;
            conn->cv.notify_all();
        }
    }
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
}

} // namespace ssemcp::server
