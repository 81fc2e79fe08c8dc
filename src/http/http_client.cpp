#include <synthetic_mcp/http/http_client.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace synthetic_mcp {

namespace {

constexpr const char* kComponent = "http";
constexpr size_t kMaxBodyLog = 2000;
constexpr std::chrono::milliseconds kCancelPollInterval{10};

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Canceled:
            return ErrorCategory::OperationCanceled;
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie";
}

// Aborts the client's in-flight request once the token fires. httplib only
// consults Request::progress while a body is being read, so without this a
// stalled status line holds the caller until the read timeout. stop() is
// repeated until the request returns, since it is a no-op before the socket
// is registered as in flight.
class CancelWatcher {
public:
    CancelWatcher(httplib::Client& client, CancellationToken cancel)
        : client_(client), cancel_(std::move(cancel)) {
        if (cancel_.CanBeCanceled()) {
            thread_ = std::thread([this] { Watch(); });
        }
    }

    ~CancelWatcher() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    CancelWatcher(const CancelWatcher&) = delete;
    CancelWatcher& operator=(const CancelWatcher&) = delete;

private:
    void Watch() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_) {
            if (cancel_.IsCancellationRequested()) {
                client_.stop();
            }
            cv_.wait_for(lock, kCancelPollInterval);
        }
    }

    httplib::Client& client_;
    CancellationToken cancel_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread thread_;
};

} // anonymous namespace

struct HttpClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_url;
    std::string bearer_token;
    Logger& logger;

    Impl(const std::string& url, const std::string& token, Logger& log,
         const HttpClientOptions& options)
        : client(std::make_unique<httplib::Client>(url)),
          base_url(url),
          bearer_token(token),
          logger(log) {
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.read_timeout);
    }

    void LogRequestHeaders(const httplib::Headers& hdrs) {
        if (!logger.IsEnabled(LogLevel::Debug)) {
            return;
        }
        for (const auto& [k, v] : hdrs) {
            logger.Debug(kComponent, "  > " + k + ": " +
                                         (IsSensitiveHeader(k) ? "<redacted>" : v));
        }
    }

    void LogResponse(int status, const std::string& body) {
        logger.Info(kComponent, "  < " + std::to_string(status));
        if (status >= 400 && !body.empty()) {
            if (body.size() <= kMaxBodyLog) {
                logger.Debug(kComponent, "  < body: " + body);
            } else {
                logger.Debug(kComponent, "  < body: " + body.substr(0, kMaxBodyLog) +
                                             "... (truncated)");
            }
        }
    }
};

HttpClient::HttpClient(const std::string& base_url,
                       const std::string& bearer_token,
                       Logger& logger,
                       const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(base_url, bearer_token, logger, options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::PostJson(std::string_view path,
                                                 std::string_view body,
                                                 const CancellationToken& cancel) {
    const std::string path_str(path);
    if (cancel.IsCancellationRequested()) {
        return Result<HttpResponse, Error>::Err(Error::Canceled("PostJson"));
    }

    httplib::Request req;
    req.method = "POST";
    req.path = path_str;
    req.body = std::string(body);
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "application/json");
    req.set_header("Authorization", "Bearer " + impl_->bearer_token);
    req.progress = [&cancel](uint64_t /*current*/, uint64_t /*total*/) {
        return !cancel.IsCancellationRequested();
    };

    impl_->logger.Info(kComponent, "POST " + impl_->base_url + path_str);
    impl_->LogRequestHeaders(req.headers);

    auto res = [&] {
        CancelWatcher watcher(*impl_->client, cancel);
        return impl_->client->send(req);
    }();
    if (!res) {
        const auto http_error = res.error();
        if (http_error == httplib::Error::Canceled ||
            cancel.IsCancellationRequested()) {
            impl_->logger.Warn(kComponent, "POST " + path_str + " canceled");
            return Result<HttpResponse, Error>::Err(Error::Canceled("PostJson"));
        }
        impl_->logger.Error(kComponent, "POST " + path_str + " failed: " +
                                            httplib::to_string(http_error));
        return Result<HttpResponse, Error>::Err(Error{
            "PostJson", path_str, std::nullopt,
            "Synthetic API request failed: " + httplib::to_string(http_error),
            CategoryFromTransportError(http_error)});
    }

    impl_->LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace synthetic_mcp
