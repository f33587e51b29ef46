#include <vaultstream/core/transport/websocket_transport.hpp>
#include <vaultstream/core/errors.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <optional>
#include <type_traits>

namespace VaultStream {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds POLL_SLICE{250};
constexpr std::chrono::milliseconds CLOSE_TIMEOUT{2000};
constexpr std::chrono::milliseconds DRAIN_TIMEOUT{1000};

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

enum class PumpResult { DONE, TIMEOUT, CANCELLED };

/**
 * Blocking facade over Beast's async API. Every operation is started
 * asynchronously and the private io_context is run on the calling thread
 * until it completes, its deadline passes or cancel() is observed.
 */
template <class NextLayer>
class BeastTransport : public WebSocketTransport {
public:
    static constexpr bool IS_TLS = std::is_same_v<NextLayer, TlsStream>;

    BeastTransport() : ssl_ctx_(ssl::context::tls_client), resolver_(ioc_) {}

    ~BeastTransport() override {
        closeSocket();
    }

    void connect(const ConnectRequest& request) override {
        if (cancelled_.load(std::memory_order_acquire)) {
            throw TransportError("connect cancelled");
        }
        timeout_ = request.timeout;
        const auto& url = request.url;

        try {
            createStream(url, request.verify_tls);
        } catch (const boost::system::system_error& e) {
            throw TransportError(std::string("TLS setup failed: ") + e.what());
        }

        // Resolve
        beginOp();
        resolver_.async_resolve(url.host, std::to_string(url.port),
            [this](const beast::error_code& ec, tcp::resolver::results_type results) {
                endpoints_ = std::move(results);
                completeOp(ec);
            });
        await("resolve");
        if (opEc_) {
            throw TransportError("resolve " + url.host + " failed: " + opEc_.message());
        }

        // TCP connect
        beginOp();
        beast::get_lowest_layer(*ws_).expires_after(timeout_);
        beast::get_lowest_layer(*ws_).async_connect(endpoints_,
            [this](const beast::error_code& ec, const tcp::endpoint&) { completeOp(ec); });
        await("connect");
        if (opEc_) {
            throw TransportError("connect to " + url.hostHeader() + " failed: " + opEc_.message());
        }

        if constexpr (IS_TLS) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url.host.c_str())) {
                beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw TransportError("TLS SNI setup failed: " + sniEc.message());
            }
            beginOp();
            beast::get_lowest_layer(*ws_).expires_after(timeout_);
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                [this](const beast::error_code& ec) { completeOp(ec); });
            await("TLS handshake");
            if (opEc_) {
                throw TransportError("TLS handshake with " + url.host + " failed: " + opEc_.message());
            }
        }

        // The websocket stream runs its own timers from here on
        beast::get_lowest_layer(*ws_).expires_never();

        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = timeout_;
        opt.idle_timeout = websocket::stream_base::none();
        opt.keep_alive_pings = false;
        ws_->set_option(opt);

        auto headers = request.headers;
        ws_->set_option(websocket::stream_base::decorator(
            [headers](websocket::request_type& req) {
                req.set(http::field::user_agent, std::string("vaultstream/") + BOOST_BEAST_VERSION_STRING);
                for (const auto& [name, value] : headers) {
                    req.set(name, value);
                }
            }));

        ws_->control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong) {
                pong_ = true;
            }
        });

        beginOp();
        ws_->async_handshake(response_, url.hostHeader(), url.target,
            [this](const beast::error_code& ec) { completeOp(ec); });
        await("websocket upgrade");

        if (opEc_) {
            if (opEc_ == websocket::error::upgrade_declined) {
                int status = static_cast<int>(response_.result_int());
                if (status == 401 || status == 403) {
                    throw AuthorizationError(status, "subscription rejected with HTTP " + std::to_string(status));
                }
                throw TransportError("upgrade declined with HTTP " + std::to_string(status));
            }
            throw TransportError("websocket upgrade failed: " + opEc_.message());
        }

        open_ = true;
        spdlog::debug("[Transport] Connected to {}", url.str());
    }

    ReadStatus read(std::string& out, std::chrono::milliseconds timeout) override {
        if (!ws_ || !open_) {
            throw TransportError("read on a closed connection");
        }

        // A read left pending by an earlier timeout is reused
        if (!readPending_) {
            startRead();
        }

        auto deadline = Clock::now() + timeout;
        auto result = pump([this] { return readDone_ || pong_; }, deadline);
        if (result == PumpResult::CANCELLED) {
            abort();
            throw TransportError("read cancelled");
        }

        if (readDone_) {
            readPending_ = false;
            readDone_ = false;
            if (readEc_) {
                open_ = false;
                if (readEc_ == websocket::error::closed) {
                    auto reason = ws_->reason();
                    throw TransportError("closed by server (code " + std::to_string(reason.code) + ")");
                }
                throw TransportError("read failed: " + readEc_.message());
            }
            out = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            return ReadStatus::MESSAGE;
        }

        if (pong_) {
            pong_ = false;
            return ReadStatus::PONG;
        }
        return ReadStatus::TIMEOUT;
    }

    void ping() override {
        if (!ws_ || !open_) {
            throw TransportError("ping on a closed connection");
        }

        beginOp();
        ws_->async_ping({}, [this](const beast::error_code& ec) { completeOp(ec); });
        await("ping");
        if (opEc_) {
            open_ = false;
            throw TransportError("ping failed: " + opEc_.message());
        }
    }

    void close() noexcept override {
        if (!ws_) return;

        if (open_ && !cancelled_.load(std::memory_order_acquire)) {
            open_ = false;
            try {
                beginOp();
                ws_->async_close(websocket::close_code::normal, [this](const beast::error_code& ec) { completeOp(ec); });
                if (pump([this] { return opDone_; }, Clock::now() + CLOSE_TIMEOUT) != PumpResult::DONE) {
                    abort();
                    drain([this] { return opDone_; });
                } else if (opEc_) {
                    spdlog::debug("[Transport] Close handshake failed: {}", opEc_.message());
                }
            } catch (const std::exception& e) {
                spdlog::debug("[Transport] Close failed: {}", e.what());
            }
        }
        open_ = false;
        closeSocket();
        drain([this] { return !readPending_ || readDone_; });
    }

    void cancel() noexcept override {
        cancelled_.store(true, std::memory_order_release);
        try {
            net::post(ioc_, [this] { abort(); });
        } catch (const std::exception& e) {
            spdlog::debug("[Transport] Cancel post failed: {}", e.what());
        }
    }

private:
    void createStream(const SubscriptionUrl& url, bool verifyTls) {
        if constexpr (IS_TLS) {
            if (verifyTls) {
                ssl_ctx_.set_default_verify_paths();
                ssl_ctx_.set_verify_mode(ssl::verify_peer);
                ssl_ctx_.set_verify_callback(ssl::host_name_verification(url.host));
            } else {
                ssl_ctx_.set_verify_mode(ssl::verify_none);
            }
            ws_.emplace(ioc_, ssl_ctx_);
        } else {
            (void)url;
            (void)verifyTls;
            ws_.emplace(ioc_);
        }
    }

    void startRead() {
        readPending_ = true;
        readDone_ = false;
        readEc_ = {};
        ws_->async_read(buffer_, [this](const beast::error_code& ec, std::size_t) {
            readEc_ = ec;
            readDone_ = true;
        });
    }

    template <class Pred>
    PumpResult pump(Pred done, Clock::time_point deadline) {
        while (!done()) {
            if (cancelled_.load(std::memory_order_acquire)) return PumpResult::CANCELLED;
            auto now = Clock::now();
            if (now >= deadline) return PumpResult::TIMEOUT;

            auto slice = std::min<Clock::duration>(deadline - now, POLL_SLICE);
            if (ioc_.stopped()) ioc_.restart();
            ioc_.run_one_for(slice);
        }
        return PumpResult::DONE;
    }

    void beginOp() {
        opDone_ = false;
        opEc_ = {};
    }

    void completeOp(const beast::error_code& ec) {
        opEc_ = ec;
        opDone_ = true;
    }

    // Runs the current operation to completion or throws
    void await(const char* what) {
        auto done = [this] { return opDone_; };
        auto result = pump(done, Clock::now() + timeout_);
        if (result == PumpResult::DONE) return;

        abort();
        drain(done);
        if (result == PumpResult::CANCELLED) {
            throw TransportError(std::string(what) + " cancelled");
        }
        throw TransportError(std::string(what) + " timed out");
    }

    // Let aborted handlers complete so nothing references the stack
    template <class Pred>
    void drain(Pred done) noexcept {
        auto deadline = Clock::now() + DRAIN_TIMEOUT;
        try {
            while (!done() && Clock::now() < deadline) {
                if (ioc_.stopped()) ioc_.restart();
                ioc_.run_one_for(POLL_SLICE);
            }
        } catch (const std::exception& e) {
            spdlog::debug("[Transport] Drain failed: {}", e.what());
        }
    }

    void abort() noexcept {
        resolver_.cancel();
        open_ = false;
        closeSocket();
    }

    void closeSocket() noexcept {
        if (!ws_) return;
        beast::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }

    net::io_context ioc_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    std::optional<websocket::stream<NextLayer>> ws_;
    beast::flat_buffer buffer_;
    std::chrono::milliseconds timeout_{10000};

    // State of the one outstanding connect/ping/close operation
    bool opDone_ = false;
    beast::error_code opEc_;
    tcp::resolver::results_type endpoints_;
    websocket::response_type response_;

    bool open_ = false;
    bool pong_ = false;
    bool readPending_ = false;
    bool readDone_ = false;
    beast::error_code readEc_;
    std::atomic<bool> cancelled_{false};
};

} // namespace

std::unique_ptr<WebSocketTransport> makeBeastTransport(const SubscriptionUrl& url) {
    if (url.secure) {
        return std::make_unique<BeastTransport<TlsStream>>();
    }
    return std::make_unique<BeastTransport<PlainStream>>();
}

} // namespace VaultStream
