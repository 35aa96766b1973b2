#include <cardview/transport-client.h>
#include <cardview/backoff.h>
#include <cardview/line-framer.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <cstring>
#include <memory>
#include <vector>

namespace cardview {

const char* healthName(TransportClient::Health health) {
    switch (health) {
        case TransportClient::Health::Disconnected: return "disconnected";
        case TransportClient::Health::Connecting:   return "connecting";
        case TransportClient::Health::Connected:    return "connected";
        case TransportClient::Health::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

class TransportClientImpl;

// Outlives the client if the lookup is still running in the threadpool
struct ResolveRequest {
    uv_getaddrinfo_t req;
    std::weak_ptr<TransportClientImpl> owner;
};

class TransportClientImpl : public TransportClient {
public:
    TransportClientImpl(base::EventLoop::Ptr loop, const TransportSettings& settings)
        : _loop(std::move(loop))
        , _settings(settings)
        , _backoff(settings.backoffInitialMs, settings.backoffMaxMs)
        , _framer(settings.maxFrameBytes) {}

    ~TransportClientImpl() override {
        _started = false;
        closeSocket();
        if (_retryTimer >= 0) {
            if (auto res = _loop->destroyTimer(_retryTimer); !res) {
                ywarn("TransportClient: {}", error_msg(res));
            }
        }
    }

    Result<void> init() noexcept {
        auto timerRes = _loop->createTimer();
        if (!timerRes) {
            return Err<void>("Failed to create retry timer", timerRes);
        }
        _retryTimer = *timerRes;

        auto self = sharedAs<base::EventListener>();
        if (auto res = _loop->registerTimerListener(_retryTimer, self); !res) {
            return Err<void>("Failed to register retry timer listener", res);
        }
        return Ok();
    }

    //=========================================================================
    // TransportClient interface
    //=========================================================================

    Result<void> start() override {
        if (_started) return Ok();
        _started = true;
        _everConnected = false;
        _backoff.reset();
        yinfo("TransportClient: connecting to {}:{}", _settings.host, _settings.port);
        return beginConnect();
    }

    void stop() override {
        if (!_started) return;
        _started = false;
        if (auto res = _loop->stopTimer(_retryTimer); !res) {
            ywarn("TransportClient: {}", error_msg(res));
        }
        closeSocket();
        _framer.reset();
        setHealth(Health::Disconnected);
    }

    Health health() const override { return _health; }
    const TransportSettings& settings() const override { return _settings; }
    uint32_t attempt() const override { return _backoff.attempts(); }
    uint64_t framesReceived() const override { return _framesReceived; }
    uint64_t framesDropped() const override { return _framer.droppedFrames(); }

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::Timer || event.timer.timerId != _retryTimer) {
            return Ok(false);
        }
        // Retry timer is one-shot
        if (auto res = _loop->stopTimer(_retryTimer); !res) {
            return Err<bool>("TransportClient: cannot stop retry timer", res);
        }
        if (!_started) return Ok(true);
        if (auto res = beginConnect(); !res) {
            ywarn("TransportClient: {}", error_msg(res));
            scheduleRetry();
        }
        return Ok(true);
    }

protected:
    Result<void> onShutdown() override {
        stop();
        return Ok();
    }

private:
    //=========================================================================
    // Connection lifecycle
    //=========================================================================

    Result<void> beginConnect() {
        setHealth(_everConnected || _backoff.attempts() > 0 ? Health::Reconnecting : Health::Connecting);

        auto* resolve = new ResolveRequest;
        resolve->owner = sharedAs<TransportClientImpl>();
        resolve->req.data = resolve;

        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        std::string service = std::to_string(_settings.port);
        int r = uv_getaddrinfo(_loop->uvLoop(), &resolve->req, onResolved,
                               _settings.host.c_str(), service.c_str(), &hints);
        if (r != 0) {
            delete resolve;
            return Err<void>(std::string("uv_getaddrinfo failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    static void onResolved(uv_getaddrinfo_t* req, int status, struct addrinfo* res) {
        std::unique_ptr<ResolveRequest> resolve(static_cast<ResolveRequest*>(req->data));
        auto self = resolve->owner.lock();

        if (!self || !self->_started) {
            if (res) uv_freeaddrinfo(res);
            return;
        }
        if (status < 0 || !res) {
            ywarn("TransportClient: cannot resolve {}: {}", self->_settings.host, uv_strerror(status));
            if (res) uv_freeaddrinfo(res);
            self->scheduleRetry();
            return;
        }

        auto connectRes = self->connectTo(res->ai_addr);
        uv_freeaddrinfo(res);
        if (!connectRes) {
            ywarn("TransportClient: {}", error_msg(connectRes));
            self->closeSocket();
            self->scheduleRetry();
        }
    }

    Result<void> connectTo(const struct sockaddr* addr) {
        closeSocket();

        _socket = new uv_tcp_t;
        int r = uv_tcp_init(_loop->uvLoop(), _socket);
        if (r != 0) {
            delete _socket;
            _socket = nullptr;
            return Err<void>(std::string("uv_tcp_init failed: ") + uv_strerror(r));
        }
        _socket->data = this;

        auto* connectReq = new uv_connect_t;
        r = uv_tcp_connect(connectReq, _socket, addr, onConnect);
        if (r != 0) {
            delete connectReq;
            return Err<void>(std::string("uv_tcp_connect failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    static void onConnect(uv_connect_t* req, int status) {
        auto* handle = req->handle;
        delete req;

        // Socket closed while connecting; the client may already be gone
        if (status == UV_ECANCELED) return;

        auto* self = static_cast<TransportClientImpl*>(handle->data);
        if (!self) return;

        if (status < 0) {
            ywarn("TransportClient: connect to {}:{} failed: {}",
                  self->_settings.host, self->_settings.port, uv_strerror(status));
            self->closeSocket();
            self->scheduleRetry();
            return;
        }

        yinfo("TransportClient: connected to {}:{}", self->_settings.host, self->_settings.port);
        self->_everConnected = true;
        self->_backoff.reset();
        self->_framer.reset();
        self->setHealth(Health::Connected);

        int r = uv_read_start(handle, allocBuffer, onRead);
        if (r != 0) {
            yerror("TransportClient: uv_read_start failed: {}", uv_strerror(r));
            self->handleDisconnect();
        }
    }

    static void allocBuffer(uv_handle_t* handle, size_t, uv_buf_t* buf) {
        auto* self = static_cast<TransportClientImpl*>(handle->data);
        buf->base = self->_readBuffer;
        buf->len = READ_BUFFER_SIZE;
    }

    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
        auto* self = static_cast<TransportClientImpl*>(stream->data);
        if (!self) return;

        if (nread < 0) {
            if (nread == UV_EOF) {
                yinfo("TransportClient: server closed the connection");
            } else {
                ywarn("TransportClient: read error: {}", uv_strerror(static_cast<int>(nread)));
            }
            self->handleDisconnect();
            return;
        }

        if (nread > 0) {
            self->onData(std::string_view(buf->base, static_cast<size_t>(nread)));
        }
    }

    void onData(std::string_view data) {
        // Frames are collected first so a listener stopping the client
        // can't pull the framer out from under feed()
        std::vector<std::string> frames;
        _framer.feed(data, [&frames](std::string frame) {
            frames.push_back(std::move(frame));
        });

        for (auto& frame : frames) {
            ++_framesReceived;
            if (_settings.ack) sendAck();
            auto res = _loop->dispatch(base::Event::frameEvent(std::move(frame)));
            if (!res) {
                yerror("TransportClient: frame handler failed: {}", error_msg(res));
            }
            if (!_started) return;
        }
    }

    void handleDisconnect() {
        closeSocket();
        _framer.reset();
        if (!_started) return;
        scheduleRetry();
    }

    void scheduleRetry() {
        if (!_started) return;
        uint64_t delay = _backoff.next();
        setHealth(Health::Reconnecting);
        ywarn("TransportClient: connect attempt {} to {}:{} - retrying in {} ms",
              _backoff.attempts(), _settings.host, _settings.port, delay);

        if (auto res = _loop->configTimer(_retryTimer, static_cast<base::Timeout>(delay)); !res) {
            yerror("TransportClient: {}", error_msg(res));
            return;
        }
        if (auto res = _loop->startTimer(_retryTimer); !res) {
            yerror("TransportClient: {}", error_msg(res));
        }
    }

    void sendAck() {
        if (!_socket) return;

        static constexpr char kAck[] = "ACK\n";
        char* data = new char[sizeof(kAck) - 1];
        std::memcpy(data, kAck, sizeof(kAck) - 1);

        uv_buf_t buf = uv_buf_init(data, sizeof(kAck) - 1);
        uv_write_t* req = new uv_write_t;
        req->data = data;

        int r = uv_write(req, reinterpret_cast<uv_stream_t*>(_socket), &buf, 1,
                         [](uv_write_t* req, int status) {
                             if (status < 0 && status != UV_ECANCELED) {
                                 ywarn("TransportClient: ack write error: {}", uv_strerror(status));
                             }
                             delete[] static_cast<char*>(req->data);
                             delete req;
                         });
        if (r != 0) {
            ywarn("TransportClient: ack write failed: {}", uv_strerror(r));
            delete[] data;
            delete req;
        }
    }

    void closeSocket() {
        if (!_socket) return;
        auto* socket = _socket;
        _socket = nullptr;
        socket->data = nullptr;
        auto* handle = reinterpret_cast<uv_handle_t*>(socket);
        if (!uv_is_closing(handle)) {
            uv_close(handle, [](uv_handle_t* h) {
                delete reinterpret_cast<uv_tcp_t*>(h);
            });
        }
    }

    void setHealth(Health health) {
        if (_health == health) return;
        ydebug("TransportClient: {} -> {}", healthName(_health), healthName(health));
        _health = health;
        auto res = _loop->dispatch(
            base::Event::connectionEvent(static_cast<uint8_t>(health), _backoff.attempts()));
        if (!res) {
            yerror("TransportClient: health listener failed: {}", error_msg(res));
        }
    }

    static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

    base::EventLoop::Ptr _loop;
    TransportSettings _settings;
    Backoff _backoff;
    LineFramer _framer;

    uv_tcp_t* _socket = nullptr;
    char _readBuffer[READ_BUFFER_SIZE];

    base::TimerId _retryTimer = -1;
    Health _health = Health::Disconnected;
    bool _started = false;
    bool _everConnected = false;
    uint64_t _framesReceived = 0;
};

Result<TransportClient::Ptr> TransportClient::createImpl(base::EventLoop::Ptr loop,
                                                         const TransportSettings& settings) noexcept {
    if (!loop) {
        return Err<Ptr>("TransportClient: null event loop");
    }
    if (settings.host.empty()) {
        return Err<Ptr>("TransportClient: empty host");
    }
    if (settings.port == 0) {
        return Err<Ptr>("TransportClient: port must be non-zero");
    }
    auto impl = std::make_shared<TransportClientImpl>(std::move(loop), settings);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init TransportClient", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace cardview
