#include "binance_kline_stream.hpp"
#include "binance_codec.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(250);

} // namespace

BinanceKlineStream::BinanceKlineStream(const Config& config)
    : host_(config.ws_host),
      port_(config.ws_port),
      idle_timeout_(config.feed_idle_timeout_seconds) {
}

void BinanceKlineStream::run(const std::string& instrument,
                             const std::string& interval,
                             const UpdateHandler& on_update,
                             const std::atomic<bool>& running) {
    const std::string stream = binance::kline_stream_name(instrument, interval);
    const std::string path = "/stream?streams=" + stream;

    try {
        ssl::context ctx{ssl::context::tls_client};
        ctx.set_default_verify_paths();

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        websocket::stream<ssl::stream<tcp::socket>> ws(ioc, ctx);

        auto const results = resolver.resolve(host_, port_);
        asio::connect(ws.next_layer().next_layer(), results.begin(), results.end());

        // SNI must be set before the TLS handshake
        ws.next_layer().set_verify_mode(ssl::verify_peer);
        if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host_.c_str())) {
            throw FeedDisconnected("Failed to set SNI host name for " + host_);
        }
        ws.next_layer().handshake(ssl::stream_base::client);
        ws.handshake(host_, path);

        spdlog::info("Kline stream connected: {}", stream);

        auto last_message = std::chrono::steady_clock::now();

        while (running.load()) {
            beast::flat_buffer buffer;
            beast::error_code read_ec;
            bool read_done = false;

            ioc.restart();
            ws.async_read(buffer, [&](beast::error_code ec, std::size_t) {
                read_ec = ec;
                read_done = true;
            });

            // Poll so shutdown and idle detection never wait on the socket
            while (!read_done) {
                ioc.run_for(kPollInterval);
                if (read_done) break;

                bool idle = std::chrono::steady_clock::now() - last_message > idle_timeout_;
                if (!running.load() || idle) {
                    beast::error_code cancel_ec;
                    ws.next_layer().next_layer().cancel(cancel_ec);
                    ioc.run();
                    if (!running.load()) {
                        spdlog::info("Kline stream closed: {}", stream);
                        return;
                    }
                    throw FeedDisconnected("No data on " + stream + " for " +
                                           std::to_string(idle_timeout_.count()) + "s");
                }
            }

            if (read_ec) {
                throw FeedDisconnected(stream + ": " + read_ec.message());
            }
            last_message = std::chrono::steady_clock::now();

            std::optional<BarUpdate> update;
            try {
                update = binance::parse_kline_message(beast::buffers_to_string(buffer.data()));
            } catch (const std::runtime_error& e) {
                spdlog::warn("Dropping frame on {}: {}", stream, e.what());
                continue;
            }

            if (update && !on_update(*update)) {
                spdlog::info("Kline stream released: {}", stream);
                return;
            }
        }
    } catch (const beast::system_error& e) {
        throw FeedDisconnected(stream + ": " + e.code().message());
    }
}
