/**
 * @file CWebSocketSubscriber.hpp
 * @brief WebSocket client registered in the subscription registry
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_DAEMON_WEBSOCKETSUBSCRIBER_HPP
#define LAP_HRMS_DAEMON_WEBSOCKETSUBSCRIBER_HPP

#include <deque>
#include <memory>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "CChangeNotifier.hpp"

namespace lap
{
namespace hrms
{
namespace daemon
{
    namespace bio       = ::boost::asio;
    namespace beast     = ::boost::beast;
    namespace http      = beast::http;
    namespace websocket = beast::websocket;

    /**
     * @brief Pushes change events as text frames {"event": name, "data": payload}
     *
     * Frames are queued and written one at a time on the stream's strand.
     * Messages sent by the client are read and discarded; close or error
     * disconnects the subscriber.
     */
    class WebSocketSubscriber final : public ISubscriber
                                    , public ::std::enable_shared_from_this< WebSocketSubscriber >
    {
    public:
        static constexpr core::Size kMaxPendingFrames = 256;

        /**
         * @brief Complete the upgrade handshake and start reading
         */
        void run( http::request< http::string_body > request );

        void OnEvent( const ChangeEvent& event ) noexcept override;

        WebSocketSubscriber( bio::ip::tcp::socket&& socket, SubscriptionRegistry& registry );
        ~WebSocketSubscriber() noexcept override = default;

    private:
        void onAccept( beast::error_code ec );
        void doRead();
        void onRead( beast::error_code ec, ::std::size_t bytes );
        void enqueue( ::std::shared_ptr< const core::String > frame );
        void doWrite();
        void onWrite( beast::error_code ec, ::std::size_t bytes );
        void disconnect();

    private:
        websocket::stream< beast::tcp_stream >                          m_ws;
        beast::flat_buffer                                              m_buffer;
        ::std::deque< ::std::shared_ptr< const core::String > >         m_queue;
        SubscriptionRegistry&                                           m_registry;
        SubscriptionRegistry::SubscriptionId                            m_id{ 0 };
        core::Bool                                                      m_bConnected{ false };
    };

} // namespace daemon
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DAEMON_WEBSOCKETSUBSCRIBER_HPP
