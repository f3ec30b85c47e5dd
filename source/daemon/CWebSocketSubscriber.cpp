/**
 * @file CWebSocketSubscriber.cpp
 * @brief WebSocket client registered in the subscription registry
 * @version 0.1
 * @date 2025-12-02
 */

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include "CWebSocketSubscriber.hpp"

namespace lap
{
namespace hrms
{
namespace daemon
{
    WebSocketSubscriber::WebSocketSubscriber( bio::ip::tcp::socket&& socket, SubscriptionRegistry& registry )
        : m_ws( ::std::move( socket ) )
        , m_registry( registry )
    {
        ;
    }

    void WebSocketSubscriber::run( http::request< http::string_body > request )
    {
        m_ws.set_option( websocket::stream_base::timeout::suggested( beast::role_type::server ) );
        m_ws.set_option( websocket::stream_base::decorator( []( websocket::response_type& res ) {
            res.set( http::field::server, "lap-hrms" );
        } ) );

        m_ws.async_accept( request, beast::bind_front_handler( &WebSocketSubscriber::onAccept, shared_from_this() ) );
    }

    void WebSocketSubscriber::onAccept( beast::error_code ec )
    {
        if ( ec ) {
            LAP_HRMS_LOG_WARN << "WebSocket handshake failed: " << ec.message();
            return;
        }

        m_bConnected = true;
        m_id = m_registry.Connect( shared_from_this() );

        doRead();
    }

    void WebSocketSubscriber::doRead()
    {
        m_ws.async_read( m_buffer, beast::bind_front_handler( &WebSocketSubscriber::onRead, shared_from_this() ) );
    }

    void WebSocketSubscriber::onRead( beast::error_code ec, ::std::size_t bytes )
    {
        UNUSED( bytes );

        if ( ec ) {
            if ( ec != websocket::error::closed ) {
                LAP_HRMS_LOG_DEBUG << "WebSocket read ended: " << ec.message();
            }
            disconnect();
            return;
        }

        // push-only channel, client messages are ignored
        m_buffer.consume( m_buffer.size() );
        doRead();
    }

    void WebSocketSubscriber::OnEvent( const ChangeEvent& event ) noexcept
    {
        try {
            auto text = ::std::make_shared< const core::String >( EncodeEventFrame( event ) );

            bio::post( m_ws.get_executor(), beast::bind_front_handler( &WebSocketSubscriber::enqueue, shared_from_this(), text ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_WARN << "Dropping event " << event.name << ": " << e.what();
        }
    }

    void WebSocketSubscriber::enqueue( ::std::shared_ptr< const core::String > frame )
    {
        if ( !m_bConnected ) return;

        if ( m_queue.size() >= kMaxPendingFrames ) {
            LAP_HRMS_LOG_WARN << "Subscriber " << m_id << " is not keeping up, dropping event";
            return;
        }

        m_queue.push_back( ::std::move( frame ) );
        if ( m_queue.size() > 1 ) return;

        doWrite();
    }

    void WebSocketSubscriber::doWrite()
    {
        m_ws.text( true );
        m_ws.async_write( bio::buffer( *m_queue.front() ),
                          beast::bind_front_handler( &WebSocketSubscriber::onWrite, shared_from_this() ) );
    }

    void WebSocketSubscriber::onWrite( beast::error_code ec, ::std::size_t bytes )
    {
        UNUSED( bytes );

        if ( ec ) {
            LAP_HRMS_LOG_DEBUG << "WebSocket write failed: " << ec.message();
            disconnect();
            m_queue.clear();
            return;
        }

        m_queue.pop_front();
        if ( !m_bConnected ) {
            m_queue.clear();
            return;
        }

        if ( !m_queue.empty() ) doWrite();
    }

    void WebSocketSubscriber::disconnect()
    {
        if ( !m_bConnected ) return;

        m_bConnected = false;
        m_registry.Disconnect( m_id );
    }

} // namespace daemon
} // namespace hrms
} // namespace lap
