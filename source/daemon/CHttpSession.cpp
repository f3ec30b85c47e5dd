/**
 * @file CHttpSession.cpp
 * @brief One HTTP/1.1 connection of the HRMS daemon
 * @version 0.1
 * @date 2025-12-02
 */

#include <chrono>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket.hpp>
#include "CHttpSession.hpp"
#include "CWebSocketSubscriber.hpp"

namespace lap
{
namespace hrms
{
namespace daemon
{
    HttpSession::HttpSession( bio::ip::tcp::socket&& socket, ApiRouter& router, SubscriptionRegistry& registry )
        : m_stream( ::std::move( socket ) )
        , m_router( router )
        , m_registry( registry )
    {
        ;
    }

    void HttpSession::run()
    {
        bio::dispatch( m_stream.get_executor(), beast::bind_front_handler( &HttpSession::doRead, shared_from_this() ) );
    }

    void HttpSession::doRead()
    {
        m_parser.emplace();
        m_parser->body_limit( kBodyLimit );

        m_stream.expires_after( ::std::chrono::seconds( kReadTimeoutSec ) );

        http::async_read( m_stream, m_buffer, *m_parser,
                          beast::bind_front_handler( &HttpSession::onRead, shared_from_this() ) );
    }

    void HttpSession::onRead( beast::error_code ec, ::std::size_t bytes )
    {
        UNUSED( bytes );

        if ( ec == http::error::end_of_stream ) {
            doClose();
            return;
        }

        if ( ec == http::error::body_limit ) {
            send( static_cast< core::UInt32 >( http::status::payload_too_large ),
                  nlohmann::json{ { "error", "Invalid request" } }, 11, false );
            return;
        }

        if ( ec ) {
            LAP_HRMS_LOG_DEBUG << "HTTP read ended: " << ec.message();
            return;
        }

        http::request< http::string_body > request = m_parser->release();

        core::String target( request.target().data(), request.target().size() );
        if ( beast::websocket::is_upgrade( request ) ) {
            if ( target == kWebSocketTarget ) {
                m_stream.expires_never();
                ::std::make_shared< WebSocketSubscriber >( m_stream.release_socket(), m_registry )->run( ::std::move( request ) );
                return;
            }

            send( 404, nlohmann::json{ { "error", "Not found" } }, request.version(), false );
            return;
        }

        core::String method( request.method_string().data(), request.method_string().size() );
        ApiResponse response = m_router.Route( method, target, request.body() );

        LAP_HRMS_LOG_DEBUG << method << " " << target << " -> " << response.status;
        send( response.status, response.body, request.version(), request.keep_alive() );
    }

    void HttpSession::send( core::UInt32 status, const nlohmann::json& body, core::UInt32 version, core::Bool keepAlive )
    {
        m_response = ::std::make_shared< http::response< http::string_body > >( static_cast< http::status >( status ), version );
        m_response->set( http::field::server, "lap-hrms" );
        m_response->set( http::field::access_control_allow_origin, "*" );
        m_response->set( http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS" );
        m_response->set( http::field::access_control_allow_headers, "Content-Type" );

        if ( !body.is_null() ) {
            m_response->set( http::field::content_type, "application/json" );
            m_response->body() = body.dump( -1, ' ', false, nlohmann::json::error_handler_t::replace );
        }

        m_response->keep_alive( keepAlive );
        m_response->prepare_payload();

        http::async_write( m_stream, *m_response,
                           beast::bind_front_handler( &HttpSession::onWrite, shared_from_this(), m_response->need_eof() ) );
    }

    void HttpSession::onWrite( core::Bool close, beast::error_code ec, ::std::size_t bytes )
    {
        UNUSED( bytes );

        if ( ec ) {
            LAP_HRMS_LOG_DEBUG << "HTTP write failed: " << ec.message();
            return;
        }

        m_response.reset();

        if ( close ) {
            doClose();
            return;
        }

        doRead();
    }

    void HttpSession::doClose()
    {
        beast::error_code ec;
        m_stream.socket().shutdown( bio::ip::tcp::socket::shutdown_send, ec );
        if ( ec && ec != beast::errc::not_connected ) {
            LAP_HRMS_LOG_DEBUG << "HTTP shutdown: " << ec.message();
        }
    }

} // namespace daemon
} // namespace hrms
} // namespace lap
