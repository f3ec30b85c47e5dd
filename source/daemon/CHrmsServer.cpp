/**
 * @file CHrmsServer.cpp
 * @brief Acceptor and io threads of the HRMS daemon
 * @version 0.1
 * @date 2025-12-02
 */

#include <pthread.h>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include "CHrmsServer.hpp"
#include "CHttpSession.hpp"

namespace lap
{
namespace hrms
{
namespace daemon
{
    HrmsServer::HrmsServer( const HrmsConfig& config, ApiRouter& router, SubscriptionRegistry& registry )
        : m_address( config.address )
        , m_iPort( static_cast< core::UInt16 >( config.port ) )
        , m_ioThreads( config.ioThreads == 0 ? 1 : config.ioThreads )
        , m_router( router )
        , m_registry( registry )
        , m_ioContext( static_cast< int >( m_ioThreads ) )
    {
        ;
    }

    HrmsServer::~HrmsServer()
    {
        stop();
    }

    core::Result< void > HrmsServer::start() noexcept
    {
        using result = core::Result< void >;

        if ( m_bRunning ) return result::FromValue();

        beast::error_code ec;
        auto address = bio::ip::make_address( m_address, ec );
        if ( ec ) {
            LAP_HRMS_LOG_ERROR << "Invalid listen address " << m_address << ": " << ec.message();
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        bio::ip::tcp::endpoint endpoint{ address, m_iPort };

        try {
            m_acceptor = core::MakeUnique< bio::ip::tcp::acceptor >( bio::make_strand( m_ioContext ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot create acceptor: " << e.what();
            return result::FromError( HrmsErrc::kNotInitialized );
        }

        m_acceptor->open( endpoint.protocol(), ec );
        if ( !ec ) m_acceptor->set_option( bio::socket_base::reuse_address( true ), ec );
        if ( !ec ) m_acceptor->bind( endpoint, ec );
        if ( !ec ) m_acceptor->listen( bio::socket_base::max_listen_connections, ec );
        if ( ec ) {
            LAP_HRMS_LOG_ERROR << "Cannot listen on " << m_address << ":" << m_iPort << ": " << ec.message();
            m_acceptor.reset();
            return result::FromError( HrmsErrc::kNotInitialized );
        }

        innerDoAccept();

        if ( m_ioContext.stopped() ) {
            // reset if context is stopped
            m_ioContext.restart();
        }

        m_bRunning = true;
        try {
            for ( core::UInt32 i = 0; i < m_ioThreads; ++i ) {
                m_threads.emplace_back( &HrmsServer::innerLoop, this );
                pthread_setname_np( m_threads.back().native_handle(), "hrms_io" );
            }
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot start io threads: " << e.what();
            stop();
            return result::FromError( HrmsErrc::kNotInitialized );
        }

        LAP_HRMS_LOG_INFO << "HRMS server listening on " << m_address << ":" << port() << " with " << m_ioThreads << " io thread(s)";
        return result::FromValue();
    }

    void HrmsServer::stop() noexcept
    {
        if ( m_acceptor ) {
            beast::error_code ec;
            m_acceptor->close( ec );
        }

        m_ioContext.stop();
        m_bRunning = false;

        for ( auto&& thread : m_threads ) {
            if ( thread.joinable() ) thread.join();
        }
        m_threads.clear();
        m_acceptor.reset();
    }

    core::UInt16 HrmsServer::port() const noexcept
    {
        if ( !m_acceptor ) return m_iPort;

        beast::error_code ec;
        auto endpoint = m_acceptor->local_endpoint( ec );
        return ec ? m_iPort : endpoint.port();
    }

    void HrmsServer::innerDoAccept()
    {
        m_acceptor->async_accept( bio::make_strand( m_ioContext ),
                                  beast::bind_front_handler( &HrmsServer::onAccept, this ) );
    }

    void HrmsServer::onAccept( beast::error_code ec, bio::ip::tcp::socket socket )
    {
        if ( ec == bio::error::operation_aborted ) return;

        if ( ec ) {
            LAP_HRMS_LOG_WARN << "Accept failed: " << ec.message();
        } else {
            ::std::make_shared< HttpSession >( ::std::move( socket ), m_router, m_registry )->run();
        }

        if ( m_acceptor && m_acceptor->is_open() ) innerDoAccept();
    }

    void HrmsServer::innerLoop()
    {
        while ( m_bRunning ) {
            try {
                m_ioContext.run();
                break;
            } catch ( const std::exception& e ) {
                LAP_HRMS_LOG_ERROR << "io thread caught exception: " << e.what();
            }
        }
    }

} // namespace daemon
} // namespace hrms
} // namespace lap
