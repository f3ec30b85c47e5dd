/**
 * @file CHrmsServer.hpp
 * @brief Acceptor and io threads of the HRMS daemon
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_DAEMON_HRMSSERVER_HPP
#define LAP_HRMS_DAEMON_HRMSSERVER_HPP

#include <atomic>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CApiRouter.hpp"
#include "CChangeNotifier.hpp"

namespace lap
{
namespace hrms
{
namespace daemon
{
    namespace bio       = ::boost::asio;
    namespace beast     = ::boost::beast;

    class HrmsServer final
    {
    public:
        /**
         * @brief Bind the listening socket and start config.ioThreads io threads
         * @return kInvalidArgument for an unusable address, kNotInitialized when bind/listen fails
         */
        core::Result< void >                            start() noexcept;

        /**
         * @brief Close the acceptor, stop the io context and join the threads
         */
        void                                            stop() noexcept;

        core::Bool                                      isRunning() const noexcept          { return m_bRunning.load(); }

        /**
         * @brief Port actually bound, useful when the configured port is 0
         */
        core::UInt16                                    port() const noexcept;

        HrmsServer( const HrmsConfig& config, ApiRouter& router, SubscriptionRegistry& registry );
        ~HrmsServer();

    private:
        HrmsServer( const HrmsServer& ) = delete;
        HrmsServer& operator=( const HrmsServer& ) = delete;

        void                                            innerDoAccept();
        void                                            onAccept( beast::error_code ec, bio::ip::tcp::socket socket );
        void                                            innerLoop();

    private:
        core::String                                    m_address;
        core::UInt16                                    m_iPort;
        core::UInt32                                    m_ioThreads;

        ApiRouter&                                      m_router;
        SubscriptionRegistry&                           m_registry;

        bio::io_context                                 m_ioContext;
        core::UniqueHandle< bio::ip::tcp::acceptor >    m_acceptor;
        core::Vector< ::std::thread >                   m_threads;
        ::std::atomic< core::Bool >                     m_bRunning{ false };
    };

} // namespace daemon
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DAEMON_HRMSSERVER_HPP
