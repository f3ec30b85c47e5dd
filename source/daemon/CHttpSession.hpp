/**
 * @file CHttpSession.hpp
 * @brief One HTTP/1.1 connection of the HRMS daemon
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_DAEMON_HTTPSESSION_HPP
#define LAP_HRMS_DAEMON_HTTPSESSION_HPP

#include <memory>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>

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
    namespace http      = beast::http;

    /**
     * @brief Reads requests in a keep-alive loop and answers through ApiRouter
     *
     * GET /ws with an Upgrade header hands the socket over to a WebSocketSubscriber.
     */
    class HttpSession final : public ::std::enable_shared_from_this< HttpSession >
    {
    public:
        static constexpr ::std::uint64_t    kBodyLimit          = 1024 * 1024;
        static constexpr ::std::uint32_t    kReadTimeoutSec     = 30;
        static constexpr const core::Char*  kWebSocketTarget    = "/ws";

        void run();

        HttpSession( bio::ip::tcp::socket&& socket, ApiRouter& router, SubscriptionRegistry& registry );
        ~HttpSession() = default;

    private:
        void doRead();
        void onRead( beast::error_code ec, ::std::size_t bytes );
        void send( core::UInt32 status, const nlohmann::json& body, core::UInt32 version, core::Bool keepAlive );
        void onWrite( core::Bool close, beast::error_code ec, ::std::size_t bytes );
        void doClose();

    private:
        beast::tcp_stream                                               m_stream;
        beast::flat_buffer                                              m_buffer;
        ::boost::optional< http::request_parser< http::string_body > >  m_parser;
        ::std::shared_ptr< http::response< http::string_body > >        m_response;
        ApiRouter&                                                      m_router;
        SubscriptionRegistry&                                           m_registry;
    };

} // namespace daemon
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DAEMON_HTTPSESSION_HPP
