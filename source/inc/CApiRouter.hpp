/**
 * @file CApiRouter.hpp
 * @brief Transport-independent mapping of HTTP requests onto RecordService
 * @version 0.1
 * @date 2025-12-02
 * 
 * Routes:
 * - GET    /api/{employees|attendance|leaves|notifications}
 * - POST   /api/{employees|attendance|leaves|notifications}
 * - DELETE /api/employees/{id}
 * - PUT    /api/leaves/{id}            body {status}
 * - POST   /api/create-super           body {username, password}
 * - POST   /api/login                  body {username, password}
 * - OPTIONS *                          CORS preflight
 */
#ifndef LAP_HRMS_APIROUTER_HPP
#define LAP_HRMS_APIROUTER_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CHrmsErrorDomain.hpp"
#include "CRecordService.hpp"

namespace lap
{
namespace hrms
{
    struct ApiResponse
    {
        core::UInt32        status{ 200 };
        nlohmann::json      body;           ///< null means no body (204)
    };

    class ApiRouter final
    {
    public:
        IMP_OPERATOR_NEW(ApiRouter)

        /**
         * @brief Handle one request
         * @param method HTTP method, upper case
         * @param target request target, a query string is ignored
         * @param body raw request body
         */
        ApiResponse                             Route( core::StringView method, core::StringView target, core::StringView body ) noexcept;

        /**
         * @brief Response for a failed operation, never exposes internal detail
         */
        static ApiResponse                      ErrorResponse( const core::ErrorCode& errorCode ) noexcept;

        static ApiResponse                      ErrorResponse( core::UInt32 status, const core::Char* message ) noexcept;

        explicit ApiRouter( RecordService& service ) noexcept
            : m_service( service )
        {
            ;
        }

    private:
        ApiResponse                             dispatch( core::StringView method, core::StringView target, core::StringView body );
        ApiResponse                             routeCollection( core::StringView method, Collection collection, core::StringView body ) noexcept;
        ApiResponse                             routeRecord( core::StringView method, Collection collection, const core::String& id, core::StringView body ) noexcept;
        ApiResponse                             createSuperAdmin( core::StringView body ) noexcept;
        ApiResponse                             login( core::StringView body ) noexcept;

        static core::Bool                       parseBody( core::StringView body, nlohmann::json& parsed ) noexcept;
        static core::Bool                       percentDecode( core::StringView encoded, core::String& decoded ) noexcept;

    private:
        RecordService&                          m_service;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_APIROUTER_HPP
