/**
 * @file CApiRouter.cpp
 * @brief Transport-independent mapping of HTTP requests onto RecordService
 * @version 0.1
 * @date 2025-12-02
 */

#include "CApiRouter.hpp"

namespace lap
{
namespace hrms
{
    static constexpr const core::Char* kApiPrefix = "/api/";

    static nlohmann::json okBody()
    {
        return nlohmann::json{ { "ok", true } };
    }

    // ==================== Error Mapping ====================

    ApiResponse ApiRouter::ErrorResponse( core::UInt32 status, const core::Char* message ) noexcept
    {
        ApiResponse response;
        response.status = status;
        response.body = nlohmann::json{ { "error", message } };
        return response;
    }

    ApiResponse ApiRouter::ErrorResponse( const core::ErrorCode& errorCode ) noexcept
    {
        switch ( ClassifyError( errorCode ) ) {
        case ErrorCategory::kBadInput:
            return ErrorResponse( 400, "Invalid request" );
        case ErrorCategory::kConflict:
            return ErrorResponse( 409, "Already exists" );
        case ErrorCategory::kUnauthorized:
            return ErrorResponse( 401, "Invalid credentials" );
        case ErrorCategory::kNotFound:
            return ErrorResponse( 404, "Not found" );
        case ErrorCategory::kServerFailure:
            break;
        }

        return ErrorResponse( 500, "Server error" );
    }

    // ==================== Dispatch ====================

    ApiResponse ApiRouter::Route( core::StringView method, core::StringView target, core::StringView body ) noexcept
    {
        try {
            return dispatch( method, target, body );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Request " << core::String( method ) << " " << core::String( target ) << " failed: " << e.what();
            return ErrorResponse( 500, "Server error" );
        }
    }

    ApiResponse ApiRouter::dispatch( core::StringView method, core::StringView target, core::StringView body )
    {
        if ( method == "OPTIONS" ) {
            ApiResponse response;
            response.status = 204;
            return response;
        }

        core::StringView path = target.substr( 0, target.find( '?' ) );

        core::StringView prefix( kApiPrefix );
        if ( path.size() <= prefix.size() || path.substr( 0, prefix.size() ) != prefix ) {
            return ErrorResponse( 404, "Not found" );
        }
        path.remove_prefix( prefix.size() );

        if ( path == "create-super" ) {
            return method == "POST" ? createSuperAdmin( body ) : ErrorResponse( 404, "Not found" );
        }
        if ( path == "login" ) {
            return method == "POST" ? login( body ) : ErrorResponse( 404, "Not found" );
        }

        core::Size slash = path.find( '/' );
        core::StringView name = path.substr( 0, slash );

        Collection collection;
        if ( !CollectionFromName( name, collection ) || collection == Collection::kUsers ) {
            return ErrorResponse( 404, "Not found" );
        }

        if ( slash == core::StringView::npos ) return routeCollection( method, collection, body );

        core::String id;
        core::StringView encodedId = path.substr( slash + 1 );
        if ( encodedId.empty() || encodedId.find( '/' ) != core::StringView::npos || !percentDecode( encodedId, id ) ) {
            return ErrorResponse( 404, "Not found" );
        }

        return routeRecord( method, collection, id, body );
    }

    ApiResponse ApiRouter::routeCollection( core::StringView method, Collection collection, core::StringView body ) noexcept
    {
        if ( method == "GET" ) {
            auto listResult = m_service.List( collection );
            if ( !listResult.HasValue() ) return ErrorResponse( listResult.Error() );

            ApiResponse response;
            response.body = listResult.Value();
            return response;
        }

        if ( method == "POST" ) {
            nlohmann::json record;
            if ( !parseBody( body, record ) || !record.is_object() ) return ErrorResponse( 400, "Invalid request" );

            auto upsertResult = m_service.Upsert( collection, record );
            if ( !upsertResult.HasValue() ) return ErrorResponse( upsertResult.Error() );

            ApiResponse response;
            response.body = okBody();
            response.body[ "id" ] = upsertResult.Value().id;
            return response;
        }

        return ErrorResponse( 404, "Not found" );
    }

    ApiResponse ApiRouter::routeRecord( core::StringView method, Collection collection, const core::String& id, core::StringView body ) noexcept
    {
        if ( method == "DELETE" && collection == Collection::kEmployees ) {
            auto deleteResult = m_service.DeleteEmployee( id );
            if ( !deleteResult.HasValue() ) return ErrorResponse( deleteResult.Error() );

            ApiResponse response;
            response.body = okBody();
            return response;
        }

        if ( method == "PUT" && collection == Collection::kLeaves ) {
            nlohmann::json request;
            if ( !parseBody( body, request ) || !request.is_object() ) return ErrorResponse( 400, "Invalid request" );

            auto&& status = request.find( LAP_HRMS_FIELD_STATUS );
            if ( status == request.end() ) return ErrorResponse( 400, "Invalid request" );

            auto updateResult = m_service.UpdateLeaveStatus( id, *status );
            if ( !updateResult.HasValue() ) return ErrorResponse( updateResult.Error() );

            ApiResponse response;
            response.body = okBody();
            return response;
        }

        return ErrorResponse( 404, "Not found" );
    }

    // ==================== Accounts ====================

    ApiResponse ApiRouter::createSuperAdmin( core::StringView body ) noexcept
    {
        nlohmann::json request;
        if ( !parseBody( body, request ) || !request.is_object() ) return ErrorResponse( 400, "Invalid request" );

        auto&& username = request.find( LAP_HRMS_FIELD_USERNAME );
        auto&& password = request.find( LAP_HRMS_FIELD_PASSWORD );
        if ( username == request.end() || !username->is_string() || username->get_ref< const std::string& >().empty() ||
             password == request.end() || !password->is_string() || password->get_ref< const std::string& >().empty() ) {
            return ErrorResponse( 400, "Missing username/password" );
        }

        auto createResult = m_service.CreateSuperAdmin( username->get_ref< const std::string& >(),
                                                        password->get_ref< const std::string& >() );
        if ( !createResult.HasValue() ) return ErrorResponse( createResult.Error() );

        ApiResponse response;
        response.body = okBody();
        return response;
    }

    ApiResponse ApiRouter::login( core::StringView body ) noexcept
    {
        nlohmann::json request;
        if ( !parseBody( body, request ) || !request.is_object() ) return ErrorResponse( 400, "Invalid request" );

        auto&& username = request.find( LAP_HRMS_FIELD_USERNAME );
        auto&& password = request.find( LAP_HRMS_FIELD_PASSWORD );
        if ( username == request.end() || !username->is_string() ||
             password == request.end() || !password->is_string() ) {
            return ErrorResponse( 401, "Invalid credentials" );
        }

        auto loginResult = m_service.Login( username->get_ref< const std::string& >(),
                                            password->get_ref< const std::string& >() );
        if ( !loginResult.HasValue() ) return ErrorResponse( loginResult.Error() );

        ApiResponse response;
        response.body = loginResult.Value();
        return response;
    }

    // ==================== Helpers ====================

    core::Bool ApiRouter::parseBody( core::StringView body, nlohmann::json& parsed ) noexcept
    {
        if ( body.empty() ) {
            parsed = nlohmann::json::object();
            return true;
        }

        parsed = nlohmann::json::parse( body.begin(), body.end(), nullptr, false );
        return !parsed.is_discarded();
    }

    core::Bool ApiRouter::percentDecode( core::StringView encoded, core::String& decoded ) noexcept
    {
        auto nibble = []( core::Char c ) -> core::Int32 {
            if ( c >= '0' && c <= '9' ) return c - '0';
            if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
            if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
            return -1;
        };

        decoded.clear();
        decoded.reserve( encoded.size() );
        for ( core::Size i = 0; i < encoded.size(); ++i ) {
            if ( encoded[i] != '%' ) {
                decoded.push_back( encoded[i] );
                continue;
            }

            if ( i + 2 >= encoded.size() ) return false;

            core::Int32 high = nibble( encoded[i + 1] );
            core::Int32 low = nibble( encoded[i + 2] );
            if ( high < 0 || low < 0 ) return false;

            decoded.push_back( static_cast< core::Char >( ( high << 4 ) | low ) );
            i += 2;
        }

        return true;
    }

} // namespace hrms
} // namespace lap
