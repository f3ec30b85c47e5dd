/**
 * @file CHrmsErrorDomain.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Error domain of the HRMS record store
 * @version 0.1
 * @date 2025-12-02
 * 
 * 
 */
#ifndef LAP_HRMS_HRMSERRORDOMAIN_HPP
#define LAP_HRMS_HRMSERRORDOMAIN_HPP

#include <exception>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CTypedef.hpp>

namespace lap
{
namespace hrms
{
    enum class HrmsErrc : core::ErrorDomain::CodeType 
    {
        kValidationFailed           = 1,
        kDuplicateUser              = 2,
        kInvalidCredentials         = 3,
        kNotFound                   = 4,
        kStorageError               = 5,
        kStorageUnavailable         = 6,
        kIntegrityCorrupted         = 7,
        kNotInitialized             = 8,
        kInvalidArgument            = 9
    };

    inline constexpr const core::Char* HrmsErrMessage( HrmsErrc errCode )
    {
        switch ( errCode ) {
        case HrmsErrc::kValidationFailed:
            return "A required field is missing or malformed.";
        case HrmsErrc::kDuplicateUser:
            return "A user with the same name already exists.";
        case HrmsErrc::kInvalidCredentials:
            return "Invalid credentials.";
        case HrmsErrc::kNotFound:
            return "The referenced record does not exist.";
        case HrmsErrc::kStorageError:
            return "Persisting the document failed.";
        case HrmsErrc::kStorageUnavailable:
            return "The storage medium cannot be accessed or did not respond in time.";
        case HrmsErrc::kIntegrityCorrupted:
            return "Stored document cannot be read because its structural integrity is corrupted.";
        case HrmsErrc::kNotInitialized:
            return "The record store is used before it was opened.";
        case HrmsErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        default:
            return "Unknown error";
        }
    }

    class HrmsException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(HrmsException)
        
        explicit HrmsException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~HrmsException() noexcept 
        {
            ;
        }

        const core::Char* what() const noexcept 
        {
            return HrmsErrMessage( static_cast< HrmsErrc > ( Error().Value() ) );
        }
    };

    class HrmsErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(HrmsErrorDomain)
        
        using Errc          = HrmsErrc;
        using Exception     = HrmsException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "HrmsErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return HrmsErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw HrmsException( errorCode ); }

        constexpr HrmsErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr HrmsErrorDomain g_hrmsErrorDomain;
    
    constexpr const core::ErrorDomain& GetHrmsDomain () noexcept
    {
        return g_hrmsErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( HrmsErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetHrmsDomain(), data };
    }

    /**
     * @brief Caller-visible failure category
     */
    enum class ErrorCategory : core::UInt8
    {
        kBadInput       = 0,
        kConflict       = 1,
        kUnauthorized   = 2,
        kNotFound       = 3,
        kServerFailure  = 4
    };

    inline ErrorCategory ClassifyError( const core::ErrorCode &errorCode ) noexcept
    {
        if ( errorCode.Domain() != GetHrmsDomain() ) return ErrorCategory::kServerFailure;

        switch ( static_cast< HrmsErrc >( errorCode.Value() ) ) {
        case HrmsErrc::kValidationFailed:
        case HrmsErrc::kInvalidArgument:
            return ErrorCategory::kBadInput;
        case HrmsErrc::kDuplicateUser:
            return ErrorCategory::kConflict;
        case HrmsErrc::kInvalidCredentials:
            return ErrorCategory::kUnauthorized;
        case HrmsErrc::kNotFound:
            return ErrorCategory::kNotFound;
        default:
            return ErrorCategory::kServerFailure;
        }
    }
} // namespace hrms
} // namespace lap

#endif
