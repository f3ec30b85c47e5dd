/**
 * @file ICredentialService.hpp
 * @brief One-way credential hashing used by account creation and login
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_ICREDENTIALSERVICE_HPP
#define LAP_HRMS_ICREDENTIALSERVICE_HPP

#include <lap/core/CResult.hpp>
#include "CDataType.hpp"

namespace lap
{
namespace hrms
{
    class ICredentialService
    {
    public:
        virtual ~ICredentialService() noexcept = default;

        /**
         * @brief Produce an opaque encoding of secret, never the plaintext
         */
        virtual core::Result< core::String > Hash( core::StringView secret ) const noexcept = 0;

        /**
         * @brief Compare secret against an encoding produced by Hash()
         * @return false for a mismatch or an undecodable encoding
         */
        virtual core::Bool Verify( core::StringView secret, core::StringView encoded ) const noexcept = 0;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_ICREDENTIALSERVICE_HPP
