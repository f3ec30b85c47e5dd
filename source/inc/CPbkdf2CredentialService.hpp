/**
 * @file CPbkdf2CredentialService.hpp
 * @brief PBKDF2-HMAC-SHA256 credential service (OpenSSL)
 * @version 0.1
 * @date 2025-12-02
 * 
 * Encoding: pbkdf2-sha256$<iterations>$<salt-hex>$<hash-hex>
 */
#ifndef LAP_HRMS_PBKDF2CREDENTIALSERVICE_HPP
#define LAP_HRMS_PBKDF2CREDENTIALSERVICE_HPP

#include <lap/core/CMemory.hpp>
#include "ICredentialService.hpp"

namespace lap
{
namespace hrms
{
    class Pbkdf2CredentialService final : public ICredentialService
    {
    public:
        IMP_OPERATOR_NEW(Pbkdf2CredentialService)

        static constexpr core::Size     kSaltLength     = 16;
        static constexpr core::Size     kHashLength     = 32;
        static constexpr const core::Char* kScheme      = "pbkdf2-sha256";

    public:
        core::Result< core::String > Hash( core::StringView secret ) const noexcept override;
        core::Bool Verify( core::StringView secret, core::StringView encoded ) const noexcept override;

        explicit Pbkdf2CredentialService( core::UInt32 iterations = LAP_HRMS_DEFAULT_PBKDF2_ITERATIONS ) noexcept
            : m_iterations( iterations == 0 ? LAP_HRMS_DEFAULT_PBKDF2_ITERATIONS : iterations )
        {
            ;
        }
        ~Pbkdf2CredentialService() noexcept override = default;

    private:
        static core::Bool derive( core::StringView secret, const core::UInt8* salt, core::Size saltLength,
                                  core::UInt32 iterations, core::UInt8* out, core::Size outLength ) noexcept;
        static core::Bool fromHex( core::StringView hex, core::Vector< core::UInt8 >& bytes ) noexcept;

    private:
        core::UInt32                    m_iterations;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_PBKDF2CREDENTIALSERVICE_HPP
