/**
 * @file CPbkdf2CredentialService.cpp
 * @brief PBKDF2-HMAC-SHA256 credential service (OpenSSL)
 * @version 0.1
 * @date 2025-12-02
 */

#include <cstdlib>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <lap/core/CCrypto.hpp>
#include "CHrmsErrorDomain.hpp"
#include "CPbkdf2CredentialService.hpp"

namespace lap
{
namespace hrms
{
    core::Result< core::String > Pbkdf2CredentialService::Hash( core::StringView secret ) const noexcept
    {
        using result = core::Result< core::String >;

        core::UInt8 salt[ kSaltLength ];
        if ( ::RAND_bytes( salt, static_cast< int >( kSaltLength ) ) != 1 ) {
            LAP_HRMS_LOG_ERROR << "RAND_bytes failed to produce a salt";
            return result::FromError( HrmsErrc::kStorageError );
        }

        core::UInt8 hash[ kHashLength ];
        if ( !derive( secret, salt, kSaltLength, m_iterations, hash, kHashLength ) ) {
            return result::FromError( HrmsErrc::kStorageError );
        }

        core::String encoded( kScheme );
        encoded += "$" + ::std::to_string( m_iterations );
        encoded += "$" + core::Crypto::Util::bytesToHex( salt, kSaltLength );
        encoded += "$" + core::Crypto::Util::bytesToHex( hash, kHashLength );

        return result::FromValue( ::std::move( encoded ) );
    }

    core::Bool Pbkdf2CredentialService::Verify( core::StringView secret, core::StringView encoded ) const noexcept
    {
        // scheme$iterations$salt$hash
        core::Vector< core::StringView > parts;
        core::Size start = 0;
        while ( true ) {
            core::Size pos = encoded.find( '$', start );
            parts.emplace_back( encoded.substr( start, pos == core::StringView::npos ? core::StringView::npos : pos - start ) );
            if ( pos == core::StringView::npos ) break;
            start = pos + 1;
        }

        if ( parts.size() != 4 || parts[0] != kScheme ) return false;

        core::String iterText( parts[1] );
        core::Char* end = nullptr;
        unsigned long iterations = ::std::strtoul( iterText.c_str(), &end, 10 );
        if ( iterText.empty() || end == nullptr || *end != '\0' || iterations == 0 || iterations > 0xFFFFFFFFUL ) return false;

        core::Vector< core::UInt8 > salt;
        core::Vector< core::UInt8 > expected;
        if ( !fromHex( parts[2], salt ) || !fromHex( parts[3], expected ) ) return false;
        if ( salt.empty() || expected.empty() ) return false;

        core::Vector< core::UInt8 > actual( expected.size() );
        if ( !derive( secret, salt.data(), salt.size(), static_cast< core::UInt32 >( iterations ), actual.data(), actual.size() ) ) {
            return false;
        }

        return ::CRYPTO_memcmp( actual.data(), expected.data(), expected.size() ) == 0;
    }

    core::Bool Pbkdf2CredentialService::derive( core::StringView secret, const core::UInt8* salt, core::Size saltLength,
                                                core::UInt32 iterations, core::UInt8* out, core::Size outLength ) noexcept
    {
        if ( ::PKCS5_PBKDF2_HMAC( secret.data(), static_cast< int >( secret.size() ),
                                  salt, static_cast< int >( saltLength ),
                                  static_cast< int >( iterations ), ::EVP_sha256(),
                                  static_cast< int >( outLength ), out ) != 1 ) {
            LAP_HRMS_LOG_ERROR << "PKCS5_PBKDF2_HMAC failed";
            return false;
        }

        return true;
    }

    core::Bool Pbkdf2CredentialService::fromHex( core::StringView hex, core::Vector< core::UInt8 >& bytes ) noexcept
    {
        auto nibble = []( core::Char c ) -> core::Int32 {
            if ( c >= '0' && c <= '9' ) return c - '0';
            if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
            if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
            return -1;
        };

        if ( hex.size() % 2 != 0 ) return false;

        bytes.clear();
        bytes.reserve( hex.size() / 2 );
        for ( core::Size i = 0; i < hex.size(); i += 2 ) {
            core::Int32 high = nibble( hex[i] );
            core::Int32 low = nibble( hex[i + 1] );
            if ( high < 0 || low < 0 ) return false;

            bytes.push_back( static_cast< core::UInt8 >( ( high << 4 ) | low ) );
        }

        return true;
    }

} // namespace hrms
} // namespace lap
