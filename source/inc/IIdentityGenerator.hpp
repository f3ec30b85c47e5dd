/**
 * @file IIdentityGenerator.hpp
 * @brief Source of record identities
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_IIDENTITYGENERATOR_HPP
#define LAP_HRMS_IIDENTITYGENERATOR_HPP

#include <lap/core/CMemory.hpp>
#include "CDataType.hpp"

namespace lap
{
namespace hrms
{
    class IIdentityGenerator
    {
    public:
        virtual ~IIdentityGenerator() noexcept = default;

        /**
         * @brief Random token, globally unique with negligible collision probability
         * @return empty string when the random source fails
         */
        virtual core::String NewIdentity() noexcept = 0;
    };

    /**
     * @brief Random (version 4) UUIDs from Boost.Uuid
     */
    class UuidIdentityGenerator final : public IIdentityGenerator
    {
    public:
        IMP_OPERATOR_NEW(UuidIdentityGenerator)

        core::String NewIdentity() noexcept override;

        UuidIdentityGenerator() noexcept = default;
        ~UuidIdentityGenerator() noexcept override = default;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_IIDENTITYGENERATOR_HPP
