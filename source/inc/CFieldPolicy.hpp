/**
 * @file CFieldPolicy.hpp
 * @brief Per-collection rules for caller-supplied fields
 * @version 0.1
 * @date 2025-12-02
 * 
 * - Identity fields always pass the allow-list
 * - Protected fields keep their stored value when a record is merged
 */
#ifndef LAP_HRMS_FIELDPOLICY_HPP
#define LAP_HRMS_FIELDPOLICY_HPP

#include <lap/core/CMemory.hpp>
#include "CDataType.hpp"

namespace lap
{
namespace hrms
{
    class FieldPolicy final
    {
    public:
        IMP_OPERATOR_NEW(FieldPolicy)

        using AllowList = core::Map< core::String, core::Vector< core::String > >;

        /**
         * @brief Drop incoming fields not on the collection's allow-list
         * @note No allow-list configured for the collection means every field passes
         */
        Record                          Filter( Collection collection, const Record& incoming ) const;

        /**
         * @brief Force protected fields of incoming to the values existing already stores
         */
        static void                     Protect( Collection collection, const Record& existing, Record& incoming );

        static core::Bool               IsIdentityField( Collection collection, core::StringView field ) noexcept;
        static core::Bool               IsProtectedField( Collection collection, core::StringView field ) noexcept;

        explicit FieldPolicy( AllowList allowedFields = AllowList() )
            : m_allowedFields( ::std::move( allowedFields ) )
        {
            ;
        }

    private:
        AllowList                       m_allowedFields;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_FIELDPOLICY_HPP
