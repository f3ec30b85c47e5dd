/**
 * @file CFieldPolicy.cpp
 * @brief Per-collection rules for caller-supplied fields
 * @version 0.1
 * @date 2025-12-02
 */

#include <algorithm>
#include "CFieldPolicy.hpp"

namespace lap
{
namespace hrms
{
    core::Bool FieldPolicy::IsIdentityField( Collection collection, core::StringView field ) noexcept
    {
        if ( field == LAP_HRMS_FIELD_ID ) return true;

        if ( collection == Collection::kAttendance ) {
            return field == LAP_HRMS_FIELD_EMPLOYEE_ID || field == LAP_HRMS_FIELD_DATE;
        }

        return false;
    }

    core::Bool FieldPolicy::IsProtectedField( Collection collection, core::StringView field ) noexcept
    {
        if ( IsIdentityField( collection, field ) ) return true;

        if ( collection == Collection::kUsers ) {
            return field == LAP_HRMS_FIELD_PASSWORD || field == LAP_HRMS_FIELD_ROLE;
        }

        return false;
    }

    Record FieldPolicy::Filter( Collection collection, const Record& incoming ) const
    {
        auto&& it = m_allowedFields.find( CollectionName( collection ) );
        if ( it == m_allowedFields.end() || it->second.empty() ) return incoming;

        auto&& allowed = it->second;

        Record filtered = Record::object();
        for ( auto&& field : incoming.items() ) {
            if ( IsIdentityField( collection, field.key() ) ||
                 ::std::find( allowed.begin(), allowed.end(), field.key() ) != allowed.end() ) {
                filtered[ field.key() ] = field.value();
            } else {
                LAP_HRMS_LOG_DEBUG << "Dropping field " << field.key() << " not allowed on " << CollectionName( collection );
            }
        }

        return filtered;
    }

    void FieldPolicy::Protect( Collection collection, const Record& existing, Record& incoming )
    {
        for ( auto it = incoming.begin(); it != incoming.end(); ++it ) {
            if ( !IsProtectedField( collection, it.key() ) ) continue;

            auto&& stored = existing.find( it.key() );
            if ( stored != existing.end() ) it.value() = *stored;
        }
    }
} // namespace hrms
} // namespace lap
