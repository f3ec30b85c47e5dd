/**
 * @file CUuidIdentityGenerator.cpp
 * @brief Random (version 4) UUIDs from Boost.Uuid
 * @version 0.1
 * @date 2025-12-02
 */

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "IIdentityGenerator.hpp"

namespace lap
{
namespace hrms
{
    core::String UuidIdentityGenerator::NewIdentity() noexcept
    {
        try {
            // random_generator seeds itself per instance and is not thread-safe
            thread_local ::boost::uuids::random_generator generator;

            return ::boost::uuids::to_string( generator() );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot generate identity: " << e.what();
        }

        return core::String();
    }
} // namespace hrms
} // namespace lap
