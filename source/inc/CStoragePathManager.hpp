/**
 * @file CStoragePathManager.hpp
 * @brief Storage path management of the HRMS document store
 * 
 * @note All paths use Core::Path
 */

#ifndef LAP_HRMS_CSTORAGEPATHMANAGER_HPP
#define LAP_HRMS_CSTORAGEPATHMANAGER_HPP

#include <lap/core/CCore.hpp>
#include <lap/core/CResult.hpp>

namespace lap {
namespace hrms {

/**
 * @class CStoragePathManager
 * @brief Builds and creates the directory layout of a document store instance
 * 
 * Directory Structure:
 * {storageRoot}/
 * └── {instance}/
 *     ├── current/        # Active document
 *     ├── update/         # Staging file of an in-flight persist
 *     └── redundancy/     # Previous document, used to recover a corrupted current/
 */
class CStoragePathManager {
public:
    /**
     * @brief Get the path for a document store instance
     * @param storageRoot Root directory (e.g., "/tmp/lap_hrms")
     * @param instance Instance name (e.g., "default" or "/site/a")
     * @return {storageRoot}/{instance}
     * @note Leading slash is removed from instance
     */
    static core::String getInstancePath(core::StringView storageRoot, core::StringView instance);

    /**
     * @brief Get the document file path inside one category directory
     * @param instancePath Path returned by getInstancePath()
     * @param category "current", "update" or "redundancy"
     * @param fileName Document file name
     */
    static core::String getDocumentPath(core::StringView instancePath,
                                        core::StringView category,
                                        core::StringView fileName);

    /**
     * @brief Create base directory plus current/, update/ and redundancy/
     * @return kStorageUnavailable if any directory cannot be created
     */
    static core::Result<void> createStorageStructure(core::StringView storageRoot,
                                                     core::StringView instance);

    /**
     * @brief Check if a path exists and is a directory
     */
    static bool pathExists(core::StringView path);

private:
    static core::String normalizeInstancePath(core::StringView instance);
};

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_CSTORAGEPATHMANAGER_HPP
