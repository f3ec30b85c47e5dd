/**
 * @file CStoragePathManager.cpp
 * @brief Storage path management of the HRMS document store
 */

#include "CStoragePathManager.hpp"
#include "CDataType.hpp"
#include "CHrmsErrorDomain.hpp"
#include <lap/core/CPath.hpp>
#include <lap/log/CLog.hpp>

namespace lap {
namespace hrms {

core::String CStoragePathManager::getInstancePath(core::StringView storageRoot, core::StringView instance) {
    core::String root(storageRoot.data(), storageRoot.size());
    return core::Path::appendString(root, normalizeInstancePath(instance));
}

core::String CStoragePathManager::getDocumentPath(core::StringView instancePath,
                                                  core::StringView category,
                                                  core::StringView fileName) {
    core::String categoryDir = core::Path::appendString(core::String(instancePath.data(), instancePath.size()),
                                                        core::String(category.data(), category.size()));
    return core::Path::appendString(categoryDir, core::String(fileName.data(), fileName.size()));
}

core::Result<void> CStoragePathManager::createStorageStructure(core::StringView storageRoot,
                                                               core::StringView instance) {
    core::String basePath = getInstancePath(storageRoot, instance);

    if (!core::Path::createDirectory(basePath)) {
        LAP_HRMS_LOG_ERROR << "Failed to create base directory: " << basePath.data();
        return core::Result<void>::FromError(HrmsErrc::kStorageUnavailable);
    }

    core::Vector<core::String> subdirs = {LAP_HRMS_CATEGORY_CURRENT, LAP_HRMS_CATEGORY_UPDATE, LAP_HRMS_CATEGORY_REDUNDANCY};
    for (const auto& subdir : subdirs) {
        core::String fullPath = core::Path::appendString(basePath, subdir);
        if (!core::Path::createDirectory(fullPath)) {
            LAP_HRMS_LOG_ERROR << "Failed to create subdirectory: " << fullPath.data();
            return core::Result<void>::FromError(HrmsErrc::kStorageUnavailable);
        }
    }

    LAP_HRMS_LOG_INFO << "Created storage structure: " << basePath.data();
    return core::Result<void>::FromValue();
}

bool CStoragePathManager::pathExists(core::StringView path) {
    return core::Path::isDirectory(path);
}

core::String CStoragePathManager::normalizeInstancePath(core::StringView instance) {
    core::String normalized(instance.data(), instance.size());

    while (!normalized.empty() && normalized[0] == '/') {
        normalized = normalized.substr(1);
    }

    if (normalized.empty()) {
        normalized = LAP_HRMS_DEFAULT_INSTANCE;
    }

    return normalized;
}

} // namespace hrms
} // namespace lap
