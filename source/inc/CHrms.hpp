/**
 * @file CHrms.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief 
 * @version 0.1
 * @date 2025-12-02
 * 
 * 
 */
#ifndef LAP_HRMS_HRMS_HPP
#define LAP_HRMS_HRMS_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// hrms common
#include "CDataType.hpp"
#include "CHrmsErrorDomain.hpp"
#include "CHrmsConfig.hpp"

// document store
#include "CStoragePathManager.hpp"
#include "CDocument.hpp"
#include "IDocumentBackend.hpp"
#include "CDocumentFileBackend.hpp"
#include "CDocumentMemoryBackend.hpp"

// collaborators
#include "ICredentialService.hpp"
#include "CPbkdf2CredentialService.hpp"
#include "IIdentityGenerator.hpp"

// service
#include "CFieldPolicy.hpp"
#include "CChangeNotifier.hpp"
#include "CRecordService.hpp"
#include "CApiRouter.hpp"

#endif
