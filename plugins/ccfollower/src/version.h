#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// This file is used by the VST3 SDK for version reporting.
// Keep in sync with CMakeLists.txt project version.
// ==============================================================================

#define MAJOR_VERSION_STR "1"
#define MAJOR_VERSION_INT 1

#define SUB_VERSION_STR "0"
#define SUB_VERSION_INT 0

#define RELEASE_NUMBER_STR "0"
#define RELEASE_NUMBER_INT 0

#define BUILD_NUMBER_STR "1"
#define BUILD_NUMBER_INT 1

#define FULL_VERSION_STR MAJOR_VERSION_STR "." SUB_VERSION_STR "." RELEASE_NUMBER_STR "." BUILD_NUMBER_STR

#define VERSION_STR MAJOR_VERSION_STR "." SUB_VERSION_STR "." RELEASE_NUMBER_STR

#define stringOriginalFilename "CcFollower.vst3"
#define stringFileDescription "CC Follower VST3 Plugin"
#define stringCompanyName "Cntrl"
#define stringVendorURL ""
#define stringVendorEmail ""
#define stringLegalCopyright "Copyright (c) 2026 Cntrl"
#define stringLegalTrademarks ""
