#pragma once

// =====================================================
// Firmware Identity
// =====================================================
// Reported by HELLO and the boot log line. Bump MAJOR
// when the host protocol changes incompatibly.
// =====================================================

#define PICKLIGHT_FW_MAJOR 1
#define PICKLIGHT_FW_MINOR 0
#define PICKLIGHT_FW_PATCH 0

#define PICKLIGHT_STR_(x) #x
#define PICKLIGHT_STR(x) PICKLIGHT_STR_(x)

#define PICKLIGHT_FW_VERSION \
    PICKLIGHT_STR(PICKLIGHT_FW_MAJOR) "." PICKLIGHT_STR(PICKLIGHT_FW_MINOR) "." PICKLIGHT_STR(PICKLIGHT_FW_PATCH)

// Host link protocol revision
#define PICKLIGHT_HOST_PROTOCOL 1

// Build stamp; the git hash comes from -DPICKLIGHT_BUILD_HASH=\"...\"
#define PICKLIGHT_BUILD_STAMP __DATE__ " " __TIME__
#ifndef PICKLIGHT_BUILD_HASH
#define PICKLIGHT_BUILD_HASH "dev"
#endif

// =====================================================
// Logging
// =====================================================

// Default threshold: 0=debug 1=info 2=warn 3=error
#ifndef PICKLIGHT_LOG_LEVEL
#define PICKLIGHT_LOG_LEVEL 1
#endif
