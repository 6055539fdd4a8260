#pragma once

#define LCU_COMPANION_VERSION_MAJOR 0
#define LCU_COMPANION_VERSION_MINOR 1
#define LCU_COMPANION_VERSION_PATCH 0

#define LCU_COMPANION_STRINGIFY(x) #x
#define LCU_COMPANION_TOSTRING(x) LCU_COMPANION_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define LCU_COMPANION_VERSION_STRING \
    LCU_COMPANION_TOSTRING(LCU_COMPANION_VERSION_MAJOR) "." \
    LCU_COMPANION_TOSTRING(LCU_COMPANION_VERSION_MINOR) "." \
    LCU_COMPANION_TOSTRING(LCU_COMPANION_VERSION_PATCH)
