#ifndef GREENHAUL_VERSION_HXX
#define GREENHAUL_VERSION_HXX

#define GREENHAUL_STR_HELPER(x) #x
#define GREENHAUL_STR(x) GREENHAUL_STR_HELPER(x)

#ifndef GREENHAUL_NAME
#error Missing definition GREENHAUL_NAME
#else
#define GREENHAUL_PROJECT_NAME GREENHAUL_STR(GREENHAUL_NAME)
#endif

#ifndef GREENHAUL_VERSION_TWEAK
#define GREENHAUL_VERSION_TWEAK ""
#endif

#define GREENHAUL_VERSION_STRING                                               \
  (GREENHAUL_STR(GREENHAUL_VERSION_MAJOR) "." GREENHAUL_STR(                   \
    GREENHAUL_VERSION_MINOR) "." GREENHAUL_STR(GREENHAUL_VERSION_PATCH)        \
     GREENHAUL_VERSION_TWEAK)
#endif
