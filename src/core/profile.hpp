#pragma once

#if defined(TRACY_ENABLE)
  #include <tracy/Tracy.hpp>
  #define KINDLE_PROFILE_SCOPE_N(name) ZoneScopedN(name)
#else
  #define KINDLE_PROFILE_SCOPE_N(name) (void)0
#endif
