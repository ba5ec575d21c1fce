#pragma once

// Tracy instrumentation, compiled out unless TRACY_ENABLE is defined.
//
//   SCAPE_PROFILE_FRAME("Loop")           one loop iteration
//   SCAPE_PROFILE_FUNCTION()              zone named after the enclosing function
//   SCAPE_PROFILE_SCOPE("Compose")        named zone
//   SCAPE_PROFILE_PLOT("Pending hooks", n) numeric series

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#ifdef TRACY_ENABLE

#include <cstdint>
#include <tracy/Tracy.hpp>

#define SCAPE_PROFILE_FRAME(name) FrameMarkNamed(name)
#define SCAPE_PROFILE_FUNCTION() ZoneScoped
#define SCAPE_PROFILE_SCOPE(name) ZoneScopedN(name)
#define SCAPE_PROFILE_PLOT(name, value) TracyPlot(name, static_cast<int64_t>(value))

#else

#define SCAPE_PROFILE_FRAME(name) (void)0
#define SCAPE_PROFILE_FUNCTION() (void)0
#define SCAPE_PROFILE_SCOPE(name) (void)0
#define SCAPE_PROFILE_PLOT(name, value) (void)0

#endif

// NOLINTEND(cppcoreguidelines-macro-usage)
