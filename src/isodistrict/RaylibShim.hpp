#pragma once

// Include raylib through this header only.
//
// Some toolchains fail when <raylib.h> comes before <cstdio>/<stdio.h> (raylib issue #3747), so
// the C headers it relies on are pulled in first.

#include <cstdarg>
#include <cstdio>

#include <raylib.h>
