/*
 * LocalSim runtime - Version info
 * (c) 2025 LocalSim contributors
 */
#pragma once

#ifndef LSIMD_VERSION
#define LSIMD_VERSION "0.3.0"
#endif

// Wire protocol revision (length-prefixed JSON, see Framing.hpp)
#define LSIM_PROTOCOL "lpjson/1"
