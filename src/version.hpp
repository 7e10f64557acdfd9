#pragma once

// Set from the CMake project version
#ifndef MINAWALLET_VERSION
#define MINAWALLET_VERSION "0.1.0"
#endif

namespace minawallet {

constexpr const char* VERSION = MINAWALLET_VERSION;

} // namespace minawallet
