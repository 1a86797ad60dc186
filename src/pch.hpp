#pragma once

// Precompiled headers (PCH) for faster local builds.
//
// Only stable standard library headers used across the npmerge sources. No
// project headers: those may depend on build options.
//
// Enabled via CMake option: NPMERGE_ENABLE_PCH=ON

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
