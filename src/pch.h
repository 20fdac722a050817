/*
 * Precompiled Header for ClusterLens
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#pragma once

// Standard C++ Library Headers (most frequently used)
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Third-party libraries that are safe to precompile
#include <Eigen/Dense>
#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

// NOTE: Headers with inline tables and functions (elements.h, ionic_radii.h,
// form_factors.h, geometry.h) are NOT precompiled, include them directly
