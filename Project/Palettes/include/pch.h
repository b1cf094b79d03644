#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <vector>
#include <array>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <fstream>
#include <sstream>
#include <functional>
#include <algorithm>
#include <optional>
#include <utility>
#include <stdexcept>
#include <filesystem>
#include <limits>

// Third-party headers (stable, never change)
#include <glm/glm.hpp>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
