// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Graphics/Color.hpp>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <unordered_map>
#include <map>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <thread>
#include <chrono>
#include <optional>
#include <memory>
#include <functional>
#include <fstream>
