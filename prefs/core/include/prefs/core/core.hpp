#pragma once

// Umbrella header for prefs::core module
#include <prefs/core/log.hpp>
#include <prefs/core/scoped_connection.hpp>
#include <prefs/core/filesystem.hpp>
