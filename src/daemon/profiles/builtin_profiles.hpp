#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "profiles/profile_registry.hpp"
#include "runner/windowed_runner.hpp"

#include <expected>

// silero-en, silero-de, silero-es and whisper-lan. Server defaults come from
// the model section of the config.
std::expected<void, Error> register_builtin_profiles(ProfileRegistry& registry, const Config& config);

// Maps validated window parameters onto WindowSettings.
WindowSettings window_settings_from(const ProfileParams& params);
