#ifndef PRESETS_H
#define PRESETS_H

#include <string>
#include <vector>

#include "kernel/Engine.h"

// Named experiment set-ups of the foraging study.
//   baseline     40 agents, 4 identical patches, reactive payoff (nu = 0)
//   surge        baseline plus growth surge w_0 = 5 over [500, 600)
//   failures     baseline plus 15 agents failing at t = 500
//   modelbased   baseline with nu = 40 and gamma* at the symmetric equilibrium
// Names are matched case-insensitively with punctuation ignored.
// Throws std::invalid_argument for an unknown name.
EngineConfig presetConfig(const std::string& name);

// Canonical name for `name`, or an empty string if it is not a preset
std::string canonicalPresetName(const std::string& name);

const std::vector<std::string>& presetNames();

// Apply one "--seed=", "--agents=", "--nu=" or "--horizon=" option.
// Returns false for any other argument; throws on a malformed value.
bool applyConfigOverride(const std::string& arg, EngineConfig& cfg);

// Preset first, then every override in order, so overrides win wherever
// they appeared relative to the preset choice.
EngineConfig resolveConfig(const std::string& preset, const std::vector<std::string>& overrides);

#endif
