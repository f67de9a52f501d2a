#pragma once

#include "../config.hpp"
#include "provider.hpp"

#include <memory>
#include <string>
#include <vector>

struct ProviderSet {
    std::vector<std::shared_ptr<TranscriptionProvider>> transcribers;
    std::vector<std::shared_ptr<TextCleanupProvider>> cleaners;
    std::vector<std::string> skipped;  // configured but missing an API key
};

// Builds providers in failover order from the config. Keys are read from
// the environment variable each provider names; a whisper.cpp server needs
// none.
ProviderSet build_providers(const Config& config);
