#pragma once

#include "output/output.hpp"

// Copies the transcript to the Wayland clipboard with wl-copy.
class WaylandClipboardOutput : public OutputMethod {
public:
    std::string_view name() const override { return "clipboard"; }
    std::expected<void, std::string> deliver(const std::string& text) override;
};
