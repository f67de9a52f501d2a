#pragma once

#include "output/output.hpp"

// Copies the transcript to the clipboard, then sends Ctrl+V to the focused
// window through wtype.
class WaylandPasteOutput : public OutputMethod {
public:
    std::string_view name() const override { return "paste"; }
    std::expected<void, std::string> deliver(const std::string& text) override;
};
