#pragma once

#include <expected>
#include <string>
#include <string_view>

// Destination for a completed transcript, chosen per session.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::string_view name() const = 0;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
