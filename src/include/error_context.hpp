#pragma once

#include <string>
#include <utility>
#include <vector>

namespace odata_filter {

/**
 * Error Context Helper
 *
 * Collects key/value details about a failure and appends them to a message.
 * Entries keep their insertion order so formatted messages are stable.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("offset", "12").Set("token", "lt");
 *   auto msg = ctx.Format("Unexpected token");
 *   // Returns: "Unexpected token [offset: 12, token: lt]"
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable. Setting an existing key replaces its value in place.
     *
     * @param key The context key
     * @param value The context value
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);

    /**
     * Get a context variable
     *
     * @return The context value, or empty string if not set
     */
    std::string Get(const std::string& key) const;

    std::string Format(const std::string& base_message) const;

    void Clear();
    bool IsEmpty() const;

private:
    std::vector<std::pair<std::string, std::string>> context_;
};

} // namespace odata_filter
