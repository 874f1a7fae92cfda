#pragma once

#include <string>

namespace odata_filter {

// Pieces of an OData request URI: scheme://authority/path?query#fragment
struct ODataUri {
    static ODataUri Parse(const std::string& uri);

    bool IsAbsolute() const { return !scheme.empty(); }
    std::string ToString() const;

    std::string scheme;
    std::string authority;
    std::string path;
    // Without the leading '?' and '#'
    std::string query;
    std::string fragment;
    bool has_query = false;
    bool has_fragment = false;
};

// Value of the first $filter query option, percent-decoded; '+' is kept as is.
// Returns an empty string when the option is absent.
std::string ExtractFilterOption(const std::string& uri);

// Last path segment with any key predicate removed: ".../Customers(1)" -> "Customers"
std::string ExtractEntitySetName(const std::string& uri);

bool IsAbsoluteUri(const std::string& uri);

std::string EnsureTrailingSlash(const std::string& uri);

// Resolves a relative reference against an absolute base. An absolute `relative` is
// returned unchanged; throws std::invalid_argument when `base` is not absolute.
std::string UriToAbsoluteUri(const std::string& base, const std::string& relative);

} // namespace odata_filter
