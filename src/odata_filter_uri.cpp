#include "odata_filter_uri.hpp"
#include "odata_filter_tracing.hpp"

#include "httplib.hpp"

#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace odata_filter {

static std::string DecodeComponent(const std::string& value) {
    // Keep '+' literal; OData services send spaces as %20
    static const std::set<char> exclude{};
    return duckdb_httplib_openssl::detail::decode_url(value, false, exclude);
}

static std::string RemoveDotSegments(const std::string& path) {
    bool absolute = !path.empty() && path[0] == '/';
    bool trailing_slash = false;

    std::vector<std::string> output;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        trailing_slash = false;
        if (segment.empty() || segment == ".") {
            trailing_slash = true;
            continue;
        }
        if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
            trailing_slash = true;
            continue;
        }
        output.push_back(segment);
    }
    if (!path.empty() && path.back() == '/') {
        trailing_slash = true;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0) {
            result += "/";
        }
        result += output[i];
    }
    if (trailing_slash && !output.empty()) {
        result += "/";
    }
    return result;
}

ODataUri ODataUri::Parse(const std::string& uri) {
    const static std::regex re(R"(^(?:([A-Za-z][A-Za-z0-9+.\-]*):)?(?://([^/?#]*))?([^?#]*)(?:\?([^#]*))?(?:#(.*))?$)");
    std::smatch m;
    if (!std::regex_match(uri, m, re)) {
        throw std::invalid_argument("Invalid URI, cannot be parsed: " + uri);
    }

    ODataUri result;
    result.scheme = m[1].str();
    result.authority = m[2].str();
    result.path = m[3].str();
    result.query = m[4].str();
    result.fragment = m[5].str();
    result.has_query = m[4].matched;
    result.has_fragment = m[5].matched;
    return result;
}

std::string ODataUri::ToString() const {
    std::ostringstream ss;
    if (!scheme.empty()) {
        ss << scheme << ":";
    }
    if (!scheme.empty() || !authority.empty()) {
        ss << "//" << authority;
    }
    ss << path;
    if (has_query) {
        ss << "?" << query;
    }
    if (has_fragment) {
        ss << "#" << fragment;
    }
    return ss.str();
}

std::string ExtractFilterOption(const std::string& uri) {
    auto parsed = ODataUri::Parse(uri);

    std::istringstream ss(parsed.query);
    std::string option;
    while (std::getline(ss, option, '&')) {
        auto eq = option.find('=');
        auto key = DecodeComponent(option.substr(0, eq));
        if (key != "$filter") {
            continue;
        }
        auto value = eq == std::string::npos ? std::string() : DecodeComponent(option.substr(eq + 1));
        ODATA_FILTER_TRACE_DEBUG("URI", "Extracted $filter: " + value);
        return value;
    }
    return "";
}

std::string ExtractEntitySetName(const std::string& uri) {
    auto path = ODataUri::Parse(uri).path;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    auto slash = path.find_last_of('/');
    auto segment = slash == std::string::npos ? path : path.substr(slash + 1);
    auto paren = segment.find('(');
    if (paren != std::string::npos) {
        segment = segment.substr(0, paren);
    }
    return DecodeComponent(segment);
}

bool IsAbsoluteUri(const std::string& uri) {
    try {
        return ODataUri::Parse(uri).IsAbsolute();
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string EnsureTrailingSlash(const std::string& uri) {
    auto parsed = ODataUri::Parse(uri);
    if (parsed.path.empty() || parsed.path.back() != '/') {
        parsed.path += "/";
    }
    return parsed.ToString();
}

std::string UriToAbsoluteUri(const std::string& base, const std::string& relative) {
    auto reference = ODataUri::Parse(relative);
    if (reference.IsAbsolute()) {
        return relative;
    }

    auto base_uri = ODataUri::Parse(base);
    if (!base_uri.IsAbsolute()) {
        throw std::invalid_argument("Base URI is not absolute: " + base);
    }

    ODataUri target;
    target.scheme = base_uri.scheme;
    target.fragment = reference.fragment;
    target.has_fragment = reference.has_fragment;

    if (relative.rfind("//", 0) == 0) {
        target.authority = reference.authority;
        target.path = RemoveDotSegments(reference.path);
        target.query = reference.query;
        target.has_query = reference.has_query;
        return target.ToString();
    }

    target.authority = base_uri.authority;
    if (reference.path.empty()) {
        target.path = base_uri.path;
        target.query = reference.has_query ? reference.query : base_uri.query;
        target.has_query = reference.has_query || base_uri.has_query;
    } else {
        if (reference.path[0] == '/') {
            target.path = RemoveDotSegments(reference.path);
        } else if (base_uri.path.empty()) {
            target.path = RemoveDotSegments("/" + reference.path);
        } else {
            auto last_slash = base_uri.path.find_last_of('/');
            auto directory = last_slash == std::string::npos ? std::string("/") : base_uri.path.substr(0, last_slash + 1);
            target.path = RemoveDotSegments(directory + reference.path);
        }
        target.query = reference.query;
        target.has_query = reference.has_query;
    }
    return target.ToString();
}

} // namespace odata_filter
