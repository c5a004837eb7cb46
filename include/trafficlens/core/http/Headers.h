#pragma once
#include <string>
#include <string_view>
#include <optional>
#include "trafficlens/core/http/HttpParser.h"

namespace trafficlens::core::http {
bool iequals(std::string_view a, std::string_view b);
bool istarts_with(std::string_view text, std::string_view prefix);
bool icontains(std::string_view haystack, std::string_view needle);
std::string to_lower(std::string_view v);

// First value of `name` (case-insensitive), nullptr when absent.
const std::string* find_header(const HeaderList& headers, std::string_view name);
void remove_header(HeaderList& headers, std::string_view name);
void set_header(HeaderList& headers, std::string_view name, std::string value);
// true when any comma separated element of `name` equals `token`.
bool header_has_token(const HeaderList& headers, std::string_view name, std::string_view token);
std::optional<uint64_t> content_length(const HeaderList& headers);

// Removes headers that only apply to a single connection leg.
void strip_hop_by_hop(HeaderList& headers);
bool is_hop_by_hop(std::string_view name);

std::string serialize_headers(const HeaderList& headers);
const char* status_text(int code);
}
