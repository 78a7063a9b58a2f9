#pragma once

#include <string>
#include <string_view>

// 32 lowercase hex digits (random UUIDv4 without dashes).
std::string new_request_id();

// Caller-supplied ids: 1-128 characters from [A-Za-z0-9._-].
bool is_valid_request_id(std::string_view id);
