#pragma once
#include <optional>
#include <string>

namespace warden::util {

// Load KEY=VALUE pairs from the first .env found near the working
// directory or the executable. Existing variables are not overridden.
void load_dotenv();

std::optional<std::string> env_string(const char* name);
std::optional<long> env_int(const char* name);
std::optional<bool> env_bool(const char* name);

} // namespace warden::util
