#pragma once
#include <string>
#include <string_view>

namespace HC::detail {

// Routes SharedStream lifecycle transitions to the tagged logger.
void logStreamTransition(std::string const& stream, std::string_view transition);

} // namespace HC::detail
