#pragma once

#include <boost/json.hpp>

#include <ostream>
#include <string>

namespace relaychat::storage {

// Two-space indented rendering, matching what the history viewer writes.
void pretty_print(std::ostream& os, const boost::json::value& jv, std::string* indent = nullptr);

std::string to_pretty_string(const boost::json::value& jv);

} // namespace relaychat::storage
