#pragma once

#include <string>

namespace agentlink::data {

/// Random (version 4) UUID in canonical upper-case 8-4-4-4-12 form.
std::string make_uuid();

} // namespace agentlink::data
