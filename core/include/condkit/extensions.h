#pragma once

#include <string>
#include <vector>

#include "condkit/operator_registry.h"

namespace condkit {

/// Installs the stock custom operators into a registry:
/// iequal, email_domain, regex, min_length, contains_any, age_group.
/// Existing entries with the same ids are replaced.
void register_standard_extensions(OperatorRegistry& registry);

/// Ids installed by register_standard_extensions.
std::vector<std::string> standard_extension_names();

}  // namespace condkit
