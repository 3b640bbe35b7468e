#pragma once

#include "naming/context.hpp"

#include <vector>

namespace namefact {
namespace naming {

// The ordered rule table. Within a phase rules run in table order; each
// fires only when its predicate holds on the context left by the previous one.
//
//   FUNCTIONAL_GROUP_DETECTION  P-41, P-31.1.4.3.4, P-41.1
//   PARENT_SELECTION            P-65.6.3.2, P-44.1, P-21.1
//   NUMBERING                   P-31.1.4, P-14.3
//   SUBSTITUENT_ASSEMBLY        P-29, P-14.5, P-65.6.3.2.1
//   NAME_ASSEMBLY               P-31.1.4.2.4, P-65.2.1, P-12.1, P-59.1, P-93.5, P-65.6.3.3, P-70
std::vector<Rule> defaultRules();

} // namespace naming
} // namespace namefact
