#pragma once

#include <string>

namespace longform::util {

// Fresh entity id (transcripts, recipes, renders): an RFC4122 v4 UUID in
// canonical 36 character text form.
std::string NewId();

} // namespace longform::util
