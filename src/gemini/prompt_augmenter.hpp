#pragma once

#include "types.hpp"

namespace relay::gemini {

// Returns a copy of `request` whose system instruction ends with the
// completion mandate. The caller's instruction text is kept as a prefix.
GenerationRequest augment_request(const GenerationRequest& request);

} // namespace relay::gemini
