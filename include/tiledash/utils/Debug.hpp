#pragma once

namespace tdash {

// Debug logging to std::cerr, off unless TILEDASH_DEBUG is set to
// something other than "" or "0"
bool debugEnabled();

void setDebugEnabled(bool enabled);

}
