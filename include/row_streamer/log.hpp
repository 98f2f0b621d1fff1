#pragma once
#include <string_view>

namespace rs {

// Whole-line writes to stdout / stderr; lines from worker threads never
// interleave. Callers prefix a component tag, e.g. "[persist] ...".
void log_out(std::string_view line);
void log_err(std::string_view line);

}
