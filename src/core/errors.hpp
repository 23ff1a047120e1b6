#pragma once

#include "types.hpp"

// Process exit code for an error category. ErrorCode::None maps to 0.
int exit_code_for(ErrorCode code);
