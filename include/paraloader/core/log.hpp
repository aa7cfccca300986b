// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

namespace paraloader::log {

// Install the default stderr logger. verbose -> debug, quiet -> warnings only.
void init(bool verbose, bool quiet) noexcept;

} // namespace paraloader::log
