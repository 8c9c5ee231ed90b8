// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

namespace profship {

/// mode: stdout, stderr, disabled or a file path
/// level: debug, informational, notice, warn or error
void setup_logger(const char *log_mode, const char *log_level);

} // namespace profship
