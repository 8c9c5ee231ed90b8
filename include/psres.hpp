// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

// Single include for result codes and their helpers
#include "psres_def.hpp"
#include "psres_exception.hpp"
#include "psres_helpers.hpp"
#include "psres_list.hpp"
