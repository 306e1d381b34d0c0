#pragma once
#include <stddef.h>

// Build-time firmware version. Override with compiler flags, e.g.:
//   -DFILTER_SIM_FW_VERSION=\"1.2.0\"
#ifndef FILTER_SIM_FW_VERSION
#define FILTER_SIM_FW_VERSION "0.1.0-dev"
#endif

#ifndef FILTER_SIM_DEVICE_MODEL
#define FILTER_SIM_DEVICE_MODEL "AquaSmart Filtration Simulator"
#endif

namespace fw_version
{
template <size_t N>
constexpr size_t literal_size(const char (&)[N])
{
    return N;
}

static constexpr char kVersion[] = FILTER_SIM_FW_VERSION;
static constexpr char kModel[] = FILTER_SIM_DEVICE_MODEL;

// FILTER_SIM_FW_VERSION must be a non-empty string literal that fits the status payload.
static_assert(literal_size(FILTER_SIM_FW_VERSION) >= 2, "FILTER_SIM_FW_VERSION must be a non-empty string literal");
} // namespace fw_version
