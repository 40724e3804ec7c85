#ifndef CHIPVIEW_VK_ERROR_HH
#define CHIPVIEW_VK_ERROR_HH

#include "volk.h"

// True for results that mean memory or the device itself ran out, as
// opposed to misuse of the API.
bool is_allocation_failure(VkResult result);

// Throws if result is an error. Allocation failures are reported as
// resource_allocation_failure, everything else as std::runtime_error.
void check_vk(VkResult result, const char* message, ...);

#endif
