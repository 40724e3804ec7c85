#include "vk_error.hh"
#include "error.hh"
#include <cstdarg>
#include <cstdio>

bool is_allocation_failure(VkResult result)
{
    switch(result)
    {
    case VK_ERROR_OUT_OF_HOST_MEMORY:
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
    case VK_ERROR_MEMORY_MAP_FAILED:
    case VK_ERROR_FRAGMENTED_POOL:
    case VK_ERROR_OUT_OF_POOL_MEMORY:
    case VK_ERROR_FRAGMENTATION:
    case VK_ERROR_TOO_MANY_OBJECTS:
    case VK_ERROR_DEVICE_LOST:
        return true;
    default:
        return false;
    }
}

void check_vk(VkResult result, const char* message, ...)
{
    if(result >= VK_SUCCESS) return;

    char buf[256];
    va_list args;
    va_start(args, message);
    vsnprintf(buf, sizeof(buf), message, args);
    va_end(args);

    std::string what = format_error("%s failed with VkResult %d", buf, (int)result);
    if(is_allocation_failure(result))
        throw resource_allocation_failure(what, (int)result);
    throw std::runtime_error(what);
}
