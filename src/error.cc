#include "error.hh"
#include <cstdarg>
#include <cstdio>
#include <vector>

namespace
{

std::string vformat(const char* message, va_list args)
{
    va_list measure;
    va_copy(measure, args);
    int len = vsnprintf(nullptr, 0, message, measure);
    va_end(measure);
    if(len <= 0) return message;

    std::vector<char> buf(len+1);
    vsnprintf(buf.data(), buf.size(), message, args);
    return std::string(buf.data(), len);
}

}

resource_allocation_failure::resource_allocation_failure(
    const std::string& message,
    int result
): display_error(message), result(result)
{
}

int resource_allocation_failure::get_result() const
{
    return result;
}

std::string format_error(const char* message, ...)
{
    va_list args;
    va_start(args, message);
    std::string str = vformat(message, args);
    va_end(args);
    return str;
}

void check_error(bool condition, const char* message, ...)
{
    if(!condition) return;

    va_list args;
    va_start(args, message);
    std::string str = vformat(message, args);
    va_end(args);

    throw std::runtime_error(str);
}
