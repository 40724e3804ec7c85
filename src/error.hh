#ifndef CHIPVIEW_ERROR_HH
#define CHIPVIEW_ERROR_HH
#include <stdexcept>
#include <string>

// Base class of everything the display subsystem reports to the frame loop.
class display_error: public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Framebuffer and texture dimensions disagree.
class configuration_mismatch: public display_error
{
public:
    using display_error::display_error;
};

// A texture or staging buffer could not be created. The result code is the
// graphics API's error value, or 0 when the failure did not come from the API.
class resource_allocation_failure: public display_error
{
public:
    resource_allocation_failure(const std::string& message, int result = 0);

    int get_result() const;

private:
    int result;
};

// The referenced texture was never created or has already been destroyed.
class invalid_handle: public display_error
{
public:
    using display_error::display_error;
};

std::string format_error(const char* message, ...);

// Throws std::runtime_error with the formatted message if condition is true.
void check_error(bool condition, const char* message, ...);

#endif
