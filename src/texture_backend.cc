#include "texture_backend.hh"
#include <algorithm>

size_t copy_layout::get_byte_size() const
{
    if(rows_per_image == 0) return 0;
    return offset + size_t(bytes_per_row) * rows_per_image * std::max(extent.z, 1u);
}
