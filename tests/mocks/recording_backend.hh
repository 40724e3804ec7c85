#ifndef CHIPVIEW_TESTS_RECORDING_BACKEND_HH
#define CHIPVIEW_TESTS_RECORDING_BACKEND_HH
#include "host_texture_backend.hh"

namespace unittest {

// Host backend that remembers what each upload looked like.
class recording_backend : public host_texture_backend
{
public:
    using host_texture_backend::host_texture_backend;

    std::unique_ptr<staging_buffer> create_staging_buffer(size_t bytes) override
    {
        staging_sizes.push_back(bytes);
        return host_texture_backend::create_staging_buffer(bytes);
    }

    void upload_region(
        texture_handle handle,
        staging_buffer& src,
        const copy_layout& layout
    ) override
    {
        layouts.push_back(layout);
        staged.emplace_back(src.get_data(), src.get_data() + src.get_size());
        host_texture_backend::upload_region(handle, src, layout);
    }

    std::vector<size_t> staging_sizes;
    std::vector<copy_layout> layouts;
    std::vector<std::vector<uint8_t>> staged;
};

}

#endif
