#ifndef CHIPVIEW_REAPER_HH
#define CHIPVIEW_REAPER_HH

#include <cstdint>
#include <functional>
#include <deque>

// Handles deallocating resources once they're no longer used in any in-flight
// frame. Cleanups are tagged with the frame that was being recorded when they
// were registered.
class reaper
{
public:
    void start_frame();

    // Runs the cleanups of every frame up to and including finished_frame.
    void finish_frame(uint64_t finished_frame);
    void flush();

    void at_finish(std::function<void()>&& cleanup);

    uint64_t get_frame_counter() const;
    size_t get_pending_count() const;

private:
    struct entry
    {
        uint64_t frame;
        std::function<void()> cleanup;
    };
    std::deque<entry> queue;
    uint64_t frame_counter = 0;
};

#endif
