#include "reaper.hh"
#include <utility>

void reaper::start_frame()
{
    frame_counter++;
}

void reaper::finish_frame(uint64_t finished_frame)
{
    // Entries are always pushed in frame order.
    while(queue.size() != 0 && queue.front().frame <= finished_frame)
    {
        std::function<void()> cleanup = std::move(queue.front().cleanup);
        queue.pop_front();
        cleanup();
    }
}

void reaper::flush()
{
    while(queue.size() != 0)
    {
        std::function<void()> cleanup = std::move(queue.front().cleanup);
        queue.pop_front();
        cleanup();
    }
}

void reaper::at_finish(std::function<void()>&& cleanup)
{
    queue.push_back({frame_counter, std::move(cleanup)});
}

uint64_t reaper::get_frame_counter() const
{
    return frame_counter;
}

size_t reaper::get_pending_count() const
{
    return queue.size();
}
