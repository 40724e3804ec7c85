#include <gtest/gtest.h>
#include "reaper.hh"
#include <vector>

namespace unittest {

class ReaperTest : public testing::Test
{
protected:
    reaper reap;
    std::vector<int> ran;
};

TEST_F(ReaperTest, cleanup_waits_for_its_frame)
{
    reap.start_frame();
    reap.at_finish([&](){ ran.push_back(1); });
    reap.start_frame();
    reap.at_finish([&](){ ran.push_back(2); });

    ASSERT_EQ(reap.get_frame_counter(), 2u);
    ASSERT_EQ(reap.get_pending_count(), 2u);

    reap.finish_frame(0);
    ASSERT_TRUE(ran.empty());

    reap.finish_frame(1);
    ASSERT_EQ(ran, std::vector<int>({1}));

    reap.finish_frame(2);
    ASSERT_EQ(ran, std::vector<int>({1, 2}));
    ASSERT_EQ(reap.get_pending_count(), 0u);
}

TEST_F(ReaperTest, flush_runs_everything_in_order)
{
    for(int i = 0; i < 3; ++i)
    {
        reap.start_frame();
        reap.at_finish([&, i](){ ran.push_back(i); });
    }
    reap.flush();
    ASSERT_EQ(ran, std::vector<int>({0, 1, 2}));
    ASSERT_EQ(reap.get_pending_count(), 0u);
}

TEST_F(ReaperTest, cleanup_may_register_more)
{
    reap.start_frame();
    reap.at_finish([&](){
        ran.push_back(1);
        reap.at_finish([&](){ ran.push_back(2); });
    });
    reap.start_frame();
    reap.finish_frame(1);

    // Registered while frame 2 was being recorded.
    ASSERT_EQ(ran, std::vector<int>({1}));
    reap.finish_frame(2);
    ASSERT_EQ(ran, std::vector<int>({1, 2}));
}

}
