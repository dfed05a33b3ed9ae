#include <gtest/gtest.h>

#include "job.hpp"

#include <stdexcept>

namespace vidtool::tests
{
    TEST(Job, transitions)
    {
        struct TestCase
        {
            JobStatus from;
            JobStatus to;
            bool valid;
        } testCases[]{
            { JobStatus::Pending, JobStatus::Running, true },
            { JobStatus::Pending, JobStatus::Skipped, true },
            { JobStatus::Pending, JobStatus::Cancelled, true },
            { JobStatus::Pending, JobStatus::Failed, true },
            { JobStatus::Pending, JobStatus::Succeeded, false },
            { JobStatus::Pending, JobStatus::Pending, false },
            { JobStatus::Running, JobStatus::Succeeded, true },
            { JobStatus::Running, JobStatus::Failed, true },
            { JobStatus::Running, JobStatus::Cancelled, true },
            { JobStatus::Running, JobStatus::Skipped, false },
            { JobStatus::Running, JobStatus::Pending, false },
            { JobStatus::Succeeded, JobStatus::Failed, false },
            { JobStatus::Failed, JobStatus::Running, false },
            { JobStatus::Skipped, JobStatus::Running, false },
            { JobStatus::Cancelled, JobStatus::Succeeded, false },
        };

        for (const TestCase& testCase : testCases)
        {
            EXPECT_EQ(is_valid_transition(testCase.from, testCase.to), testCase.valid)
                << to_string(testCase.from) << " -> " << to_string(testCase.to);
        }
    }

    TEST(Job, lifecycle)
    {
        Job job{ 3, "/in/a.mkv" };
        EXPECT_EQ(job.index(), 3u);
        EXPECT_EQ(job.status(), JobStatus::Pending);
        EXPECT_FALSE(is_terminal(job.status()));

        job.transition(JobStatus::Running);
        job.transition(JobStatus::Failed, "exit code 1");
        EXPECT_EQ(job.status(), JobStatus::Failed);
        EXPECT_EQ(job.detail(), "exit code 1");
        EXPECT_TRUE(is_terminal(job.status()));

        // terminal states are final
        EXPECT_THROW(job.transition(JobStatus::Succeeded), std::logic_error);
        EXPECT_EQ(job.status(), JobStatus::Failed);
    }

    TEST(Job, batchCounts)
    {
        BatchCounts counts;
        for (JobStatus s : { JobStatus::Succeeded, JobStatus::Succeeded, JobStatus::Failed, JobStatus::Skipped, JobStatus::Cancelled, JobStatus::Running })
            counts.add(s);

        EXPECT_EQ(counts, (BatchCounts{ 2, 1, 1, 1 }));
        EXPECT_EQ(counts.settled(), 5u);
    }
} // namespace vidtool::tests
